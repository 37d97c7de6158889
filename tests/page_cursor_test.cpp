#include "pagecursor.h"

#include <cassert>
#include <cmath>

#include "recordingsurface.h"

namespace {
bool Near(double a, double b) { return std::abs(a - b) < 1e-6; }
} // namespace

int main() {
  RecordingSurface surface;
  PageCursor cursor(surface);
  const PageGeometry &g = surface.Geometry();

  assert(cursor.PageIndex() == 0);
  assert(!cursor.AtPageTop());

  // The first request for space opens the first page.
  assert(cursor.EnsureSpace(10.0));
  assert(surface.PageCount() == 1);
  assert(cursor.PageIndex() == 1);
  assert(Near(cursor.Y(), g.ContentTop()));
  assert(cursor.AtPageTop());

  cursor.Advance(-5.0);
  assert(Near(cursor.Y(), g.ContentTop()));
  cursor.Advance(100.0);
  assert(Near(cursor.Y(), g.ContentTop() + 100.0));
  assert(!cursor.EnsureSpace(100.0));

  cursor.MoveTo(5000.0);
  assert(Near(cursor.Y(), g.ContentBottom()));
  assert(Near(cursor.Remaining(), 0.0));
  cursor.MoveTo(-20.0);
  assert(Near(cursor.Y(), g.ContentTop()));

  cursor.MoveTo(g.ContentBottom() - 5.0);
  assert(cursor.EnsureSpace(10.0));
  assert(surface.PageCount() == 2);
  assert(cursor.AtPageTop());

  // Already at the top: oversized content stays on this page.
  assert(!cursor.EnsureSpace(g.ContentHeight() * 3.0));
  assert(surface.PageCount() == 2);

  cursor.Advance(1e6);
  assert(Near(cursor.Y(), g.ContentBottom()));

  cursor.SyncTo(1, 300.0);
  assert(cursor.PageIndex() == 1);
  assert(surface.CurrentPage() == 1);
  assert(Near(cursor.Y(), 300.0));

  cursor.SyncTo(9, 10.0);
  assert(cursor.PageIndex() == 2);
  assert(Near(cursor.Y(), g.ContentTop()));

  // Copies share the surface but keep their own position.
  PageCursor copy = cursor;
  copy.StartNewPage();
  assert(copy.PageIndex() == 3);
  assert(cursor.PageIndex() == 2);

  RecordingSurface fresh;
  PageCursor placed(fresh);
  placed.MoveTo(200.0);
  assert(fresh.PageCount() == 1);
  assert(Near(placed.Y(), 200.0));
  return 0;
}
