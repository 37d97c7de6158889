#include "tablepaginator.h"

#include <cassert>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "recordingsurface.h"

namespace {
class SizingSurface : public RecordingSurface {
public:
  std::optional<std::vector<double>>
  AutoColumnWidths(const std::vector<std::string> &,
                   const std::vector<std::vector<std::string>> &, double,
                   const TextStyle &, const TextStyle &) const override {
    return widths;
  }

  std::optional<std::vector<double>> widths;
};

bool IsBodyCell(const std::string &text) { return text.rfind("row", 0) == 0; }

void CheckInsideContent(const RecordingSurface &surface) {
  const PageGeometry &g = surface.Geometry();
  for (const auto &op : surface.ops) {
    if (op.kind == RecordingSurface::OpKind::Text) {
      assert(op.y >= g.ContentTop());
      assert(op.y <= g.ContentBottom());
    } else if (op.kind == RecordingSurface::OpKind::Rect) {
      assert(op.y >= g.ContentTop() - 1e-6);
      assert(op.y + op.height <= g.ContentBottom() + 0.02);
    }
  }
}
} // namespace

int main() {
  TableStyle style;
  TablePaginator paginator(style);

  {
    // A long table repeats its header on every page with body rows.
    RecordingSurface surface;
    PageCursor cursor(surface);
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 120; ++i)
      rows.push_back({"row " + std::to_string(i), "value"});
    TablePlacement placement =
        paginator.RenderTable({"Company", "Score"}, rows, cursor);

    assert(cursor.PageIndex() == 0);
    assert(placement.pageIndex == surface.PageCount());
    assert(placement.pageIndex >= 3);
    assert(placement.pagesAdded == placement.pageIndex - 1);

    for (int page = 1; page <= surface.PageCount(); ++page) {
      auto texts = surface.TextsOnPage(page);
      bool hasRows = false;
      for (const auto &op : texts)
        hasRows = hasRows || IsBodyCell(op.text);
      if (!hasRows)
        continue;
      assert(texts.front().text == "Company");
      assert(texts.front().style.bold);
    }
    size_t bodyCells = 0;
    for (const auto &op : surface.Texts())
      if (IsBodyCell(op.text))
        ++bodyCells;
    assert(bodyCells == rows.size());
    CheckInsideContent(surface);
  }

  {
    // A row taller than a page is split between lines.
    RecordingSurface surface;
    PageCursor cursor(surface);
    std::string longText;
    for (int i = 0; i < 3000; ++i)
      longText += "word ";
    TablePlacement placement =
        paginator.RenderTable({"Topic", "Notes"}, {{"row", longText}}, cursor);
    assert(placement.pageIndex > 1);
    for (int page = 1; page <= surface.PageCount(); ++page)
      assert(surface.TextsOnPage(page).front().text == "Topic");
    CheckInsideContent(surface);
  }

  {
    // A header taller than a page is cut so each page still takes one
    // body line below it, and nothing is drawn past the content bottom.
    RecordingSurface surface;
    PageCursor cursor(surface);
    std::string longHeader;
    for (int i = 0; i < 2000; ++i)
      longHeader += "word ";
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 5; ++i)
      rows.push_back({"row " + std::to_string(i), "value"});
    TablePlacement placement =
        paginator.RenderTable({"Topic", longHeader}, rows, cursor);

    assert(surface.PageCount() == 5);
    assert(placement.pageIndex == 5);
    assert(placement.y <= surface.Geometry().ContentBottom());
    for (int page = 1; page <= surface.PageCount(); ++page) {
      auto texts = surface.TextsOnPage(page);
      assert(texts.front().text == "Topic");
      size_t bodyCells = 0;
      for (const auto &op : texts)
        if (IsBodyCell(op.text))
          ++bodyCells;
      assert(bodyCells == 1);
    }
    CheckInsideContent(surface);
  }

  {
    // Not enough room for the start reserve: the table moves on.
    RecordingSurface surface;
    PageCursor cursor(surface);
    cursor.MoveTo(surface.Geometry().ContentBottom() - 100.0);
    TablePlacement placement = paginator.RenderTable({"A"}, {{"row"}}, cursor);
    assert(placement.pageIndex == 2);
    assert(placement.pagesAdded == 1);
    assert(surface.TextsOnPage(1).empty());
  }

  {
    // Rows wider than the header widen the table; short rows are padded.
    RecordingSurface surface;
    PageCursor cursor(surface);
    paginator.RenderTable({"A"}, {{"row a", "row b", "row c"}, {"row d"}},
                          cursor);
    double width = surface.Geometry().ContentWidth() / 3.0;
    double left = surface.Geometry().ContentLeft();
    bool sawThird = false;
    for (const auto &op : surface.Texts())
      if (op.text == "row c") {
        sawThird = true;
        assert(std::abs(op.x - (left + 2.0 * width + style.cellPadding)) < 1e-6);
      }
    assert(sawThird);
  }

  {
    RecordingSurface surface;
    PageCursor cursor(surface);
    TablePlacement placement = paginator.RenderTable({}, {}, cursor);
    assert(placement.pagesAdded == 0);
    assert(surface.PageCount() == 0);
  }

  {
    SizingSurface surface;
    surface.widths = std::vector<double>{100.0, 415.28};
    auto widths = paginator.ColumnWidths(surface, {"a", "b"}, {}, 515.28);
    assert(widths.size() == 2);
    assert(widths[0] == 100.0);

    surface.widths = std::vector<double>{400.0, 400.0};
    widths = paginator.ColumnWidths(surface, {"a", "b"}, {}, 515.28);
    assert(std::abs(widths[0] - 257.64) < 1e-6);

    surface.widths = std::vector<double>{515.28};
    widths = paginator.ColumnWidths(surface, {"a", "b"}, {}, 515.28);
    assert(std::abs(widths[1] - 257.64) < 1e-6);
  }
  return 0;
}
