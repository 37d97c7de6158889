/*
 * This file is part of CompaReports.
 * Copyright (C) 2025 Luisma Peramato
 *
 * CompaReports is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CompaReports is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CompaReports. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "drawingsurface.h"

// Vertical write position on a surface. The y coordinate always stays
// inside [ContentTop, ContentBottom] of the current page.
class PageCursor {
public:
  explicit PageCursor(DrawingSurface &surface);

  DrawingSurface &Surface() const { return *surface_; }
  const PageGeometry &Geometry() const { return surface_->Geometry(); }

  int PageIndex() const { return pageIndex_; }
  double Y() const { return y_; }

  double ContentLeft() const { return Geometry().ContentLeft(); }
  double ContentWidth() const { return Geometry().ContentWidth(); }
  double ContentTop() const { return Geometry().ContentTop(); }
  double ContentBottom() const { return Geometry().ContentBottom(); }

  double Remaining() const;
  bool AtPageTop() const;

  // Starts a new page when requiredHeight does not fit below the
  // current position. Content already at the top of a page stays where
  // it is even when it is taller than the page. Returns true when a
  // page was added.
  bool EnsureSpace(double requiredHeight);

  // Moves down by height, stopping at the content bottom.
  void Advance(double height);

  // Places the cursor at y on the current page.
  void MoveTo(double y);

  void StartNewPage();

  // Adopts a position reached by another cursor on the same surface.
  void SyncTo(int pageIndex, double y);

private:
  double Clamp(double y) const;

  DrawingSurface *surface_;
  int pageIndex_ = 0;
  double y_ = 0.0;
};
