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
#include "pagecursor.h"

#include <algorithm>

namespace {
constexpr double kTopTolerance = 0.01;
}

PageCursor::PageCursor(DrawingSurface &surface)
    : surface_(&surface), pageIndex_(surface.CurrentPage()),
      y_(surface.Geometry().ContentTop()) {}

double PageCursor::Remaining() const { return ContentBottom() - y_; }

bool PageCursor::AtPageTop() const {
  return pageIndex_ > 0 && y_ <= ContentTop() + kTopTolerance;
}

bool PageCursor::EnsureSpace(double requiredHeight) {
  if (pageIndex_ == 0) {
    StartNewPage();
    return true;
  }
  if (y_ + requiredHeight <= ContentBottom() + kTopTolerance)
    return false;
  if (AtPageTop())
    return false;
  StartNewPage();
  return true;
}

void PageCursor::Advance(double height) {
  if (height <= 0.0)
    return;
  y_ = Clamp(y_ + height);
}

void PageCursor::MoveTo(double y) {
  if (pageIndex_ == 0)
    StartNewPage();
  y_ = Clamp(y);
}

void PageCursor::StartNewPage() {
  surface_->AddPage();
  pageIndex_ = surface_->CurrentPage();
  y_ = ContentTop();
}

void PageCursor::SyncTo(int pageIndex, double y) {
  pageIndex_ = std::clamp(pageIndex, 0, surface_->PageCount());
  if (pageIndex_ > 0 && surface_->CurrentPage() != pageIndex_)
    surface_->SetPage(pageIndex_);
  y_ = Clamp(y);
}

double PageCursor::Clamp(double y) const {
  return std::clamp(y, ContentTop(), ContentBottom());
}
