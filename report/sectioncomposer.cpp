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
#include "sectioncomposer.h"

SectionComposer::SectionComposer(const StyleTable &styles)
    : styles_(styles), renderer_(styles) {}

int SectionComposer::ComposeSection(const std::string &title,
                                    const std::string &byline,
                                    const std::vector<Block> &blocks,
                                    PageCursor &cursor) const {
  cursor.StartNewPage();
  int startPage = cursor.PageIndex();
  DrawBanner(title, byline, cursor);
  cursor.MoveTo(styles_.Banner().contentTop);
  renderer_.RenderAll(blocks, cursor);
  return startPage;
}

void SectionComposer::DrawBanner(const std::string &title,
                                 const std::string &byline,
                                 PageCursor &cursor) const {
  const BannerStyle &banner = styles_.Banner();
  DrawingSurface &surface = cursor.Surface();
  const PageGeometry &geometry = cursor.Geometry();

  RectStyle rect;
  rect.fill = banner.fill;
  surface.WriteRect(0.0, 0.0, geometry.pageWidth, banner.height, rect);

  double x = geometry.ContentLeft();
  if (banner.titleAlign == TextAlign::Center)
    x = geometry.pageWidth / 2.0;
  else if (banner.titleAlign == TextAlign::Right)
    x = geometry.pageWidth - geometry.marginRight;

  TextStyle titleStyle{banner.titleSize, true, banner.textColor};
  // Long titles are shrunk to the content width rather than wrapped.
  double width = surface.MeasureText(title, titleStyle);
  if (width > geometry.ContentWidth() && width > 0.0)
    titleStyle.fontSize *= geometry.ContentWidth() / width;
  surface.WriteText(title, x, banner.titleBaseline, titleStyle,
                    banner.titleAlign);

  if (!byline.empty()) {
    TextStyle bylineStyle{banner.bylineSize, false, banner.textColor};
    surface.WriteText(byline, x, banner.bylineBaseline, bylineStyle,
                      banner.titleAlign);
  }
}
