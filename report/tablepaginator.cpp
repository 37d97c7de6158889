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
#include "tablepaginator.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "stringutils.h"

namespace {
struct CellLines {
  std::vector<std::string> lines;
  size_t next = 0;

  size_t Pending() const { return lines.size() - next; }
};

struct RowLayout {
  std::vector<CellLines> cells;

  size_t PendingLines() const {
    size_t pending = 0;
    for (const auto &cell : cells)
      pending = std::max(pending, cell.Pending());
    return pending;
  }
};

bool HasText(const std::vector<std::string> &cells) {
  for (const auto &cell : cells)
    if (!StringUtils::Trim(cell).empty())
      return true;
  return false;
}

std::vector<std::string> Normalize(const std::vector<std::string> &cells,
                                   size_t columns) {
  std::vector<std::string> out(cells.begin(),
                               cells.begin() + std::min(cells.size(), columns));
  out.resize(columns);
  return out;
}
} // namespace

TablePaginator::TablePaginator(const TableStyle &style) : style_(style) {}

std::vector<double> TablePaginator::ColumnWidths(
    const DrawingSurface &surface, const std::vector<std::string> &headers,
    const std::vector<std::vector<std::string>> &rows,
    double totalWidth) const {
  size_t columns = headers.size();
  for (const auto &row : rows)
    columns = std::max(columns, row.size());
  if (columns == 0)
    return {};

  auto widths = surface.AutoColumnWidths(headers, rows, totalWidth,
                                         style_.HeaderText(),
                                         style_.BodyText());
  if (widths && widths->size() == columns) {
    double sum = std::accumulate(widths->begin(), widths->end(), 0.0);
    bool positive = std::all_of(widths->begin(), widths->end(),
                                [](double w) { return w > 0.0; });
    if (positive && sum > 0.0 && sum <= totalWidth + 0.5)
      return *widths;
  }
  return std::vector<double>(columns, totalWidth / columns);
}

TablePlacement TablePaginator::RenderTable(
    const std::vector<std::string> &headers,
    const std::vector<std::vector<std::string>> &rows,
    const PageCursor &cursor) const {
  PageCursor local = cursor;
  DrawingSurface &surface = local.Surface();
  TablePlacement placement{local.PageIndex(), local.Y(), 0};

  size_t columns = headers.size();
  for (const auto &row : rows)
    columns = std::max(columns, row.size());
  if (columns == 0)
    return placement;

  std::vector<std::string> header = Normalize(headers, columns);
  std::vector<std::vector<std::string>> body;
  body.reserve(rows.size());
  for (const auto &row : rows)
    body.push_back(Normalize(row, columns));

  const double totalWidth = local.ContentWidth();
  const double left = local.ContentLeft();
  const double padding = style_.cellPadding;
  const double lineHeight = style_.LineHeight();
  const TextStyle headerText = style_.HeaderText();
  const TextStyle bodyText = style_.BodyText();
  const std::vector<double> widths =
      ColumnWidths(surface, header, body, totalWidth);

  std::vector<double> columnX(columns, left);
  for (size_t c = 1; c < columns; ++c)
    columnX[c] = columnX[c - 1] + widths[c - 1];

  auto layoutRow = [&](const std::vector<std::string> &cells,
                       const TextStyle &text) {
    RowLayout layout;
    layout.cells.resize(columns);
    for (size_t c = 0; c < columns; ++c) {
      double inner = std::max(1.0, widths[c] - 2.0 * padding);
      layout.cells[c].lines = surface.MeasureWrap(cells[c], inner, text);
    }
    return layout;
  };
  auto heightFor = [&](size_t lineCount) {
    return static_cast<double>(std::max<size_t>(1, lineCount)) * lineHeight +
           2.0 * padding;
  };

  const double contentHeight = local.ContentBottom() - local.ContentTop();
  // Lines that fit in `space` inside one padded row.
  auto linesWithin = [&](double space) -> size_t {
    double room = space - 2.0 * padding;
    if (room < lineHeight - 0.01)
      return 0;
    return static_cast<size_t>(std::floor((room + 0.01) / lineHeight));
  };

  // The repeated header keeps room for one body line below it on every
  // page; extra header lines are cut.
  bool hasHeader = HasText(header);
  RowLayout headerLayout;
  double headerHeight = 0.0;
  if (hasHeader) {
    size_t maxHeaderLines = linesWithin(contentHeight - heightFor(1));
    if (maxHeaderLines == 0) {
      hasHeader = false;
    } else {
      headerLayout = layoutRow(header, headerText);
      for (auto &cell : headerLayout.cells)
        if (cell.lines.size() > maxHeaderLines)
          cell.lines.resize(maxHeaderLines);
      headerHeight = heightFor(headerLayout.PendingLines());
    }
  }

  // Draws up to maxLines pending lines of every cell of the row at the
  // cursor and moves below them.
  auto drawRow = [&](RowLayout &layout, size_t maxLines, const TextStyle &text,
                     const RgbColor *fill) {
    size_t lineCount = std::min(layout.PendingLines(), maxLines);
    double height = heightFor(lineCount);
    double top = local.Y();
    if (fill) {
      RectStyle rect;
      rect.fill = *fill;
      surface.WriteRect(left, top, totalWidth, height, rect);
    }
    for (size_t c = 0; c < columns; ++c) {
      auto &cell = layout.cells[c];
      size_t take = std::min(cell.Pending(), lineCount);
      for (size_t i = 0; i < take; ++i) {
        double baseline =
            LineBaseline(top + padding + i * lineHeight, text.fontSize,
                         lineHeight);
        surface.WriteText(cell.lines[cell.next + i], columnX[c] + padding,
                          baseline, text, TextAlign::Left);
      }
      cell.next += take;
    }
    local.Advance(height);
  };

  auto drawHeader = [&]() {
    if (!hasHeader)
      return;
    RowLayout copy = headerLayout;
    drawRow(copy, copy.PendingLines(), headerText, &style_.headerFill);
  };

  bool freshPage = false;
  auto startContinuationPage = [&]() {
    local.StartNewPage();
    ++placement.pagesAdded;
    drawHeader();
    freshPage = true;
  };

  std::vector<RowLayout> bodyLayouts;
  bodyLayouts.reserve(body.size());
  for (const auto &row : body)
    bodyLayouts.push_back(layoutRow(row, bodyText));

  double firstRowHeight =
      bodyLayouts.empty() ? 0.0 : heightFor(bodyLayouts.front().PendingLines());
  double needed = std::max(style_.startReserve, headerHeight + firstRowHeight);
  needed = std::min(needed, contentHeight);
  int pageBefore = local.PageIndex();
  if (local.EnsureSpace(needed) && pageBefore > 0)
    ++placement.pagesAdded;
  freshPage = local.Y() <= local.ContentTop() + 0.01;
  drawHeader();

  bool pageHasRows = false;
  for (size_t r = 0; r < bodyLayouts.size(); ++r) {
    RowLayout &layout = bodyLayouts[r];
    const RgbColor *fill = (r % 2 == 1) ? &style_.alternateFill : nullptr;
    while (true) {
      double rowHeight = heightFor(layout.PendingLines());
      double available = local.ContentBottom() - local.Y();
      if (rowHeight <= available + 0.01) {
        drawRow(layout, layout.PendingLines(), bodyText, fill);
        pageHasRows = true;
        freshPage = false;
        break;
      }
      size_t fitting = linesWithin(available);
      if (pageHasRows || (fitting == 0 && !freshPage)) {
        startContinuationPage();
        pageHasRows = false;
        continue;
      }
      // The row does not fit even on a page of its own: draw the lines
      // that fit and carry the rest over. A page too short for a single
      // line still takes one, since no page break can make room for it.
      fitting = std::max<size_t>(fitting, 1);
      drawRow(layout, fitting, bodyText, fill);
      freshPage = false;
      if (layout.PendingLines() == 0) {
        pageHasRows = true;
        break;
      }
      startContinuationPage();
      pageHasRows = false;
    }
  }

  placement.pageIndex = local.PageIndex();
  placement.y = local.Y();
  return placement;
}
