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

#include <string>
#include <vector>

#include "pagecursor.h"
#include "styletable.h"

// Where a table ended.
struct TablePlacement {
  int pageIndex = 0;
  double y = 0.0;
  int pagesAdded = 0;
};

// Draws a table that may span several pages. The header row is drawn
// again at the top of every continuation page and rows taller than a
// page are split between lines.
class TablePaginator {
public:
  explicit TablePaginator(const TableStyle &style);

  // The passed cursor is not moved. Callers adopt the returned
  // placement with PageCursor::SyncTo.
  TablePlacement RenderTable(const std::vector<std::string> &headers,
                             const std::vector<std::vector<std::string>> &rows,
                             const PageCursor &cursor) const;

  // Equal widths, or the surface's own sizing when it offers one.
  std::vector<double>
  ColumnWidths(const DrawingSurface &surface,
               const std::vector<std::string> &headers,
               const std::vector<std::vector<std::string>> &rows,
               double totalWidth) const;

private:
  const TableStyle &style_;
};
