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

#include "block.h"
#include "pagecursor.h"
#include "styletable.h"
#include "tablepaginator.h"

// Draws blocks at the cursor using the rules of a StyleTable, breaking
// pages as needed.
class BlockRenderer {
public:
  explicit BlockRenderer(const StyleTable &styles);

  // Empty blocks draw nothing and leave the cursor untouched.
  void Render(const Block &block, PageCursor &cursor) const;
  void RenderAll(const std::vector<Block> &blocks, PageCursor &cursor) const;

private:
  void RenderTextBlock(const Block &block, PageCursor &cursor) const;
  void RenderList(const Block &block, PageCursor &cursor) const;
  void RenderTable(const Block &block, PageCursor &cursor) const;

  const StyleTable &styles_;
  TablePaginator tables_;
};
