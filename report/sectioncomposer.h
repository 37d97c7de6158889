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
#include "blockrenderer.h"
#include "pagecursor.h"
#include "styletable.h"

// Lays out one report section: a banner on a fresh page followed by the
// section's blocks.
class SectionComposer {
public:
  explicit SectionComposer(const StyleTable &styles);

  // Returns the page the section starts on.
  int ComposeSection(const std::string &title, const std::string &byline,
                     const std::vector<Block> &blocks,
                     PageCursor &cursor) const;

private:
  void DrawBanner(const std::string &title, const std::string &byline,
                  PageCursor &cursor) const;

  const StyleTable &styles_;
  BlockRenderer renderer_;
};
