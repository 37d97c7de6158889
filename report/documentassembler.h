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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "block.h"
#include "drawingsurface.h"
#include "pagecursor.h"
#include "sectioncomposer.h"
#include "styletable.h"

struct CoverPage {
  std::string title;
  std::string subtitle;
  double subtitleSize = 20.0;
  // Centred lines around the middle of the page, or left aligned lines
  // near the top when centerDetails is false.
  std::vector<std::string> details;
  bool centerDetails = true;
};

struct TocEntry {
  std::string title;
  std::string description;
};

struct ClosingPage {
  std::string heading = "Thank You";
  std::string message;
};

struct FooterSpec {
  bool enabled = false;
  // Left part of the footer. The right part is "Page i of N".
  std::string label;
};

struct AssemblyPlan {
  std::optional<CoverPage> cover;
  std::vector<TocEntry> tableOfContents;
  std::optional<ClosingPage> closing;
  FooterSpec footer;
};

// Builds a complete document on a surface: optional cover and table of
// contents, one section per AppendSection call, then on Finalize the
// optional closing page and the page footers. Calls out of this order
// throw std::logic_error.
class DocumentAssembler {
public:
  enum class State { Created, Open, Finalized };

  DocumentAssembler(DrawingSurface &surface, const StyleTable &styles);

  void Begin(const AssemblyPlan &plan);
  void AppendSection(const std::string &title, const std::string &byline,
                     const std::vector<Block> &blocks);
  // Draws the closing page and footers, then saves the surface.
  bool Finalize(const std::filesystem::path &path, std::string &error);

  State GetState() const { return state_; }
  int PageCount() const { return surface_.PageCount(); }
  const std::vector<int> &SectionStartPages() const { return sectionPages_; }
  int TableOfContentsPages() const { return tocPages_; }

private:
  void DrawCover(const CoverPage &cover);
  void DrawTableOfContents(const std::vector<TocEntry> &entries);
  void DrawClosingPage(const ClosingPage &closing);
  void StampFooters();

  DrawingSurface &surface_;
  const StyleTable &styles_;
  SectionComposer composer_;
  PageCursor cursor_;
  AssemblyPlan plan_;
  State state_ = State::Created;
  std::vector<int> sectionPages_;
  int tocPages_ = 0;
};

// Single page document explaining that a report could not be generated.
void ComposeErrorDocument(DrawingSurface &surface,
                          const std::vector<std::string> &lines);
