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
#include "blockrenderer.h"

#include "stringutils.h"

BlockRenderer::BlockRenderer(const StyleTable &styles)
    : styles_(styles), tables_(styles.Table()) {}

void BlockRenderer::RenderAll(const std::vector<Block> &blocks,
                              PageCursor &cursor) const {
  for (const auto &block : blocks)
    Render(block, cursor);
}

void BlockRenderer::Render(const Block &block, PageCursor &cursor) const {
  if (IsBlockEmpty(block))
    return;

  cursor.EnsureSpace(styles_.BlockStartReserve());

  switch (block.kind) {
  case BlockKind::UnorderedList:
  case BlockKind::OrderedList:
    RenderList(block, cursor);
    break;
  case BlockKind::Table:
    RenderTable(block, cursor);
    break;
  default:
    RenderTextBlock(block, cursor);
    break;
  }
}

void BlockRenderer::RenderTextBlock(const Block &block,
                                    PageCursor &cursor) const {
  const StyleRule &rule = styles_.StyleFor(block.kind);
  const TextStyle text = rule.Text();
  DrawingSurface &surface = cursor.Surface();

  auto lines = surface.MeasureWrap(StringUtils::Trim(block.text),
                                   cursor.ContentWidth(), text);
  if (lines.empty())
    return;

  cursor.Advance(rule.topGap);
  // Keep short headings together with their first lines.
  if (IsHeading(block.kind))
    cursor.EnsureSpace(rule.lineHeight * lines.size());
  for (const auto &line : lines) {
    cursor.EnsureSpace(rule.lineHeight);
    surface.WriteText(line, cursor.ContentLeft(),
                      LineBaseline(cursor.Y(), rule.fontSize, rule.lineHeight),
                      text, TextAlign::Left);
    cursor.Advance(rule.lineHeight);
  }
  cursor.Advance(rule.bottomGap);
}

void BlockRenderer::RenderList(const Block &block, PageCursor &cursor) const {
  const StyleRule &rule = styles_.StyleFor(block.kind);
  const TextStyle text = rule.Text();
  DrawingSurface &surface = cursor.Surface();
  const double textX = cursor.ContentLeft() + rule.indent;
  const double textWidth = cursor.ContentWidth() - rule.indent;

  cursor.Advance(rule.topGap);
  for (size_t i = 0; i < block.items.size(); ++i) {
    auto lines =
        surface.MeasureWrap(StringUtils::Trim(block.items[i]), textWidth, text);
    if (lines.empty())
      continue;
    std::string marker = styles_.ListMarker(
        block.kind, block.startNumber + static_cast<int>(i));
    for (size_t l = 0; l < lines.size(); ++l) {
      cursor.EnsureSpace(rule.lineHeight);
      double baseline =
          LineBaseline(cursor.Y(), rule.fontSize, rule.lineHeight);
      if (l == 0)
        surface.WriteText(marker, cursor.ContentLeft(), baseline, text,
                          TextAlign::Left);
      surface.WriteText(lines[l], textX, baseline, text, TextAlign::Left);
      cursor.Advance(rule.lineHeight);
    }
    cursor.Advance(rule.itemGap);
  }
  cursor.Advance(rule.bottomGap);
}

void BlockRenderer::RenderTable(const Block &block, PageCursor &cursor) const {
  TablePlacement placement = tables_.RenderTable(block.headers, block.rows, cursor);
  cursor.SyncTo(placement.pageIndex, placement.y);
  cursor.Advance(styles_.Table().bottomGap);
}
