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

// Kinds of content a report can be made of. Every kind has a style
// rule in the StyleTable.
enum class BlockKind {
  Heading1,
  Heading2,
  Heading3,
  Paragraph,
  UnorderedList,
  OrderedList,
  Table
};

// One unit of report content. Which fields are meaningful depends on
// kind: headings and paragraphs use text, lists use items (and
// startNumber for ordered lists), tables use headers and rows. Inline
// formatting has already been stripped.
struct Block {
  BlockKind kind = BlockKind::Paragraph;
  std::string text;
  std::vector<std::string> items;
  int startNumber = 1;
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;

  static Block Heading(int level, std::string text);
  static Block Paragraph(std::string text);
  static Block List(bool ordered, std::vector<std::string> items,
                    int startNumber = 1);
  static Block Table(std::vector<std::string> headers,
                     std::vector<std::vector<std::string>> rows);
};

const char *BlockKindName(BlockKind kind);

bool IsHeading(BlockKind kind);

// True when the block would draw nothing (only whitespace content).
bool IsBlockEmpty(const Block &block);

// Visible text of the blocks, one line per text run.
std::string BlocksPlainText(const std::vector<Block> &blocks);
