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
#include "block.h"

#include <utility>

#include "stringutils.h"

namespace {
bool IsBlank(const std::string &text) {
  return StringUtils::Trim(text).empty();
}

void AppendLine(std::string &out, const std::string &line) {
  if (IsBlank(line))
    return;
  if (!out.empty())
    out += '\n';
  out += line;
}
} // namespace

Block Block::Heading(int level, std::string text) {
  Block block;
  if (level <= 1)
    block.kind = BlockKind::Heading1;
  else if (level == 2)
    block.kind = BlockKind::Heading2;
  else
    block.kind = BlockKind::Heading3;
  block.text = std::move(text);
  return block;
}

Block Block::Paragraph(std::string text) {
  Block block;
  block.kind = BlockKind::Paragraph;
  block.text = std::move(text);
  return block;
}

Block Block::List(bool ordered, std::vector<std::string> items,
                  int startNumber) {
  Block block;
  block.kind = ordered ? BlockKind::OrderedList : BlockKind::UnorderedList;
  block.items = std::move(items);
  block.startNumber = startNumber;
  return block;
}

Block Block::Table(std::vector<std::string> headers,
                   std::vector<std::vector<std::string>> rows) {
  Block block;
  block.kind = BlockKind::Table;
  block.headers = std::move(headers);
  block.rows = std::move(rows);
  return block;
}

const char *BlockKindName(BlockKind kind) {
  switch (kind) {
  case BlockKind::Heading1:
    return "h1";
  case BlockKind::Heading2:
    return "h2";
  case BlockKind::Heading3:
    return "h3";
  case BlockKind::Paragraph:
    return "p";
  case BlockKind::UnorderedList:
    return "ul";
  case BlockKind::OrderedList:
    return "ol";
  case BlockKind::Table:
    return "table";
  }
  return "p";
}

bool IsHeading(BlockKind kind) {
  return kind == BlockKind::Heading1 || kind == BlockKind::Heading2 ||
         kind == BlockKind::Heading3;
}

bool IsBlockEmpty(const Block &block) {
  switch (block.kind) {
  case BlockKind::UnorderedList:
  case BlockKind::OrderedList:
    for (const auto &item : block.items)
      if (!IsBlank(item))
        return false;
    return true;
  case BlockKind::Table:
    for (const auto &header : block.headers)
      if (!IsBlank(header))
        return false;
    for (const auto &row : block.rows)
      for (const auto &cell : row)
        if (!IsBlank(cell))
          return false;
    return true;
  default:
    return IsBlank(block.text);
  }
}

std::string BlocksPlainText(const std::vector<Block> &blocks) {
  std::string out;
  for (const auto &block : blocks) {
    AppendLine(out, block.text);
    for (const auto &item : block.items)
      AppendLine(out, item);
    for (const auto &header : block.headers)
      AppendLine(out, header);
    for (const auto &row : block.rows)
      for (const auto &cell : row)
        AppendLine(out, cell);
  }
  return out;
}
