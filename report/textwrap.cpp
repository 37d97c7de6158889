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
#include "textwrap.h"

#include <cctype>

#include "stringutils.h"

namespace {
std::vector<std::string> SplitWords(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty())
    words.push_back(current);
  return words;
}

// Splits a word that does not fit on a line into pieces that do. Each
// piece holds at least one character so the loop always progresses.
std::vector<std::string> BreakWord(const std::string &word, double maxWidth,
                                   const TextMeasure &measure) {
  std::vector<std::string> pieces;
  std::string piece;
  for (size_t i = 0; i < word.size();) {
    size_t len = StringUtils::Utf8SequenceLength(
        static_cast<unsigned char>(word[i]));
    std::string ch = word.substr(i, len);
    i += len;
    if (!piece.empty() && measure(piece + ch) > maxWidth) {
      pieces.push_back(piece);
      piece.clear();
    }
    piece += ch;
  }
  if (!piece.empty())
    pieces.push_back(piece);
  return pieces;
}

void WrapParagraph(const std::string &paragraph, double maxWidth,
                   const TextMeasure &measure,
                   std::vector<std::string> &lines) {
  std::string line;
  for (const auto &word : SplitWords(paragraph)) {
    std::string candidate = line.empty() ? word : line + " " + word;
    if (measure(candidate) <= maxWidth) {
      line = candidate;
      continue;
    }
    if (!line.empty()) {
      lines.push_back(line);
      line.clear();
    }
    if (measure(word) <= maxWidth) {
      line = word;
      continue;
    }
    auto pieces = BreakWord(word, maxWidth, measure);
    for (size_t i = 0; i + 1 < pieces.size(); ++i)
      lines.push_back(pieces[i]);
    line = pieces.empty() ? std::string() : pieces.back();
  }
  if (!line.empty())
    lines.push_back(line);
}
} // namespace

std::vector<std::string> WrapText(const std::string &text, double maxWidth,
                                  const TextMeasure &measure) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos)
      end = text.size();
    WrapParagraph(text.substr(start, end - start), maxWidth, measure, lines);
    start = end + 1;
  }
  return lines;
}
