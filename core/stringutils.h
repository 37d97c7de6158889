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

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

namespace StringUtils {

inline std::string Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

inline std::string ToLowerCopy(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

inline bool ContainsIgnoreCase(const std::string &haystack,
                               const std::string &needle) {
  if (needle.empty())
    return true;
  return ToLowerCopy(haystack).find(ToLowerCopy(needle)) != std::string::npos;
}

inline std::string ReplaceAll(std::string text, const std::string &from,
                              const std::string &to) {
  if (from.empty())
    return text;
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

inline std::vector<std::string> SplitCSV(const std::string &s) {
  std::vector<std::string> result;
  size_t start = 0;
  while (start <= s.size()) {
    size_t comma = s.find(',', start);
    if (comma == std::string::npos)
      comma = s.size();
    std::string item = Trim(s.substr(start, comma - start));
    if (!item.empty())
      result.push_back(item);
    start = comma + 1;
  }
  return result;
}

inline std::string JoinCSV(const std::vector<std::string> &items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      out += ',';
    out += items[i];
  }
  return out;
}

// Byte length of the UTF-8 sequence starting with the given lead byte.
inline size_t Utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 1;
}

inline size_t Utf8Length(const std::string &text) {
  size_t count = 0;
  for (size_t i = 0; i < text.size();) {
    i += Utf8SequenceLength(static_cast<unsigned char>(text[i]));
    ++count;
  }
  return count;
}

// Replace characters that are not allowed in file names on common
// platforms. Spaces are kept.
inline std::string SanitizeFileComponent(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || c == '/' || c == '\\' || c == ':' || c == '*' ||
        c == '?' || c == '"' || c == '<' || c == '>' || c == '|')
      out += '_';
    else
      out += c;
  }
  out = Trim(out);
  return out.empty() ? std::string("report") : out;
}

} // namespace StringUtils
