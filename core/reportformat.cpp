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
#include "reportformat.h"

#include <nlohmann/json.hpp>

#include "stringutils.h"

namespace {
constexpr const char *kQuadrants[] = {"Strengths", "Weaknesses",
                                      "Opportunities", "Threats"};

std::string ItemText(const nlohmann::json &item) {
  if (item.is_string())
    return item.get<std::string>();
  return item.dump();
}
} // namespace

bool FormatSwotMarkdown(const std::string &json, std::string &markdown) {
  nlohmann::json root = nlohmann::json::parse(json, nullptr, false);
  if (root.is_discarded() || !root.is_object())
    return false;

  std::string out = "# SWOT Analysis";
  for (const char *quadrant : kQuadrants) {
    out += "\n\n## ";
    out += quadrant;
    auto it = root.find(quadrant);
    if (it == root.end())
      continue;
    if (it->is_array()) {
      for (const auto &item : *it)
        out += "\n- " + ItemText(item);
    } else if (!it->is_null()) {
      out += "\n- " + ItemText(*it);
    }
  }
  markdown = out;
  return true;
}

std::string NormalizeReportContent(const std::string &reportTypeId,
                                   const std::string &content) {
  if (reportTypeId != SWOT_REPORT_ID)
    return content;
  std::string trimmed = StringUtils::Trim(content);
  if (trimmed.empty() || trimmed.front() != '{')
    return content;
  std::string markdown;
  if (FormatSwotMarkdown(trimmed, markdown))
    return markdown;
  return content;
}
