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

inline constexpr const char *SWOT_REPORT_ID = "swot-analysis";

// Converts a SWOT JSON object ({"Strengths": [...], "Weaknesses": [...],
// "Opportunities": [...], "Threats": [...]}) into markdown. Returns false
// when json is not such an object.
bool FormatSwotMarkdown(const std::string &json, std::string &markdown);

// Markdown for a report body. SWOT reports delivered as JSON are
// converted; everything else is returned unchanged.
std::string NormalizeReportContent(const std::string &reportTypeId,
                                   const std::string &content);
