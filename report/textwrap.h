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

#include <functional>
#include <string>
#include <vector>

using TextMeasure = std::function<double(const std::string &)>;

// Greedy word wrap. Runs of whitespace collapse to one space, '\n'
// forces a break and words wider than maxWidth are split between UTF-8
// characters. Blank input yields no lines.
std::vector<std::string> WrapText(const std::string &text, double maxWidth,
                                  const TextMeasure &measure);
