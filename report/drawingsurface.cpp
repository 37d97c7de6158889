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
#include "drawingsurface.h"

#include "textwrap.h"

std::vector<std::string> DrawingSurface::MeasureWrap(
    const std::string &text, double maxWidth, const TextStyle &style) const {
  return WrapText(text, maxWidth, [this, &style](const std::string &s) {
    return MeasureText(s, style);
  });
}

std::optional<std::vector<double>> DrawingSurface::AutoColumnWidths(
    const std::vector<std::string> &, const std::vector<std::vector<std::string>> &,
    double, const TextStyle &, const TextStyle &) const {
  return std::nullopt;
}
