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
#include "contentcheck.h"

#include "stringutils.h"

namespace {
constexpr const char *kErrorPhrases[] = {"error generating", "try again",
                                         "failed to generate"};
}

bool LooksLikeGenerationError(const std::string &text) {
  std::string lower = StringUtils::ToLowerCopy(text);
  for (const char *phrase : kErrorPhrases) {
    if (lower.find(phrase) != std::string::npos)
      return true;
  }
  return false;
}
