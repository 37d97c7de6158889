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

struct ReportType {
  std::string id;
  std::string name;
  std::string description;
};

// Ordered list of the report types a bundle export covers. The order is
// the order of sections and of the table of contents.
class ReportCatalog {
public:
  ReportCatalog() = default;
  explicit ReportCatalog(std::vector<ReportType> types);

  // The sixteen built-in competitive analysis reports.
  static ReportCatalog Default();

  // Reads a JSON array of {"id", "name", "description"} objects.
  static bool LoadFromFile(const std::string &path, ReportCatalog &catalog,
                           std::string &error);
  static bool LoadFromString(const std::string &json, ReportCatalog &catalog,
                             std::string &error);

  const std::vector<ReportType> &Types() const { return types_; }
  const ReportType *Find(const std::string &id) const;
  size_t Size() const { return types_.size(); }
  bool Empty() const { return types_.empty(); }

private:
  std::vector<ReportType> types_;
};
