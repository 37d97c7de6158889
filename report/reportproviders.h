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

struct RequesterContext {
  std::string userId;
  std::string firmId;
};

struct ReportRequest {
  std::string reportTypeId;
  std::string companyId;
  std::vector<std::string> competitorIds;
  RequesterContext requester;
};

struct ReportFetchResult {
  bool success = false;
  std::string content;
  std::string error;
};

struct SummaryRequest {
  std::string companyId;
  std::vector<std::string> reports;
  RequesterContext requester;
};

struct SummaryResult {
  bool success = false;
  std::string content;
  std::string error;
};

// Source of report markdown. Implementations may block; they report
// failures through the result or by throwing std::exception.
class ReportContentProvider {
public:
  virtual ~ReportContentProvider() = default;
  virtual ReportFetchResult FetchReport(const ReportRequest &request) = 0;
};

class SummaryProvider {
public:
  virtual ~SummaryProvider() = default;
  virtual SummaryResult Summarize(const SummaryRequest &request) = 0;
};

// Receives the progress of a bundle export. All callbacks run on the
// exporting thread.
class ExportProgressListener {
public:
  virtual ~ExportProgressListener() = default;
  virtual void OnExportStarted() {}
  virtual void OnProgress(const std::string &) {}
  virtual void OnAlert(const std::string &) {}
  virtual void OnExportFinished() {}
};
