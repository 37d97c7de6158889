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
#ifndef REPORTCLIENT_H
#define REPORTCLIENT_H

#include <string>

#include "reportproviders.h"

// Fetches reports and summaries from the analysis backend over HTTP.
// A request that times out is reported like any other failed fetch.
class HttpReportClient : public ReportContentProvider, public SummaryProvider {
public:
  // apiBaseUrl is the API root, e.g. http://localhost:5000/api.
  // A timeout of 0 waits indefinitely.
  HttpReportClient(std::string apiBaseUrl, long timeoutSeconds);

  ReportFetchResult FetchReport(const ReportRequest &request) override;
  SummaryResult Summarize(const SummaryRequest &request) override;

private:
  bool PostJson(const std::string &url, const std::string &body,
                std::string &response, long &httpCode,
                std::string &error) const;

  std::string apiBaseUrl_;
  long timeoutSeconds_ = 0;
};

std::string BuildReportRequestBody(const ReportRequest &request);
std::string BuildSummaryRequestBody(const SummaryRequest &request);

// Interpret {"success": true, "report": "..." | {"content": "..."}}.
ReportFetchResult ParseReportResponse(const std::string &body, long httpCode);
// Interpret {"success": true, "summary": {"content": "..."}}.
SummaryResult ParseSummaryResponse(const std::string &body, long httpCode);

#endif // REPORTCLIENT_H
