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

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "block.h"
#include "drawingsurface.h"
#include "reportcatalog.h"
#include "reportproviders.h"

enum class ExportMode { Single, All, Summary };

const char *ExportModeName(ExportMode mode);

struct ExportJob {
  std::vector<ReportRequest> reportList;
  ExportMode mode = ExportMode::Single;
  std::string progressMessage;
};

// Subject of a bundle export.
struct ExportContext {
  std::string companyId;
  std::string companyName;
  std::vector<std::string> competitorIds;
  RequesterContext requester;
  std::string timeRange;
  std::filesystem::path outputDirectory;
  // Report bodies already at hand, keyed by report type id. These are
  // used instead of asking the content provider.
  std::map<std::string, std::string> resolvedReports;
};

struct SingleExportRequest {
  std::string reportTypeId;
  std::string content;
  std::string companyName;
  std::filesystem::path outputDirectory;
};

struct ExportResult {
  bool success = false;
  // Another export was running; nothing was done.
  bool rejected = false;
  // The single report looked like an error message and the fixed error
  // document was written instead.
  bool errorDocument = false;
  std::string message;
  std::filesystem::path outputPath;
  int pageCount = 0;
  std::vector<std::string> failedReports;
};

struct ExportDate {
  std::string display;
  std::string iso;
};

struct ExportOptions {
  PageGeometry geometry;
  std::string brandName = "COMPA AI";
  std::string closingMessage = "For using COMPA AI Strategic Analysis";
};

using SurfaceFactory =
    std::function<std::unique_ptr<DrawingSurface>(const PageGeometry &)>;
using DateProvider = std::function<ExportDate()>;

// Local date formatted with strftime's displayFormat, plus YYYY-MM-DD.
ExportDate CurrentExportDate(const std::string &displayFormat = "%m/%d/%Y");

// Runs report exports one at a time. A second export started while one
// is running (for example from a progress callback) is rejected.
class ExportOrchestrator {
public:
  ExportOrchestrator(ReportCatalog catalog, SurfaceFactory surfaces,
                     ReportContentProvider &reports,
                     SummaryProvider &summaries,
                     ExportProgressListener &progress,
                     ExportOptions options = {});

  void SetDateProvider(DateProvider provider);

  ExportResult ExportSingleReport(const SingleExportRequest &request);
  ExportResult ExportAllReports(const ExportContext &context);
  ExportResult ExportExecutiveSummary(const ExportContext &context);

  bool IsBusy() const { return busy_; }
  std::optional<ExportJob> CurrentJob() const { return job_; }
  const ReportCatalog &Catalog() const { return catalog_; }

  static std::string SingleReportFileName(const std::string &reportTypeId,
                                          const std::string &isoDate);
  static std::string ErrorReportFileName(const std::string &reportTypeId);
  static std::string BundleFileName(const std::string &prefix,
                                    const std::string &companyName,
                                    const std::string &isoDate);

private:
  class BusyScope;

  struct ResolvedReport {
    bool failed = false;
    std::string content;
    std::vector<Block> blocks;
  };

  ResolvedReport ResolveReport(const ReportType &type,
                               const ReportRequest &request,
                               const ExportContext &context);
  std::vector<ReportRequest> BuildRequests(const ExportContext &context) const;
  std::unique_ptr<DrawingSurface> CreateSurface() const;
  void Progress(const std::string &message);
  void Alert(const std::string &message);

  ReportCatalog catalog_;
  SurfaceFactory surfaces_;
  ReportContentProvider &reports_;
  SummaryProvider &summaries_;
  ExportProgressListener &progress_;
  ExportOptions options_;
  DateProvider dates_;
  std::atomic<bool> busy_{false};
  std::optional<ExportJob> job_;
};
