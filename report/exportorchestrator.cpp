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
#include "exportorchestrator.h"

#include <ctime>
#include <exception>
#include <stdexcept>

#include "contentcheck.h"
#include "documentassembler.h"
#include "logger.h"
#include "markdown.h"
#include "reportformat.h"
#include "stringutils.h"
#include "styletable.h"

namespace {
constexpr const char *kBusyMessage = "An export is already in progress.";
constexpr const char *kSingleFailedAlert =
    "Failed to generate PDF. Please try again.";
constexpr const char *kAllFailedAlert =
    "Failed to generate comprehensive PDF. Please try again.";
constexpr const char *kSummaryFailedAlert =
    "Failed to generate summary PDF. Please try again.";
constexpr const char *kSummarizeFailedAlert = "Failed to generate summary.";

std::string FormatDate(const std::tm &tm, const char *format) {
  char buffer[128] = {};
  size_t written = std::strftime(buffer, sizeof(buffer), format, &tm);
  return std::string(buffer, written);
}

std::string CompanyLabel(const std::string &companyName) {
  return companyName.empty() ? std::string("Report") : companyName;
}
} // namespace

const char *ExportModeName(ExportMode mode) {
  switch (mode) {
  case ExportMode::Single:
    return "single";
  case ExportMode::All:
    return "all";
  case ExportMode::Summary:
    return "summary";
  }
  return "single";
}

ExportDate CurrentExportDate(const std::string &displayFormat) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  ExportDate date;
  date.display = FormatDate(local, displayFormat.c_str());
  date.iso = FormatDate(local, "%Y-%m-%d");
  if (date.display.empty())
    date.display = date.iso;
  return date;
}

// Marks the orchestrator busy for the lifetime of one export and makes
// sure the progress listener always sees the export finish.
class ExportOrchestrator::BusyScope {
public:
  BusyScope(ExportOrchestrator &owner, ExportJob job, bool notify)
      : owner_(owner), notify_(notify) {
    acquired_ = !owner_.busy_.exchange(true);
    if (!acquired_)
      return;
    owner_.job_ = std::move(job);
    if (notify_)
      owner_.progress_.OnExportStarted();
  }

  ~BusyScope() {
    if (!acquired_)
      return;
    if (notify_)
      owner_.progress_.OnExportFinished();
    owner_.job_.reset();
    owner_.busy_ = false;
  }

  BusyScope(const BusyScope &) = delete;
  BusyScope &operator=(const BusyScope &) = delete;

  bool Acquired() const { return acquired_; }

private:
  ExportOrchestrator &owner_;
  bool notify_ = false;
  bool acquired_ = false;
};

ExportOrchestrator::ExportOrchestrator(ReportCatalog catalog,
                                       SurfaceFactory surfaces,
                                       ReportContentProvider &reports,
                                       SummaryProvider &summaries,
                                       ExportProgressListener &progress,
                                       ExportOptions options)
    : catalog_(std::move(catalog)), surfaces_(std::move(surfaces)),
      reports_(reports), summaries_(summaries), progress_(progress),
      options_(std::move(options)),
      dates_([] { return CurrentExportDate(); }) {}

void ExportOrchestrator::SetDateProvider(DateProvider provider) {
  if (provider)
    dates_ = std::move(provider);
}

std::string
ExportOrchestrator::SingleReportFileName(const std::string &reportTypeId,
                                         const std::string &isoDate) {
  std::string type = reportTypeId.empty() ? std::string("report")
                                          : reportTypeId;
  return StringUtils::SanitizeFileComponent(
             StringUtils::ReplaceAll(type, "-", "_")) +
         "_" + isoDate + ".pdf";
}

std::string
ExportOrchestrator::ErrorReportFileName(const std::string &reportTypeId) {
  std::string type = reportTypeId.empty() ? std::string("error")
                                          : reportTypeId;
  return StringUtils::SanitizeFileComponent(
             StringUtils::ReplaceAll(type, "-", "_")) +
         "_report.pdf";
}

std::string ExportOrchestrator::BundleFileName(const std::string &prefix,
                                               const std::string &companyName,
                                               const std::string &isoDate) {
  return prefix + "_" +
         StringUtils::SanitizeFileComponent(CompanyLabel(companyName)) + "_" +
         isoDate + ".pdf";
}

std::unique_ptr<DrawingSurface> ExportOrchestrator::CreateSurface() const {
  if (!surfaces_)
    throw std::runtime_error("no drawing surface factory configured");
  auto surface = surfaces_(options_.geometry);
  if (!surface)
    throw std::runtime_error("drawing surface factory returned nothing");
  return surface;
}

void ExportOrchestrator::Progress(const std::string &message) {
  if (job_)
    job_->progressMessage = message;
  progress_.OnProgress(message);
}

void ExportOrchestrator::Alert(const std::string &message) {
  Logger::Instance().Log(LogLevel::Error, message);
  progress_.OnAlert(message);
}

std::vector<ReportRequest>
ExportOrchestrator::BuildRequests(const ExportContext &context) const {
  std::vector<ReportRequest> requests;
  requests.reserve(catalog_.Size());
  for (const auto &type : catalog_.Types()) {
    ReportRequest request;
    request.reportTypeId = type.id;
    request.companyId = context.companyId;
    request.competitorIds = context.competitorIds;
    request.requester = context.requester;
    requests.push_back(std::move(request));
  }
  return requests;
}

ExportOrchestrator::ResolvedReport
ExportOrchestrator::ResolveReport(const ReportType &type,
                                  const ReportRequest &request,
                                  const ExportContext &context) {
  ResolvedReport resolved;
  auto known = context.resolvedReports.find(type.id);
  if (known != context.resolvedReports.end()) {
    resolved.content = NormalizeReportContent(type.id, known->second);
    resolved.blocks = ParseMarkdownBlocks(resolved.content);
    return resolved;
  }

  ReportFetchResult fetched;
  try {
    fetched = reports_.FetchReport(request);
  } catch (const std::exception &ex) {
    fetched.success = false;
    fetched.error = ex.what();
  }

  if (!fetched.success) {
    std::string reason = fetched.error.empty() ? std::string("Unknown error")
                                               : fetched.error;
    Logger::Instance().Log(LogLevel::Warning,
                           "Report " + type.id + " failed: " + reason);
    resolved.failed = true;
    resolved.content = "Error generating " + type.name + ": " + reason;
    resolved.blocks.push_back(Block::Paragraph(resolved.content));
    return resolved;
  }

  resolved.content = NormalizeReportContent(type.id, fetched.content);
  resolved.blocks = ParseMarkdownBlocks(resolved.content);
  return resolved;
}

ExportResult
ExportOrchestrator::ExportSingleReport(const SingleExportRequest &request) {
  ExportResult result;
  ExportJob job;
  job.mode = ExportMode::Single;
  ReportRequest entry;
  entry.reportTypeId = request.reportTypeId;
  job.reportList.push_back(entry);

  BusyScope scope(*this, std::move(job), false);
  if (!scope.Acquired()) {
    result.rejected = true;
    result.message = kBusyMessage;
    return result;
  }

  try {
    const ExportDate date = dates_();
    std::string content =
        NormalizeReportContent(request.reportTypeId, request.content);
    std::vector<Block> blocks = ParseMarkdownBlocks(content);
    auto surface = CreateSurface();
    std::string error;

    if (LooksLikeGenerationError(BlocksPlainText(blocks))) {
      Logger::Instance().Log(LogLevel::Warning,
                             "Report " + request.reportTypeId +
                                 " contains an error message, writing "
                                 "error document");
      ComposeErrorDocument(
          *surface, {"There was an error generating this report.",
                     "Please try regenerating the report or contact support."});
      result.outputPath = request.outputDirectory /
                          ErrorReportFileName(request.reportTypeId);
      result.errorDocument = true;
      result.pageCount = surface->PageCount();
      if (!surface->Save(result.outputPath, error)) {
        result.message = error;
        Alert(kSingleFailedAlert);
        return result;
      }
      result.success = true;
      result.message = "Report content contained an error message";
      return result;
    }

    const ReportType *type = catalog_.Find(request.reportTypeId);
    std::string title = type ? type->name : request.reportTypeId;
    if (title.empty())
      title = "Report";
    std::string byline =
        request.companyName.empty() ? "" : "Company: " + request.companyName;

    StyleTable styles = StyleTable::ForPreset(StylePreset::Single);
    DocumentAssembler assembler(*surface, styles);
    assembler.Begin(AssemblyPlan{});
    assembler.AppendSection(title, byline, blocks);
    result.outputPath = request.outputDirectory /
                        SingleReportFileName(request.reportTypeId, date.iso);
    if (!assembler.Finalize(result.outputPath, error)) {
      result.message = error;
      Alert(kSingleFailedAlert);
      return result;
    }
    result.pageCount = assembler.PageCount();
    result.success = true;
    Logger::Instance().Log("Exported " + result.outputPath.string());
  } catch (const std::exception &ex) {
    result.success = false;
    result.message = ex.what();
    Logger::Instance().Log(LogLevel::Error,
                           std::string("Single report export failed: ") +
                               ex.what());
    Alert(kSingleFailedAlert);
  }
  return result;
}

ExportResult ExportOrchestrator::ExportAllReports(const ExportContext &context) {
  ExportResult result;
  ExportJob job;
  job.mode = ExportMode::All;
  job.reportList = BuildRequests(context);

  BusyScope scope(*this, job, true);
  if (!scope.Acquired()) {
    result.rejected = true;
    result.message = kBusyMessage;
    return result;
  }

  try {
    Progress("Preparing comprehensive report export...");
    const ExportDate date = dates_();
    auto surface = CreateSurface();
    StyleTable styles = StyleTable::ForPreset(StylePreset::Bundle);
    DocumentAssembler assembler(*surface, styles);

    AssemblyPlan plan;
    CoverPage cover;
    cover.title = "Comprehensive Business Analysis";
    cover.subtitle = context.companyName;
    cover.details.push_back("Generated on: " + date.display);
    if (!context.competitorIds.empty())
      cover.details.push_back("Analyzing " +
                              std::to_string(context.competitorIds.size()) +
                              " competitors");
    plan.cover = cover;
    for (const auto &type : catalog_.Types())
      plan.tableOfContents.push_back(TocEntry{type.name, type.description});
    plan.closing = ClosingPage{"Thank You", options_.closingMessage};
    plan.footer.enabled = true;
    plan.footer.label = "Comprehensive Business Analysis | " +
                        options_.brandName + " | " + date.display;
    assembler.Begin(plan);

    const auto &types = catalog_.Types();
    for (size_t i = 0; i < types.size(); ++i) {
      Progress("Processing: " + types[i].name + " (" + std::to_string(i + 1) +
               "/" + std::to_string(types.size()) + ")");
      ResolvedReport resolved =
          ResolveReport(types[i], job.reportList[i], context);
      if (resolved.failed)
        result.failedReports.push_back(types[i].id);
      assembler.AppendSection(types[i].name, "", resolved.blocks);
    }

    Progress("Finalizing PDF...");
    result.outputPath =
        context.outputDirectory /
        BundleFileName("Comprehensive_Business_Analysis", context.companyName,
                       date.iso);
    std::string error;
    if (!assembler.Finalize(result.outputPath, error)) {
      result.message = error;
      Alert(kAllFailedAlert);
      return result;
    }
    result.pageCount = assembler.PageCount();
    result.success = true;
    Logger::Instance().Log("Exported " + result.outputPath.string() + " (" +
                           std::to_string(result.pageCount) + " pages, " +
                           std::to_string(result.failedReports.size()) +
                           " failed reports)");
  } catch (const std::exception &ex) {
    result.success = false;
    result.message = ex.what();
    Logger::Instance().Log(LogLevel::Error,
                           std::string("Comprehensive export failed: ") +
                               ex.what());
    Alert(kAllFailedAlert);
  }
  return result;
}

ExportResult
ExportOrchestrator::ExportExecutiveSummary(const ExportContext &context) {
  ExportResult result;
  ExportJob job;
  job.mode = ExportMode::Summary;
  job.reportList = BuildRequests(context);

  BusyScope scope(*this, job, true);
  if (!scope.Acquired()) {
    result.rejected = true;
    result.message = kBusyMessage;
    return result;
  }

  try {
    Progress("Gathering all reports...");
    const auto &types = catalog_.Types();
    SummaryRequest summaryRequest;
    summaryRequest.companyId = context.companyId;
    summaryRequest.requester = context.requester;
    for (size_t i = 0; i < types.size(); ++i) {
      Progress("Gathering: " + types[i].name + " (" + std::to_string(i + 1) +
               "/" + std::to_string(types.size()) + ")");
      ResolvedReport resolved =
          ResolveReport(types[i], job.reportList[i], context);
      if (resolved.failed)
        result.failedReports.push_back(types[i].id);
      summaryRequest.reports.push_back(resolved.content);
    }

    Progress("Generating AI summary...");
    SummaryResult summary;
    try {
      summary = summaries_.Summarize(summaryRequest);
    } catch (const std::exception &ex) {
      summary.success = false;
      summary.error = ex.what();
    }
    if (!summary.success) {
      result.message = summary.error.empty() ? std::string(kSummarizeFailedAlert)
                                             : summary.error;
      Logger::Instance().Log(LogLevel::Error,
                             "Summary generation failed: " + result.message);
      Alert(kSummarizeFailedAlert);
      return result;
    }

    Progress("Creating summary PDF...");
    const ExportDate date = dates_();
    auto surface = CreateSurface();
    StyleTable styles = StyleTable::ForPreset(StylePreset::Summary);
    DocumentAssembler assembler(*surface, styles);

    AssemblyPlan plan;
    CoverPage cover;
    cover.title = "Executive Summary";
    cover.subtitle = CompanyLabel(context.companyName) + " - Strategic Analysis";
    cover.subtitleSize = 18.0;
    cover.centerDetails = false;
    cover.details.push_back("Generated: " + date.display);
    if (!context.timeRange.empty())
      cover.details.push_back("Analysis Period: " + context.timeRange);
    cover.details.push_back("Competitors Analyzed: " +
                            std::to_string(context.competitorIds.size()));
    cover.details.push_back("Total Reports: " + std::to_string(types.size()));
    plan.cover = cover;
    plan.closing = ClosingPage{"Thank You", options_.closingMessage};
    plan.footer.enabled = true;
    plan.footer.label =
        "Executive Summary | " + options_.brandName + " | " + date.display;
    assembler.Begin(plan);

    assembler.AppendSection(
        "Executive Summary", context.companyName,
        ParseMarkdownBlocks(NormalizeReportContent("", summary.content)));

    Progress("Finalizing summary PDF...");
    result.outputPath = context.outputDirectory /
                        BundleFileName("Executive_Summary",
                                       context.companyName, date.iso);
    std::string error;
    if (!assembler.Finalize(result.outputPath, error)) {
      result.message = error;
      Alert(kSummaryFailedAlert);
      return result;
    }
    result.pageCount = assembler.PageCount();
    result.success = true;
    Logger::Instance().Log("Exported " + result.outputPath.string() + " (" +
                           std::to_string(result.pageCount) + " pages)");
  } catch (const std::exception &ex) {
    result.success = false;
    result.message = ex.what();
    Logger::Instance().Log(LogLevel::Error,
                           std::string("Summary export failed: ") + ex.what());
    Alert(kSummaryFailedAlert);
  }
  return result;
}
