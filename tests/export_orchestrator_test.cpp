#include "exportorchestrator.h"

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fakeproviders.h"
#include "logger.h"
#include "recordingsurface.h"

namespace {
using Op = RecordingSurface::Op;

const std::filesystem::path kOutDir = "exports";

struct Harness {
  FakeReportProvider reports;
  FakeSummaryProvider summaries;
  RecordingListener listener;
  std::vector<std::shared_ptr<RecordingSurface>> surfaces;
  bool saveResult = true;

  SurfaceFactory Factory() {
    return [this](const PageGeometry &geometry) {
      auto recording = std::make_shared<RecordingSurface>(geometry);
      recording->saveResult = saveResult;
      surfaces.push_back(recording);
      return std::unique_ptr<DrawingSurface>(
          std::make_unique<ForwardingSurface>(recording));
    };
  }
};

ExportDate FixedDate() { return ExportDate{"01/15/2025", "2025-01-15"}; }

ExportContext AcmeContext() {
  ExportContext context;
  context.companyId = "42";
  context.companyName = "Acme";
  context.competitorIds = {"7", "9"};
  context.requester.userId = "u1";
  context.requester.firmId = "f1";
  context.timeRange = "Last 30 days";
  context.outputDirectory = kOutDir;
  return context;
}

ReportCatalog FiveReports() {
  return ReportCatalog({{"r1", "Report One", "first"},
                        {"r2", "Report Two", "second"},
                        {"r3", "Report Three", "third"},
                        {"r4", "Report Four", "fourth"},
                        {"r5", "Report Five", "fifth"}});
}

bool IsBannerTitle(const Op &op) {
  return op.kind == RecordingSurface::OpKind::Text && op.y == 35.0 &&
         op.style.bold && op.style.color == RgbColor{255, 255, 255};
}

// Text drawn for each section, banner title first. Stops at the
// closing page.
std::vector<std::vector<Op>> Sections(const RecordingSurface &surface) {
  std::vector<std::vector<Op>> sections;
  for (const auto &op : surface.ops) {
    if (op.kind != RecordingSurface::OpKind::Text)
      continue;
    if (op.text == "Thank You")
      break;
    if (IsBannerTitle(op))
      sections.emplace_back();
    if (!sections.empty())
      sections.back().push_back(op);
  }
  return sections;
}

size_t CountStartingWith(const std::vector<Op> &ops, const std::string &prefix) {
  size_t count = 0;
  for (const auto &op : ops)
    if (op.text.rfind(prefix, 0) == 0)
      ++count;
  return count;
}

void TestSingleReport() {
  Harness h;
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  SingleExportRequest request;
  request.reportTypeId = "competitor-analysis";
  request.content = "# Title\n\nShort paragraph.";
  request.companyName = "Acme";
  request.outputDirectory = kOutDir;
  ExportResult result = exporter.ExportSingleReport(request);

  assert(result.success);
  assert(!result.errorDocument);
  assert(result.pageCount == 1);
  assert(result.outputPath == kOutDir / "competitor_analysis_2025-01-15.pdf");
  assert(h.surfaces.size() == 1);
  const RecordingSurface &surface = *h.surfaces[0];
  assert(surface.savedPaths.size() == 1);
  assert(surface.savedPaths[0] == result.outputPath);

  auto texts = surface.Texts();
  assert(texts.size() == 4);
  assert(texts[0].text == "Competitor Analysis");
  assert(texts[1].text == "Company: Acme");
  assert(texts[2].text == "Title");
  assert(texts[3].text == "Short paragraph.");
  assert(texts[3].y > texts[2].y);
  assert(surface.CountTextContaining("Page ") == 0);
  assert(h.listener.started == 0);
  assert(h.listener.alerts.empty());
  assert(h.reports.requests.empty());

  request.reportTypeId = "custom-report";
  request.companyName.clear();
  result = exporter.ExportSingleReport(request);
  assert(result.success);
  assert(h.surfaces[1]->Texts()[0].text == "custom-report");
  assert(h.surfaces[1]->CountTextContaining("Company:") == 0);
}

void TestSingleReportErrorDocument() {
  Harness h;
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  SingleExportRequest request;
  request.reportTypeId = "competitor-analysis";
  request.content = "# Heading\n\nSorry, we **Failed to generate** this one.";
  request.outputDirectory = kOutDir;
  ExportResult result = exporter.ExportSingleReport(request);

  assert(result.success);
  assert(result.errorDocument);
  assert(result.pageCount == 1);
  assert(result.outputPath == kOutDir / "competitor_analysis_report.pdf");
  const RecordingSurface &surface = *h.surfaces[0];
  assert(surface.PageCount() == 1);
  auto texts = surface.Texts();
  assert(texts.size() == 2);
  assert(texts[0].text == "There was an error generating this report.");
  assert(!surface.HasText("Heading"));
}

void TestBundleWithThrowingReport() {
  Harness h;
  ReportCatalog catalog = ReportCatalog::Default();
  assert(catalog.Size() == 16);
  const std::string failing = catalog.Types()[6].id;
  h.reports.throwing.insert(failing);
  ExportOrchestrator exporter(catalog, h.Factory(), h.reports, h.summaries,
                              h.listener);
  exporter.SetDateProvider(FixedDate);

  ExportResult result = exporter.ExportAllReports(AcmeContext());
  assert(result.success);
  assert(result.failedReports == std::vector<std::string>{failing});
  assert(result.outputPath ==
         kOutDir / "Comprehensive_Business_Analysis_Acme_2025-01-15.pdf");
  assert(result.pageCount >= 1 + 1 + 16 + 1);

  const RecordingSurface &surface = *h.surfaces[0];
  assert(surface.PageCount() == result.pageCount);
  for (size_t i = 0; i < catalog.Size(); ++i)
    assert(surface.HasText(std::to_string(i + 1) + ". " +
                           catalog.Types()[i].name));

  auto sections = Sections(surface);
  assert(sections.size() == 16);
  for (size_t i = 0; i < sections.size(); ++i)
    assert(sections[i][0].text == catalog.Types()[i].name);
  assert(sections[6].size() == 2);
  assert(sections[6][1].text ==
         "Error generating " + catalog.Types()[6].name + ": connection reset");
  assert(CountStartingWith(sections[5], "Content for ") == 1);

  auto last = surface.TextsOnPage(result.pageCount);
  assert(last[0].text == "Thank You");
  assert(last[1].text == "For using COMPA AI Strategic Analysis");
  assert(surface.CountTextContaining(
             "Comprehensive Business Analysis | COMPA AI | 01/15/2025") ==
         static_cast<size_t>(result.pageCount - 2));
  assert(surface.HasText("Analyzing 2 competitors"));
  assert(surface.HasText("Generated on: 01/15/2025"));

  assert(h.reports.requests.size() == 16);
  assert(h.reports.requests[0].companyId == "42");
  assert(h.reports.requests[0].competitorIds.size() == 2);
  assert(h.reports.requests[0].requester.firmId == "f1");

  assert(h.listener.started == 1);
  assert(h.listener.finished == 1);
  assert(h.listener.progress.front() ==
         "Preparing comprehensive report export...");
  assert(h.listener.progress[1] == "Processing: SWOT Analysis (1/16)");
  assert(h.listener.progress.back() == "Finalizing PDF...");
  assert(h.listener.alerts.empty());
  assert(!exporter.IsBusy());
}

void TestPartialFailureIsolation() {
  Harness h;
  h.reports.failing.insert("r3");
  ExportOrchestrator exporter(FiveReports(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  ExportResult result = exporter.ExportAllReports(AcmeContext());
  assert(result.success);
  auto sections = Sections(*h.surfaces[0]);
  assert(sections.size() == 5);
  for (size_t i = 0; i < sections.size(); ++i) {
    const std::string id = "r" + std::to_string(i + 1);
    if (i == 2) {
      assert(sections[i].size() == 2);
      assert(sections[i][1].text ==
             "Error generating Report Three: Service unavailable");
    } else {
      assert(CountStartingWith(sections[i], "Error generating") == 0);
      bool found = false;
      for (const auto &op : sections[i])
        found = found || op.text == "Content for " + id;
      assert(found);
    }
  }

  // An empty failure reason still explains itself.
  Harness empty;
  empty.reports.failing.insert("r1");
  empty.reports.failureMessage.clear();
  ExportOrchestrator second(FiveReports(), empty.Factory(), empty.reports,
                            empty.summaries, empty.listener);
  second.SetDateProvider(FixedDate);
  assert(second.ExportAllReports(AcmeContext()).success);
  assert(empty.surfaces[0]->HasText(
      "Error generating Report One: Unknown error"));
}

void TestResolvedReportsSkipFetching() {
  Harness h;
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);
  ExportContext context = AcmeContext();
  context.resolvedReports["swot-analysis"] =
      R"({"Strengths":["Loyal customers"],"Weaknesses":[],)"
      R"("Opportunities":["Asia"],"Threats":["New rivals"]})";

  ExportResult result = exporter.ExportAllReports(context);
  assert(result.success);
  assert(h.reports.requests.size() == 15);
  for (const auto &request : h.reports.requests)
    assert(request.reportTypeId != "swot-analysis");
  auto sections = Sections(*h.surfaces[0]);
  bool strengths = false;
  bool item = false;
  for (const auto &op : sections[0]) {
    strengths = strengths || op.text == "Strengths";
    item = item || op.text == "Loyal customers";
  }
  assert(strengths);
  assert(item);
}

void TestExclusiveExport() {
  Harness h;
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  bool reentered = false;
  bool busyDuring = false;
  std::optional<ExportJob> job;
  ExportResult nestedAll;
  ExportResult nestedSummary;
  ExportResult nestedSingle;
  h.reports.onFetch = [&](const ReportRequest &) {
    if (reentered)
      return;
    reentered = true;
    busyDuring = exporter.IsBusy();
    job = exporter.CurrentJob();
    nestedAll = exporter.ExportAllReports(AcmeContext());
    nestedSummary = exporter.ExportExecutiveSummary(AcmeContext());
    SingleExportRequest single;
    single.reportTypeId = "swot-analysis";
    single.content = "# Nested";
    nestedSingle = exporter.ExportSingleReport(single);
  };

  ExportResult result = exporter.ExportAllReports(AcmeContext());
  assert(result.success);
  assert(busyDuring);
  assert(job.has_value());
  assert(job->mode == ExportMode::All);
  assert(job->reportList.size() == 16);
  assert(job->progressMessage == "Processing: SWOT Analysis (1/16)");
  for (const auto *nested : {&nestedAll, &nestedSummary, &nestedSingle}) {
    assert(nested->rejected);
    assert(!nested->success);
    assert(nested->message == "An export is already in progress.");
  }
  assert(h.surfaces.size() == 1);
  assert(h.listener.started == 1);
  assert(h.listener.finished == 1);
  assert(!exporter.IsBusy());
  assert(!exporter.CurrentJob().has_value());

  // The lock is released; the next export runs.
  assert(exporter.ExportAllReports(AcmeContext()).success);
  assert(h.listener.started == 2);
}

void TestExecutiveSummary() {
  Harness h;
  h.reports.failing.insert("churn-fix");
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  ExportResult result = exporter.ExportExecutiveSummary(AcmeContext());
  assert(result.success);
  assert(result.outputPath == kOutDir / "Executive_Summary_Acme_2025-01-15.pdf");
  assert(result.failedReports == std::vector<std::string>{"churn-fix"});
  assert(result.pageCount == 3);

  assert(h.summaries.requests.size() == 1);
  const SummaryRequest &request = h.summaries.requests[0];
  assert(request.companyId == "42");
  assert(request.reports.size() == 16);
  assert(request.reports[11] == "Error generating Churn Fix: Service unavailable");

  const RecordingSurface &surface = *h.surfaces[0];
  assert(!surface.HasText("Table of Contents"));
  auto cover = surface.TextsOnPage(1);
  assert(cover[0].text == "Executive Summary");
  assert(cover[1].text == "Acme - Strategic Analysis");
  assert(cover[1].style.fontSize == 18.0);
  assert(cover[2].text == "Generated: 01/15/2025");
  assert(cover[2].align == TextAlign::Left);
  assert(cover[3].text == "Analysis Period: Last 30 days");
  assert(cover[4].text == "Competitors Analyzed: 2");
  assert(cover[5].text == "Total Reports: 16");

  auto sections = Sections(surface);
  assert(sections.size() == 1);
  assert(sections[0][0].text == "Executive Summary");
  assert(sections[0][1].text == "Acme");
  assert(surface.HasText("The company leads its market."));
  assert(surface.CountTextContaining("Executive Summary | COMPA AI | 01/15/2025") == 1);
  assert(surface.HasText("Page 2 of 3"));

  // One progress update before every fetch, in catalog order.
  const ReportCatalog catalog = ReportCatalog::Default();
  const auto &types = catalog.Types();
  std::vector<std::string> expected = {"Gathering all reports..."};
  for (size_t i = 0; i < types.size(); ++i)
    expected.push_back("Gathering: " + types[i].name + " (" +
                       std::to_string(i + 1) + "/16)");
  expected.push_back("Generating AI summary...");
  expected.push_back("Creating summary PDF...");
  expected.push_back("Finalizing summary PDF...");
  assert(h.listener.progress == expected);
  assert(h.listener.progress[12] == "Gathering: Churn Fix (12/16)");
}

void TestSummaryFailure() {
  Harness h;
  h.summaries.succeed = false;
  ExportOrchestrator exporter(ReportCatalog::Default(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  ExportResult result = exporter.ExportExecutiveSummary(AcmeContext());
  assert(!result.success);
  assert(!result.rejected);
  assert(h.listener.alerts == std::vector<std::string>{"Failed to generate summary."});
  assert(h.surfaces.empty());
  assert(h.listener.started == 1);
  assert(h.listener.finished == 1);
  assert(!exporter.IsBusy());
}

void TestSaveFailure() {
  Harness h;
  h.saveResult = false;
  ExportOrchestrator exporter(FiveReports(), h.Factory(), h.reports,
                              h.summaries, h.listener);
  exporter.SetDateProvider(FixedDate);

  ExportResult result = exporter.ExportAllReports(AcmeContext());
  assert(!result.success);
  assert(result.message == "disk full");
  assert(h.listener.alerts ==
         std::vector<std::string>{
             "Failed to generate comprehensive PDF. Please try again."});

  SingleExportRequest request;
  request.reportTypeId = "r1";
  request.content = "Body";
  result = exporter.ExportSingleReport(request);
  assert(!result.success);
  assert(h.listener.alerts.back() == "Failed to generate PDF. Please try again.");
}

void TestFileNames() {
  assert(ExportOrchestrator::SingleReportFileName("30-60-90", "2025-01-15") ==
         "30_60_90_2025-01-15.pdf");
  assert(ExportOrchestrator::ErrorReportFileName("swot-analysis") ==
         "swot_analysis_report.pdf");
  assert(ExportOrchestrator::BundleFileName("Executive_Summary", "",
                                            "2025-01-15") ==
         "Executive_Summary_Report_2025-01-15.pdf");
  assert(ExportOrchestrator::BundleFileName("X", "A/B: C", "2025-01-15") ==
         "X_A_B_ C_2025-01-15.pdf");
  assert(std::string(ExportModeName(ExportMode::Summary)) == "summary");
  ExportDate today = CurrentExportDate();
  assert(today.iso.size() == 10);
  assert(!today.display.empty());
}
} // namespace

int main() {
  Logger::Instance().SetEchoToStderr(false);
  TestSingleReport();
  TestSingleReportErrorDocument();
  TestBundleWithThrowingReport();
  TestPartialFailureIsolation();
  TestResolvedReportsSkipFetching();
  TestExclusiveExport();
  TestExecutiveSummary();
  TestSummaryFailure();
  TestSaveFailure();
  TestFileNames();
  Logger::Instance().Flush();
  return 0;
}
