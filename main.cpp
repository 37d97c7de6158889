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
#include "exportprogresswindow.h"
#include "exportsettings.h"
#include "logger.h"
#include "pdf_canvas.h"
#include "reportcatalog.h"
#include "reportclient.h"
#include "stringutils.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <wx/cmdline.h>
#include <wx/stdpaths.h>
#include <wx/wx.h>

namespace {
std::string ToStd(const wxString &value) { return std::string(value.ToUTF8()); }

std::filesystem::path DefaultConfigFile() {
  wxString dir = wxStandardPaths::Get().GetUserDataDir();
  std::filesystem::path p = std::filesystem::path(ToStd(dir));
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  return p / "compa_reports.json";
}

bool ReadTextFile(const std::string &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}
} // namespace

class CompaReportsApp : public wxApp {
public:
  virtual bool OnInit() override;
  virtual int OnRun() override;
  virtual void OnInitCmdLine(wxCmdLineParser &parser) override;
  virtual bool OnCmdLineParsed(wxCmdLineParser &parser) override;

private:
  bool LoadConfiguration(ExportSettingsStore &settings,
                         ReportCatalog &catalog);

  wxString mode_ = "all";
  wxString companyId_;
  wxString companyName_;
  wxString competitors_;
  wxString userId_;
  wxString firmId_;
  wxString timeRange_;
  wxString reportType_;
  wxString inputFile_;
  wxString catalogFile_;
  wxString configFile_;
  wxString outputDir_;
  bool quiet_ = false;
};

wxIMPLEMENT_APP(CompaReportsApp);

void CompaReportsApp::OnInitCmdLine(wxCmdLineParser &parser) {
  wxApp::OnInitCmdLine(parser);
  parser.AddOption("m", "mode", "export mode: single, all or summary");
  parser.AddOption("", "company-id", "id of the analysed company");
  parser.AddOption("", "company-name", "name printed in the report");
  parser.AddOption("", "competitors", "comma separated competitor ids");
  parser.AddOption("", "user", "requesting user id");
  parser.AddOption("", "firm", "requesting firm id");
  parser.AddOption("", "time-range", "analysis period shown on the summary");
  parser.AddOption("t", "report-type", "report type id (single mode)");
  parser.AddOption("i", "input", "markdown file with the report (single mode)");
  parser.AddOption("", "catalog", "JSON file overriding the report catalog");
  parser.AddOption("c", "config", "settings file");
  parser.AddOption("o", "output-dir", "directory for the generated PDF");
  parser.AddSwitch("q", "quiet", "do not show message boxes");
}

bool CompaReportsApp::OnCmdLineParsed(wxCmdLineParser &parser) {
  if (!wxApp::OnCmdLineParsed(parser))
    return false;
  parser.Found("mode", &mode_);
  parser.Found("company-id", &companyId_);
  parser.Found("company-name", &companyName_);
  parser.Found("competitors", &competitors_);
  parser.Found("user", &userId_);
  parser.Found("firm", &firmId_);
  parser.Found("time-range", &timeRange_);
  parser.Found("report-type", &reportType_);
  parser.Found("input", &inputFile_);
  parser.Found("catalog", &catalogFile_);
  parser.Found("config", &configFile_);
  parser.Found("output-dir", &outputDir_);
  quiet_ = parser.Found("quiet");

  mode_ = mode_.Lower();
  if (mode_ != "single" && mode_ != "all" && mode_ != "summary") {
    wxLogError("Unknown mode '%s'", mode_);
    return false;
  }
  if (mode_ == "single" && reportType_.empty()) {
    wxLogError("--report-type is required in single mode");
    return false;
  }
  return true;
}

bool CompaReportsApp::OnInit() {
  // Initialize logging system (overwrites log file each launch)
  Logger::Instance();
  SetAppName("CompaReports");
  return wxApp::OnInit();
}

bool CompaReportsApp::LoadConfiguration(ExportSettingsStore &settings,
                                        ReportCatalog &catalog) {
  std::string configPath = configFile_.empty()
                               ? DefaultConfigFile().string()
                               : ToStd(configFile_);
  std::error_code ec;
  if (std::filesystem::exists(configPath, ec)) {
    if (!settings.LoadFromFile(configPath)) {
      Logger::Instance().Log(LogLevel::Error,
                             "Cannot read settings " + configPath);
      return false;
    }
  } else if (configFile_.empty() && !settings.SaveToFile(configPath)) {
    Logger::Instance().Log(LogLevel::Warning,
                           "Cannot write default settings to " + configPath);
  }

  catalog = ReportCatalog::Default();
  if (!catalogFile_.empty()) {
    std::string error;
    if (!ReportCatalog::LoadFromFile(ToStd(catalogFile_), catalog, error)) {
      Logger::Instance().Log(LogLevel::Error, error);
      return false;
    }
  }
  return true;
}

int CompaReportsApp::OnRun() {
  ExportSettingsStore settings;
  ReportCatalog catalog;
  if (!LoadConfiguration(settings, catalog))
    return 2;

  HttpReportClient client(settings.GetString("api_base_url"),
                          static_cast<long>(settings.GetFloat("request_timeout_s")));
  ExportProgressWindow progress(nullptr, !quiet_);

  ExportOptions options;
  options.geometry = settings.GetPageGeometry();
  options.brandName = settings.GetString("brand_name");
  options.closingMessage = settings.GetString("closing_message");

  PdfCanvasOptions pdfOptions;
  pdfOptions.compressStreams = settings.GetBool("compress_streams");
  pdfOptions.title = ToStd(companyName_);
  pdfOptions.author = options.brandName;
  SurfaceFactory surfaces = [pdfOptions](const PageGeometry &geometry) {
    return std::make_unique<PdfCanvas>(geometry, pdfOptions);
  };

  ExportOrchestrator orchestrator(catalog, surfaces, client, client, progress,
                                  options);
  const std::string dateFormat = settings.GetString("date_format");
  orchestrator.SetDateProvider([dateFormat] { return CurrentExportDate(dateFormat); });

  std::filesystem::path outputDir = outputDir_.empty()
                                        ? std::filesystem::path(settings.GetString("output_directory"))
                                        : std::filesystem::path(ToStd(outputDir_));
  std::error_code ec;
  std::filesystem::create_directories(outputDir, ec);

  ExportContext context;
  context.companyId = ToStd(companyId_);
  context.companyName = ToStd(companyName_);
  context.competitorIds = StringUtils::SplitCSV(ToStd(competitors_));
  context.requester.userId = ToStd(userId_);
  context.requester.firmId = ToStd(firmId_);
  context.timeRange = ToStd(timeRange_);
  context.outputDirectory = outputDir;

  Logger::Instance().Log(std::string("Starting ") + ToStd(mode_) + " export");
  ExportResult result;
  if (mode_ == "single") {
    SingleExportRequest request;
    request.reportTypeId = ToStd(reportType_);
    request.companyName = context.companyName;
    request.outputDirectory = outputDir;
    if (!inputFile_.empty()) {
      if (!ReadTextFile(ToStd(inputFile_), request.content)) {
        Logger::Instance().Log(LogLevel::Error,
                               "Cannot read " + ToStd(inputFile_));
        return 2;
      }
    } else {
      ReportRequest fetch;
      fetch.reportTypeId = request.reportTypeId;
      fetch.companyId = context.companyId;
      fetch.competitorIds = context.competitorIds;
      fetch.requester = context.requester;
      ReportFetchResult fetched = client.FetchReport(fetch);
      request.content = fetched.success ? fetched.content
                                        : "Error generating report: " + fetched.error;
    }
    result = orchestrator.ExportSingleReport(request);
  } else if (mode_ == "summary") {
    result = orchestrator.ExportExecutiveSummary(context);
  } else {
    result = orchestrator.ExportAllReports(context);
  }

  if (result.success)
    Logger::Instance().Log("Saved " + result.outputPath.string());
  else
    Logger::Instance().Log(LogLevel::Error, "Export failed: " + result.message);
  Logger::Instance().Flush();
  return result.success ? 0 : 1;
}
