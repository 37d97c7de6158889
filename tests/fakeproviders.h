#pragma once

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "reportproviders.h"

// Returns canned markdown per report type. Ids in failing report an
// error result and ids in throwing raise std::runtime_error.
class FakeReportProvider : public ReportContentProvider {
public:
  ReportFetchResult FetchReport(const ReportRequest &request) override {
    requests.push_back(request);
    if (onFetch)
      onFetch(request);
    if (throwing.count(request.reportTypeId))
      throw std::runtime_error("connection reset");
    ReportFetchResult result;
    if (failing.count(request.reportTypeId)) {
      result.error = failureMessage;
      return result;
    }
    auto it = content.find(request.reportTypeId);
    result.success = true;
    result.content = it != content.end()
                         ? it->second
                         : "## Findings\n\nContent for " + request.reportTypeId;
    return result;
  }

  std::map<std::string, std::string> content;
  std::set<std::string> failing;
  std::set<std::string> throwing;
  std::string failureMessage = "Service unavailable";
  std::vector<ReportRequest> requests;
  std::function<void(const ReportRequest &)> onFetch;
};

class FakeSummaryProvider : public SummaryProvider {
public:
  SummaryResult Summarize(const SummaryRequest &request) override {
    requests.push_back(request);
    SummaryResult result;
    result.success = succeed;
    if (succeed)
      result.content = content;
    else
      result.error = error;
    return result;
  }

  bool succeed = true;
  std::string content = "# Overview\n\nThe company leads its market.";
  std::string error;
  std::vector<SummaryRequest> requests;
};

class RecordingListener : public ExportProgressListener {
public:
  void OnExportStarted() override { ++started; }
  void OnProgress(const std::string &message) override {
    progress.push_back(message);
  }
  void OnAlert(const std::string &message) override {
    alerts.push_back(message);
  }
  void OnExportFinished() override { ++finished; }

  int started = 0;
  int finished = 0;
  std::vector<std::string> progress;
  std::vector<std::string> alerts;
};
