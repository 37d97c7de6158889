#include "reportclient.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <string>

int main() {
  ReportRequest request;
  request.reportTypeId = "swot-analysis";
  request.companyId = "42";
  request.competitorIds = {"7", "abc"};
  request.requester.userId = "u1";
  request.requester.firmId = "f9";
  nlohmann::json body = nlohmann::json::parse(BuildReportRequestBody(request));
  assert(body["companyId"] == 42);
  assert(body["competitorIds"][0] == 7);
  assert(body["competitorIds"][1] == "abc");
  assert(body["userid"] == "u1");
  assert(body["firmid"] == "f9");

  SummaryRequest summary;
  summary.companyId = "c-1";
  summary.reports = {"one", "two"};
  nlohmann::json summaryBody =
      nlohmann::json::parse(BuildSummaryRequestBody(summary));
  assert(summaryBody["companyId"] == "c-1");
  assert(summaryBody["reports"].size() == 2);

  ReportFetchResult result =
      ParseReportResponse(R"({"success":true,"report":"# Hi"})", 200);
  assert(result.success);
  assert(result.content == "# Hi");

  result = ParseReportResponse(
      R"({"success":true,"report":{"content":"# Nested"}})", 200);
  assert(result.success);
  assert(result.content == "# Nested");

  result = ParseReportResponse(R"({"success":false,"error":"Quota exceeded"})",
                               200);
  assert(!result.success);
  assert(result.error == "Quota exceeded");

  result = ParseReportResponse(R"({"message":"Not found"})", 404);
  assert(!result.success);
  assert(result.error == "Not found");

  result = ParseReportResponse("<html>gateway</html>", 502);
  assert(!result.success);
  assert(result.error == "HTTP 502");

  result = ParseReportResponse(R"({"success":"yes","report":"x"})", 200);
  assert(!result.success);

  result = ParseReportResponse(R"({"success":true})", 200);
  assert(!result.success);
  assert(!result.error.empty());

  SummaryResult parsed = ParseSummaryResponse(
      R"({"success":true,"summary":{"content":"# Summary"}})", 200);
  assert(parsed.success);
  assert(parsed.content == "# Summary");

  parsed = ParseSummaryResponse(R"({"success":false})", 500);
  assert(!parsed.success);
  assert(parsed.error == "Summary generation failed");
  return 0;
}
