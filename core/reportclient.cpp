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
#include "reportclient.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <utility>

#include "logger.h"

namespace {
size_t WriteToString(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* s = static_cast<std::string*>(userp);
    size_t total = size * nmemb;
    s->append(static_cast<char*>(contents), total);
    return total;
}

// Ids that look numeric are sent as JSON numbers, the way the backend
// stores them.
nlohmann::json IdValue(const std::string &id) {
    bool numeric = !id.empty() && id.size() < 16;
    for (char c : id)
        numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
    if (numeric)
        return std::stoll(id);
    return id;
}

nlohmann::json IdArray(const std::vector<std::string> &ids) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &id : ids)
        out.push_back(IdValue(id));
    return out;
}

std::string ErrorFromBody(const nlohmann::json &root) {
    for (const char *key : {"error", "message"}) {
        auto it = root.find(key);
        if (it != root.end() && it->is_string())
            return it->get<std::string>();
    }
    return {};
}

bool SuccessFlag(const nlohmann::json &root) {
    auto it = root.find("success");
    return it != root.end() && it->is_boolean() && it->get<bool>();
}

std::string JoinUrl(const std::string &base, const std::string &path) {
    if (!base.empty() && base.back() == '/')
        return base + path;
    return base + "/" + path;
}
} // namespace

HttpReportClient::HttpReportClient(std::string apiBaseUrl, long timeoutSeconds)
    : apiBaseUrl_(std::move(apiBaseUrl)), timeoutSeconds_(timeoutSeconds) {}

std::string BuildReportRequestBody(const ReportRequest &request) {
    nlohmann::json body;
    body["companyId"] = IdValue(request.companyId);
    body["competitorIds"] = IdArray(request.competitorIds);
    body["userid"] = request.requester.userId;
    body["firmid"] = request.requester.firmId;
    return body.dump();
}

std::string BuildSummaryRequestBody(const SummaryRequest &request) {
    nlohmann::json body;
    body["companyId"] = IdValue(request.companyId);
    body["reports"] = request.reports;
    body["userid"] = request.requester.userId;
    body["firmid"] = request.requester.firmId;
    return body.dump();
}

ReportFetchResult ParseReportResponse(const std::string &body, long httpCode) {
    ReportFetchResult result;
    nlohmann::json root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        result.error = httpCode >= 400 ? "HTTP " + std::to_string(httpCode)
                                       : "Invalid response from server";
        return result;
    }
    bool success = SuccessFlag(root);
    if (httpCode >= 400 || !success) {
        result.error = ErrorFromBody(root);
        if (result.error.empty())
            result.error = httpCode >= 400 ? "HTTP " + std::to_string(httpCode)
                                           : "Report generation failed";
        return result;
    }
    auto report = root.find("report");
    if (report == root.end() || report->is_null()) {
        result.error = "Response contains no report";
        return result;
    }
    if (report->is_string()) {
        result.content = report->get<std::string>();
    } else if (report->is_object() && report->contains("content") &&
               (*report)["content"].is_string()) {
        result.content = (*report)["content"].get<std::string>();
    } else {
        result.content = report->dump(2);
    }
    result.success = true;
    return result;
}

SummaryResult ParseSummaryResponse(const std::string &body, long httpCode) {
    SummaryResult result;
    nlohmann::json root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        result.error = httpCode >= 400 ? "HTTP " + std::to_string(httpCode)
                                       : "Invalid response from server";
        return result;
    }
    bool success = SuccessFlag(root);
    if (httpCode >= 400 || !success) {
        result.error = ErrorFromBody(root);
        if (result.error.empty())
            result.error = "Summary generation failed";
        return result;
    }
    auto summary = root.find("summary");
    if (summary != root.end() && summary->is_object() &&
        summary->contains("content") && (*summary)["content"].is_string()) {
        result.content = (*summary)["content"].get<std::string>();
    } else if (summary != root.end() && summary->is_string()) {
        result.content = summary->get<std::string>();
    } else {
        result.error = "Response contains no summary";
        return result;
    }
    result.success = true;
    return result;
}

bool HttpReportClient::PostJson(const std::string &url, const std::string &body,
                                std::string &response, long &httpCode,
                                std::string &error) const
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "Cannot initialise HTTP client";
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        curl_slist_free_all(headers);
        return false;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);
    return true;
}

ReportFetchResult HttpReportClient::FetchReport(const ReportRequest &request) {
    std::string url = JoinUrl(apiBaseUrl_, "generate-report/" + request.reportTypeId);
    std::string response;
    std::string error;
    long httpCode = 0;
    if (!PostJson(url, BuildReportRequestBody(request), response, httpCode, error)) {
        Logger::Instance().Log(LogLevel::Warning, "POST " + url + " failed: " + error);
        ReportFetchResult result;
        result.error = error;
        return result;
    }
    return ParseReportResponse(response, httpCode);
}

SummaryResult HttpReportClient::Summarize(const SummaryRequest &request) {
    std::string url = JoinUrl(apiBaseUrl_, "generate-summary-report");
    std::string response;
    std::string error;
    long httpCode = 0;
    if (!PostJson(url, BuildSummaryRequestBody(request), response, httpCode, error)) {
        Logger::Instance().Log(LogLevel::Warning, "POST " + url + " failed: " + error);
        SummaryResult result;
        result.error = error;
        return result;
    }
    return ParseSummaryResponse(response, httpCode);
}
