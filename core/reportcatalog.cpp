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
#include "reportcatalog.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace {
struct CatalogEntry {
  const char *id;
  const char *name;
  const char *description;
};

constexpr CatalogEntry kDefaultCatalog[] = {
    {"swot-analysis", "SWOT Analysis",
     "Strengths, Weaknesses, Opportunities, Threats"},
    {"competitor-analysis", "Competitor Analysis",
     "Detailed competitor market analysis"},
    {"market-share", "Market Share Analysis",
     "Market share distribution and positioning"},
    {"content-gap", "Content Gap Analysis",
     "Content opportunities and strategy gaps"},
    {"technical-seo", "Technical SEO Analysis",
     "Website performance and SEO comparison"},
    {"ux-comparison", "UX Comparison", "User experience and design analysis"},
    {"pricing-comparison", "Pricing Comparison",
     "Pricing strategies and positioning"},
    {"brand-presence", "Brand Presence Analysis",
     "Brand visibility across channels"},
    {"audience-overlap", "Audience Overlap Analysis",
     "Audience segmentation insights"},
    {"30-60-90", "30-60-90 Plan", "90-day execution roadmap"},
    {"revenue-model-canvas", "Revenue Model Canvas",
     "Monetization & business model"},
    {"churn-fix", "Churn Fix", "Retention action plan and experiments"},
    {"kpi-dashboard-blueprint", "KPI Dashboard Blueprint",
     "Metrics tree and dashboard design"},
    {"go-to-market-plan", "Go-to-Market Plan",
     "ICP, messaging, channels, and timeline"},
    {"value-proposition", "Value Proposition",
     "Differentiation and messaging"},
    {"pivot-ideas", "Pivot Ideas", "Adjacency and pivot options"},
};
} // namespace

ReportCatalog::ReportCatalog(std::vector<ReportType> types)
    : types_(std::move(types)) {}

ReportCatalog ReportCatalog::Default() {
  std::vector<ReportType> types;
  for (const auto &entry : kDefaultCatalog)
    types.push_back(ReportType{entry.id, entry.name, entry.description});
  return ReportCatalog(std::move(types));
}

const ReportType *ReportCatalog::Find(const std::string &id) const {
  for (const auto &type : types_) {
    if (type.id == id)
      return &type;
  }
  return nullptr;
}

bool ReportCatalog::LoadFromFile(const std::string &path,
                                 ReportCatalog &catalog, std::string &error) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    error = "Cannot open catalog file " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromString(buffer.str(), catalog, error);
}

bool ReportCatalog::LoadFromString(const std::string &json,
                                   ReportCatalog &catalog,
                                   std::string &error) {
  nlohmann::json root = nlohmann::json::parse(json, nullptr, false);
  if (root.is_discarded()) {
    error = "Catalog is not valid JSON";
    return false;
  }
  if (!root.is_array()) {
    error = "Catalog must be a JSON array";
    return false;
  }

  std::vector<ReportType> types;
  std::set<std::string> seen;
  for (size_t i = 0; i < root.size(); ++i) {
    const auto &item = root[i];
    if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
      error = "Catalog entry " + std::to_string(i + 1) + " has no id";
      return false;
    }
    ReportType type;
    type.id = item["id"].get<std::string>();
    type.name = type.id;
    if (item.contains("name") && item["name"].is_string())
      type.name = item["name"].get<std::string>();
    if (item.contains("description") && item["description"].is_string())
      type.description = item["description"].get<std::string>();
    if (type.id.empty() || !seen.insert(type.id).second) {
      error = "Catalog entry " + std::to_string(i + 1) +
              " has an empty or duplicate id";
      return false;
    }
    types.push_back(std::move(type));
  }
  if (types.empty()) {
    error = "Catalog is empty";
    return false;
  }
  catalog = ReportCatalog(std::move(types));
  return true;
}
