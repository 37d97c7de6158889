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
#include "exportsettings.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <fstream>
#include <string_view>

#include "logger.h"
#include "stringutils.h"

namespace {
bool TryParseFloat(const std::string &text, float &out) {
  if (text.empty())
    return false;

  const auto first =
      std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
      });
  if (first == text.end())
    return false;
  const auto last =
      std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();
  std::string_view trimmed(&(*first), static_cast<size_t>(last - first));

  auto *begin = trimmed.data();
  auto *end = trimmed.data() + trimmed.size();

  auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc{} && result.ptr == end;
}

// Accepts the textual forms a hand-edited config file tends to use.
bool TryParseBool(const std::string &text, bool &out) {
  std::string lower = StringUtils::ToLowerCopy(StringUtils::Trim(text));
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    out = true;
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    out = false;
    return true;
  }
  return false;
}

std::string JsonValueToString(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_boolean())
    return value.get<bool>() ? "true" : "false";
  return value.dump();
}
} // namespace

ExportSettingsStore::ExportSettingsStore() {
  RegisterDefaultVariables();
  ApplyStringDefaults();
  ApplyDefaults();
}

void ExportSettingsStore::RegisterDefaultVariables() {
  RegisterVariable("page_width_pt", "float", 595.28f, 144.0f, 2000.0f);
  RegisterVariable("page_height_pt", "float", 841.89f, 144.0f, 2000.0f);
  RegisterVariable("margin_pt", "float", 40.0f, 18.0f, 144.0f);
  RegisterVariable("request_timeout_s", "float", 300.0f, 0.0f, 3600.0f);
}

void ExportSettingsStore::ApplyStringDefaults() {
  if (!HasKey("api_base_url"))
    SetValue("api_base_url", "http://localhost:5000/api");
  if (!HasKey("brand_name"))
    SetValue("brand_name", "COMPA AI");
  if (!HasKey("output_directory"))
    SetValue("output_directory", ".");
  if (!HasKey("date_format"))
    SetValue("date_format", "%m/%d/%Y");
  if (!HasKey("compress_streams"))
    SetValue("compress_streams", "true");
  if (!HasKey("closing_message"))
    SetValue("closing_message", "For using COMPA AI Strategic Analysis");
}

void ExportSettingsStore::SetValue(const std::string &key,
                                   const std::string &value) {
  std::string newValue = value;

  auto var = variables.find(key);
  if (var != variables.end() && var->second.type == "float") {
    float parsed = 0.0f;
    if (TryParseFloat(value, parsed)) {
      parsed = std::clamp(parsed, var->second.minValue, var->second.maxValue);
      var->second.value = parsed;
      newValue = std::to_string(parsed);
    }
  }

  configData[key] = newValue;
}

std::optional<std::string>
ExportSettingsStore::GetValue(const std::string &key) const {
  auto it = configData.find(key);
  if (it != configData.end())
    return it->second;
  return std::nullopt;
}

std::string ExportSettingsStore::GetString(const std::string &key) const {
  auto value = GetValue(key);
  return value ? *value : std::string();
}

bool ExportSettingsStore::HasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

void ExportSettingsStore::RemoveKey(const std::string &key) {
  configData.erase(key);
}

void ExportSettingsStore::ClearValues() { configData.clear(); }

void ExportSettingsStore::RegisterVariable(const std::string &name,
                                           const std::string &type,
                                           float defVal, float minVal,
                                           float maxVal) {
  VariableInfo info;
  info.type = type;
  info.defaultValue = defVal;
  info.value = defVal;
  info.minValue = minVal;
  info.maxValue = maxVal;
  variables[name] = info;
}

float ExportSettingsStore::GetFloat(const std::string &name) const {
  auto it = variables.find(name);
  float defVal = 0.0f;
  if (it != variables.end())
    defVal = it->second.defaultValue;

  auto valStr = GetValue(name);
  if (valStr) {
    float parsed = 0.0f;
    if (TryParseFloat(*valStr, parsed))
      return parsed;
    return defVal;
  }
  return defVal;
}

void ExportSettingsStore::SetFloat(const std::string &name, float v) {
  auto it = variables.find(name);
  if (it != variables.end()) {
    v = std::clamp(v, it->second.minValue, it->second.maxValue);
    it->second.value = v;
  }
  SetValue(name, std::to_string(v));
}

bool ExportSettingsStore::GetBool(const std::string &name) const {
  auto raw = GetValue(name);
  bool parsed = false;
  if (raw && TryParseBool(*raw, parsed))
    return parsed;
  return false;
}

void ExportSettingsStore::ApplyDefaults() {
  for (const auto &[name, info] : variables) {
    float value = info.defaultValue;
    auto raw = GetValue(name);
    if (raw) {
      float parsed = 0.0f;
      if (TryParseFloat(*raw, parsed))
        value = std::clamp(parsed, info.minValue, info.maxValue);
    }
    SetValue(name, std::to_string(value));
  }
}

PageGeometry ExportSettingsStore::GetPageGeometry() const {
  PageGeometry geometry;
  geometry.pageWidth = GetFloat("page_width_pt");
  geometry.pageHeight = GetFloat("page_height_pt");
  double margin = GetFloat("margin_pt");
  double widest = (geometry.pageWidth - kMinContentWidth) / 2.0;
  double tallest = (geometry.pageHeight - kMinContentWidth) / 2.0;
  margin = std::max(0.0, std::min({margin, widest, tallest}));
  geometry.marginLeft = margin;
  geometry.marginRight = margin;
  geometry.marginTop = margin;
  geometry.marginBottom = margin;
  return geometry;
}

bool ExportSettingsStore::LoadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &ex) {
    Logger::Instance().Log(LogLevel::Warning, "Invalid settings file " +
                                                  path + ": " + ex.what());
    return false;
  }
  if (!j.is_object())
    return false;

  std::unordered_map<std::string, std::string> loaded;
  for (const auto &[key, value] : j.items()) {
    if (value.is_null() || value.is_object() || value.is_array())
      continue;
    loaded[key] = JsonValueToString(value);
  }
  configData = std::move(loaded);
  ApplyStringDefaults();
  ApplyDefaults();
  return true;
}

bool ExportSettingsStore::SaveToFile(const std::string &path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j(configData);
  file << j.dump(4);
  return static_cast<bool>(file);
}
