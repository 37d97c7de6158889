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

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "drawingsurface.h"

// Key/value settings for the report exporter. Numeric variables are
// registered with a range and clamped on every write.
class ExportSettingsStore {
public:
  struct VariableInfo {
    std::string type;
    float defaultValue = 0.0f;
    float value = 0.0f;
    float minValue = 0.0f;
    float maxValue = 0.0f;
  };

  ExportSettingsStore();

  void SetValue(const std::string &key, const std::string &value);
  std::optional<std::string> GetValue(const std::string &key) const;
  std::string GetString(const std::string &key) const;
  bool HasKey(const std::string &key) const;
  void RemoveKey(const std::string &key);
  void ClearValues();

  bool LoadFromFile(const std::string &path);
  bool SaveToFile(const std::string &path) const;

  void RegisterVariable(const std::string &name, const std::string &type,
                        float defVal, float minVal, float maxVal);
  float GetFloat(const std::string &name) const;
  void SetFloat(const std::string &name, float v);
  bool GetBool(const std::string &name) const;
  void ApplyDefaults();

  // Page size and margins taken from page_width_pt, page_height_pt and
  // margin_pt. The margin is reduced when it would leave less than
  // kMinContentWidth points of content.
  PageGeometry GetPageGeometry() const;

  static constexpr float kMinContentWidth = 144.0f;

private:
  void RegisterDefaultVariables();
  void ApplyStringDefaults();

  std::unordered_map<std::string, std::string> configData;
  std::unordered_map<std::string, VariableInfo> variables;
};
