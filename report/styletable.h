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

#include <map>
#include <string>

#include "block.h"
#include "drawingsurface.h"

// Named style sets. Single is used for a one-report export, Bundle for
// every section of the all-reports document and Summary for the
// executive summary.
enum class StylePreset { Single, Bundle, Summary };

const char *StylePresetName(StylePreset preset);

struct StyleRule {
  double fontSize = 11.0;
  bool bold = false;
  RgbColor color;
  double lineHeight = 14.0;
  double topGap = 0.0;
  double bottomGap = 0.0;
  // List only: horizontal offset of item text and extra space after an
  // item's last line.
  double indent = 0.0;
  double itemGap = 0.0;

  TextStyle Text() const { return TextStyle{fontSize, bold, color}; }
};

struct TableStyle {
  double fontSize = 10.0;
  double cellPadding = 4.0;
  double lineHeightFactor = 1.15;
  RgbColor headerFill{52, 152, 219};
  RgbColor headerText{255, 255, 255};
  RgbColor bodyText{50, 50, 50};
  RgbColor alternateFill{245, 245, 245};
  // Space that must remain on the page before a table may start there.
  double startReserve = 160.0;
  double bottomGap = 15.0;

  double LineHeight() const { return fontSize * lineHeightFactor; }
  TextStyle HeaderText() const { return TextStyle{fontSize, true, headerText}; }
  TextStyle BodyText() const { return TextStyle{fontSize, false, bodyText}; }
};

struct BannerStyle {
  double height = 80.0;
  RgbColor fill{52, 152, 219};
  RgbColor textColor{255, 255, 255};
  double titleSize = 20.0;
  double titleBaseline = 35.0;
  TextAlign titleAlign = TextAlign::Center;
  double bylineSize = 14.0;
  double bylineBaseline = 55.0;
  // y where section content starts below the banner.
  double contentTop = 120.0;
};

// Baseline of a line of text whose line box starts at top. The glyphs
// are centred vertically within the line box.
double LineBaseline(double top, double fontSize, double lineHeight);

class StyleTable {
public:
  static StyleTable ForPreset(StylePreset preset);

  StylePreset Preset() const { return preset_; }

  // Unknown kinds fall back to the paragraph rule.
  const StyleRule &StyleFor(BlockKind kind) const;
  void SetRule(BlockKind kind, const StyleRule &rule);

  // "•" for unordered lists, "N." for ordered lists.
  std::string ListMarker(BlockKind kind, int ordinal) const;

  const TableStyle &Table() const { return table_; }
  void SetTable(const TableStyle &table) { table_ = table; }
  const BannerStyle &Banner() const { return banner_; }
  void SetBanner(const BannerStyle &banner) { banner_ = banner; }

  // A block only starts on the current page when at least this much
  // space remains.
  double BlockStartReserve() const { return blockStartReserve_; }
  void SetBlockStartReserve(double reserve) { blockStartReserve_ = reserve; }

private:
  StylePreset preset_ = StylePreset::Single;
  std::map<BlockKind, StyleRule> rules_;
  TableStyle table_;
  BannerStyle banner_;
  double blockStartReserve_ = 60.0;
};
