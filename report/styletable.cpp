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
#include "styletable.h"

namespace {
constexpr RgbColor kPrimaryBlue{52, 152, 219};
constexpr RgbColor kGreen{39, 174, 96};
constexpr RgbColor kPurple{155, 89, 182};
constexpr RgbColor kBodyText{0, 0, 0};
constexpr const char *kBullet = "\xE2\x80\xA2";

StyleRule MakeRule(double size, bool bold, RgbColor color, double lineHeight,
                   double top, double bottom) {
  StyleRule rule;
  rule.fontSize = size;
  rule.bold = bold;
  rule.color = color;
  rule.lineHeight = lineHeight;
  rule.topGap = top;
  rule.bottomGap = bottom;
  return rule;
}

StyleRule MakeListRule(double size, double lineHeight, double itemStep,
                       double top, double bottom) {
  StyleRule rule = MakeRule(size, false, kBodyText, lineHeight, top, bottom);
  rule.indent = 20.0;
  rule.itemGap = itemStep - lineHeight;
  return rule;
}

void SetListRules(std::map<BlockKind, StyleRule> &rules,
                  const StyleRule &rule) {
  rules[BlockKind::UnorderedList] = rule;
  rules[BlockKind::OrderedList] = rule;
}
} // namespace

const char *StylePresetName(StylePreset preset) {
  switch (preset) {
  case StylePreset::Single:
    return "single";
  case StylePreset::Bundle:
    return "bundle";
  case StylePreset::Summary:
    return "summary";
  }
  return "single";
}

double LineBaseline(double top, double fontSize, double lineHeight) {
  return top + (lineHeight + fontSize) / 2.0 - fontSize * 0.2;
}

StyleTable StyleTable::ForPreset(StylePreset preset) {
  StyleTable styles;
  styles.preset_ = preset;
  auto &rules = styles.rules_;

  switch (preset) {
  case StylePreset::Single:
    rules[BlockKind::Heading1] = MakeRule(18, true, kPrimaryBlue, 22, 20, 10);
    rules[BlockKind::Heading2] = MakeRule(16, true, kGreen, 20, 15, 8);
    rules[BlockKind::Heading3] = MakeRule(14, true, kPurple, 18, 12, 6);
    rules[BlockKind::Paragraph] = MakeRule(11, false, kBodyText, 14, 5, 8);
    SetListRules(rules, MakeListRule(11, 14, 16, 5, 8));
    styles.table_.fontSize = 10;
    styles.table_.cellPadding = 4;
    styles.table_.bottomGap = 15;
    break;
  case StylePreset::Bundle:
    rules[BlockKind::Heading1] = MakeRule(16, true, kPrimaryBlue, 20, 15, 12);
    rules[BlockKind::Heading2] = MakeRule(14, true, kGreen, 18, 12, 10);
    rules[BlockKind::Heading3] = MakeRule(12, true, kPurple, 16, 10, 8);
    rules[BlockKind::Paragraph] = MakeRule(10, false, kBodyText, 13, 3, 6);
    SetListRules(rules, MakeListRule(10, 13, 15, 3, 6));
    styles.table_.fontSize = 9;
    styles.table_.cellPadding = 3;
    styles.table_.bottomGap = 10;
    styles.banner_.height = 60;
    styles.banner_.titleSize = 18;
    styles.banner_.titleAlign = TextAlign::Left;
    styles.banner_.bylineSize = 11;
    styles.banner_.bylineBaseline = 52;
    styles.banner_.contentTop = 90;
    break;
  case StylePreset::Summary:
    rules[BlockKind::Heading1] = MakeRule(18, true, kPrimaryBlue, 22, 20, 12);
    rules[BlockKind::Heading2] = MakeRule(16, true, kGreen, 20, 15, 10);
    rules[BlockKind::Heading3] = MakeRule(14, true, kPurple, 18, 12, 8);
    rules[BlockKind::Paragraph] = MakeRule(11, false, kBodyText, 15, 5, 8);
    SetListRules(rules, MakeListRule(11, 15, 17, 5, 8));
    styles.table_.fontSize = 10;
    styles.table_.cellPadding = 4;
    styles.table_.bottomGap = 15;
    styles.banner_.height = 60;
    styles.banner_.titleSize = 18;
    styles.banner_.titleAlign = TextAlign::Left;
    styles.banner_.bylineSize = 11;
    styles.banner_.bylineBaseline = 52;
    styles.banner_.contentTop = 90;
    break;
  }
  rules[BlockKind::Table] = rules[BlockKind::Paragraph];
  rules[BlockKind::Table].fontSize = styles.table_.fontSize;
  rules[BlockKind::Table].bottomGap = styles.table_.bottomGap;
  return styles;
}

const StyleRule &StyleTable::StyleFor(BlockKind kind) const {
  auto it = rules_.find(kind);
  if (it != rules_.end())
    return it->second;
  auto paragraph = rules_.find(BlockKind::Paragraph);
  if (paragraph != rules_.end())
    return paragraph->second;
  static const StyleRule fallback;
  return fallback;
}

void StyleTable::SetRule(BlockKind kind, const StyleRule &rule) {
  rules_[kind] = rule;
}

std::string StyleTable::ListMarker(BlockKind kind, int ordinal) const {
  if (kind == BlockKind::OrderedList)
    return std::to_string(ordinal) + ".";
  return kBullet;
}
