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
#include "documentassembler.h"

#include <stdexcept>

namespace {
constexpr RgbColor kPrimaryBlue{52, 152, 219};
constexpr RgbColor kWhite{255, 255, 255};
constexpr RgbColor kBlack{0, 0, 0};
constexpr RgbColor kMutedGray{100, 100, 100};
constexpr RgbColor kFooterGray{128, 128, 128};
constexpr RgbColor kClosingFill{240, 248, 255};

constexpr double kCoverBannerHeight = 120.0;
constexpr double kCoverTitleSize = 28.0;
constexpr double kCoverTitleBaseline = 50.0;
constexpr double kCoverSubtitleBaseline = 85.0;
constexpr double kCenteredDetailStep = 30.0;
constexpr double kLeftDetailTop = 180.0;
constexpr double kLeftDetailStep = 20.0;

constexpr double kTocTitleSize = 20.0;
constexpr double kTocTitleBaseline = 60.0;
constexpr double kTocFirstEntryBaseline = 100.0;
constexpr double kTocEntrySize = 12.0;
constexpr double kTocDescriptionSize = 10.0;
constexpr double kTocEntryHeight = 35.0;
constexpr double kTocEntryIndent = 20.0;
constexpr double kTocDescriptionIndent = 40.0;
constexpr double kTocDescriptionOffset = 15.0;

constexpr double kClosingInset = 30.0;
constexpr double kClosingBorder = 3.0;
constexpr double kFooterSize = 8.0;
constexpr double kFooterOffset = 15.0;
constexpr double kErrorTextSize = 16.0;

const char *StateName(DocumentAssembler::State state) {
  switch (state) {
  case DocumentAssembler::State::Created:
    return "created";
  case DocumentAssembler::State::Open:
    return "open";
  case DocumentAssembler::State::Finalized:
    return "finalized";
  }
  return "unknown";
}

void RequireState(DocumentAssembler::State actual,
                  DocumentAssembler::State expected, const char *operation) {
  if (actual != expected)
    throw std::logic_error(std::string("DocumentAssembler::") + operation +
                           " called in state " + StateName(actual));
}
} // namespace

DocumentAssembler::DocumentAssembler(DrawingSurface &surface,
                                     const StyleTable &styles)
    : surface_(surface), styles_(styles), composer_(styles),
      cursor_(surface) {}

void DocumentAssembler::Begin(const AssemblyPlan &plan) {
  RequireState(state_, State::Created, "Begin");
  plan_ = plan;
  if (plan_.cover)
    DrawCover(*plan_.cover);
  if (!plan_.tableOfContents.empty())
    DrawTableOfContents(plan_.tableOfContents);
  state_ = State::Open;
}

void DocumentAssembler::AppendSection(const std::string &title,
                                      const std::string &byline,
                                      const std::vector<Block> &blocks) {
  RequireState(state_, State::Open, "AppendSection");
  sectionPages_.push_back(
      composer_.ComposeSection(title, byline, blocks, cursor_));
}

bool DocumentAssembler::Finalize(const std::filesystem::path &path,
                                 std::string &error) {
  RequireState(state_, State::Open, "Finalize");
  if (plan_.closing)
    DrawClosingPage(*plan_.closing);
  if (surface_.PageCount() == 0)
    cursor_.StartNewPage();
  if (plan_.footer.enabled)
    StampFooters();
  state_ = State::Finalized;
  return surface_.Save(path, error);
}

void DocumentAssembler::DrawCover(const CoverPage &cover) {
  cursor_.StartNewPage();
  const PageGeometry &geometry = surface_.Geometry();
  const double centerX = geometry.pageWidth / 2.0;

  RectStyle banner;
  banner.fill = kPrimaryBlue;
  surface_.WriteRect(0.0, 0.0, geometry.pageWidth, kCoverBannerHeight, banner);
  surface_.WriteText(cover.title, centerX, kCoverTitleBaseline,
                     TextStyle{kCoverTitleSize, true, kWhite},
                     TextAlign::Center);
  if (!cover.subtitle.empty())
    surface_.WriteText(cover.subtitle, centerX, kCoverSubtitleBaseline,
                       TextStyle{cover.subtitleSize, false, kWhite},
                       TextAlign::Center);

  for (size_t i = 0; i < cover.details.size(); ++i) {
    if (cover.centerDetails) {
      double size = i == 0 ? 14.0 : 12.0;
      surface_.WriteText(cover.details[i], centerX,
                         geometry.pageHeight / 2.0 + i * kCenteredDetailStep,
                         TextStyle{size, false, kBlack}, TextAlign::Center);
    } else {
      surface_.WriteText(cover.details[i], geometry.ContentLeft(),
                         kLeftDetailTop + i * kLeftDetailStep,
                         TextStyle{12.0, false, kBlack}, TextAlign::Left);
    }
  }
}

void DocumentAssembler::DrawTableOfContents(
    const std::vector<TocEntry> &entries) {
  cursor_.StartNewPage();
  int firstPage = cursor_.PageIndex();
  const PageGeometry &geometry = surface_.Geometry();
  const double left = geometry.ContentLeft();

  surface_.WriteText("Table of Contents", left, kTocTitleBaseline,
                     TextStyle{kTocTitleSize, true, kPrimaryBlue},
                     TextAlign::Left);
  // The cursor tracks the top of each entry; the entry title sits one
  // line below it.
  cursor_.MoveTo(kTocFirstEntryBaseline - kTocEntrySize);
  const TextStyle entryStyle{kTocEntrySize, false, kBlack};
  const TextStyle descriptionStyle{kTocDescriptionSize, false, kMutedGray};
  for (size_t i = 0; i < entries.size(); ++i) {
    cursor_.EnsureSpace(kTocEntryHeight);
    double baseline = cursor_.Y() + kTocEntrySize;
    surface_.WriteText(std::to_string(i + 1) + ". " + entries[i].title,
                       left + kTocEntryIndent, baseline, entryStyle,
                       TextAlign::Left);
    if (!entries[i].description.empty())
      surface_.WriteText(entries[i].description, left + kTocDescriptionIndent,
                         baseline + kTocDescriptionOffset, descriptionStyle,
                         TextAlign::Left);
    cursor_.Advance(kTocEntryHeight);
  }
  tocPages_ = cursor_.PageIndex() - firstPage + 1;
}

void DocumentAssembler::DrawClosingPage(const ClosingPage &closing) {
  cursor_.StartNewPage();
  const PageGeometry &geometry = surface_.Geometry();
  const double centerX = geometry.pageWidth / 2.0;
  const double centerY = geometry.pageHeight / 2.0;

  RectStyle frame;
  frame.fill = kClosingFill;
  frame.stroke = kPrimaryBlue;
  frame.lineWidth = kClosingBorder;
  surface_.WriteRect(kClosingInset, kClosingInset,
                     geometry.pageWidth - 2 * kClosingInset,
                     geometry.pageHeight - 2 * kClosingInset, frame);
  surface_.WriteText(closing.heading, centerX, centerY - 20.0,
                     TextStyle{24.0, true, kPrimaryBlue}, TextAlign::Center);
  if (!closing.message.empty())
    surface_.WriteText(closing.message, centerX, centerY + 20.0,
                       TextStyle{16.0, false, kMutedGray}, TextAlign::Center);
}

void DocumentAssembler::StampFooters() {
  const PageGeometry &geometry = surface_.Geometry();
  const int total = surface_.PageCount();
  const int current = surface_.CurrentPage();
  const TextStyle style{kFooterSize, false, kFooterGray};
  const double baseline = geometry.pageHeight - kFooterOffset;

  for (int page = 1; page <= total; ++page) {
    if (plan_.cover && page == 1)
      continue;
    if (plan_.closing && page == total)
      continue;
    surface_.SetPage(page);
    if (!plan_.footer.label.empty())
      surface_.WriteText(plan_.footer.label, geometry.ContentLeft(), baseline,
                         style, TextAlign::Left);
    surface_.WriteText("Page " + std::to_string(page) + " of " +
                           std::to_string(total),
                       geometry.pageWidth - geometry.marginRight, baseline,
                       style, TextAlign::Right);
  }
  if (current > 0)
    surface_.SetPage(current);
}

void ComposeErrorDocument(DrawingSurface &surface,
                          const std::vector<std::string> &lines) {
  if (surface.PageCount() == 0)
    surface.AddPage();
  const PageGeometry &geometry = surface.Geometry();
  const TextStyle style{kErrorTextSize, false, kBlack};
  double baseline = 60.0;
  for (const auto &line : lines) {
    for (const auto &wrapped :
         surface.MeasureWrap(line, geometry.ContentWidth(), style)) {
      surface.WriteText(wrapped, geometry.ContentLeft(), baseline, style,
                        TextAlign::Left);
      baseline += kErrorTextSize * 1.25;
    }
    baseline += kErrorTextSize * 0.625;
  }
}
