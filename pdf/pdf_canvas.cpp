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
#include "pdf_canvas.h"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "logger.h"

using namespace compa_pdf;

namespace {
std::string PdfInfoString(const std::string &utf8) {
  return "(" + EscapePdfString(EncodeWinAnsi(utf8)) + ")";
}
} // namespace

PdfCanvas::PdfCanvas(const PageGeometry &geometry, PdfCanvasOptions options)
    : geometry_(geometry), options_(std::move(options)),
      formatter_(options_.floatPrecision) {
  fonts_.regular.resourceName = "F1";
  fonts_.bold.resourceName = "F2";
  if (!options_.embedFonts)
    return;
  if (!LoadPdfFontMetrics(fonts_.regular, false))
    Logger::Instance().Log(LogLevel::Warning,
                           "No TrueType font found, using Helvetica");
  if (!LoadPdfFontMetrics(fonts_.bold, true))
    Logger::Instance().Log(LogLevel::Warning,
                           "No bold TrueType font found, using Helvetica-Bold");
}

void PdfCanvas::AddPage() {
  pages_.emplace_back();
  current_ = static_cast<int>(pages_.size());
}

void PdfCanvas::SetPage(int page) {
  if (page < 1 || page > PageCount())
    throw std::out_of_range("PdfCanvas::SetPage: page " +
                            std::to_string(page) + " does not exist");
  current_ = page;
}

std::string &PdfCanvas::Content() {
  if (current_ == 0)
    AddPage();
  return pages_[static_cast<size_t>(current_ - 1)];
}

const std::string &PdfCanvas::PageContent(int page) const {
  return pages_.at(static_cast<size_t>(page - 1));
}

std::string PdfCanvas::Color(const RgbColor &color) const {
  auto channel = [this](int value) {
    return formatter_.Format(std::clamp(value, 0, 255) / 255.0);
  };
  return channel(color.r) + ' ' + channel(color.g) + ' ' + channel(color.b);
}

double PdfCanvas::MeasureText(const std::string &text,
                              const TextStyle &style) const {
  return MeasureTextWidth(EncodeWinAnsi(text), style.fontSize,
                          &fonts_.ForWeight(style.bold));
}

void PdfCanvas::WriteText(const std::string &text, double x, double baseline,
                          const TextStyle &style, TextAlign align) {
  if (text.empty())
    return;
  const PdfFontDefinition &font = fonts_.ForWeight(style.bold);
  const std::string encoded = EncodeWinAnsi(text);
  double width = MeasureTextWidth(encoded, style.fontSize, &font);
  if (align == TextAlign::Center)
    x -= width / 2.0;
  else if (align == TextAlign::Right)
    x -= width;

  std::ostringstream op;
  op << "BT\n/" << font.resourceName << ' ' << formatter_.Format(style.fontSize)
     << " Tf\n"
     << Color(style.color) << " rg\n"
     << formatter_.Format(x) << ' ' << formatter_.Format(PdfY(baseline))
     << " Td\n(" << EscapePdfString(encoded) << ") Tj\nET\n";
  Content() += op.str();
}

void PdfCanvas::WriteRect(double x, double y, double width, double height,
                          const RectStyle &style) {
  if (!style.fill && !style.stroke)
    return;
  std::ostringstream op;
  op << "q\n";
  if (style.fill)
    op << Color(*style.fill) << " rg\n";
  if (style.stroke)
    op << Color(*style.stroke) << " RG " << formatter_.Format(style.lineWidth)
       << " w\n";
  op << formatter_.Format(x) << ' ' << formatter_.Format(PdfY(y + height))
     << ' ' << formatter_.Format(width) << ' ' << formatter_.Format(height)
     << " re ";
  if (style.fill && style.stroke)
    op << "B";
  else if (style.fill)
    op << "f";
  else
    op << "S";
  op << "\nQ\n";
  Content() += op.str();
}

std::optional<std::vector<double>> PdfCanvas::AutoColumnWidths(
    const std::vector<std::string> &headers,
    const std::vector<std::vector<std::string>> &rows, double totalWidth,
    const TextStyle &headerStyle, const TextStyle &bodyStyle) const {
  size_t columns = headers.size();
  for (const auto &row : rows)
    columns = std::max(columns, row.size());
  if (columns == 0 || totalWidth <= 0.0)
    return std::nullopt;

  // Natural width of each column is its widest unwrapped cell. Narrow
  // columns keep at least half of an even share so long text cannot
  // squeeze them to nothing.
  const double padding = bodyStyle.fontSize;
  std::vector<double> natural(columns, 0.0);
  for (size_t c = 0; c < headers.size(); ++c)
    natural[c] = std::max(natural[c], MeasureText(headers[c], headerStyle));
  for (const auto &row : rows)
    for (size_t c = 0; c < row.size(); ++c)
      natural[c] = std::max(natural[c], MeasureText(row[c], bodyStyle));

  const double minimum = totalWidth / columns / 2.0;
  for (auto &width : natural)
    width = std::max(minimum, width + padding);
  double sum = std::accumulate(natural.begin(), natural.end(), 0.0);
  if (sum <= 0.0)
    return std::nullopt;
  for (auto &width : natural)
    width *= totalWidth / sum;
  return natural;
}

bool PdfCanvas::Save(const std::filesystem::path &path, std::string &error) {
  if (pages_.empty())
    AddPage();

  std::vector<PdfObject> objects;
  if (!AppendEmbeddedFontObjects(objects, fonts_.regular))
    AppendFallbackType1Font(objects, fonts_.regular, "Helvetica");
  if (!AppendEmbeddedFontObjects(objects, fonts_.bold))
    AppendFallbackType1Font(objects, fonts_.bold, "Helvetica-Bold");

  std::ostringstream resources;
  resources << "<< /Font << /F1 " << fonts_.regular.objectId << " 0 R /F2 "
            << fonts_.bold.objectId << " 0 R >> >>";

  const size_t pageCount = pages_.size();
  const size_t firstContent = objects.size() + 1;
  const size_t firstPage = firstContent + pageCount;
  const size_t pagesIndex = firstPage + pageCount;
  const size_t catalogIndex = pagesIndex + 1;
  const size_t infoIndex = catalogIndex + 1;

  for (const auto &content : pages_)
    objects.push_back(MakeStreamObject(content, options_.compressStreams));

  std::ostringstream kids;
  for (size_t i = 0; i < pageCount; ++i) {
    std::ostringstream pageObj;
    pageObj << "<< /Type /Page /Parent " << pagesIndex
            << " 0 R /MediaBox [0 0 " << formatter_.Format(geometry_.pageWidth)
            << ' ' << formatter_.Format(geometry_.pageHeight) << "] /Contents "
            << (firstContent + i) << " 0 R /Resources " << resources.str()
            << " >>";
    objects.push_back({pageObj.str()});
    if (i > 0)
      kids << ' ';
    kids << (firstPage + i) << " 0 R";
  }
  objects.push_back({"<< /Type /Pages /Kids [" + kids.str() + "] /Count " +
                     std::to_string(pageCount) + " >>"});
  objects.push_back({"<< /Type /Catalog /Pages " + std::to_string(pagesIndex) +
                     " 0 R >>"});

  std::string info = "<< /Producer (CompaReports)";
  if (!options_.title.empty())
    info += " /Title " + PdfInfoString(options_.title);
  if (!options_.author.empty())
    info += " /Author " + PdfInfoString(options_.author);
  info += " >>";
  objects.push_back({info});

  if (!WritePdfDocument(path, objects, catalogIndex, infoIndex, error)) {
    Logger::Instance().Log(LogLevel::Error,
                           "Saving " + path.string() + " failed: " + error);
    return false;
  }
  return true;
}
