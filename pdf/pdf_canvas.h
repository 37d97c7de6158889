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

#include <string>
#include <vector>

#include "drawingsurface.h"
#include "pdf_font_metrics.h"
#include "pdf_objects.h"

struct PdfCanvasOptions {
  bool compressStreams = true;
  int floatPrecision = 2;
  bool embedFonts = true;
  std::string title;
  std::string author;
};

// DrawingSurface that records each page as a PDF content stream and
// writes a complete PDF file on Save. Text is encoded as WinAnsi and set
// in an embedded TrueType face when one is installed, Helvetica
// otherwise.
class PdfCanvas : public DrawingSurface {
public:
  explicit PdfCanvas(const PageGeometry &geometry,
                     PdfCanvasOptions options = {});

  const PageGeometry &Geometry() const override { return geometry_; }

  void AddPage() override;
  int CurrentPage() const override { return current_; }
  int PageCount() const override { return static_cast<int>(pages_.size()); }
  void SetPage(int page) override;

  void WriteText(const std::string &text, double x, double baseline,
                 const TextStyle &style, TextAlign align) override;
  void WriteRect(double x, double y, double width, double height,
                 const RectStyle &style) override;

  double MeasureText(const std::string &text,
                     const TextStyle &style) const override;

  std::optional<std::vector<double>>
  AutoColumnWidths(const std::vector<std::string> &headers,
                   const std::vector<std::vector<std::string>> &rows,
                   double totalWidth, const TextStyle &headerStyle,
                   const TextStyle &bodyStyle) const override;

  bool Save(const std::filesystem::path &path, std::string &error) override;

  // Raw content stream of a page, for inspection.
  const std::string &PageContent(int page) const;

private:
  std::string &Content();
  std::string Color(const RgbColor &color) const;
  double PdfY(double y) const { return geometry_.pageHeight - y; }

  PageGeometry geometry_;
  PdfCanvasOptions options_;
  compa_pdf::FloatFormatter formatter_;
  compa_pdf::PdfFontSet fonts_;
  std::vector<std::string> pages_;
  int current_ = 0;
};
