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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Page size and margins in points. Coordinates used by the layout code
// have their origin at the top-left corner of the page with y growing
// downwards.
struct PageGeometry {
  double pageWidth = 595.28;
  double pageHeight = 841.89;
  double marginLeft = 40.0;
  double marginRight = 40.0;
  double marginTop = 40.0;
  double marginBottom = 40.0;

  double ContentLeft() const { return marginLeft; }
  double ContentWidth() const { return pageWidth - marginLeft - marginRight; }
  double ContentTop() const { return marginTop; }
  double ContentBottom() const { return pageHeight - marginBottom; }
  double ContentHeight() const { return ContentBottom() - ContentTop(); }
};

struct RgbColor {
  int r = 0;
  int g = 0;
  int b = 0;
};

inline bool operator==(const RgbColor &a, const RgbColor &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const RgbColor &a, const RgbColor &b) {
  return !(a == b);
}

enum class TextAlign { Left, Center, Right };

struct TextStyle {
  double fontSize = 11.0;
  bool bold = false;
  RgbColor color;
};

struct RectStyle {
  std::optional<RgbColor> fill;
  std::optional<RgbColor> stroke;
  double lineWidth = 1.0;
};

// Output target of the layout engine. A surface starts without pages;
// AddPage appends a page and makes it current. Page numbers are 1-based.
class DrawingSurface {
public:
  virtual ~DrawingSurface() = default;

  virtual const PageGeometry &Geometry() const = 0;

  virtual void AddPage() = 0;
  virtual int CurrentPage() const = 0;
  virtual int PageCount() const = 0;
  virtual void SetPage(int page) = 0;

  // Draws one line of text. x is the anchor selected by align and
  // baseline the y of the text baseline.
  virtual void WriteText(const std::string &text, double x, double baseline,
                         const TextStyle &style, TextAlign align) = 0;
  virtual void WriteRect(double x, double y, double width, double height,
                         const RectStyle &style) = 0;

  virtual double MeasureText(const std::string &text,
                             const TextStyle &style) const = 0;

  // Breaks text into lines no wider than maxWidth.
  virtual std::vector<std::string> MeasureWrap(const std::string &text,
                                               double maxWidth,
                                               const TextStyle &style) const;

  // Column widths for a table filling totalWidth, or nullopt when the
  // surface does not size columns itself.
  virtual std::optional<std::vector<double>>
  AutoColumnWidths(const std::vector<std::string> &headers,
                   const std::vector<std::vector<std::string>> &rows,
                   double totalWidth, const TextStyle &headerStyle,
                   const TextStyle &bodyStyle) const;

  virtual bool Save(const std::filesystem::path &path, std::string &error) = 0;
};
