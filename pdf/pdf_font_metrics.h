#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace compa_pdf {

struct TtfFontMetrics {
  int unitsPerEm = 1000;
  int ascent = 0;
  int descent = 0;
  int lineGap = 0;
  int capHeight = 0;
  int xMin = 0;
  int yMin = 0;
  int xMax = 0;
  int yMax = 0;
  // Indexed by WinAnsi code.
  std::array<int, 256> advanceWidths{};
  std::array<int, 256> widths1000{};
  std::string data;
  bool valid = false;
};

struct PdfFontDefinition {
  std::string resourceName;
  std::string baseName;
  size_t objectId = 0;
  bool embedded = false;
  TtfFontMetrics metrics;
};

// Regular and bold faces used for one document.
struct PdfFontSet {
  PdfFontDefinition regular;
  PdfFontDefinition bold;

  const PdfFontDefinition &ForWeight(bool isBold) const {
    return isBold ? bold : regular;
  }
};

// Width of WinAnsi encoded text. Without loaded metrics every character
// counts as 0.6 em.
double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font);

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint);
uint32_t WinAnsiToUnicode(unsigned char code);
std::string EncodeWinAnsi(const std::string &utf8);

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics);
std::filesystem::path FindFontPath(bool bold);
bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold);

} // namespace compa_pdf
