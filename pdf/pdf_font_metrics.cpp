#include "pdf_font_metrics.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace compa_pdf {

namespace {
// Unicode code points of WinAnsi 0x80..0x9F. Zero marks unused codes.
constexpr uint32_t kWinAnsiHigh[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

// Big-endian reader over an sfnt (TrueType) file held in memory.
class SfntData {
public:
  explicit SfntData(const std::string &bytes) : bytes_(bytes) {}

  size_t Size() const { return bytes_.size(); }

  uint16_t U16(size_t offset) const {
    return static_cast<uint16_t>((Byte(offset) << 8) | Byte(offset + 1));
  }
  int16_t S16(size_t offset) const { return static_cast<int16_t>(U16(offset)); }
  uint32_t U32(size_t offset) const {
    return (static_cast<uint32_t>(U16(offset)) << 16) | U16(offset + 2);
  }

  // Offset and length of a table, if present and inside the file.
  std::optional<std::pair<uint32_t, uint32_t>> Table(const char tag[4]) const {
    if (Size() < 12)
      return std::nullopt;
    uint32_t wanted = (static_cast<uint32_t>(tag[0]) << 24) |
                      (static_cast<uint32_t>(tag[1]) << 16) |
                      (static_cast<uint32_t>(tag[2]) << 8) |
                      static_cast<uint32_t>(tag[3]);
    uint16_t numTables = U16(4);
    for (uint16_t i = 0; i < numTables; ++i) {
      size_t record = 12 + static_cast<size_t>(i) * 16;
      if (record + 16 > Size())
        return std::nullopt;
      if (U32(record) != wanted)
        continue;
      uint32_t offset = U32(record + 8);
      uint32_t length = U32(record + 12);
      if (static_cast<uint64_t>(offset) + length > Size())
        return std::nullopt;
      return std::make_pair(offset, length);
    }
    return std::nullopt;
  }

private:
  unsigned Byte(size_t offset) const {
    return static_cast<unsigned char>(bytes_[offset]);
  }

  const std::string &bytes_;
};

// Format 4 (BMP) character map lookup.
class CmapFormat4 {
public:
  CmapFormat4(const SfntData &font, size_t subtable)
      : font_(font), base_(subtable) {
    segCount_ = font_.U16(base_ + 6) / 2;
    endCodes_ = base_ + 14;
    startCodes_ = endCodes_ + 2 * segCount_ + 2;
    idDeltas_ = startCodes_ + 2 * segCount_;
    idRangeOffsets_ = idDeltas_ + 2 * segCount_;
  }

  bool Valid() const {
    return segCount_ > 0 && idRangeOffsets_ + 2 * segCount_ <= font_.Size();
  }

  uint16_t Glyph(uint32_t code) const {
    if (code > 0xFFFF)
      return 0;
    for (size_t i = 0; i < segCount_; ++i) {
      uint16_t end = font_.U16(endCodes_ + 2 * i);
      uint16_t start = font_.U16(startCodes_ + 2 * i);
      if (code < start || code > end)
        continue;
      int16_t delta = font_.S16(idDeltas_ + 2 * i);
      uint16_t rangeOffset = font_.U16(idRangeOffsets_ + 2 * i);
      if (rangeOffset == 0)
        return static_cast<uint16_t>(code + delta);
      size_t glyphAt = idRangeOffsets_ + 2 * i + rangeOffset + 2 * (code - start);
      if (glyphAt + 2 > font_.Size())
        return 0;
      uint16_t glyph = font_.U16(glyphAt);
      return glyph == 0 ? 0 : static_cast<uint16_t>(glyph + delta);
    }
    return 0;
  }

private:
  const SfntData &font_;
  size_t base_ = 0;
  size_t segCount_ = 0;
  size_t endCodes_ = 0;
  size_t startCodes_ = 0;
  size_t idDeltas_ = 0;
  size_t idRangeOffsets_ = 0;
};

std::optional<size_t> FindUnicodeCmap(const SfntData &font, uint32_t cmapOffset) {
  if (cmapOffset + 4 > font.Size())
    return std::nullopt;
  uint16_t count = font.U16(cmapOffset + 2);
  for (uint16_t i = 0; i < count; ++i) {
    size_t record = cmapOffset + 4 + static_cast<size_t>(i) * 8;
    if (record + 8 > font.Size())
      return std::nullopt;
    uint16_t platformId = font.U16(record);
    uint16_t encodingId = font.U16(record + 2);
    size_t subtable = cmapOffset + font.U32(record + 4);
    if (subtable + 14 > font.Size())
      continue;
    if (platformId == 3 && (encodingId == 1 || encodingId == 0) &&
        font.U16(subtable) == 4)
      return subtable;
  }
  return std::nullopt;
}

bool ReadFileToString(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

// Decodes one UTF-8 sequence at i; malformed input yields U+FFFD.
uint32_t NextCodepoint(const std::string &utf8, size_t &i) {
  unsigned char lead = static_cast<unsigned char>(utf8[i]);
  size_t length = 1;
  uint32_t codepoint = lead;
  if (lead >= 0xF8) {
    ++i;
    return 0xFFFD;
  }
  if (lead >= 0xF0) {
    length = 4;
    codepoint = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    codepoint = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    codepoint = lead & 0x1F;
  } else if (lead >= 0x80) {
    ++i;
    return 0xFFFD;
  }
  if (i + length > utf8.size()) {
    ++i;
    return 0xFFFD;
  }
  for (size_t k = 1; k < length; ++k) {
    unsigned char next = static_cast<unsigned char>(utf8[i + k]);
    if ((next & 0xC0) != 0x80) {
      ++i;
      return 0xFFFD;
    }
    codepoint = (codepoint << 6) | (next & 0x3F);
  }
  i += length;
  return codepoint;
}
} // namespace

double MeasureTextWidth(const std::string &winAnsi, double fontSize,
                        const PdfFontDefinition *font) {
  if (!font || !font->metrics.valid || font->metrics.unitsPerEm <= 0)
    return static_cast<double>(winAnsi.size()) * fontSize * 0.6;
  double units = 0.0;
  for (unsigned char ch : winAnsi) {
    if (ch == '\n')
      continue;
    units += font->metrics.advanceWidths[ch];
  }
  return (units / font->metrics.unitsPerEm) * fontSize;
}

unsigned char EncodeWinAnsiCodepoint(uint32_t codepoint) {
  if (codepoint <= 0x7F)
    return static_cast<unsigned char>(codepoint);
  if (codepoint >= 0xA0 && codepoint <= 0xFF)
    return static_cast<unsigned char>(codepoint);
  for (unsigned i = 0; i < 32; ++i) {
    if (kWinAnsiHigh[i] != 0 && kWinAnsiHigh[i] == codepoint)
      return static_cast<unsigned char>(0x80 + i);
  }
  return '?';
}

uint32_t WinAnsiToUnicode(unsigned char code) {
  if (code >= 0x80 && code <= 0x9F)
    return kWinAnsiHigh[code - 0x80];
  return code;
}

std::string EncodeWinAnsi(const std::string &utf8) {
  std::string out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size())
    out.push_back(static_cast<char>(EncodeWinAnsiCodepoint(NextCodepoint(utf8, i))));
  return out;
}

bool LoadTtfFontMetrics(const std::filesystem::path &path,
                        TtfFontMetrics &metrics) {
  metrics = TtfFontMetrics{};
  std::string data;
  if (!ReadFileToString(path, data))
    return false;
  SfntData font(data);

  auto head = font.Table("head");
  auto hhea = font.Table("hhea");
  auto maxp = font.Table("maxp");
  auto hmtx = font.Table("hmtx");
  auto cmap = font.Table("cmap");
  if (!head || !hhea || !maxp || !hmtx || !cmap)
    return false;
  if (head->first + 54 > font.Size() || hhea->first + 36 > font.Size() ||
      maxp->first + 6 > font.Size())
    return false;

  metrics.unitsPerEm = font.U16(head->first + 18);
  metrics.xMin = font.S16(head->first + 36);
  metrics.yMin = font.S16(head->first + 38);
  metrics.xMax = font.S16(head->first + 40);
  metrics.yMax = font.S16(head->first + 42);
  metrics.ascent = font.S16(hhea->first + 4);
  metrics.descent = font.S16(hhea->first + 6);
  metrics.lineGap = font.S16(hhea->first + 8);

  uint16_t numHMetrics = font.U16(hhea->first + 34);
  uint16_t numGlyphs = font.U16(maxp->first + 4);
  if (numGlyphs == 0 || numHMetrics == 0 || numHMetrics > numGlyphs)
    return false;
  if (hmtx->first + static_cast<size_t>(numHMetrics) * 4 > font.Size())
    return false;

  // Glyphs past numHMetrics repeat the last advance.
  std::vector<int> glyphAdvance(numGlyphs, 0);
  for (uint16_t i = 0; i < numGlyphs; ++i) {
    uint16_t entry = std::min<uint16_t>(i, numHMetrics - 1);
    glyphAdvance[i] = font.U16(hmtx->first + static_cast<size_t>(entry) * 4);
  }

  if (auto os2 = font.Table("OS/2")) {
    if (os2->second >= 90 && font.U16(os2->first) >= 2)
      metrics.capHeight = font.S16(os2->first + 88);
  }
  if (metrics.capHeight == 0)
    metrics.capHeight = metrics.ascent;

  auto subtable = FindUnicodeCmap(font, cmap->first);
  if (!subtable)
    return false;
  CmapFormat4 map(font, *subtable);
  if (!map.Valid())
    return false;

  const int missingWidth = glyphAdvance.front();
  for (size_t code = 0; code < metrics.advanceWidths.size(); ++code) {
    uint32_t unicode = WinAnsiToUnicode(static_cast<unsigned char>(code));
    uint16_t glyph = unicode ? map.Glyph(unicode) : 0;
    int advance = glyph < glyphAdvance.size() ? glyphAdvance[glyph] : missingWidth;
    metrics.advanceWidths[code] = advance;
    metrics.widths1000[code] =
        metrics.unitsPerEm > 0
            ? static_cast<int>(std::lround(advance * 1000.0 / metrics.unitsPerEm))
            : 0;
  }

  metrics.data = std::move(data);
  metrics.valid = metrics.unitsPerEm > 0;
  return metrics.valid;
}

std::filesystem::path FindFontPath(bool bold) {
  struct FontCandidate {
    const char *regularPath;
    const char *boldPath;
  };
  const std::vector<FontCandidate> candidates = {
#ifdef _WIN32
      {"C:/Windows/Fonts/arial.ttf", "C:/Windows/Fonts/arialbd.ttf"},
#elif defined(__APPLE__)
      {"/Library/Fonts/Arial.ttf", "/Library/Fonts/Arial Bold.ttf"},
      {"/System/Library/Fonts/Supplemental/Arial.ttf",
       "/System/Library/Fonts/Supplemental/Arial Bold.ttf"},
#else
      {"/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
       "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf"},
      {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
       "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf"},
#endif
  };
  for (const auto &candidate : candidates) {
    const char *path = bold ? candidate.boldPath : candidate.regularPath;
    std::error_code ec;
    if (path && std::filesystem::exists(path, ec))
      return std::filesystem::path(path);
  }
  return {};
}

bool LoadPdfFontMetrics(PdfFontDefinition &font, bool bold) {
  std::filesystem::path path = FindFontPath(bold);
  if (path.empty())
    return false;
  if (!LoadTtfFontMetrics(path, font.metrics))
    return false;
  // PDF names may not contain spaces.
  std::string stem = path.stem().string();
  stem.erase(std::remove(stem.begin(), stem.end(), ' '), stem.end());
  font.baseName = stem;
  return true;
}

} // namespace compa_pdf
