#include "pdf_objects.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include <zlib.h>

#include "logger.h"

namespace compa_pdf {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  if (std::abs(value) < 0.5 * std::pow(10.0, -precision_))
    value = 0.0;
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  return ss.str();
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_SPEED);
  if (zres != Z_OK) {
    error = "compress2 failed with code " + std::to_string(zres);
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

std::string EscapePdfString(const std::string &winAnsi) {
  std::string out;
  out.reserve(winAnsi.size() + 8);
  for (unsigned char ch : winAnsi) {
    if (ch == '(' || ch == ')' || ch == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(ch));
    } else if (ch < 0x20 || ch >= 0x7F) {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "\\%03o", ch);
      out += buf;
    } else {
      out.push_back(static_cast<char>(ch));
    }
  }
  return out;
}

PdfObject MakeStreamObject(const std::string &data, bool compress) {
  std::string payload = data;
  bool deflated = false;
  if (compress && !data.empty()) {
    std::string packed;
    std::string error;
    if (PdfDeflater::Compress(data, packed, error)) {
      payload.swap(packed);
      deflated = true;
    } else {
      Logger::Instance().Log(LogLevel::Warning,
                             "PDF stream left uncompressed: " + error);
    }
  }
  std::ostringstream body;
  body << "<< /Length " << payload.size();
  if (deflated)
    body << " /Filter /FlateDecode";
  body << " >>\nstream\n" << payload << "\nendstream";
  return {body.str()};
}

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font) {
  if (!font.metrics.valid || font.metrics.data.empty())
    return false;
  const double scale = font.metrics.unitsPerEm > 0 ? 1000.0 / font.metrics.unitsPerEm : 1.0;
  auto scaled = [scale](int value) {
    return static_cast<int>(std::lround(value * scale));
  };

  std::string packed;
  std::string error;
  bool deflated = PdfDeflater::Compress(font.metrics.data, packed, error);
  const std::string &fontData = deflated ? packed : font.metrics.data;

  size_t fontFileIndex = objects.size() + 1;
  std::ostringstream fontFileStream;
  fontFileStream << "<< /Length " << fontData.size() << " /Length1 "
                 << font.metrics.data.size();
  if (deflated)
    fontFileStream << " /Filter /FlateDecode";
  fontFileStream << " >>\nstream\n" << fontData << "\nendstream";
  objects.push_back({fontFileStream.str()});

  size_t descriptorIndex = objects.size() + 1;
  std::ostringstream descriptor;
  descriptor << "<< /Type /FontDescriptor /FontName /" << font.baseName
             << " /Flags 32 /FontBBox [" << scaled(font.metrics.xMin) << ' '
             << scaled(font.metrics.yMin) << ' ' << scaled(font.metrics.xMax) << ' '
             << scaled(font.metrics.yMax) << "] /Ascent " << scaled(font.metrics.ascent)
             << " /Descent " << -std::abs(scaled(font.metrics.descent))
             << " /CapHeight " << scaled(font.metrics.capHeight)
             << " /ItalicAngle 0 /StemV 80 /FontFile2 " << fontFileIndex << " 0 R >>";
  objects.push_back({descriptor.str()});

  size_t fontIndex = objects.size() + 1;
  std::ostringstream fontObject;
  fontObject << "<< /Type /Font /Subtype /TrueType /BaseFont /" << font.baseName
             << " /FirstChar 32 /LastChar 255 /Widths [";
  for (int code = 32; code <= 255; ++code) {
    fontObject << font.metrics.widths1000[static_cast<unsigned char>(code)];
    if (code != 255)
      fontObject << ' ';
  }
  fontObject << "] /FontDescriptor " << descriptorIndex << " 0 R /Encoding /WinAnsiEncoding >>";
  objects.push_back({fontObject.str()});

  font.objectId = fontIndex;
  font.embedded = true;
  return true;
}

void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont) {
  objects.push_back({"<< /Type /Font /Subtype /Type1 /BaseFont /" + baseFont +
                     " /Encoding /WinAnsiEncoding >>"});
  font.objectId = objects.size();
  font.embedded = false;
  font.baseName = baseFont;
}

} // namespace compa_pdf
