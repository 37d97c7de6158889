#pragma once

#include "pdf_font_metrics.h"
#include "pdf_writer.h"

#include <string>
#include <vector>

namespace compa_pdf {

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Escapes a WinAnsi string for use inside a PDF literal string.
std::string EscapePdfString(const std::string &winAnsi);

// Stream object with an optional /FlateDecode filter.
PdfObject MakeStreamObject(const std::string &data, bool compress);

bool AppendEmbeddedFontObjects(std::vector<PdfObject> &objects,
                               PdfFontDefinition &font);
void AppendFallbackType1Font(std::vector<PdfObject> &objects,
                             PdfFontDefinition &font,
                             const std::string &baseFont);

} // namespace compa_pdf
