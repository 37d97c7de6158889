#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace compa_pdf {

struct PdfObject {
  std::string body;
};

// Writes objects numbered from 1 in order, followed by the xref table
// and trailer. infoObjectIndex 0 omits the /Info entry.
bool WritePdfDocument(const std::filesystem::path &outputPath,
                      const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, size_t infoObjectIndex,
                      std::string &error);

} // namespace compa_pdf
