#include "pdf_writer.h"

#include <fstream>
#include <iomanip>

namespace compa_pdf {

bool WritePdfDocument(const std::filesystem::path &outputPath,
                      const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, size_t infoObjectIndex,
                      std::string &error) {
  if (catalogObjectIndex == 0 || catalogObjectIndex > objects.size()) {
    error = "The PDF catalog object is missing.";
    return false;
  }
  try {
    std::ofstream file(outputPath, std::ios::binary);
    if (!file.is_open()) {
      error = "Unable to open the destination file for writing.";
      return false;
    }

    file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<long> offsets;
    offsets.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
      offsets.push_back(static_cast<long>(file.tellp()));
      file << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
    }

    long xrefPos = static_cast<long>(file.tellp());
    file << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (long off : offsets)
      file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";

    file << "trailer\n<< /Size " << (objects.size() + 1) << " /Root "
         << catalogObjectIndex << " 0 R";
    if (infoObjectIndex > 0 && infoObjectIndex <= objects.size())
      file << " /Info " << infoObjectIndex << " 0 R";
    file << " >>\nstartxref\n" << xrefPos << "\n%%EOF\n";
    file.flush();
    if (!file) {
      error = "Failed to write the PDF file.";
      return false;
    }
    return true;
  } catch (const std::exception &ex) {
    error = std::string("Failed to generate PDF content: ") + ex.what();
    return false;
  }
}

} // namespace compa_pdf
