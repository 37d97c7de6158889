#include "pdf_canvas.h"
#include "pdf_objects.h"
#include "pdf_writer.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <numeric>
#include <stdexcept>
#include <string>

namespace {
std::string ReadAll(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}
} // namespace

int main() {
  const std::filesystem::path outPath =
      std::filesystem::temp_directory_path() / "compareports_pdf_canvas_test.pdf";

  PdfCanvasOptions options;
  options.compressStreams = false;
  options.embedFonts = false;
  options.title = "Acme (Q1)";
  PdfCanvas canvas(PageGeometry{}, options);
  assert(canvas.PageCount() == 0);

  canvas.AddPage();
  TextStyle style{10.0, false, RgbColor{255, 0, 0}};
  canvas.WriteText("ab", 100.0, 100.0, style, TextAlign::Center);
  canvas.WriteText("\xE2\x80\xA2 item", 40.0, 120.0, style, TextAlign::Left);
  RectStyle fill;
  fill.fill = RgbColor{0, 0, 255};
  canvas.WriteRect(10.0, 20.0, 30.0, 40.0, fill);
  canvas.WriteRect(0.0, 0.0, 5.0, 5.0, RectStyle{});

  const std::string &page = canvas.PageContent(1);
  assert(Contains(page, "/F1 10.00 Tf\n1.00 0.00 0.00 rg\n"));
  assert(Contains(page, "94.00 741.89 Td\n(ab) Tj\nET\n"));
  assert(Contains(page, "(\\225 item) Tj"));
  assert(Contains(page, "0.00 0.00 1.00 rg\n10.00 781.89 30.00 40.00 re f\nQ\n"));
  assert(!Contains(page, "5.00 5.00 re"));
  assert(canvas.MeasureText("abcd", style) == 24.0);

  canvas.AddPage();
  RectStyle frame;
  frame.fill = RgbColor{240, 248, 255};
  frame.stroke = RgbColor{52, 152, 219};
  frame.lineWidth = 3.0;
  canvas.WriteRect(30.0, 30.0, 100.0, 100.0, frame);
  canvas.WriteText("Bold", 10.0, 10.0, TextStyle{12.0, true, RgbColor{}},
                   TextAlign::Right);
  assert(Contains(canvas.PageContent(2), "3.00 w\n"));
  assert(Contains(canvas.PageContent(2), " re B\n"));
  assert(Contains(canvas.PageContent(2), "/F2 12.00 Tf"));

  canvas.SetPage(1);
  assert(canvas.CurrentPage() == 1);
  bool threw = false;
  try {
    canvas.SetPage(3);
  } catch (const std::out_of_range &) {
    threw = true;
  }
  assert(threw);

  auto widths = canvas.AutoColumnWidths(
      {"Name", "Description"}, {{"Acme", "A very long description of it"}},
      400.0, style, style);
  assert(widths && widths->size() == 2);
  assert(std::abs(std::accumulate(widths->begin(), widths->end(), 0.0) - 400.0) <
         1e-6);
  assert((*widths)[1] > (*widths)[0]);
  assert((*widths)[0] >= 100.0 - 1e-6);

  std::string error;
  assert(canvas.Save(outPath, error));
  const std::string data = ReadAll(outPath);
  assert(data.rfind("%PDF-1.4\n", 0) == 0);
  assert(Contains(data, "/Type /Pages /Kids ["));
  assert(Contains(data, "/Count 2"));
  assert(Contains(data, "/BaseFont /Helvetica-Bold"));
  assert(Contains(data, "/Producer (CompaReports) /Title (Acme \\(Q1\\))"));
  assert(Contains(data, "\nxref\n0 "));
  assert(Contains(data, "/Root "));
  assert(Contains(data, "/Info "));
  assert(data.size() > 6 && data.compare(data.size() - 6, 6, "%%EOF\n") == 0);
  std::filesystem::remove(outPath);

  // Compressed streams carry the Flate filter.
  PdfCanvasOptions packed;
  packed.embedFonts = false;
  PdfCanvas compressed(PageGeometry{}, packed);
  compressed.AddPage();
  compressed.WriteText("compressed text", 40.0, 60.0, style, TextAlign::Left);
  assert(compressed.Save(outPath, error));
  assert(Contains(ReadAll(outPath), "/Filter /FlateDecode"));
  std::filesystem::remove(outPath);

  std::vector<compa_pdf::PdfObject> objects;
  objects.push_back({"<< /Type /Catalog >>"});
  assert(!compa_pdf::WritePdfDocument(outPath, objects, 0, 0, error));
  assert(!error.empty());
  assert(compa_pdf::EscapePdfString("a(b)\\") == "a\\(b\\)\\\\");
  assert(compa_pdf::FloatFormatter(2).Format(-0.001) == "0.00");
  return 0;
}
