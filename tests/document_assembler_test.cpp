#include "documentassembler.h"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "recordingsurface.h"

namespace {
std::vector<Block> LongSection(int paragraphs) {
  std::vector<Block> blocks;
  blocks.push_back(Block::Heading(1, "Overview"));
  for (int i = 0; i < paragraphs; ++i)
    blocks.push_back(Block::Paragraph(
        "Market positioning remains strong across every segment we "
        "reviewed this quarter and the trend continues."));
  return blocks;
}

int LastPageTouched(const RecordingSurface &surface, size_t endOp) {
  int page = 0;
  for (size_t i = 0; i < endOp; ++i)
    if (surface.ops[i].kind != RecordingSurface::OpKind::AddPage)
      page = std::max(page, surface.ops[i].page);
  return page;
}
} // namespace

int main() {
  StyleTable styles = StyleTable::ForPreset(StylePreset::Bundle);

  {
    RecordingSurface surface;
    DocumentAssembler assembler(surface, styles);
    bool threw = false;
    try {
      assembler.AppendSection("Early", "", {});
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);
    assert(assembler.GetState() == DocumentAssembler::State::Created);

    assembler.Begin(AssemblyPlan{});
    threw = false;
    try {
      assembler.Begin(AssemblyPlan{});
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);

    std::string error;
    assert(assembler.Finalize("empty.pdf", error));
    assert(assembler.PageCount() == 1);
    assert(assembler.GetState() == DocumentAssembler::State::Finalized);
    threw = false;
    try {
      assembler.Finalize("again.pdf", error);
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);
    assert(surface.savedPaths.size() == 1);
  }

  {
    // Sections always start on a page of their own.
    RecordingSurface surface;
    DocumentAssembler assembler(surface, styles);
    assembler.Begin(AssemblyPlan{});
    assembler.AppendSection("First", "", LongSection(70));
    size_t firstEnd = surface.ops.size();
    assembler.AppendSection("Second", "", LongSection(1));
    const auto &starts = assembler.SectionStartPages();
    assert(starts.size() == 2);
    assert(starts[0] == 1);
    assert(starts[1] > LastPageTouched(surface, firstEnd));
    assert(surface.ops[firstEnd].kind == RecordingSurface::OpKind::AddPage);
    assert(surface.ops[firstEnd + 1].page == starts[1]);
    assert(surface.ops[firstEnd + 1].kind == RecordingSurface::OpKind::Rect);
    assert(surface.ops[firstEnd + 1].y == 0.0);
    auto texts = surface.TextsOnPage(starts[1]);
    assert(texts[0].text == "Second");
    // Content starts below the banner.
    assert(texts[1].y > styles.Banner().contentTop);
  }

  {
    // Every page between cover and closing carries one footer.
    RecordingSurface surface;
    DocumentAssembler assembler(surface, styles);
    AssemblyPlan plan;
    plan.cover = CoverPage{"Comprehensive Business Analysis", "Acme", 20.0,
                           {"Generated on: 01/15/2025"}, true};
    for (int i = 0; i < 30; ++i)
      plan.tableOfContents.push_back(
          TocEntry{"Report " + std::to_string(i + 1), "Description"});
    plan.closing = ClosingPage{"Thank You", "For reading"};
    plan.footer.enabled = true;
    plan.footer.label = "Comprehensive Business Analysis | COMPA AI";
    assembler.Begin(plan);
    assert(assembler.TableOfContentsPages() == 2);
    for (int i = 0; i < 3; ++i)
      assembler.AppendSection("Section " + std::to_string(i + 1), "",
                              LongSection(i * 40));
    std::string error;
    assert(assembler.Finalize("bundle.pdf", error));

    const int total = assembler.PageCount();
    assert(total >= 1 + 2 + 3 + 1);
    const std::string suffix = " of " + std::to_string(total);
    for (int page = 1; page <= total; ++page) {
      int footers = 0;
      int labels = 0;
      for (const auto &op : surface.TextsOnPage(page)) {
        if (op.text == "Page " + std::to_string(page) + suffix) {
          ++footers;
          assert(op.align == TextAlign::Right);
          assert(op.style.fontSize == 8.0);
        }
        if (op.text == plan.footer.label)
          ++labels;
      }
      bool interior = page != 1 && page != total;
      assert(footers == (interior ? 1 : 0));
      assert(labels == (interior ? 1 : 0));
    }
    assert(surface.CountTextContaining("Page ") ==
           static_cast<size_t>(total - 2));

    auto cover = surface.TextsOnPage(1);
    assert(cover[0].text == "Comprehensive Business Analysis");
    assert(cover[0].style.fontSize == 28.0);
    auto toc = surface.TextsOnPage(2);
    assert(toc[0].text == "Table of Contents");
    assert(toc[1].text == "1. Report 1");
    assert(toc[1].y == 100.0);
    assert(toc[2].text == "Description");
    assert(toc[2].y == 115.0);
    assert(surface.HasText("30. Report 30"));
    auto closing = surface.TextsOnPage(total);
    assert(closing[0].text == "Thank You");
    assert(closing[1].text == "For reading");
  }

  {
    RecordingSurface surface;
    surface.saveResult = false;
    DocumentAssembler assembler(surface, styles);
    assembler.Begin(AssemblyPlan{});
    assembler.AppendSection("Only", "Acme", {Block::Paragraph("Body")});
    std::string error;
    assert(!assembler.Finalize("fail.pdf", error));
    assert(error == "disk full");
    assert(surface.HasText("Acme"));
  }

  {
    RecordingSurface surface;
    ComposeErrorDocument(surface, {"There was an error generating this report.",
                                   "Please try again."});
    assert(surface.PageCount() == 1);
    auto texts = surface.Texts();
    assert(texts.size() == 2);
    assert(texts[0].y == 60.0);
    assert(texts[1].y == 90.0);
  }
  return 0;
}
