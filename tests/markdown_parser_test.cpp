#include "markdown.h"

#include <cassert>
#include <string>

int main() {
  {
    auto blocks = ParseMarkdownBlocks("# Title\n\nShort paragraph.");
    assert(blocks.size() == 2);
    assert(blocks[0].kind == BlockKind::Heading1);
    assert(blocks[0].text == "Title");
    assert(blocks[1].kind == BlockKind::Paragraph);
    assert(blocks[1].text == "Short paragraph.");
  }

  {
    // Consecutive lines join; deep headings collapse to level three.
    auto blocks = ParseMarkdownBlocks("## Market ##\nfirst line\nsecond line\n"
                                      "#### Detail\n");
    assert(blocks.size() == 3);
    assert(blocks[0].kind == BlockKind::Heading2);
    assert(blocks[0].text == "Market");
    assert(blocks[1].text == "first line second line");
    assert(blocks[2].kind == BlockKind::Heading3);
    assert(blocks[2].text == "Detail");
  }

  {
    auto blocks = ParseMarkdownBlocks("- **Strong** brand\n* second\n"
                                      "  continued\n\n3. third\n4) fourth\n");
    assert(blocks.size() == 2);
    assert(blocks[0].kind == BlockKind::UnorderedList);
    assert(blocks[0].items.size() == 2);
    assert(blocks[0].items[0] == "Strong brand");
    assert(blocks[0].items[1] == "second continued");
    assert(blocks[1].kind == BlockKind::OrderedList);
    assert(blocks[1].startNumber == 3);
    assert(blocks[1].items.size() == 2);
    assert(blocks[1].items[1] == "fourth");
  }

  {
    auto blocks = ParseMarkdownBlocks("| Name | Share |\n|:---|---:|\n"
                                      "| *Acme* | 40% |\n| Beta |\n");
    assert(blocks.size() == 1);
    assert(blocks[0].kind == BlockKind::Table);
    assert(blocks[0].headers.size() == 2);
    assert(blocks[0].headers[1] == "Share");
    assert(blocks[0].rows.size() == 2);
    assert(blocks[0].rows[0][0] == "Acme");
    assert(blocks[0].rows[1].size() == 1);
  }

  {
    // Without a separator row the pipes are plain text.
    auto blocks = ParseMarkdownBlocks("| a | b |\n| c | d |\n");
    assert(blocks.size() == 1);
    assert(blocks[0].kind == BlockKind::Paragraph);
  }

  {
    auto blocks = ParseMarkdownBlocks("Intro\n\n---\n\n```\ncode line\n"
                                      "  indented\n```\nAfter");
    assert(blocks.size() == 3);
    assert(blocks[0].text == "Intro");
    assert(blocks[1].kind == BlockKind::Paragraph);
    assert(blocks[1].text == "code line\n  indented");
    assert(blocks[2].text == "After");
  }

  {
    auto blocks = ParseMarkdownBlocks("Overview\n========\n> quoted text\n");
    assert(blocks.size() == 2);
    assert(blocks[0].kind == BlockKind::Heading1);
    assert(blocks[0].text == "Overview");
    assert(blocks[1].text == "quoted text");
  }

  assert(StripInlineMarkdown("See [the site](http://x.y) now") ==
         "See the site now");
  assert(StripInlineMarkdown("snake_case and _em_ `code`") ==
         "snake_case and em code");
  assert(StripInlineMarkdown("a<br/>b &amp; c") == "a b & c");
  assert(StripInlineMarkdown("\\*literal\\*") == "*literal*");
  assert(ParseMarkdownBlocks("").empty());
  assert(ParseMarkdownBlocks("\n\n   \n").empty());
  return 0;
}
