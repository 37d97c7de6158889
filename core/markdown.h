#pragma once

#include <string>
#include <vector>

#include "block.h"

// Markdown to report blocks.
// Supports ATX and setext headings (levels 3 and deeper become Heading3),
// paragraphs, bullet and numbered lists, pipe tables with a separator row
// and fenced code (kept as a plain paragraph). Horizontal rules are
// dropped and inline markup is reduced to plain text.
std::vector<Block> ParseMarkdownBlocks(const std::string &markdown);

// Removes emphasis markers, inline code ticks, link targets and simple
// HTML tags, and decodes the common HTML entities.
std::string StripInlineMarkdown(const std::string &text);
