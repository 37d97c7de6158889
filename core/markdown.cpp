#include "markdown.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "stringutils.h"

namespace {
using StringUtils::Trim;

bool IsWordChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || uc >= 0x80;
}

// Split a markdown table row into individual cells
std::vector<std::string> SplitTableRow(const std::string &line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, '|')) {
        cells.push_back(Trim(cell));
    }
    if (!cells.empty() && cells.front().empty())
        cells.erase(cells.begin());
    if (!cells.empty() && cells.back().empty())
        cells.pop_back();
    return cells;
}

// Check if a row is a markdown table separator (--- or :---: etc)
bool IsSeparatorRow(const std::vector<std::string> &cells) {
    if (cells.empty())
        return false;
    for (const auto &c : cells) {
        if (c.empty())
            return false;
        if (c.find_first_not_of("-: ") != std::string::npos)
            return false;
        if (c.find('-') == std::string::npos)
            return false;
    }
    return true;
}

bool IsTableLine(const std::string &trimmed) {
    return !trimmed.empty() && trimmed.front() == '|' &&
           trimmed.find('|', 1) != std::string::npos;
}

// Returns the heading level of an ATX heading line, 0 otherwise.
int HeadingLevel(const std::string &trimmed, std::string &text) {
    size_t level = 0;
    while (level < trimmed.size() && trimmed[level] == '#')
        ++level;
    if (level == 0 || level > 6)
        return 0;
    if (level < trimmed.size() && trimmed[level] != ' ' && trimmed[level] != '\t')
        return 0;
    text = Trim(trimmed.substr(level));
    // Optional closing sequence: "## Title ##"
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '#')
        --end;
    if (end == 0)
        text.clear();
    else if (end < text.size() && (text[end - 1] == ' ' || text[end - 1] == '\t'))
        text = Trim(text.substr(0, end));
    return static_cast<int>(level);
}

bool IsRuleLine(const std::string &trimmed) {
    char marker = 0;
    int count = 0;
    for (char c : trimmed) {
        if (c == ' ' || c == '\t')
            continue;
        if (c != '-' && c != '*' && c != '_')
            return false;
        if (marker == 0)
            marker = c;
        else if (c != marker)
            return false;
        ++count;
    }
    return count >= 3;
}

bool IsSetextUnderline(const std::string &trimmed, char marker) {
    if (trimmed.empty())
        return false;
    return trimmed.find_first_not_of(marker) == std::string::npos;
}

bool ParseListItem(const std::string &trimmed, bool &ordered, int &number,
                   std::string &text) {
    if (trimmed.empty())
        return false;
    char first = trimmed.front();
    if (first == '-' || first == '*' || first == '+') {
        if (trimmed.size() > 1 && trimmed[1] != ' ' && trimmed[1] != '\t')
            return false;
        ordered = false;
        number = 1;
        text = Trim(trimmed.substr(1));
        return true;
    }
    size_t digits = 0;
    while (digits < trimmed.size() &&
           std::isdigit(static_cast<unsigned char>(trimmed[digits])))
        ++digits;
    if (digits == 0 || digits > 9 || digits >= trimmed.size())
        return false;
    char delimiter = trimmed[digits];
    if (delimiter != '.' && delimiter != ')')
        return false;
    if (digits + 1 < trimmed.size() && trimmed[digits + 1] != ' ' &&
        trimmed[digits + 1] != '\t')
        return false;
    ordered = true;
    number = std::stoi(trimmed.substr(0, digits));
    text = Trim(trimmed.substr(digits + 1));
    return true;
}

bool IsIndented(const std::string &line) {
    return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

std::string StripQuoteMarkers(const std::string &trimmed) {
    size_t pos = 0;
    while (pos < trimmed.size() && (trimmed[pos] == '>' || trimmed[pos] == ' '))
        ++pos;
    return trimmed.substr(pos);
}

std::string DecodeEntities(const std::string &text) {
    static const std::pair<const char *, const char *> kEntities[] = {
        {"&nbsp;", " "}, {"&lt;", "<"},    {"&gt;", ">"},
        {"&quot;", "\""}, {"&#39;", "'"},  {"&apos;", "'"},
        {"&amp;", "&"}};
    std::string out = text;
    for (const auto &[entity, replacement] : kEntities)
        out = StringUtils::ReplaceAll(out, entity, replacement);
    return out;
}

std::string JoinLines(const std::vector<std::string> &lines, char separator) {
    std::string out;
    for (const auto &line : lines) {
        if (!out.empty())
            out += separator;
        out += line;
    }
    return out;
}
} // namespace

std::string StripInlineMarkdown(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    for (size_t i = 0; i < n; ++i) {
        char c = text[i];
        char next = i + 1 < n ? text[i + 1] : '\0';
        if (c == '\\' && std::ispunct(static_cast<unsigned char>(next))) {
            out += next;
            ++i;
            continue;
        }
        if (c == '!' && next == '[')
            continue;
        if (c == '[') {
            size_t close = text.find(']', i + 1);
            if (close != std::string::npos && close + 1 < n &&
                text[close + 1] == '(') {
                size_t paren = text.find(')', close + 2);
                if (paren != std::string::npos) {
                    out += StripInlineMarkdown(text.substr(i + 1, close - i - 1));
                    i = paren;
                    continue;
                }
            }
            out += c;
            continue;
        }
        if (c == '<' && (std::isalpha(static_cast<unsigned char>(next)) ||
                         next == '/')) {
            size_t close = text.find('>', i + 1);
            if (close != std::string::npos) {
                std::string tag = StringUtils::ToLowerCopy(text.substr(i, close - i + 1));
                if (tag.rfind("<br", 0) == 0 && !out.empty() && out.back() != ' ')
                    out += ' ';
                i = close;
                continue;
            }
        }
        if (c == '`' || c == '*')
            continue;
        if (c == '~' && next == '~') {
            ++i;
            continue;
        }
        if (c == '_') {
            char prev = i > 0 ? text[i - 1] : '\0';
            if (!(IsWordChar(prev) && IsWordChar(next)))
                continue;
        }
        out += c;
    }
    return DecodeEntities(out);
}

std::vector<Block> ParseMarkdownBlocks(const std::string &markdown) {
    std::istringstream in(markdown);
    std::vector<Block> blocks;
    std::string line;

    std::vector<std::string> paragraph;
    std::vector<std::string> listItems;
    bool inList = false;
    bool listOrdered = false;
    int listStart = 1;
    bool blankInList = false;
    std::vector<std::string> tableLines;
    bool inFence = false;
    std::string fenceMarker;
    std::vector<std::string> fenceLines;

    auto flushParagraph = [&]() {
        if (paragraph.empty())
            return;
        std::string text = Trim(StripInlineMarkdown(JoinLines(paragraph, ' ')));
        if (!text.empty())
            blocks.push_back(Block::Paragraph(text));
        paragraph.clear();
    };

    auto flushList = [&]() {
        if (!inList)
            return;
        std::vector<std::string> items;
        for (const auto &item : listItems)
            items.push_back(Trim(StripInlineMarkdown(item)));
        blocks.push_back(Block::List(listOrdered, std::move(items), listStart));
        listItems.clear();
        inList = false;
        blankInList = false;
    };

    auto flushTable = [&]() {
        if (tableLines.empty())
            return;
        std::vector<std::vector<std::string>> rows;
        for (const auto &raw : tableLines)
            rows.push_back(SplitTableRow(raw));
        if (rows.size() >= 2 && IsSeparatorRow(rows[1])) {
            std::vector<std::string> headers;
            for (const auto &h : rows[0])
                headers.push_back(Trim(StripInlineMarkdown(h)));
            std::vector<std::vector<std::string>> body;
            for (size_t r = 2; r < rows.size(); ++r) {
                if (IsSeparatorRow(rows[r]))
                    continue;
                std::vector<std::string> cells;
                for (const auto &c : rows[r])
                    cells.push_back(Trim(StripInlineMarkdown(c)));
                body.push_back(std::move(cells));
            }
            blocks.push_back(Block::Table(std::move(headers), std::move(body)));
        } else {
            paragraph.insert(paragraph.end(), tableLines.begin(), tableLines.end());
            flushParagraph();
        }
        tableLines.clear();
    };

    auto flushFence = [&]() {
        std::string text = JoinLines(fenceLines, '\n');
        if (!Trim(text).empty())
            blocks.push_back(Block::Paragraph(text));
        fenceLines.clear();
        inFence = false;
    };

    auto flushAll = [&]() {
        flushTable();
        flushParagraph();
        flushList();
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        std::string trimmed = Trim(line);

        if (inFence) {
            if (trimmed.rfind(fenceMarker, 0) == 0)
                flushFence();
            else
                fenceLines.push_back(line);
            continue;
        }
        if (trimmed.rfind("```", 0) == 0 || trimmed.rfind("~~~", 0) == 0) {
            flushAll();
            inFence = true;
            fenceMarker = trimmed.substr(0, 3);
            continue;
        }

        if (IsTableLine(trimmed)) {
            flushParagraph();
            flushList();
            tableLines.push_back(trimmed);
            continue;
        }
        flushTable();

        if (trimmed.empty()) {
            flushParagraph();
            if (inList)
                blankInList = true;
            continue;
        }

        std::string text;
        int level = HeadingLevel(trimmed, text);
        if (level > 0) {
            flushAll();
            text = Trim(StripInlineMarkdown(text));
            if (!text.empty())
                blocks.push_back(Block::Heading(level, text));
            continue;
        }

        if (!paragraph.empty() && (IsSetextUnderline(trimmed, '=') ||
                                   IsSetextUnderline(trimmed, '-'))) {
            std::string heading =
                Trim(StripInlineMarkdown(JoinLines(paragraph, ' ')));
            paragraph.clear();
            if (!heading.empty())
                blocks.push_back(Block::Heading(trimmed.front() == '=' ? 1 : 2,
                                                heading));
            continue;
        }

        if (IsRuleLine(trimmed)) {
            flushParagraph();
            flushList();
            continue;
        }

        bool ordered = false;
        int number = 1;
        if (ParseListItem(trimmed, ordered, number, text)) {
            flushParagraph();
            if (inList && ordered != listOrdered)
                flushList();
            if (!inList) {
                inList = true;
                listOrdered = ordered;
                listStart = number;
            }
            listItems.push_back(text);
            blankInList = false;
            continue;
        }

        std::string content = trimmed.front() == '>' ? StripQuoteMarkers(trimmed)
                                                     : trimmed;
        if (inList) {
            if (!listItems.empty() && (!blankInList || IsIndented(line))) {
                listItems.back() += " " + content;
                continue;
            }
            flushList();
        }
        if (!content.empty())
            paragraph.push_back(content);
    }

    if (inFence)
        flushFence();
    flushAll();
    return blocks;
}
