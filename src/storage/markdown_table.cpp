#include <regdoc/core/text_utils.h>
#include <regdoc/storage/markdown_table.h>

#include <sstream>

namespace regdoc::markdown {

namespace {

std::string_view trimView(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in{std::string(text)};
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool isLabelChar(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || (cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z') ||
           cp == U'-' || cp == U'.' || cp == U'－' || cp == U'—' || cp == U'–';
}

} // namespace

bool isTableLine(std::string_view line) {
    auto t = trimView(line);
    return !t.empty() && t.front() == '|';
}

bool isSeparatorLine(std::string_view line) {
    auto t = trimView(line);
    if (t.empty() || t.front() != '|') {
        return false;
    }
    bool sawDash = false;
    for (char c : t) {
        if (c == '-') {
            sawDash = true;
        } else if (c != '|' && c != ':' && c != ' ' && c != '\t') {
            return false;
        }
    }
    return sawDash;
}

int columnCount(std::string_view line) {
    auto t = trimView(line);
    int pipes = 0;
    char prev = '\0';
    for (char c : t) {
        if (c == '|' && prev != '\\') {
            ++pipes;
        }
        prev = c;
    }
    return pipes > 0 ? pipes - 1 : 0;
}

std::vector<std::string> splitCells(std::string_view line) {
    auto t = trimView(line);
    if (!t.empty() && t.front() == '|') {
        t.remove_prefix(1);
    }
    if (!t.empty() && t.back() == '|') {
        t.remove_suffix(1);
    }
    std::vector<std::string> cells;
    std::string current;
    char prev = '\0';
    for (char c : t) {
        if (c == '|' && prev != '\\') {
            cells.push_back(text::trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
        prev = c;
    }
    cells.push_back(text::trim(current));
    return cells;
}

MarkdownTable parseTable(std::string_view markdown) {
    MarkdownTable table;
    auto lines = splitLines(markdown);

    size_t i = 0;
    while (i < lines.size() && !isTableLine(lines[i])) {
        if (!trimView(lines[i]).empty()) {
            table.preamble.push_back(lines[i]);
        }
        ++i;
    }

    std::vector<std::string> tableLines;
    for (; i < lines.size(); ++i) {
        if (isTableLine(lines[i])) {
            tableLines.push_back(lines[i]);
        } else if (!trimView(lines[i]).empty()) {
            table.trailer.push_back(lines[i]);
        }
    }

    // Header rows are everything up to the first separator; a separator deep in
    // the table (past the third row) is treated as data.
    size_t sepIndex = tableLines.size();
    for (size_t k = 0; k < tableLines.size() && k < 3; ++k) {
        if (isSeparatorLine(tableLines[k])) {
            sepIndex = k;
            break;
        }
    }

    if (sepIndex == tableLines.size()) {
        table.rows = std::move(tableLines);
        return table;
    }
    table.header.assign(tableLines.begin(), tableLines.begin() + static_cast<long>(sepIndex) + 1);
    table.rows.assign(tableLines.begin() + static_cast<long>(sepIndex) + 1, tableLines.end());
    return table;
}

void MarkdownTable::append(const MarkdownTable& continuation) {
    rows.insert(rows.end(), continuation.rows.begin(), continuation.rows.end());
    trailer.insert(trailer.end(), continuation.trailer.begin(), continuation.trailer.end());
}

int MarkdownTable::columnCount() const {
    if (!header.empty()) {
        return markdown::columnCount(header.front());
    }
    if (!rows.empty()) {
        return markdown::columnCount(rows.front());
    }
    return 0;
}

std::vector<std::string> MarkdownTable::headerCells() const {
    if (header.size() < 2) {
        return {};
    }
    return splitCells(header.front());
}

std::string MarkdownTable::render() const {
    std::string out;
    auto append = [&out](const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            if (!out.empty()) {
                out += '\n';
            }
            out += line;
        }
    };
    append(preamble);
    append(header);
    append(rows);
    append(trailer);
    return out;
}

std::optional<std::string> extractTableLabel(std::string_view textIn) {
    auto cps = text::trim(text::decodeUtf8(textIn));
    size_t pos = 0;
    std::u32string label;
    if (pos < cps.size() && cps[pos] == U'附') {
        label.push_back(U'附');
        ++pos;
    }
    if (pos >= cps.size() || cps[pos] != U'表') {
        return std::nullopt;
    }
    label.push_back(U'表');
    ++pos;
    while (pos < cps.size() && text::isWhitespace(cps[pos])) {
        ++pos;
    }
    size_t start = label.size();
    while (pos < cps.size() && isLabelChar(cps[pos])) {
        char32_t cp = cps[pos];
        if (cp == U'－' || cp == U'—' || cp == U'–') {
            cp = U'-';
        }
        label.push_back(cp);
        ++pos;
    }
    while (label.size() > start && (label.back() == U'.' || label.back() == U'-')) {
        label.pop_back();
    }
    if (label.size() == start) {
        return std::nullopt;
    }
    return text::encodeUtf8(label);
}

} // namespace regdoc::markdown
