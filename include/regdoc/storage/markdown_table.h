#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::markdown {

/**
 * @brief A pipe table split into its parts
 *
 * `preamble` holds non-table lines before the first row (usually a caption).
 * `header` holds the rows up to and including the first separator row; it is
 * empty when the table has no separator. `trailer` keeps the non-table lines
 * after the first row, such as a note under the table.
 */
struct MarkdownTable {
    std::vector<std::string> preamble;
    std::vector<std::string> header;
    std::vector<std::string> rows;
    std::vector<std::string> trailer;

    // Append a continuation segment: its data rows and its trailer, not its header
    void append(const MarkdownTable& continuation);

    int columnCount() const;
    std::vector<std::string> headerCells() const;
    std::string render() const;
};

bool isTableLine(std::string_view line);
bool isSeparatorLine(std::string_view line);

// Pipe count of a row minus one
int columnCount(std::string_view line);

// Cell texts of one row, trimmed
std::vector<std::string> splitCells(std::string_view line);

MarkdownTable parseTable(std::string_view markdown);

// Caption label such as "表6-2" or "附表1" found at the start of text
std::optional<std::string> extractTableLabel(std::string_view text);

} // namespace regdoc::markdown
