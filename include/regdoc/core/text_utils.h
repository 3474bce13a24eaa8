#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace regdoc::text {

// Decode UTF-8 into code points. Invalid byte sequences become U+FFFD.
std::u32string decodeUtf8(std::string_view input);

std::string encodeUtf8(char32_t cp);
std::string encodeUtf8(std::u32string_view input);

// Number of code points in a UTF-8 string.
size_t codepointCount(std::string_view input);

// First maxChars code points of input, never splitting a sequence.
std::string truncateCodepoints(std::string_view input, size_t maxChars);

// Trim ASCII whitespace and the ideographic space U+3000.
std::string trim(std::string_view input);
std::u32string trim(std::u32string_view input);

bool isWhitespace(char32_t cp);

// CJK unified ideographs (basic block plus extension A).
bool isCjk(char32_t cp);

// Map full-width ASCII variants (U+FF01..U+FF5E) and U+3000 to half width.
std::string toHalfWidth(std::string_view input);

// Parse a Chinese numeral (一, 十二, 二十三, 一百零五) or a run of ASCII digits.
// Returns nullopt for empty input or characters outside the numeral set.
std::optional<int> parseChineseNumber(std::u32string_view input);
std::optional<int> parseChineseNumber(std::string_view input);

// ASCII digit or a character parseChineseNumber understands.
bool isNumeralChar(char32_t cp);

// Collapse newlines and runs of whitespace into single spaces.
std::string collapseWhitespace(std::string_view input);

} // namespace regdoc::text
