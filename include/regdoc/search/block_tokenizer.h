#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::search {

/**
 * Tokenise text for the keyword index.
 *
 * CJK runs become overlapping bigrams (a lone CJK character stays a unigram),
 * latin letters and digits become lower-cased words. Full-width forms are
 * folded first. Queries go through the same function so both sides agree.
 */
std::vector<std::string> tokenizeForIndex(std::string_view text);

// Space separated tokens as stored in the FTS5 column
std::string joinTokens(const std::vector<std::string>& tokens);

// Quoted tokens joined with OR; a lone CJK character becomes a prefix query
std::string buildMatchExpression(const std::vector<std::string>& tokens);

/**
 * Window of contextChars code points on each side of the first token found in
 * content, with "..." marking cut ends. Falls back to the head of the content.
 */
std::string extractSnippet(std::string_view content, const std::vector<std::string>& tokens,
                           size_t contextChars);

} // namespace regdoc::search
