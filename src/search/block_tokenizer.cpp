#include <regdoc/core/text_utils.h>
#include <regdoc/search/block_tokenizer.h>

#include <algorithm>
#include <cctype>

namespace regdoc::search {

namespace {

bool isWordChar(char32_t cp) {
    return (cp >= U'a' && cp <= U'z') || (cp >= U'0' && cp <= U'9');
}

std::u32string foldForMatching(std::string_view text) {
    auto cps = text::decodeUtf8(text::toHalfWidth(text));
    for (auto& cp : cps) {
        if (cp < 0x80) {
            cp = static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
        }
    }
    return cps;
}

} // namespace

std::vector<std::string> tokenizeForIndex(std::string_view input) {
    const auto cps = foldForMatching(input);
    std::vector<std::string> tokens;

    size_t i = 0;
    while (i < cps.size()) {
        if (text::isCjk(cps[i])) {
            size_t start = i;
            while (i < cps.size() && text::isCjk(cps[i])) {
                ++i;
            }
            const size_t len = i - start;
            if (len == 1) {
                tokens.push_back(text::encodeUtf8(cps[start]));
                continue;
            }
            for (size_t k = start; k + 1 < i; ++k) {
                tokens.push_back(text::encodeUtf8(std::u32string_view(cps).substr(k, 2)));
            }
        } else if (isWordChar(cps[i])) {
            size_t start = i;
            while (i < cps.size() && isWordChar(cps[i])) {
                ++i;
            }
            tokens.push_back(text::encodeUtf8(std::u32string_view(cps).substr(start, i - start)));
        } else {
            ++i;
        }
    }
    return tokens;
}

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        if (!out.empty()) {
            out += ' ';
        }
        out += token;
    }
    return out;
}

std::string buildMatchExpression(const std::vector<std::string>& tokens) {
    std::vector<std::string> unique;
    for (const auto& token : tokens) {
        if (std::find(unique.begin(), unique.end(), token) == unique.end()) {
            unique.push_back(token);
        }
    }

    std::string expr;
    for (const auto& token : unique) {
        if (!expr.empty()) {
            expr += " OR ";
        }
        // Tokens never contain quotes; they are letters, digits or CJK only
        expr += '"';
        expr += token;
        expr += '"';
        auto cps = text::decodeUtf8(token);
        if (cps.size() == 1 && text::isCjk(cps[0])) {
            expr += '*';
        }
    }
    return expr;
}

std::string extractSnippet(std::string_view content, const std::vector<std::string>& tokens,
                           size_t contextChars) {
    const auto original = text::decodeUtf8(content);
    const auto folded = foldForMatching(content);

    size_t best = std::u32string::npos;
    size_t bestLen = 0;
    for (const auto& token : tokens) {
        auto needle = text::decodeUtf8(token);
        if (needle.empty()) {
            continue;
        }
        auto pos = folded.find(needle);
        if (pos != std::u32string::npos && pos < best) {
            best = pos;
            bestLen = needle.size();
        }
    }

    // Folding maps one code point to one code point, so offsets line up
    size_t start = 0;
    size_t end = std::min(original.size(), contextChars * 2);
    if (best != std::u32string::npos && best < original.size()) {
        start = best > contextChars ? best - contextChars : 0;
        end = std::min(original.size(), best + bestLen + contextChars);
    }

    std::string snippet;
    if (start > 0) {
        snippet += "...";
    }
    snippet += text::collapseWhitespace(
        text::encodeUtf8(std::u32string_view(original).substr(start, end - start)));
    if (end < original.size()) {
        snippet += "...";
    }
    return snippet;
}

} // namespace regdoc::search
