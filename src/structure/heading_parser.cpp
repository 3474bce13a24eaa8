#include <regdoc/core/text_utils.h>
#include <regdoc/structure/heading_parser.h>

#include <algorithm>
#include <array>

namespace regdoc::structure {

namespace {

constexpr std::array<std::u32string_view, 25> kDirectContentStarters = {
    U"根据", U"按照", U"当", U"在", U"为", U"是",   U"有",   U"对于", U"如果",
    U"若",   U"应",   U"需", U"可", U"不", U"与",   U"和",   U"或",   U"包括",
    U"其中", U"主要", U"具体", U"详见", U"参见", U"见", U"凡",
};

bool isAsciiDigit(char32_t cp) {
    return cp >= U'0' && cp <= U'9';
}

bool isTitleDelimiter(char32_t cp) {
    return cp == U'，' || cp == U'。' || cp == U'；' || cp == U'：' || cp == U'\n';
}

bool startsWith(std::u32string_view text, std::u32string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace

HeadingParser::HeadingParser(StructureConfig config) : config_(config) {}

std::optional<HeadingMatch> HeadingParser::parse(std::string_view content) const {
    auto decoded = text::decodeUtf8(content);
    // Markdown heading markers ("## 2.1 ...")
    size_t hashes = 0;
    while (hashes < decoded.size() && decoded[hashes] == U'#') {
        ++hashes;
    }
    const auto cps = text::trim(std::u32string_view(decoded).substr(hashes));
    if (cps.empty()) {
        return std::nullopt;
    }

    HeadingMatch match;
    size_t pos = 0;

    if (cps[0] == U'第') {
        pos = 1;
        while (pos < cps.size() && text::isNumeralChar(cps[pos])) {
            ++pos;
        }
        if (pos == 1 || pos >= cps.size()) {
            return std::nullopt;
        }
        if (!text::parseChineseNumber(cps.substr(1, pos - 1))) {
            return std::nullopt;
        }
        switch (cps[pos]) {
            case U'章':
                match.kind = HeadingKind::Chapter;
                match.level = 1;
                break;
            case U'节':
                match.kind = HeadingKind::Section;
                match.level = 2;
                break;
            case U'条':
                match.kind = HeadingKind::Article;
                match.level = 3;
                break;
            default:
                return std::nullopt;
        }
        ++pos;
        if (match.kind == HeadingKind::Article && pos < cps.size() &&
            !text::isWhitespace(cps[pos])) {
            // 第十二条规定的... cites an article instead of opening one
            return std::nullopt;
        }
        match.sectionNumber = text::encodeUtf8(cps.substr(0, pos));
    } else if (startsWith(cps, U"附录")) {
        pos = 2;
        size_t idStart = pos;
        while (pos < cps.size() &&
               ((cps[pos] >= U'A' && cps[pos] <= U'Z') || text::isNumeralChar(cps[pos]))) {
            ++pos;
        }
        if (pos == idStart && pos < cps.size() && !text::isWhitespace(cps[pos])) {
            // 附录中规定的... is body text, not an appendix heading
            return std::nullopt;
        }
        match.kind = HeadingKind::Appendix;
        match.level = 1;
        match.sectionNumber = text::encodeUtf8(cps.substr(0, pos));
    } else if (isAsciiDigit(cps[0])) {
        int components = 0;
        while (true) {
            size_t digitsStart = pos;
            while (pos < cps.size() && isAsciiDigit(cps[pos])) {
                ++pos;
            }
            size_t digits = pos - digitsStart;
            if (digits == 0 || digits > 3) {
                return std::nullopt;
            }
            ++components;
            if (pos + 1 < cps.size() && cps[pos] == U'.' && isAsciiDigit(cps[pos + 1])) {
                ++pos;
                continue;
            }
            break;
        }
        std::u32string number(cps.substr(0, pos));
        if (pos < cps.size() && cps[pos] == U'.') {
            ++pos;
        }
        if (pos < cps.size()) {
            bool spaced = text::isWhitespace(cps[pos]);
            bool glued = components >= 2 && text::isCjk(cps[pos]);
            if (!spaced && !glued) {
                return std::nullopt;
            }
        }
        if (components > config_.maxLevel) {
            return std::nullopt;
        }
        match.kind = HeadingKind::Numeric;
        match.components = components;
        match.level = components;
        match.sectionNumber = text::encodeUtf8(number);
    } else {
        return std::nullopt;
    }

    match.text = text::encodeUtf8(text::trim(cps.substr(pos)));
    return match;
}

TitleSplit HeadingParser::splitTitle(std::string_view textIn) const {
    const auto cps = text::trim(text::decodeUtf8(textIn));
    TitleSplit split;
    if (cps.empty()) {
        return split;
    }

    auto newline = cps.find(U'\n');
    if (newline == std::u32string::npos) {
        if (cps.size() <= config_.titleLengthThreshold) {
            split.title = text::encodeUtf8(cps);
            return split;
        }
        return splitLong(cps);
    }

    // Multi-line heading: a short first line is the title, the rest is body
    auto firstLine = text::trim(cps.substr(0, newline));
    auto rest = text::trim(cps.substr(newline + 1));
    bool starter = false;
    for (auto word : kDirectContentStarters) {
        if (startsWith(firstLine, word)) {
            starter = true;
            break;
        }
    }
    if (!starter && firstLine.size() >= config_.minTitleChars &&
        firstLine.size() <= config_.maxTitleChars) {
        split.title = text::encodeUtf8(firstLine);
        split.directContent = text::encodeUtf8(rest);
        return split;
    }
    return splitLong(cps);
}

TitleSplit HeadingParser::splitLong(std::u32string_view cps) const {
    TitleSplit split;
    for (auto word : kDirectContentStarters) {
        if (startsWith(cps, word)) {
            split.directContent = text::encodeUtf8(cps);
            return split;
        }
    }

    size_t cut = std::min(cps.size(), config_.maxTitleChars);
    for (size_t i = 1; i < cut; ++i) {
        if (isTitleDelimiter(cps[i])) {
            cut = i;
            break;
        }
    }

    auto candidate = text::trim(cps.substr(0, cut));
    if (candidate.size() < config_.minTitleChars || candidate.size() > config_.maxTitleChars) {
        split.directContent = text::encodeUtf8(cps);
        return split;
    }

    auto rest = cps.substr(cut);
    while (!rest.empty() && (isTitleDelimiter(rest.front()) || text::isWhitespace(rest.front()))) {
        rest.remove_prefix(1);
    }
    split.title = text::encodeUtf8(candidate);
    split.directContent = text::encodeUtf8(text::trim(rest));
    return split;
}

} // namespace regdoc::structure
