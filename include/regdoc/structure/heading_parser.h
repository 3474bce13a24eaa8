#pragma once

#include <regdoc/config/engine_config.h>

#include <optional>
#include <string>
#include <string_view>

namespace regdoc::structure {

enum class HeadingKind {
    Numeric,  // 2.1.4
    Chapter,  // 第六章
    Section,  // 第三节
    Article,  // 第十二条
    Appendix, // 附录A
};

struct HeadingMatch {
    HeadingKind kind = HeadingKind::Numeric;
    std::string sectionNumber;
    int level = 1;
    // Number of dotted components, 1 for the CJK markers
    int components = 1;
    // Everything after the marker, trimmed; may span several lines
    std::string text;
};

struct TitleSplit {
    std::string title;
    std::string directContent;
};

/**
 * @brief Recognises chapter headings and splits inline body text off them
 */
class HeadingParser {
public:
    explicit HeadingParser(StructureConfig config = {});

    std::optional<HeadingMatch> parse(std::string_view content) const;

    /**
     * @brief Split heading text into title and direct content
     *
     * Text up to the threshold on one line is all title. Longer text is cut at
     * the first sentence delimiter or at maxTitleChars; text opening with a
     * body-text starter word (根据, 按照, ...) has no title at all.
     */
    TitleSplit splitTitle(std::string_view text) const;

private:
    TitleSplit splitLong(std::u32string_view text) const;

    StructureConfig config_;
};

} // namespace regdoc::structure
