#include <regdoc/core/errors.h>
#include <regdoc/core/text_utils.h>
#include <regdoc/resolve/annotation_lookup.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>

namespace regdoc::resolve {

namespace {

constexpr std::u32string_view kNotePrefix = U"注";
constexpr std::array<std::u32string_view, 2> kPlanPrefixes = {U"方案", U"选项"};
constexpr std::u32string_view kHeavenlyStems = U"甲乙丙丁戊己庚辛壬癸";

bool isOpening(char32_t cp) {
    switch (cp) {
        case U'(':
        case U'[':
        case U'【':
        case U'〔':
        case U'「':
        case U'『':
            return true;
        default:
            return false;
    }
}

bool isClosing(char32_t cp) {
    switch (cp) {
        case U')':
        case U']':
        case U'】':
        case U'〕':
        case U'」':
        case U'』':
        case U':':
        case U'.':
        case U',':
        case U';':
        case U'。':
        case U'、':
            return true;
        default:
            return false;
    }
}

bool startsWith(std::u32string_view text, std::u32string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

// ①..⑳, ⑴..⒇ and ❶..❿
std::optional<int> circledNumber(char32_t cp) {
    if (cp >= 0x2460 && cp <= 0x2473) {
        return static_cast<int>(cp - 0x2460) + 1;
    }
    if (cp >= 0x2474 && cp <= 0x2487) {
        return static_cast<int>(cp - 0x2474) + 1;
    }
    if (cp >= 0x2776 && cp <= 0x277F) {
        return static_cast<int>(cp - 0x2776) + 1;
    }
    return std::nullopt;
}

std::optional<int> noteNumber(std::u32string_view rest) {
    if (rest.size() == 1) {
        if (auto circled = circledNumber(rest[0])) {
            return circled;
        }
    }
    return text::parseChineseNumber(rest);
}

std::optional<char32_t> planLetter(std::u32string_view rest) {
    if (rest.size() != 1) {
        return std::nullopt;
    }
    char32_t cp = rest[0];
    if (cp >= U'a' && cp <= U'z') {
        return static_cast<char32_t>(cp - U'a' + U'A');
    }
    if (cp >= U'A' && cp <= U'Z') {
        return cp;
    }
    if (auto pos = kHeavenlyStems.find(cp); pos != std::u32string_view::npos) {
        return static_cast<char32_t>(U'A' + pos);
    }
    return std::nullopt;
}

} // namespace

std::string normalizeAnnotationId(std::string_view raw) {
    std::u32string cps;
    for (char32_t cp : text::decodeUtf8(text::toHalfWidth(raw))) {
        if (!text::isWhitespace(cp)) {
            cps.push_back(cp);
        }
    }

    size_t begin = 0;
    size_t end = cps.size();
    while (begin < end && isOpening(cps[begin])) {
        ++begin;
    }
    while (end > begin && isClosing(cps[end - 1])) {
        --end;
    }
    std::u32string_view id(cps.data() + begin, end - begin);

    if (startsWith(id, kNotePrefix) && id.size() > kNotePrefix.size()) {
        if (auto n = noteNumber(id.substr(kNotePrefix.size()))) {
            return text::encodeUtf8(kNotePrefix) + std::to_string(*n);
        }
    }
    for (auto prefix : kPlanPrefixes) {
        if (startsWith(id, prefix)) {
            if (auto letter = planLetter(id.substr(prefix.size()))) {
                std::u32string out(prefix);
                out.push_back(*letter);
                return text::encodeUtf8(out);
            }
        }
    }

    std::u32string out(id);
    for (auto& cp : out) {
        if (cp >= U'a' && cp <= U'z') {
            cp = cp - U'a' + U'A';
        }
    }
    return text::encodeUtf8(out);
}

AnnotationKind classifyAnnotation(std::string_view normalizedId) {
    const auto cps = text::decodeUtf8(normalizedId);
    std::u32string_view id(cps);
    if (startsWith(id, kNotePrefix) && id.size() > 1 && id[1] >= U'0' && id[1] <= U'9') {
        return AnnotationKind::Note;
    }
    for (auto prefix : kPlanPrefixes) {
        if (startsWith(id, prefix)) {
            return AnnotationKind::Plan;
        }
    }
    return AnnotationKind::Any;
}

AnnotationLookup::AnnotationLookup(const storage::PageStore& store) : store_(store) {}

std::optional<Annotation> AnnotationLookup::findOnPage(const PageDocument& page,
                                                       const std::string& normalizedId) {
    for (const auto& annotation : page.annotations) {
        bool match = normalizeAnnotationId(annotation.annotationId) == normalizedId;
        if (!match && !annotation.normalizedId.empty()) {
            match = normalizeAnnotationId(annotation.normalizedId) == normalizedId;
        }
        if (match) {
            Annotation found = annotation;
            found.normalizedId = normalizedId;
            if (found.pageNum == 0) {
                found.pageNum = page.pageNum;
            }
            return found;
        }
    }
    return std::nullopt;
}

Result<Annotation> AnnotationLookup::lookup(std::string_view regId, std::string_view rawId,
                                            std::optional<int> pageHint) const {
    const auto target = normalizeAnnotationId(rawId);
    if (target.empty()) {
        return errors::invalidArgument("Empty annotation id");
    }

    auto pageNums = store_.pageNumbers(regId);
    if (!pageNums) {
        return pageNums.error();
    }

    if (pageHint) {
        auto page = store_.loadPage(regId, *pageHint);
        if (page) {
            if (auto found = findOnPage(page.value(), target)) {
                return *found;
            }
        } else if (page.error().code != ErrorCode::PageNotFound) {
            return page.error();
        } else {
            spdlog::debug("Annotation hint page {} missing in {}", *pageHint, regId);
        }
    }

    for (int pageNum : pageNums.value()) {
        if (pageHint && *pageHint == pageNum) {
            continue;
        }
        auto page = store_.loadPage(regId, pageNum);
        if (!page) {
            if (page.error().code == ErrorCode::PageNotFound) {
                spdlog::warn("Page {} of {} missing during annotation scan", pageNum, regId);
                continue;
            }
            return page.error();
        }
        if (auto found = findOnPage(page.value(), target)) {
            return *found;
        }
    }

    return errors::annotationNotFound(regId, rawId);
}

Result<std::vector<Annotation>> AnnotationLookup::search(std::string_view regId,
                                                         std::string_view pattern,
                                                         AnnotationKind kind) const {
    auto pageNums = store_.pageNumbers(regId);
    if (!pageNums) {
        return pageNums.error();
    }

    std::vector<Annotation> matches;
    for (int pageNum : pageNums.value()) {
        auto page = store_.loadPage(regId, pageNum);
        if (!page) {
            if (page.error().code == ErrorCode::PageNotFound) {
                continue;
            }
            return page.error();
        }
        for (const auto& annotation : page.value().annotations) {
            Annotation item = annotation;
            item.normalizedId = normalizeAnnotationId(annotation.annotationId);
            if (item.pageNum == 0) {
                item.pageNum = pageNum;
            }
            if (kind != AnnotationKind::Any && classifyAnnotation(item.normalizedId) != kind) {
                continue;
            }
            if (!pattern.empty() && item.content.find(pattern) == std::string::npos &&
                item.annotationId.find(pattern) == std::string::npos) {
                continue;
            }
            matches.push_back(std::move(item));
        }
    }
    spdlog::debug("Annotation search in {} matched {}", regId, matches.size());
    return matches;
}

} // namespace regdoc::resolve
