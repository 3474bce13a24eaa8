#include <regdoc/core/errors.h>
#include <regdoc/core/text_utils.h>
#include <regdoc/resolve/reference_resolver.h>
#include <regdoc/storage/markdown_table.h>

#include <spdlog/spdlog.h>

#include <climits>

namespace regdoc::resolve {

namespace {

bool isAsciiDigit(char32_t cp) {
    return cp >= U'0' && cp <= U'9';
}

bool isAsciiAlnum(char32_t cp) {
    return isAsciiDigit(cp) || (cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z');
}

std::u32string_view view(const std::u32string& s) {
    return std::u32string_view(s);
}

// 第<numeral><marker>, returning the ordinal and the matched span
std::optional<ParsedReference> findOrdinal(const std::u32string& cps, char32_t marker,
                                           ReferenceType type) {
    for (size_t i = 0; i < cps.size(); ++i) {
        if (cps[i] != U'第') {
            continue;
        }
        size_t j = i + 1;
        while (j < cps.size() && text::isNumeralChar(cps[j])) {
            ++j;
        }
        if (j == i + 1 || j >= cps.size() || cps[j] != marker) {
            continue;
        }
        auto number = text::parseChineseNumber(view(cps).substr(i + 1, j - i - 1));
        if (!number) {
            continue;
        }
        ParsedReference ref;
        ref.type = type;
        ref.number = number;
        ref.target = text::encodeUtf8(view(cps).substr(i, j - i + 1));
        return ref;
    }
    return std::nullopt;
}

std::optional<ParsedReference> findChapter(const std::u32string& cps) {
    // Whichever of 第X章 / 第X节 comes first in the text
    auto chapter = findOrdinal(cps, U'章', ReferenceType::Chapter);
    auto section = findOrdinal(cps, U'节', ReferenceType::Chapter);
    if (section) {
        section->isSectionMarker = true;
    }
    if (chapter && section) {
        auto chapterPos = cps.find(text::decodeUtf8(chapter->target));
        auto sectionPos = cps.find(text::decodeUtf8(section->target));
        return chapterPos <= sectionPos ? chapter : section;
    }
    return chapter ? chapter : section;
}

std::optional<ParsedReference> findTable(const std::u32string& cps) {
    for (size_t i = 0; i < cps.size(); ++i) {
        if (cps[i] != U'表') {
            continue;
        }
        size_t start = (i > 0 && cps[i - 1] == U'附') ? i - 1 : i;
        if (auto label = markdown::extractTableLabel(text::encodeUtf8(view(cps).substr(start)))) {
            ParsedReference ref;
            ref.type = ReferenceType::Table;
            ref.target = *label;
            return ref;
        }
    }
    return std::nullopt;
}

std::optional<ParsedReference> findDottedSection(const std::u32string& cps) {
    for (size_t i = 0; i < cps.size(); ++i) {
        if (!isAsciiDigit(cps[i]) || (i > 0 && (isAsciiDigit(cps[i - 1]) || cps[i - 1] == U'.'))) {
            continue;
        }
        size_t pos = i;
        int components = 0;
        bool valid = true;
        while (true) {
            size_t digitsStart = pos;
            while (pos < cps.size() && isAsciiDigit(cps[pos])) {
                ++pos;
            }
            if (pos - digitsStart == 0 || pos - digitsStart > 3) {
                valid = false;
                break;
            }
            ++components;
            if (pos + 1 < cps.size() && cps[pos] == U'.' && isAsciiDigit(cps[pos + 1])) {
                ++pos;
                continue;
            }
            break;
        }
        if (valid && components >= 2 && components <= 6) {
            ParsedReference ref;
            ref.type = ReferenceType::Section;
            ref.target = text::encodeUtf8(view(cps).substr(i, pos - i));
            return ref;
        }
    }
    return std::nullopt;
}

bool isCircled(char32_t cp) {
    return (cp >= 0x2460 && cp <= 0x2487) || (cp >= 0x2776 && cp <= 0x277F);
}

std::optional<ParsedReference> findAnnotation(const std::u32string& cps) {
    for (size_t i = 0; i < cps.size(); ++i) {
        if (cps[i] == U'注') {
            size_t j = i + 1;
            if (j < cps.size() && isCircled(cps[j])) {
                ++j;
            } else {
                while (j < cps.size() && text::isNumeralChar(cps[j])) {
                    ++j;
                }
            }
            if (j > i + 1) {
                ParsedReference ref;
                ref.type = ReferenceType::Annotation;
                ref.target = text::encodeUtf8(view(cps).substr(i, j - i));
                return ref;
            }
            continue;
        }
        const auto rest = view(cps).substr(i);
        if (rest.substr(0, 2) == U"方案" || rest.substr(0, 2) == U"选项") {
            if (rest.size() > 2 && (isAsciiAlnum(rest[2]) ||
                                    std::u32string_view(U"甲乙丙丁戊己庚辛壬癸").find(rest[2]) !=
                                        std::u32string_view::npos)) {
                if (rest.size() > 3 && isAsciiAlnum(rest[3])) {
                    continue;
                }
                ParsedReference ref;
                ref.type = ReferenceType::Annotation;
                ref.target = text::encodeUtf8(rest.substr(0, 3));
                return ref;
            }
        }
    }
    return std::nullopt;
}

std::optional<ParsedReference> findAppendix(const std::u32string& cps) {
    auto pos = cps.find(U"附录");
    if (pos == std::u32string::npos) {
        return std::nullopt;
    }
    size_t j = pos + 2;
    while (j < cps.size() && (isAsciiAlnum(cps[j]) || text::isNumeralChar(cps[j]))) {
        ++j;
    }
    if (j == pos + 2) {
        return std::nullopt;
    }
    std::u32string target(view(cps).substr(pos, j - pos));
    for (auto& cp : target) {
        if (cp >= U'a' && cp <= U'z') {
            cp = cp - U'a' + U'A';
        }
    }
    ParsedReference ref;
    ref.type = ReferenceType::Appendix;
    ref.target = text::encodeUtf8(target);
    return ref;
}

// 第六章 / 第6章 style section numbers carry their ordinal between 第 and the marker
std::optional<int> markerOrdinal(std::string_view sectionNumber, char32_t marker) {
    auto cps = text::decodeUtf8(sectionNumber);
    if (cps.size() < 3 || cps.front() != U'第' || cps.back() != marker) {
        return std::nullopt;
    }
    return text::parseChineseNumber(std::u32string_view(cps).substr(1, cps.size() - 2));
}

const ChapterNode* findByMarker(const structure::DocumentStructure& structure, char32_t marker,
                                int number) {
    for (const auto& id : structure.nodeOrder()) {
        const auto* node = structure.getNode(id);
        if (node && markerOrdinal(node->sectionNumber, marker) == number) {
            return node;
        }
    }
    return nullptr;
}

std::string sourceFor(std::string_view regId, int pageNum, const std::vector<std::string>& path) {
    if (path.empty()) {
        return fmt::format("{} P{}", regId, pageNum);
    }
    return fmt::format("{} P{} ({})", regId, pageNum, joinChapterPath(path));
}

std::string makePreview(std::string_view content) {
    return text::truncateCodepoints(text::collapseWhitespace(content),
                                    ReferenceResolver::kPreviewChars);
}

} // namespace

const char* toString(ReferenceType type) {
    switch (type) {
        case ReferenceType::Chapter:
            return "chapter";
        case ReferenceType::Table:
            return "table";
        case ReferenceType::Section:
            return "section";
        case ReferenceType::Annotation:
            return "annotation";
        case ReferenceType::Appendix:
            return "appendix";
        case ReferenceType::Article:
            return "article";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const ReferenceResolution& r) {
    j = nlohmann::json{{"type", toString(r.type)},
                       {"parsed_target", r.parsedTarget},
                       {"reg_id", r.regId},
                       {"page_num", r.pageNum},
                       {"chapter_path", r.chapterPath},
                       {"preview", r.preview},
                       {"source", r.source}};
    if (r.pageEnd) {
        j["page_end"] = *r.pageEnd;
    }
    if (r.sectionNumber) {
        j["section_number"] = *r.sectionNumber;
    }
    if (r.tableId) {
        j["table_id"] = *r.tableId;
    }
    if (r.annotationId) {
        j["annotation_id"] = *r.annotationId;
    }
}

std::optional<ParsedReference> parseReference(std::string_view textIn) {
    const auto cps = text::decodeUtf8(text::toHalfWidth(textIn));
    if (auto ref = findChapter(cps)) {
        return ref;
    }
    if (auto ref = findTable(cps)) {
        return ref;
    }
    if (auto ref = findDottedSection(cps)) {
        return ref;
    }
    if (auto ref = findAnnotation(cps)) {
        return ref;
    }
    if (auto ref = findAppendix(cps)) {
        return ref;
    }
    return findOrdinal(cps, U'条', ReferenceType::Article);
}

ReferenceResolver::ReferenceResolver(const storage::PageStore& store,
                                     const AnnotationLookup& annotations)
    : store_(store), annotations_(annotations) {}

Result<ReferenceResolution> ReferenceResolver::resolve(std::string_view regId,
                                                       std::string_view referenceText) const {
    if (auto valid = storage::validateRegId(regId); !valid) {
        return valid.error();
    }
    if (!store_.exists(regId)) {
        return errors::regulationNotFound(regId);
    }

    auto ref = parseReference(referenceText);
    if (!ref) {
        return errors::referenceResolutionFailed(regId, referenceText,
                                                 "no reference pattern matched");
    }
    spdlog::debug("Reference '{}' parsed as {} {}", referenceText, toString(ref->type),
                  ref->target);

    switch (ref->type) {
        case ReferenceType::Table:
            return resolveTable(regId, referenceText, *ref);
        case ReferenceType::Annotation:
            return resolveAnnotation(regId, referenceText, *ref);
        case ReferenceType::Chapter:
        case ReferenceType::Section:
        case ReferenceType::Appendix:
        case ReferenceType::Article:
            return resolveChapter(regId, referenceText, *ref);
    }
    return errors::referenceResolutionFailed(regId, referenceText,
                                             "unsupported reference type");
}

Result<ReferenceResolution> ReferenceResolver::resolveChapter(std::string_view regId,
                                                              std::string_view referenceText,
                                                              const ParsedReference& ref) const {
    auto structureResult = store_.loadDocumentStructure(regId);
    if (!structureResult) {
        return structureResult.error();
    }
    const auto& structure = structureResult.value();

    const ChapterNode* node = nullptr;
    switch (ref.type) {
        case ReferenceType::Chapter:
            if (ref.isSectionMarker) {
                node = findByMarker(structure, U'节', *ref.number);
                break;
            }
            node = structure.getNodeBySectionNumber(std::to_string(*ref.number));
            if (!node) {
                node = findByMarker(structure, U'章', *ref.number);
            }
            if (!node) {
                // Shallowest node numbered N.x
                const std::string prefix = std::to_string(*ref.number) + ".";
                int bestLevel = INT_MAX;
                for (const auto& id : structure.nodeOrder()) {
                    const auto* candidate = structure.getNode(id);
                    if (candidate && candidate->sectionNumber.rfind(prefix, 0) == 0 &&
                        candidate->level < bestLevel) {
                        node = candidate;
                        bestLevel = candidate->level;
                    }
                }
            }
            if (!node) {
                // A chapter title quoted next to the marker, longest title wins
                size_t bestLength = 0;
                for (const auto& id : structure.nodeOrder()) {
                    const auto* candidate = structure.getNode(id);
                    if (candidate && candidate->level == 1 &&
                        text::codepointCount(candidate->title) >= 2 &&
                        referenceText.find(candidate->title) != std::string_view::npos &&
                        candidate->title.size() > bestLength) {
                        node = candidate;
                        bestLength = candidate->title.size();
                    }
                }
            }
            break;
        case ReferenceType::Section:
            node = structure.getNodeBySectionNumber(ref.target);
            break;
        case ReferenceType::Appendix:
            for (const auto& id : structure.nodeOrder()) {
                const auto* candidate = structure.getNode(id);
                if (!candidate) {
                    continue;
                }
                auto marker = findAppendix(
                    text::decodeUtf8(text::toHalfWidth(candidate->sectionNumber)));
                if (marker && marker->target == ref.target) {
                    node = candidate;
                    break;
                }
            }
            break;
        case ReferenceType::Article:
            node = findByMarker(structure, U'条', *ref.number);
            break;
        default:
            break;
    }

    if (!node) {
        return errors::referenceResolutionFailed(
            regId, referenceText, fmt::format("{} {} not found", toString(ref.type), ref.target));
    }

    ReferenceResolution resolution;
    resolution.type = ref.type;
    resolution.parsedTarget = ref.target;
    resolution.regId = std::string(regId);
    resolution.pageNum = node->pageNum;
    resolution.chapterPath = structure.getChapterPath(node->nodeId);
    resolution.sectionNumber = node->sectionNumber;
    resolution.preview = previewForNode(regId, *node);
    resolution.source = sourceFor(regId, node->pageNum, resolution.chapterPath);
    return resolution;
}

Result<ReferenceResolution> ReferenceResolver::resolveTable(std::string_view regId,
                                                            std::string_view referenceText,
                                                            const ParsedReference& ref) const {
    auto registryResult = store_.loadTableRegistry(regId);
    if (!registryResult) {
        return registryResult.error();
    }
    const auto& registry = registryResult.value();

    const TableEntry* entry = registry.findByCaption(ref.target);
    if (!entry) {
        entry = registry.find(ref.target);
    }
    if (!entry) {
        return errors::referenceResolutionFailed(regId, referenceText,
                                                 fmt::format("table {} not found", ref.target));
    }

    ReferenceResolution resolution;
    resolution.type = ReferenceType::Table;
    resolution.parsedTarget = ref.target;
    resolution.regId = std::string(regId);
    resolution.pageNum = entry->pageStart;
    if (entry->pageEnd != entry->pageStart) {
        resolution.pageEnd = entry->pageEnd;
    }
    resolution.chapterPath = entry->chapterPath;
    resolution.tableId = entry->tableId;
    resolution.preview = text::truncateCodepoints(entry->mergedMarkdown, kPreviewChars);
    resolution.source = resolution.pageEnd
                            ? fmt::format("{} P{}-{}", regId, entry->pageStart, entry->pageEnd)
                            : sourceFor(regId, entry->pageStart, entry->chapterPath);
    return resolution;
}

Result<ReferenceResolution>
ReferenceResolver::resolveAnnotation(std::string_view regId, std::string_view referenceText,
                                     const ParsedReference& ref) const {
    auto annotation = annotations_.lookup(regId, ref.target);
    if (!annotation) {
        if (annotation.error().code == ErrorCode::AnnotationNotFound) {
            return errors::referenceResolutionFailed(
                regId, referenceText, fmt::format("annotation {} not found", ref.target));
        }
        return annotation.error();
    }
    const auto& found = annotation.value();

    ReferenceResolution resolution;
    resolution.type = ReferenceType::Annotation;
    resolution.parsedTarget = ref.target;
    resolution.regId = std::string(regId);
    resolution.pageNum = found.pageNum;
    resolution.annotationId = found.annotationId;
    resolution.preview = makePreview(found.content);

    auto page = store_.loadPage(regId, found.pageNum);
    if (page) {
        resolution.chapterPath = page.value().chapterPath;
    } else {
        spdlog::debug("No chapter path for annotation page {}: {}", found.pageNum,
                      page.error().message);
    }
    resolution.source = sourceFor(regId, found.pageNum, resolution.chapterPath);
    return resolution;
}

std::string ReferenceResolver::previewForNode(std::string_view regId,
                                              const ChapterNode& node) const {
    if (node.hasDirectContent && !node.directContent.empty()) {
        return makePreview(node.directContent);
    }
    auto page = store_.loadPage(regId, node.pageNum);
    if (!page) {
        spdlog::debug("No preview for {}: {}", node.nodeId, page.error().message);
        return makePreview(node.fullTitle());
    }
    for (const auto& block : page.value().contentBlocks) {
        if (block.chapterNodeId == node.nodeId && block.blockType != BlockType::Heading) {
            return makePreview(block.content);
        }
    }
    return makePreview(node.fullTitle());
}

} // namespace regdoc::resolve
