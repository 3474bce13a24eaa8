#pragma once

#include <regdoc/core/types.h>
#include <regdoc/resolve/annotation_lookup.h>
#include <regdoc/storage/page_store.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::resolve {

enum class ReferenceType { Chapter, Table, Section, Annotation, Appendix, Article };

const char* toString(ReferenceType type);

/**
 * @brief A cross-reference recognised in free text, before resolution
 */
struct ParsedReference {
    ReferenceType type = ReferenceType::Chapter;
    // The matched fragment, e.g. 第六章, 表6-2, 2.1.4, 注1
    std::string target;
    // Chapter/section/article ordinal, when the marker carries one
    std::optional<int> number;
    // 章 or 节 for chapter references
    bool isSectionMarker = false;
};

struct ReferenceResolution {
    ReferenceType type = ReferenceType::Chapter;
    std::string parsedTarget;
    RegId regId;
    int pageNum = 0;
    std::optional<int> pageEnd;
    std::vector<std::string> chapterPath;
    std::optional<std::string> sectionNumber;
    std::optional<std::string> tableId;
    std::optional<std::string> annotationId;
    std::string preview;
    std::string source;
};

void to_json(nlohmann::json& j, const ReferenceResolution& r);

/**
 * Recognise the first cross-reference in text. Patterns are tried in order:
 * chapter, table, dotted section, annotation, appendix, article.
 */
std::optional<ParsedReference> parseReference(std::string_view referenceText);

/**
 * @brief Resolves cross-references against a stored collection
 */
class ReferenceResolver {
public:
    static constexpr size_t kPreviewChars = 300;

    ReferenceResolver(const storage::PageStore& store, const AnnotationLookup& annotations);

    /**
     * @brief Resolve a reference such as 见第六章, 参见表6-2, 见2.1.4, 见注1
     *
     * @return RegulationNotFound for an unknown collection,
     *         ReferenceResolutionFailed when no pattern matches or the target
     *         does not exist
     */
    Result<ReferenceResolution> resolve(std::string_view regId,
                                        std::string_view referenceText) const;

private:
    Result<ReferenceResolution> resolveChapter(std::string_view regId,
                                               std::string_view referenceText,
                                               const ParsedReference& ref) const;
    Result<ReferenceResolution> resolveTable(std::string_view regId,
                                             std::string_view referenceText,
                                             const ParsedReference& ref) const;
    Result<ReferenceResolution> resolveAnnotation(std::string_view regId,
                                                  std::string_view referenceText,
                                                  const ParsedReference& ref) const;

    std::string previewForNode(std::string_view regId, const ChapterNode& node) const;

    const storage::PageStore& store_;
    const AnnotationLookup& annotations_;
};

} // namespace regdoc::resolve
