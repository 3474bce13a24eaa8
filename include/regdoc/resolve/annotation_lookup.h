#pragma once

#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>
#include <regdoc/storage/page_store.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::resolve {

/**
 * Canonical form of an annotation identifier.
 *
 * 注1, 注①, 注一, （注1）, 注 1： all become 注1; 方案a, 方案Ａ, 方案甲 become
 * 方案A (likewise 选项). Other identifiers are trimmed, stripped of spaces and
 * trailing punctuation, and upper-cased. The function is idempotent.
 */
std::string normalizeAnnotationId(std::string_view raw);

enum class AnnotationKind {
    Any,
    Note, // 注N
    Plan, // 方案X / 选项X
};

AnnotationKind classifyAnnotation(std::string_view normalizedId);

/**
 * @brief Finds footnote-style annotations of a stored collection
 */
class AnnotationLookup {
public:
    explicit AnnotationLookup(const storage::PageStore& store);

    /**
     * @brief Find an annotation by (raw) id
     *
     * The hint page is checked first, then every page of the collection.
     *
     * @return RegulationNotFound for an unknown collection, AnnotationNotFound
     *         when no page carries a matching annotation
     */
    Result<Annotation> lookup(std::string_view regId, std::string_view rawId,
                              std::optional<int> pageHint = std::nullopt) const;

    /**
     * @brief All annotations whose content contains pattern (empty matches all)
     */
    Result<std::vector<Annotation>> search(std::string_view regId, std::string_view pattern = {},
                                           AnnotationKind kind = AnnotationKind::Any) const;

private:
    static std::optional<Annotation> findOnPage(const PageDocument& page,
                                                const std::string& normalizedId);

    const storage::PageStore& store_;
};

} // namespace regdoc::resolve
