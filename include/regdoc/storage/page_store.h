#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>
#include <regdoc/structure/document_structure.h>
#include <regdoc/structure/table_registry.h>

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace regdoc::storage {

/**
 * @brief Per-page document store
 *
 * Layout under the base path:
 *   <reg_id>/page_0001.json ...   one file per page
 *   <reg_id>/structure.json       chapter tree
 *   <reg_id>/table_registry.json  logical tables
 *   <reg_id>/info.json            collection record
 *
 * Only the page files are required. A collection written page by page has
 * its info record, chapter tree and table registry derived from the stored
 * pages on load.
 *
 * Every file is written to a temp path and renamed into place, so readers
 * never observe a partially written page. Writes to one collection are
 * serialised; different collections proceed independently.
 */
class PageStore {
public:
    explicit PageStore(PageStoreConfig config);
    ~PageStore();

    PageStore(const PageStore&) = delete;
    PageStore& operator=(const PageStore&) = delete;
    PageStore(PageStore&&) noexcept;
    PageStore& operator=(PageStore&&) noexcept;

    Result<void> savePage(const PageDocument& page);

    /**
     * @brief Persist a whole ingested collection
     *
     * Pages left over from a previous, longer ingestion are removed.
     */
    Result<RegulationInfo> saveCollection(const std::vector<PageDocument>& pages,
                                          const structure::DocumentStructure& structure,
                                          const structure::TableRegistry& registry,
                                          std::string_view title, std::string_view sourceFile);

    /**
     * @brief Load one page
     * @return RegulationNotFound if the collection is absent, PageNotFound if
     *         the page was never stored
     */
    Result<PageDocument> loadPage(std::string_view regId, int pageNum) const;

    /**
     * @brief Load a page range with cross-page tables stitched
     *
     * The span is capped at maxPagesPerRange. Missing pages inside the range
     * are skipped and reported in PageContent::skippedPages.
     *
     * @return InvalidPageRange if start < 1 or start > end, PageNotFound(start)
     *         if no page of the range exists
     */
    Result<PageContent> loadPageRange(std::string_view regId, int startPage, int endPage) const;

    /**
     * @brief Page numbers stored for a collection, ascending
     * @return RegulationNotFound if the collection is absent
     */
    Result<std::vector<int>> pageNumbers(std::string_view regId) const;

    Result<std::vector<RegulationInfo>> listCollections() const;
    Result<void> deleteCollection(std::string_view regId);
    bool exists(std::string_view regId) const;
    Result<RegulationInfo> loadInfo(std::string_view regId) const;

    Result<void> saveDocumentStructure(const structure::DocumentStructure& structure);
    Result<structure::DocumentStructure> loadDocumentStructure(std::string_view regId) const;

    Result<void> saveTableRegistry(const structure::TableRegistry& registry);
    Result<structure::TableRegistry> loadTableRegistry(std::string_view regId) const;

    std::filesystem::path basePath() const;
    int maxPagesPerRange() const;

    /**
     * @brief Rebuild range markdown from loaded pages
     *
     * Emits a page marker before each page. A truncated table on a page that
     * continues_to_next is buffered; the first table on following
     * continues_from_prev pages contributes only its data rows, and the
     * stitched table is emitted where its first segment appeared.
     */
    static std::string mergePages(const std::vector<PageDocument>& pages, bool& hasMergedTables);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// A reg_id must be usable as a single directory name
Result<void> validateRegId(std::string_view regId);

} // namespace regdoc::storage
