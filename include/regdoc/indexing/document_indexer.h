#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/core/types.h>
#include <regdoc/search/search_index.h>
#include <regdoc/storage/models.h>
#include <regdoc/storage/page_store.h>
#include <regdoc/structure/document_structure.h>
#include <regdoc/structure/table_registry.h>

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

namespace regdoc::indexing {

struct IngestReport {
    RegulationInfo info;
    size_t pageCount{0};
    size_t blockCount{0};
    size_t chapterCount{0};
    size_t tableCount{0};
    size_t crossPageTableCount{0};
    size_t keywordIndexed{0};
    // Blocks below the minimum length are not embedded
    size_t vectorIndexed{0};
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Ingestion pipeline for one collection
 *
 * structure pass -> table registry pass -> page store -> keyword and vector
 * indexes. Re-ingesting a reg_id replaces every artifact and index entry of
 * the previous run. Only one ingestion per reg_id may run at a time.
 */
class DocumentIndexer {
public:
    DocumentIndexer(storage::PageStore& store, std::shared_ptr<search::ISearchIndex> keywordIndex,
                    std::shared_ptr<search::ISearchIndex> vectorIndex,
                    StructureConfig structureConfig = {});

    Result<IngestReport> ingest(std::vector<PageDocument> pages, std::string_view title,
                                std::string_view sourceFile);

    // Drop the collection from both indexes and the page store
    Result<void> removeCollection(const RegId& regId);

    /**
     * @brief Index records for every block, enriched with chapter and table data
     *
     * Expects pages that went through the structure and registry passes.
     */
    static std::vector<search::BlockRecord>
    buildRecords(const std::vector<PageDocument>& pages,
                 const structure::DocumentStructure& structure,
                 const structure::TableRegistry& registry);

private:
    storage::PageStore& store_;
    std::shared_ptr<search::ISearchIndex> keywordIndex_;
    std::shared_ptr<search::ISearchIndex> vectorIndex_;
    StructureConfig structureConfig_;
};

} // namespace regdoc::indexing
