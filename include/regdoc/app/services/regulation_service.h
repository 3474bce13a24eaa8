#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/core/types.h>
#include <regdoc/indexing/document_indexer.h>
#include <regdoc/resolve/annotation_lookup.h>
#include <regdoc/resolve/reference_resolver.h>
#include <regdoc/search/hybrid_search.h>
#include <regdoc/storage/page_store.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc::ml {
class IEmbeddingProvider;
}

namespace regdoc::app::services {

enum class SearchMode { Hybrid, Keyword, Vector };

Result<SearchMode> parseSearchMode(std::string_view name);

struct SearchRequest {
    std::string query;
    std::optional<RegId> regId;
    std::optional<std::string> chapterScope;
    std::vector<BlockType> blockTypes;
    std::optional<std::string> sectionNumber;
    size_t limit{0}; // 0 uses the configured default
    SearchMode mode{SearchMode::Hybrid};
};

struct TableSearchRequest {
    std::string query;
    RegId regId;
    std::optional<std::string> chapterScope;
    size_t limit{0}; // 0 uses the configured default
    SearchMode mode{SearchMode::Hybrid};
};

// One logical table, cross-page segments already stitched
struct TableSearchHit {
    RegId regId;
    std::string tableId;
    std::string caption;
    std::vector<std::string> chapterPath;
    int pageStart{0};
    int pageEnd{0};
    bool isCrossPage{false};
    int rowCount{0};
    int colCount{0};
    std::vector<std::string> colHeaders;
    std::string snippet;
    double score{0.0};
    SearchMode matchType{SearchMode::Hybrid};

    std::string source() const;
};

struct TocResponse {
    RegId regId;
    std::string title;
    int totalPages{0};
    std::vector<TocItem> items;
};

struct ChapterStructureResponse {
    RegId regId;
    size_t totalChapters{0};
    std::vector<std::string> rootNodeIds;
    // Document order
    std::vector<ChapterNode> nodes;
};

struct ChapterChild {
    std::string nodeId;
    std::string sectionNumber;
    std::string title;
    int pageNum{0};
};

struct ChapterBlock {
    int pageNum{0};
    ContentBlock block;
};

struct ChapterContent {
    RegId regId;
    std::string nodeId;
    std::string sectionNumber;
    std::string title;
    std::vector<std::string> chapterPath;
    int pageStart{0};
    int pageEnd{0};
    // Ordered by (page, order in page)
    std::vector<ChapterBlock> blocks;
    std::vector<ChapterChild> children;
    std::string contentMarkdown;
    std::string source;
};

const char* toString(SearchMode mode);

void to_json(nlohmann::json& j, const TableSearchHit& v);
void to_json(nlohmann::json& j, const TocResponse& v);
void to_json(nlohmann::json& j, const ChapterStructureResponse& v);
void to_json(nlohmann::json& j, const ChapterContent& v);

/**
 * @brief Read-side facade over one data directory
 *
 * Owns the page store, both indexes and the resolvers, all built from one
 * EngineConfig. Every result carries reg_id and page numbers so callers can
 * cite sources.
 */
class RegulationService {
public:
    /**
     * @brief Build the service for a configuration
     *
     * Without an explicit provider the configured embedding provider is
     * created from the registry.
     */
    static Result<std::unique_ptr<RegulationService>>
    create(const EngineConfig& config, std::shared_ptr<ml::IEmbeddingProvider> provider = nullptr);

    ~RegulationService();

    RegulationService(const RegulationService&) = delete;
    RegulationService& operator=(const RegulationService&) = delete;

    Result<indexing::IngestReport> ingest(std::vector<PageDocument> pages, std::string_view title,
                                          std::string_view sourceFile);

    Result<PageDocument> readPage(std::string_view regId, int pageNum) const;
    Result<PageContent> readPageRange(std::string_view regId, int startPage, int endPage) const;

    Result<TocResponse> getToc(std::string_view regId) const;
    Result<ChapterStructureResponse> getChapterStructure(std::string_view regId) const;

    /**
     * @brief Blocks of one chapter, optionally with its whole subtree
     * @return ChapterNotFound when no node has this section number
     */
    Result<ChapterContent> readChapterContent(std::string_view regId,
                                              std::string_view sectionNumber,
                                              bool includeChildren = true) const;

    // Table id, segment id or caption label (表6-2)
    Result<TableEntry> getTable(std::string_view regId, std::string_view tableId) const;

    Result<std::vector<SearchResult>> search(const SearchRequest& request) const;

    /**
     * @brief Search the logical tables of one collection
     *
     * Table blocks are searched like any other block; each hit is then folded
     * into the table it belongs to, so a cross-page table is returned once.
     * Hybrid mode fuses the folded keyword and vector rankings with RRF.
     *
     * @return RegulationNotFound for an unknown collection
     */
    Result<std::vector<TableSearchHit>> searchTables(const TableSearchRequest& request) const;

    Result<Annotation> lookupAnnotation(std::string_view regId, std::string_view annotationId,
                                        std::optional<int> pageHint = std::nullopt) const;
    Result<std::vector<Annotation>>
    searchAnnotations(std::string_view regId, std::string_view pattern = {},
                      resolve::AnnotationKind kind = resolve::AnnotationKind::Any) const;

    Result<resolve::ReferenceResolution> resolveReference(std::string_view regId,
                                                          std::string_view referenceText) const;

    Result<std::vector<RegulationInfo>> listCollections() const;

    // Removes pages, artifacts and index entries
    Result<void> deleteCollection(std::string_view regId);

    const EngineConfig& config() const { return config_; }

private:
    RegulationService(EngineConfig config, std::shared_ptr<search::ISearchIndex> keywordIndex,
                      std::shared_ptr<search::ISearchIndex> vectorIndex);

    EngineConfig config_;
    storage::PageStore store_;
    std::shared_ptr<search::ISearchIndex> keywordIndex_;
    std::shared_ptr<search::ISearchIndex> vectorIndex_;
    search::HybridSearch hybrid_;
    resolve::AnnotationLookup annotations_;
    resolve::ReferenceResolver resolver_;
    indexing::DocumentIndexer indexer_;
};

} // namespace regdoc::app::services
