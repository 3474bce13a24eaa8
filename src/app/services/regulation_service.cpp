#include <regdoc/app/services/regulation_service.h>
#include <regdoc/core/errors.h>
#include <regdoc/core/text_utils.h>
#include <regdoc/ml/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace regdoc::app::services {

Result<SearchMode> parseSearchMode(std::string_view name) {
    if (name == "hybrid" || name.empty()) {
        return SearchMode::Hybrid;
    }
    if (name == "keyword") {
        return SearchMode::Keyword;
    }
    if (name == "vector" || name == "semantic") {
        return SearchMode::Vector;
    }
    return errors::invalidArgument(fmt::format("Unknown search mode: {}", name));
}

namespace {

// Several segments of one table may rank; fetch deeper than the table limit
constexpr size_t kTableFetchFactor = 4;

// Collapse block hits into one result per logical table, keeping rank order
std::vector<SearchResult> foldIntoTables(const std::vector<SearchResult>& hits,
                                         const structure::TableRegistry& registry) {
    std::vector<SearchResult> folded;
    std::unordered_set<std::string> seen;
    for (const auto& hit : hits) {
        const auto* entry = registry.find(hit.blockId);
        if (!entry) {
            spdlog::debug("Table block {} of {} is not in the registry", hit.blockId, hit.regId);
            continue;
        }
        if (!seen.insert(entry->tableId).second) {
            continue;
        }
        SearchResult table;
        table.regId = hit.regId;
        table.pageNum = entry->pageStart;
        table.chapterPath = entry->chapterPath;
        table.blockId = entry->tableId;
        table.snippet = hit.snippet;
        table.score = hit.score;
        folded.push_back(std::move(table));
    }
    return folded;
}

} // namespace

const char* toString(SearchMode mode) {
    switch (mode) {
        case SearchMode::Hybrid:
            return "hybrid";
        case SearchMode::Keyword:
            return "keyword";
        case SearchMode::Vector:
            return "vector";
    }
    return "hybrid";
}

std::string TableSearchHit::source() const {
    if (pageEnd > pageStart) {
        return fmt::format("{} P{}-{}", regId, pageStart, pageEnd);
    }
    return fmt::format("{} P{}", regId, pageStart);
}

void to_json(nlohmann::json& j, const TableSearchHit& v) {
    j = nlohmann::json{{"reg_id", v.regId},
                       {"table_id", v.tableId},
                       {"caption", v.caption},
                       {"chapter_path", v.chapterPath},
                       {"page_start", v.pageStart},
                       {"page_end", v.pageEnd},
                       {"is_cross_page", v.isCrossPage},
                       {"row_count", v.rowCount},
                       {"col_count", v.colCount},
                       {"col_headers", v.colHeaders},
                       {"snippet", v.snippet},
                       {"score", v.score},
                       {"match_type", toString(v.matchType)},
                       {"source", v.source()}};
}

void to_json(nlohmann::json& j, const TocResponse& v) {
    j = nlohmann::json{{"reg_id", v.regId},
                       {"title", v.title},
                       {"total_pages", v.totalPages},
                       {"toc", v.items}};
}

void to_json(nlohmann::json& j, const ChapterStructureResponse& v) {
    j = nlohmann::json{{"reg_id", v.regId},
                       {"total_chapters", v.totalChapters},
                       {"root_node_ids", v.rootNodeIds},
                       {"nodes", v.nodes}};
}

void to_json(nlohmann::json& j, const ChapterContent& v) {
    auto blocks = nlohmann::json::array();
    for (const auto& item : v.blocks) {
        nlohmann::json block = item.block;
        block["page_num"] = item.pageNum;
        blocks.push_back(std::move(block));
    }
    auto children = nlohmann::json::array();
    for (const auto& child : v.children) {
        children.push_back({{"node_id", child.nodeId},
                            {"section_number", child.sectionNumber},
                            {"title", child.title},
                            {"page_num", child.pageNum}});
    }
    j = nlohmann::json{{"reg_id", v.regId},
                       {"node_id", v.nodeId},
                       {"section_number", v.sectionNumber},
                       {"title", v.title},
                       {"chapter_path", v.chapterPath},
                       {"page_range", {v.pageStart, v.pageEnd}},
                       {"content_blocks", blocks},
                       {"children", children},
                       {"content_markdown", v.contentMarkdown},
                       {"source", v.source}};
}

Result<std::unique_ptr<RegulationService>>
RegulationService::create(const EngineConfig& config,
                          std::shared_ptr<ml::IEmbeddingProvider> provider) {
    if (!config.search.isValid()) {
        return errors::invalidArgument("Fusion weights must be non-negative with a positive sum");
    }

    auto keyword = search::createKeywordIndex(config.index);
    if (!keyword) {
        return keyword.error();
    }
    auto vector = search::createVectorIndex(config.index, std::move(provider));
    if (!vector) {
        return vector.error();
    }

    try {
        std::unique_ptr<RegulationService> service(new RegulationService(
            config, std::move(keyword).value(), std::move(vector).value()));
        spdlog::info("Regulation service ready (pages at {})",
                     config.pageStore.basePath.string());
        return service;
    } catch (const std::exception& e) {
        spdlog::error("Failed to open page store at {}: {}", config.pageStore.basePath.string(),
                      e.what());
        return errors::storageError(std::string("Failed to open page store: ") + e.what());
    }
}

RegulationService::RegulationService(EngineConfig config,
                                     std::shared_ptr<search::ISearchIndex> keywordIndex,
                                     std::shared_ptr<search::ISearchIndex> vectorIndex)
    : config_(std::move(config)), store_(config_.pageStore),
      keywordIndex_(std::move(keywordIndex)), vectorIndex_(std::move(vectorIndex)),
      hybrid_(keywordIndex_, vectorIndex_, config_.search), annotations_(store_),
      resolver_(store_, annotations_),
      indexer_(store_, keywordIndex_, vectorIndex_, config_.structure) {}

RegulationService::~RegulationService() = default;

Result<indexing::IngestReport> RegulationService::ingest(std::vector<PageDocument> pages,
                                                         std::string_view title,
                                                         std::string_view sourceFile) {
    return indexer_.ingest(std::move(pages), title, sourceFile);
}

Result<PageDocument> RegulationService::readPage(std::string_view regId, int pageNum) const {
    return store_.loadPage(regId, pageNum);
}

Result<PageContent> RegulationService::readPageRange(std::string_view regId, int startPage,
                                                     int endPage) const {
    return store_.loadPageRange(regId, startPage, endPage);
}

Result<TocResponse> RegulationService::getToc(std::string_view regId) const {
    auto info = store_.loadInfo(regId);
    if (!info) {
        return info.error();
    }
    auto structure = store_.loadDocumentStructure(regId);
    if (!structure) {
        return structure.error();
    }

    TocResponse response;
    response.regId = info.value().regId;
    response.title = info.value().title;
    response.totalPages = info.value().totalPages;
    response.items = structure.value().toc(info.value().totalPages);
    return response;
}

Result<ChapterStructureResponse>
RegulationService::getChapterStructure(std::string_view regId) const {
    auto structure = store_.loadDocumentStructure(regId);
    if (!structure) {
        return structure.error();
    }
    const auto& tree = structure.value();

    ChapterStructureResponse response;
    response.regId = std::string(regId);
    response.totalChapters = tree.size();
    response.rootNodeIds = tree.rootNodeIds();
    response.nodes.reserve(tree.size());
    for (const auto& id : tree.nodeOrder()) {
        if (const auto* node = tree.getNode(id)) {
            response.nodes.push_back(*node);
        }
    }
    return response;
}

Result<ChapterContent> RegulationService::readChapterContent(std::string_view regId,
                                                             std::string_view sectionNumber,
                                                             bool includeChildren) const {
    auto info = store_.loadInfo(regId);
    if (!info) {
        return info.error();
    }
    auto structure = store_.loadDocumentStructure(regId);
    if (!structure) {
        return structure.error();
    }
    const auto& tree = structure.value();

    const ChapterNode* node = tree.getNodeBySectionNumber(sectionNumber);
    if (!node) {
        return errors::chapterNotFound(regId, sectionNumber);
    }

    ChapterContent content;
    content.regId = std::string(regId);
    content.nodeId = node->nodeId;
    content.sectionNumber = node->sectionNumber;
    content.title = node->title;
    content.chapterPath = tree.getChapterPath(node->nodeId);
    content.pageStart = node->pageNum;
    content.pageEnd = tree.endPage(node->nodeId, info.value().totalPages);

    std::unordered_set<std::string> wanted(node->contentBlockIds.begin(),
                                           node->contentBlockIds.end());
    if (includeChildren) {
        for (const auto& id : tree.descendantIds(node->nodeId)) {
            if (const auto* child = tree.getNode(id)) {
                wanted.insert(child->contentBlockIds.begin(), child->contentBlockIds.end());
            }
        }
    }
    for (const auto& id : node->childrenIds) {
        if (const auto* child = tree.getNode(id)) {
            content.children.push_back(
                {child->nodeId, child->sectionNumber, child->title, child->pageNum});
        }
    }

    for (int pageNum = content.pageStart; pageNum <= content.pageEnd; ++pageNum) {
        auto page = store_.loadPage(regId, pageNum);
        if (!page) {
            if (page.error().code == ErrorCode::PageNotFound) {
                spdlog::warn("Page {} of {} missing while reading chapter {}", pageNum, regId,
                             sectionNumber);
                continue;
            }
            return page.error();
        }
        for (const auto& block : page.value().contentBlocks) {
            if (wanted.count(block.blockId) != 0) {
                content.blocks.push_back({pageNum, block});
            }
        }
    }
    std::stable_sort(content.blocks.begin(), content.blocks.end(),
                     [](const ChapterBlock& a, const ChapterBlock& b) {
                         if (a.pageNum != b.pageNum) {
                             return a.pageNum < b.pageNum;
                         }
                         return a.block.orderInPage < b.block.orderInPage;
                     });

    for (const auto& item : content.blocks) {
        if (!content.contentMarkdown.empty()) {
            content.contentMarkdown += "\n\n";
        }
        content.contentMarkdown += item.block.content;
    }

    const auto pages = content.pageEnd > content.pageStart
                           ? fmt::format("P{}-{}", content.pageStart, content.pageEnd)
                           : fmt::format("P{}", content.pageStart);
    content.source = fmt::format("{} {} ({})", regId, pages, joinChapterPath(content.chapterPath));
    return content;
}

Result<TableEntry> RegulationService::getTable(std::string_view regId,
                                               std::string_view tableId) const {
    auto registry = store_.loadTableRegistry(regId);
    if (!registry) {
        return registry.error();
    }
    if (const auto* entry = registry.value().find(tableId)) {
        return *entry;
    }
    if (const auto* entry = registry.value().findByCaption(tableId)) {
        return *entry;
    }
    return errors::tableNotFound(regId, tableId);
}

Result<std::vector<SearchResult>> RegulationService::search(const SearchRequest& request) const {
    search::SearchQuery query;
    query.text = request.query;
    query.regId = request.regId;
    query.chapterScope = request.chapterScope;
    query.blockTypes = request.blockTypes;
    query.sectionNumber = request.sectionNumber;
    query.limit = request.limit == 0 ? config_.search.default_limit : request.limit;

    if (request.regId && !store_.exists(*request.regId)) {
        return errors::regulationNotFound(*request.regId);
    }

    switch (request.mode) {
        case SearchMode::Hybrid:
            return hybrid_.search(query);
        case SearchMode::Keyword:
        case SearchMode::Vector: {
            auto& index = request.mode == SearchMode::Keyword ? keywordIndex_ : vectorIndex_;
            auto results = index->search(query);
            if (!results) {
                return errors::indexError(index->name() +
                                          " search failed: " + results.error().message);
            }
            return results;
        }
    }
    return errors::invalidArgument("Unknown search mode");
}

Result<std::vector<TableSearchHit>>
RegulationService::searchTables(const TableSearchRequest& request) const {
    if (!store_.exists(request.regId)) {
        return errors::regulationNotFound(request.regId);
    }
    std::vector<TableSearchHit> hits;
    const size_t limit = request.limit == 0 ? config_.search.default_limit : request.limit;
    if (text::trim(request.query).empty()) {
        return hits;
    }

    auto registry = store_.loadTableRegistry(request.regId);
    if (!registry) {
        return registry.error();
    }
    if (registry.value().size() == 0) {
        return hits;
    }

    search::SearchQuery query;
    query.text = request.query;
    query.regId = request.regId;
    query.chapterScope = request.chapterScope;
    query.blockTypes = {BlockType::Table};
    query.limit = limit * kTableFetchFactor;

    auto rankWith = [&](search::ISearchIndex& index) -> Result<std::vector<SearchResult>> {
        auto results = index.search(query);
        if (!results) {
            return errors::indexError(index.name() + " table search failed: " +
                                      results.error().message);
        }
        return foldIntoTables(results.value(), registry.value());
    };

    std::vector<SearchResult> ranked;
    if (request.mode == SearchMode::Hybrid) {
        auto keyword = rankWith(*keywordIndex_);
        if (!keyword) {
            return keyword.error();
        }
        auto vector = rankWith(*vectorIndex_);
        if (!vector) {
            return vector.error();
        }
        spdlog::debug("Table search in {}: {} keyword, {} vector candidates", request.regId,
                      keyword.value().size(), vector.value().size());
        ranked = search::fusion::reciprocalRankFusion(
            {{config_.search.keyword_weight, std::move(keyword).value()},
             {config_.search.vector_weight, std::move(vector).value()}},
            config_.search.rrf_k, limit);
    } else {
        auto single =
            rankWith(request.mode == SearchMode::Keyword ? *keywordIndex_ : *vectorIndex_);
        if (!single) {
            return single.error();
        }
        ranked = std::move(single).value();
        if (ranked.size() > limit) {
            ranked.resize(limit);
        }
    }

    for (const auto& result : ranked) {
        const auto* entry = registry.value().find(result.blockId);
        if (!entry) {
            continue;
        }
        TableSearchHit hit;
        hit.regId = request.regId;
        hit.tableId = entry->tableId;
        hit.caption = entry->caption;
        hit.chapterPath = entry->chapterPath;
        hit.pageStart = entry->pageStart;
        hit.pageEnd = entry->pageEnd;
        hit.isCrossPage = entry->isCrossPage;
        hit.rowCount = entry->rowCount;
        hit.colCount = entry->colCount;
        hit.colHeaders = entry->colHeaders;
        hit.snippet = result.snippet;
        hit.score = result.score;
        hit.matchType = request.mode;
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<Annotation> RegulationService::lookupAnnotation(std::string_view regId,
                                                       std::string_view annotationId,
                                                       std::optional<int> pageHint) const {
    return annotations_.lookup(regId, annotationId, pageHint);
}

Result<std::vector<Annotation>>
RegulationService::searchAnnotations(std::string_view regId, std::string_view pattern,
                                     resolve::AnnotationKind kind) const {
    return annotations_.search(regId, pattern, kind);
}

Result<resolve::ReferenceResolution>
RegulationService::resolveReference(std::string_view regId, std::string_view referenceText) const {
    return resolver_.resolve(regId, referenceText);
}

Result<std::vector<RegulationInfo>> RegulationService::listCollections() const {
    return store_.listCollections();
}

Result<void> RegulationService::deleteCollection(std::string_view regId) {
    if (auto valid = storage::validateRegId(regId); !valid) {
        return valid;
    }
    if (!store_.exists(regId)) {
        return errors::regulationNotFound(regId);
    }
    return indexer_.removeCollection(RegId(regId));
}

} // namespace regdoc::app::services
