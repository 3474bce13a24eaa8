#pragma once

#include <regdoc/metadata/database.h>
#include <regdoc/search/search_index.h>

#include <mutex>

namespace regdoc::search {

/**
 * @brief Keyword backend on SQLite FTS5
 *
 * Block text is pre-tokenised (CJK bigrams, lower-cased latin words) into a
 * single FTS5 column so the stock unicode61 tokenizer can be used. Ranking is
 * BM25; the reported score is -bm25 so that larger is better.
 */
class Fts5KeywordIndex : public ISearchIndex {
public:
    explicit Fts5KeywordIndex(IndexConfig config);
    ~Fts5KeywordIndex() override;

    // Open the database and create the schema
    Result<void> initialize();

    std::string name() const override { return "fts5"; }

    Result<void> indexBlock(const BlockRecord& record) override;
    Result<size_t> indexBlocks(const std::vector<BlockRecord>& records) override;
    Result<std::vector<SearchResult>> search(const SearchQuery& query) override;
    Result<void> deleteCollection(const RegId& regId) override;
    Result<size_t> count(const std::optional<RegId>& regId = std::nullopt) override;

private:
    Result<void> createSchema();
    Result<void> insertLocked(const BlockRecord& record);

    IndexConfig config_;
    metadata::Database db_;
    std::mutex mutex_;
};

} // namespace regdoc::search
