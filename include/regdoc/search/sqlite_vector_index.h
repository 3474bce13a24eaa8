#pragma once

#include <regdoc/metadata/database.h>
#include <regdoc/ml/embedding_provider.h>
#include <regdoc/search/search_index.h>

#include <memory>
#include <mutex>

namespace regdoc::search {

/**
 * @brief Vector backend storing embeddings as float BLOBs in SQLite
 *
 * Search is exact: every candidate row passing the filters is scored by
 * cosine similarity against the query embedding. Blocks shorter than
 * IndexConfig::minEmbedChars are not embedded and therefore never returned
 * by this backend; the keyword backend still covers them.
 */
class SqliteVectorIndex : public ISearchIndex {
public:
    SqliteVectorIndex(IndexConfig config, std::shared_ptr<ml::IEmbeddingProvider> provider);
    ~SqliteVectorIndex() override;

    Result<void> initialize();

    std::string name() const override { return "sqlite_vector"; }

    Result<void> indexBlock(const BlockRecord& record) override;
    Result<size_t> indexBlocks(const std::vector<BlockRecord>& records) override;
    Result<std::vector<SearchResult>> search(const SearchQuery& query) override;
    Result<void> deleteCollection(const RegId& regId) override;
    Result<size_t> count(const std::optional<RegId>& regId = std::nullopt) override;

    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

private:
    bool shouldEmbed(const BlockRecord& record) const;
    Result<void> insertLocked(const BlockRecord& record, const std::vector<float>& embedding);
    // Drops a stale vector for a block that no longer qualifies for embedding
    Result<void> eraseLocked(const BlockRecord& record);

    std::vector<uint8_t> vectorToBlob(const std::vector<float>& vec) const;
    std::vector<float> blobToVector(const std::vector<std::byte>& blob) const;

    IndexConfig config_;
    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    metadata::Database db_;
    std::mutex mutex_;
};

} // namespace regdoc::search
