#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/core/types.h>
#include <regdoc/storage/models.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regdoc::ml {
class IEmbeddingProvider;
}

namespace regdoc::search {

/**
 * @brief One content block handed to an index, enriched with its location
 */
struct BlockRecord {
    RegId regId;
    int pageNum = 0;
    ContentBlock block;
    std::vector<std::string> chapterPath;
    std::optional<std::string> tableId;
    std::optional<std::string> sectionNumber;
};

struct SearchQuery {
    std::string text;
    std::optional<RegId> regId;
    // Substring of the joined chapter path
    std::optional<std::string> chapterScope;
    // Empty means every block type
    std::vector<BlockType> blockTypes;
    // Matches the section itself and its descendants (2.1 matches 2.1.4)
    std::optional<std::string> sectionNumber;
    size_t limit = 10;
};

/**
 * @brief Abstract interface for retrieval backends
 *
 * Results come back best first with a backend-specific score. Re-indexing a
 * block with the same (reg_id, block_id) replaces the previous entry.
 */
class ISearchIndex {
public:
    virtual ~ISearchIndex() = default;

    virtual std::string name() const = 0;

    virtual Result<void> indexBlock(const BlockRecord& record) = 0;

    /**
     * @brief Index many blocks in one transaction
     * @return Number of blocks actually stored
     */
    virtual Result<size_t> indexBlocks(const std::vector<BlockRecord>& records) = 0;

    virtual Result<std::vector<SearchResult>> search(const SearchQuery& query) = 0;

    virtual Result<void> deleteCollection(const RegId& regId) = 0;

    // Number of stored blocks, optionally for one collection
    virtual Result<size_t> count(const std::optional<RegId>& regId = std::nullopt) = 0;
};

Result<std::unique_ptr<ISearchIndex>> createKeywordIndex(const IndexConfig& config);

/**
 * @brief Create the configured vector backend
 *
 * Without an explicit provider, IndexConfig::embeddingProvider is looked up
 * in the provider registry.
 *
 * @return IndexError if no provider is available or its dimension differs
 *         from IndexConfig::embeddingDimension
 */
Result<std::unique_ptr<ISearchIndex>>
createVectorIndex(const IndexConfig& config,
                  std::shared_ptr<ml::IEmbeddingProvider> provider = nullptr);

} // namespace regdoc::search
