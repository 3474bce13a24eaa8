#pragma once

#include <regdoc/config/engine_config.h>
#include <regdoc/search/search_index.h>

#include <memory>
#include <vector>

namespace regdoc::search {

namespace fusion {

/**
 * One backend's ranking, best first, with the weight it carries in the fusion
 */
struct RankedList {
    double weight = 1.0;
    std::vector<SearchResult> results;
};

/**
 * Weighted Reciprocal Rank Fusion
 *
 * Results are keyed by (reg_id, page_num, block_id). A key scores
 * sum(weight / (k + rank + 1)) over the lists it appears in, rank being
 * 0-based. Output is ordered by fused score, then smaller page number, then
 * block id, then reg id, and truncated to limit. Snippet and chapter path
 * come from the first list that holds the key.
 */
std::vector<SearchResult> reciprocalRankFusion(const std::vector<RankedList>& lists, size_t k,
                                               size_t limit);

} // namespace fusion

/**
 * @brief Keyword + vector search fused with RRF
 *
 * Both backends receive the same query and limit. A backend failure fails the
 * whole search with IndexError.
 */
class HybridSearch {
public:
    HybridSearch(std::shared_ptr<ISearchIndex> keywordIndex,
                 std::shared_ptr<ISearchIndex> vectorIndex, HybridSearchConfig config = {});

    // A limit of 0 falls back to HybridSearchConfig::default_limit
    Result<std::vector<SearchResult>> search(const SearchQuery& query) const;

    const HybridSearchConfig& config() const { return config_; }

    ISearchIndex* keywordIndex() const { return keywordIndex_.get(); }
    ISearchIndex* vectorIndex() const { return vectorIndex_.get(); }

private:
    std::shared_ptr<ISearchIndex> keywordIndex_;
    std::shared_ptr<ISearchIndex> vectorIndex_;
    HybridSearchConfig config_;
};

} // namespace regdoc::search
