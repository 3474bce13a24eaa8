#include <regdoc/core/errors.h>
#include <regdoc/search/hybrid_search.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <map>
#include <tuple>

namespace regdoc::search {

namespace fusion {

std::vector<SearchResult> reciprocalRankFusion(const std::vector<RankedList>& lists, size_t k,
                                               size_t limit) {
    using Key = std::tuple<std::string, int, std::string>;
    std::map<Key, size_t> slots;
    std::vector<SearchResult> fused;

    for (const auto& list : lists) {
        for (size_t rank = 0; rank < list.results.size(); ++rank) {
            const auto& result = list.results[rank];
            const double contribution =
                list.weight / (static_cast<double>(k) + static_cast<double>(rank) + 1.0);

            Key key{result.regId, result.pageNum, result.blockId};
            auto [it, inserted] = slots.emplace(std::move(key), fused.size());
            if (inserted) {
                SearchResult entry = result;
                entry.score = contribution;
                fused.push_back(std::move(entry));
            } else {
                fused[it->second].score += contribution;
            }
        }
    }

    auto before = [](const SearchResult& a, const SearchResult& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.pageNum != b.pageNum) {
            return a.pageNum < b.pageNum;
        }
        if (a.blockId != b.blockId) {
            return a.blockId < b.blockId;
        }
        return a.regId < b.regId;
    };

    if (fused.size() > limit) {
        std::partial_sort(fused.begin(), fused.begin() + static_cast<ptrdiff_t>(limit), fused.end(),
                          before);
        fused.resize(limit);
    } else {
        std::sort(fused.begin(), fused.end(), before);
    }
    return fused;
}

} // namespace fusion

HybridSearch::HybridSearch(std::shared_ptr<ISearchIndex> keywordIndex,
                           std::shared_ptr<ISearchIndex> vectorIndex, HybridSearchConfig config)
    : keywordIndex_(std::move(keywordIndex)), vectorIndex_(std::move(vectorIndex)),
      config_(config) {}

Result<std::vector<SearchResult>> HybridSearch::search(const SearchQuery& queryIn) const {
    if (!config_.isValid()) {
        return errors::invalidArgument(
            fmt::format("Invalid fusion weights: keyword {} vector {}", config_.keyword_weight,
                        config_.vector_weight));
    }
    if (!keywordIndex_ || !vectorIndex_) {
        return errors::indexError("Hybrid search needs both a keyword and a vector index");
    }

    SearchQuery query = queryIn;
    if (query.limit == 0) {
        query.limit = config_.default_limit;
    }

    Result<std::vector<SearchResult>> keywordResults{std::vector<SearchResult>{}};
    Result<std::vector<SearchResult>> vectorResults{std::vector<SearchResult>{}};

    if (config_.parallel_search) {
        auto keywordFuture = std::async(std::launch::async,
                                        [&]() { return keywordIndex_->search(query); });
        auto vectorFuture =
            std::async(std::launch::async, [&]() { return vectorIndex_->search(query); });
        keywordResults = keywordFuture.get();
        vectorResults = vectorFuture.get();
    } else {
        keywordResults = keywordIndex_->search(query);
        vectorResults = vectorIndex_->search(query);
    }

    if (!keywordResults) {
        spdlog::error("Keyword search failed: {}", keywordResults.error().message);
        return errors::indexError(keywordIndex_->name() +
                                  " search failed: " + keywordResults.error().message);
    }
    if (!vectorResults) {
        spdlog::error("Vector search failed: {}", vectorResults.error().message);
        return errors::indexError(vectorIndex_->name() +
                                  " search failed: " + vectorResults.error().message);
    }

    std::vector<fusion::RankedList> lists;
    lists.push_back({config_.keyword_weight, std::move(keywordResults).value()});
    lists.push_back({config_.vector_weight, std::move(vectorResults).value()});

    spdlog::debug("Fusing {} keyword and {} vector results for '{}'", lists[0].results.size(),
                  lists[1].results.size(), query.text);
    return fusion::reciprocalRankFusion(lists, config_.rrf_k, query.limit);
}

} // namespace regdoc::search
