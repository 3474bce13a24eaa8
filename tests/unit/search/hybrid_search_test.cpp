#include <gtest/gtest.h>
#include <regdoc/search/hybrid_search.h>

using namespace regdoc;
using namespace regdoc::search;

namespace {

SearchResult hit(const std::string& blockId, int page, double score = 1.0,
                 const std::string& regId = "fire_code") {
    SearchResult r;
    r.regId = regId;
    r.pageNum = page;
    r.blockId = blockId;
    r.score = score;
    r.snippet = "snippet of " + blockId;
    return r;
}

// Returns a fixed ranking and records the limit it was asked for
class FixedIndex : public ISearchIndex {
public:
    FixedIndex(std::string name, std::vector<SearchResult> results, bool fail = false)
        : name_(std::move(name)), results_(std::move(results)), fail_(fail) {}

    std::string name() const override { return name_; }
    Result<void> indexBlock(const BlockRecord&) override { return Result<void>(); }
    Result<size_t> indexBlocks(const std::vector<BlockRecord>& records) override {
        return records.size();
    }
    Result<std::vector<SearchResult>> search(const SearchQuery& query) override {
        lastLimit = query.limit;
        if (fail_) {
            return Error{ErrorCode::DatabaseError, "disk I/O error"};
        }
        return results_;
    }
    Result<void> deleteCollection(const RegId&) override { return Result<void>(); }
    Result<size_t> count(const std::optional<RegId>& = std::nullopt) override {
        return results_.size();
    }

    size_t lastLimit = 0;

private:
    std::string name_;
    std::vector<SearchResult> results_;
    bool fail_;
};

HybridSearchConfig sequentialConfig() {
    HybridSearchConfig config;
    config.parallel_search = false;
    return config;
}

} // namespace

TEST(ReciprocalRankFusionTest, WeightedContributionsDecideOrder) {
    std::vector<fusion::RankedList> lists;
    lists.push_back({0.4, {hit("x", 1), hit("y", 2)}});
    lists.push_back({0.6, {hit("y", 2), hit("z", 3)}});

    auto fused = fusion::reciprocalRankFusion(lists, 60, 10);
    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].blockId, "y");
    EXPECT_EQ(fused[1].blockId, "z");
    EXPECT_EQ(fused[2].blockId, "x");

    EXPECT_NEAR(fused[0].score, 0.4 / 62.0 + 0.6 / 61.0, 1e-12);
    EXPECT_NEAR(fused[1].score, 0.6 / 62.0, 1e-12);
    EXPECT_NEAR(fused[2].score, 0.4 / 61.0, 1e-12);
}

TEST(ReciprocalRankFusionTest, TiesGoToSmallerPage) {
    std::vector<fusion::RankedList> lists;
    lists.push_back({0.5, {hit("late", 9)}});
    lists.push_back({0.5, {hit("early", 2)}});

    auto fused = fusion::reciprocalRankFusion(lists, 60, 10);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].blockId, "early");
    EXPECT_EQ(fused[1].blockId, "late");
}

TEST(ReciprocalRankFusionTest, SameBlockIdOnDifferentPagesStaysDistinct) {
    std::vector<fusion::RankedList> lists;
    lists.push_back({1.0, {hit("b1", 1), hit("b1", 2, 1.0, "other_code")}});

    auto fused = fusion::reciprocalRankFusion(lists, 60, 1);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_EQ(fused[0].pageNum, 1);
    EXPECT_EQ(fused[0].snippet, "snippet of b1");
}

TEST(HybridSearchTest, FusesBothBackends) {
    auto keyword = std::make_shared<FixedIndex>("fts5", std::vector<SearchResult>{
                                                            hit("x", 1, 7.5), hit("y", 2, 3.1)});
    auto vector = std::make_shared<FixedIndex>("sqlite_vector", std::vector<SearchResult>{
                                                                    hit("y", 2, 0.9),
                                                                    hit("z", 3, 0.4)});
    HybridSearch hybrid(keyword, vector, sequentialConfig());

    SearchQuery query;
    query.text = "防火分区";
    query.limit = 2;
    auto results = hybrid.search(query);
    ASSERT_TRUE(results) << results.error().message;
    ASSERT_EQ(results.value().size(), 2u);
    EXPECT_EQ(results.value()[0].blockId, "y");
    EXPECT_EQ(keyword->lastLimit, 2u);
    EXPECT_EQ(vector->lastLimit, 2u);
}

TEST(HybridSearchTest, ZeroLimitUsesDefault) {
    auto keyword = std::make_shared<FixedIndex>("fts5", std::vector<SearchResult>{});
    auto vector = std::make_shared<FixedIndex>("sqlite_vector", std::vector<SearchResult>{});
    auto config = sequentialConfig();
    config.default_limit = 7;
    HybridSearch hybrid(keyword, vector, config);

    SearchQuery query;
    query.text = "疏散";
    query.limit = 0;
    auto results = hybrid.search(query);
    ASSERT_TRUE(results);
    EXPECT_TRUE(results.value().empty());
    EXPECT_EQ(keyword->lastLimit, 7u);
}

TEST(HybridSearchTest, ParallelModeMatchesSequential) {
    auto keyword = std::make_shared<FixedIndex>("fts5", std::vector<SearchResult>{hit("x", 1)});
    auto vector = std::make_shared<FixedIndex>("sqlite_vector", std::vector<SearchResult>{hit("x", 1)});
    HybridSearch hybrid(keyword, vector);

    SearchQuery query;
    query.text = "防火";
    auto results = hybrid.search(query);
    ASSERT_TRUE(results);
    ASSERT_EQ(results.value().size(), 1u);
    EXPECT_NEAR(results.value()[0].score, 1.0 / 61.0, 1e-12);
}

TEST(HybridSearchTest, BackendFailureBecomesIndexError) {
    auto keyword = std::make_shared<FixedIndex>("fts5", std::vector<SearchResult>{hit("x", 1)});
    auto vector = std::make_shared<FixedIndex>("sqlite_vector", std::vector<SearchResult>{}, true);
    HybridSearch hybrid(keyword, vector, sequentialConfig());

    SearchQuery query;
    query.text = "防火";
    auto results = hybrid.search(query);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::IndexError);
    EXPECT_NE(results.error().message.find("sqlite_vector"), std::string::npos);
}

TEST(HybridSearchTest, RejectsInvalidWeights) {
    auto keyword = std::make_shared<FixedIndex>("fts5", std::vector<SearchResult>{});
    auto vector = std::make_shared<FixedIndex>("sqlite_vector", std::vector<SearchResult>{});
    auto config = sequentialConfig();
    config.keyword_weight = 0.0;
    config.vector_weight = 0.0;
    HybridSearch hybrid(keyword, vector, config);

    SearchQuery query;
    query.text = "防火";
    auto results = hybrid.search(query);
    ASSERT_FALSE(results);
    EXPECT_EQ(results.error().code, ErrorCode::InvalidArgument);
}
