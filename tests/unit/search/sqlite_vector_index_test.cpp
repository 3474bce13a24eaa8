#include <gtest/gtest.h>
#include <regdoc/ml/embedding_provider.h>
#include <regdoc/search/search_index.h>
#include <regdoc/search/sqlite_vector_index.h>

#include "../../common/regulation_fixture.h"

using namespace regdoc;
using namespace regdoc::search;
using regdoc::test::makeRecord;

namespace {

constexpr size_t kDim = 256;

IndexConfig vectorConfig() {
    IndexConfig config;
    config.embeddingDimension = kDim;
    config.minEmbedChars = 5;
    return config;
}

std::shared_ptr<ml::IEmbeddingProvider> hashingProvider(size_t dim) {
    auto provider = std::make_shared<ml::HashingEmbeddingProvider>(dim);
    EXPECT_TRUE(provider->initialize());
    return provider;
}

} // namespace

class SqliteVectorIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto created = createVectorIndex(vectorConfig(), hashingProvider(kDim));
        ASSERT_TRUE(created) << created.error().message;
        index_ = std::move(created).value();

        std::vector<BlockRecord> records = {
            makeRecord("fire_code", 1, "b1", "消防车道的净宽度和净空高度均不应小于4m",
                       {"第一章 总则"}, "1.1"),
            makeRecord("fire_code", 2, "b2", "住宅建筑的日照标准应符合城市规划要求",
                       {"第二章 住宅"}, "2.1"),
            makeRecord("fire_code", 3, "b3", "疏散楼梯间应能天然采光和自然通风",
                       {"第三章 疏散"}, "3.1"),
            makeRecord("fire_code", 3, "b4", "注"),
        };
        auto indexed = index_->indexBlocks(records);
        ASSERT_TRUE(indexed) << indexed.error().message;
        embedded_ = indexed.value();
    }

    std::unique_ptr<ISearchIndex> index_;
    size_t embedded_ = 0;
};

TEST_F(SqliteVectorIndexTest, ShortBlocksAreNotEmbedded) {
    EXPECT_EQ(embedded_, 3u);
    EXPECT_EQ(index_->count().value(), 3u);
}

TEST_F(SqliteVectorIndexTest, ShortenedBlockDropsItsOldVector) {
    auto shortened = index_->indexBlocks({makeRecord("fire_code", 1, "b1", "见下表")});
    ASSERT_TRUE(shortened) << shortened.error().message;
    EXPECT_EQ(shortened.value(), 0u);
    EXPECT_EQ(index_->count().value(), 2u);

    SearchQuery query;
    query.text = "消防车道净宽度";
    auto results = index_->search(query);
    ASSERT_TRUE(results) << results.error().message;
    for (const auto& hit : results.value()) {
        EXPECT_NE(hit.blockId, "b1");
    }
}

TEST_F(SqliteVectorIndexTest, NearestBlockRanksFirst) {
    SearchQuery query;
    query.text = "消防车道净宽度";
    auto results = index_->search(query);
    ASSERT_TRUE(results) << results.error().message;
    ASSERT_FALSE(results.value().empty());
    const auto& top = results.value().front();
    EXPECT_EQ(top.blockId, "b1");
    EXPECT_EQ(top.pageNum, 1);
    EXPECT_GT(top.score, 0.0);
    EXPECT_EQ(top.snippet, "消防车道的净宽度和净空高度均不应小于4m");
    for (size_t i = 1; i < results.value().size(); ++i) {
        EXPECT_GE(results.value()[i - 1].score, results.value()[i].score);
    }
}

TEST_F(SqliteVectorIndexTest, FiltersApplyBeforeScoring) {
    SearchQuery query;
    query.text = "消防车道净宽度";
    query.sectionNumber = "3";
    auto results = index_->search(query);
    ASSERT_TRUE(results);
    for (const auto& r : results.value()) {
        EXPECT_EQ(r.blockId, "b3");
    }

    query.sectionNumber.reset();
    query.regId = "other_code";
    auto none = index_->search(query);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_F(SqliteVectorIndexTest, DeleteCollectionRemovesVectors) {
    ASSERT_TRUE(index_->deleteCollection("fire_code"));
    EXPECT_EQ(index_->count().value(), 0u);
}

TEST(SqliteVectorIndexSetupTest, RejectsDimensionMismatch) {
    auto created = createVectorIndex(vectorConfig(), hashingProvider(kDim / 2));
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::IndexError);
}

TEST(SqliteVectorIndexSetupTest, RejectsUnknownProvider) {
    auto config = vectorConfig();
    config.embeddingProvider = "missing-model";
    auto created = createVectorIndex(config);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error().code, ErrorCode::IndexError);
}

TEST(SqliteVectorIndexSetupTest, BuildsDefaultProviderFromRegistry) {
    auto created = createVectorIndex(vectorConfig());
    ASSERT_TRUE(created) << created.error().message;
    EXPECT_EQ(created.value()->name(), "sqlite_vector");
}

TEST(SqliteVectorIndexSetupTest, CosineSimilarityBasics) {
    std::vector<float> a = {1.0f, 0.0f};
    std::vector<float> b = {0.0f, 1.0f};
    std::vector<float> c = {2.0f, 0.0f};
    EXPECT_NEAR(SqliteVectorIndex::cosineSimilarity(a, b), 0.0f, 1e-6);
    EXPECT_NEAR(SqliteVectorIndex::cosineSimilarity(a, c), 1.0f, 1e-6);
    EXPECT_EQ(SqliteVectorIndex::cosineSimilarity(a, {1.0f}), 0.0f);
}
