#include <gtest/gtest.h>
#include <regdoc/ml/embedding_provider.h>
#include <regdoc/search/sqlite_vector_index.h>

#include <algorithm>
#include <cmath>

using namespace regdoc;
using namespace regdoc::ml;

TEST(HashingEmbeddingProviderTest, ProducesNormalisedVectorsOfConfiguredSize) {
    HashingEmbeddingProvider provider(128);
    ASSERT_TRUE(provider.initialize());
    auto embedding = provider.generateEmbedding("防火分区的最大允许建筑面积");
    ASSERT_TRUE(embedding);
    ASSERT_EQ(embedding.value().size(), 128u);

    double norm = 0.0;
    for (float v : embedding.value()) {
        norm += static_cast<double>(v) * v;
    }
    EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-5);
}

TEST(HashingEmbeddingProviderTest, IsDeterministicAndBatchConsistent) {
    HashingEmbeddingProvider provider(64);
    ASSERT_TRUE(provider.initialize());
    auto single = provider.generateEmbedding("消防车道");
    auto batch = provider.generateBatchEmbeddings({"消防车道", "疏散楼梯"});
    ASSERT_TRUE(single);
    ASSERT_TRUE(batch);
    ASSERT_EQ(batch.value().size(), 2u);
    EXPECT_EQ(single.value(), batch.value()[0]);
}

TEST(HashingEmbeddingProviderTest, SharedVocabularyScoresHigher) {
    HashingEmbeddingProvider provider(512);
    ASSERT_TRUE(provider.initialize());
    auto query = provider.generateEmbedding("消防车道净宽度");
    auto related = provider.generateEmbedding("消防车道的净宽度不应小于4m");
    auto unrelated = provider.generateEmbedding("住宅日照标准");
    ASSERT_TRUE(query && related && unrelated);

    float near = search::SqliteVectorIndex::cosineSimilarity(query.value(), related.value());
    float far = search::SqliteVectorIndex::cosineSimilarity(query.value(), unrelated.value());
    EXPECT_GT(near, 0.5f);
    EXPECT_GT(near, far);
}

TEST(HashingEmbeddingProviderTest, RequiresInitialisation) {
    HashingEmbeddingProvider provider(16);
    auto embedding = provider.generateEmbedding("text");
    ASSERT_FALSE(embedding);
    EXPECT_EQ(embedding.error().code, ErrorCode::IndexError);

    HashingEmbeddingProvider zero(0);
    auto init = zero.initialize();
    ASSERT_FALSE(init);
    EXPECT_EQ(init.error().code, ErrorCode::InvalidArgument);
}

TEST(EmbeddingProviderRegistryTest, CreatesRegisteredProviders) {
    auto names = getRegisteredEmbeddingProviders();
    EXPECT_NE(std::find(names.begin(), names.end(), "hashing"), names.end());

    auto provider = createEmbeddingProvider("hashing", 32);
    ASSERT_NE(provider, nullptr);
    EXPECT_TRUE(provider->isAvailable());
    EXPECT_EQ(provider->getEmbeddingDimension(), 32u);

    EXPECT_EQ(createEmbeddingProvider("no-such-model", 32), nullptr);
}

TEST(EmbeddingProviderRegistryTest, CustomFactoriesCanBeRegistered) {
    registerEmbeddingProvider("hashing-small", [](size_t) -> std::unique_ptr<IEmbeddingProvider> {
        return std::make_unique<HashingEmbeddingProvider>(8);
    });
    auto provider = createEmbeddingProvider("hashing-small", 512);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->getEmbeddingDimension(), 8u);
}
