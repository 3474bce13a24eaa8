#include <gtest/gtest.h>
#include <regdoc/indexing/document_indexer.h>
#include <regdoc/ml/embedding_provider.h>
#include <regdoc/structure/structure_builder.h>

#include "../../common/regulation_fixture.h"
#include "../../support/temp_dir_scope.hpp"

using namespace regdoc;
using namespace regdoc::indexing;

class DocumentIndexerTest : public ::testing::Test {
protected:
    void SetUp() override {
        PageStoreConfig storeConfig;
        storeConfig.basePath = tmp_.path() / "pages";
        store_ = std::make_unique<storage::PageStore>(storeConfig);

        IndexConfig indexConfig;
        indexConfig.embeddingDimension = 128;
        auto keyword = search::createKeywordIndex(indexConfig);
        ASSERT_TRUE(keyword) << keyword.error().message;
        keyword_ = std::move(keyword).value();
        auto vector = search::createVectorIndex(indexConfig);
        ASSERT_TRUE(vector) << vector.error().message;
        vector_ = std::move(vector).value();

        indexer_ = std::make_unique<DocumentIndexer>(*store_, keyword_, vector_);
    }

    size_t keywordHits(const std::string& text) {
        search::SearchQuery query;
        query.text = text;
        query.regId = "fire_code";
        auto results = keyword_->search(query);
        EXPECT_TRUE(results) << results.error().message;
        return results ? results.value().size() : 0;
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("regdoc_ingest");
    std::unique_ptr<storage::PageStore> store_;
    std::shared_ptr<search::ISearchIndex> keyword_;
    std::shared_ptr<search::ISearchIndex> vector_;
    std::unique_ptr<DocumentIndexer> indexer_;
};

TEST_F(DocumentIndexerTest, IngestReportsEveryStage) {
    auto report = indexer_->ingest(test::sampleRegulation(), "建筑设计防火规范", "fire.pdf");
    ASSERT_TRUE(report) << report.error().message;
    const auto& r = report.value();

    EXPECT_EQ(r.info.regId, "fire_code");
    EXPECT_EQ(r.info.title, "建筑设计防火规范");
    EXPECT_EQ(r.info.totalPages, 4);
    EXPECT_EQ(r.pageCount, 4u);
    EXPECT_EQ(r.blockCount, 14u);
    EXPECT_EQ(r.chapterCount, 7u);
    EXPECT_EQ(r.tableCount, 1u);
    EXPECT_EQ(r.crossPageTableCount, 1u);
    EXPECT_EQ(r.keywordIndexed, 14u);
    // Short headings are below the embedding threshold
    EXPECT_GT(r.vectorIndexed, 0u);
    EXPECT_LT(r.vectorIndexed, r.blockCount);

    EXPECT_TRUE(store_->exists("fire_code"));
    auto structure = store_->loadDocumentStructure("fire_code");
    ASSERT_TRUE(structure);
    EXPECT_EQ(structure.value().size(), 7u);
    EXPECT_EQ(keyword_->count(std::string("fire_code")).value(), 14u);
}

TEST_F(DocumentIndexerTest, RecordsCarrySectionAndTableIds) {
    auto pages = test::sampleRegulation();
    structure::DocumentStructureBuilder structureBuilder;
    auto structure = structureBuilder.build(pages);
    ASSERT_TRUE(structure);
    structure::TableRegistryBuilder registryBuilder;
    auto registry = registryBuilder.build(pages);
    ASSERT_TRUE(registry);

    auto records = DocumentIndexer::buildRecords(pages, structure.value(), registry.value());
    ASSERT_EQ(records.size(), 14u);

    auto byId = [&](const std::string& blockId) -> const search::BlockRecord& {
        for (const auto& record : records) {
            if (record.block.blockId == blockId) {
                return record;
            }
        }
        return records.front();
    };

    const auto& body = byId("b10");
    EXPECT_EQ(body.pageNum, 3);
    EXPECT_EQ(body.sectionNumber, "2.1");
    ASSERT_EQ(body.chapterPath.size(), 2u);
    EXPECT_EQ(body.chapterPath[0], "第二章 消防设计");

    const auto& continued = byId("b7");
    EXPECT_EQ(continued.block.blockId, "b7");
    EXPECT_EQ(continued.tableId, "t1");
    EXPECT_EQ(continued.sectionNumber, "1.2");
}

TEST_F(DocumentIndexerTest, ReingestionReplacesOldEntries) {
    ASSERT_TRUE(indexer_->ingest(test::sampleRegulation(), "v1", "fire.pdf"));
    EXPECT_EQ(keywordHits("屋面"), 0u);
    EXPECT_GT(keywordHits("防火分区"), 0u);

    auto pages = test::sampleRegulation();
    pages.resize(1);
    pages[0].contentBlocks[2].content = "屋面构造应满足耐火极限要求。";
    auto report = indexer_->ingest(std::move(pages), "v2", "fire.pdf");
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().pageCount, 1u);

    EXPECT_EQ(keywordHits("防火分区"), 0u);
    EXPECT_EQ(keywordHits("屋面构造"), 1u);
    EXPECT_EQ(keyword_->count(std::string("fire_code")).value(), 3u);
    EXPECT_EQ(store_->loadInfo("fire_code").value().totalPages, 1);

    auto stale = store_->loadPage("fire_code", 2);
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, ErrorCode::PageNotFound);
}

TEST_F(DocumentIndexerTest, RemoveCollectionClearsStoreAndIndexes) {
    ASSERT_TRUE(indexer_->ingest(test::sampleRegulation(), "v1", "fire.pdf"));
    ASSERT_TRUE(indexer_->removeCollection("fire_code"));

    EXPECT_FALSE(store_->exists("fire_code"));
    EXPECT_EQ(keyword_->count().value(), 0u);
    EXPECT_EQ(vector_->count().value(), 0u);

    auto again = indexer_->removeCollection("fire_code");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::RegulationNotFound);
}

TEST_F(DocumentIndexerTest, RejectsEmptyAndInvalidInput) {
    auto empty = indexer_->ingest({}, "t", "s");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ParserError);

    auto pages = test::sampleRegulation("../escape");
    auto invalid = indexer_->ingest(std::move(pages), "t", "s");
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
}
