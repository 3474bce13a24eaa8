#include <gtest/gtest.h>
#include <regdoc/structure/structure_builder.h>
#include <regdoc/structure/table_registry.h>

#include "../../common/regulation_fixture.h"

using namespace regdoc;
using namespace regdoc::structure;
using regdoc::test::makeBlock;
using regdoc::test::makePage;
using regdoc::test::makeTable;

class TableRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        pages_ = test::sampleRegulation();
        DocumentStructureBuilder structureBuilder;
        ASSERT_TRUE(structureBuilder.build(pages_));
        auto built = TableRegistryBuilder().build(pages_);
        ASSERT_TRUE(built) << built.error().message;
        registry_ = std::move(built).value();
    }

    std::vector<PageDocument> pages_;
    TableRegistry registry_;
};

TEST_F(TableRegistryTest, StitchesTruncatedTableIntoOneEntry) {
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.crossPageCount(), 1u);

    const auto* entry = registry_.find("t1");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->isCrossPage);
    EXPECT_EQ(entry->pageStart, 2);
    EXPECT_EQ(entry->pageEnd, 3);
    ASSERT_EQ(entry->segments.size(), 2u);
    EXPECT_EQ(entry->segments[1].segmentIndex, 1);
    EXPECT_EQ(entry->rowCount, 4);
    EXPECT_EQ(entry->colCount, 2);
    ASSERT_EQ(entry->colHeaders.size(), 2u);
    EXPECT_EQ(entry->colHeaders[0], "类别");
    ASSERT_EQ(entry->chapterPath.size(), 2u);
    EXPECT_EQ(entry->chapterPath[1], "1.2 适用范围");
    EXPECT_NE(entry->mergedMarkdown.find("| 仓库 | 24m |"), std::string::npos);
}

TEST_F(TableRegistryTest, LookupsBySegmentBlockAndCaption) {
    EXPECT_EQ(registry_.find("t1_p3"), registry_.find("t1"));
    EXPECT_EQ(registry_.find("b7"), registry_.find("t1"));
    EXPECT_EQ(registry_.findByCaption("表1-1"), registry_.find("t1"));
    EXPECT_EQ(registry_.findByCaption("表 1－1"), registry_.find("t1"));
    EXPECT_EQ(registry_.find("missing"), nullptr);

    auto onPage = registry_.getTablesOnPage(3);
    ASSERT_EQ(onPage.size(), 1u);
    EXPECT_EQ(onPage[0]->tableId, "t1");

    auto full = registry_.getFullTable("nope");
    ASSERT_FALSE(full);
    EXPECT_EQ(full.error().code, ErrorCode::TableNotFound);
}

TEST_F(TableRegistryTest, ContinuationSegmentIsStamped) {
    const auto& continued = pages_[2].contentBlocks[0];
    ASSERT_TRUE(continued.tableMeta.has_value());
    ASSERT_TRUE(continued.tableMeta->masterTableId.has_value());
    EXPECT_EQ(*continued.tableMeta->masterTableId, "t1");
    EXPECT_EQ(continued.tableMeta->segmentIndex, 1);
}

TEST(TableRegistryBuilderTest, UnflaggedPagesKeepTablesApart) {
    std::vector<PageDocument> pages = {
        makePage("r", 1,
                 {makeTable("a", "| x | y |\n| --- | --- |\n| 1 | 2 |", "ta", "表1 甲", true)}),
        makePage("r", 2, {makeTable("b", "| 3 | 4 |", "tb", "", false)})};
    // Neither continues_to_next nor continues_from_prev is set

    auto registry = TableRegistryBuilder().build(pages);
    ASSERT_TRUE(registry);
    EXPECT_EQ(registry.value().size(), 2u);
    EXPECT_EQ(registry.value().crossPageCount(), 0u);
}

TEST(TableRegistryBuilderTest, OnlyFirstTableOnContinuationPageExtends) {
    auto first = makePage("r", 1, {makeTable("a", "| x | y |\n| --- | --- |\n| 1 | 2 |", "ta", "", true)});
    first.continuesToNext = true;
    auto second = makePage("r", 2,
                           {makeBlock("t", "文字"), makeTable("b", "| 3 | 4 |", "tb", "", false),
                            makeTable("c", "| p | q |\n| --- | --- |\n| 5 | 6 |", "tc", "", false)});
    second.continuesFromPrev = true;
    std::vector<PageDocument> pages = {first, second};

    auto registry = TableRegistryBuilder().build(pages);
    ASSERT_TRUE(registry);
    EXPECT_EQ(registry.value().size(), 2u);
    ASSERT_NE(registry.value().find("ta"), nullptr);
    EXPECT_EQ(registry.value().find("ta")->rowCount, 2);
    EXPECT_EQ(registry.value().find("tb"), registry.value().find("ta"));
    ASSERT_NE(registry.value().find("tc"), nullptr);
    EXPECT_FALSE(registry.value().find("tc")->isCrossPage);
}

TEST(TableRegistryBuilderTest, MergedMarkdownKeepsSegmentNotesInPageOrder) {
    auto first = makePage(
        "r", 1, {makeTable("a", "| x | y |\n| --- | --- |\n| 1 | 2 |\n注1：首页说明", "ta", "", true)});
    first.continuesToNext = true;
    auto second =
        makePage("r", 2, {makeTable("b", "| 3 | 4 |\n注：本表数据为示例", "tb", "", false)});
    second.continuesFromPrev = true;
    std::vector<PageDocument> pages = {first, second};

    auto registry = TableRegistryBuilder().build(pages);
    ASSERT_TRUE(registry);
    const auto* entry = registry.value().find("ta");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->rowCount, 2);
    EXPECT_EQ(entry->mergedMarkdown,
              "| x | y |\n| --- | --- |\n| 1 | 2 |\n| 3 | 4 |\n注1：首页说明\n注：本表数据为示例");
}
