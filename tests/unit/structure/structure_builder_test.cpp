#include <gtest/gtest.h>
#include <regdoc/structure/structure_builder.h>

#include "../../common/regulation_fixture.h"

using namespace regdoc;
using namespace regdoc::structure;
using regdoc::test::makeBlock;
using regdoc::test::makePage;

TEST(StructureBuilderTest, LevelsFormTreeWithTwoRoots) {
    std::vector<PageDocument> pages = {
        makePage("r", 1,
                 {makeBlock("h1", "第一章 总则", BlockType::Heading), makeBlock("h2", "1.1 目的"),
                  makeBlock("h3", "1.2 范围"), makeBlock("h4", "1.2.1 细则"),
                  makeBlock("h5", "第二章 设计", BlockType::Heading)})};

    DocumentStructureBuilder builder;
    auto result = builder.build(pages);
    ASSERT_TRUE(result) << result.error().message;
    const auto& tree = result.value();

    EXPECT_EQ(tree.size(), 5u);
    ASSERT_EQ(tree.rootNodeIds().size(), 2u);

    const auto* first = tree.getNode(tree.rootNodeIds()[0]);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->sectionNumber, "第一章");
    EXPECT_EQ(first->childrenIds.size(), 2u);

    const auto* detail = tree.getNodeBySectionNumber("1.2.1");
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->level, 3);
    ASSERT_TRUE(detail->parentId.has_value());
    EXPECT_EQ(tree.getNode(*detail->parentId)->sectionNumber, "1.2");

    auto path = tree.getChapterPath(detail->nodeId);
    ASSERT_EQ(path.size(), 3u);
    EXPECT_EQ(path[0], "第一章 总则");
    EXPECT_EQ(path[2], "1.2.1 细则");
}

TEST(StructureBuilderTest, BlocksInheritChapterAcrossPages) {
    auto pages = test::sampleRegulation();
    DocumentStructureBuilder builder;
    auto result = builder.build(pages);
    ASSERT_TRUE(result) << result.error().message;
    const auto& tree = result.value();

    EXPECT_EQ(tree.size(), 7u);
    EXPECT_EQ(tree.rootNodeIds().size(), 3u);

    // The continued table on page 3 still belongs to 1.2
    const auto& continued = pages[2].contentBlocks[0];
    EXPECT_EQ(continued.blockId, "b7");
    ASSERT_TRUE(continued.chapterNodeId.has_value());
    EXPECT_EQ(tree.getNode(*continued.chapterNodeId)->sectionNumber, "1.2");

    // Page path is the chapter open at the top of the page
    ASSERT_EQ(pages[2].chapterPath.size(), 2u);
    EXPECT_EQ(pages[2].chapterPath[1], "1.2 适用范围");

    const auto& body = pages[2].contentBlocks[3];
    EXPECT_EQ(body.blockId, "b10");
    ASSERT_EQ(body.chapterPath.size(), 2u);
    EXPECT_EQ(body.chapterPath[0], "第二章 消防设计");
    EXPECT_EQ(body.chapterPath[1], "2.1 防火分区");

    const auto& heading = pages[0].contentBlocks[1];
    EXPECT_EQ(heading.blockType, BlockType::Heading);
    EXPECT_EQ(heading.headingLevel, 2);
}

TEST(StructureBuilderTest, TocPageRanges) {
    auto pages = test::sampleRegulation();
    DocumentStructureBuilder builder;
    auto result = builder.build(pages);
    ASSERT_TRUE(result);

    auto toc = result.value().toc(4);
    ASSERT_EQ(toc.size(), 3u);
    EXPECT_EQ(toc[0].title, "第一章 总则");
    EXPECT_EQ(toc[0].pageStart, 1);
    EXPECT_EQ(toc[0].pageEnd, 3);
    ASSERT_EQ(toc[0].children.size(), 2u);
    EXPECT_EQ(toc[0].children[1].pageStart, 2);
    EXPECT_EQ(toc[2].pageStart, 4);
    EXPECT_EQ(toc[2].pageEnd, 4);
}

TEST(StructureBuilderTest, SplitsInlineDirectContent) {
    std::vector<PageDocument> pages = {makePage(
        "r", 1,
        {makeBlock("h1", "2.3 消防车道\n消防车道的净宽度和净空高度均不应小于4.0m。",
                   BlockType::Heading),
         makeBlock("p1", "转弯半径应满足消防车转弯的要求。")})};

    DocumentStructureBuilder builder;
    auto result = builder.build(pages);
    ASSERT_TRUE(result);
    const auto* node = result.value().getNodeBySectionNumber("2.3");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->title, "消防车道");
    EXPECT_TRUE(node->hasDirectContent);
    EXPECT_EQ(node->directContent, "消防车道的净宽度和净空高度均不应小于4.0m。");

    const auto& blocks = pages[0].contentBlocks;
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].content, "2.3 消防车道");
    EXPECT_EQ(blocks[1].blockType, BlockType::SectionContent);
    EXPECT_EQ(blocks[1].blockId, "h1_content");
    EXPECT_EQ(blocks[1].orderInPage, 1);
    EXPECT_EQ(blocks[2].orderInPage, 2);
    EXPECT_EQ(node->contentBlockIds.size(), 3u);
}

TEST(StructureBuilderTest, BareNumberInBodyTextIsNotHeading) {
    std::vector<PageDocument> pages = {
        makePage("r", 1,
                 {makeBlock("h1", "第一章 总则", BlockType::Heading),
                  makeBlock("p1", "3 应设置环形消防车道"), makeBlock("h2", "4 术语", BlockType::Heading)})};

    DocumentStructureBuilder builder;
    auto result = builder.build(pages);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().size(), 2u);
    EXPECT_EQ(pages[0].contentBlocks[1].blockType, BlockType::Text);
    EXPECT_NE(result.value().getNodeBySectionNumber("4"), nullptr);
}

TEST(StructureBuilderTest, RejectsMalformedPageStreams) {
    DocumentStructureBuilder builder;

    std::vector<PageDocument> empty;
    auto none = builder.build(empty);
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::ParserError);

    std::vector<PageDocument> gap = {makePage("r", 1, {makeBlock("a", "x")}),
                                     makePage("r", 3, {makeBlock("b", "y")})};
    auto gapped = builder.build(gap);
    ASSERT_FALSE(gapped);
    EXPECT_EQ(gapped.error().code, ErrorCode::ParserError);

    std::vector<PageDocument> duplicate = {makePage("r", 1, {makeBlock("a", "x")}),
                                           makePage("r", 2, {makeBlock("a", "y")})};
    auto duplicated = builder.build(duplicate);
    ASSERT_FALSE(duplicated);
    EXPECT_EQ(duplicated.error().code, ErrorCode::ParserError);
}
