#include <gtest/gtest.h>
#include <regdoc/indexing/document_indexer.h>
#include <regdoc/resolve/reference_resolver.h>

#include "../../common/regulation_fixture.h"
#include "../../support/temp_dir_scope.hpp"

using namespace regdoc;
using namespace regdoc::resolve;

TEST(ReferenceParserTest, RecognisesEachReferenceKind) {
    auto chapter = parseReference("详见第六章的规定");
    ASSERT_TRUE(chapter);
    EXPECT_EQ(chapter->type, ReferenceType::Chapter);
    EXPECT_EQ(chapter->target, "第六章");
    EXPECT_EQ(chapter->number, 6);
    EXPECT_FALSE(chapter->isSectionMarker);

    auto section = parseReference("见第三节");
    ASSERT_TRUE(section);
    EXPECT_EQ(section->type, ReferenceType::Chapter);
    EXPECT_TRUE(section->isSectionMarker);
    EXPECT_EQ(section->number, 3);

    auto table = parseReference("参见表6-2");
    ASSERT_TRUE(table);
    EXPECT_EQ(table->type, ReferenceType::Table);
    EXPECT_EQ(table->target, "表6-2");

    auto dotted = parseReference("应按2.1.4执行");
    ASSERT_TRUE(dotted);
    EXPECT_EQ(dotted->type, ReferenceType::Section);
    EXPECT_EQ(dotted->target, "2.1.4");

    auto note = parseReference("见注1");
    ASSERT_TRUE(note);
    EXPECT_EQ(note->type, ReferenceType::Annotation);
    EXPECT_EQ(note->target, "注1");

    auto plan = parseReference("采用方案甲");
    ASSERT_TRUE(plan);
    EXPECT_EQ(plan->type, ReferenceType::Annotation);
    EXPECT_EQ(plan->target, "方案甲");

    auto appendix = parseReference("见附录a");
    ASSERT_TRUE(appendix);
    EXPECT_EQ(appendix->type, ReferenceType::Appendix);
    EXPECT_EQ(appendix->target, "附录A");

    auto article = parseReference("依照第十二条");
    ASSERT_TRUE(article);
    EXPECT_EQ(article->type, ReferenceType::Article);
    EXPECT_EQ(article->number, 12);
}

TEST(ReferenceParserTest, PlainTextHasNoReference) {
    EXPECT_FALSE(parseReference("建筑高度按室外设计地面计算").has_value());
    EXPECT_FALSE(parseReference("").has_value());
}

class ReferenceResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        PageStoreConfig config;
        config.basePath = tmp_.path() / "pages";
        store_ = std::make_unique<storage::PageStore>(config);
        indexing::DocumentIndexer indexer(*store_, nullptr, nullptr);
        auto report = indexer.ingest(test::sampleRegulation(), "建筑设计防火规范", "fire.pdf");
        ASSERT_TRUE(report) << report.error().message;
        annotations_ = std::make_unique<AnnotationLookup>(*store_);
        resolver_ = std::make_unique<ReferenceResolver>(*store_, *annotations_);
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("regdoc_refs");
    std::unique_ptr<storage::PageStore> store_;
    std::unique_ptr<AnnotationLookup> annotations_;
    std::unique_ptr<ReferenceResolver> resolver_;
};

TEST_F(ReferenceResolverTest, ResolvesChapters) {
    auto first = resolver_->resolve("fire_code", "见第一章");
    ASSERT_TRUE(first) << first.error().message;
    EXPECT_EQ(first.value().type, ReferenceType::Chapter);
    EXPECT_EQ(first.value().pageNum, 1);
    EXPECT_EQ(first.value().sectionNumber, "第一章");

    auto second = resolver_->resolve("fire_code", "见第二章");
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_EQ(second.value().pageNum, 3);
    ASSERT_EQ(second.value().chapterPath.size(), 1u);
    EXPECT_EQ(second.value().chapterPath[0], "第二章 消防设计");
    EXPECT_EQ(second.value().source, "fire_code P3 (第二章 消防设计)");
}

TEST_F(ReferenceResolverTest, ResolvesCrossPageTable) {
    auto table = resolver_->resolve("fire_code", "参见表1-1");
    ASSERT_TRUE(table) << table.error().message;
    EXPECT_EQ(table.value().type, ReferenceType::Table);
    EXPECT_EQ(table.value().pageNum, 2);
    EXPECT_EQ(table.value().pageEnd, 3);
    EXPECT_EQ(table.value().tableId, "t1");
    EXPECT_EQ(table.value().source, "fire_code P2-3");
    EXPECT_NE(table.value().preview.find("住宅"), std::string::npos);
}

TEST_F(ReferenceResolverTest, ResolvesDottedSection) {
    auto section = resolver_->resolve("fire_code", "见2.1");
    ASSERT_TRUE(section) << section.error().message;
    EXPECT_EQ(section.value().type, ReferenceType::Section);
    EXPECT_EQ(section.value().pageNum, 3);
    ASSERT_EQ(section.value().chapterPath.size(), 2u);
    EXPECT_EQ(section.value().chapterPath[1], "2.1 防火分区");
    EXPECT_NE(section.value().preview.find("防火分区"), std::string::npos);

    auto nested = resolver_->resolve("fire_code", "按2.1.1执行");
    ASSERT_TRUE(nested);
    EXPECT_EQ(nested.value().pageNum, 4);
}

TEST_F(ReferenceResolverTest, ResolvesAnnotation) {
    auto note = resolver_->resolve("fire_code", "见注1");
    ASSERT_TRUE(note) << note.error().message;
    EXPECT_EQ(note.value().type, ReferenceType::Annotation);
    EXPECT_EQ(note.value().pageNum, 3);
    EXPECT_EQ(note.value().annotationId, "注①");
    EXPECT_NE(note.value().preview.find("室外设计地面"), std::string::npos);
}

TEST_F(ReferenceResolverTest, UnresolvableReferencesFail) {
    auto missingNote = resolver_->resolve("fire_code", "见注99");
    ASSERT_FALSE(missingNote);
    EXPECT_EQ(missingNote.error().code, ErrorCode::ReferenceResolutionFailed);

    auto missingChapter = resolver_->resolve("fire_code", "见第九章");
    ASSERT_FALSE(missingChapter);
    EXPECT_EQ(missingChapter.error().code, ErrorCode::ReferenceResolutionFailed);

    auto missingTable = resolver_->resolve("fire_code", "见表9-9");
    ASSERT_FALSE(missingTable);
    EXPECT_EQ(missingTable.error().code, ErrorCode::ReferenceResolutionFailed);

    auto noPattern = resolver_->resolve("fire_code", "按有关规定执行");
    ASSERT_FALSE(noPattern);
    EXPECT_EQ(noPattern.error().code, ErrorCode::ReferenceResolutionFailed);
    EXPECT_EQ(noPattern.error().details.target, "按有关规定执行");
}

TEST_F(ReferenceResolverTest, UnknownCollection) {
    auto result = resolver_->resolve("other_code", "见第一章");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RegulationNotFound);
}

TEST_F(ReferenceResolverTest, ResolutionSerialisesToJson) {
    auto table = resolver_->resolve("fire_code", "参见表1-1");
    ASSERT_TRUE(table);
    nlohmann::json j = table.value();
    EXPECT_EQ(j["type"], "table");
    EXPECT_EQ(j["page_num"], 2);
    EXPECT_EQ(j["page_end"], 3);
    EXPECT_EQ(j["table_id"], "t1");
    EXPECT_FALSE(j.contains("annotation_id"));
}

TEST(ReferenceResolverPageStoreTest, ResolvesAgainstPagesSavedOneByOne) {
    auto tmp = test_support::TempDirScope::unique_under("regdoc_refs_pages");
    PageStoreConfig config;
    config.basePath = tmp.path() / "pages";
    storage::PageStore store(config);
    for (const auto& page : test::sampleRegulation()) {
        ASSERT_TRUE(store.savePage(page));
    }
    AnnotationLookup annotations(store);
    ReferenceResolver resolver(store, annotations);

    auto chapter = resolver.resolve("fire_code", "见第二章");
    ASSERT_TRUE(chapter) << chapter.error().message;
    EXPECT_EQ(chapter.value().pageNum, 3);

    auto table = resolver.resolve("fire_code", "参见表1-1");
    ASSERT_TRUE(table) << table.error().message;
    EXPECT_EQ(table.value().tableId, "t1");
    EXPECT_EQ(table.value().source, "fire_code P2-3");

    auto note = resolver.resolve("fire_code", "见注1");
    ASSERT_TRUE(note) << note.error().message;
    EXPECT_EQ(note.value().pageNum, 3);
}
