#include <gtest/gtest.h>
#include <regdoc/indexing/document_indexer.h>
#include <regdoc/resolve/annotation_lookup.h>

#include "../../common/regulation_fixture.h"
#include "../../support/temp_dir_scope.hpp"

using namespace regdoc;
using namespace regdoc::resolve;

TEST(AnnotationIdTest, NoteSpellingsShareOneForm) {
    EXPECT_EQ(normalizeAnnotationId("注1"), "注1");
    EXPECT_EQ(normalizeAnnotationId("注①"), "注1");
    EXPECT_EQ(normalizeAnnotationId("注一"), "注1");
    EXPECT_EQ(normalizeAnnotationId("（注1）"), "注1");
    EXPECT_EQ(normalizeAnnotationId("注 1："), "注1");
    EXPECT_EQ(normalizeAnnotationId("注十二"), "注12");
}

TEST(AnnotationIdTest, PlanLettersAreUpperCased) {
    EXPECT_EQ(normalizeAnnotationId("方案a"), "方案A");
    EXPECT_EQ(normalizeAnnotationId("方案甲"), "方案A");
    EXPECT_EQ(normalizeAnnotationId("方案乙"), "方案B");
    EXPECT_EQ(normalizeAnnotationId("选项c"), "选项C");
}

TEST(AnnotationIdTest, NormalisationIsIdempotent) {
    for (const char* raw : {"注①", "（注三）", "方案甲", "说明a"}) {
        const auto once = normalizeAnnotationId(raw);
        EXPECT_EQ(normalizeAnnotationId(once), once) << raw;
    }
    EXPECT_EQ(normalizeAnnotationId("说明a"), "说明A");
}

TEST(AnnotationIdTest, Classification) {
    EXPECT_EQ(classifyAnnotation("注1"), AnnotationKind::Note);
    EXPECT_EQ(classifyAnnotation("方案A"), AnnotationKind::Plan);
    EXPECT_EQ(classifyAnnotation("选项B"), AnnotationKind::Plan);
    EXPECT_EQ(classifyAnnotation("说明"), AnnotationKind::Any);
}

class AnnotationLookupTest : public ::testing::Test {
protected:
    void SetUp() override {
        PageStoreConfig config;
        config.basePath = tmp_.path() / "pages";
        store_ = std::make_unique<storage::PageStore>(config);
        indexing::DocumentIndexer indexer(*store_, nullptr, nullptr);
        auto report = indexer.ingest(test::sampleRegulation(), "建筑设计防火规范", "fire.pdf");
        ASSERT_TRUE(report) << report.error().message;
        lookup_ = std::make_unique<AnnotationLookup>(*store_);
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("regdoc_notes");
    std::unique_ptr<storage::PageStore> store_;
    std::unique_ptr<AnnotationLookup> lookup_;
};

TEST_F(AnnotationLookupTest, FindsAnnotationUnderAnySpelling) {
    for (const char* raw : {"注1", "注①", "注一", "（注1）"}) {
        auto found = lookup_->lookup("fire_code", raw);
        ASSERT_TRUE(found) << raw;
        EXPECT_EQ(found.value().pageNum, 3);
        EXPECT_EQ(found.value().normalizedId, "注1");
        EXPECT_EQ(found.value().content, "注①：建筑高度按室外设计地面至屋面面层计算。");
    }
}

TEST_F(AnnotationLookupTest, WrongHintFallsBackToFullScan) {
    auto found = lookup_->lookup("fire_code", "注1", 1);
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value().pageNum, 3);

    auto missingHint = lookup_->lookup("fire_code", "注1", 42);
    ASSERT_TRUE(missingHint);
    EXPECT_EQ(missingHint.value().pageNum, 3);
}

TEST_F(AnnotationLookupTest, ReportsMissingAnnotationsAndCollections) {
    auto missing = lookup_->lookup("fire_code", "注9");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::AnnotationNotFound);

    auto unknown = lookup_->lookup("no_such_code", "注1");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::RegulationNotFound);

    auto empty = lookup_->lookup("fire_code", "  ");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);
}

TEST_F(AnnotationLookupTest, SearchFiltersByContentAndKind) {
    auto all = lookup_->search("fire_code");
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].normalizedId, "注1");

    auto byText = lookup_->search("fire_code", "屋面");
    ASSERT_TRUE(byText);
    EXPECT_EQ(byText.value().size(), 1u);

    auto noText = lookup_->search("fire_code", "地下室");
    ASSERT_TRUE(noText);
    EXPECT_TRUE(noText.value().empty());

    auto plans = lookup_->search("fire_code", {}, AnnotationKind::Plan);
    ASSERT_TRUE(plans);
    EXPECT_TRUE(plans.value().empty());
}

TEST(AnnotationLookupPageStoreTest, PagesSavedOneByOneAreSearchable) {
    auto tmp = test_support::TempDirScope::unique_under("regdoc_notes_pages");
    PageStoreConfig config;
    config.basePath = tmp.path() / "pages";
    storage::PageStore store(config);

    auto page = test::makePage("r1", 1, {test::makeBlock("b1", "屋顶承重构件的耐火极限。")});
    Annotation note;
    note.annotationId = "注1";
    note.content = "注1：不上人屋面除外。";
    page.annotations.push_back(note);
    ASSERT_TRUE(store.savePage(page));

    AnnotationLookup lookup(store);
    auto hinted = lookup.lookup("r1", "注①", 1);
    ASSERT_TRUE(hinted) << hinted.error().message;
    EXPECT_EQ(hinted.value().pageNum, 1);
    EXPECT_EQ(hinted.value().normalizedId, "注1");

    auto scanned = lookup.lookup("r1", "注一");
    ASSERT_TRUE(scanned) << scanned.error().message;

    auto all = lookup.search("r1");
    ASSERT_TRUE(all) << all.error().message;
    EXPECT_EQ(all.value().size(), 1u);
}
