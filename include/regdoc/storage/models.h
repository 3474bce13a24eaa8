#pragma once

#include <regdoc/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regdoc {

enum class BlockType { Text, Table, Heading, List, SectionContent };

const char* toString(BlockType type);
Result<BlockType> parseBlockType(std::string_view name);

struct TableCell {
    int row = 0;
    int col = 0;
    std::string content;
    int rowSpan = 1;
    int colSpan = 1;
};

struct TableMeta {
    std::string tableId;
    std::string caption;
    bool isTruncated = false;
    int rowCount = 0;
    int colCount = 0;
    std::vector<std::string> colHeaders;
    std::vector<std::string> rowHeaders;
    std::vector<TableCell> cells;
    // Set on continuation segments of a cross-page table
    std::optional<std::string> masterTableId;
    int segmentIndex = 0;
};

struct ContentBlock {
    std::string blockId;
    BlockType blockType = BlockType::Text;
    std::string content; // markdown
    int orderInPage = 0;
    std::optional<TableMeta> tableMeta;
    std::optional<std::string> chapterNodeId;
    std::optional<int> headingLevel;
    std::vector<std::string> chapterPath;
};

struct Annotation {
    std::string annotationId;
    std::string normalizedId;
    std::string content;
    int pageNum = 0;
    std::vector<std::string> relatedBlocks;
};

struct PageDocument {
    RegId regId;
    int pageNum = 0;
    std::vector<std::string> chapterPath;
    std::vector<ContentBlock> contentBlocks;
    bool continuesFromPrev = false;
    bool continuesToNext = false;
    std::vector<Annotation> annotations;

    std::string source() const;
    std::string markdown() const;
    std::vector<const ContentBlock*> tables() const;
    const ContentBlock* findBlock(std::string_view blockId) const;

    // First table block, the continuation candidate on a continues_from_prev page
    const ContentBlock* firstTable() const;
    // Last table flagged is_truncated when the page continues_to_next, else null
    const ContentBlock* truncatedTable() const;
};

struct ChapterNode {
    std::string nodeId;
    std::string sectionNumber;
    std::string title;
    int level = 1;
    int pageNum = 0;
    std::optional<std::string> parentId;
    std::vector<std::string> childrenIds;
    std::vector<std::string> contentBlockIds;
    bool hasDirectContent = false;
    std::string directContent;

    std::string fullTitle() const;
};

struct TocItem {
    std::string nodeId;
    std::string title;
    int level = 1;
    int pageStart = 0;
    int pageEnd = 0;
    std::vector<TocItem> children;
};

struct SearchResult {
    RegId regId;
    int pageNum = 0;
    std::vector<std::string> chapterPath;
    std::string blockId;
    std::string snippet;
    double score = 0.0;

    std::string source() const;
};

struct PageContent {
    RegId regId;
    int startPage = 0;
    int endPage = 0;
    std::string contentMarkdown;
    std::vector<PageDocument> pages;
    bool hasMergedTables = false;
    bool continuesToNext = false;
    bool truncated = false;
    std::vector<int> skippedPages;

    std::string source() const;
};

struct RegulationInfo {
    RegId regId;
    std::string title;
    std::string sourceFile;
    int totalPages = 0;
    std::string indexedAt; // ISO-8601
};

struct TableSegment {
    std::string segmentId;
    int pageNum = 0;
    std::string blockId;
    int segmentIndex = 0;
    bool isHeader = false;
    int rowStart = 0;
    int rowEnd = 0;
};

struct TableEntry {
    std::string tableId;
    std::string caption;
    std::vector<std::string> chapterPath;
    int pageStart = 0;
    int pageEnd = 0;
    bool isCrossPage = false;
    std::vector<TableSegment> segments;
    int rowCount = 0;
    int colCount = 0;
    std::vector<std::string> colHeaders;
    std::string mergedMarkdown;
};

// Join a chapter path for display: "第一章 总则 > 1.1 目的"
std::string joinChapterPath(const std::vector<std::string>& path, std::string_view sep = " > ");

// Current UTC time as ISO-8601 (seconds precision)
std::string currentIsoTimestamp();

void to_json(nlohmann::json& j, const TableCell& v);
void from_json(const nlohmann::json& j, TableCell& v);
void to_json(nlohmann::json& j, const TableMeta& v);
void from_json(const nlohmann::json& j, TableMeta& v);
void to_json(nlohmann::json& j, const ContentBlock& v);
void from_json(const nlohmann::json& j, ContentBlock& v);
void to_json(nlohmann::json& j, const Annotation& v);
void from_json(const nlohmann::json& j, Annotation& v);
void to_json(nlohmann::json& j, const PageDocument& v);
void from_json(const nlohmann::json& j, PageDocument& v);
void to_json(nlohmann::json& j, const ChapterNode& v);
void from_json(const nlohmann::json& j, ChapterNode& v);
void to_json(nlohmann::json& j, const TocItem& v);
void to_json(nlohmann::json& j, const SearchResult& v);
void to_json(nlohmann::json& j, const RegulationInfo& v);
void from_json(const nlohmann::json& j, RegulationInfo& v);
void to_json(nlohmann::json& j, const TableSegment& v);
void from_json(const nlohmann::json& j, TableSegment& v);
void to_json(nlohmann::json& j, const TableEntry& v);
void from_json(const nlohmann::json& j, TableEntry& v);

} // namespace regdoc
