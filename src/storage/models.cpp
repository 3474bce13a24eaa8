#include <regdoc/storage/models.h>

#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <stdexcept>

namespace regdoc {

using nlohmann::json;

namespace {

template <typename T> void putOptional(json& j, const char* key, const std::optional<T>& v) {
    if (v) {
        j[key] = *v;
    } else {
        j[key] = nullptr;
    }
}

template <typename T> std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T> std::vector<T> getArray(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<T>>();
}

} // namespace

const char* toString(BlockType type) {
    switch (type) {
        case BlockType::Text:
            return "text";
        case BlockType::Table:
            return "table";
        case BlockType::Heading:
            return "heading";
        case BlockType::List:
            return "list";
        case BlockType::SectionContent:
            return "section_content";
    }
    return "text";
}

Result<BlockType> parseBlockType(std::string_view name) {
    if (name == "text")
        return BlockType::Text;
    if (name == "table")
        return BlockType::Table;
    if (name == "heading")
        return BlockType::Heading;
    if (name == "list")
        return BlockType::List;
    if (name == "section_content")
        return BlockType::SectionContent;
    return Error{ErrorCode::InvalidArgument, fmt::format("Unknown block type: {}", name)};
}

std::string PageDocument::source() const {
    return fmt::format("{} P{}", regId, pageNum);
}

std::string PageDocument::markdown() const {
    std::string out;
    for (const auto& block : contentBlocks) {
        if (block.content.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += "\n\n";
        }
        out += block.content;
    }
    return out;
}

std::vector<const ContentBlock*> PageDocument::tables() const {
    std::vector<const ContentBlock*> out;
    for (const auto& block : contentBlocks) {
        if (block.blockType == BlockType::Table) {
            out.push_back(&block);
        }
    }
    return out;
}

const ContentBlock* PageDocument::findBlock(std::string_view blockId) const {
    for (const auto& block : contentBlocks) {
        if (block.blockId == blockId) {
            return &block;
        }
    }
    return nullptr;
}

const ContentBlock* PageDocument::firstTable() const {
    for (const auto& block : contentBlocks) {
        if (block.blockType == BlockType::Table) {
            return &block;
        }
    }
    return nullptr;
}

const ContentBlock* PageDocument::truncatedTable() const {
    if (!continuesToNext) {
        return nullptr;
    }
    const ContentBlock* found = nullptr;
    for (const auto& block : contentBlocks) {
        if (block.blockType == BlockType::Table && block.tableMeta && block.tableMeta->isTruncated) {
            found = &block;
        }
    }
    return found;
}

std::string ChapterNode::fullTitle() const {
    if (title.empty()) {
        return sectionNumber;
    }
    return fmt::format("{} {}", sectionNumber, title);
}

std::string SearchResult::source() const {
    if (chapterPath.empty()) {
        return fmt::format("{} P{}", regId, pageNum);
    }
    return fmt::format("{} P{} ({})", regId, pageNum, joinChapterPath(chapterPath));
}

std::string PageContent::source() const {
    if (startPage == endPage) {
        return fmt::format("{} P{}", regId, startPage);
    }
    return fmt::format("{} P{}-{}", regId, startPage, endPage);
}

std::string joinChapterPath(const std::vector<std::string>& path, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += path[i];
    }
    return out;
}

std::string currentIsoTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void to_json(json& j, const TableCell& v) {
    j = json{{"row", v.row},
             {"col", v.col},
             {"content", v.content},
             {"row_span", v.rowSpan},
             {"col_span", v.colSpan}};
}

void from_json(const json& j, TableCell& v) {
    v.row = j.value("row", 0);
    v.col = j.value("col", 0);
    v.content = j.value("content", std::string{});
    v.rowSpan = j.value("row_span", 1);
    v.colSpan = j.value("col_span", 1);
}

void to_json(json& j, const TableMeta& v) {
    j = json{{"table_id", v.tableId},       {"caption", v.caption},
             {"is_truncated", v.isTruncated}, {"row_count", v.rowCount},
             {"col_count", v.colCount},     {"col_headers", v.colHeaders},
             {"row_headers", v.rowHeaders}, {"cells", v.cells},
             {"segment_index", v.segmentIndex}};
    putOptional(j, "master_table_id", v.masterTableId);
}

void from_json(const json& j, TableMeta& v) {
    v.tableId = j.value("table_id", std::string{});
    v.caption = j.value("caption", std::string{});
    v.isTruncated = j.value("is_truncated", false);
    v.rowCount = j.value("row_count", 0);
    v.colCount = j.value("col_count", 0);
    v.colHeaders = getArray<std::string>(j, "col_headers");
    v.rowHeaders = getArray<std::string>(j, "row_headers");
    v.cells = getArray<TableCell>(j, "cells");
    v.masterTableId = getOptional<std::string>(j, "master_table_id");
    v.segmentIndex = j.value("segment_index", 0);
}

void to_json(json& j, const ContentBlock& v) {
    j = json{{"block_id", v.blockId},
             {"block_type", toString(v.blockType)},
             {"content", v.content},
             {"order_in_page", v.orderInPage},
             {"chapter_path", v.chapterPath}};
    putOptional(j, "table_meta", v.tableMeta);
    putOptional(j, "chapter_node_id", v.chapterNodeId);
    putOptional(j, "heading_level", v.headingLevel);
}

void from_json(const json& j, ContentBlock& v) {
    v.blockId = j.at("block_id").get<std::string>();
    auto type = parseBlockType(j.value("block_type", std::string("text")));
    if (!type) {
        throw std::invalid_argument(type.error().message);
    }
    v.blockType = type.value();
    // Parsers emit either "content" or "content_markdown"
    if (j.contains("content")) {
        v.content = j.at("content").get<std::string>();
    } else {
        v.content = j.value("content_markdown", std::string{});
    }
    v.orderInPage = j.value("order_in_page", 0);
    v.tableMeta = getOptional<TableMeta>(j, "table_meta");
    v.chapterNodeId = getOptional<std::string>(j, "chapter_node_id");
    v.headingLevel = getOptional<int>(j, "heading_level");
    v.chapterPath = getArray<std::string>(j, "chapter_path");
}

void to_json(json& j, const Annotation& v) {
    j = json{{"annotation_id", v.annotationId},
             {"normalized_id", v.normalizedId},
             {"content", v.content},
             {"page_num", v.pageNum},
             {"related_blocks", v.relatedBlocks}};
}

void from_json(const json& j, Annotation& v) {
    v.annotationId = j.at("annotation_id").get<std::string>();
    v.normalizedId = j.value("normalized_id", std::string{});
    v.content = j.value("content", std::string{});
    v.pageNum = j.value("page_num", 0);
    v.relatedBlocks = getArray<std::string>(j, "related_blocks");
}

void to_json(json& j, const PageDocument& v) {
    j = json{{"reg_id", v.regId},
             {"page_num", v.pageNum},
             {"chapter_path", v.chapterPath},
             {"content_blocks", v.contentBlocks},
             {"continues_from_prev", v.continuesFromPrev},
             {"continues_to_next", v.continuesToNext},
             {"annotations", v.annotations}};
}

void from_json(const json& j, PageDocument& v) {
    v.regId = j.at("reg_id").get<std::string>();
    v.pageNum = j.at("page_num").get<int>();
    v.chapterPath = getArray<std::string>(j, "chapter_path");
    if (v.chapterPath.empty()) {
        v.chapterPath = getArray<std::string>(j, "active_chapters");
    }
    v.contentBlocks = getArray<ContentBlock>(j, "content_blocks");
    v.continuesFromPrev = j.value("continues_from_prev", false);
    v.continuesToNext = j.value("continues_to_next", false);
    v.annotations = getArray<Annotation>(j, "annotations");
}

void to_json(json& j, const ChapterNode& v) {
    j = json{{"node_id", v.nodeId},
             {"section_number", v.sectionNumber},
             {"title", v.title},
             {"level", v.level},
             {"page_num", v.pageNum},
             {"children_ids", v.childrenIds},
             {"content_block_ids", v.contentBlockIds},
             {"has_direct_content", v.hasDirectContent},
             {"direct_content", v.directContent}};
    putOptional(j, "parent_id", v.parentId);
}

void from_json(const json& j, ChapterNode& v) {
    v.nodeId = j.at("node_id").get<std::string>();
    v.sectionNumber = j.value("section_number", std::string{});
    v.title = j.value("title", std::string{});
    v.level = j.value("level", 1);
    v.pageNum = j.value("page_num", 0);
    v.parentId = getOptional<std::string>(j, "parent_id");
    v.childrenIds = getArray<std::string>(j, "children_ids");
    v.contentBlockIds = getArray<std::string>(j, "content_block_ids");
    v.hasDirectContent = j.value("has_direct_content", false);
    v.directContent = j.value("direct_content", std::string{});
}

void to_json(json& j, const TocItem& v) {
    j = json{{"node_id", v.nodeId},       {"title", v.title},       {"level", v.level},
             {"page_start", v.pageStart}, {"page_end", v.pageEnd}, {"children", v.children}};
}

void to_json(json& j, const SearchResult& v) {
    j = json{{"reg_id", v.regId},   {"page_num", v.pageNum}, {"chapter_path", v.chapterPath},
             {"block_id", v.blockId}, {"snippet", v.snippet}, {"score", v.score},
             {"source", v.source()}};
}

void to_json(json& j, const RegulationInfo& v) {
    j = json{{"reg_id", v.regId},
             {"title", v.title},
             {"source_file", v.sourceFile},
             {"total_pages", v.totalPages},
             {"indexed_at", v.indexedAt}};
}

void from_json(const json& j, RegulationInfo& v) {
    v.regId = j.at("reg_id").get<std::string>();
    v.title = j.value("title", std::string{});
    v.sourceFile = j.value("source_file", std::string{});
    v.totalPages = j.value("total_pages", 0);
    v.indexedAt = j.value("indexed_at", std::string{});
}

void to_json(json& j, const TableSegment& v) {
    j = json{{"segment_id", v.segmentId},       {"page_num", v.pageNum},
             {"block_id", v.blockId},           {"segment_index", v.segmentIndex},
             {"is_header", v.isHeader},         {"row_start", v.rowStart},
             {"row_end", v.rowEnd}};
}

void from_json(const json& j, TableSegment& v) {
    v.segmentId = j.at("segment_id").get<std::string>();
    v.pageNum = j.value("page_num", 0);
    v.blockId = j.value("block_id", std::string{});
    v.segmentIndex = j.value("segment_index", 0);
    v.isHeader = j.value("is_header", false);
    v.rowStart = j.value("row_start", 0);
    v.rowEnd = j.value("row_end", 0);
}

void to_json(json& j, const TableEntry& v) {
    j = json{{"table_id", v.tableId},         {"caption", v.caption},
             {"chapter_path", v.chapterPath}, {"page_start", v.pageStart},
             {"page_end", v.pageEnd},         {"is_cross_page", v.isCrossPage},
             {"segments", v.segments},        {"row_count", v.rowCount},
             {"col_count", v.colCount},       {"col_headers", v.colHeaders},
             {"merged_markdown", v.mergedMarkdown}};
}

void from_json(const json& j, TableEntry& v) {
    v.tableId = j.at("table_id").get<std::string>();
    v.caption = j.value("caption", std::string{});
    v.chapterPath = getArray<std::string>(j, "chapter_path");
    v.pageStart = j.value("page_start", 0);
    v.pageEnd = j.value("page_end", 0);
    v.isCrossPage = j.value("is_cross_page", false);
    v.segments = getArray<TableSegment>(j, "segments");
    v.rowCount = j.value("row_count", 0);
    v.colCount = j.value("col_count", 0);
    v.colHeaders = getArray<std::string>(j, "col_headers");
    v.mergedMarkdown = j.value("merged_markdown", std::string{});
}

} // namespace regdoc
