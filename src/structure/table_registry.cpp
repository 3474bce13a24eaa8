#include <regdoc/core/errors.h>
#include <regdoc/storage/markdown_table.h>
#include <regdoc/structure/table_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace regdoc::structure {

void TableRegistry::addTable(TableEntry entry) {
    const auto id = entry.tableId;
    for (const auto& segment : entry.segments) {
        segmentToTable_[segment.segmentId] = id;
        if (!segment.blockId.empty()) {
            segmentToTable_[segment.blockId] = id;
        }
        auto& onPage = pageToTables_[segment.pageNum];
        if (std::find(onPage.begin(), onPage.end(), id) == onPage.end()) {
            onPage.push_back(id);
        }
    }
    if (auto label = markdown::extractTableLabel(entry.caption)) {
        captionToTable_.emplace(*label, id);
    }
    if (tables_.count(id) == 0) {
        order_.push_back(id);
    }
    tables_[id] = std::move(entry);
}

const TableEntry* TableRegistry::find(std::string_view tableId) const {
    const std::string key(tableId);
    if (auto it = tables_.find(key); it != tables_.end()) {
        return &it->second;
    }
    if (auto seg = segmentToTable_.find(key); seg != segmentToTable_.end()) {
        if (auto it = tables_.find(seg->second); it != tables_.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

Result<TableEntry> TableRegistry::getFullTable(std::string_view tableId) const {
    if (const auto* entry = find(tableId)) {
        return *entry;
    }
    return errors::tableNotFound(regId_, tableId);
}

const TableEntry* TableRegistry::findByCaption(std::string_view label) const {
    auto normalized = markdown::extractTableLabel(label);
    if (!normalized) {
        return nullptr;
    }
    auto it = captionToTable_.find(*normalized);
    if (it == captionToTable_.end()) {
        return nullptr;
    }
    return find(it->second);
}

std::vector<const TableEntry*> TableRegistry::getTablesOnPage(int pageNum) const {
    std::vector<const TableEntry*> out;
    auto it = pageToTables_.find(pageNum);
    if (it == pageToTables_.end()) {
        return out;
    }
    for (const auto& id : it->second) {
        if (const auto* entry = find(id)) {
            out.push_back(entry);
        }
    }
    return out;
}

size_t TableRegistry::crossPageCount() const {
    return static_cast<size_t>(std::count_if(tables_.begin(), tables_.end(),
                                             [](const auto& kv) { return kv.second.isCrossPage; }));
}

void to_json(nlohmann::json& j, const TableRegistry& r) {
    auto tables = nlohmann::json::array();
    for (const auto& id : r.order_) {
        tables.push_back(r.tables_.at(id));
    }
    auto pages = nlohmann::json::object();
    for (const auto& [page, ids] : r.pageToTables_) {
        pages[std::to_string(page)] = ids;
    }
    j = nlohmann::json{{"reg_id", r.regId_},
                       {"version", TableRegistry::kVersion},
                       {"total_tables", r.size()},
                       {"cross_page_tables", r.crossPageCount()},
                       {"tables", tables},
                       {"segment_to_table", r.segmentToTable_},
                       {"page_to_tables", pages}};
}

void from_json(const nlohmann::json& j, TableRegistry& r) {
    r = TableRegistry(j.at("reg_id").get<std::string>());
    for (const auto& item : j.at("tables")) {
        r.addTable(item.get<TableEntry>());
    }
}

namespace {

struct Chain {
    TableEntry entry;
    markdown::MarkdownTable merged;
    int lastPage = 0;
};

std::string tableIdOf(const ContentBlock& block) {
    if (block.tableMeta && !block.tableMeta->tableId.empty()) {
        return block.tableMeta->tableId;
    }
    return block.blockId;
}

TableMeta& ensureMeta(ContentBlock& block) {
    if (!block.tableMeta) {
        block.tableMeta.emplace();
        block.tableMeta->tableId = block.blockId;
    }
    return *block.tableMeta;
}

Chain startChain(ContentBlock& block, int pageNum) {
    Chain chain;
    chain.merged = markdown::parseTable(block.content);
    chain.lastPage = pageNum;

    auto& meta = ensureMeta(block);
    meta.segmentIndex = 0;
    meta.masterTableId.reset();

    auto& entry = chain.entry;
    entry.tableId = tableIdOf(block);
    entry.caption = meta.caption;
    if (entry.caption.empty() && !chain.merged.preamble.empty()) {
        entry.caption = chain.merged.preamble.front();
    }
    entry.chapterPath = block.chapterPath;
    entry.pageStart = pageNum;
    entry.pageEnd = pageNum;

    TableSegment segment;
    segment.segmentId = entry.tableId;
    segment.pageNum = pageNum;
    segment.blockId = block.blockId;
    segment.segmentIndex = 0;
    segment.isHeader = !chain.merged.header.empty();
    segment.rowStart = 0;
    segment.rowEnd = static_cast<int>(chain.merged.rows.size());
    entry.segments.push_back(std::move(segment));
    return chain;
}

void extendChain(Chain& chain, ContentBlock& block, int pageNum) {
    auto part = markdown::parseTable(block.content);
    int expected = chain.merged.columnCount();
    int actual = part.columnCount();
    if (expected > 0 && actual > 0 && expected != actual) {
        spdlog::warn("Column count mismatch stitching {} on page {}: {} vs {}",
                     chain.entry.tableId, pageNum, expected, actual);
    }

    TableSegment segment;
    segment.segmentId = tableIdOf(block);
    segment.pageNum = pageNum;
    segment.blockId = block.blockId;
    segment.segmentIndex = static_cast<int>(chain.entry.segments.size());
    segment.isHeader = false;
    segment.rowStart = static_cast<int>(chain.merged.rows.size());
    chain.merged.append(part);
    segment.rowEnd = static_cast<int>(chain.merged.rows.size());

    auto& meta = ensureMeta(block);
    meta.masterTableId = chain.entry.tableId;
    meta.segmentIndex = segment.segmentIndex;

    chain.entry.segments.push_back(std::move(segment));
    chain.entry.pageEnd = pageNum;
    chain.lastPage = pageNum;
}

TableEntry finalizeChain(Chain chain, const ContentBlock* firstBlock) {
    auto& entry = chain.entry;
    entry.mergedMarkdown = chain.merged.render();
    entry.rowCount = static_cast<int>(chain.merged.rows.size());
    entry.colCount = chain.merged.columnCount();
    entry.colHeaders = chain.merged.headerCells();
    if (firstBlock && firstBlock->tableMeta) {
        if (entry.colCount == 0) {
            entry.colCount = firstBlock->tableMeta->colCount;
        }
        if (entry.colHeaders.empty()) {
            entry.colHeaders = firstBlock->tableMeta->colHeaders;
        }
    }
    entry.isCrossPage = entry.segments.size() > 1;
    return std::move(chain.entry);
}

} // namespace

Result<TableRegistry> TableRegistryBuilder::build(std::vector<PageDocument>& pages) const {
    if (pages.empty()) {
        return errors::parserError("No pages to build a table registry from");
    }

    TableRegistry registry(pages.front().regId);
    std::optional<Chain> open;
    const ContentBlock* openFirst = nullptr;

    auto close = [&]() {
        if (open) {
            auto entry = finalizeChain(std::move(*open), openFirst);
            if (entry.isCrossPage) {
                spdlog::debug("Stitched table {} across pages {}-{} ({} segments)", entry.tableId,
                              entry.pageStart, entry.pageEnd, entry.segments.size());
            }
            registry.addTable(std::move(entry));
            open.reset();
            openFirst = nullptr;
        }
    };

    for (auto& page : pages) {
        const ContentBlock* truncated = page.truncatedTable();
        bool firstTableSeen = false;
        bool chainContinues = false;

        for (auto& block : page.contentBlocks) {
            if (block.blockType != BlockType::Table) {
                continue;
            }
            const bool isTruncated = &block == truncated;

            if (open && !firstTableSeen && page.continuesFromPrev &&
                page.pageNum == open->lastPage + 1) {
                firstTableSeen = true;
                extendChain(*open, block, page.pageNum);
                if (isTruncated) {
                    chainContinues = true;
                } else {
                    close();
                }
                continue;
            }
            firstTableSeen = true;

            close();
            open = startChain(block, page.pageNum);
            openFirst = &block;
            if (isTruncated) {
                chainContinues = true;
            } else {
                close();
            }
        }

        if (open && !chainContinues) {
            close();
        }
    }
    close();

    spdlog::info("Registered {} tables for {} ({} cross-page)", registry.size(),
                 registry.regId(), registry.crossPageCount());
    return registry;
}

} // namespace regdoc::structure
