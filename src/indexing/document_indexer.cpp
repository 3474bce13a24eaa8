#include <regdoc/core/errors.h>
#include <regdoc/indexing/document_indexer.h>
#include <regdoc/structure/structure_builder.h>

#include <spdlog/spdlog.h>

namespace regdoc::indexing {

DocumentIndexer::DocumentIndexer(storage::PageStore& store,
                                 std::shared_ptr<search::ISearchIndex> keywordIndex,
                                 std::shared_ptr<search::ISearchIndex> vectorIndex,
                                 StructureConfig structureConfig)
    : store_(store), keywordIndex_(std::move(keywordIndex)), vectorIndex_(std::move(vectorIndex)),
      structureConfig_(structureConfig) {}

std::vector<search::BlockRecord>
DocumentIndexer::buildRecords(const std::vector<PageDocument>& pages,
                              const structure::DocumentStructure& structure,
                              const structure::TableRegistry& registry) {
    std::vector<search::BlockRecord> records;
    for (const auto& page : pages) {
        for (const auto& block : page.contentBlocks) {
            search::BlockRecord record;
            record.regId = page.regId;
            record.pageNum = page.pageNum;
            record.block = block;
            record.chapterPath = block.chapterPath.empty() ? page.chapterPath : block.chapterPath;
            if (block.chapterNodeId) {
                if (const auto* node = structure.getNode(*block.chapterNodeId)) {
                    record.sectionNumber = node->sectionNumber;
                }
            }
            if (block.blockType == BlockType::Table) {
                if (const auto* entry = registry.find(block.blockId)) {
                    record.tableId = entry->tableId;
                } else if (block.tableMeta) {
                    const auto& meta = *block.tableMeta;
                    record.tableId = meta.masterTableId.value_or(meta.tableId);
                }
            }
            records.push_back(std::move(record));
        }
    }
    return records;
}

Result<IngestReport> DocumentIndexer::ingest(std::vector<PageDocument> pages,
                                             std::string_view title, std::string_view sourceFile) {
    const auto started = std::chrono::steady_clock::now();
    if (pages.empty()) {
        return errors::parserError("Nothing to ingest: no pages");
    }
    const RegId regId = pages.front().regId;
    if (auto valid = storage::validateRegId(regId); !valid) {
        return valid.error();
    }
    spdlog::info("Ingesting {} ({} pages)", regId, pages.size());

    structure::DocumentStructureBuilder structureBuilder(structureConfig_);
    auto structure = structureBuilder.build(pages);
    if (!structure) {
        return structure.error();
    }

    structure::TableRegistryBuilder registryBuilder;
    auto registry = registryBuilder.build(pages);
    if (!registry) {
        return registry.error();
    }

    auto info =
        store_.saveCollection(pages, structure.value(), registry.value(), title, sourceFile);
    if (!info) {
        return info.error();
    }

    // Stale entries from a previous ingestion must not survive
    for (const auto& index : {keywordIndex_, vectorIndex_}) {
        if (!index) {
            continue;
        }
        if (auto r = index->deleteCollection(regId); !r) {
            return r.error();
        }
    }

    const auto records = buildRecords(pages, structure.value(), registry.value());

    IngestReport report;
    report.info = info.value();
    report.pageCount = pages.size();
    report.blockCount = records.size();
    report.chapterCount = structure.value().size();
    report.tableCount = registry.value().size();
    report.crossPageTableCount = registry.value().crossPageCount();

    if (keywordIndex_) {
        auto indexed = keywordIndex_->indexBlocks(records);
        if (!indexed) {
            return indexed.error();
        }
        report.keywordIndexed = indexed.value();
    }
    if (vectorIndex_) {
        auto indexed = vectorIndex_->indexBlocks(records);
        if (!indexed) {
            return indexed.error();
        }
        report.vectorIndexed = indexed.value();
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Ingested {}: {} pages, {} blocks, {} chapters, {} tables ({} cross-page), "
                 "{} keyword / {} vector entries in {} ms",
                 regId, report.pageCount, report.blockCount, report.chapterCount,
                 report.tableCount, report.crossPageTableCount, report.keywordIndexed,
                 report.vectorIndexed, report.duration.count());
    return report;
}

Result<void> DocumentIndexer::removeCollection(const RegId& regId) {
    for (const auto& index : {keywordIndex_, vectorIndex_}) {
        if (!index) {
            continue;
        }
        if (auto r = index->deleteCollection(regId); !r) {
            return r;
        }
    }
    return store_.deleteCollection(regId);
}

} // namespace regdoc::indexing
