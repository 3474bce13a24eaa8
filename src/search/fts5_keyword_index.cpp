#include <regdoc/core/errors.h>
#include <regdoc/search/block_tokenizer.h>
#include <regdoc/search/fts5_keyword_index.h>
#include "block_filters.hpp"
#include "index_db.hpp"

#include <spdlog/spdlog.h>

namespace regdoc::search {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS block_meta (
    rowid INTEGER PRIMARY KEY,
    reg_id TEXT NOT NULL,
    page_num INTEGER NOT NULL,
    block_id TEXT NOT NULL,
    block_type TEXT NOT NULL,
    chapter_path TEXT NOT NULL,
    chapter_path_json TEXT NOT NULL,
    section_number TEXT,
    table_id TEXT,
    content TEXT NOT NULL,
    UNIQUE(reg_id, block_id)
);
CREATE INDEX IF NOT EXISTS idx_block_meta_page ON block_meta(reg_id, page_num);
CREATE VIRTUAL TABLE IF NOT EXISTS block_fts USING fts5(tokens, tokenize = 'unicode61');
)SQL";

Error wrap(const char* what, const Error& cause) {
    return errors::indexError(std::string("fts5: ") + what + ": " + cause.message);
}

Result<void> bindOptional(metadata::Statement& stmt, int index,
                          const std::optional<std::string>& value) {
    if (value) {
        return stmt.bind(index, *value);
    }
    return stmt.bind(index, nullptr);
}

} // namespace

Fts5KeywordIndex::Fts5KeywordIndex(IndexConfig config) : config_(std::move(config)) {}

Fts5KeywordIndex::~Fts5KeywordIndex() = default;

Result<void> Fts5KeywordIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.isOpen()) {
        return Result<void>();
    }
    if (auto r = detail::openIndexDatabase(db_, config_.keywordDbPath); !r) {
        return wrap("open", r.error());
    }
    return createSchema();
}

Result<void> Fts5KeywordIndex::createSchema() {
    auto fts = db_.hasFTS5();
    if (!fts) {
        return wrap("fts5 check", fts.error());
    }
    if (!fts.value()) {
        return errors::indexError("fts5: SQLite was built without FTS5 support");
    }
    if (auto r = db_.execute(kSchema); !r) {
        return wrap("create schema", r.error());
    }
    spdlog::debug("FTS5 keyword index ready at {}",
                  config_.keywordDbPath.empty() ? ":memory:" : config_.keywordDbPath.string());
    return Result<void>();
}

Result<void> Fts5KeywordIndex::insertLocked(const BlockRecord& record) {
    const auto& block = record.block;

    {
        auto stmt = db_.prepare("DELETE FROM block_fts WHERE rowid IN "
                                "(SELECT rowid FROM block_meta WHERE reg_id = ? AND block_id = ?)");
        if (!stmt) {
            return stmt.error();
        }
        if (auto r = stmt.value().bindAll(record.regId, block.blockId); !r) {
            return r;
        }
        if (auto r = stmt.value().execute(); !r) {
            return r;
        }
    }
    {
        auto stmt = db_.prepare("DELETE FROM block_meta WHERE reg_id = ? AND block_id = ?");
        if (!stmt) {
            return stmt.error();
        }
        if (auto r = stmt.value().bindAll(record.regId, block.blockId); !r) {
            return r;
        }
        if (auto r = stmt.value().execute(); !r) {
            return r;
        }
    }

    auto insertMeta = db_.prepare(R"SQL(
        INSERT INTO block_meta (reg_id, page_num, block_id, block_type, chapter_path,
                                chapter_path_json, section_number, table_id, content)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL");
    if (!insertMeta) {
        return insertMeta.error();
    }
    auto& meta = insertMeta.value();
    if (auto r = meta.bindAll(record.regId, record.pageNum, block.blockId,
                              toString(block.blockType), joinChapterPath(record.chapterPath),
                              detail::chapterPathToJson(record.chapterPath));
        !r) {
        return r;
    }
    if (auto r = bindOptional(meta, 7, record.sectionNumber); !r) {
        return r;
    }
    if (auto r = bindOptional(meta, 8, record.tableId); !r) {
        return r;
    }
    if (auto r = meta.bind(9, block.content); !r) {
        return r;
    }
    if (auto r = meta.execute(); !r) {
        return r;
    }

    const int64_t rowid = db_.lastInsertRowId();
    auto insertFts = db_.prepare("INSERT INTO block_fts (rowid, tokens) VALUES (?, ?)");
    if (!insertFts) {
        return insertFts.error();
    }
    if (auto r = insertFts.value().bindAll(rowid, joinTokens(tokenizeForIndex(block.content)));
        !r) {
        return r;
    }
    return insertFts.value().execute();
}

Result<void> Fts5KeywordIndex::indexBlock(const BlockRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("fts5: index not initialized");
    }
    auto r = db_.transaction([&]() { return insertLocked(record); });
    if (!r) {
        return wrap("index block", r.error());
    }
    return r;
}

Result<size_t> Fts5KeywordIndex::indexBlocks(const std::vector<BlockRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("fts5: index not initialized");
    }
    size_t stored = 0;
    auto r = db_.transaction([&]() -> Result<void> {
        for (const auto& record : records) {
            if (auto ins = insertLocked(record); !ins) {
                spdlog::error("FTS5 insert failed for {}/{}: {}", record.regId,
                              record.block.blockId, ins.error().message);
                return ins;
            }
            ++stored;
        }
        return Result<void>();
    });
    if (!r) {
        return wrap("index blocks", r.error());
    }
    spdlog::debug("FTS5 indexed {} blocks", stored);
    return stored;
}

Result<std::vector<SearchResult>> Fts5KeywordIndex::search(const SearchQuery& query) {
    std::vector<SearchResult> results;
    const auto tokens = tokenizeForIndex(query.text);
    if (tokens.empty() || query.limit == 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("fts5: index not initialized");
    }

    const auto filters = detail::buildBlockFilters(query, "m");
    std::string sql = "SELECT m.reg_id, m.page_num, m.block_id, m.chapter_path_json, m.content, "
                      "-bm25(block_fts) AS score "
                      "FROM block_fts JOIN block_meta m ON m.rowid = block_fts.rowid "
                      "WHERE block_fts MATCH ?" +
                      filters.sql +
                      " ORDER BY score DESC, m.page_num ASC, m.block_id ASC LIMIT ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult) {
        return wrap("prepare search", stmtResult.error());
    }
    auto& stmt = stmtResult.value();
    if (auto r = stmt.bind(1, buildMatchExpression(tokens)); !r) {
        return wrap("bind", r.error());
    }
    auto next = detail::bindFilters(stmt, filters, 2);
    if (!next) {
        return wrap("bind", next.error());
    }
    if (auto r = stmt.bind(next.value(), static_cast<int64_t>(query.limit)); !r) {
        return wrap("bind", r.error());
    }

    while (true) {
        auto step = stmt.step();
        if (!step) {
            return wrap("search", step.error());
        }
        if (!step.value()) {
            break;
        }
        SearchResult result;
        result.regId = stmt.getString(0);
        result.pageNum = stmt.getInt(1);
        result.blockId = stmt.getString(2);
        auto path = detail::chapterPathFromJson(stmt.getString(3));
        if (!path) {
            return path.error();
        }
        result.chapterPath = std::move(path).value();
        result.snippet = extractSnippet(stmt.getString(4), tokens, config_.snippetContextChars);
        result.score = stmt.getDouble(5);
        results.push_back(std::move(result));
    }
    spdlog::debug("FTS5 search '{}' returned {} results", query.text, results.size());
    return results;
}

Result<void> Fts5KeywordIndex::deleteCollection(const RegId& regId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("fts5: index not initialized");
    }
    auto r = db_.transaction([&]() -> Result<void> {
        auto fts = db_.prepare(
            "DELETE FROM block_fts WHERE rowid IN (SELECT rowid FROM block_meta WHERE reg_id = ?)");
        if (!fts) {
            return fts.error();
        }
        if (auto b = fts.value().bind(1, regId); !b) {
            return b;
        }
        if (auto e = fts.value().execute(); !e) {
            return e;
        }
        auto meta = db_.prepare("DELETE FROM block_meta WHERE reg_id = ?");
        if (!meta) {
            return meta.error();
        }
        if (auto b = meta.value().bind(1, regId); !b) {
            return b;
        }
        return meta.value().execute();
    });
    if (!r) {
        return wrap("delete collection", r.error());
    }
    spdlog::info("Removed {} from keyword index", regId);
    return r;
}

Result<size_t> Fts5KeywordIndex::count(const std::optional<RegId>& regId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("fts5: index not initialized");
    }
    auto stmt = db_.prepare(regId ? "SELECT COUNT(*) FROM block_meta WHERE reg_id = ?"
                                  : "SELECT COUNT(*) FROM block_meta");
    if (!stmt) {
        return wrap("count", stmt.error());
    }
    if (regId) {
        if (auto r = stmt.value().bind(1, *regId); !r) {
            return wrap("count", r.error());
        }
    }
    auto step = stmt.value().step();
    if (!step) {
        return wrap("count", step.error());
    }
    return static_cast<size_t>(step.value() ? stmt.value().getInt64(0) : 0);
}

} // namespace regdoc::search
