#include <regdoc/core/errors.h>
#include <regdoc/core/text_utils.h>
#include <regdoc/search/sqlite_vector_index.h>
#include "block_filters.hpp"
#include "index_db.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <span>

namespace regdoc::search {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS block_vectors (
    reg_id TEXT NOT NULL,
    page_num INTEGER NOT NULL,
    block_id TEXT NOT NULL,
    block_type TEXT NOT NULL,
    chapter_path TEXT NOT NULL,
    chapter_path_json TEXT NOT NULL,
    section_number TEXT,
    table_id TEXT,
    content TEXT NOT NULL,
    dimension INTEGER NOT NULL,
    embedding BLOB NOT NULL,
    PRIMARY KEY (reg_id, block_id)
);
CREATE INDEX IF NOT EXISTS idx_block_vectors_page ON block_vectors(reg_id, page_num);
)SQL";

Error wrap(const char* what, const Error& cause) {
    return errors::indexError(std::string("vector: ") + what + ": " + cause.message);
}

} // namespace

SqliteVectorIndex::SqliteVectorIndex(IndexConfig config,
                                     std::shared_ptr<ml::IEmbeddingProvider> provider)
    : config_(std::move(config)), provider_(std::move(provider)) {}

SqliteVectorIndex::~SqliteVectorIndex() = default;

Result<void> SqliteVectorIndex::initialize() {
    if (!provider_ || !provider_->isAvailable()) {
        return errors::indexError("vector: embedding provider not available");
    }
    if (provider_->getEmbeddingDimension() != config_.embeddingDimension) {
        return errors::indexError(
            fmt::format("vector: provider '{}' produces {} dimensions, index expects {}",
                        provider_->getProviderName(), provider_->getEmbeddingDimension(),
                        config_.embeddingDimension));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.isOpen()) {
        return Result<void>();
    }
    if (auto r = detail::openIndexDatabase(db_, config_.vectorDbPath); !r) {
        return wrap("open", r.error());
    }
    if (auto r = db_.execute(kSchema); !r) {
        return wrap("create schema", r.error());
    }
    spdlog::debug("Vector index ready at {} (dim {})",
                  config_.vectorDbPath.empty() ? ":memory:" : config_.vectorDbPath.string(),
                  config_.embeddingDimension);
    return Result<void>();
}

bool SqliteVectorIndex::shouldEmbed(const BlockRecord& record) const {
    const auto chars = text::codepointCount(text::trim(record.block.content));
    if (chars < config_.minEmbedChars) {
        spdlog::warn("Skipping embedding for short block {}/{} ({} chars)", record.regId,
                     record.block.blockId, chars);
        return false;
    }
    return true;
}

std::vector<uint8_t> SqliteVectorIndex::vectorToBlob(const std::vector<float>& vec) const {
    std::vector<uint8_t> blob(vec.size() * sizeof(float));
    std::memcpy(blob.data(), vec.data(), blob.size());
    return blob;
}

std::vector<float> SqliteVectorIndex::blobToVector(const std::vector<std::byte>& blob) const {
    size_t numFloats = blob.size() / sizeof(float);
    std::vector<float> vec(numFloats);
    std::memcpy(vec.data(), blob.data(), numFloats * sizeof(float));
    return vec;
}

float SqliteVectorIndex::cosineSimilarity(const std::vector<float>& a,
                                          const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(normA) * std::sqrt(normB)));
}

Result<void> SqliteVectorIndex::insertLocked(const BlockRecord& record,
                                             const std::vector<float>& embedding) {
    if (embedding.size() != config_.embeddingDimension) {
        return errors::indexError(fmt::format("vector: embedding for {} has {} dimensions, expected {}",
                                              record.block.blockId, embedding.size(),
                                              config_.embeddingDimension));
    }

    auto stmtResult = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO block_vectors (reg_id, page_num, block_id, block_type,
                                              chapter_path, chapter_path_json, section_number,
                                              table_id, content, dimension, embedding)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL");
    if (!stmtResult) {
        return stmtResult.error();
    }
    auto& stmt = stmtResult.value();
    const auto& block = record.block;
    if (auto r = stmt.bindAll(record.regId, record.pageNum, block.blockId,
                              toString(block.blockType), joinChapterPath(record.chapterPath),
                              detail::chapterPathToJson(record.chapterPath));
        !r) {
        return r;
    }
    auto r7 = record.sectionNumber ? stmt.bind(7, *record.sectionNumber) : stmt.bind(7, nullptr);
    if (!r7) {
        return r7;
    }
    auto r8 = record.tableId ? stmt.bind(8, *record.tableId) : stmt.bind(8, nullptr);
    if (!r8) {
        return r8;
    }
    // Stored text is only a snippet; the block id still names the exact source
    if (auto r = stmt.bind(9, text::truncateCodepoints(block.content, config_.snippetChars)); !r) {
        return r;
    }
    if (auto r = stmt.bind(10, static_cast<int64_t>(embedding.size())); !r) {
        return r;
    }
    const auto blob = vectorToBlob(embedding);
    if (auto r = stmt.bind(11, std::as_bytes(std::span<const uint8_t>(blob))); !r) {
        return r;
    }
    return stmt.execute();
}

Result<void> SqliteVectorIndex::indexBlock(const BlockRecord& record) {
    auto stored = indexBlocks({record});
    if (!stored) {
        return stored.error();
    }
    return Result<void>();
}

Result<void> SqliteVectorIndex::eraseLocked(const BlockRecord& record) {
    auto stmt = db_.prepare("DELETE FROM block_vectors WHERE reg_id = ? AND block_id = ?");
    if (!stmt) {
        return stmt.error();
    }
    if (auto r = stmt.value().bindAll(record.regId, record.block.blockId); !r) {
        return r;
    }
    return stmt.value().execute();
}

Result<size_t> SqliteVectorIndex::indexBlocks(const std::vector<BlockRecord>& records) {
    std::vector<const BlockRecord*> accepted;
    std::vector<const BlockRecord*> skipped;
    std::vector<std::string> texts;
    for (const auto& record : records) {
        if (shouldEmbed(record)) {
            accepted.push_back(&record);
            texts.push_back(record.block.content);
        } else {
            skipped.push_back(&record);
        }
    }
    if (records.empty()) {
        return size_t{0};
    }

    std::vector<std::vector<float>> vectors;
    if (!accepted.empty()) {
        auto embeddings = provider_->generateBatchEmbeddings(texts);
        if (!embeddings) {
            return wrap("embed documents", embeddings.error());
        }
        if (embeddings.value().size() != accepted.size()) {
            return errors::indexError(
                fmt::format("vector: provider returned {} embeddings for {} texts",
                            embeddings.value().size(), accepted.size()));
        }
        vectors = std::move(embeddings).value();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("vector: index not initialized");
    }
    auto r = db_.transaction([&]() -> Result<void> {
        for (size_t i = 0; i < accepted.size(); ++i) {
            if (auto ins = insertLocked(*accepted[i], vectors[i]); !ins) {
                return ins;
            }
        }
        for (const auto* record : skipped) {
            if (auto del = eraseLocked(*record); !del) {
                return del;
            }
        }
        return Result<void>();
    });
    if (!r) {
        return wrap("index blocks", r.error());
    }
    spdlog::debug("Embedded {} of {} blocks", accepted.size(), records.size());
    return accepted.size();
}

Result<std::vector<SearchResult>> SqliteVectorIndex::search(const SearchQuery& query) {
    std::vector<SearchResult> results;
    if (text::trim(query.text).empty() || query.limit == 0) {
        return results;
    }

    auto queryEmbedding = provider_->generateEmbedding(query.text);
    if (!queryEmbedding) {
        return wrap("embed query", queryEmbedding.error());
    }
    const auto& qvec = queryEmbedding.value();
    if (qvec.size() != config_.embeddingDimension) {
        return errors::indexError(fmt::format("vector: query embedding has {} dimensions, expected {}",
                                              qvec.size(), config_.embeddingDimension));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("vector: index not initialized");
    }

    const auto filters = detail::buildBlockFilters(query, "v");
    auto stmtResult = db_.prepare(
        "SELECT v.reg_id, v.page_num, v.block_id, v.chapter_path_json, v.content, v.embedding "
        "FROM block_vectors v WHERE 1 = 1" +
        filters.sql);
    if (!stmtResult) {
        return wrap("prepare search", stmtResult.error());
    }
    auto& stmt = stmtResult.value();
    if (auto bound = detail::bindFilters(stmt, filters, 1); !bound) {
        return wrap("bind", bound.error());
    }

    while (true) {
        auto step = stmt.step();
        if (!step) {
            return wrap("search", step.error());
        }
        if (!step.value()) {
            break;
        }
        auto embedding = blobToVector(stmt.getBlob(5));
        float similarity = cosineSimilarity(qvec, embedding);
        if (similarity <= 0.0f) {
            continue;
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
        result.snippet = stmt.getString(4);
        result.score = similarity;
        results.push_back(std::move(result));
    }

    auto better = [](const SearchResult& a, const SearchResult& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.pageNum != b.pageNum) {
            return a.pageNum < b.pageNum;
        }
        return a.blockId < b.blockId;
    };
    if (results.size() > query.limit) {
        std::partial_sort(results.begin(),
                          results.begin() + static_cast<ptrdiff_t>(query.limit), results.end(),
                          better);
        results.resize(query.limit);
    } else {
        std::sort(results.begin(), results.end(), better);
    }
    spdlog::debug("Vector search '{}' returned {} results", query.text, results.size());
    return results;
}

Result<void> SqliteVectorIndex::deleteCollection(const RegId& regId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("vector: index not initialized");
    }
    auto stmt = db_.prepare("DELETE FROM block_vectors WHERE reg_id = ?");
    if (!stmt) {
        return wrap("delete collection", stmt.error());
    }
    if (auto r = stmt.value().bind(1, regId); !r) {
        return wrap("delete collection", r.error());
    }
    if (auto r = stmt.value().execute(); !r) {
        return wrap("delete collection", r.error());
    }
    spdlog::info("Removed {} from vector index", regId);
    return Result<void>();
}

Result<size_t> SqliteVectorIndex::count(const std::optional<RegId>& regId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return errors::indexError("vector: index not initialized");
    }
    auto stmt = db_.prepare(regId ? "SELECT COUNT(*) FROM block_vectors WHERE reg_id = ?"
                                  : "SELECT COUNT(*) FROM block_vectors");
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
