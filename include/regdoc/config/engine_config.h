#pragma once

#include <regdoc/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace regdoc {

enum class KeywordBackendType {
    Fts5 // SQLite FTS5 with BM25 ranking
};

enum class VectorBackendType {
    Sqlite // float BLOBs in SQLite, exact cosine KNN
};

const char* toString(KeywordBackendType type);
const char* toString(VectorBackendType type);
Result<KeywordBackendType> parseKeywordBackendType(std::string_view name);
Result<VectorBackendType> parseVectorBackendType(std::string_view name);

struct PageStoreConfig {
    std::filesystem::path basePath;
    int maxPagesPerRange = DEFAULT_MAX_PAGES_PER_RANGE;
};

struct StructureConfig {
    // Heading text longer than this (in code points) is split into a title
    // and inline direct content.
    size_t titleLengthThreshold = 50;
    size_t minTitleChars = 2;
    size_t maxTitleChars = 30;
    int maxLevel = 6;
};

struct IndexConfig {
    KeywordBackendType keywordBackend = KeywordBackendType::Fts5;
    VectorBackendType vectorBackend = VectorBackendType::Sqlite;
    std::string embeddingProvider = "hashing";
    size_t embeddingDimension = DEFAULT_EMBEDDING_DIM;
    size_t minEmbedChars = DEFAULT_MIN_EMBED_CHARS;
    size_t snippetChars = DEFAULT_SNIPPET_CHARS;
    size_t snippetContextChars = 100;
    std::filesystem::path keywordDbPath; // empty means in-memory
    std::filesystem::path vectorDbPath;  // empty means in-memory
};

struct HybridSearchConfig {
    double keyword_weight = 0.4;
    double vector_weight = 0.6;
    size_t rrf_k = DEFAULT_RRF_K;
    bool parallel_search = true;
    size_t default_limit = 10;

    bool isValid() const {
        return keyword_weight >= 0.0 && vector_weight >= 0.0 &&
               (keyword_weight + vector_weight) > 0.0;
    }
};

struct EngineConfig {
    std::filesystem::path dataDir;
    PageStoreConfig pageStore;
    StructureConfig structure;
    IndexConfig index;
    HybridSearchConfig search;

    // Default layout under a data directory: pages/, index/keyword.db, index/vectors.db
    static EngineConfig forDataDir(const std::filesystem::path& dataDir);
};

/**
 * @brief Load engine configuration from a TOML-style file
 *
 * Missing keys keep their defaults. REGDOC_DATA_DIR overrides [storage] data_dir.
 * A missing file yields the defaults under the resolved data directory.
 *
 * @return InvalidArgument when a value cannot be parsed or weights are invalid
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& configPath);

} // namespace regdoc
