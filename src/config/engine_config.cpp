#include <regdoc/config/config_helpers.h>
#include <regdoc/config/engine_config.h>
#include <regdoc/core/errors.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <charconv>

namespace regdoc {

namespace {

template <typename T>
Result<void> readNumber(const std::filesystem::path& path, const std::string& section,
                        const std::string& key, T& out) {
    auto raw = config::parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    T parsed{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return errors::invalidArgument(
            fmt::format("Invalid value for {}.{}: '{}'", section, key, raw));
    }
    out = parsed;
    return {};
}

Result<void> readBool(const std::filesystem::path& path, const std::string& section,
                      const std::string& key, bool& out) {
    auto raw = config::parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    if (raw == "true" || raw == "1" || raw == "yes") {
        out = true;
    } else if (raw == "false" || raw == "0" || raw == "no") {
        out = false;
    } else {
        return errors::invalidArgument(
            fmt::format("Invalid boolean for {}.{}: '{}'", section, key, raw));
    }
    return {};
}

} // namespace

const char* toString(KeywordBackendType type) {
    switch (type) {
        case KeywordBackendType::Fts5:
            return "fts5";
    }
    return "unknown";
}

const char* toString(VectorBackendType type) {
    switch (type) {
        case VectorBackendType::Sqlite:
            return "sqlite";
    }
    return "unknown";
}

Result<KeywordBackendType> parseKeywordBackendType(std::string_view name) {
    if (name == "fts5") {
        return KeywordBackendType::Fts5;
    }
    return Error{ErrorCode::NotSupported, fmt::format("Unknown keyword backend: {}", name)};
}

Result<VectorBackendType> parseVectorBackendType(std::string_view name) {
    if (name == "sqlite" || name == "sqlite_vec") {
        return VectorBackendType::Sqlite;
    }
    return Error{ErrorCode::NotSupported, fmt::format("Unknown vector backend: {}", name)};
}

EngineConfig EngineConfig::forDataDir(const std::filesystem::path& dataDir) {
    EngineConfig cfg;
    cfg.dataDir = dataDir;
    cfg.pageStore.basePath = dataDir / "pages";
    cfg.index.keywordDbPath = dataDir / "index" / "keyword.db";
    cfg.index.vectorDbPath = dataDir / "index" / "vectors.db";
    return cfg;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& configPath) {
    auto cfg = EngineConfig::forDataDir(config::resolve_data_dir_from_config(configPath));

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        spdlog::debug("No config file at '{}', using defaults under {}", configPath.string(),
                      cfg.dataDir.string());
        return cfg;
    }

    const std::pair<Result<void>, const char*> checks[] = {
        {readNumber(configPath, "storage", "max_pages_per_range", cfg.pageStore.maxPagesPerRange),
         "storage"},
        {readNumber(configPath, "structure", "title_length_threshold",
                    cfg.structure.titleLengthThreshold),
         "structure"},
        {readNumber(configPath, "structure", "max_title_chars", cfg.structure.maxTitleChars),
         "structure"},
        {readNumber(configPath, "structure", "max_level", cfg.structure.maxLevel), "structure"},
        {readNumber(configPath, "index", "embedding_dimension", cfg.index.embeddingDimension),
         "index"},
        {readNumber(configPath, "index", "min_embed_chars", cfg.index.minEmbedChars), "index"},
        {readNumber(configPath, "index", "snippet_chars", cfg.index.snippetChars), "index"},
        {readNumber(configPath, "search", "keyword_weight", cfg.search.keyword_weight), "search"},
        {readNumber(configPath, "search", "vector_weight", cfg.search.vector_weight), "search"},
        {readNumber(configPath, "search", "rrf_k", cfg.search.rrf_k), "search"},
        {readNumber(configPath, "search", "default_limit", cfg.search.default_limit), "search"},
        {readBool(configPath, "search", "parallel", cfg.search.parallel_search), "search"},
    };
    for (const auto& [result, section] : checks) {
        if (!result) {
            spdlog::error("Config [{}] in {}: {}", section, configPath.string(),
                          result.error().message);
            return result.error();
        }
    }

    if (auto name = config::parse_config_value(configPath, "index", "keyword_backend");
        !name.empty()) {
        auto parsed = parseKeywordBackendType(name);
        if (!parsed) {
            return parsed.error();
        }
        cfg.index.keywordBackend = parsed.value();
    }
    if (auto name = config::parse_config_value(configPath, "index", "vector_backend");
        !name.empty()) {
        auto parsed = parseVectorBackendType(name);
        if (!parsed) {
            return parsed.error();
        }
        cfg.index.vectorBackend = parsed.value();
    }
    if (auto name = config::parse_config_value(configPath, "index", "embedding_provider");
        !name.empty()) {
        cfg.index.embeddingProvider = name;
    }

    if (cfg.pageStore.maxPagesPerRange < 1) {
        return errors::invalidArgument("storage.max_pages_per_range must be at least 1");
    }
    if (cfg.index.embeddingDimension == 0) {
        return errors::invalidArgument("index.embedding_dimension must be positive");
    }
    if (!cfg.search.isValid()) {
        return errors::invalidArgument(
            "search weights must be non-negative with a positive sum");
    }

    spdlog::info("Loaded config from {} (data dir {})", configPath.string(),
                 cfg.dataDir.string());
    return cfg;
}

} // namespace regdoc
