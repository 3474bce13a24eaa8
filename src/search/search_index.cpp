#include <regdoc/core/errors.h>
#include <regdoc/ml/embedding_provider.h>
#include <regdoc/search/fts5_keyword_index.h>
#include <regdoc/search/search_index.h>
#include <regdoc/search/sqlite_vector_index.h>

#include <spdlog/spdlog.h>

namespace regdoc::search {

Result<std::unique_ptr<ISearchIndex>> createKeywordIndex(const IndexConfig& config) {
    switch (config.keywordBackend) {
        case KeywordBackendType::Fts5: {
            auto index = std::make_unique<Fts5KeywordIndex>(config);
            if (auto r = index->initialize(); !r) {
                spdlog::error("Failed to initialize FTS5 keyword index: {}", r.error().message);
                return r.error();
            }
            return std::unique_ptr<ISearchIndex>(std::move(index));
        }
    }
    return errors::invalidArgument(
        fmt::format("Unsupported keyword backend: {}", toString(config.keywordBackend)));
}

Result<std::unique_ptr<ISearchIndex>>
createVectorIndex(const IndexConfig& config, std::shared_ptr<ml::IEmbeddingProvider> provider) {
    if (!provider) {
        std::shared_ptr<ml::IEmbeddingProvider> created =
            ml::createEmbeddingProvider(config.embeddingProvider, config.embeddingDimension);
        provider = std::move(created);
    }
    if (!provider) {
        return errors::indexError(
            fmt::format("No embedding provider named '{}'", config.embeddingProvider));
    }

    switch (config.vectorBackend) {
        case VectorBackendType::Sqlite: {
            auto index = std::make_unique<SqliteVectorIndex>(config, std::move(provider));
            if (auto r = index->initialize(); !r) {
                spdlog::error("Failed to initialize vector index: {}", r.error().message);
                return r.error();
            }
            return std::unique_ptr<ISearchIndex>(std::move(index));
        }
    }
    return errors::invalidArgument(
        fmt::format("Unsupported vector backend: {}", toString(config.vectorBackend)));
}

} // namespace regdoc::search
