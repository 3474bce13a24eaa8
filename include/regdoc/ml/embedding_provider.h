#pragma once

#include <regdoc/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace regdoc::ml {

/**
 * Abstract interface for embedding providers.
 * Real transformer models live outside the engine and are injected through
 * this interface; the vector index only depends on it.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text (used for queries)
     * @return Vector of getEmbeddingDimension() floats or error
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts (used for documents)
     * @return One vector per input, same order
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;
    virtual std::string getProviderName() const = 0;
    virtual size_t getEmbeddingDimension() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
};

/**
 * Deterministic feature-hashing embedder
 *
 * Hashes CJK character unigrams and bigrams plus lower-cased latin words into
 * a signed bag of features, then L2-normalises. Texts sharing vocabulary get
 * high cosine similarity. No model files, so it is the default provider and
 * the one the tests run against.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = DEFAULT_EMBEDDING_DIM);
    ~HashingEmbeddingProvider() override;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return initialized_; }
    std::string getProviderName() const override { return "hashing"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

    Result<void> initialize() override;
    void shutdown() override;

private:
    std::vector<float> embed(const std::string& text) const;

    size_t dimension_;
    bool initialized_ = false;
};

using EmbeddingProviderFactory = std::unique_ptr<IEmbeddingProvider> (*)(size_t dimension);

/**
 * Create and initialise a registered provider by name
 * @return nullptr when no provider of that name is registered or it fails to initialise
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension);

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

std::vector<std::string> getRegisteredEmbeddingProviders();

} // namespace regdoc::ml
