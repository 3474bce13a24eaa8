#include <regdoc/core/text_utils.h>
#include <regdoc/ml/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>

namespace regdoc::ml {

namespace {

constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

constexpr float UNIGRAM_WEIGHT = 1.0f;
constexpr float BIGRAM_WEIGHT = 1.5f;
constexpr float WORD_WEIGHT = 1.0f;

uint64_t fnv1a(std::u32string_view feature, uint64_t salt) {
    uint64_t h = FNV_OFFSET ^ salt;
    for (char32_t cp : feature) {
        for (int shift = 0; shift < 32; shift += 8) {
            h ^= static_cast<uint64_t>((cp >> shift) & 0xFF);
            h *= FNV_PRIME;
        }
    }
    return h;
}

bool isWordChar(char32_t cp) {
    return (cp >= U'a' && cp <= U'z') || (cp >= U'0' && cp <= U'9');
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
}

HashingEmbeddingProvider::~HashingEmbeddingProvider() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> HashingEmbeddingProvider::initialize() {
    if (initialized_) {
        return Result<void>();
    }
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }
    spdlog::debug("Initializing HashingEmbeddingProvider");
    initialized_ = true;
    return Result<void>();
}

void HashingEmbeddingProvider::shutdown() {
    initialized_ = false;
}

std::vector<float> HashingEmbeddingProvider::embed(const std::string& text) const {
    std::vector<float> embedding(dimension_, 0.0f);

    auto add = [&](std::u32string_view feature, uint64_t salt, float weight) {
        uint64_t h = fnv1a(feature, salt);
        size_t index = static_cast<size_t>(h % dimension_);
        float sign = (h >> 63) != 0 ? -1.0f : 1.0f;
        embedding[index] += sign * weight;
    };

    auto cps = text::decodeUtf8(text::toHalfWidth(text));
    for (auto& cp : cps) {
        if (cp < 0x80) {
            cp = static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
        }
    }

    char32_t prevCjk = 0;
    std::u32string word;
    auto flushWord = [&]() {
        if (!word.empty()) {
            add(word, 3, WORD_WEIGHT);
            word.clear();
        }
    };

    for (char32_t cp : cps) {
        if (text::isCjk(cp)) {
            flushWord();
            char32_t unigram[1] = {cp};
            add(std::u32string_view(unigram, 1), 1, UNIGRAM_WEIGHT);
            if (prevCjk != 0) {
                char32_t bigram[2] = {prevCjk, cp};
                add(std::u32string_view(bigram, 2), 2, BIGRAM_WEIGHT);
            }
            prevCjk = cp;
        } else if (isWordChar(cp)) {
            prevCjk = 0;
            word.push_back(cp);
        } else {
            prevCjk = 0;
            flushWord();
        }
    }
    flushWord();

    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
    return embedding;
}

Result<std::vector<float>> HashingEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_) {
        return Error{ErrorCode::IndexError, "Hashing provider not initialized"};
    }
    return embed(text);
}

Result<std::vector<std::vector<float>>>
HashingEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    if (!initialized_) {
        return Error{ErrorCode::IndexError, "Hashing provider not initialized"};
    }
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        embeddings.push_back(embed(text));
    }
    return embeddings;
}

// ============================================================================
// Provider Factory Implementation
// ============================================================================

namespace {

struct ProviderRegistry {
    std::mutex mutex;
    std::map<std::string, EmbeddingProviderFactory> factories;

    ProviderRegistry() {
        factories["hashing"] = [](size_t dimension) -> std::unique_ptr<IEmbeddingProvider> {
            return std::make_unique<HashingEmbeddingProvider>(dimension);
        };
    }
};

ProviderRegistry& registry() {
    static ProviderRegistry instance;
    return instance;
}

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.factories[name] = factory;
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [name, _] : reg.factories) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension) {
    EmbeddingProviderFactory factory = nullptr;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.factories.find(name);
        if (it != reg.factories.end()) {
            factory = it->second;
        }
    }
    if (!factory) {
        spdlog::error("Embedding provider '{}' not registered", name);
        return nullptr;
    }

    auto provider = factory(dimension);
    if (!provider) {
        return nullptr;
    }
    if (auto init = provider->initialize(); !init) {
        spdlog::error("Embedding provider '{}' failed to initialize: {}", name,
                      init.error().message);
        return nullptr;
    }
    spdlog::info("Using {} embedding provider (dim {})", provider->getProviderName(),
                 provider->getEmbeddingDimension());
    return provider;
}

} // namespace regdoc::ml
