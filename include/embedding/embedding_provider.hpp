#pragma once

#include "common/vector_math.hpp"
#include <memory>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Configuration for embedding providers
 */
struct EmbeddingConfig {
    std::string provider = "gemini";        ///< "gemini", "openai" or "hashing"
    std::string api_key;
    std::string model;                      ///< Empty selects the provider default
    std::string api_base_url;               ///< Empty selects the provider default
    size_t dimensions = 0;                  ///< 0 selects the model's native size
    int timeout_seconds = 30;               ///< Per-request timeout
    int max_retries = 3;
    size_t batch_size = 32;                 ///< Texts per batch request
    bool verbose = false;
};

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Maps text to a fixed-dimensionality vector
 *
 * Implementations are stateless after construction; embed() and
 * embed_batch() may be called from several threads.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embed one text
     * @throws BackendError if the provider cannot be reached
     */
    virtual Vector embed(const std::string& text) const = 0;

    /**
     * @brief Embed several texts, results in input order
     *
     * The default implementation calls embed() per text.
     */
    virtual std::vector<Vector> embed_batch(const std::vector<std::string>& texts) const;

    virtual size_t dimensions() const = 0;
    virtual std::string get_provider_name() const = 0;
    virtual std::string get_model() const = 0;

    /**
     * @brief Version tag stored with every index ("provider:model:dimensions")
     */
    std::string version() const;
};

/**
 * @brief Gemini embedContent / batchEmbedContents
 */
class GeminiEmbeddingProvider : public EmbeddingProvider {
public:
    explicit GeminiEmbeddingProvider(const EmbeddingConfig& config);

    Vector embed(const std::string& text) const override;
    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) const override;

    size_t dimensions() const override { return config_.dimensions; }
    std::string get_provider_name() const override { return "gemini"; }
    std::string get_model() const override { return config_.model; }

private:
    EmbeddingConfig config_;

    std::string endpoint(const std::string& method) const;
};

/**
 * @brief OpenAI /embeddings
 */
class OpenAIEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenAIEmbeddingProvider(const EmbeddingConfig& config);

    Vector embed(const std::string& text) const override;
    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) const override;

    size_t dimensions() const override { return config_.dimensions; }
    std::string get_provider_name() const override { return "openai"; }
    std::string get_model() const override { return config_.model; }

private:
    EmbeddingConfig config_;
};

/**
 * @brief Deterministic offline embedder
 *
 * Lower-cased word tokens are hashed into buckets (with a smaller share
 * spread to the neighbouring buckets) and the histogram is L2-normalized.
 * Texts sharing vocabulary get high cosine similarity. Used for offline runs
 * and tests.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimensions = 256);

    Vector embed(const std::string& text) const override;

    size_t dimensions() const override { return dimensions_; }
    std::string get_provider_name() const override { return "hashing"; }
    std::string get_model() const override { return "fnv1a"; }

private:
    size_t dimensions_;
};

// ============================================================================
// Factory
// ============================================================================

/**
 * @brief Create an embedding provider by config.provider
 * @throws std::invalid_argument for unknown providers or a missing API key
 */
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config);

} // namespace atlas
