#pragma once

#include "chunking/chunker.hpp"
#include "dedup/claim_deduplicator.hpp"
#include "dedup/claim_store.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/vector_index.hpp"
#include "llm/llm_provider.hpp"
#include "taxonomy/taxonomy_builder.hpp"
#include "taxonomy/taxonomy_store.hpp"
#include <string>
#include <vector>

namespace atlas {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Settings shared by every atlas command
 *
 * Stored as a flat JSON object; every key is optional.
 */
struct EngineConfig {
    // Storage backends
    std::string vector_backend = "local";   ///< "local" or "remote"
    std::string index_dir = "atlas_index";  ///< Local index directory
    std::string remote_url;                 ///< PostgREST base URL
    std::string remote_key;                 ///< Service key
    int remote_timeout_seconds = 30;
    size_t upsert_batch_size = 100;

    // Embedding
    std::string embedding_provider = "gemini";  ///< "gemini", "openai" or "hashing"
    std::string embedding_api_key;
    std::string embedding_model;            ///< Empty selects the provider default
    size_t embedding_dimensions = 0;
    size_t embedding_batch_size = 32;
    size_t embedding_parallelism = 4;       ///< Concurrent embedding batches
    int embedding_timeout_seconds = 30;
    int embedding_max_retries = 3;

    // Chunking
    size_t chunk_target_tokens = 400;
    size_t chunk_overlap_tokens = 50;
    std::string tokenizer = "word";

    // Labeling LLM
    std::string llm_provider = "gemini";    ///< "openai" or "gemini"
    std::string llm_api_key;
    std::string llm_model;                  ///< Empty selects the provider default
    double llm_temperature = 0.0;
    int llm_max_tokens = 500;
    int llm_max_retries = 3;
    int llm_timeout_seconds = 60;

    // Taxonomy
    int taxonomy_min_clusters = 8;
    int taxonomy_max_clusters = 12;
    double silhouette_weight = 1.0;
    double assignment_threshold = 0.1;
    size_t label_samples = 5;
    size_t label_parallelism = 4;
    int label_timeout_seconds = 90;
    std::string projection = "mds";
    int gmm_n_init = 3;
    unsigned int gmm_seed = 42;
    std::string taxonomy_path;              ///< Empty: <index_dir>/taxonomy.json

    // Claims
    std::string claims_path = "claims.json";
    std::vector<DedupPass> dedup_passes = default_dedup_passes();

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API keys redacted)
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json(bool redact_keys = true) const;
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load from environment variables (ATLAS_*)
     */
    static EngineConfig from_environment();

    /**
     * @brief Overlay set environment variables onto this config
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     *
     * @param require_embedding_key Commands that never embed (stats,
     *        taxonomy) pass false
     */
    bool validate(std::string& error_message, bool require_embedding_key = true) const;

    // Component settings
    ChunkerConfig chunker_config() const;
    EmbeddingConfig embedding_config() const;
    VectorIndexConfig vector_index_config() const;
    LLMConfig llm_config() const;
    TaxonomyConfig taxonomy_config() const;
    TaxonomyStoreConfig taxonomy_store_config() const;
    ClaimStoreConfig claim_store_config() const;
};

/**
 * @brief Load config with fallback
 *
 * Tries the given path, then .atlas_config.json in the current directory
 * and two parents. Environment variables override file values; with no
 * file the config comes from the environment alone.
 *
 * @throws std::runtime_error if an explicitly given path cannot be loaded
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace atlas
