#include "pipeline/engine_config.hpp"
#include "common/file_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

namespace {

const char* kRedacted = "***REDACTED***";

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

size_t env_size(const char* name, size_t current) {
    std::string value = env_or_empty(name);
    if (value.empty()) return current;
    try {
        return static_cast<size_t>(std::stoul(value));
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + value);
    }
}

std::string provider_key_variable(const std::string& provider) {
    if (provider == "openai") return "OPENAI_API_KEY";
    if (provider == "gemini") return "GEMINI_API_KEY";
    return "";
}

// Redacted placeholders written by to_json_file are not real keys
std::string key_value(const json& j, const std::string& key, const std::string& fallback) {
    if (!j.contains(key) || !j[key].is_string()) return fallback;
    std::string value = j[key].get<std::string>();
    return value == kRedacted ? fallback : value;
}

} // anonymous namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    config.vector_backend = j.value("vector_backend", config.vector_backend);
    config.index_dir = j.value("index_dir", config.index_dir);
    config.remote_url = j.value("remote_url", j.value("supabase_url", config.remote_url));
    config.remote_key = key_value(j, "remote_key", key_value(j, "supabase_key", ""));
    config.remote_timeout_seconds = j.value("remote_timeout_seconds", config.remote_timeout_seconds);
    config.upsert_batch_size = j.value("upsert_batch_size", config.upsert_batch_size);

    config.embedding_provider = j.value("embedding_provider", config.embedding_provider);
    config.embedding_api_key = key_value(j, "embedding_api_key", "");
    config.embedding_model = j.value("embedding_model", config.embedding_model);
    config.embedding_dimensions = j.value("embedding_dimensions", config.embedding_dimensions);
    config.embedding_batch_size = j.value("embedding_batch_size", config.embedding_batch_size);
    config.embedding_parallelism = j.value("embedding_parallelism", config.embedding_parallelism);
    config.embedding_timeout_seconds = j.value("embedding_timeout_seconds", config.embedding_timeout_seconds);
    config.embedding_max_retries = j.value("embedding_max_retries", config.embedding_max_retries);

    config.chunk_target_tokens = j.value("chunk_target_tokens", config.chunk_target_tokens);
    config.chunk_overlap_tokens = j.value("chunk_overlap_tokens", config.chunk_overlap_tokens);
    config.tokenizer = j.value("tokenizer", config.tokenizer);

    config.llm_provider = j.value("llm_provider", config.llm_provider);
    config.llm_api_key = key_value(j, "llm_api_key", "");
    config.llm_model = j.value("llm_model", config.llm_model);
    config.llm_temperature = j.value("llm_temperature", config.llm_temperature);
    config.llm_max_tokens = j.value("llm_max_tokens", config.llm_max_tokens);
    config.llm_max_retries = j.value("llm_max_retries", config.llm_max_retries);
    config.llm_timeout_seconds = j.value("llm_timeout_seconds", config.llm_timeout_seconds);

    config.taxonomy_min_clusters = j.value("taxonomy_min_clusters", config.taxonomy_min_clusters);
    config.taxonomy_max_clusters = j.value("taxonomy_max_clusters", config.taxonomy_max_clusters);
    config.silhouette_weight = j.value("silhouette_weight", config.silhouette_weight);
    config.assignment_threshold = j.value("assignment_threshold", config.assignment_threshold);
    config.label_samples = j.value("label_samples", config.label_samples);
    config.label_parallelism = j.value("label_parallelism", config.label_parallelism);
    config.label_timeout_seconds = j.value("label_timeout_seconds", config.label_timeout_seconds);
    config.projection = j.value("projection", config.projection);
    config.gmm_n_init = j.value("gmm_n_init", config.gmm_n_init);
    config.gmm_seed = j.value("gmm_seed", config.gmm_seed);
    config.taxonomy_path = j.value("taxonomy_path", config.taxonomy_path);

    config.claims_path = j.value("claims_path", config.claims_path);
    if (j.contains("dedup_passes") && j["dedup_passes"].is_array()) {
        config.dedup_passes.clear();
        for (const auto& pass : j["dedup_passes"]) {
            config.dedup_passes.push_back(DedupPass::from_json(pass));
        }
    }

    config.verbose = j.value("verbose", config.verbose);
    return config;
}

json EngineConfig::to_json(bool redact_keys) const {
    auto secret = [redact_keys](const std::string& value) {
        return (redact_keys && !value.empty()) ? std::string(kRedacted) : value;
    };

    json j;

    // Storage
    j["vector_backend"] = vector_backend;
    j["index_dir"] = index_dir;
    j["remote_url"] = remote_url;
    j["remote_key"] = secret(remote_key);
    j["remote_timeout_seconds"] = remote_timeout_seconds;
    j["upsert_batch_size"] = upsert_batch_size;

    // Embedding
    j["embedding_provider"] = embedding_provider;
    j["embedding_api_key"] = secret(embedding_api_key);
    j["embedding_model"] = embedding_model;
    j["embedding_dimensions"] = embedding_dimensions;
    j["embedding_batch_size"] = embedding_batch_size;
    j["embedding_parallelism"] = embedding_parallelism;
    j["embedding_timeout_seconds"] = embedding_timeout_seconds;
    j["embedding_max_retries"] = embedding_max_retries;

    // Chunking
    j["chunk_target_tokens"] = chunk_target_tokens;
    j["chunk_overlap_tokens"] = chunk_overlap_tokens;
    j["tokenizer"] = tokenizer;

    // LLM
    j["llm_provider"] = llm_provider;
    j["llm_api_key"] = secret(llm_api_key);
    j["llm_model"] = llm_model;
    j["llm_temperature"] = llm_temperature;
    j["llm_max_tokens"] = llm_max_tokens;
    j["llm_max_retries"] = llm_max_retries;
    j["llm_timeout_seconds"] = llm_timeout_seconds;

    // Taxonomy
    j["taxonomy_min_clusters"] = taxonomy_min_clusters;
    j["taxonomy_max_clusters"] = taxonomy_max_clusters;
    j["silhouette_weight"] = silhouette_weight;
    j["assignment_threshold"] = assignment_threshold;
    j["label_samples"] = label_samples;
    j["label_parallelism"] = label_parallelism;
    j["label_timeout_seconds"] = label_timeout_seconds;
    j["projection"] = projection;
    j["gmm_n_init"] = gmm_n_init;
    j["gmm_seed"] = gmm_seed;
    j["taxonomy_path"] = taxonomy_path;

    // Claims
    j["claims_path"] = claims_path;
    j["dedup_passes"] = json::array();
    for (const auto& pass : dedup_passes) {
        j["dedup_passes"].push_back(pass.to_json());
    }

    j["verbose"] = verbose;
    return j;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    json j = read_json_file(path);
    if (!j.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }
    return from_json(j);
}

void EngineConfig::to_json_file(const std::string& path) const {
    write_file_atomically(path, to_json(true).dump(2));
}

void EngineConfig::apply_environment() {
    std::string value;

    if (!(value = env_or_empty("ATLAS_VECTOR_BACKEND")).empty()) vector_backend = value;
    if (!(value = env_or_empty("ATLAS_INDEX_DIR")).empty()) index_dir = value;

    value = env_or_empty("ATLAS_REMOTE_URL");
    if (value.empty()) value = env_or_empty("SUPABASE_URL");
    if (!value.empty()) remote_url = value;

    value = env_or_empty("ATLAS_REMOTE_KEY");
    if (value.empty()) value = env_or_empty("SUPABASE_SERVICE_KEY");
    if (!value.empty()) remote_key = value;

    if (!(value = env_or_empty("ATLAS_EMBEDDING_PROVIDER")).empty()) embedding_provider = value;
    if (!(value = env_or_empty("ATLAS_EMBEDDING_MODEL")).empty()) embedding_model = value;
    if (!(value = env_or_empty("ATLAS_LLM_PROVIDER")).empty()) llm_provider = value;
    if (!(value = env_or_empty("ATLAS_LLM_MODEL")).empty()) llm_model = value;

    // Provider keys follow the provider that was just selected
    std::string embedding_var = provider_key_variable(embedding_provider);
    if (!embedding_var.empty() && !(value = env_or_empty(embedding_var.c_str())).empty()) {
        embedding_api_key = value;
    }
    std::string llm_var = provider_key_variable(llm_provider);
    if (!llm_var.empty() && !(value = env_or_empty(llm_var.c_str())).empty()) {
        llm_api_key = value;
    }

    chunk_target_tokens = env_size("ATLAS_CHUNK_TARGET_TOKENS", chunk_target_tokens);
    chunk_overlap_tokens = env_size("ATLAS_CHUNK_OVERLAP_TOKENS", chunk_overlap_tokens);

    if (!(value = env_or_empty("ATLAS_TAXONOMY_PATH")).empty()) taxonomy_path = value;
    if (!(value = env_or_empty("ATLAS_CLAIMS_PATH")).empty()) claims_path = value;
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    config.apply_environment();
    return config;
}

bool EngineConfig::validate(std::string& error_message, bool require_embedding_key) const {
    if (vector_backend != "local" && vector_backend != "remote") {
        error_message = "vector_backend must be 'local' or 'remote'";
        return false;
    }

    if (vector_backend == "remote" && remote_url.empty()) {
        error_message = "remote_url (or ATLAS_REMOTE_URL) is required for the remote backend";
        return false;
    }

    if (embedding_provider != "gemini" && embedding_provider != "openai" &&
        embedding_provider != "hashing") {
        error_message = "embedding_provider must be 'gemini', 'openai' or 'hashing'";
        return false;
    }

    if (require_embedding_key && embedding_provider != "hashing" && embedding_api_key.empty()) {
        error_message = "Embedding API key is required for provider " + embedding_provider;
        return false;
    }

    if (llm_provider != "openai" && llm_provider != "gemini") {
        error_message = "llm_provider must be 'openai' or 'gemini'";
        return false;
    }

    if (chunk_target_tokens == 0 || chunk_overlap_tokens >= chunk_target_tokens) {
        error_message = "chunk_target_tokens must be greater than chunk_overlap_tokens";
        return false;
    }

    if (tokenizer != "word" && tokenizer != "whitespace") {
        error_message = "Invalid tokenizer: " + tokenizer;
        return false;
    }

    if (taxonomy_min_clusters < 2 || taxonomy_max_clusters < taxonomy_min_clusters) {
        error_message = "Cluster range must satisfy 2 <= min <= max";
        return false;
    }

    if (assignment_threshold <= 0.0 || assignment_threshold >= 1.0) {
        error_message = "assignment_threshold must be between 0.0 and 1.0";
        return false;
    }

    if (projection != "mds" && projection != "pca") {
        error_message = "projection must be 'mds' or 'pca'";
        return false;
    }

    for (const auto& pass : dedup_passes) {
        if (pass.similarity_threshold <= 0.0 || pass.similarity_threshold > 1.0) {
            error_message = "Dedup pass " + pass.name + " has an invalid similarity threshold";
            return false;
        }
        if (pass.temporal_window_ms < 0) {
            error_message = "Dedup pass " + pass.name + " has a negative temporal window";
            return false;
        }
    }

    return true;
}

// ============================================================================
// Component Settings
// ============================================================================

ChunkerConfig EngineConfig::chunker_config() const {
    ChunkerConfig config;
    config.target_tokens = chunk_target_tokens;
    config.overlap_tokens = chunk_overlap_tokens;
    config.tokenizer = tokenizer;
    return config;
}

EmbeddingConfig EngineConfig::embedding_config() const {
    EmbeddingConfig config;
    config.provider = embedding_provider;
    config.api_key = embedding_api_key;
    config.model = embedding_model;
    config.dimensions = embedding_dimensions;
    config.timeout_seconds = embedding_timeout_seconds;
    config.max_retries = embedding_max_retries;
    config.batch_size = embedding_batch_size;
    config.verbose = verbose;
    return config;
}

VectorIndexConfig EngineConfig::vector_index_config() const {
    VectorIndexConfig config;
    config.backend = vector_backend;
    config.index_dir = index_dir;
    config.remote_url = remote_url;
    config.remote_key = remote_key;
    config.timeout_seconds = remote_timeout_seconds;
    config.upsert_batch_size = upsert_batch_size;
    config.verbose = verbose;
    return config;
}

LLMConfig EngineConfig::llm_config() const {
    LLMConfig config;
    config.api_key = llm_api_key;
    config.model = llm_model.empty() ? default_llm_model(llm_provider) : llm_model;
    config.temperature = llm_temperature;
    config.max_tokens = llm_max_tokens;
    config.timeout_seconds = llm_timeout_seconds;
    config.max_retries = llm_max_retries;
    config.verbose = verbose;
    return config;
}

TaxonomyConfig EngineConfig::taxonomy_config() const {
    TaxonomyConfig config;
    config.min_clusters = taxonomy_min_clusters;
    config.max_clusters = taxonomy_max_clusters;
    config.silhouette_weight = silhouette_weight;
    config.assignment_threshold = assignment_threshold;
    config.label_samples = label_samples;
    config.label_parallelism = label_parallelism;
    config.label_timeout_seconds = label_timeout_seconds;
    config.projection = projection;
    config.gmm.n_init = gmm_n_init;
    config.gmm.seed = gmm_seed;
    config.verbose = verbose;
    return config;
}

TaxonomyStoreConfig EngineConfig::taxonomy_store_config() const {
    TaxonomyStoreConfig config;
    config.backend = vector_backend;
    config.path = taxonomy_path.empty()
        ? (std::filesystem::path(index_dir) / "taxonomy.json").string()
        : taxonomy_path;
    config.remote_url = remote_url;
    config.remote_key = remote_key;
    config.timeout_seconds = remote_timeout_seconds;
    return config;
}

ClaimStoreConfig EngineConfig::claim_store_config() const {
    ClaimStoreConfig config;
    config.backend = vector_backend;
    config.path = claims_path;
    config.remote_url = remote_url;
    config.remote_key = remote_key;
    config.timeout_seconds = remote_timeout_seconds;
    return config;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty()) {
        EngineConfig config = EngineConfig::from_json_file(config_path);
        config.apply_environment();
        return config;
    }

    const std::vector<std::string> paths_to_try = {
        ".atlas_config.json",
        "../.atlas_config.json",
        "../../.atlas_config.json"
    };

    for (const auto& path : paths_to_try) {
        if (!std::filesystem::exists(path)) continue;
        try {
            EngineConfig config = EngineConfig::from_json_file(path);
            config.apply_environment();
            return config;
        } catch (const std::exception& e) {
            std::cerr << "Warning: ignoring config file " << path << ": " << e.what() << std::endl;
        }
    }

    return EngineConfig::from_environment();
}

} // namespace atlas
