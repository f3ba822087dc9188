#include "embedding/embedding_provider.hpp"
#include "chunking/tokenizer.hpp"
#include "common/errors.hpp"
#include "common/http_client.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

namespace {

Vector to_vector(const json& values) {
    Vector v;
    v.reserve(values.size());
    for (const auto& x : values) {
        v.push_back(x.get<float>());
    }
    return v;
}

uint64_t fnv1a_64(const std::string& s) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

} // anonymous namespace

// ============================================================================
// EmbeddingProvider
// ============================================================================

std::vector<Vector> EmbeddingProvider::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<Vector> vectors;
    vectors.reserve(texts.size());
    for (const auto& text : texts) {
        vectors.push_back(embed(text));
    }
    return vectors;
}

std::string EmbeddingProvider::version() const {
    return get_provider_name() + ":" + get_model() + ":" + std::to_string(dimensions());
}

// ============================================================================
// Gemini
// ============================================================================

GeminiEmbeddingProvider::GeminiEmbeddingProvider(const EmbeddingConfig& config)
    : config_(config) {
    if (config_.model.empty()) config_.model = "text-embedding-004";
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://generativelanguage.googleapis.com/v1beta";
    }
    if (config_.dimensions == 0) config_.dimensions = 768;
}

std::string GeminiEmbeddingProvider::endpoint(const std::string& method) const {
    return config_.api_base_url + "/models/" + config_.model + ":" + method +
           "?key=" + url_encode(config_.api_key);
}

Vector GeminiEmbeddingProvider::embed(const std::string& text) const {
    json payload;
    payload["model"] = "models/" + config_.model;
    payload["content"] = {{"parts", json::array({{{"text", text}}})}};
    payload["outputDimensionality"] = config_.dimensions;

    std::string body = with_retries([&]() {
        return http_post(endpoint("embedContent"), payload.dump(),
                         {"Content-Type: application/json"}, config_.timeout_seconds);
    }, config_.max_retries, config_.verbose, "Gemini embed");

    try {
        json j = json::parse(body);
        return to_vector(j.at("embedding").at("values"));
    } catch (const json::exception& e) {
        throw BackendError(std::string("Malformed Gemini embedding response: ") + e.what());
    }
}

std::vector<Vector> GeminiEmbeddingProvider::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<Vector> vectors;
    if (texts.empty()) return vectors;

    json payload;
    payload["requests"] = json::array();
    for (const auto& text : texts) {
        payload["requests"].push_back({
            {"model", "models/" + config_.model},
            {"content", {{"parts", json::array({{{"text", text}}})}}},
            {"outputDimensionality", config_.dimensions}
        });
    }

    std::string body = with_retries([&]() {
        return http_post(endpoint("batchEmbedContents"), payload.dump(),
                         {"Content-Type: application/json"}, config_.timeout_seconds);
    }, config_.max_retries, config_.verbose, "Gemini batch embed");

    try {
        json j = json::parse(body);
        for (const auto& e : j.at("embeddings")) {
            vectors.push_back(to_vector(e.at("values")));
        }
    } catch (const json::exception& e) {
        throw BackendError(std::string("Malformed Gemini batch response: ") + e.what());
    }

    if (vectors.size() != texts.size()) {
        throw BackendError("Gemini returned " + std::to_string(vectors.size()) +
                           " embeddings for " + std::to_string(texts.size()) + " texts");
    }
    return vectors;
}

// ============================================================================
// OpenAI
// ============================================================================

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(const EmbeddingConfig& config)
    : config_(config) {
    if (config_.model.empty()) config_.model = "text-embedding-3-small";
    if (config_.api_base_url.empty()) config_.api_base_url = "https://api.openai.com/v1";
    if (config_.dimensions == 0) config_.dimensions = 1536;
}

Vector OpenAIEmbeddingProvider::embed(const std::string& text) const {
    return embed_batch({text}).front();
}

std::vector<Vector> OpenAIEmbeddingProvider::embed_batch(const std::vector<std::string>& texts) const {
    std::vector<Vector> vectors;
    if (texts.empty()) return vectors;

    json payload;
    payload["model"] = config_.model;
    payload["input"] = texts;
    payload["dimensions"] = config_.dimensions;

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };

    std::string body = with_retries([&]() {
        return http_post(config_.api_base_url + "/embeddings", payload.dump(),
                         headers, config_.timeout_seconds);
    }, config_.max_retries, config_.verbose, "OpenAI embed");

    try {
        json j = json::parse(body);
        const auto& data = j.at("data");
        vectors.resize(texts.size());
        size_t filled = 0;
        for (const auto& item : data) {
            size_t index = item.at("index").get<size_t>();
            if (index < vectors.size()) {
                vectors[index] = to_vector(item.at("embedding"));
                filled++;
            }
        }
        if (filled != texts.size()) {
            throw BackendError("OpenAI returned " + std::to_string(filled) +
                               " embeddings for " + std::to_string(texts.size()) + " texts");
        }
    } catch (const json::exception& e) {
        throw BackendError(std::string("Malformed OpenAI embedding response: ") + e.what());
    }

    return vectors;
}

// ============================================================================
// Hashing
// ============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimensions)
    : dimensions_(dimensions) {
    if (dimensions_ == 0) {
        throw std::invalid_argument("Hashing embedder needs a positive dimensionality");
    }
}

Vector HashingEmbeddingProvider::embed(const std::string& text) const {
    Vector embedding(dimensions_, 0.0f);

    WordTokenizer tokenizer;
    std::map<std::string, int> token_counts;
    for (const auto& token : tokenizer.tokenize(text)) {
        std::string word = text.substr(token.begin, token.length());
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        token_counts[word]++;
    }

    if (token_counts.empty()) {
        return embedding;
    }

    for (const auto& [word, count] : token_counts) {
        size_t idx = fnv1a_64(word) % dimensions_;
        size_t idx_prev = (idx + dimensions_ - 1) % dimensions_;
        size_t idx_next = (idx + 1) % dimensions_;
        embedding[idx] += static_cast<float>(count);
        embedding[idx_prev] += static_cast<float>(count) * 0.3f;
        embedding[idx_next] += static_cast<float>(count) * 0.3f;
    }

    l2_normalize(embedding);
    return embedding;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingConfig& config) {
    std::string name = config.provider;
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    if (name == "hashing") {
        return std::make_unique<HashingEmbeddingProvider>(
            config.dimensions == 0 ? 256 : config.dimensions
        );
    }

    if (name != "gemini" && name != "openai") {
        throw std::invalid_argument("Unknown embedding provider: " + config.provider);
    }
    if (config.api_key.empty()) {
        throw std::invalid_argument("No API key configured for embedding provider " + name);
    }

    if (name == "openai") {
        return std::make_unique<OpenAIEmbeddingProvider>(config);
    }
    return std::make_unique<GeminiEmbeddingProvider>(config);
}

} // namespace atlas
