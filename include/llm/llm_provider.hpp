#pragma once

#include <memory>
#include <string>
#include <vector>

namespace atlas {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for a chat-completion provider
 */
struct LLMConfig {
    std::string api_key;
    std::string model;                      ///< Empty selects the provider default
    std::string api_base_url;               ///< Empty selects the public endpoint
    double temperature = 0.0;
    int max_tokens = 500;
    int timeout_seconds = 60;
    int max_retries = 3;                    ///< Attempts for retryable failures
    bool verbose = false;
};

/**
 * @brief One turn of a conversation
 */
struct Message {
    enum class Role {
        System,
        User,
        Assistant
    };

    Role role;
    std::string content;

    Message(Role r, const std::string& c) : role(r), content(c) {}

    std::string role_string() const;
};

/**
 * @brief Result of a chat request
 *
 * Failures are reported through success/error_message rather than thrown,
 * so that callers labeling many clusters can fall back per request.
 */
struct LLMResponse {
    std::string content;
    std::string model;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    double latency_ms = 0.0;
    bool success = false;
    std::string error_message;
};

// ============================================================================
// LLM Provider Interface
// ============================================================================

/**
 * @brief Black-box text generator behind cluster labeling
 */
class LLMProvider {
public:
    explicit LLMProvider(const LLMConfig& config) : config_(config) {}
    virtual ~LLMProvider() = default;

    /**
     * @brief Send the conversation and return the model's answer
     *
     * Retryable failures (transport, 429, 5xx) are retried up to
     * max_retries times with exponential backoff.
     */
    virtual LLMResponse chat(const std::vector<Message>& messages) = 0;

    virtual std::string get_provider_name() const = 0;
    std::string get_model() const { return config_.model; }
    const LLMConfig& config() const { return config_; }

protected:
    LLMConfig config_;

    /**
     * @brief POST payload to url and parse the body with parse
     *
     * Converts the final BackendError into an unsuccessful response.
     */
    template<typename Parser>
    LLMResponse post_with_retries(
        const std::string& url,
        const std::string& payload,
        const std::vector<std::string>& headers,
        Parser&& parse
    ) const;
};

/**
 * @brief OpenAI chat completions
 */
class OpenAIProvider : public LLMProvider {
public:
    explicit OpenAIProvider(const LLMConfig& config);

    LLMResponse chat(const std::vector<Message>& messages) override;
    std::string get_provider_name() const override { return "openai"; }

    std::string build_payload(const std::vector<Message>& messages) const;
    LLMResponse parse_response(const std::string& body) const;
};

/**
 * @brief Google Gemini generateContent
 *
 * System turns are folded into the first user turn.
 */
class GeminiProvider : public LLMProvider {
public:
    explicit GeminiProvider(const LLMConfig& config);

    LLMResponse chat(const std::vector<Message>& messages) override;
    std::string get_provider_name() const override { return "gemini"; }

    std::string build_payload(const std::vector<Message>& messages) const;
    LLMResponse parse_response(const std::string& body) const;
};

// ============================================================================
// LLM Provider Factory
// ============================================================================

class LLMProviderFactory {
public:
    /**
     * @brief Create provider from name ("openai" or "gemini", any case)
     * @throws std::invalid_argument for unknown names
     */
    static std::unique_ptr<LLMProvider> create(
        const std::string& provider_name,
        const LLMConfig& config
    );
};

/**
 * @brief Default chat model for a provider name
 */
std::string default_llm_model(const std::string& provider_name);

// ============================================================================
// Prompt Templates
// ============================================================================

class PromptTemplates {
public:
    static std::string cluster_label_system_prompt();

    /**
     * @param samples One entry per document: "Title: ...\nAbstract: ..."
     */
    static std::string cluster_label_user_prompt(const std::vector<std::string>& samples);
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Strip markdown code fences, and unescaped newlines inside strings,
 * from a model's JSON answer
 */
std::string clean_json_response(const std::string& text);

/**
 * @brief Read an environment variable, empty if unset
 */
std::string get_api_key_from_env(const std::string& env_var_name);

} // namespace atlas
