#include "llm/llm_provider.hpp"
#include "common/errors.hpp"
#include "common/http_client.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

std::string Message::role_string() const {
    switch (role) {
        case Role::System: return "system";
        case Role::Assistant: return "assistant";
        default: return "user";
    }
}

// ============================================================================
// LLMProvider Base Class
// ============================================================================

template<typename Parser>
LLMResponse LLMProvider::post_with_retries(
    const std::string& url,
    const std::string& payload,
    const std::vector<std::string>& headers,
    Parser&& parse
) const {
    auto start_time = std::chrono::steady_clock::now();
    LLMResponse response;

    try {
        std::string body = with_retries([&]() {
            return http_post(url, payload, headers, config_.timeout_seconds);
        }, config_.max_retries, config_.verbose, get_provider_name() + " chat");
        response = parse(body);
    } catch (const BackendError& e) {
        response.success = false;
        response.error_message = e.what();
    }

    response.latency_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time).count();

    if (config_.verbose && response.success) {
        std::cout << get_provider_name() << " " << config_.model << ": "
                  << response.prompt_tokens << " + " << response.completion_tokens
                  << " tokens, " << static_cast<int>(response.latency_ms) << " ms" << std::endl;
    }
    return response;
}

namespace {

// Error message carried in a 2xx body, empty if none
std::string error_message_of(const json& j) {
    if (!j.contains("error")) return "";
    const auto& error = j["error"];
    if (error.is_object()) return error.value("message", "unknown error");
    if (error.is_string()) return error.get<std::string>();
    return "unknown error";
}

} // anonymous namespace

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIProvider::OpenAIProvider(const LLMConfig& config) : LLMProvider(config) {
    if (config_.model.empty()) config_.model = default_llm_model("openai");
    if (config_.api_base_url.empty()) config_.api_base_url = "https://api.openai.com/v1";
}

std::string OpenAIProvider::build_payload(const std::vector<Message>& messages) const {
    json j;
    j["model"] = config_.model;
    j["temperature"] = config_.temperature;
    j["max_tokens"] = config_.max_tokens;
    j["response_format"] = {{"type", "json_object"}};
    j["messages"] = json::array();
    for (const auto& msg : messages) {
        j["messages"].push_back({{"role", msg.role_string()}, {"content", msg.content}});
    }
    return j.dump();
}

LLMResponse OpenAIProvider::parse_response(const std::string& body) const {
    LLMResponse response;
    try {
        json j = json::parse(body);
        response.error_message = error_message_of(j);
        if (!response.error_message.empty()) return response;

        response.content = j.at("choices").at(0).at("message").at("content").get<std::string>();
        response.model = j.value("model", config_.model);
        if (j.contains("usage")) {
            response.prompt_tokens = j["usage"].value("prompt_tokens", 0);
            response.completion_tokens = j["usage"].value("completion_tokens", 0);
        }
        response.success = true;
    } catch (const json::exception& e) {
        response.error_message = std::string("Malformed chat response: ") + e.what();
    }
    return response;
}

LLMResponse OpenAIProvider::chat(const std::vector<Message>& messages) {
    return post_with_retries(
        config_.api_base_url + "/chat/completions",
        build_payload(messages),
        {"Content-Type: application/json", "Authorization: Bearer " + config_.api_key},
        [this](const std::string& body) { return parse_response(body); }
    );
}

// ============================================================================
// Gemini Provider
// ============================================================================

GeminiProvider::GeminiProvider(const LLMConfig& config) : LLMProvider(config) {
    if (config_.model.empty()) config_.model = default_llm_model("gemini");
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://generativelanguage.googleapis.com/v1beta";
    }
}

std::string GeminiProvider::build_payload(const std::vector<Message>& messages) const {
    json contents = json::array();
    std::string system_text;

    for (const auto& msg : messages) {
        if (msg.role == Message::Role::System) {
            system_text += msg.content + "\n\n";
            continue;
        }
        contents.push_back({
            {"role", msg.role == Message::Role::User ? "user" : "model"},
            {"parts", json::array({{{"text", msg.content}}})}
        });
    }

    if (!system_text.empty()) {
        if (contents.empty()) {
            contents.push_back({{"role", "user"}, {"parts", json::array({{{"text", ""}}})}});
        }
        contents[0]["parts"][0]["text"] =
            system_text + contents[0]["parts"][0]["text"].get<std::string>();
    }

    json j;
    j["contents"] = contents;
    j["generationConfig"] = {
        {"temperature", config_.temperature},
        {"maxOutputTokens", config_.max_tokens},
        {"responseMimeType", "application/json"}
    };
    return j.dump();
}

LLMResponse GeminiProvider::parse_response(const std::string& body) const {
    LLMResponse response;
    try {
        json j = json::parse(body);
        response.error_message = error_message_of(j);
        if (!response.error_message.empty()) return response;

        if (!j.contains("candidates") || j["candidates"].empty()) {
            response.error_message = "Response contained no candidates";
            return response;
        }
        response.content = j["candidates"][0].at("content").at("parts").at(0).at("text").get<std::string>();
        response.model = config_.model;
        if (j.contains("usageMetadata")) {
            response.prompt_tokens = j["usageMetadata"].value("promptTokenCount", 0);
            response.completion_tokens = j["usageMetadata"].value("candidatesTokenCount", 0);
        }
        response.success = true;
    } catch (const json::exception& e) {
        response.error_message = std::string("Malformed generateContent response: ") + e.what();
    }
    return response;
}

LLMResponse GeminiProvider::chat(const std::vector<Message>& messages) {
    return post_with_retries(
        config_.api_base_url + "/models/" + config_.model + ":generateContent?key=" +
            url_encode(config_.api_key),
        build_payload(messages),
        {"Content-Type: application/json"},
        [this](const std::string& body) { return parse_response(body); }
    );
}

// ============================================================================
// LLM Provider Factory
// ============================================================================

std::string default_llm_model(const std::string& provider_name) {
    if (provider_name == "openai") return "gpt-4o-mini";
    return "gemini-2.0-flash";
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    const std::string& provider_name,
    const LLMConfig& config
) {
    std::string name = provider_name;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "openai") return std::make_unique<OpenAIProvider>(config);
    if (name == "gemini") return std::make_unique<GeminiProvider>(config);
    throw std::invalid_argument("Unknown LLM provider name: " + provider_name);
}

// ============================================================================
// Prompt Templates
// ============================================================================

std::string PromptTemplates::cluster_label_system_prompt() {
    return R"(You name research topics. You are given representative documents from one
topical cluster of a research corpus. Produce a short label that a reader would
use to describe what these documents have in common.

Output JSON format:
{
  "label": "2-5 word topic name",
  "description": "One or two sentences describing the cluster",
  "keywords": ["keyword1", "keyword2", "keyword3"]
}

Guidelines:
- The description must be at most 300 characters
- Give between 3 and 5 keywords
- Respond ONLY with valid JSON (no markdown, no explanation))";
}

std::string PromptTemplates::cluster_label_user_prompt(const std::vector<std::string>& samples) {
    std::string prompt = "Representative documents in this cluster:\n\n";
    for (size_t i = 0; i < samples.size(); ++i) {
        prompt += std::to_string(i + 1) + ". " + samples[i] + "\n\n";
    }
    prompt += "Label this cluster.";
    return prompt;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string clean_json_response(const std::string& text) {
    std::string clean = text;

    size_t first = clean.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    clean = clean.substr(first);

    // Remove ```json or ``` markers
    if (clean.compare(0, 7, "```json") == 0) {
        clean = clean.substr(7);
    } else if (clean.compare(0, 3, "```") == 0) {
        clean = clean.substr(3);
    }

    size_t last_backticks = clean.rfind("```");
    if (last_backticks != std::string::npos && last_backticks > 0) {
        clean = clean.substr(0, last_backticks);
    }

    first = clean.find_first_not_of(" \t\n\r");
    size_t last = clean.find_last_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    clean = clean.substr(first, last - first + 1);

    // Unescaped newlines inside string values become spaces
    std::string fixed;
    fixed.reserve(clean.size());
    bool in_string = false;
    bool escaped = false;

    for (char c : clean) {
        if (escaped) {
            fixed += c;
            escaped = false;
            continue;
        }
        if (c == '\\') {
            fixed += c;
            escaped = true;
            continue;
        }
        if (c == '"') {
            in_string = !in_string;
            fixed += c;
            continue;
        }
        if (in_string && (c == '\n' || c == '\r')) {
            if (c == '\n') fixed += ' ';
            continue;
        }
        fixed += c;
    }

    return fixed;
}

std::string get_api_key_from_env(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace atlas
