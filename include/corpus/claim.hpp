#pragma once

#include "common/vector_math.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief A short assertion derived from a transcript
 */
struct Claim {
    int64_t id = 0;
    std::string episode_id;
    std::optional<std::string> document_id;     ///< Source paper, if linked
    std::string text;                           ///< Raw claim text
    std::optional<std::string> distilled_text;  ///< Short distilled form
    int distilled_word_count = 0;
    double confidence = 0.0;                    ///< Upstream confidence (0.0-1.0)
    std::optional<int64_t> timestamp_ms;        ///< Position in the episode
    std::optional<int64_t> duplicate_of;        ///< Retained claim, if marked duplicate
    Vector embedding;                           ///< Empty until embedded

    bool is_duplicate() const { return duplicate_of.has_value(); }

    /**
     * @brief Text used for embedding: distilled form when present
     */
    const std::string& embedding_text() const {
        return (distilled_text && !distilled_text->empty()) ? *distilled_text : text;
    }

    nlohmann::json to_json(bool include_embedding = true) const;

    /**
     * @brief Parse a claim record
     *
     * Accepts "text" or "claim_text", "distilled_text" or "distilled_claim",
     * "timestamp_ms" or "start_ms", "document_id" or "paper_id".
     */
    static Claim from_json(const nlohmann::json& j);
};

/**
 * @brief Load claims from a JSON array file (or {"claims": [...]})
 * @throws std::runtime_error if the file cannot be read or parsed
 */
std::vector<Claim> load_claims(const std::string& path);

/**
 * @brief Write claims atomically as a JSON array
 */
void save_claims(const std::string& path, const std::vector<Claim>& claims);

} // namespace atlas
