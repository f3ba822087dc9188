#include "corpus/claim.hpp"
#include "common/file_utils.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

namespace {

std::optional<std::string> optional_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<int64_t> optional_int(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<int64_t>();
    }
    return std::nullopt;
}

} // anonymous namespace

json Claim::to_json(bool include_embedding) const {
    json j;
    j["id"] = id;
    j["episode_id"] = episode_id;
    j["document_id"] = document_id ? json(*document_id) : json(nullptr);
    j["claim_text"] = text;
    j["distilled_claim"] = distilled_text ? json(*distilled_text) : json(nullptr);
    j["distilled_word_count"] = distilled_word_count;
    j["confidence"] = confidence;
    j["start_ms"] = timestamp_ms ? json(*timestamp_ms) : json(nullptr);
    j["duplicate_of"] = duplicate_of ? json(*duplicate_of) : json(nullptr);
    if (include_embedding && !embedding.empty()) {
        j["embedding"] = embedding;
    }
    return j;
}

Claim Claim::from_json(const json& j) {
    Claim claim;
    claim.id = j.at("id").get<int64_t>();

    if (j.contains("episode_id") && !j["episode_id"].is_null()) {
        claim.episode_id = j["episode_id"].is_string()
            ? j["episode_id"].get<std::string>()
            : j["episode_id"].dump();
    }

    claim.document_id = optional_string(j, "document_id");
    if (!claim.document_id) claim.document_id = optional_string(j, "paper_id");

    claim.text = optional_string(j, "claim_text").value_or(optional_string(j, "text").value_or(""));

    claim.distilled_text = optional_string(j, "distilled_claim");
    if (!claim.distilled_text) claim.distilled_text = optional_string(j, "distilled_text");

    claim.distilled_word_count = j.contains("distilled_word_count") && j["distilled_word_count"].is_number()
        ? j["distilled_word_count"].get<int>() : 0;
    if (claim.distilled_text && claim.distilled_word_count == 0) {
        // Count words when the upstream record omitted it
        bool in_word = false;
        for (char c : *claim.distilled_text) {
            bool space = (c == ' ' || c == '\n' || c == '\t' || c == '\r');
            if (!space && !in_word) claim.distilled_word_count++;
            in_word = !space;
        }
    }

    if (j.contains("confidence") && j["confidence"].is_number()) {
        claim.confidence = j["confidence"].get<double>();
    } else if (j.contains("confidence_score") && j["confidence_score"].is_number()) {
        claim.confidence = j["confidence_score"].get<double>();
    }

    claim.timestamp_ms = optional_int(j, "start_ms");
    if (!claim.timestamp_ms) claim.timestamp_ms = optional_int(j, "timestamp_ms");

    claim.duplicate_of = optional_int(j, "duplicate_of");

    if (j.contains("embedding") && j["embedding"].is_array()) {
        claim.embedding = j["embedding"].get<Vector>();
    }

    return claim;
}

std::vector<Claim> load_claims(const std::string& path) {
    json j = read_json_file(path);
    const json& records = (j.is_object() && j.contains("claims")) ? j["claims"] : j;

    std::vector<Claim> claims;
    if (!records.is_array()) {
        throw std::runtime_error("Expected a JSON array of claims in " + path);
    }
    for (const auto& record : records) {
        claims.push_back(Claim::from_json(record));
    }
    return claims;
}

void save_claims(const std::string& path, const std::vector<Claim>& claims) {
    json j = json::array();
    for (const auto& claim : claims) {
        j.push_back(claim.to_json());
    }
    write_file_atomically(path, j.dump(2));
}

} // namespace atlas
