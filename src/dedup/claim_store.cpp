#include "dedup/claim_store.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace atlas {

namespace {

constexpr size_t kPageSize = 1000;

const char* kClaimColumns =
    "id,episode_id,document_id,claim_text,distilled_claim,distilled_word_count,"
    "confidence,start_ms,duplicate_of,embedding";

} // anonymous namespace

void apply_duplicate_links(std::vector<Claim>& claims, const std::vector<DuplicateLink>& links) {
    std::unordered_map<int64_t, size_t> position;
    for (size_t i = 0; i < claims.size(); ++i) {
        position[claims[i].id] = i;
    }

    for (const auto& link : links) {
        auto dup = position.find(link.duplicate_id);
        if (dup == position.end() || position.count(link.kept_id) == 0) {
            throw std::invalid_argument(
                "Duplicate link " + std::to_string(link.duplicate_id) + " -> " +
                std::to_string(link.kept_id) + " references an unknown claim"
            );
        }
        claims[dup->second].duplicate_of = link.kept_id;
    }

    // Reject the write if the stored relation would stop being a forest
    DuplicateForest::from_claims(claims);
}

// ============================================================================
// LocalClaimStore
// ============================================================================

LocalClaimStore::LocalClaimStore(const std::string& path) : path_(path) {}

std::vector<Claim> LocalClaimStore::load_all() const {
    auto claims = load_claims(path_);
    std::sort(claims.begin(), claims.end(),
        [](const Claim& a, const Claim& b) { return a.id < b.id; });
    return claims;
}

std::vector<Claim> LocalClaimStore::load(const std::optional<std::string>& episode_id) const {
    auto claims = load_all();
    if (episode_id) {
        claims.erase(std::remove_if(claims.begin(), claims.end(),
            [&](const Claim& c) { return c.episode_id != *episode_id; }), claims.end());
    }
    return claims;
}

void LocalClaimStore::mark_duplicates(const std::vector<DuplicateLink>& links) {
    if (links.empty()) return;

    auto claims = load_all();
    apply_duplicate_links(claims, links);
    save_claims(path_, claims);
}

void LocalClaimStore::store_embeddings(const std::vector<Claim>& updated) {
    std::unordered_map<int64_t, const Claim*> by_id;
    for (const auto& claim : updated) {
        if (!claim.embedding.empty()) by_id[claim.id] = &claim;
    }
    if (by_id.empty()) return;

    auto claims = load_all();
    bool changed = false;
    for (auto& claim : claims) {
        auto it = by_id.find(claim.id);
        if (it != by_id.end() && claim.embedding != it->second->embedding) {
            claim.embedding = it->second->embedding;
            changed = true;
        }
    }
    if (changed) {
        save_claims(path_, claims);
    }
}

// ============================================================================
// RemoteClaimStore
// ============================================================================

RemoteClaimStore::RemoteClaimStore(PostgrestClient client) : client_(std::move(client)) {}

std::vector<Claim> RemoteClaimStore::load(const std::optional<std::string>& episode_id) const {
    std::vector<Claim> claims;
    std::string filter = episode_id ? "&" + PostgrestClient::eq("episode_id", *episode_id) : "";

    for (size_t offset = 0;; offset += kPageSize) {
        json rows = client_.select("claims",
            std::string("select=") + kClaimColumns + filter +
            "&order=id.asc&limit=" + std::to_string(kPageSize) +
            "&offset=" + std::to_string(offset));
        if (!rows.is_array() || rows.empty()) break;

        for (auto& row : rows) {
            Vector embedding;
            if (row.contains("embedding") && !row["embedding"].is_null()) {
                embedding = from_pgvector(row["embedding"]);
            }
            row.erase("embedding");
            Claim claim = Claim::from_json(row);
            claim.embedding = std::move(embedding);
            claims.push_back(std::move(claim));
        }
        if (rows.size() < kPageSize) break;
    }
    return claims;
}

std::vector<Claim> RemoteClaimStore::load_relation() const {
    std::vector<Claim> relation;
    for (size_t offset = 0;; offset += kPageSize) {
        json rows = client_.select("claims",
            "select=id,duplicate_of&order=id.asc&limit=" + std::to_string(kPageSize) +
            "&offset=" + std::to_string(offset));
        if (!rows.is_array() || rows.empty()) break;

        for (const auto& row : rows) {
            Claim claim;
            claim.id = row.at("id").get<int64_t>();
            if (row.contains("duplicate_of") && !row["duplicate_of"].is_null()) {
                claim.duplicate_of = row["duplicate_of"].get<int64_t>();
            }
            relation.push_back(std::move(claim));
        }
        if (rows.size() < kPageSize) break;
    }
    return relation;
}

void RemoteClaimStore::mark_duplicates(const std::vector<DuplicateLink>& links) {
    if (links.empty()) return;

    // The run may have seen one episode only; check against the whole table
    std::vector<Claim> relation = load_relation();
    apply_duplicate_links(relation, links);

    // One PATCH per kept claim
    std::map<int64_t, std::vector<int64_t>> by_kept;
    for (const auto& link : links) {
        by_kept[link.kept_id].push_back(link.duplicate_id);
    }

    for (const auto& [kept, duplicates] : by_kept) {
        std::string ids;
        for (int64_t id : duplicates) {
            if (!ids.empty()) ids += ",";
            ids += std::to_string(id);
        }
        client_.patch("claims", "id=in.(" + ids + ")", {{"duplicate_of", kept}});
    }
}

void RemoteClaimStore::store_embeddings(const std::vector<Claim>& claims) {
    for (const auto& claim : claims) {
        if (claim.embedding.empty()) continue;
        client_.patch("claims", PostgrestClient::eq("id", std::to_string(claim.id)),
                      {{"embedding", to_pgvector(claim.embedding)}});
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<ClaimStore> create_claim_store(const ClaimStoreConfig& config) {
    if (config.backend == "local") {
        return std::make_unique<LocalClaimStore>(config.path);
    }
    if (config.backend == "remote") {
        if (config.remote_url.empty()) {
            throw std::invalid_argument("Remote claim store needs a remote_url");
        }
        return std::make_unique<RemoteClaimStore>(
            PostgrestClient(config.remote_url, config.remote_key, config.timeout_seconds)
        );
    }
    throw std::invalid_argument("Unknown claim store backend: " + config.backend);
}

} // namespace atlas
