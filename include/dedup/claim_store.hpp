#pragma once

#include "common/postgrest_client.hpp"
#include "corpus/claim.hpp"
#include "dedup/duplicate_forest.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Where claims are read from and duplicate links written to
 */
class ClaimStore {
public:
    virtual ~ClaimStore() = default;

    /**
     * @brief Claims ordered by id, optionally restricted to one episode
     */
    virtual std::vector<Claim> load(const std::optional<std::string>& episode_id = std::nullopt) const = 0;

    /**
     * @brief Set duplicate_of for each link; rows are never deleted
     *
     * The links are checked against every stored claim before anything is
     * written.
     *
     * @throws DuplicateCycleError if the stored relation would gain a cycle
     */
    virtual void mark_duplicates(const std::vector<DuplicateLink>& links) = 0;

    /**
     * @brief Persist embeddings computed for claims that had none
     */
    virtual void store_embeddings(const std::vector<Claim>& claims) = 0;

    virtual std::string backend_name() const = 0;
};

/**
 * @brief Set duplicate_of on claims for each link and check the result
 *
 * claims must hold the whole stored relation, not just the claims a run
 * looked at.
 *
 * @throws std::invalid_argument if a link names an unknown claim
 * @throws DuplicateCycleError if the updated relation is not a forest
 */
void apply_duplicate_links(std::vector<Claim>& claims, const std::vector<DuplicateLink>& links);

/**
 * @brief Claims kept in a JSON array file, rewritten atomically
 */
class LocalClaimStore : public ClaimStore {
public:
    explicit LocalClaimStore(const std::string& path);

    std::vector<Claim> load(const std::optional<std::string>& episode_id = std::nullopt) const override;
    void mark_duplicates(const std::vector<DuplicateLink>& links) override;
    void store_embeddings(const std::vector<Claim>& claims) override;
    std::string backend_name() const override { return "local"; }

private:
    std::string path_;

    std::vector<Claim> load_all() const;
};

/**
 * @brief The remote claims table
 */
class RemoteClaimStore : public ClaimStore {
public:
    explicit RemoteClaimStore(PostgrestClient client);

    std::vector<Claim> load(const std::optional<std::string>& episode_id = std::nullopt) const override;
    void mark_duplicates(const std::vector<DuplicateLink>& links) override;
    void store_embeddings(const std::vector<Claim>& claims) override;
    std::string backend_name() const override { return "remote"; }

private:
    PostgrestClient client_;

    /**
     * @brief id and duplicate_of of every stored claim
     */
    std::vector<Claim> load_relation() const;
};

/**
 * @brief Settings for create_claim_store
 */
struct ClaimStoreConfig {
    std::string backend = "local";          ///< "local" or "remote"
    std::string path = "claims.json";
    std::string remote_url;
    std::string remote_key;
    int timeout_seconds = 30;
};

/**
 * @throws std::invalid_argument for an unknown backend or missing URL
 */
std::unique_ptr<ClaimStore> create_claim_store(const ClaimStoreConfig& config);

} // namespace atlas
