#pragma once

#include "corpus/claim.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace atlas {

/**
 * @brief Soft-delete edge: duplicate claim -> retained claim
 */
struct DuplicateLink {
    int64_t duplicate_id = 0;
    int64_t kept_id = 0;

    nlohmann::json to_json() const {
        return {{"duplicate_id", duplicate_id}, {"kept_id", kept_id}};
    }

    bool operator==(const DuplicateLink& other) const {
        return duplicate_id == other.duplicate_id && kept_id == other.kept_id;
    }
};

/**
 * @brief The duplicate_of relation, kept acyclic at write time
 *
 * Every claim has at most one outgoing link. add_link() rejects self-loops
 * and links that would close a cycle, so following links from any claim
 * reaches a root in at most size() hops.
 */
class DuplicateForest {
public:
    DuplicateForest() = default;

    /**
     * @brief Rebuild from the duplicate_of fields of stored claims
     * @throws DuplicateCycleError if the stored links are not a forest
     */
    static DuplicateForest from_claims(const std::vector<Claim>& claims);

    /**
     * @brief Record duplicate -> kept
     *
     * Re-adding an existing link is a no-op.
     *
     * @throws DuplicateCycleError on a self-loop or a cycle
     * @throws std::invalid_argument if duplicate already links elsewhere
     */
    void add_link(int64_t duplicate_id, int64_t kept_id);

    std::optional<int64_t> parent(int64_t claim_id) const;

    /**
     * @brief Follow links to the retained root (the claim itself if unlinked)
     * @throws DuplicateCycleError if the hop bound is exceeded
     */
    int64_t root_of(int64_t claim_id) const;

    bool is_duplicate(int64_t claim_id) const { return links_.count(claim_id) > 0; }
    size_t size() const { return links_.size(); }

    std::vector<DuplicateLink> links() const;

private:
    std::map<int64_t, int64_t> links_;
};

} // namespace atlas
