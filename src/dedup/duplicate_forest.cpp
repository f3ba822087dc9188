#include "dedup/duplicate_forest.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <string>

namespace atlas {

DuplicateForest DuplicateForest::from_claims(const std::vector<Claim>& claims) {
    DuplicateForest forest;
    for (const auto& claim : claims) {
        if (claim.duplicate_of) {
            forest.add_link(claim.id, *claim.duplicate_of);
        }
    }
    return forest;
}

void DuplicateForest::add_link(int64_t duplicate_id, int64_t kept_id) {
    if (duplicate_id == kept_id) {
        throw DuplicateCycleError(
            "Claim " + std::to_string(duplicate_id) + " cannot be a duplicate of itself"
        );
    }

    auto existing = links_.find(duplicate_id);
    if (existing != links_.end()) {
        if (existing->second == kept_id) {
            return;
        }
        throw std::invalid_argument(
            "Claim " + std::to_string(duplicate_id) + " is already a duplicate of " +
            std::to_string(existing->second)
        );
    }

    // Walking up from kept must not reach duplicate
    int64_t current = kept_id;
    size_t hops = 0;
    while (true) {
        if (current == duplicate_id) {
            throw DuplicateCycleError(
                "Linking " + std::to_string(duplicate_id) + " -> " +
                std::to_string(kept_id) + " would create a cycle"
            );
        }
        auto it = links_.find(current);
        if (it == links_.end()) break;
        current = it->second;
        if (++hops > links_.size()) {
            throw DuplicateCycleError("Existing duplicate links contain a cycle");
        }
    }

    links_[duplicate_id] = kept_id;
}

std::optional<int64_t> DuplicateForest::parent(int64_t claim_id) const {
    auto it = links_.find(claim_id);
    if (it == links_.end()) return std::nullopt;
    return it->second;
}

int64_t DuplicateForest::root_of(int64_t claim_id) const {
    int64_t current = claim_id;
    size_t hops = 0;
    for (auto it = links_.find(current); it != links_.end(); it = links_.find(current)) {
        current = it->second;
        if (++hops > links_.size()) {
            throw DuplicateCycleError(
                "No root within " + std::to_string(links_.size()) + " hops of claim " +
                std::to_string(claim_id)
            );
        }
    }
    return current;
}

std::vector<DuplicateLink> DuplicateForest::links() const {
    std::vector<DuplicateLink> result;
    for (const auto& [duplicate, kept] : links_) {
        result.push_back({duplicate, kept});
    }
    return result;
}

} // namespace atlas
