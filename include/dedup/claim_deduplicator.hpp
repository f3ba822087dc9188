#pragma once

#include "common/run_summary.hpp"
#include "corpus/claim.hpp"
#include "dedup/duplicate_forest.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace atlas {

class EmbeddingProvider;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Parameters of one deduplication pass
 */
struct DedupPass {
    std::string name;
    double similarity_threshold = 0.95;     ///< Minimum cosine similarity
    int64_t temporal_window_ms = 30000;     ///< Maximum |timestamp difference|

    nlohmann::json to_json() const;
    static DedupPass from_json(const nlohmann::json& j);
};

/**
 * @brief Strict pass (0.95, 30 s) followed by a broad pass (0.90, 3 min)
 */
std::vector<DedupPass> default_dedup_passes();

/**
 * @brief Near-duplicate claim ids, sorted ascending
 */
struct DuplicateGroup {
    std::vector<int64_t> claim_ids;
};

/**
 * @brief Which member of a group is kept
 */
struct GroupResolution {
    int64_t kept_id = 0;
    std::vector<int64_t> duplicate_ids;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of one pass
 */
struct PassReport {
    DedupPass pass;
    int analyzed = 0;          ///< Claims that were candidates
    int skipped = 0;           ///< Claims without embedding or timestamp
    int groups = 0;
    int marked_duplicate = 0;
    std::vector<GroupResolution> resolutions;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a multi-pass run
 */
struct DedupResult {
    std::vector<PassReport> passes;
    std::vector<DuplicateLink> new_links;   ///< Links added by this run, in pass order
    RunSummary summary;
};

// ============================================================================
// Claim Deduplicator
// ============================================================================

/**
 * @brief Groups near-duplicate claims and soft-deletes all but the best one
 *
 * Two claims are candidates when they belong to the same episode, their
 * embeddings have cosine similarity >= threshold and their timestamps lie
 * within the temporal window. Groups are the connected components of the
 * candidate graph. Nothing is removed: duplicates get a duplicate_of link to
 * the kept claim.
 */
class ClaimDeduplicator {
public:
    explicit ClaimDeduplicator(bool verbose = false) : verbose_(verbose) {}

    /**
     * @brief Candidate groups among the claims
     *
     * Claims already marked duplicate are ignored. Claims without an
     * embedding or timestamp are ignored and counted in *skipped.
     * Groups are sorted by their smallest id.
     */
    static std::vector<DuplicateGroup> detect_duplicates(
        const std::vector<Claim>& claims,
        double similarity_threshold,
        int64_t temporal_window_ms,
        int* skipped = nullptr
    );

    /**
     * @brief Ranking used to pick the kept claim
     *
     * Distilled form (+1000, +10 per distilled word), raw length (+1 per
     * 10 characters), linked document (+50), confidence (+100 x confidence).
     */
    static double quality_score(const Claim& claim);

    /**
     * @brief Pick the highest-scoring member of each group (smallest id on ties)
     * @throws std::invalid_argument if a group references an unknown claim id
     */
    static std::vector<GroupResolution> resolve(
        const std::vector<DuplicateGroup>& groups,
        const std::vector<Claim>& claims
    );

    /**
     * @brief Run passes in order, updating duplicate_of on the claims
     *
     * Each pass sees only the claims left unmarked by earlier passes.
     * Links go through a forest rebuilt from the claims' existing
     * duplicate_of fields, so a cycle aborts the run before any claim is
     * changed by the offending pass.
     *
     * @throws DuplicateCycleError if a link would close a cycle
     */
    DedupResult run_passes(std::vector<Claim>& claims, const std::vector<DedupPass>& passes) const;

private:
    bool verbose_;
};

/**
 * @brief Embed claims that have no embedding yet
 *
 * Batches that fail are retried one claim at a time; claims that still fail
 * keep an empty embedding (and are then skipped by the deduplicator).
 *
 * @return Number of claims newly embedded
 */
int embed_missing_claims(
    std::vector<Claim>& claims,
    const EmbeddingProvider& provider,
    size_t batch_size,
    RunSummary* summary = nullptr
);

} // namespace atlas
