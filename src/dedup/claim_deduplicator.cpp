#include "dedup/claim_deduplicator.hpp"
#include "common/errors.hpp"
#include "embedding/embedding_provider.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace atlas {

namespace {

// Disjoint sets over candidate indices; the smaller index becomes the root
class UnionFind {
public:
    explicit UnionFind(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        size_t ra = find(a);
        size_t rb = find(b);
        if (ra == rb) return;
        if (rb < ra) std::swap(ra, rb);
        parent_[rb] = ra;
    }

private:
    std::vector<size_t> parent_;
};

int64_t abs_difference(int64_t a, int64_t b) {
    return a > b ? a - b : b - a;
}

} // anonymous namespace

// ============================================================================
// DedupPass
// ============================================================================

json DedupPass::to_json() const {
    return {
        {"name", name},
        {"similarity_threshold", similarity_threshold},
        {"temporal_window_ms", temporal_window_ms}
    };
}

DedupPass DedupPass::from_json(const json& j) {
    DedupPass pass;
    pass.name = j.value("name", "");
    pass.similarity_threshold = j.value("similarity_threshold", pass.similarity_threshold);
    pass.temporal_window_ms = j.value("temporal_window_ms", pass.temporal_window_ms);
    if (pass.similarity_threshold <= 0.0 || pass.similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity_threshold must be in (0, 1]");
    }
    if (pass.temporal_window_ms < 0) {
        throw std::invalid_argument("temporal_window_ms must be non-negative");
    }
    return pass;
}

std::vector<DedupPass> default_dedup_passes() {
    return {
        {"strict", 0.95, 30000},
        {"broad", 0.90, 180000}
    };
}

json GroupResolution::to_json() const {
    return {{"kept_id", kept_id}, {"duplicate_ids", duplicate_ids}};
}

json PassReport::to_json() const {
    json j = pass.to_json();
    j["analyzed"] = analyzed;
    j["skipped"] = skipped;
    j["groups"] = groups;
    j["marked_duplicate"] = marked_duplicate;
    j["resolutions"] = json::array();
    for (const auto& r : resolutions) {
        j["resolutions"].push_back(r.to_json());
    }
    return j;
}

// ============================================================================
// Detection
// ============================================================================

std::vector<DuplicateGroup> ClaimDeduplicator::detect_duplicates(
    const std::vector<Claim>& claims,
    double similarity_threshold,
    int64_t temporal_window_ms,
    int* skipped
) {
    std::vector<const Claim*> candidates;
    int skip_count = 0;
    for (const auto& claim : claims) {
        if (claim.is_duplicate()) continue;
        if (claim.embedding.empty() || !claim.timestamp_ms) {
            skip_count++;
            continue;
        }
        candidates.push_back(&claim);
    }
    if (skipped) *skipped = skip_count;

    std::sort(candidates.begin(), candidates.end(),
        [](const Claim* a, const Claim* b) { return a->id < b->id; });

    // Pairs are only compared within an episode
    std::map<std::string, std::vector<size_t>> by_episode;
    for (size_t i = 0; i < candidates.size(); ++i) {
        by_episode[candidates[i]->episode_id].push_back(i);
    }

    UnionFind sets(candidates.size());
    for (const auto& [episode, members] : by_episode) {
        for (size_t a = 0; a < members.size(); ++a) {
            const Claim& first = *candidates[members[a]];
            for (size_t b = a + 1; b < members.size(); ++b) {
                const Claim& second = *candidates[members[b]];
                if (abs_difference(*first.timestamp_ms, *second.timestamp_ms) > temporal_window_ms) {
                    continue;
                }
                if (first.embedding.size() != second.embedding.size()) {
                    continue;
                }
                if (cosine_similarity(first.embedding, second.embedding) >= similarity_threshold) {
                    sets.unite(members[a], members[b]);
                }
            }
        }
    }

    // Candidates are sorted by id, so each component's root is its smallest id
    std::map<size_t, DuplicateGroup> components;
    for (size_t i = 0; i < candidates.size(); ++i) {
        components[sets.find(i)].claim_ids.push_back(candidates[i]->id);
    }

    std::vector<DuplicateGroup> groups;
    for (auto& [root, group] : components) {
        if (group.claim_ids.size() > 1) {
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

// ============================================================================
// Resolution
// ============================================================================

double ClaimDeduplicator::quality_score(const Claim& claim) {
    double score = 0.0;
    if (claim.distilled_text && !claim.distilled_text->empty()) {
        score += 1000.0;
        score += 10.0 * claim.distilled_word_count;
    }
    score += static_cast<double>(claim.text.size() / 10);
    if (claim.document_id) {
        score += 50.0;
    }
    score += 100.0 * claim.confidence;
    return score;
}

std::vector<GroupResolution> ClaimDeduplicator::resolve(
    const std::vector<DuplicateGroup>& groups,
    const std::vector<Claim>& claims
) {
    std::unordered_map<int64_t, const Claim*> by_id;
    for (const auto& claim : claims) {
        by_id[claim.id] = &claim;
    }

    std::vector<GroupResolution> resolutions;
    for (const auto& group : groups) {
        if (group.claim_ids.size() < 2) continue;

        std::vector<int64_t> ids = group.claim_ids;
        std::sort(ids.begin(), ids.end());

        int64_t best_id = 0;
        double best_score = -1.0;
        for (int64_t id : ids) {
            auto it = by_id.find(id);
            if (it == by_id.end()) {
                throw std::invalid_argument("Duplicate group references unknown claim " +
                                            std::to_string(id));
            }
            double score = quality_score(*it->second);
            // Strict comparison keeps the smallest id on ties
            if (score > best_score) {
                best_score = score;
                best_id = id;
            }
        }

        GroupResolution resolution;
        resolution.kept_id = best_id;
        for (int64_t id : ids) {
            if (id != best_id) resolution.duplicate_ids.push_back(id);
        }
        resolutions.push_back(std::move(resolution));
    }
    return resolutions;
}

// ============================================================================
// Passes
// ============================================================================

DedupResult ClaimDeduplicator::run_passes(
    std::vector<Claim>& claims,
    const std::vector<DedupPass>& passes
) const {
    auto start_time = std::chrono::steady_clock::now();

    DedupResult result;
    result.summary.pipeline = "dedup";

    DuplicateForest forest = DuplicateForest::from_claims(claims);

    std::unordered_map<int64_t, size_t> position;
    for (size_t i = 0; i < claims.size(); ++i) {
        position[claims[i].id] = i;
    }

    for (const auto& pass : passes) {
        PassReport report;
        report.pass = pass;

        auto groups = detect_duplicates(claims, pass.similarity_threshold,
                                        pass.temporal_window_ms, &report.skipped);
        for (const auto& claim : claims) {
            if (!claim.is_duplicate() && !claim.embedding.empty() && claim.timestamp_ms) {
                report.analyzed++;
            }
        }

        report.resolutions = resolve(groups, claims);
        report.groups = static_cast<int>(report.resolutions.size());

        // Validate the whole pass before touching any claim
        DuplicateForest staged = forest;
        for (const auto& resolution : report.resolutions) {
            for (int64_t duplicate_id : resolution.duplicate_ids) {
                staged.add_link(duplicate_id, resolution.kept_id);
            }
        }
        forest = std::move(staged);

        for (const auto& resolution : report.resolutions) {
            for (int64_t duplicate_id : resolution.duplicate_ids) {
                claims[position.at(duplicate_id)].duplicate_of = resolution.kept_id;
                result.new_links.push_back({duplicate_id, resolution.kept_id});
                report.marked_duplicate++;
            }
        }

        if (verbose_) {
            std::cout << "Pass " << pass.name << " (threshold " << pass.similarity_threshold
                      << ", window " << pass.temporal_window_ms << " ms): "
                      << report.analyzed << " analyzed, " << report.groups << " groups, "
                      << report.marked_duplicate << " marked duplicate, "
                      << report.skipped << " skipped" << std::endl;
        }

        result.summary.processed += report.analyzed;
        result.summary.count("groups_" + pass.name, report.groups);
        result.summary.count("duplicates_" + pass.name, report.marked_duplicate);
        result.passes.push_back(std::move(report));
    }

    if (!result.passes.empty()) {
        result.summary.skipped = result.passes.front().skipped;
    }
    result.summary.count("claims_marked_duplicate", static_cast<int>(result.new_links.size()));

    auto end_time = std::chrono::steady_clock::now();
    result.summary.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();
    return result;
}

// ============================================================================
// Embedding
// ============================================================================

int embed_missing_claims(
    std::vector<Claim>& claims,
    const EmbeddingProvider& provider,
    size_t batch_size,
    RunSummary* summary
) {
    std::vector<size_t> pending;
    for (size_t i = 0; i < claims.size(); ++i) {
        if (claims[i].embedding.empty() && !claims[i].is_duplicate() &&
            !claims[i].embedding_text().empty()) {
            pending.push_back(i);
        }
    }

    if (batch_size == 0) batch_size = 1;
    int embedded = 0;

    for (size_t offset = 0; offset < pending.size(); offset += batch_size) {
        size_t end = std::min(offset + batch_size, pending.size());
        std::vector<std::string> texts;
        for (size_t i = offset; i < end; ++i) {
            texts.push_back(claims[pending[i]].embedding_text());
        }

        try {
            auto vectors = provider.embed_batch(texts);
            if (vectors.size() != texts.size()) {
                throw BackendError("Embedding batch returned " + std::to_string(vectors.size()) +
                                   " vectors for " + std::to_string(texts.size()) + " texts");
            }
            for (size_t i = offset; i < end; ++i) {
                claims[pending[i]].embedding = std::move(vectors[i - offset]);
                embedded++;
            }
        } catch (const BackendError& e) {
            std::cerr << "Warning: claim embedding batch failed (" << e.what()
                      << "), retrying one by one" << std::endl;
            for (size_t i = offset; i < end; ++i) {
                Claim& claim = claims[pending[i]];
                try {
                    claim.embedding = provider.embed(claim.embedding_text());
                    embedded++;
                } catch (const BackendError& inner) {
                    std::cerr << "Warning: failed to embed claim " << claim.id
                              << ": " << inner.what() << std::endl;
                    if (summary) summary->errored++;
                }
            }
        }
    }

    if (summary) summary->count("claims_embedded", embedded);
    return embedded;
}

} // namespace atlas
