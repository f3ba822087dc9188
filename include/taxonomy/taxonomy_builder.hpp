#pragma once

#include "common/run_summary.hpp"
#include "corpus/claim.hpp"
#include "corpus/document.hpp"
#include "index/vector_index.hpp"
#include "taxonomy/cluster_labeler.hpp"
#include "taxonomy/gaussian_mixture.hpp"
#include "taxonomy/taxonomy_types.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Settings for a taxonomy rebuild
 */
struct TaxonomyConfig {
    int min_clusters = 8;                   ///< Smallest candidate k
    int max_clusters = 12;                  ///< Largest candidate k
    int forced_clusters = 0;                ///< > 0 bypasses model-order selection
    double silhouette_weight = 1.0;         ///< Weight of silhouette in the combined score
    double assignment_threshold = 0.1;      ///< Minimum posterior for a soft edge

    size_t label_samples = 5;               ///< Top documents sent to the labeler
    size_t label_parallelism = 4;           ///< Concurrent labeler calls
    int label_timeout_seconds = 90;         ///< Per-wave labeling deadline
    size_t abstract_chars = 300;            ///< Abstract excerpt length in samples
    bool skip_labels = false;               ///< Use placeholder labels only

    std::string projection = "mds";         ///< "mds" (falls back to pca) or "pca"
    GmmConfig gmm;
    bool verbose = false;
};

/**
 * @brief Token-weighted, L2-normalized mean of a document's chunk vectors
 */
struct DocumentVector {
    std::string document_id;
    Vector embedding;
    int chunk_count = 0;
    int token_count = 0;
};

struct TaxonomyResult {
    TaxonomySnapshot snapshot;
    RunSummary summary;
};

/**
 * @brief Builds the soft topical taxonomy from indexed chunk vectors
 *
 * Stages: aggregate chunk vectors per document, select the number of
 * clusters, soft-assign documents, project to 2D, label clusters, and
 * propagate document assignments to claims. Nothing is written; the caller
 * hands the snapshot to a TaxonomyStore.
 */
class TaxonomyBuilder {
public:
    /**
     * @param config Rebuild settings
     * @param labeler Cluster labeler; placeholders are used when null
     * @throws std::invalid_argument for inconsistent settings
     */
    explicit TaxonomyBuilder(const TaxonomyConfig& config,
                             std::shared_ptr<TextLabeler> labeler = nullptr);

    /**
     * @brief Rebuild from every vector in the index
     *
     * @param catalog Known documents (titles and abstracts for labeling);
     *        when empty, every indexed document is accepted
     * @param claims Claims to propagate assignments to
     */
    TaxonomyResult build(
        const VectorIndex& index,
        const std::vector<Document>& catalog,
        const std::vector<Claim>& claims
    ) const;

    /**
     * @brief Rebuild from already fetched vectors
     */
    TaxonomyResult build_from_vectors(
        const std::vector<StoredVector>& vectors,
        const std::vector<Document>& catalog,
        const std::vector<Claim>& claims
    ) const;

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // ------------------------------------------------------------------
    // Stages
    // ------------------------------------------------------------------

    /**
     * @brief Aggregate chunk vectors to document vectors
     *
     * Chunks of documents outside known_documents (when non-null) and
     * vectors whose size differs from the first are skipped and counted in
     * summary. Output is ordered by document id.
     */
    static std::vector<DocumentVector> aggregate(
        const std::vector<StoredVector>& vectors,
        const std::set<std::string>* known_documents,
        RunSummary& summary
    );

    /**
     * @brief Keep edges above threshold; the maximal edge is always kept
     * and marked primary (ties to the lowest cluster id)
     */
    static std::vector<PaperClusterAssignment> soft_assign(
        const std::vector<std::string>& document_ids,
        const Matrix& posteriors,
        double threshold
    );

    /**
     * @brief Claims inherit their source document's edges
     *
     * Claims without a document are ignored; claims whose document has no
     * assignment are skipped and counted.
     */
    static std::vector<ClaimClusterAssignment> propagate(
        const std::vector<PaperClusterAssignment>& assignments,
        const std::vector<Claim>& claims,
        RunSummary& summary
    );

    const TaxonomyConfig& config() const { return config_; }

private:
    TaxonomyConfig config_;
    std::shared_ptr<TextLabeler> labeler_;
    ProgressCallback progress_callback_;

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message) const;

    std::vector<std::vector<std::string>> label_samples(
        const std::vector<PaperClusterAssignment>& assignments,
        int k,
        const std::map<std::string, const Document*>& documents
    ) const;
};

} // namespace atlas
