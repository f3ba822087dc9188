#pragma once

#include "common/vector_math.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace atlas {

// ============================================================================
// Taxonomy Entities
// ============================================================================

/**
 * @brief Position on the normalized 2D map, both axes in [0, 1]
 */
struct Point2D {
    double x = 0.5;
    double y = 0.5;
};

/**
 * @brief One topical cluster of the taxonomy
 */
struct Cluster {
    int cluster_id = 0;                     ///< Dense id, 0 .. k-1
    std::string label;
    std::string description;
    std::vector<std::string> keywords;
    Point2D position;
    int paper_count = 0;                    ///< Documents with any edge to the cluster
    int primary_paper_count = 0;            ///< Documents whose primary edge is this cluster
    Vector centroid;                        ///< Component mean in embedding space

    nlohmann::json to_json() const;
    static Cluster from_json(const nlohmann::json& j);
};

/**
 * @brief Soft membership of a document in a cluster
 */
struct PaperClusterAssignment {
    std::string document_id;
    int cluster_id = 0;
    double confidence = 0.0;                ///< Posterior probability
    bool is_primary = false;                ///< Highest-confidence edge of the document
    Point2D position;                       ///< Document position on the map

    nlohmann::json to_json() const;
    static PaperClusterAssignment from_json(const nlohmann::json& j);
};

/**
 * @brief Cluster membership a claim inherits from its source document
 */
struct ClaimClusterAssignment {
    int64_t claim_id = 0;
    int cluster_id = 0;
    std::string source_document_id;
    double confidence = 0.0;

    nlohmann::json to_json() const;
    static ClaimClusterAssignment from_json(const nlohmann::json& j);
};

/**
 * @brief Scores of one candidate cluster count
 */
struct ModelOrderScore {
    int k = 0;
    bool valid = false;                     ///< False if a component got no documents
    double log_likelihood = 0.0;
    double bic = 0.0;
    double silhouette = 0.0;
    double combined = 0.0;                  ///< Normalized BIC - weight * silhouette

    nlohmann::json to_json() const;
};

/**
 * @brief A complete taxonomy, replaced wholesale on every rebuild
 */
struct TaxonomySnapshot {
    std::vector<Cluster> clusters;
    std::vector<PaperClusterAssignment> paper_assignments;
    std::vector<ClaimClusterAssignment> claim_assignments;

    std::string generated_at;               ///< UTC timestamp
    std::string model_used;                 ///< Labeling model
    std::string projection;                 ///< "mds" or "pca"
    int selected_k = 0;
    std::vector<ModelOrderScore> model_order_scores;

    nlohmann::json to_json() const;
    static TaxonomySnapshot from_json(const nlohmann::json& j);
};

} // namespace atlas
