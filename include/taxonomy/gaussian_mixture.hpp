#pragma once

#include "taxonomy/taxonomy_types.hpp"
#include <cstdint>
#include <vector>

namespace atlas {

using Matrix = std::vector<std::vector<double>>;

/**
 * @brief Settings for fitting a spherical Gaussian mixture
 */
struct GmmConfig {
    int max_iterations = 200;               ///< EM iterations per restart
    double tolerance = 1e-3;                ///< Convergence on mean log-likelihood
    int n_init = 3;                         ///< Restarts; the best likelihood wins
    int kmeans_iterations = 10;             ///< Lloyd steps after k-means++ seeding
    double reg_covar = 1e-6;                ///< Added to every variance
    uint32_t seed = 42;
};

/**
 * @brief Gaussian mixture with one scalar variance per component
 *
 * Initialized with k-means++ seeding and a few Lloyd iterations, then
 * refined by EM. Deterministic for a given seed.
 */
class GaussianMixture {
public:
    explicit GaussianMixture(const GmmConfig& config = GmmConfig());

    /**
     * @brief Fit k components to the rows of data
     * @throws std::invalid_argument if k < 1, data is empty or k > rows
     */
    void fit(const Matrix& data, int k);

    /**
     * @brief Posterior membership probabilities, one row per point
     */
    Matrix predict_proba(const Matrix& data) const;

    /**
     * @brief Most probable component per point (ties to the lowest index)
     */
    std::vector<int> predict(const Matrix& data) const;

    /**
     * @brief Total log-likelihood of data under the model
     */
    double log_likelihood(const Matrix& data) const;

    /**
     * @brief Bayesian information criterion, lower is better
     *
     * Free parameters: k*d means, k variances, k-1 weights.
     */
    double bic(const Matrix& data) const;

    int num_components() const { return static_cast<int>(weights_.size()); }
    bool converged() const { return converged_; }
    int iterations() const { return iterations_; }

    const Matrix& means() const { return means_; }
    const std::vector<double>& variances() const { return variances_; }
    const std::vector<double>& weights() const { return weights_; }

private:
    GmmConfig config_;
    Matrix means_;
    std::vector<double> variances_;
    std::vector<double> weights_;
    bool converged_ = false;
    int iterations_ = 0;

    /**
     * @brief Log of weight * density per point and component
     */
    Matrix weighted_log_prob(const Matrix& data) const;

    void m_step(const Matrix& data, const Matrix& resp);
};

/**
 * @brief Mean silhouette coefficient with Euclidean distance
 *
 * Points alone in their cluster score 0. Returns 0 when there are fewer
 * than two distinct labels or every point has its own label.
 */
double silhouette_score(const Matrix& data, const std::vector<int>& labels);

/**
 * @brief Candidate cluster counts after clamping to the corpus size
 *
 * n == 0 gives no candidates and n == 1 gives {1}. When n <= min_k the
 * single candidate max(2, n - 1) (at most n) is used; otherwise
 * min_k .. min(max_k, n - 1).
 */
std::vector<int> candidate_cluster_counts(size_t n, int min_k, int max_k);

/**
 * @brief Clamp a forced cluster count the same way
 */
int clamp_forced_cluster_count(size_t n, int k);

/**
 * @brief Result of model-order selection
 */
struct ModelOrderSelection {
    int k = 0;
    GaussianMixture model;
    std::vector<ModelOrderScore> scores;
};

/**
 * @brief Fit every candidate k and pick the best by combined score
 *
 * Candidates where some component receives no hard-assigned point are
 * discarded. Combined score = min-max normalized BIC - silhouette_weight *
 * silhouette (silhouette skipped below three clusters); lowest wins, ties
 * go to fewer clusters. If no candidate is valid k is lowered until a fit
 * succeeds.
 *
 * @throws std::invalid_argument if candidates is empty
 */
ModelOrderSelection select_model_order(
    const Matrix& data,
    const std::vector<int>& candidates,
    double silhouette_weight,
    const GmmConfig& config = GmmConfig()
);

} // namespace atlas
