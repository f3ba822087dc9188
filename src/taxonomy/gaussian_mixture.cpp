#include "taxonomy/gaussian_mixture.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>

namespace atlas {

namespace {

constexpr double kPi = 3.14159265358979323846;

double squared_euclidean(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = a[i] - b[i];
        sum += diff * diff;
    }
    return sum;
}

// Uniform in [0, 1) from raw engine output, identical on every standard library
double next_unit(std::mt19937& rng) {
    return static_cast<double>(rng()) / 4294967296.0;
}

double log_sum_exp(const std::vector<double>& values) {
    double max_value = -std::numeric_limits<double>::infinity();
    for (double v : values) max_value = std::max(max_value, v);
    if (!std::isfinite(max_value)) return max_value;
    double sum = 0.0;
    for (double v : values) sum += std::exp(v - max_value);
    return max_value + std::log(sum);
}

/**
 * k-means++ seeding followed by Lloyd iterations; returns hard labels
 */
std::vector<int> kmeans_labels(const Matrix& data, int k, int iterations, std::mt19937& rng) {
    const size_t n = data.size();
    Matrix centers;
    std::vector<bool> chosen(n, false);

    size_t first = static_cast<size_t>(next_unit(rng) * n);
    centers.push_back(data[first]);
    chosen[first] = true;

    std::vector<double> closest(n);
    for (size_t i = 0; i < n; ++i) {
        closest[i] = squared_euclidean(data[i], centers[0]);
    }

    while (static_cast<int>(centers.size()) < k) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) total += closest[i];

        size_t pick = n;
        if (total > 0.0) {
            double target = next_unit(rng) * total;
            double acc = 0.0;
            for (size_t i = 0; i < n; ++i) {
                acc += closest[i];
                if (acc > target && closest[i] > 0.0) {
                    pick = i;
                    break;
                }
            }
        }
        if (pick == n) {
            // Remaining points coincide with chosen centers
            for (size_t i = 0; i < n; ++i) {
                if (!chosen[i]) {
                    pick = i;
                    break;
                }
            }
        }

        chosen[pick] = true;
        centers.push_back(data[pick]);
        for (size_t i = 0; i < n; ++i) {
            closest[i] = std::min(closest[i], squared_euclidean(data[i], centers.back()));
        }
    }

    std::vector<int> labels(n, 0);
    const size_t d = data[0].size();

    for (int iter = 0; iter <= iterations; ++iter) {
        bool changed = false;
        for (size_t i = 0; i < n; ++i) {
            int best = 0;
            double best_dist = squared_euclidean(data[i], centers[0]);
            for (int c = 1; c < k; ++c) {
                double dist = squared_euclidean(data[i], centers[c]);
                if (dist < best_dist) {
                    best_dist = dist;
                    best = c;
                }
            }
            if (labels[i] != best) {
                labels[i] = best;
                changed = true;
            }
        }
        if (iter > 0 && !changed) break;
        if (iter == iterations) break;

        Matrix sums(k, std::vector<double>(d, 0.0));
        std::vector<int> counts(k, 0);
        for (size_t i = 0; i < n; ++i) {
            counts[labels[i]]++;
            for (size_t j = 0; j < d; ++j) sums[labels[i]][j] += data[i][j];
        }
        for (int c = 0; c < k; ++c) {
            if (counts[c] == 0) continue;  // empty cluster keeps its center
            for (size_t j = 0; j < d; ++j) centers[c][j] = sums[c][j] / counts[c];
        }
    }

    return labels;
}

} // anonymous namespace

// ============================================================================
// GaussianMixture
// ============================================================================

GaussianMixture::GaussianMixture(const GmmConfig& config) : config_(config) {}

Matrix GaussianMixture::weighted_log_prob(const Matrix& data) const {
    const size_t k = weights_.size();
    const double d = data.empty() ? 0.0 : static_cast<double>(data[0].size());
    Matrix lp(data.size(), std::vector<double>(k, 0.0));

    for (size_t i = 0; i < data.size(); ++i) {
        for (size_t c = 0; c < k; ++c) {
            double var = variances_[c];
            double dist = squared_euclidean(data[i], means_[c]);
            lp[i][c] = std::log(weights_[c])
                     - 0.5 * d * std::log(2.0 * kPi * var)
                     - dist / (2.0 * var);
        }
    }
    return lp;
}

void GaussianMixture::m_step(const Matrix& data, const Matrix& resp) {
    const size_t n = data.size();
    const size_t d = data[0].size();
    const size_t k = resp[0].size();

    weights_.assign(k, 0.0);
    means_.assign(k, std::vector<double>(d, 0.0));
    variances_.assign(k, 0.0);

    std::vector<double> nk(k, 10.0 * std::numeric_limits<double>::epsilon());
    for (size_t i = 0; i < n; ++i) {
        for (size_t c = 0; c < k; ++c) nk[c] += resp[i][c];
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t c = 0; c < k; ++c) {
            double r = resp[i][c];
            if (r == 0.0) continue;
            for (size_t j = 0; j < d; ++j) means_[c][j] += r * data[i][j];
        }
    }
    for (size_t c = 0; c < k; ++c) {
        for (size_t j = 0; j < d; ++j) means_[c][j] /= nk[c];
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t c = 0; c < k; ++c) {
            double r = resp[i][c];
            if (r == 0.0) continue;
            variances_[c] += r * squared_euclidean(data[i], means_[c]);
        }
    }
    for (size_t c = 0; c < k; ++c) {
        variances_[c] = variances_[c] / (nk[c] * static_cast<double>(d)) + config_.reg_covar;
        weights_[c] = nk[c] / static_cast<double>(n);
    }
}

void GaussianMixture::fit(const Matrix& data, int k) {
    if (k < 1) {
        throw std::invalid_argument("Number of components must be positive");
    }
    if (data.empty() || data[0].empty()) {
        throw std::invalid_argument("Cannot fit a mixture to empty data");
    }
    if (static_cast<size_t>(k) > data.size()) {
        throw std::invalid_argument(
            "Cannot fit " + std::to_string(k) + " components to " +
            std::to_string(data.size()) + " points"
        );
    }

    const size_t n = data.size();
    std::mt19937 rng(config_.seed);

    double best_ll = -std::numeric_limits<double>::infinity();
    Matrix best_means;
    std::vector<double> best_variances;
    std::vector<double> best_weights;
    bool best_converged = false;
    int best_iterations = 0;

    for (int init = 0; init < std::max(1, config_.n_init); ++init) {
        std::vector<int> labels = kmeans_labels(data, k, config_.kmeans_iterations, rng);

        Matrix resp(n, std::vector<double>(k, 0.0));
        for (size_t i = 0; i < n; ++i) resp[i][labels[i]] = 1.0;
        m_step(data, resp);

        double previous = -std::numeric_limits<double>::infinity();
        converged_ = false;
        iterations_ = 0;

        for (int iter = 1; iter <= config_.max_iterations; ++iter) {
            iterations_ = iter;

            // E-step
            Matrix lp = weighted_log_prob(data);
            double total = 0.0;
            for (size_t i = 0; i < n; ++i) {
                double norm = log_sum_exp(lp[i]);
                total += norm;
                for (int c = 0; c < k; ++c) resp[i][c] = std::exp(lp[i][c] - norm);
            }

            // M-step
            m_step(data, resp);

            double mean_ll = total / static_cast<double>(n);
            if (std::abs(mean_ll - previous) < config_.tolerance) {
                converged_ = true;
                break;
            }
            previous = mean_ll;
        }

        double ll = log_likelihood(data);
        if (ll > best_ll || best_means.empty()) {
            best_ll = ll;
            best_means = means_;
            best_variances = variances_;
            best_weights = weights_;
            best_converged = converged_;
            best_iterations = iterations_;
        }
    }

    means_ = best_means;
    variances_ = best_variances;
    weights_ = best_weights;
    converged_ = best_converged;
    iterations_ = best_iterations;
}

Matrix GaussianMixture::predict_proba(const Matrix& data) const {
    Matrix lp = weighted_log_prob(data);
    for (auto& row : lp) {
        double norm = log_sum_exp(row);
        for (auto& v : row) v = std::exp(v - norm);
    }
    return lp;
}

std::vector<int> GaussianMixture::predict(const Matrix& data) const {
    Matrix proba = predict_proba(data);
    std::vector<int> labels(proba.size(), 0);
    for (size_t i = 0; i < proba.size(); ++i) {
        int best = 0;
        for (size_t c = 1; c < proba[i].size(); ++c) {
            if (proba[i][c] > proba[i][best]) best = static_cast<int>(c);
        }
        labels[i] = best;
    }
    return labels;
}

double GaussianMixture::log_likelihood(const Matrix& data) const {
    Matrix lp = weighted_log_prob(data);
    double total = 0.0;
    for (const auto& row : lp) total += log_sum_exp(row);
    return total;
}

double GaussianMixture::bic(const Matrix& data) const {
    const double n = static_cast<double>(data.size());
    const double d = data.empty() ? 0.0 : static_cast<double>(data[0].size());
    const double k = static_cast<double>(num_components());
    double params = k * d + k + (k - 1.0);
    return -2.0 * log_likelihood(data) + params * std::log(n);
}

// ============================================================================
// Silhouette
// ============================================================================

double silhouette_score(const Matrix& data, const std::vector<int>& labels) {
    const size_t n = data.size();
    std::set<int> distinct(labels.begin(), labels.end());
    if (distinct.size() < 2 || distinct.size() >= n) {
        return 0.0;
    }

    int max_label = *distinct.rbegin();
    std::vector<int> sizes(max_label + 1, 0);
    for (int label : labels) sizes[label]++;

    double total = 0.0;
    std::vector<double> sums(max_label + 1);

    for (size_t i = 0; i < n; ++i) {
        if (sizes[labels[i]] <= 1) continue;  // singleton scores 0

        std::fill(sums.begin(), sums.end(), 0.0);
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            sums[labels[j]] += std::sqrt(squared_euclidean(data[i], data[j]));
        }

        double a = sums[labels[i]] / (sizes[labels[i]] - 1);
        double b = std::numeric_limits<double>::infinity();
        for (int label : distinct) {
            if (label == labels[i]) continue;
            b = std::min(b, sums[label] / sizes[label]);
        }

        double denom = std::max(a, b);
        if (denom > 0.0) total += (b - a) / denom;
    }

    return total / static_cast<double>(n);
}

// ============================================================================
// Model Order Selection
// ============================================================================

std::vector<int> candidate_cluster_counts(size_t n, int min_k, int max_k) {
    std::vector<int> candidates;
    if (n == 0) return candidates;
    if (n == 1) return {1};

    int size = static_cast<int>(std::min<size_t>(n, std::numeric_limits<int>::max()));
    if (size <= min_k) {
        candidates.push_back(std::min(size, std::max(2, size - 1)));
        return candidates;
    }

    int upper = std::min(max_k, size - 1);
    for (int k = min_k; k <= upper; ++k) {
        candidates.push_back(k);
    }
    return candidates;
}

int clamp_forced_cluster_count(size_t n, int k) {
    if (n == 0) return 0;
    if (n == 1) return 1;
    int size = static_cast<int>(std::min<size_t>(n, std::numeric_limits<int>::max()));
    if (k < 1) return 1;
    if (k >= size) return std::min(size, std::max(2, size - 1));
    return k;
}

ModelOrderSelection select_model_order(
    const Matrix& data,
    const std::vector<int>& candidates,
    double silhouette_weight,
    const GmmConfig& config
) {
    if (candidates.empty()) {
        throw std::invalid_argument("No candidate cluster counts");
    }

    std::vector<int> ks(candidates);
    std::sort(ks.begin(), ks.end());
    ks.erase(std::unique(ks.begin(), ks.end()), ks.end());

    ModelOrderSelection selection;
    std::vector<GaussianMixture> models;

    auto fit_candidate = [&](int k) {
        GaussianMixture model(config);
        model.fit(data, k);

        std::vector<int> labels = model.predict(data);
        std::vector<int> counts(k, 0);
        for (int label : labels) counts[label]++;

        ModelOrderScore score;
        score.k = k;
        score.valid = std::all_of(counts.begin(), counts.end(), [](int c) { return c > 0; });
        score.log_likelihood = model.log_likelihood(data);
        score.bic = model.bic(data);
        score.silhouette = (k >= 3 && score.valid) ? silhouette_score(data, labels) : 0.0;

        selection.scores.push_back(score);
        models.push_back(std::move(model));
    };

    for (int k : ks) {
        if (k < 1 || static_cast<size_t>(k) > data.size()) continue;
        fit_candidate(k);
    }

    double min_bic = std::numeric_limits<double>::infinity();
    double max_bic = -std::numeric_limits<double>::infinity();
    for (const auto& s : selection.scores) {
        if (!s.valid) continue;
        min_bic = std::min(min_bic, s.bic);
        max_bic = std::max(max_bic, s.bic);
    }
    double range = max_bic - min_bic;

    int best = -1;
    for (size_t i = 0; i < selection.scores.size(); ++i) {
        auto& s = selection.scores[i];
        if (!s.valid) continue;
        double normalized = range > 0.0 ? (s.bic - min_bic) / range : 0.0;
        s.combined = normalized - silhouette_weight * s.silhouette;
        if (best < 0 || s.combined < selection.scores[best].combined) {
            best = static_cast<int>(i);
        }
    }

    // Degenerate data: lower k until every component is populated
    if (best < 0) {
        for (int k = ks.front() - 1; k >= 1 && best < 0; --k) {
            if (static_cast<size_t>(k) > data.size()) continue;
            fit_candidate(k);
            if (selection.scores.back().valid) {
                best = static_cast<int>(selection.scores.size() - 1);
            }
        }
    }

    if (best < 0) {
        throw std::invalid_argument("No cluster count could be fitted");
    }

    selection.k = selection.scores[best].k;
    selection.model = models[best];
    return selection;
}

} // namespace atlas
