#include "common/vector_math.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace atlas {

double dot(const Vector& a, const Vector& b) {
    double sum = 0.0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

double l2_norm(const Vector& v) {
    return std::sqrt(dot(v, v));
}

void l2_normalize(Vector& v) {
    double norm = l2_norm(v);
    if (norm <= 0.0) return;
    for (auto& x : v) {
        x = static_cast<float>(x / norm);
    }
}

double cosine_similarity(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(
            "Dimension mismatch: " + std::to_string(a.size()) +
            " vs " + std::to_string(b.size())
        );
    }
    double na = l2_norm(a);
    double nb = l2_norm(b);
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    double cos = dot(a, b) / (na * nb);
    return std::max(-1.0, std::min(1.0, cos));
}

double similarity_score(const Vector& a, const Vector& b) {
    return std::max(0.0, cosine_similarity(a, b));
}

double squared_distance(const Vector& a, const Vector& b) {
    double sum = 0.0;
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += diff * diff;
    }
    return sum;
}

Vector weighted_mean(const std::vector<const Vector*>& vectors, const std::vector<double>& weights) {
    if (vectors.empty()) return {};

    size_t dim = vectors.front()->size();
    std::vector<double> acc(dim, 0.0);
    double total_weight = 0.0;

    for (size_t i = 0; i < vectors.size(); ++i) {
        double w = (i < weights.size() && weights[i] > 0.0) ? weights[i] : 1.0;
        const Vector& v = *vectors[i];
        for (size_t d = 0; d < dim && d < v.size(); ++d) {
            acc[d] += w * v[d];
        }
        total_weight += w;
    }

    Vector mean(dim, 0.0f);
    for (size_t d = 0; d < dim; ++d) {
        mean[d] = static_cast<float>(acc[d] / total_weight);
    }
    return mean;
}

} // namespace atlas
