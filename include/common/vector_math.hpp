#pragma once

#include <vector>
#include <cstddef>

namespace atlas {

/// Dense embedding vector
using Vector = std::vector<float>;

/**
 * @brief Dot product of two equal-length vectors
 */
double dot(const Vector& a, const Vector& b);

/**
 * @brief Euclidean norm
 */
double l2_norm(const Vector& v);

/**
 * @brief Normalize in place to unit length (zero vectors are left untouched)
 */
void l2_normalize(Vector& v);

/**
 * @brief Cosine similarity in [-1, 1]; 0 when either vector is zero
 *
 * @throws std::invalid_argument if the dimensions differ
 */
double cosine_similarity(const Vector& a, const Vector& b);

/**
 * @brief Cosine similarity mapped to a [0, 1] relevance score
 *
 * Negative similarities are clamped to 0.
 */
double similarity_score(const Vector& a, const Vector& b);

/**
 * @brief Squared Euclidean distance
 */
double squared_distance(const Vector& a, const Vector& b);

/**
 * @brief Weighted mean of equal-length vectors
 *
 * Non-positive weights count as 1.
 */
Vector weighted_mean(const std::vector<const Vector*>& vectors, const std::vector<double>& weights);

} // namespace atlas
