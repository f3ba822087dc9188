#pragma once

#include "taxonomy/gaussian_mixture.hpp"
#include "taxonomy/taxonomy_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Maps high-dimensional points to 2D map coordinates
 */
class Projector {
public:
    virtual ~Projector() = default;

    /**
     * @brief Project points to raw (unnormalized) 2D coordinates
     *
     * @return Coordinates, or an empty vector when the method does not
     *         apply to this input
     */
    virtual std::vector<Point2D> project(const Matrix& points) const = 0;

    virtual std::string get_name() const = 0;
};

/**
 * @brief Classical multidimensional scaling over cosine distances
 *
 * Double-centers the squared distance matrix (1 - cosine) and keeps the two
 * leading eigenvectors. Not applicable to fewer than three points or when
 * the leading eigenvalue vanishes.
 */
class CosineMdsProjector : public Projector {
public:
    std::vector<Point2D> project(const Matrix& points) const override;
    std::string get_name() const override { return "mds"; }
};

/**
 * @brief Linear projection onto the two leading principal components
 */
class PcaProjector : public Projector {
public:
    std::vector<Point2D> project(const Matrix& points) const override;
    std::string get_name() const override { return "pca"; }
};

/**
 * @brief Rescale each axis to [0, 1]; an axis with zero range maps to 0.5
 */
void normalize_unit_square(std::vector<Point2D>& points);

/**
 * @brief Outcome of project_points
 */
struct ProjectionResult {
    std::vector<Point2D> points;            ///< Normalized to [0, 1]
    std::string method;                     ///< Projector actually used
};

/**
 * @brief Project with the preferred method ("mds" or "pca"), falling back
 * to PCA when MDS is not applicable, then normalize
 *
 * @throws std::invalid_argument for an unknown method name
 */
ProjectionResult project_points(const Matrix& points, const std::string& preferred = "mds");

} // namespace atlas
