#include "taxonomy/projection.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace atlas {

namespace {

constexpr double kEigenEpsilon = 1e-10;

struct Eigenpairs {
    std::vector<double> values;
    Matrix vectors;                         ///< One row per eigenvector
};

/**
 * @brief Leading eigenpairs of a symmetric matrix, largest eigenvalue first
 *
 * Each eigenvector is oriented so that its largest-magnitude component is
 * positive. Empty when the solver does not converge.
 */
Eigenpairs leading_eigenpairs(const Eigen::MatrixXd& symmetric, int count) {
    Eigenpairs result;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(symmetric);
    if (solver.info() != Eigen::Success) {
        return result;
    }

    // Eigen sorts eigenvalues in increasing order
    const Eigen::Index n = symmetric.rows();
    for (int e = 0; e < count && e < n; ++e) {
        Eigen::Index col = n - 1 - e;
        Eigen::VectorXd v = solver.eigenvectors().col(col);

        Eigen::Index largest = 0;
        v.cwiseAbs().maxCoeff(&largest);
        if (v(largest) < 0.0) {
            v = -v;
        }

        result.values.push_back(solver.eigenvalues()(col));
        result.vectors.emplace_back(v.data(), v.data() + v.size());
    }
    return result;
}

Eigen::MatrixXd to_eigen(const Matrix& points) {
    const Eigen::Index n = static_cast<Eigen::Index>(points.size());
    const Eigen::Index d = n > 0 ? static_cast<Eigen::Index>(points[0].size()) : 0;
    Eigen::MatrixXd m(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < d; ++j) m(i, j) = points[i][j];
    }
    return m;
}

std::vector<Point2D> coordinates_from(const Eigenpairs& pairs, size_t n) {
    const auto& values = pairs.values;
    const auto& vectors = pairs.vectors;
    std::vector<Point2D> coords(n);
    for (size_t i = 0; i < n; ++i) {
        coords[i].x = values.size() > 0 && values[0] > 0.0 ? vectors[0][i] * std::sqrt(values[0]) : 0.0;
        coords[i].y = values.size() > 1 && values[1] > 0.0 ? vectors[1][i] * std::sqrt(values[1]) : 0.0;
    }
    return coords;
}

} // anonymous namespace

// ============================================================================
// Projectors
// ============================================================================

std::vector<Point2D> CosineMdsProjector::project(const Matrix& points) const {
    const Eigen::Index n = static_cast<Eigen::Index>(points.size());
    if (n < 3) {
        return {};
    }

    Eigen::MatrixXd unit = to_eigen(points);
    for (Eigen::Index i = 0; i < unit.rows(); ++i) {
        double norm = unit.row(i).norm();
        if (norm > 0.0) unit.row(i) /= norm;
    }

    // Squared cosine distances; a zero vector is at distance 1 from everything
    Eigen::MatrixXd cosine = (unit * unit.transpose()).cwiseMax(-1.0).cwiseMin(1.0);
    Eigen::MatrixXd d2 = (Eigen::MatrixXd::Ones(n, n) - cosine).array().square().matrix();
    d2.diagonal().setZero();

    // B = -1/2 J D2 J
    Eigen::MatrixXd j = Eigen::MatrixXd::Identity(n, n) -
                        Eigen::MatrixXd::Constant(n, n, 1.0 / static_cast<double>(n));
    Eigen::MatrixXd b = -0.5 * j * d2 * j;

    Eigenpairs pairs = leading_eigenpairs(b, 2);
    if (pairs.values.empty() || pairs.values[0] <= kEigenEpsilon) {
        return {};
    }
    return coordinates_from(pairs, points.size());
}

std::vector<Point2D> PcaProjector::project(const Matrix& points) const {
    const size_t n = points.size();
    if (n == 0) {
        return {};
    }
    if (n == 1) {
        return {Point2D{0.0, 0.0}};
    }

    Eigen::MatrixXd x = to_eigen(points);
    Eigen::MatrixXd centered = x.rowwise() - x.colwise().mean();

    // Gram matrix shares the nonzero spectrum of the covariance
    Eigen::MatrixXd gram = centered * centered.transpose();

    return coordinates_from(leading_eigenpairs(gram, 2), n);
}

// ============================================================================
// Utility Functions
// ============================================================================

void normalize_unit_square(std::vector<Point2D>& points) {
    if (points.empty()) return;

    auto normalize_axis = [&](double Point2D::*axis) {
        double lo = points[0].*axis;
        double hi = points[0].*axis;
        for (const auto& p : points) {
            lo = std::min(lo, p.*axis);
            hi = std::max(hi, p.*axis);
        }
        double range = hi - lo;
        for (auto& p : points) {
            p.*axis = range > kEigenEpsilon ? (p.*axis - lo) / range : 0.5;
        }
    };

    normalize_axis(&Point2D::x);
    normalize_axis(&Point2D::y);
}

ProjectionResult project_points(const Matrix& points, const std::string& preferred) {
    if (preferred != "mds" && preferred != "pca") {
        throw std::invalid_argument("Unknown projection method: " + preferred);
    }

    ProjectionResult result;
    if (preferred == "mds") {
        CosineMdsProjector mds;
        result.points = mds.project(points);
        result.method = mds.get_name();
    }

    if (result.points.empty()) {
        PcaProjector pca;
        result.points = pca.project(points);
        result.method = pca.get_name();
    }

    normalize_unit_square(result.points);
    return result;
}

} // namespace atlas
