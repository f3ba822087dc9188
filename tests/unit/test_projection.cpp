#include <gtest/gtest.h>
#include "taxonomy/projection.hpp"
#include <cmath>

using namespace atlas;

class ProjectionTest : public ::testing::Test {
protected:
    // Unit vectors at distinct angles in a 3D space
    Matrix directions() {
        Matrix points;
        for (int i = 0; i < 6; ++i) {
            double angle = 0.5 * i;
            points.push_back({std::cos(angle), std::sin(angle), 0.1 * i});
        }
        return points;
    }

    void expect_in_unit_square(const std::vector<Point2D>& points) {
        for (const auto& p : points) {
            EXPECT_GE(p.x, 0.0);
            EXPECT_LE(p.x, 1.0);
            EXPECT_GE(p.y, 0.0);
            EXPECT_LE(p.y, 1.0);
        }
    }
};

// ==========================================
// Principal Axis Tests
// ==========================================

TEST_F(ProjectionTest, PcaFirstAxisFollowsLargestSpread) {
    // Spread along x, jitter along y
    Matrix points = {{0.0, 0.1, 0.0}, {1.0, -0.1, 0.0}, {2.0, 0.1, 0.0}, {6.0, -0.1, 0.0}};
    auto result = project_points(points, "pca");

    ASSERT_EQ(result.points.size(), 4u);
    EXPECT_NEAR(result.points[0].x, 0.0, 1e-9);
    EXPECT_NEAR(result.points[3].x, 1.0, 1e-9);
    EXPECT_LT(result.points[1].x, result.points[2].x);
    EXPECT_NEAR(result.points[1].x, 1.0 / 6.0, 1e-3);
}

TEST_F(ProjectionTest, MdsSeparatesOpposedGroups) {
    // Two tight groups pointing in different directions
    Matrix points = {{1.0, 0.0, 0.0}, {0.99, 0.05, 0.0}, {0.98, 0.0, 0.05},
                     {0.0, 1.0, 0.0}, {0.05, 0.99, 0.0}, {0.0, 0.98, 0.05}};
    auto result = project_points(points, "mds");

    EXPECT_EQ(result.method, "mds");
    ASSERT_EQ(result.points.size(), 6u);
    for (int i = 0; i < 3; ++i) {
        for (int j = 3; j < 6; ++j) {
            EXPECT_GT(std::fabs(result.points[i].x - result.points[j].x), 0.5);
        }
    }
}

// ==========================================
// Normalization Tests
// ==========================================

TEST_F(ProjectionTest, NormalizeMapsRangeToUnitSquare) {
    std::vector<Point2D> points = {{-2.0, 7.0}, {2.0, 7.0}, {0.0, 7.0}};
    normalize_unit_square(points);

    EXPECT_DOUBLE_EQ(points[0].x, 0.0);
    EXPECT_DOUBLE_EQ(points[1].x, 1.0);
    EXPECT_DOUBLE_EQ(points[2].x, 0.5);
    // Zero range on y
    for (const auto& p : points) {
        EXPECT_DOUBLE_EQ(p.y, 0.5);
    }
}

// ==========================================
// Projection Tests
// ==========================================

TEST_F(ProjectionTest, MdsProjectsDistinctDirections) {
    auto result = project_points(directions(), "mds");
    EXPECT_EQ(result.method, "mds");
    ASSERT_EQ(result.points.size(), 6u);
    expect_in_unit_square(result.points);
}

TEST_F(ProjectionTest, FallsBackToPcaForTwoPoints) {
    Matrix points = {{1.0, 0.0}, {0.0, 1.0}};
    auto result = project_points(points, "mds");
    EXPECT_EQ(result.method, "pca");
    ASSERT_EQ(result.points.size(), 2u);
    expect_in_unit_square(result.points);
    EXPECT_NE(result.points[0].x, result.points[1].x);
}

TEST_F(ProjectionTest, IdenticalPointsLandInCenter) {
    Matrix points(4, std::vector<double>{0.3, 0.4, 0.5});
    auto result = project_points(points, "mds");
    EXPECT_EQ(result.method, "pca");
    for (const auto& p : result.points) {
        EXPECT_DOUBLE_EQ(p.x, 0.5);
        EXPECT_DOUBLE_EQ(p.y, 0.5);
    }
}

TEST_F(ProjectionTest, PcaRequestedDirectly) {
    auto result = project_points(directions(), "pca");
    EXPECT_EQ(result.method, "pca");
    expect_in_unit_square(result.points);
}

TEST_F(ProjectionTest, UnknownMethodThrows) {
    EXPECT_THROW(project_points(directions(), "tsne"), std::invalid_argument);
}
