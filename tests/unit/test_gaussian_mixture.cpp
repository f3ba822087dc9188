#include <gtest/gtest.h>
#include "taxonomy/gaussian_mixture.hpp"
#include <numeric>
#include <random>
#include <set>

using namespace atlas;

class GaussianMixtureTest : public ::testing::Test {
protected:
    Matrix blobs;
    std::vector<int> truth;

    void SetUp() override {
        // Three tight, well separated blobs of ten points each
        std::mt19937 rng(1234);
        std::normal_distribution<double> noise(0.0, 0.05);
        const std::vector<std::vector<double>> centers = {{0.0, 0.0}, {5.0, 5.0}, {-5.0, 5.0}};
        for (size_t c = 0; c < centers.size(); ++c) {
            for (int i = 0; i < 10; ++i) {
                blobs.push_back({centers[c][0] + noise(rng), centers[c][1] + noise(rng)});
                truth.push_back(static_cast<int>(c));
            }
        }
    }
};

// ==========================================
// Cluster Count Tests
// ==========================================

TEST_F(GaussianMixtureTest, CandidateCountsClampToCorpus) {
    EXPECT_TRUE(candidate_cluster_counts(0, 8, 12).empty());
    EXPECT_EQ(candidate_cluster_counts(1, 8, 12), std::vector<int>({1}));
    EXPECT_EQ(candidate_cluster_counts(2, 8, 12), std::vector<int>({2}));
    EXPECT_EQ(candidate_cluster_counts(5, 8, 12), std::vector<int>({4}));
    EXPECT_EQ(candidate_cluster_counts(8, 8, 12), std::vector<int>({7}));
    EXPECT_EQ(candidate_cluster_counts(10, 8, 12), std::vector<int>({8, 9}));
    EXPECT_EQ(candidate_cluster_counts(100, 8, 12), std::vector<int>({8, 9, 10, 11, 12}));
}

TEST_F(GaussianMixtureTest, ForcedCountClamps) {
    EXPECT_EQ(clamp_forced_cluster_count(5, 10), 4);
    EXPECT_EQ(clamp_forced_cluster_count(100, 10), 10);
    EXPECT_EQ(clamp_forced_cluster_count(1, 10), 1);
    EXPECT_EQ(clamp_forced_cluster_count(50, 0), 1);
}

// ==========================================
// Fitting Tests
// ==========================================

TEST_F(GaussianMixtureTest, RecoversSeparatedBlobs) {
    GaussianMixture gmm;
    gmm.fit(blobs, 3);

    EXPECT_EQ(gmm.num_components(), 3);
    double weight_sum = std::accumulate(gmm.weights().begin(), gmm.weights().end(), 0.0);
    EXPECT_NEAR(weight_sum, 1.0, 1e-9);

    auto labels = gmm.predict(blobs);
    // Points of one blob share a label, different blobs differ
    std::set<int> blob_labels;
    for (int c = 0; c < 3; ++c) {
        int first = labels[c * 10];
        for (int i = 0; i < 10; ++i) {
            EXPECT_EQ(labels[c * 10 + i], first);
        }
        blob_labels.insert(first);
    }
    EXPECT_EQ(blob_labels.size(), 3u);
}

TEST_F(GaussianMixtureTest, PosteriorsAreDistributions) {
    GaussianMixture gmm;
    gmm.fit(blobs, 4);
    for (const auto& row : gmm.predict_proba(blobs)) {
        ASSERT_EQ(row.size(), 4u);
        double sum = 0.0;
        for (double p : row) {
            EXPECT_GE(p, 0.0);
            sum += p;
        }
        EXPECT_NEAR(sum, 1.0, 1e-9);
    }
}

TEST_F(GaussianMixtureTest, DeterministicForSeed) {
    GaussianMixture a, b;
    a.fit(blobs, 3);
    b.fit(blobs, 3);
    EXPECT_EQ(a.means(), b.means());
    EXPECT_DOUBLE_EQ(a.bic(blobs), b.bic(blobs));
}

TEST_F(GaussianMixtureTest, RejectsMoreComponentsThanPoints) {
    GaussianMixture gmm;
    EXPECT_THROW(gmm.fit(blobs, 31), std::invalid_argument);
    EXPECT_THROW(gmm.fit(blobs, 0), std::invalid_argument);
    EXPECT_THROW(gmm.fit(Matrix(), 1), std::invalid_argument);
}

// ==========================================
// Model Selection Tests
// ==========================================

TEST_F(GaussianMixtureTest, SilhouetteOfSeparatedBlobs) {
    EXPECT_GT(silhouette_score(blobs, truth), 0.9);
    EXPECT_DOUBLE_EQ(silhouette_score(blobs, std::vector<int>(blobs.size(), 0)), 0.0);
}

TEST_F(GaussianMixtureTest, SelectsTrueClusterCount) {
    auto selection = select_model_order(blobs, {2, 3, 4, 5}, 1.0);
    EXPECT_EQ(selection.k, 3);
    EXPECT_EQ(selection.model.num_components(), 3);
    EXPECT_EQ(selection.scores.size(), 4u);
}

TEST_F(GaussianMixtureTest, EmptyCandidatesThrow) {
    EXPECT_THROW(select_model_order(blobs, {}, 1.0), std::invalid_argument);
}
