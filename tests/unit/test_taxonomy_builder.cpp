#include <gtest/gtest.h>
#include "taxonomy/taxonomy_builder.hpp"
#include "taxonomy/taxonomy_store.hpp"
#include <filesystem>
#include <map>

using namespace atlas;
namespace fs = std::filesystem;

namespace {

class FixedLabeler : public TextLabeler {
public:
    ClusterLabel label(const std::vector<std::string>& samples) override {
        ClusterLabel result;
        result.label = "Topic of " + std::to_string(samples.size());
        result.description = "Fixed.";
        result.keywords = {"one", "two", "three"};
        return result;
    }
    std::string model_name() const override { return "fixed"; }
};

} // anonymous namespace

class TaxonomyBuilderTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("atlas_taxonomy_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    // Unit vector along axis with a small offset on the next axis
    static Vector direction(size_t axis, float offset, size_t dims = 8) {
        Vector v(dims, 0.0f);
        v[axis] = 1.0f;
        v[(axis + 1) % dims] = offset;
        l2_normalize(v);
        return v;
    }

    static StoredVector stored(const std::string& document_id, int ordinal, Vector embedding,
                               int tokens = 100) {
        return {document_id + "_chunk_" + std::to_string(ordinal), document_id, tokens,
                std::move(embedding)};
    }

    // Five documents in three topical directions, two chunks each
    std::vector<StoredVector> corpus() const {
        return {
            stored("bio_a", 0, direction(0, 0.05f)), stored("bio_a", 1, direction(0, 0.10f)),
            stored("bio_b", 0, direction(0, 0.02f)), stored("bio_b", 1, direction(0, 0.08f)),
            stored("astro_a", 0, direction(3, 0.05f)), stored("astro_a", 1, direction(3, 0.01f)),
            stored("astro_b", 0, direction(3, 0.09f)), stored("astro_b", 1, direction(3, 0.04f)),
            stored("econ_a", 0, direction(6, 0.03f)), stored("econ_a", 1, direction(6, 0.07f))
        };
    }

    std::vector<Document> catalog() const {
        std::vector<Document> docs;
        for (const char* id : {"bio_a", "bio_b", "astro_a", "astro_b", "econ_a"}) {
            Document doc;
            doc.document_id = id;
            doc.title = std::string(id) + " title";
            doc.abstract_text = "Abstract of " + std::string(id);
            docs.push_back(doc);
        }
        return docs;
    }

    static Claim claim(int64_t id, std::optional<std::string> document_id) {
        Claim c;
        c.id = id;
        c.episode_id = "ep1";
        c.document_id = std::move(document_id);
        c.text = "claim " + std::to_string(id);
        return c;
    }
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(TaxonomyBuilderTest, RejectsInvalidSettings) {
    TaxonomyConfig config;
    config.min_clusters = 1;
    EXPECT_THROW(TaxonomyBuilder{config}, std::invalid_argument);

    config.min_clusters = 6;
    config.max_clusters = 5;
    EXPECT_THROW(TaxonomyBuilder{config}, std::invalid_argument);

    config = TaxonomyConfig{};
    config.assignment_threshold = 1.5;
    EXPECT_THROW(TaxonomyBuilder{config}, std::invalid_argument);

    config = TaxonomyConfig{};
    config.projection = "tsne";
    EXPECT_THROW(TaxonomyBuilder{config}, std::invalid_argument);
}

// ==========================================
// Stage Tests
// ==========================================

TEST_F(TaxonomyBuilderTest, AggregateWeightsByTokensAndSkips) {
    std::vector<StoredVector> vectors = {
        stored("doc", 0, Vector{1.0f, 0.0f}, 300),
        stored("doc", 1, Vector{0.0f, 1.0f}, 100),
        stored("doc", 2, Vector{1.0f, 0.0f, 0.0f}, 50),
        stored("stranger", 0, Vector{0.0f, 1.0f}, 10)
    };
    std::set<std::string> known = {"doc"};
    RunSummary summary;

    auto docs = TaxonomyBuilder::aggregate(vectors, &known, summary);

    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0].document_id, "doc");
    EXPECT_EQ(docs[0].chunk_count, 2);
    EXPECT_EQ(docs[0].token_count, 400);
    EXPECT_NEAR(l2_norm(docs[0].embedding), 1.0, 1e-6);
    EXPECT_NEAR(docs[0].embedding[0] / docs[0].embedding[1], 3.0, 1e-4);
    EXPECT_EQ(summary.skipped, 2);
    EXPECT_EQ(summary.details["chunks_dimension_mismatch"], 1);
    EXPECT_EQ(summary.details["chunks_unknown_document"], 1);
}

TEST_F(TaxonomyBuilderTest, SoftAssignKeepsPrimaryAndThreshold) {
    Matrix posteriors = {
        {0.70, 0.25, 0.05},
        {0.05, 0.05, 0.90},
        {0.40, 0.40, 0.20}
    };
    auto edges = TaxonomyBuilder::soft_assign({"a", "b", "c"}, posteriors, 0.1);

    std::map<std::string, std::vector<PaperClusterAssignment>> by_doc;
    for (const auto& e : edges) by_doc[e.document_id].push_back(e);

    ASSERT_EQ(by_doc["a"].size(), 2u);
    EXPECT_TRUE(by_doc["a"][0].is_primary);
    EXPECT_EQ(by_doc["a"][0].cluster_id, 0);
    EXPECT_FALSE(by_doc["a"][1].is_primary);

    ASSERT_EQ(by_doc["b"].size(), 1u);
    EXPECT_EQ(by_doc["b"][0].cluster_id, 2);

    // Tie resolves to the lowest cluster id
    ASSERT_EQ(by_doc["c"].size(), 3u);
    EXPECT_TRUE(by_doc["c"][0].is_primary);
    EXPECT_FALSE(by_doc["c"][1].is_primary);
}

TEST_F(TaxonomyBuilderTest, PrimaryEdgeSurvivesHighThreshold) {
    Matrix posteriors = {{0.3, 0.35, 0.35}};
    auto edges = TaxonomyBuilder::soft_assign({"flat"}, posteriors, 0.9);

    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].cluster_id, 1);
    EXPECT_TRUE(edges[0].is_primary);
}

TEST_F(TaxonomyBuilderTest, PropagateCopiesDocumentEdges) {
    std::vector<PaperClusterAssignment> edges(2);
    edges[0].document_id = "p1";
    edges[0].cluster_id = 0;
    edges[0].confidence = 0.8;
    edges[0].is_primary = true;
    edges[1].document_id = "p1";
    edges[1].cluster_id = 2;
    edges[1].confidence = 0.2;

    std::vector<Claim> claims = {claim(1, std::string("p1")), claim(2, std::nullopt),
                                 claim(3, std::string("missing"))};
    RunSummary summary;
    auto result = TaxonomyBuilder::propagate(edges, claims, summary);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].claim_id, 1);
    EXPECT_EQ(result[0].source_document_id, "p1");
    EXPECT_DOUBLE_EQ(result[1].confidence, 0.2);
    EXPECT_EQ(summary.details["claims_assigned"], 1);
    EXPECT_EQ(summary.details["claims_without_document"], 1);
    EXPECT_EQ(summary.details["claims_unknown_document"], 1);
}

// ==========================================
// Full Rebuild Tests
// ==========================================

TEST_F(TaxonomyBuilderTest, SmallCorpusClampsClusterCount) {
    TaxonomyConfig config;  // 8..12 candidates
    TaxonomyBuilder builder(config);

    auto result = builder.build_from_vectors(corpus(), catalog(), {});
    const auto& snapshot = result.snapshot;

    EXPECT_GE(snapshot.selected_k, 2);
    EXPECT_LE(snapshot.selected_k, 4);
    EXPECT_EQ(snapshot.clusters.size(), static_cast<size_t>(snapshot.selected_k));
    EXPECT_EQ(result.summary.details.at("cluster_count_clamped"), 1);
    EXPECT_EQ(result.summary.processed, 5);
}

TEST_F(TaxonomyBuilderTest, EveryDocumentHasOnePrimaryEdge) {
    TaxonomyConfig config;
    config.min_clusters = 2;
    config.max_clusters = 3;
    TaxonomyBuilder builder(config);

    auto snapshot = builder.build_from_vectors(corpus(), catalog(), {}).snapshot;

    std::map<std::string, int> primaries;
    for (const auto& a : snapshot.paper_assignments) {
        EXPECT_TRUE(a.is_primary || a.confidence > config.assignment_threshold);
        EXPECT_GE(a.position.x, 0.0);
        EXPECT_LE(a.position.x, 1.0);
        EXPECT_GE(a.position.y, 0.0);
        EXPECT_LE(a.position.y, 1.0);
        if (a.is_primary) primaries[a.document_id]++;
    }
    EXPECT_EQ(primaries.size(), 5u);
    for (const auto& [id, count] : primaries) {
        EXPECT_EQ(count, 1) << id;
    }

    int primary_total = 0;
    for (const auto& c : snapshot.clusters) primary_total += c.primary_paper_count;
    EXPECT_EQ(primary_total, 5);
}

TEST_F(TaxonomyBuilderTest, SeparatedTopicsLandInDifferentClusters) {
    TaxonomyConfig config;
    config.forced_clusters = 3;
    TaxonomyBuilder builder(config);

    auto snapshot = builder.build_from_vectors(corpus(), catalog(), {}).snapshot;
    ASSERT_EQ(snapshot.selected_k, 3);

    std::map<std::string, int> primary;
    for (const auto& a : snapshot.paper_assignments) {
        if (a.is_primary) primary[a.document_id] = a.cluster_id;
    }
    EXPECT_EQ(primary["bio_a"], primary["bio_b"]);
    EXPECT_EQ(primary["astro_a"], primary["astro_b"]);
    EXPECT_NE(primary["bio_a"], primary["astro_a"]);
    EXPECT_NE(primary["bio_a"], primary["econ_a"]);
    EXPECT_NE(primary["astro_a"], primary["econ_a"]);
}

TEST_F(TaxonomyBuilderTest, PlaceholderLabelsWithoutLabeler) {
    TaxonomyConfig config;
    config.forced_clusters = 2;
    TaxonomyBuilder builder(config);

    auto result = builder.build_from_vectors(corpus(), catalog(), {});
    EXPECT_EQ(result.snapshot.model_used, "none");
    EXPECT_EQ(result.snapshot.clusters[0].label, "Cluster 0");
    EXPECT_EQ(result.snapshot.clusters[1].label, "Cluster 1");
    EXPECT_EQ(result.summary.details.at("labels_placeholder"), 2);
}

TEST_F(TaxonomyBuilderTest, LabelerNamesClusters) {
    TaxonomyConfig config;
    config.forced_clusters = 2;
    config.label_samples = 2;
    TaxonomyBuilder builder(config, std::make_shared<FixedLabeler>());

    auto snapshot = builder.build_from_vectors(corpus(), catalog(), {}).snapshot;
    EXPECT_EQ(snapshot.model_used, "fixed");
    for (const auto& cluster : snapshot.clusters) {
        EXPECT_EQ(cluster.label.rfind("Topic of ", 0), 0u);
        EXPECT_EQ(cluster.keywords.size(), 3u);
    }
}

TEST_F(TaxonomyBuilderTest, ClaimsFollowTheirDocuments) {
    TaxonomyConfig config;
    config.forced_clusters = 3;
    TaxonomyBuilder builder(config);

    std::vector<Claim> claims = {claim(10, std::string("bio_a")), claim(11, std::string("econ_a")),
                                 claim(12, std::nullopt)};
    auto snapshot = builder.build_from_vectors(corpus(), catalog(), claims).snapshot;

    std::set<int64_t> assigned;
    for (const auto& ca : snapshot.claim_assignments) {
        assigned.insert(ca.claim_id);
        bool matched = false;
        for (const auto& pa : snapshot.paper_assignments) {
            if (pa.document_id == ca.source_document_id && pa.cluster_id == ca.cluster_id) {
                matched = pa.confidence == ca.confidence;
            }
        }
        EXPECT_TRUE(matched);
    }
    EXPECT_EQ(assigned, (std::set<int64_t>{10, 11}));
}

TEST_F(TaxonomyBuilderTest, EmptyCorpusGivesEmptySnapshot) {
    TaxonomyBuilder builder(TaxonomyConfig{});
    auto result = builder.build_from_vectors({}, {}, {claim(1, std::string("p"))});

    EXPECT_TRUE(result.snapshot.clusters.empty());
    EXPECT_TRUE(result.snapshot.paper_assignments.empty());
    EXPECT_TRUE(result.snapshot.claim_assignments.empty());
    EXPECT_EQ(result.snapshot.selected_k, 0);
}

TEST_F(TaxonomyBuilderTest, RebuildIsDeterministic) {
    TaxonomyConfig config;
    config.min_clusters = 2;
    config.max_clusters = 3;
    TaxonomyBuilder builder(config);

    auto first = builder.build_from_vectors(corpus(), catalog(), {}).snapshot;
    auto second = builder.build_from_vectors(corpus(), catalog(), {}).snapshot;

    ASSERT_EQ(first.paper_assignments.size(), second.paper_assignments.size());
    EXPECT_EQ(first.selected_k, second.selected_k);
    for (size_t i = 0; i < first.paper_assignments.size(); ++i) {
        EXPECT_EQ(first.paper_assignments[i].cluster_id, second.paper_assignments[i].cluster_id);
        EXPECT_DOUBLE_EQ(first.paper_assignments[i].confidence, second.paper_assignments[i].confidence);
    }
}

// ==========================================
// Store Tests
// ==========================================

TEST_F(TaxonomyBuilderTest, LocalStoreReplacesWholeSnapshot) {
    LocalTaxonomyStore store((temp_dir / "taxonomy.json").string());
    EXPECT_FALSE(store.load().has_value());

    TaxonomyConfig config;
    config.forced_clusters = 3;
    auto first = TaxonomyBuilder(config).build_from_vectors(corpus(), catalog(), {}).snapshot;
    store.replace(first);

    config.forced_clusters = 2;
    auto second = TaxonomyBuilder(config).build_from_vectors(corpus(), catalog(), {}).snapshot;
    store.replace(second);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->clusters.size(), 2u);
    EXPECT_EQ(loaded->selected_k, 2);
    EXPECT_EQ(loaded->paper_assignments.size(), second.paper_assignments.size());
    EXPECT_FALSE(fs::exists(temp_dir / "taxonomy.json.tmp"));
}

TEST_F(TaxonomyBuilderTest, RemotePayloadHasFlatRows) {
    TaxonomyConfig config;
    config.forced_clusters = 2;
    auto snapshot = TaxonomyBuilder(config).build_from_vectors(
        corpus(), catalog(), {claim(5, std::string("bio_b"))}).snapshot;

    auto payload = RemoteTaxonomyStore::build_payload(snapshot);
    ASSERT_EQ(payload["clusters"].size(), 2u);
    EXPECT_TRUE(payload["clusters"][0]["centroid"].is_string());
    EXPECT_EQ(payload["paper_assignments"].size(), snapshot.paper_assignments.size());
    EXPECT_EQ(payload["claim_assignments"].size(), snapshot.claim_assignments.size());
    EXPECT_EQ(payload["model_used"], "none");
}

TEST_F(TaxonomyBuilderTest, StoreFactory) {
    TaxonomyStoreConfig config;
    config.path = (temp_dir / "t.json").string();
    EXPECT_EQ(create_taxonomy_store(config)->backend_name(), "local");

    config.backend = "remote";
    EXPECT_THROW(create_taxonomy_store(config), std::invalid_argument);

    config.backend = "cloud";
    EXPECT_THROW(create_taxonomy_store(config), std::invalid_argument);
}
