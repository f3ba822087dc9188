#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/local_vector_index.hpp"
#include "index/remote_vector_index.hpp"
#include "pipeline/index_pipeline.hpp"
#include <filesystem>

using namespace atlas;
namespace fs = std::filesystem;

class VectorIndexTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    HashingEmbeddingProvider embedder{128};

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("atlas_index_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    EmbeddedChunk make_chunk(const std::string& document_id, int ordinal, const std::string& text) {
        EmbeddedChunk item;
        item.chunk.document_id = document_id;
        item.chunk.ordinal = ordinal;
        item.chunk.chunk_id = Chunk::generate_chunk_id(document_id, ordinal);
        item.chunk.text = text;
        item.chunk.section_heading = "Results";
        item.chunk.token_count = 10;
        item.chunk.metadata.document_title = document_id + " title";
        item.chunk.metadata.year = 2021;
        item.embedding = embedder.embed(text);
        return item;
    }

    std::vector<EmbeddedChunk> corpus() {
        return {
            make_chunk("bio", 0, "Protein folding is predicted from amino acid sequences with deep networks trained on structures"),
            make_chunk("astro", 0, "Galaxies merge over billions of years and their black holes sink toward the common center"),
            make_chunk("ml", 0, "Transformers replace recurrence with self attention over every pair of positions in the input"),
            make_chunk("ml", 1, "Gradient descent with momentum converges faster on poorly conditioned loss surfaces"),
            make_chunk("econ", 0, "Central banks raise interest rates to slow inflation when labour markets are tight")
        };
    }

    std::vector<Document> documents() {
        std::vector<Document> docs;
        for (const auto& item : corpus()) {
            Document doc;
            doc.document_id = item.chunk.document_id + "_" + std::to_string(item.chunk.ordinal);
            doc.title = item.chunk.metadata.document_title;
            doc.text = item.chunk.text;
            docs.push_back(doc);
        }
        return docs;
    }
};

// ==========================================
// Search Tests
// ==========================================

TEST_F(VectorIndexTest, NearIdenticalChunkRanksFirst) {
    LocalVectorIndex index(temp_dir.string());
    auto result = index.upsert(corpus(), embedder.version());
    EXPECT_EQ(result.inserted, 5u);
    EXPECT_EQ(result.skipped_dimension, 0u);

    Vector query = embedder.embed(
        "Transformers replace recurrence with self attention over every pair of positions in the input sequence");
    auto hits = index.search(query, 3);

    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].chunk.chunk_id, "ml_chunk_0");
    EXPECT_GT(hits[0].score, 0.8);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_GE(hits[i - 1].score, hits[i].score);
        EXPECT_GE(hits[i].score, 0.0);
        EXPECT_LE(hits[i].score, 1.0);
    }
}

TEST_F(VectorIndexTest, FilterRestrictsResults) {
    LocalVectorIndex index(temp_dir.string());
    index.upsert(corpus(), embedder.version());

    Vector query = embedder.embed("interest rates and inflation");
    auto hits = index.search(query, 10, MetadataFilter::parse({"document_id=ml"}));
    ASSERT_EQ(hits.size(), 2u);
    for (const auto& hit : hits) {
        EXPECT_EQ(hit.chunk.document_id, "ml");
    }

    EXPECT_TRUE(index.search(query, 10, MetadataFilter::parse({"colour=red"})).empty());
    EXPECT_EQ(index.search(query, 10, MetadataFilter::parse({"year=2021"})).size(), 5u);

    // Papers store no episode_id, so even an empty value does not match
    EXPECT_TRUE(index.search(query, 10, MetadataFilter::parse({"episode_id="})).empty());
}

TEST_F(VectorIndexTest, FilterParseRejectsMalformedExpression) {
    EXPECT_THROW(MetadataFilter::parse({"document_id"}), std::invalid_argument);
}

// ==========================================
// Consistency Tests
// ==========================================

TEST_F(VectorIndexTest, SkipsMismatchedDimensions) {
    LocalVectorIndex index(temp_dir.string());
    auto items = corpus();
    items[2].embedding.resize(64);

    auto result = index.upsert(items, embedder.version());
    EXPECT_EQ(result.inserted, 4u);
    EXPECT_EQ(result.skipped_dimension, 1u);
    EXPECT_EQ(index.stats().dimensionality, 128u);
}

TEST_F(VectorIndexTest, RejectsOtherEmbeddingVersion) {
    LocalVectorIndex index(temp_dir.string());
    index.upsert(corpus(), embedder.version());

    HashingEmbeddingProvider other(64);
    EXPECT_THROW(index.upsert({make_chunk("x", 0, "text")}, other.version()), ConsistencyError);

    index.clear();
    EXPECT_EQ(index.stats().count, 0u);
    EXPECT_NO_THROW(index.upsert({make_chunk("x", 0, "text")}, other.version()));
}

TEST_F(VectorIndexTest, RejectsWrongQueryDimension) {
    LocalVectorIndex index(temp_dir.string());
    index.upsert(corpus(), embedder.version());
    EXPECT_THROW(index.search(Vector(7, 0.1f), 3), ConsistencyError);
}

TEST_F(VectorIndexTest, UpsertReplacesById) {
    LocalVectorIndex index(temp_dir.string());
    index.upsert(corpus(), embedder.version());
    index.upsert({make_chunk("ml", 0, "replaced text")}, embedder.version());

    auto stats = index.stats();
    EXPECT_EQ(stats.count, 5u);
    auto hits = index.search(embedder.embed("replaced text"), 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].chunk.text, "replaced text");
}

// ==========================================
// Persistence Tests
// ==========================================

TEST_F(VectorIndexTest, ReopensPersistedIndex) {
    Vector query = embedder.embed("black holes in merging galaxies");
    std::vector<SearchHit> before;
    {
        LocalVectorIndex index(temp_dir.string());
        index.upsert(corpus(), embedder.version());
        before = index.search(query, 5);
    }

    LocalVectorIndex reopened(temp_dir.string());
    auto stats = reopened.stats();
    EXPECT_EQ(stats.count, 5u);
    EXPECT_EQ(stats.embedding_version, embedder.version());
    EXPECT_EQ(stats.backend, "local");

    auto after = reopened.search(query, 5);
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].chunk.chunk_id, before[i].chunk.chunk_id);
        EXPECT_NEAR(after[i].score, before[i].score, 1e-6);
    }
    EXPECT_EQ(after[0].chunk.metadata.document_title, "astro title");
}

TEST_F(VectorIndexTest, FetchVectorsSortedById) {
    LocalVectorIndex index(temp_dir.string());
    index.upsert(corpus(), embedder.version());

    auto vectors = index.fetch_vectors();
    ASSERT_EQ(vectors.size(), 5u);
    for (size_t i = 1; i < vectors.size(); ++i) {
        EXPECT_LT(vectors[i - 1].chunk_id, vectors[i].chunk_id);
    }
    EXPECT_EQ(vectors[0].embedding.size(), 128u);
}

// ==========================================
// Pipeline Tests
// ==========================================

TEST_F(VectorIndexTest, RebuildIsDeterministic) {
    ChunkerConfig chunker_config;
    chunker_config.target_tokens = 8;
    chunker_config.overlap_tokens = 2;
    Chunker chunker(chunker_config);

    IndexPipelineConfig pipeline_config;
    pipeline_config.batch_size = 2;
    pipeline_config.parallelism = 3;

    LocalVectorIndex first((temp_dir / "a").string());
    LocalVectorIndex second((temp_dir / "b").string());
    RunSummary s1 = IndexPipeline(chunker, embedder, first, pipeline_config).run(documents());
    IndexPipeline(chunker, embedder, second, pipeline_config).run(documents());
    IndexPipeline again(chunker, embedder, second, pipeline_config);
    again.run(documents());

    EXPECT_EQ(s1.processed, 5);
    EXPECT_EQ(s1.errored, 0);
    EXPECT_EQ(first.stats().count, second.stats().count);

    auto a = first.search(embedder.embed("self attention transformers"), 4);
    auto b = again.search("self attention transformers", 4);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].chunk.chunk_id, b[i].chunk.chunk_id);
        EXPECT_DOUBLE_EQ(a[i].score, b[i].score);
    }
}

// ==========================================
// Factory Tests
// ==========================================

TEST_F(VectorIndexTest, FactorySelectsBackend) {
    VectorIndexConfig config;
    config.index_dir = temp_dir.string();
    auto index = create_vector_index(config);
    EXPECT_EQ(index->backend_name(), "local");

    config.backend = "remote";
    EXPECT_THROW(create_vector_index(config), std::invalid_argument);

    config.backend = "faiss";
    EXPECT_THROW(create_vector_index(config), std::invalid_argument);
}

TEST_F(VectorIndexTest, RemoteFilterQueryMapsColumns) {
    MetadataFilter filter = MetadataFilter::parse({"document_id=p 1", "year=2020"});
    EXPECT_EQ(RemoteVectorIndex::filter_query(filter),
              "document_id=eq.p%201&metadata->>year=eq.2020");
}
