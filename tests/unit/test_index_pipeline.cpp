#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/local_vector_index.hpp"
#include "pipeline/index_pipeline.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace atlas;
namespace fs = std::filesystem;

namespace {

// Hashing embedder with switchable failures and call accounting
class ControlledEmbedder : public HashingEmbeddingProvider {
public:
    bool down = false;                      ///< Every call fails with 503
    bool batches_fail = false;              ///< Batch calls fail, single calls work

    mutable std::atomic<int> active{0};
    mutable std::atomic<int> finished{0};
    mutable std::atomic<int> single_calls{0};

    ControlledEmbedder() : HashingEmbeddingProvider(128) {}

    Vector embed(const std::string& text) const override {
        CallScope scope(*this);
        single_calls++;
        if (down) throw BackendError("embedding service unavailable", 503);
        if (text.find("poison") != std::string::npos) {
            throw BackendError("text rejected", 400);
        }
        return HashingEmbeddingProvider::embed(text);
    }

    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) const override {
        CallScope scope(*this);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        if (down || batches_fail) throw BackendError("batch rejected", 503);
        std::vector<Vector> vectors;
        for (const auto& text : texts) {
            if (text.find("poison") != std::string::npos) {
                throw BackendError("text rejected", 400);
            }
            vectors.push_back(HashingEmbeddingProvider::embed(text));
        }
        return vectors;
    }

private:
    struct CallScope {
        const ControlledEmbedder& owner;
        explicit CallScope(const ControlledEmbedder& e) : owner(e) { owner.active++; }
        ~CallScope() {
            owner.active--;
            owner.finished++;
        }
    };
};

// Records the embedder's state whenever the index is modified
class RecordingIndex : public LocalVectorIndex {
public:
    RecordingIndex(const std::string& directory, const ControlledEmbedder& embedder)
        : LocalVectorIndex(directory), embedder_(embedder) {}

    int active_at_write = -1;
    int finished_at_write = -1;

    UpsertResult upsert(const std::vector<EmbeddedChunk>& chunks,
                        const std::string& embedding_version) override {
        record();
        return LocalVectorIndex::upsert(chunks, embedding_version);
    }

    void clear() override {
        record();
        LocalVectorIndex::clear();
    }

private:
    const ControlledEmbedder& embedder_;

    void record() {
        if (active_at_write < 0) {
            active_at_write = embedder_.active.load();
            finished_at_write = embedder_.finished.load();
        }
    }
};

} // anonymous namespace

class IndexPipelineTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    ControlledEmbedder embedder;
    Chunker chunker;
    IndexPipelineConfig pipeline_config;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
            ("atlas_pipeline_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
        pipeline_config.batch_size = 2;
        pipeline_config.parallelism = 3;
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    Document make_document(const std::string& id, const std::string& text) {
        Document doc;
        doc.document_id = id;
        doc.title = id + " title";
        doc.text = text;
        return doc;
    }

    std::vector<Document> documents() {
        return {
            make_document("bio", "Protein folding is predicted from amino acid sequences"),
            make_document("astro", "Galaxies merge and their black holes sink toward the center"),
            make_document("ml", "Transformers replace recurrence with self attention"),
            make_document("opt", "Gradient descent with momentum converges faster"),
            make_document("econ", "Central banks raise interest rates to slow inflation"),
            make_document("geo", "Glaciers carve valleys as they advance and retreat")
        };
    }
};

// ==========================================
// Failure Handling Tests
// ==========================================

TEST_F(IndexPipelineTest, FailedEmbeddingLeavesIndexUntouched) {
    {
        LocalVectorIndex index(temp_dir.string());
        RunSummary first = IndexPipeline(chunker, embedder, index, pipeline_config).run(documents());
        EXPECT_EQ(first.errored, 0);
        ASSERT_EQ(index.stats().count, 6u);
    }

    embedder.down = true;
    LocalVectorIndex index(temp_dir.string());
    RunSummary summary = IndexPipeline(chunker, embedder, index, pipeline_config).run(documents());

    EXPECT_EQ(summary.errored, 6);
    EXPECT_EQ(summary.details["index_unchanged"], 1);
    EXPECT_EQ(index.stats().count, 6u);

    LocalVectorIndex reopened(temp_dir.string());
    EXPECT_EQ(reopened.stats().count, 6u);
}

TEST_F(IndexPipelineTest, FailedBatchesFallBackToSingleChunks) {
    embedder.batches_fail = true;
    auto docs = documents();
    docs[4] = make_document("bad", "This text carries poison and is always rejected");

    LocalVectorIndex index(temp_dir.string());
    RunSummary summary = IndexPipeline(chunker, embedder, index, pipeline_config).run(docs);

    EXPECT_EQ(summary.errored, 1);
    EXPECT_EQ(summary.details["batches_retried"], 3);
    EXPECT_EQ(summary.details["chunks_embedded"], 5);
    EXPECT_EQ(summary.details["chunks_inserted"], 5);
    EXPECT_EQ(summary.details.count("index_unchanged"), 0u);
    EXPECT_EQ(index.stats().count, 5u);

    for (const auto& stored : index.fetch_vectors()) {
        EXPECT_NE(stored.document_id, "bad");
    }
}

TEST_F(IndexPipelineTest, PoisonedBatchOnlyLosesOneChunk) {
    auto docs = documents();
    docs[1] = make_document("bad", "A poison text inside an otherwise healthy batch");

    LocalVectorIndex index(temp_dir.string());
    RunSummary summary = IndexPipeline(chunker, embedder, index, pipeline_config).run(docs);

    EXPECT_EQ(summary.errored, 1);
    EXPECT_EQ(summary.details["batches_retried"], 1);
    EXPECT_EQ(index.stats().count, 5u);
}

// ==========================================
// Ordering Tests
// ==========================================

TEST_F(IndexPipelineTest, IndexWrittenAfterAllEmbeddingFinishes) {
    RecordingIndex index(temp_dir.string(), embedder);
    IndexPipeline(chunker, embedder, index, pipeline_config).run(documents());

    // Six chunks in batches of two
    EXPECT_EQ(index.active_at_write, 0);
    EXPECT_EQ(index.finished_at_write, 3);
    EXPECT_EQ(index.stats().count, 6u);
}

TEST_F(IndexPipelineTest, WithoutClearExistingChunksStay) {
    LocalVectorIndex index(temp_dir.string());
    auto docs = documents();
    IndexPipeline(chunker, embedder, index, pipeline_config)
        .run(std::vector<Document>(docs.begin(), docs.begin() + 2));

    pipeline_config.clear_first = false;
    IndexPipeline(chunker, embedder, index, pipeline_config)
        .run(std::vector<Document>(docs.begin() + 2, docs.end()));

    EXPECT_EQ(index.stats().count, 6u);
}

// ==========================================
// Search Tests
// ==========================================

TEST_F(IndexPipelineTest, SearchEmbedsTheQuery) {
    LocalVectorIndex index(temp_dir.string());
    IndexPipeline pipeline(chunker, embedder, index, pipeline_config);
    pipeline.run(documents());

    int before = embedder.single_calls.load();
    auto hits = pipeline.search("self attention replaces recurrence in transformers", 2);

    EXPECT_EQ(embedder.single_calls.load(), before + 1);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].chunk.document_id, "ml");
}

TEST_F(IndexPipelineTest, RepeatedRunsGiveSameRanking) {
    LocalVectorIndex index(temp_dir.string());
    IndexPipeline pipeline(chunker, embedder, index, pipeline_config);

    pipeline.run(documents());
    auto first = pipeline.search("glaciers and valleys", 6);
    pipeline.run(documents());
    auto second = pipeline.search("glaciers and valleys", 6);

    EXPECT_EQ(index.stats().count, 6u);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].chunk.chunk_id, second[i].chunk.chunk_id);
        EXPECT_DOUBLE_EQ(first[i].score, second[i].score);
    }
}
