#pragma once

#include "chunking/chunker.hpp"
#include "common/run_summary.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/vector_index.hpp"
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Settings for IndexPipeline
 */
struct IndexPipelineConfig {
    size_t batch_size = 32;                 ///< Chunks per embedding request
    size_t parallelism = 4;                 ///< Embedding batches in flight
    bool clear_first = true;                ///< Rebuild: clear() before upsert()
    bool verbose = false;
};

/**
 * @brief Write path: documents -> chunks -> embeddings -> vector index
 *
 * Embedding batches run concurrently; the index is only touched after every
 * batch has finished. A failed batch is retried one chunk at a time and
 * chunks that still fail are left out of the index. When no chunk at all
 * could be embedded the index is not touched and the summary carries an
 * "index_unchanged" detail.
 */
class IndexPipeline {
public:
    IndexPipeline(const Chunker& chunker,
                  const EmbeddingProvider& embedder,
                  VectorIndex& index,
                  const IndexPipelineConfig& config = IndexPipelineConfig());

    /**
     * @brief Chunk, embed and store the documents
     * @throws BackendError / ConsistencyError from the index (fatal for the run)
     */
    RunSummary run(const std::vector<Document>& documents);

    /**
     * @brief Embed chunks, dropping those that fail
     */
    std::vector<EmbeddedChunk> embed_chunks(const std::vector<Chunk>& chunks, RunSummary& summary) const;

    /**
     * @brief Read path: embed the query and search the index
     */
    std::vector<SearchHit> search(const std::string& query, size_t k,
                                  const MetadataFilter& filter = MetadataFilter()) const;

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

private:
    const Chunker& chunker_;
    const EmbeddingProvider& embedder_;
    VectorIndex& index_;
    IndexPipelineConfig config_;
    ProgressCallback progress_callback_;

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message) const;
};

} // namespace atlas
