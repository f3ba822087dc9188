#include "pipeline/index_pipeline.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>

namespace atlas {

namespace {

struct BatchOutcome {
    std::vector<Vector> vectors;            ///< Empty vector marks a failed chunk
    bool batch_failed = false;
};

BatchOutcome embed_batch_with_fallback(const EmbeddingProvider& embedder,
                                       const std::vector<std::string>& texts) {
    BatchOutcome outcome;
    try {
        outcome.vectors = embedder.embed_batch(texts);
        if (outcome.vectors.size() == texts.size()) {
            return outcome;
        }
        std::cerr << "Warning: embedding batch returned " << outcome.vectors.size()
                  << " vectors for " << texts.size() << " texts" << std::endl;
    } catch (const BackendError& e) {
        std::cerr << "Warning: embedding batch failed: " << e.what() << std::endl;
    }

    // Retry one text at a time
    outcome.batch_failed = true;
    outcome.vectors.assign(texts.size(), Vector());
    for (size_t i = 0; i < texts.size(); ++i) {
        try {
            outcome.vectors[i] = embedder.embed(texts[i]);
        } catch (const BackendError& e) {
            std::cerr << "Warning: embedding failed for one chunk: " << e.what() << std::endl;
        }
    }
    return outcome;
}

} // anonymous namespace

IndexPipeline::IndexPipeline(const Chunker& chunker,
                             const EmbeddingProvider& embedder,
                             VectorIndex& index,
                             const IndexPipelineConfig& config)
    : chunker_(chunker), embedder_(embedder), index_(index), config_(config) {
    if (config_.batch_size == 0) config_.batch_size = 1;
    if (config_.parallelism == 0) config_.parallelism = 1;
}

void IndexPipeline::report_progress(const std::string& stage, int current, int total,
                                    const std::string& message) const {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
    if (config_.verbose) {
        std::cout << "[" << stage << "] " << current << "/" << total << " " << message << std::endl;
    }
}

std::vector<EmbeddedChunk> IndexPipeline::embed_chunks(const std::vector<Chunk>& chunks,
                                                       RunSummary& summary) const {
    std::vector<EmbeddedChunk> embedded;
    embedded.reserve(chunks.size());

    const size_t batch_count = (chunks.size() + config_.batch_size - 1) / config_.batch_size;
    size_t next_batch = 0;

    while (next_batch < batch_count) {
        size_t wave_end = std::min(batch_count, next_batch + config_.parallelism);

        std::vector<std::future<BatchOutcome>> futures;
        for (size_t b = next_batch; b < wave_end; ++b) {
            size_t begin = b * config_.batch_size;
            size_t end = std::min(chunks.size(), begin + config_.batch_size);
            std::vector<std::string> texts;
            for (size_t i = begin; i < end; ++i) {
                texts.push_back(chunks[i].text);
            }
            futures.push_back(std::async(std::launch::async,
                [this, texts = std::move(texts)]() {
                    return embed_batch_with_fallback(embedder_, texts);
                }));
        }

        for (size_t b = next_batch; b < wave_end; ++b) {
            BatchOutcome outcome = futures[b - next_batch].get();
            if (outcome.batch_failed) {
                summary.count("batches_retried");
            }

            size_t begin = b * config_.batch_size;
            for (size_t i = 0; i < outcome.vectors.size(); ++i) {
                if (outcome.vectors[i].empty()) {
                    summary.errored++;
                    continue;
                }
                embedded.push_back({chunks[begin + i], std::move(outcome.vectors[i])});
            }
        }

        report_progress("embed", static_cast<int>(wave_end), static_cast<int>(batch_count),
                        "batches embedded");
        next_batch = wave_end;
    }

    summary.count("chunks_embedded", static_cast<int>(embedded.size()));
    return embedded;
}

RunSummary IndexPipeline::run(const std::vector<Document>& documents) {
    auto start_time = std::chrono::steady_clock::now();

    RunSummary summary;
    summary.pipeline = "index";

    report_progress("chunk", 0, static_cast<int>(documents.size()), "chunking documents");
    std::vector<Chunk> chunks = chunker_.chunk_documents(documents, &summary);
    report_progress("chunk", static_cast<int>(documents.size()),
                    static_cast<int>(documents.size()),
                    std::to_string(chunks.size()) + " chunks");

    std::vector<EmbeddedChunk> embedded = embed_chunks(chunks, summary);

    if (embedded.empty() && !chunks.empty()) {
        std::cerr << "Warning: none of " << chunks.size()
                  << " chunks could be embedded; index left unchanged" << std::endl;
        summary.count("index_unchanged");
        auto end_time = std::chrono::steady_clock::now();
        summary.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();
        return summary;
    }

    // All parallel work is done; only now is the index modified
    if (config_.clear_first) {
        index_.clear();
    }
    UpsertResult result = index_.upsert(embedded, embedder_.version());
    summary.count("chunks_inserted", static_cast<int>(result.inserted));
    summary.count("chunks_skipped_dimension", static_cast<int>(result.skipped_dimension));

    report_progress("upsert", static_cast<int>(result.inserted),
                    static_cast<int>(embedded.size()), "chunks stored");

    auto end_time = std::chrono::steady_clock::now();
    summary.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();
    return summary;
}

std::vector<SearchHit> IndexPipeline::search(const std::string& query, size_t k,
                                             const MetadataFilter& filter) const {
    Vector embedding = embedder_.embed(query);
    return index_.search(embedding, k, filter);
}

} // namespace atlas
