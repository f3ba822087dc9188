#pragma once

#include "chunking/tokenizer.hpp"
#include "common/run_summary.hpp"
#include "corpus/document.hpp"
#include <memory>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Chunking parameters
 */
struct ChunkerConfig {
    size_t target_tokens = 400;     ///< Maximum tokens per chunk (overlap included)
    size_t overlap_tokens = 50;     ///< Tokens repeated from the previous chunk
    std::string tokenizer = "word"; ///< "word" or "whitespace"
};

/**
 * @brief Token-bounded, section-aware document chunker
 *
 * Walks the token stream of a document with a window of target_tokens.
 * When the window crosses into a later section the chunk ends at the last
 * section start inside the window, as long as at least a quarter of the
 * window remains in the chunk; such chunks are followed without overlap.
 * Otherwise the chunk ends at the window boundary and the next chunk repeats
 * the last overlap_tokens tokens, never reaching back before the start of
 * the section it continues.
 *
 * The chunker holds no mutable state; chunk() may be called concurrently.
 */
class Chunker {
public:
    /**
     * @brief Constructor
     *
     * @param config Chunking parameters
     * @param tokenizer Tokenizer to use (created from config.tokenizer if null)
     * @throws std::invalid_argument if target_tokens is zero or
     *         overlap_tokens >= target_tokens
     */
    explicit Chunker(const ChunkerConfig& config = ChunkerConfig(),
                     std::shared_ptr<Tokenizer> tokenizer = nullptr);

    /**
     * @brief Split a document into ordered chunks
     *
     * Empty or whitespace-only documents produce no chunks.
     */
    std::vector<Chunk> chunk(const Document& document) const;

    /**
     * @brief Chunk a batch of documents in order
     *
     * @param documents Documents to chunk
     * @param summary Optional summary receiving per-document counts
     *        (processed, skipped for empty text, "chunks" detail)
     */
    std::vector<Chunk> chunk_documents(
        const std::vector<Document>& documents,
        RunSummary* summary = nullptr
    ) const;

    const ChunkerConfig& config() const { return config_; }
    const Tokenizer& tokenizer() const { return *tokenizer_; }

private:
    ChunkerConfig config_;
    std::shared_ptr<Tokenizer> tokenizer_;
};

} // namespace atlas
