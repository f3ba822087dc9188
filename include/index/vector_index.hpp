#pragma once

#include "corpus/document.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace atlas {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Equality constraints on scalar chunk fields
 *
 * All constraints must hold. A constraint on a field outside
 * known_fields() never matches.
 */
struct MetadataFilter {
    std::map<std::string, std::string> equals;

    bool empty() const { return equals.empty(); }
    bool matches(const Chunk& chunk) const;

    /**
     * @brief True when every constrained field is filterable
     */
    bool is_satisfiable() const;

    static const std::vector<std::string>& known_fields();

    /**
     * @brief Parse "field=value" expressions
     * @throws std::invalid_argument for expressions without '='
     */
    static MetadataFilter parse(const std::vector<std::string>& expressions);

    nlohmann::json to_json() const;
};

/**
 * @brief A ranked search result; score is cosine similarity clamped to [0, 1]
 */
struct SearchHit {
    Chunk chunk;
    double score = 0.0;
};

struct IndexStats {
    size_t count = 0;
    size_t dimensionality = 0;              ///< 0 while the index is empty
    std::string backend;
    std::string embedding_version;          ///< Empty while the index is empty

    nlohmann::json to_json() const;
};

struct UpsertResult {
    size_t inserted = 0;
    size_t skipped_dimension = 0;           ///< Items whose vector size disagreed
};

/**
 * @brief Minimal per-chunk record returned by bulk reads
 */
struct StoredVector {
    std::string chunk_id;
    std::string document_id;
    int token_count = 0;
    Vector embedding;
};

/**
 * @brief Backend selection and connection settings
 */
struct VectorIndexConfig {
    std::string backend = "local";          ///< "local" or "remote"
    std::string index_dir = "atlas_index";  ///< Local: directory holding index.json
    std::string remote_url;                 ///< Remote: PostgREST base URL
    std::string remote_key;                 ///< Remote: service key
    int timeout_seconds = 30;
    size_t upsert_batch_size = 100;         ///< Remote: rows per insert request
    bool verbose = false;
};

// ============================================================================
// Vector Index Interface
// ============================================================================

/**
 * @brief Persistent store of chunk embeddings with similarity search
 *
 * One index holds vectors of a single dimensionality produced by a single
 * embedding version. Refresh is clear() followed by a bulk upsert(); there is
 * no per-document delete.
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    /**
     * @brief Insert or replace chunks by chunk id
     *
     * Items whose embedding size differs from the index dimensionality
     * (or from the first item when the index is empty) are skipped and
     * counted.
     *
     * @throws ConsistencyError if embedding_version differs from the
     *         version of a non-empty index
     * @throws BackendError if the backend cannot be reached
     */
    virtual UpsertResult upsert(
        const std::vector<EmbeddedChunk>& chunks,
        const std::string& embedding_version
    ) = 0;

    /**
     * @brief Top-k chunks by cosine similarity, ties ordered by chunk id
     *
     * @throws ConsistencyError if the query dimensionality is wrong
     */
    virtual std::vector<SearchHit> search(
        const Vector& query,
        size_t k,
        const MetadataFilter& filter = MetadataFilter()
    ) = 0;

    /**
     * @brief Remove every chunk
     */
    virtual void clear() = 0;

    virtual IndexStats stats() const = 0;

    /**
     * @brief All stored vectors matching filter, ordered by chunk id
     */
    virtual std::vector<StoredVector> fetch_vectors(
        const MetadataFilter& filter = MetadataFilter()
    ) const = 0;

    virtual std::string backend_name() const = 0;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Sort hits by descending score then chunk id and keep the first k
 */
void rank_hits(std::vector<SearchHit>& hits, size_t k);

/**
 * @brief Create the configured backend
 *
 * Called once per process; the instance is passed to the pipelines that
 * need it.
 *
 * @throws std::invalid_argument for an unknown backend or missing settings
 */
std::unique_ptr<VectorIndex> create_vector_index(const VectorIndexConfig& config);

} // namespace atlas
