#pragma once

#include "common/postgrest_client.hpp"
#include "index/vector_index.hpp"
#include <string>

namespace atlas {

/**
 * @brief Vector index in PostgreSQL + pgvector, reached through PostgREST
 *
 * Rows live in the paper_chunks table; similarity search runs server-side
 * in the match_chunks function (see sql/schema.sql).
 */
class RemoteVectorIndex : public VectorIndex {
public:
    explicit RemoteVectorIndex(const VectorIndexConfig& config);

    UpsertResult upsert(
        const std::vector<EmbeddedChunk>& chunks,
        const std::string& embedding_version
    ) override;

    std::vector<SearchHit> search(
        const Vector& query,
        size_t k,
        const MetadataFilter& filter = MetadataFilter()
    ) override;

    void clear() override;
    IndexStats stats() const override;

    std::vector<StoredVector> fetch_vectors(
        const MetadataFilter& filter = MetadataFilter()
    ) const override;

    std::string backend_name() const override { return "remote"; }

    /**
     * @brief PostgREST query string equivalent of a metadata filter
     */
    static std::string filter_query(const MetadataFilter& filter);

private:
    VectorIndexConfig config_;
    PostgrestClient client_;

    static constexpr const char* kTable = "paper_chunks";
    static constexpr size_t kPageSize = 1000;
};

} // namespace atlas
