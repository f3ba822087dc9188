#pragma once

#include "index/vector_index.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas {

/**
 * @brief Embedded vector index persisted as <directory>/index.json
 *
 * The whole index lives in memory; search is an exact linear scan. Every
 * mutation rewrites the file atomically, so a crash leaves the previous
 * state on disk.
 */
class LocalVectorIndex : public VectorIndex {
public:
    /**
     * @brief Open (or create) the index in directory
     * @throws std::runtime_error if an existing index file cannot be parsed
     */
    explicit LocalVectorIndex(const std::string& directory, bool verbose = false);

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

    std::string backend_name() const override { return "local"; }

    /**
     * @brief Path of the persisted index file
     */
    std::string index_path() const;

private:
    std::string directory_;
    bool verbose_;

    std::vector<EmbeddedChunk> entries_;
    std::unordered_map<std::string, size_t> position_by_id_;
    size_t dimensionality_ = 0;
    std::string embedding_version_;
    mutable std::mutex mutex_;

    void load();
    void save() const;
};

} // namespace atlas
