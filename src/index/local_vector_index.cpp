#include "index/local_vector_index.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace atlas {

namespace {

constexpr int kIndexFormatVersion = 1;

} // anonymous namespace

LocalVectorIndex::LocalVectorIndex(const std::string& directory, bool verbose)
    : directory_(directory), verbose_(verbose) {
    load();
}

std::string LocalVectorIndex::index_path() const {
    return (fs::path(directory_) / "index.json").string();
}

void LocalVectorIndex::load() {
    std::string path = index_path();
    if (!fs::exists(path)) {
        return;
    }

    json j = read_json_file(path);
    int format = j.value("format_version", 0);
    if (format != kIndexFormatVersion) {
        throw std::runtime_error(
            "Unsupported index format version " + std::to_string(format) + " in " + path
        );
    }

    embedding_version_ = j.value("embedding_version", "");
    dimensionality_ = j.value("dimensionality", size_t{0});

    for (const auto& item : j["chunks"]) {
        EmbeddedChunk entry;
        entry.chunk = Chunk::from_json(item);
        entry.embedding = item["embedding"].get<Vector>();
        position_by_id_[entry.chunk.chunk_id] = entries_.size();
        entries_.push_back(std::move(entry));
    }

    if (verbose_) {
        std::cout << "Loaded " << entries_.size() << " chunks from " << path << std::endl;
    }
}

void LocalVectorIndex::save() const {
    json j;
    j["format_version"] = kIndexFormatVersion;
    j["embedding_version"] = embedding_version_;
    j["dimensionality"] = dimensionality_;
    j["chunks"] = json::array();

    for (const auto& entry : entries_) {
        json item = entry.chunk.to_json();
        item["embedding"] = entry.embedding;
        j["chunks"].push_back(std::move(item));
    }

    write_file_atomically(index_path(), j.dump());
}

UpsertResult LocalVectorIndex::upsert(
    const std::vector<EmbeddedChunk>& chunks,
    const std::string& embedding_version
) {
    std::lock_guard<std::mutex> lock(mutex_);
    UpsertResult result;

    if (chunks.empty()) {
        return result;
    }

    if (!entries_.empty() && embedding_version != embedding_version_) {
        throw ConsistencyError(
            "Embedding version " + embedding_version + " does not match index version " +
            embedding_version_ + "; clear the index before switching providers"
        );
    }

    size_t dims = dimensionality_;
    if (entries_.empty()) {
        for (const auto& item : chunks) {
            if (!item.embedding.empty()) {
                dims = item.embedding.size();
                break;
            }
        }
    }

    for (const auto& item : chunks) {
        if (item.embedding.empty() || item.embedding.size() != dims) {
            std::cerr << "Warning: skipping chunk " << item.chunk.chunk_id
                      << " (dimension " << item.embedding.size()
                      << ", index expects " << dims << ")" << std::endl;
            result.skipped_dimension++;
            continue;
        }

        auto it = position_by_id_.find(item.chunk.chunk_id);
        if (it != position_by_id_.end()) {
            entries_[it->second] = item;
        } else {
            position_by_id_[item.chunk.chunk_id] = entries_.size();
            entries_.push_back(item);
        }
        result.inserted++;
    }

    if (result.inserted > 0) {
        dimensionality_ = dims;
        embedding_version_ = embedding_version;
        save();
    }

    if (verbose_) {
        std::cout << "Upserted " << result.inserted << " chunks ("
                  << result.skipped_dimension << " skipped)" << std::endl;
    }

    return result;
}

std::vector<SearchHit> LocalVectorIndex::search(
    const Vector& query,
    size_t k,
    const MetadataFilter& filter
) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SearchHit> hits;

    if (entries_.empty() || k == 0) {
        return hits;
    }
    if (query.size() != dimensionality_) {
        throw ConsistencyError(
            "Query has dimension " + std::to_string(query.size()) +
            ", index has " + std::to_string(dimensionality_)
        );
    }
    if (!filter.is_satisfiable()) {
        return hits;
    }

    for (const auto& entry : entries_) {
        if (!filter.matches(entry.chunk)) continue;
        hits.push_back({entry.chunk, similarity_score(query, entry.embedding)});
    }

    rank_hits(hits, k);
    return hits;
}

void LocalVectorIndex::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    position_by_id_.clear();
    dimensionality_ = 0;
    embedding_version_.clear();
    save();
}

IndexStats LocalVectorIndex::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexStats s;
    s.count = entries_.size();
    s.dimensionality = dimensionality_;
    s.backend = backend_name();
    s.embedding_version = embedding_version_;
    return s;
}

std::vector<StoredVector> LocalVectorIndex::fetch_vectors(const MetadataFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredVector> result;

    if (!filter.is_satisfiable()) {
        return result;
    }

    for (const auto& entry : entries_) {
        if (!filter.matches(entry.chunk)) continue;
        result.push_back({
            entry.chunk.chunk_id,
            entry.chunk.document_id,
            entry.chunk.token_count,
            entry.embedding
        });
    }

    std::sort(result.begin(), result.end(), [](const StoredVector& a, const StoredVector& b) {
        return a.chunk_id < b.chunk_id;
    });
    return result;
}

} // namespace atlas
