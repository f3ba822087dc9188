#include "index/vector_index.hpp"
#include "index/local_vector_index.hpp"
#include "index/remote_vector_index.hpp"
#include <algorithm>
#include <stdexcept>

namespace atlas {

// ============================================================================
// MetadataFilter
// ============================================================================

const std::vector<std::string>& MetadataFilter::known_fields() {
    static const std::vector<std::string> fields = {
        "document_id", "source_type", "section_heading", "year",
        "page", "episode_id", "source_path", "document_title"
    };
    return fields;
}

bool MetadataFilter::is_satisfiable() const {
    const auto& fields = known_fields();
    for (const auto& [field, value] : equals) {
        if (std::find(fields.begin(), fields.end(), field) == fields.end()) {
            return false;
        }
    }
    return true;
}

bool MetadataFilter::matches(const Chunk& chunk) const {
    for (const auto& [field, value] : equals) {
        auto actual = chunk_field_value(chunk, field);
        if (!actual || *actual != value) {
            return false;
        }
    }
    return true;
}

MetadataFilter MetadataFilter::parse(const std::vector<std::string>& expressions) {
    MetadataFilter filter;
    for (const auto& expr : expressions) {
        size_t eq = expr.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Filter must look like field=value: " + expr);
        }
        filter.equals[expr.substr(0, eq)] = expr.substr(eq + 1);
    }
    return filter;
}

nlohmann::json MetadataFilter::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [field, value] : equals) {
        j[field] = value;
    }
    return j;
}

// ============================================================================
// IndexStats
// ============================================================================

nlohmann::json IndexStats::to_json() const {
    return {
        {"count", count},
        {"dimensionality", dimensionality},
        {"backend", backend},
        {"embedding_version", embedding_version}
    };
}

// ============================================================================
// Utility Functions
// ============================================================================

void rank_hits(std::vector<SearchHit>& hits, size_t k) {
    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.chunk.chunk_id < b.chunk.chunk_id;
    });
    if (hits.size() > k) {
        hits.resize(k);
    }
}

std::unique_ptr<VectorIndex> create_vector_index(const VectorIndexConfig& config) {
    if (config.backend == "local") {
        return std::make_unique<LocalVectorIndex>(config.index_dir, config.verbose);
    }
    if (config.backend == "remote") {
        if (config.remote_url.empty()) {
            throw std::invalid_argument("Remote vector backend needs a remote_url");
        }
        return std::make_unique<RemoteVectorIndex>(config);
    }
    throw std::invalid_argument("Unknown vector backend: " + config.backend);
}

} // namespace atlas
