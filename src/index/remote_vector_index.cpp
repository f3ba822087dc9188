#include "index/remote_vector_index.hpp"
#include "common/errors.hpp"
#include "common/http_client.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace atlas {

namespace {

json chunk_row(const EmbeddedChunk& item, const std::string& embedding_version) {
    const Chunk& c = item.chunk;
    return {
        {"chunk_id", c.chunk_id},
        {"document_id", c.document_id},
        {"section_heading", c.section_heading},
        {"chunk_text", c.text},
        {"ordinal", c.ordinal},
        {"token_count", c.token_count},
        {"page", c.page_number < 0 ? json(nullptr) : json(c.page_number)},
        {"start_offset", c.start_offset},
        {"core_offset", c.core_offset},
        {"end_offset", c.end_offset},
        {"metadata", c.metadata.to_json()},
        {"embedding", to_pgvector(item.embedding)},
        {"embedding_version", embedding_version}
    };
}

Chunk chunk_from_row(const json& row) {
    json j = row;
    if (j.contains("page") && j["page"].is_null()) {
        j["page"] = -1;
    }
    return Chunk::from_json(j);
}

} // anonymous namespace

RemoteVectorIndex::RemoteVectorIndex(const VectorIndexConfig& config)
    : config_(config),
      client_(config.remote_url, config.remote_key, config.timeout_seconds) {}

std::string RemoteVectorIndex::filter_query(const MetadataFilter& filter) {
    std::string query;
    for (const auto& [field, value] : filter.equals) {
        std::string column = field;
        if (field != "document_id" && field != "section_heading" && field != "page") {
            column = "metadata->>" + field;
        }
        if (!query.empty()) query += "&";
        query += PostgrestClient::eq(column, value);
    }
    return query;
}

IndexStats RemoteVectorIndex::stats() const {
    json result = client_.rpc("chunk_index_stats", json::object());
    const json& row = result.is_array() ? (result.empty() ? json::object() : result[0]) : result;

    IndexStats s;
    s.backend = backend_name();
    if (row.is_object()) {
        s.count = row.value("count", size_t{0});
        if (row.contains("dimensionality") && !row["dimensionality"].is_null()) {
            s.dimensionality = row["dimensionality"].get<size_t>();
        }
        if (row.contains("embedding_version") && !row["embedding_version"].is_null()) {
            s.embedding_version = row["embedding_version"].get<std::string>();
        }
    }
    return s;
}

UpsertResult RemoteVectorIndex::upsert(
    const std::vector<EmbeddedChunk>& chunks,
    const std::string& embedding_version
) {
    UpsertResult result;
    if (chunks.empty()) {
        return result;
    }

    IndexStats current = stats();
    if (current.count > 0 && current.embedding_version != embedding_version) {
        throw ConsistencyError(
            "Embedding version " + embedding_version + " does not match index version " +
            current.embedding_version + "; clear the index before switching providers"
        );
    }

    size_t dims = current.count > 0 ? current.dimensionality : 0;
    if (dims == 0) {
        for (const auto& item : chunks) {
            if (!item.embedding.empty()) {
                dims = item.embedding.size();
                break;
            }
        }
    }

    json batch = json::array();
    auto flush = [&]() {
        if (batch.empty()) return;
        client_.upsert(kTable, batch);
        if (config_.verbose) {
            std::cout << "  Uploaded " << batch.size() << " chunks" << std::endl;
        }
        batch = json::array();
    };

    for (const auto& item : chunks) {
        if (item.embedding.empty() || item.embedding.size() != dims) {
            std::cerr << "Warning: skipping chunk " << item.chunk.chunk_id
                      << " (dimension " << item.embedding.size()
                      << ", index expects " << dims << ")" << std::endl;
            result.skipped_dimension++;
            continue;
        }
        batch.push_back(chunk_row(item, embedding_version));
        result.inserted++;
        if (batch.size() >= std::max<size_t>(1, config_.upsert_batch_size)) {
            flush();
        }
    }
    flush();

    return result;
}

std::vector<SearchHit> RemoteVectorIndex::search(
    const Vector& query,
    size_t k,
    const MetadataFilter& filter
) {
    std::vector<SearchHit> hits;
    if (k == 0 || !filter.is_satisfiable()) {
        return hits;
    }

    IndexStats current = stats();
    if (current.count == 0) {
        return hits;
    }
    if (query.size() != current.dimensionality) {
        throw ConsistencyError(
            "Query has dimension " + std::to_string(query.size()) +
            ", index has " + std::to_string(current.dimensionality)
        );
    }

    json args = {
        {"query_embedding", to_pgvector(query)},
        {"match_threshold", 0.0},
        {"match_count", k},
        {"filter", filter.to_json()}
    };
    json rows = client_.rpc("match_chunks", args);

    for (const auto& row : rows) {
        SearchHit hit;
        hit.chunk = chunk_from_row(row);
        double similarity = row.value("similarity", 0.0);
        hit.score = std::max(0.0, std::min(1.0, similarity));
        hits.push_back(std::move(hit));
    }

    rank_hits(hits, k);
    return hits;
}

void RemoteVectorIndex::clear() {
    client_.remove(kTable, "chunk_id=not.is.null");
}

std::vector<StoredVector> RemoteVectorIndex::fetch_vectors(const MetadataFilter& filter) const {
    std::vector<StoredVector> result;
    if (!filter.is_satisfiable()) {
        return result;
    }

    std::string base = "select=chunk_id,document_id,token_count,embedding&order=chunk_id.asc";
    std::string conditions = filter_query(filter);
    if (!conditions.empty()) {
        base += "&" + conditions;
    }

    for (size_t offset = 0;; offset += kPageSize) {
        json rows = client_.select(
            kTable,
            base + "&limit=" + std::to_string(kPageSize) + "&offset=" + std::to_string(offset)
        );
        if (!rows.is_array() || rows.empty()) {
            break;
        }
        for (const auto& row : rows) {
            result.push_back({
                row.value("chunk_id", ""),
                row.value("document_id", ""),
                row.value("token_count", 0),
                from_pgvector(row["embedding"])
            });
        }
        if (rows.size() < kPageSize) {
            break;
        }
    }

    return result;
}

} // namespace atlas
