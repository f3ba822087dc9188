#include "taxonomy/taxonomy_store.hpp"
#include "common/file_utils.hpp"
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

// ============================================================================
// LocalTaxonomyStore
// ============================================================================

LocalTaxonomyStore::LocalTaxonomyStore(const std::string& path) : path_(path) {}

void LocalTaxonomyStore::replace(const TaxonomySnapshot& snapshot) {
    write_file_atomically(path_, snapshot.to_json().dump(2));
}

std::optional<TaxonomySnapshot> LocalTaxonomyStore::load() const {
    if (!std::filesystem::exists(path_)) {
        return std::nullopt;
    }
    return TaxonomySnapshot::from_json(read_json_file(path_));
}

// ============================================================================
// RemoteTaxonomyStore
// ============================================================================

RemoteTaxonomyStore::RemoteTaxonomyStore(PostgrestClient client)
    : client_(std::move(client)) {}

json RemoteTaxonomyStore::build_payload(const TaxonomySnapshot& snapshot) {
    json payload;
    payload["model_used"] = snapshot.model_used;

    payload["clusters"] = json::array();
    for (const auto& c : snapshot.clusters) {
        payload["clusters"].push_back({
            {"cluster_id", c.cluster_id},
            {"label", c.label},
            {"description", c.description},
            {"keywords", c.keywords},
            {"position_x", c.position.x},
            {"position_y", c.position.y},
            {"centroid", to_pgvector(c.centroid)},
            {"paper_count", c.paper_count},
            {"primary_paper_count", c.primary_paper_count}
        });
    }

    payload["paper_assignments"] = json::array();
    for (const auto& a : snapshot.paper_assignments) {
        payload["paper_assignments"].push_back({
            {"document_id", a.document_id},
            {"cluster_id", a.cluster_id},
            {"confidence", a.confidence},
            {"is_primary", a.is_primary},
            {"position_x", a.position.x},
            {"position_y", a.position.y}
        });
    }

    payload["claim_assignments"] = json::array();
    for (const auto& a : snapshot.claim_assignments) {
        payload["claim_assignments"].push_back(a.to_json());
    }

    return payload;
}

void RemoteTaxonomyStore::replace(const TaxonomySnapshot& snapshot) {
    client_.rpc("replace_taxonomy", {{"payload", build_payload(snapshot)}});
}

std::optional<TaxonomySnapshot> RemoteTaxonomyStore::load() const {
    json clusters = client_.select("taxonomy_clusters", "select=*&order=cluster_id.asc");
    if (!clusters.is_array() || clusters.empty()) {
        return std::nullopt;
    }

    TaxonomySnapshot snapshot;
    for (const auto& row : clusters) {
        Cluster c;
        c.cluster_id = row.value("cluster_id", 0);
        c.label = row.value("label", "");
        if (row.contains("description") && row["description"].is_string()) {
            c.description = row["description"].get<std::string>();
        }
        if (row.contains("keywords") && row["keywords"].is_array()) {
            c.keywords = row["keywords"].get<std::vector<std::string>>();
        }
        c.position.x = row.value("position_x", 0.5);
        c.position.y = row.value("position_y", 0.5);
        c.paper_count = row.value("paper_count", 0);
        c.primary_paper_count = row.value("primary_paper_count", 0);
        if (row.contains("centroid_embedding") && !row["centroid_embedding"].is_null()) {
            c.centroid = from_pgvector(row["centroid_embedding"]);
        }
        if (row.contains("model_used") && row["model_used"].is_string()) {
            snapshot.model_used = row["model_used"].get<std::string>();
        }
        if (row.contains("generated_at") && row["generated_at"].is_string()) {
            snapshot.generated_at = row["generated_at"].get<std::string>();
        }
        snapshot.clusters.push_back(std::move(c));
    }
    snapshot.selected_k = static_cast<int>(snapshot.clusters.size());

    json papers = client_.select("paper_cluster_assignments",
                                 "select=*&order=document_id.asc,cluster_id.asc");
    for (const auto& row : papers) {
        PaperClusterAssignment a;
        a.document_id = row.value("document_id", "");
        a.cluster_id = row.value("cluster_id", 0);
        a.confidence = row.value("confidence", 0.0);
        a.is_primary = row.value("is_primary", false);
        if (row.contains("position_x") && row["position_x"].is_number()) {
            a.position.x = row["position_x"].get<double>();
        }
        if (row.contains("position_y") && row["position_y"].is_number()) {
            a.position.y = row["position_y"].get<double>();
        }
        snapshot.paper_assignments.push_back(std::move(a));
    }

    json claims = client_.select("claim_cluster_assignments",
                                 "select=*&order=claim_id.asc,cluster_id.asc");
    for (const auto& row : claims) {
        ClaimClusterAssignment a;
        a.claim_id = row.value("claim_id", int64_t{0});
        a.cluster_id = row.value("cluster_id", 0);
        if (row.contains("source_document_id") && row["source_document_id"].is_string()) {
            a.source_document_id = row["source_document_id"].get<std::string>();
        }
        a.confidence = row.value("confidence", 0.0);
        snapshot.claim_assignments.push_back(std::move(a));
    }

    return snapshot;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<TaxonomyStore> create_taxonomy_store(const TaxonomyStoreConfig& config) {
    if (config.backend == "local") {
        return std::make_unique<LocalTaxonomyStore>(config.path);
    }
    if (config.backend == "remote") {
        if (config.remote_url.empty()) {
            throw std::invalid_argument("Remote taxonomy store needs a remote_url");
        }
        return std::make_unique<RemoteTaxonomyStore>(
            PostgrestClient(config.remote_url, config.remote_key, config.timeout_seconds)
        );
    }
    throw std::invalid_argument("Unknown taxonomy backend: " + config.backend);
}

} // namespace atlas
