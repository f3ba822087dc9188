#include "taxonomy/taxonomy_types.hpp"

using json = nlohmann::json;

namespace atlas {

namespace {

json point_json(const Point2D& p) {
    return {{"x", p.x}, {"y", p.y}};
}

Point2D point_from(const json& j) {
    Point2D p;
    if (j.is_object()) {
        p.x = j.value("x", 0.5);
        p.y = j.value("y", 0.5);
    }
    return p;
}

} // anonymous namespace

json Cluster::to_json() const {
    return {
        {"cluster_id", cluster_id},
        {"label", label},
        {"description", description},
        {"keywords", keywords},
        {"position", point_json(position)},
        {"paper_count", paper_count},
        {"primary_paper_count", primary_paper_count},
        {"centroid", centroid}
    };
}

Cluster Cluster::from_json(const json& j) {
    Cluster c;
    c.cluster_id = j.at("cluster_id").get<int>();
    c.label = j.value("label", "");
    c.description = j.value("description", "");
    if (j.contains("keywords")) c.keywords = j["keywords"].get<std::vector<std::string>>();
    if (j.contains("position")) c.position = point_from(j["position"]);
    c.paper_count = j.value("paper_count", 0);
    c.primary_paper_count = j.value("primary_paper_count", 0);
    if (j.contains("centroid")) c.centroid = j["centroid"].get<Vector>();
    return c;
}

json PaperClusterAssignment::to_json() const {
    return {
        {"document_id", document_id},
        {"cluster_id", cluster_id},
        {"confidence", confidence},
        {"is_primary", is_primary},
        {"position", point_json(position)}
    };
}

PaperClusterAssignment PaperClusterAssignment::from_json(const json& j) {
    PaperClusterAssignment a;
    a.document_id = j.at("document_id").get<std::string>();
    a.cluster_id = j.at("cluster_id").get<int>();
    a.confidence = j.value("confidence", 0.0);
    a.is_primary = j.value("is_primary", false);
    if (j.contains("position")) a.position = point_from(j["position"]);
    return a;
}

json ClaimClusterAssignment::to_json() const {
    return {
        {"claim_id", claim_id},
        {"cluster_id", cluster_id},
        {"source_document_id", source_document_id},
        {"confidence", confidence}
    };
}

ClaimClusterAssignment ClaimClusterAssignment::from_json(const json& j) {
    ClaimClusterAssignment a;
    a.claim_id = j.at("claim_id").get<int64_t>();
    a.cluster_id = j.at("cluster_id").get<int>();
    a.source_document_id = j.value("source_document_id", "");
    a.confidence = j.value("confidence", 0.0);
    return a;
}

json ModelOrderScore::to_json() const {
    return {
        {"k", k},
        {"valid", valid},
        {"log_likelihood", log_likelihood},
        {"bic", bic},
        {"silhouette", silhouette},
        {"combined", combined}
    };
}

json TaxonomySnapshot::to_json() const {
    json j;
    j["generated_at"] = generated_at;
    j["model_used"] = model_used;
    j["projection"] = projection;
    j["selected_k"] = selected_k;

    j["model_order_scores"] = json::array();
    for (const auto& s : model_order_scores) j["model_order_scores"].push_back(s.to_json());

    j["clusters"] = json::array();
    for (const auto& c : clusters) j["clusters"].push_back(c.to_json());

    j["paper_assignments"] = json::array();
    for (const auto& a : paper_assignments) j["paper_assignments"].push_back(a.to_json());

    j["claim_assignments"] = json::array();
    for (const auto& a : claim_assignments) j["claim_assignments"].push_back(a.to_json());

    return j;
}

TaxonomySnapshot TaxonomySnapshot::from_json(const json& j) {
    TaxonomySnapshot s;
    s.generated_at = j.value("generated_at", "");
    s.model_used = j.value("model_used", "");
    s.projection = j.value("projection", "");
    s.selected_k = j.value("selected_k", 0);

    if (j.contains("model_order_scores")) {
        for (const auto& item : j["model_order_scores"]) {
            ModelOrderScore score;
            score.k = item.value("k", 0);
            score.valid = item.value("valid", false);
            score.log_likelihood = item.value("log_likelihood", 0.0);
            score.bic = item.value("bic", 0.0);
            score.silhouette = item.value("silhouette", 0.0);
            score.combined = item.value("combined", 0.0);
            s.model_order_scores.push_back(score);
        }
    }
    if (j.contains("clusters")) {
        for (const auto& item : j["clusters"]) s.clusters.push_back(Cluster::from_json(item));
    }
    if (j.contains("paper_assignments")) {
        for (const auto& item : j["paper_assignments"]) {
            s.paper_assignments.push_back(PaperClusterAssignment::from_json(item));
        }
    }
    if (j.contains("claim_assignments")) {
        for (const auto& item : j["claim_assignments"]) {
            s.claim_assignments.push_back(ClaimClusterAssignment::from_json(item));
        }
    }
    return s;
}

} // namespace atlas
