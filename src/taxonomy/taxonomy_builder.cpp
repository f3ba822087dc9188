#include "taxonomy/taxonomy_builder.hpp"
#include "common/file_utils.hpp"
#include "taxonomy/projection.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace atlas {

namespace {

std::string excerpt(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    size_t cut = max_chars;
    // Do not split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

} // anonymous namespace

TaxonomyBuilder::TaxonomyBuilder(const TaxonomyConfig& config,
                                 std::shared_ptr<TextLabeler> labeler)
    : config_(config), labeler_(std::move(labeler)) {
    if (config_.min_clusters < 2 || config_.max_clusters < config_.min_clusters) {
        throw std::invalid_argument(
            "Cluster range must satisfy 2 <= min_clusters <= max_clusters"
        );
    }
    if (config_.assignment_threshold < 0.0 || config_.assignment_threshold > 1.0) {
        throw std::invalid_argument("assignment_threshold must be in [0, 1]");
    }
    if (config_.projection != "mds" && config_.projection != "pca") {
        throw std::invalid_argument("Unknown projection method: " + config_.projection);
    }
}

void TaxonomyBuilder::report_progress(const std::string& stage, int current, int total,
                                      const std::string& message) const {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
    if (config_.verbose) {
        std::cout << "[" << stage << "] " << message << std::endl;
    }
}

// ============================================================================
// Stages
// ============================================================================

std::vector<DocumentVector> TaxonomyBuilder::aggregate(
    const std::vector<StoredVector>& vectors,
    const std::set<std::string>* known_documents,
    RunSummary& summary
) {
    std::map<std::string, std::vector<const StoredVector*>> by_document;
    size_t dims = 0;

    for (const auto& v : vectors) {
        if (v.embedding.empty()) {
            summary.skipped++;
            summary.count("chunks_dimension_mismatch");
            continue;
        }
        if (dims == 0) dims = v.embedding.size();
        if (v.embedding.size() != dims) {
            summary.skipped++;
            summary.count("chunks_dimension_mismatch");
            continue;
        }
        if (known_documents && known_documents->count(v.document_id) == 0) {
            summary.skipped++;
            summary.count("chunks_unknown_document");
            continue;
        }
        by_document[v.document_id].push_back(&v);
    }

    std::vector<DocumentVector> documents;
    for (const auto& [document_id, chunks] : by_document) {
        std::vector<const Vector*> embeddings;
        std::vector<double> weights;
        DocumentVector doc;
        doc.document_id = document_id;

        for (const auto* chunk : chunks) {
            embeddings.push_back(&chunk->embedding);
            weights.push_back(static_cast<double>(chunk->token_count));
            doc.token_count += chunk->token_count;
        }
        doc.chunk_count = static_cast<int>(chunks.size());
        doc.embedding = weighted_mean(embeddings, weights);
        l2_normalize(doc.embedding);
        documents.push_back(std::move(doc));
    }

    return documents;
}

std::vector<PaperClusterAssignment> TaxonomyBuilder::soft_assign(
    const std::vector<std::string>& document_ids,
    const Matrix& posteriors,
    double threshold
) {
    std::vector<PaperClusterAssignment> assignments;

    for (size_t i = 0; i < document_ids.size() && i < posteriors.size(); ++i) {
        const auto& row = posteriors[i];
        if (row.empty()) continue;

        size_t primary = 0;
        for (size_t c = 1; c < row.size(); ++c) {
            if (row[c] > row[primary]) primary = c;
        }

        for (size_t c = 0; c < row.size(); ++c) {
            bool is_primary = (c == primary);
            if (!is_primary && row[c] <= threshold) continue;

            PaperClusterAssignment a;
            a.document_id = document_ids[i];
            a.cluster_id = static_cast<int>(c);
            a.confidence = row[c];
            a.is_primary = is_primary;
            assignments.push_back(a);
        }
    }

    return assignments;
}

std::vector<ClaimClusterAssignment> TaxonomyBuilder::propagate(
    const std::vector<PaperClusterAssignment>& assignments,
    const std::vector<Claim>& claims,
    RunSummary& summary
) {
    std::map<std::string, std::vector<const PaperClusterAssignment*>> by_document;
    for (const auto& a : assignments) {
        by_document[a.document_id].push_back(&a);
    }

    std::vector<ClaimClusterAssignment> result;
    for (const auto& claim : claims) {
        if (!claim.document_id) {
            summary.count("claims_without_document");
            continue;
        }

        auto it = by_document.find(*claim.document_id);
        if (it == by_document.end()) {
            summary.skipped++;
            summary.count("claims_unknown_document");
            continue;
        }

        for (const auto* a : it->second) {
            ClaimClusterAssignment ca;
            ca.claim_id = claim.id;
            ca.cluster_id = a->cluster_id;
            ca.source_document_id = a->document_id;
            ca.confidence = a->confidence;
            result.push_back(ca);
        }
        summary.count("claims_assigned");
    }

    return result;
}

std::vector<std::vector<std::string>> TaxonomyBuilder::label_samples(
    const std::vector<PaperClusterAssignment>& assignments,
    int k,
    const std::map<std::string, const Document*>& documents
) const {
    std::vector<std::vector<const PaperClusterAssignment*>> members(k);
    for (const auto& a : assignments) {
        members[a.cluster_id].push_back(&a);
    }

    std::vector<std::vector<std::string>> samples(k);
    for (int c = 0; c < k; ++c) {
        auto& list = members[c];
        std::sort(list.begin(), list.end(),
            [](const PaperClusterAssignment* a, const PaperClusterAssignment* b) {
                if (a->confidence != b->confidence) return a->confidence > b->confidence;
                return a->document_id < b->document_id;
            });

        for (size_t i = 0; i < list.size() && i < config_.label_samples; ++i) {
            const std::string& id = list[i]->document_id;
            auto it = documents.find(id);

            std::string title = id;
            std::string summary_text;
            if (it != documents.end()) {
                const Document* doc = it->second;
                if (!doc->title.empty()) title = doc->title;
                summary_text = doc->abstract_text.empty() ? doc->text : doc->abstract_text;
            }

            std::string sample = "Title: " + title;
            if (!summary_text.empty()) {
                sample += "\nAbstract: " + excerpt(summary_text, config_.abstract_chars);
            }
            samples[c].push_back(sample);
        }
    }
    return samples;
}

// ============================================================================
// Build
// ============================================================================

TaxonomyResult TaxonomyBuilder::build(
    const VectorIndex& index,
    const std::vector<Document>& catalog,
    const std::vector<Claim>& claims
) const {
    report_progress("fetch", 0, 1, "Reading vectors from " + index.backend_name() + " index");
    std::vector<StoredVector> vectors = index.fetch_vectors();
    report_progress("fetch", 1, 1, "Read " + std::to_string(vectors.size()) + " chunk vectors");
    return build_from_vectors(vectors, catalog, claims);
}

TaxonomyResult TaxonomyBuilder::build_from_vectors(
    const std::vector<StoredVector>& vectors,
    const std::vector<Document>& catalog,
    const std::vector<Claim>& claims
) const {
    auto start_time = std::chrono::steady_clock::now();

    TaxonomyResult result;
    result.summary.pipeline = "taxonomy";
    TaxonomySnapshot& snapshot = result.snapshot;
    snapshot.generated_at = utc_timestamp();

    std::map<std::string, const Document*> documents_by_id;
    std::set<std::string> known;
    for (const auto& doc : catalog) {
        documents_by_id[doc.document_id] = &doc;
        known.insert(doc.document_id);
    }

    // Stage 1: aggregate
    std::vector<DocumentVector> docs = aggregate(
        vectors, catalog.empty() ? nullptr : &known, result.summary
    );
    report_progress("aggregate", 1, 1,
                    "Aggregated " + std::to_string(docs.size()) + " document vectors");

    if (docs.empty()) {
        std::cerr << "Warning: no document vectors available, taxonomy is empty" << std::endl;
        result.summary.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        return result;
    }

    Matrix data(docs.size());
    std::vector<std::string> document_ids;
    for (size_t i = 0; i < docs.size(); ++i) {
        data[i].assign(docs[i].embedding.begin(), docs[i].embedding.end());
        document_ids.push_back(docs[i].document_id);
    }

    // Stage 2: model order
    std::vector<int> candidates;
    if (config_.forced_clusters > 0) {
        candidates.push_back(clamp_forced_cluster_count(docs.size(), config_.forced_clusters));
    } else {
        candidates = candidate_cluster_counts(docs.size(), config_.min_clusters, config_.max_clusters);
    }
    if (candidates.size() == 1 && config_.forced_clusters <= 0 &&
        candidates.front() < config_.min_clusters) {
        std::cerr << "Warning: only " << docs.size() << " documents, clamping to "
                  << candidates.front() << " clusters" << std::endl;
        result.summary.count("cluster_count_clamped");
    }

    report_progress("select", 0, static_cast<int>(candidates.size()), "Fitting mixture models");
    ModelOrderSelection selection = select_model_order(
        data, candidates, config_.silhouette_weight, config_.gmm
    );
    const int k = selection.k;
    snapshot.selected_k = k;
    snapshot.model_order_scores = selection.scores;
    report_progress("select", static_cast<int>(candidates.size()),
                    static_cast<int>(candidates.size()),
                    "Selected k = " + std::to_string(k));

    // Stage 3: soft assignment
    Matrix posteriors = selection.model.predict_proba(data);
    snapshot.paper_assignments = soft_assign(document_ids, posteriors, config_.assignment_threshold);

    // Stage 4: projection of centroids and documents together
    Matrix points;
    for (const auto& mean : selection.model.means()) points.push_back(mean);
    for (const auto& row : data) points.push_back(row);
    ProjectionResult projection = project_points(points, config_.projection);
    snapshot.projection = projection.method;
    report_progress("project", 1, 1, "Projected with " + projection.method);

    std::map<std::string, Point2D> document_positions;
    for (size_t i = 0; i < docs.size(); ++i) {
        document_positions[document_ids[i]] = projection.points[k + i];
    }
    for (auto& a : snapshot.paper_assignments) {
        a.position = document_positions[a.document_id];
    }

    snapshot.clusters.resize(k);
    for (int c = 0; c < k; ++c) {
        Cluster& cluster = snapshot.clusters[c];
        cluster.cluster_id = c;
        cluster.position = projection.points[c];
        const auto& mean = selection.model.means()[c];
        cluster.centroid.assign(mean.begin(), mean.end());
    }
    for (const auto& a : snapshot.paper_assignments) {
        snapshot.clusters[a.cluster_id].paper_count++;
        if (a.is_primary) snapshot.clusters[a.cluster_id].primary_paper_count++;
    }

    // Stage 5: labels
    if (config_.skip_labels || !labeler_) {
        for (int c = 0; c < k; ++c) {
            ClusterLabel label = ClusterLabel::placeholder(c);
            snapshot.clusters[c].label = label.label;
            snapshot.clusters[c].description = label.description;
        }
        result.summary.count("labels_placeholder", k);
        snapshot.model_used = "none";
    } else {
        report_progress("label", 0, k, "Labeling " + std::to_string(k) + " clusters");
        LabelingResult labels = label_clusters(
            labeler_,
            label_samples(snapshot.paper_assignments, k, documents_by_id),
            config_.label_parallelism,
            std::chrono::seconds(config_.label_timeout_seconds)
        );
        for (int c = 0; c < k; ++c) {
            snapshot.clusters[c].label = labels.labels[c].label;
            snapshot.clusters[c].description = labels.labels[c].description;
            snapshot.clusters[c].keywords = labels.labels[c].keywords;
        }
        if (labels.failed > 0) result.summary.count("labels_failed", labels.failed);
        if (labels.timed_out > 0) result.summary.count("labels_timed_out", labels.timed_out);
        snapshot.model_used = labeler_->model_name();
        report_progress("label", k, k, "Labeling complete");
    }

    // Stage 6: claim propagation
    snapshot.claim_assignments = propagate(snapshot.paper_assignments, claims, result.summary);
    report_progress("propagate", 1, 1, std::to_string(snapshot.claim_assignments.size()) +
                    " claim assignments");

    result.summary.processed = static_cast<int>(docs.size());
    result.summary.count("clusters", k);
    result.summary.count("paper_assignments", static_cast<int>(snapshot.paper_assignments.size()));
    result.summary.count("claim_assignments", static_cast<int>(snapshot.claim_assignments.size()));
    result.summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();

    return result;
}

} // namespace atlas
