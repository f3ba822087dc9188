#include "chunking/chunker.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/local_vector_index.hpp"
#include "pipeline/index_pipeline.hpp"
#include "taxonomy/taxonomy_builder.hpp"
#include "taxonomy/taxonomy_store.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace atlas;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

Document make_document(const std::string& id, const std::string& title, const std::string& text) {
    Document doc;
    doc.document_id = id;
    doc.title = title;
    doc.abstract_text = text.substr(0, 120);
    doc.text = text;
    return doc;
}

int main(int argc, char* argv[]) {
    print_separator("Soft Taxonomy Rebuild");

    std::string work_dir = argc > 1 ? argv[1] : "example_taxonomy";
    std::filesystem::remove_all(work_dir);

    std::vector<Document> catalog = {
        make_document("bio_1", "Protein folding with deep networks",
            "protein folding structure prediction amino acid sequence deep network protein structure"),
        make_document("bio_2", "Enzyme design",
            "enzyme protein design amino acid active site folding structure protein"),
        make_document("bio_3", "Antibody structure",
            "antibody protein structure binding amino acid loop folding protein"),
        make_document("astro_1", "Galaxy mergers",
            "galaxy merger black hole gravitational waves cosmic time galaxy"),
        make_document("astro_2", "Dark matter halos",
            "dark matter halo galaxy rotation curve cosmic structure galaxy"),
        make_document("astro_3", "Black hole spin",
            "black hole spin accretion disk galaxy gravitational waves"),
        make_document("econ_1", "Inflation targeting",
            "central bank inflation interest rate monetary policy labour market"),
        make_document("econ_2", "Labour markets",
            "labour market wages unemployment inflation interest rate policy")
    };

    // =========================================================================
    // Index the catalog
    // =========================================================================

    print_separator("Step 1: Index");

    Chunker chunker;
    HashingEmbeddingProvider embedder(128);
    LocalVectorIndex index(work_dir + "/index");

    IndexPipeline pipeline(chunker, embedder, index);
    try {
        pipeline.run(catalog).print_summary();
    } catch (const std::exception& e) {
        std::cerr << "Indexing error: " << e.what() << "\n";
        return 1;
    }

    // =========================================================================
    // Rebuild taxonomy
    // =========================================================================

    print_separator("Step 2: Cluster");

    TaxonomyConfig config;
    config.min_clusters = 2;
    config.max_clusters = 4;
    config.skip_labels = true;

    TaxonomyBuilder builder(config);
    builder.set_progress_callback(progress_handler);

    TaxonomyResult result;
    try {
        result = builder.build(index, catalog, {});
    } catch (const std::exception& e) {
        std::cerr << "Taxonomy error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nModel order scores:\n";
    for (const auto& score : result.snapshot.model_order_scores) {
        std::cout << "  k=" << score.k << std::fixed << std::setprecision(3)
                  << "  bic=" << score.bic << "  silhouette=" << score.silhouette
                  << "  combined=" << score.combined << (score.valid ? "" : "  (invalid)") << "\n";
    }
    std::cout << "Selected k = " << result.snapshot.selected_k
              << " (projection " << result.snapshot.projection << ")\n";

    // =========================================================================
    // Results
    // =========================================================================

    print_separator("Step 3: Clusters");

    for (const auto& cluster : result.snapshot.clusters) {
        std::cout << cluster.label << "  at (" << std::setprecision(2)
                  << cluster.position.x << ", " << cluster.position.y << ")  "
                  << cluster.primary_paper_count << " primary / "
                  << cluster.paper_count << " total\n";
        for (const auto& a : result.snapshot.paper_assignments) {
            if (a.cluster_id != cluster.cluster_id) continue;
            std::cout << "    " << (a.is_primary ? "*" : " ") << " " << a.document_id
                      << "  " << std::setprecision(3) << a.confidence << "\n";
        }
    }

    LocalTaxonomyStore store(work_dir + "/taxonomy.json");
    store.replace(result.snapshot);
    std::cout << "\nSaved taxonomy to " << work_dir << "/taxonomy.json\n";

    result.summary.print_summary();
    return 0;
}
