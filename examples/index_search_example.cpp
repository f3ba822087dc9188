#include "chunking/chunker.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/local_vector_index.hpp"
#include "pipeline/index_pipeline.hpp"
#include <iomanip>
#include <iostream>

using namespace atlas;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Progress callback function
void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
        int percent = (current * 100) / total;
        std::cout << "(" << percent << "%) ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

std::vector<Document> sample_corpus() {
    std::vector<Document> docs;

    Document protein;
    protein.document_id = "paper_protein";
    protein.title = "Learned Structure Prediction";
    protein.year = 2021;
    protein.authors = {"A. Researcher", "B. Scientist"};
    protein.text =
        "Proteins fold into three dimensional structures determined by their amino acid "
        "sequence. Deep networks trained on solved structures now predict folds with "
        "near experimental accuracy.\n\nThe predicted structures speed up drug discovery "
        "because binding pockets can be located before any crystal is grown.";
    docs.push_back(protein);

    Document galaxies;
    galaxies.document_id = "paper_galaxies";
    galaxies.title = "Galaxy Mergers Over Cosmic Time";
    galaxies.year = 2019;
    galaxies.text =
        "Galaxies grow by merging with their neighbours. During a merger the central "
        "black holes sink toward each other and eventually coalesce, emitting "
        "gravitational waves that detectors can observe.";
    docs.push_back(galaxies);

    Document transcript;
    transcript.document_id = "episode_sleep";
    transcript.title = "Sleep and Memory";
    transcript.source_type = SourceType::Transcript;
    transcript.episode_id = "ep_042";
    transcript.text =
        "Today we talk about sleep. The guest explains that sleeping after learning "
        "consolidates memory, and that the hippocampus replays the day's experiences "
        "during deep sleep.";
    docs.push_back(transcript);

    return docs;
}

int main(int argc, char* argv[]) {
    print_separator("Chunk, Embed and Search");

    std::string index_dir = argc > 1 ? argv[1] : "example_index";
    std::cout << "Index directory: " << index_dir << "\n";
    std::cout << "Embedder: offline hashing provider (256 dimensions)\n";

    // =========================================================================
    // Build the index
    // =========================================================================

    print_separator("Step 1: Index Documents");

    ChunkerConfig chunker_config;
    chunker_config.target_tokens = 24;
    chunker_config.overlap_tokens = 6;

    Chunker chunker(chunker_config);
    HashingEmbeddingProvider embedder(256);
    LocalVectorIndex index(index_dir, true);

    IndexPipelineConfig pipeline_config;
    pipeline_config.batch_size = 4;
    pipeline_config.parallelism = 2;

    IndexPipeline pipeline(chunker, embedder, index, pipeline_config);
    pipeline.set_progress_callback(progress_handler);

    RunSummary summary;
    try {
        summary = pipeline.run(sample_corpus());
    } catch (const std::exception& e) {
        std::cerr << "Indexing error: " << e.what() << "\n";
        return 1;
    }
    summary.print_summary();

    // =========================================================================
    // Search
    // =========================================================================

    print_separator("Step 2: Search");

    const std::vector<std::string> queries = {
        "how do deep networks predict protein folds",
        "black holes in merging galaxies",
        "does sleep help memory"
    };

    for (const auto& query : queries) {
        std::cout << "Query: " << query << "\n";
        for (const auto& hit : pipeline.search(query, 2)) {
            std::cout << "  " << std::fixed << std::setprecision(3) << hit.score << "  "
                      << hit.chunk.chunk_id << " [" << hit.chunk.section_heading << "]\n";
        }
        std::cout << "\n";
    }

    // =========================================================================
    // Filtered search
    // =========================================================================

    print_separator("Step 3: Filtered Search");

    MetadataFilter filter = MetadataFilter::parse({"source_type=transcript"});
    std::cout << "Filter: source_type=transcript\n";
    for (const auto& hit : pipeline.search("memory", 5, filter)) {
        std::cout << "  " << std::fixed << std::setprecision(3) << hit.score << "  "
                  << hit.chunk.chunk_id << " (episode " << hit.chunk.metadata.episode_id << ")\n";
    }

    auto stats = index.stats();
    std::cout << "\nIndex holds " << stats.count << " chunks of dimension "
              << stats.dimensionality << " (" << stats.embedding_version << ")\n";

    return 0;
}
