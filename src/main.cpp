#include "cli/cli.hpp"
#include "chunking/chunker.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "corpus/document.hpp"
#include "dedup/claim_deduplicator.hpp"
#include "dedup/claim_store.hpp"
#include "embedding/embedding_provider.hpp"
#include "index/vector_index.hpp"
#include "llm/llm_provider.hpp"
#include "pipeline/engine_config.hpp"
#include "pipeline/index_pipeline.hpp"
#include "taxonomy/cluster_labeler.hpp"
#include "taxonomy/taxonomy_builder.hpp"
#include "taxonomy/taxonomy_store.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

using namespace atlas;

// ============== Helper Functions ==============

// Load config (file, then environment) and apply command-line overrides
EngineConfig load_engine_config(const Args& args, bool require_embedding_key) {
    EngineConfig config = load_config_with_fallback(args.get("config").value());
    if (args.has("verbose")) config.verbose = true;
    if (args.has("backend")) config.vector_backend = args.get("backend").value();
    if (args.has("embedder")) {
        config.embedding_provider = args.get("embedder").value();
        if (config.embedding_provider == "openai") {
            config.embedding_api_key = get_api_key_from_env("OPENAI_API_KEY");
        } else if (config.embedding_provider == "gemini") {
            config.embedding_api_key = get_api_key_from_env("GEMINI_API_KEY");
        }
    }

    std::string error;
    if (!config.validate(error, require_embedding_key)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    return config;
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

std::string snippet(const std::string& text, size_t max_chars = 160) {
    std::string s = text.substr(0, max_chars);
    for (auto& c : s) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (text.size() > max_chars) s += "...";
    return s;
}

void print_progress(const std::string& stage, int current, int total, const std::string& message) {
    std::cout << "  [" << stage << "] " << current << "/" << total;
    if (!message.empty()) std::cout << " " << message;
    std::cout << "\n";
}

// ============== atlas chunk ==============
int cmd_chunk(const Args& args) {
    EngineConfig config = load_engine_config(args, false);
    if (args.has("target")) config.chunk_target_tokens = args.get("target").as_size();
    if (args.has("overlap")) config.chunk_overlap_tokens = args.get("overlap").as_size();

    std::string input_path = args.require("input");
    std::cout << "Loading documents from: " << input_path << "\n";
    auto documents = load_documents(input_path);

    Chunker chunker(config.chunker_config());
    RunSummary summary;
    summary.pipeline = "chunk";
    auto start = std::chrono::steady_clock::now();
    auto chunks = chunker.chunk_documents(documents, &summary);
    summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (args.has("output")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& chunk : chunks) {
            j.push_back(chunk.to_json());
        }
        write_file_atomically(args.get("output").value(), j.dump(2));
        std::cout << "Wrote " << chunks.size() << " chunks to " << args.get("output").value() << "\n";
    } else {
        for (const auto& chunk : chunks) {
            std::cout << chunk.chunk_id << " [" << chunk.section_heading << "] "
                      << chunk.token_count << " tokens: " << snippet(chunk.text, 80) << "\n";
        }
    }

    summary.print_summary();
    return 0;
}

// ============== atlas index ==============
int cmd_index(const Args& args) {
    EngineConfig config = load_engine_config(args, true);
    std::string input_path = args.require("input");
    if (args.has("parallel")) config.embedding_parallelism = args.get("parallel").as_size();

    std::cout << "Loading documents from: " << input_path << "\n";
    auto documents = load_documents(input_path);
    std::cout << "Loaded " << documents.size() << " documents\n";

    Chunker chunker(config.chunker_config());
    auto embedder = create_embedding_provider(config.embedding_config());
    auto index = create_vector_index(config.vector_index_config());

    std::cout << "Embedding with " << embedder->version() << " into the "
              << index->backend_name() << " index\n";

    IndexPipelineConfig pipeline_config;
    pipeline_config.batch_size = config.embedding_batch_size;
    pipeline_config.parallelism = config.embedding_parallelism;
    pipeline_config.clear_first = !args.has("no-clear");
    pipeline_config.verbose = config.verbose;

    IndexPipeline pipeline(chunker, *embedder, *index, pipeline_config);
    if (!config.verbose) {
        pipeline.set_progress_callback(print_progress);
    }

    RunSummary summary = pipeline.run(documents);
    summary.print_summary();

    IndexStats stats = index->stats();
    std::cout << "Index now holds " << stats.count << " chunks ("
              << stats.dimensionality << " dimensions)\n";
    return summary.details.count("index_unchanged") > 0 ? 1 : 0;
}

// ============== atlas search ==============
int cmd_search(const Args& args) {
    EngineConfig config = load_engine_config(args, true);
    std::string query = args.require("query");
    size_t k = args.get("k").as_size(5);
    MetadataFilter filter = MetadataFilter::parse(args.get("filter").values);

    auto embedder = create_embedding_provider(config.embedding_config());
    auto index = create_vector_index(config.vector_index_config());
    Chunker chunker(config.chunker_config());
    IndexPipeline pipeline(chunker, *embedder, *index);

    auto started = std::chrono::steady_clock::now();
    auto hits = pipeline.search(query, k, filter);
    auto elapsed = std::chrono::steady_clock::now() - started;

    if (args.has("json")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& hit : hits) {
            nlohmann::json item = hit.chunk.to_json();
            item["score"] = hit.score;
            j.push_back(std::move(item));
        }
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "\n" << hits.size() << " results for \"" << query << "\" ("
              << format_duration(elapsed) << ")\n\n";
    int rank = 1;
    for (const auto& hit : hits) {
        std::cout << std::setw(2) << rank++ << ". "
                  << std::fixed << std::setprecision(3) << hit.score << "  "
                  << hit.chunk.chunk_id << "  [" << hit.chunk.section_heading << "]\n";
        if (!hit.chunk.metadata.document_title.empty()) {
            std::cout << "    " << hit.chunk.metadata.document_title << "\n";
        }
        std::cout << "    " << snippet(hit.chunk.text) << "\n\n";
    }
    return 0;
}

// ============== atlas stats ==============
int cmd_stats(const Args& args) {
    EngineConfig config = load_engine_config(args, false);

    auto index = create_vector_index(config.vector_index_config());
    IndexStats stats = index->stats();

    std::cout << "\nVector Index:\n";
    std::cout << "  Backend: " << stats.backend << "\n";
    std::cout << "  Chunks: " << stats.count << "\n";
    std::cout << "  Dimensionality: " << stats.dimensionality << "\n";
    std::cout << "  Embedding version: "
              << (stats.embedding_version.empty() ? "(none)" : stats.embedding_version) << "\n";

    auto store = create_taxonomy_store(config.taxonomy_store_config());
    auto snapshot = store->load();
    std::cout << "\nTaxonomy:\n";
    if (!snapshot) {
        std::cout << "  (not built)\n";
        return 0;
    }

    std::set<std::string> documents;
    for (const auto& a : snapshot->paper_assignments) {
        documents.insert(a.document_id);
    }
    std::cout << "  Generated: " << snapshot->generated_at << "\n";
    std::cout << "  Clusters: " << snapshot->clusters.size() << "\n";
    std::cout << "  Documents: " << documents.size() << "\n";
    std::cout << "  Claim assignments: " << snapshot->claim_assignments.size() << "\n";
    for (const auto& cluster : snapshot->clusters) {
        std::cout << "    " << std::setw(3) << cluster.cluster_id << "  " << cluster.label
                  << " (" << cluster.paper_count << " documents, "
                  << cluster.primary_paper_count << " primary)\n";
    }
    return 0;
}

// ============== atlas taxonomy ==============
int cmd_taxonomy(const Args& args) {
    EngineConfig config = load_engine_config(args, false);
    TaxonomyConfig taxonomy_config = config.taxonomy_config();
    if (args.has("k")) taxonomy_config.forced_clusters = args.get("k").as_int();
    taxonomy_config.skip_labels = args.has("skip-labels");
    bool dry_run = args.has("dry-run");

    std::vector<Document> catalog;
    if (args.has("documents")) {
        catalog = load_documents(args.get("documents").value());
        std::cout << "Loaded " << catalog.size() << " catalog documents\n";
    }

    auto claim_store = create_claim_store(config.claim_store_config());
    std::vector<Claim> claims;
    if (claim_store->backend_name() == "remote" || fs::exists(config.claims_path)) {
        claims = claim_store->load();
    } else if (config.verbose) {
        std::cout << "No claims file at " << config.claims_path << "\n";
    }

    std::shared_ptr<TextLabeler> labeler;
    if (!taxonomy_config.skip_labels) {
        LLMConfig llm_config = config.llm_config();
        if (llm_config.api_key.empty()) {
            std::cerr << "Warning: no " << config.llm_provider
                      << " API key; clusters get placeholder labels\n";
        } else {
            std::shared_ptr<LLMProvider> provider =
                LLMProviderFactory::create(config.llm_provider, llm_config);
            labeler = std::make_shared<LLMTextLabeler>(provider);
        }
    }

    auto index = create_vector_index(config.vector_index_config());
    TaxonomyBuilder builder(taxonomy_config, labeler);
    if (!config.verbose) {
        builder.set_progress_callback(print_progress);
    }

    std::cout << "Building taxonomy from the " << index->backend_name() << " index\n";
    TaxonomyResult result = builder.build(*index, catalog, claims);

    if (dry_run) {
        std::cout << result.snapshot.to_json().dump(2) << "\n";
    } else if (result.snapshot.clusters.empty()) {
        std::cerr << "Warning: no clusters were built; the stored taxonomy is unchanged\n";
    } else {
        auto store = create_taxonomy_store(config.taxonomy_store_config());
        store->replace(result.snapshot);
        std::cout << "Stored " << result.snapshot.clusters.size() << " clusters in the "
                  << store->backend_name() << " taxonomy store\n";
    }

    result.summary.print_summary();
    return 0;
}

// ============== atlas dedup ==============
int cmd_dedup(const Args& args) {
    EngineConfig config = load_engine_config(args, false);
    bool detect_only = args.has("detect-only");

    std::vector<DedupPass> passes = config.dedup_passes;
    if (args.has("threshold") || args.has("window")) {
        DedupPass pass;
        pass.name = "custom";
        pass.similarity_threshold = args.get("threshold").as_double(pass.similarity_threshold);
        pass.temporal_window_ms = static_cast<int64_t>(args.get("window").as_double(30.0) * 1000.0);
        passes = {pass};
    }

    auto store = create_claim_store(config.claim_store_config());
    std::optional<std::string> episode;
    if (args.has("episode")) episode = args.get("episode").value();

    std::vector<Claim> claims = store->load(episode);
    std::cout << "Loaded " << claims.size() << " claims from the "
              << store->backend_name() << " claim store\n";

    RunSummary embed_summary;
    embed_summary.pipeline = "claim embedding";
    std::set<int64_t> unembedded;
    for (const auto& claim : claims) {
        if (claim.embedding.empty() && !claim.is_duplicate()) unembedded.insert(claim.id);
    }

    if (!unembedded.empty()) {
        auto embedder = create_embedding_provider(config.embedding_config());
        int embedded = embed_missing_claims(claims, *embedder, config.embedding_batch_size,
                                            &embed_summary);
        std::cout << "Embedded " << embedded << " of " << unembedded.size() << " claims\n";

        if (!detect_only && embedded > 0) {
            std::vector<Claim> updated;
            for (const auto& claim : claims) {
                if (unembedded.count(claim.id) && !claim.embedding.empty()) {
                    updated.push_back(claim);
                }
            }
            store->store_embeddings(updated);
        }
    }

    ClaimDeduplicator deduplicator(config.verbose);
    DedupResult result = deduplicator.run_passes(claims, passes);

    for (const auto& report : result.passes) {
        std::cout << "\nPass '" << report.pass.name << "' (similarity >= "
                  << report.pass.similarity_threshold << ", window "
                  << report.pass.temporal_window_ms / 1000.0 << "s)\n";
        std::cout << "  Analyzed: " << report.analyzed << "\n";
        std::cout << "  Skipped: " << report.skipped << "\n";
        std::cout << "  Groups: " << report.groups << "\n";
        std::cout << "  Marked duplicate: " << report.marked_duplicate << "\n";
        if (detect_only || config.verbose) {
            for (const auto& resolution : report.resolutions) {
                std::cout << "    keep " << resolution.kept_id << ", duplicates:";
                for (int64_t id : resolution.duplicate_ids) std::cout << " " << id;
                std::cout << "\n";
            }
        }
    }

    if (detect_only) {
        std::cout << "\nDetect-only run: nothing written\n";
    } else if (!result.new_links.empty()) {
        store->mark_duplicates(result.new_links);
        std::cout << "\nMarked " << result.new_links.size() << " claims as duplicates\n";
    }

    result.summary.merge(embed_summary);
    result.summary.print_summary();
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("atlas", "1.0.0");

    const ArgDef config_arg{"config", "c", "Path to config JSON (default: .atlas_config.json, then environment)", "", false, false};
    const ArgDef verbose_arg{"verbose", "v", "Verbose logging", "", false, true};
    const ArgDef backend_arg{"backend", "b", "Storage backend", "", false, false, {"local", "remote"}};

    // atlas chunk
    cli.register_command({
        "chunk",
        "Split documents into token-bounded chunks",
        {
            {"input", "i", "Documents JSON file or directory", "", true, false},
            {"output", "o", "Write chunks as JSON to this file", "", false, false},
            {"target", "t", "Target tokens per chunk", "", false, false},
            {"overlap", "l", "Overlap tokens between chunks", "", false, false},
            config_arg,
            verbose_arg
        },
        cmd_chunk
    });

    // atlas index
    cli.register_command({
        "index",
        "Chunk, embed and store documents in the vector index",
        {
            {"input", "i", "Documents JSON file or directory", "", true, false},
            {"parallel", "p", "Concurrent embedding batches", "", false, false},
            {"no-clear", "", "Upsert without clearing the index first", "", false, true},
            {"embedder", "e", "Embedding provider", "", false, false, {"gemini", "openai", "hashing"}},
            backend_arg,
            config_arg,
            verbose_arg
        },
        cmd_index
    });

    // atlas search
    cli.register_command({
        "search",
        "Semantic search over indexed chunks",
        {
            {"query", "q", "Query text", "", true, false},
            {"k", "k", "Number of results", "5", false, false},
            {"filter", "f", "field=value constraint", "", false, false, {}, true},
            {"json", "j", "Print results as JSON", "", false, true},
            {"embedder", "e", "Embedding provider", "", false, false, {"gemini", "openai", "hashing"}},
            backend_arg,
            config_arg,
            verbose_arg
        },
        cmd_search
    });

    // atlas stats
    cli.register_command({
        "stats",
        "Print vector index and taxonomy statistics",
        {
            backend_arg,
            config_arg,
            verbose_arg
        },
        cmd_stats
    });

    // atlas taxonomy
    cli.register_command({
        "taxonomy",
        "Rebuild the soft topical taxonomy from the index",
        {
            {"documents", "d", "Documents JSON (titles and abstracts for labeling)", "", false, false},
            {"k", "k", "Force the number of clusters", "", false, false},
            {"skip-labels", "s", "Use placeholder labels instead of the LLM", "", false, true},
            {"dry-run", "n", "Print the taxonomy without storing it", "", false, true},
            backend_arg,
            config_arg,
            verbose_arg
        },
        cmd_taxonomy
    });

    // atlas dedup
    cli.register_command({
        "dedup",
        "Mark near-duplicate claims",
        {
            {"episode", "p", "Only claims of this episode", "", false, false},
            {"detect-only", "n", "Report groups without writing", "", false, true},
            {"threshold", "t", "Similarity threshold for a single custom pass", "", false, false},
            {"window", "w", "Temporal window in seconds for a single custom pass", "", false, false},
            {"embedder", "e", "Embedding provider", "", false, false, {"gemini", "openai", "hashing"}},
            backend_arg,
            config_arg,
            verbose_arg
        },
        cmd_dedup
    });

    return cli.run(argc, argv);
}
