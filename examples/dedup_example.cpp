#include "dedup/claim_deduplicator.hpp"
#include "embedding/embedding_provider.hpp"
#include <algorithm>
#include <iostream>

using namespace atlas;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

Claim make_claim(int64_t id, int64_t timestamp_ms, const std::string& text,
                 const std::string& distilled = "") {
    Claim claim;
    claim.id = id;
    claim.episode_id = "ep_042";
    claim.text = text;
    claim.timestamp_ms = timestamp_ms;
    claim.confidence = 0.8;
    if (!distilled.empty()) {
        claim.distilled_text = distilled;
        claim.distilled_word_count = static_cast<int>(
            std::count(distilled.begin(), distilled.end(), ' ') + 1);
    }
    return claim;
}

int main() {
    print_separator("Claim Deduplication");

    std::vector<Claim> claims = {
        make_claim(1, 10000, "sleep after learning consolidates memory"),
        make_claim(2, 12000, "sleep after learning consolidates memory",
                   "Sleep consolidates memory"),
        make_claim(3, 95000, "the hippocampus replays experiences during deep sleep"),
        make_claim(4, 140000, "the hippocampus replays experiences during deep sleep at night"),
        make_claim(5, 60000, "caffeine late in the day delays sleep onset")
    };

    // =========================================================================
    // Embed
    // =========================================================================

    print_separator("Step 1: Embed Claims");

    HashingEmbeddingProvider embedder(256);
    RunSummary embed_summary;
    int embedded = embed_missing_claims(claims, embedder, 16, &embed_summary);
    std::cout << "Embedded " << embedded << " claims\n";

    // =========================================================================
    // Passes
    // =========================================================================

    print_separator("Step 2: Run Passes");

    ClaimDeduplicator dedup(true);
    DedupResult result;
    try {
        result = dedup.run_passes(claims, default_dedup_passes());
    } catch (const std::exception& e) {
        std::cerr << "Dedup error: " << e.what() << "\n";
        return 1;
    }

    for (const auto& report : result.passes) {
        std::cout << "\nPass " << report.pass.name << ":\n";
        for (const auto& resolution : report.resolutions) {
            std::cout << "  keep " << resolution.kept_id << ", mark";
            for (int64_t id : resolution.duplicate_ids) std::cout << " " << id;
            std::cout << "\n";
        }
    }

    // =========================================================================
    // Results
    // =========================================================================

    print_separator("Step 3: Claims");

    for (const auto& claim : claims) {
        std::cout << claim.id << "  " << claim.embedding_text();
        if (claim.duplicate_of) std::cout << "  -> duplicate of " << *claim.duplicate_of;
        std::cout << "\n";
    }

    result.summary.print_summary();
    return 0;
}
