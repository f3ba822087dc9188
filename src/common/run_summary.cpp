#include "common/run_summary.hpp"
#include <iostream>

namespace atlas {

void RunSummary::merge(const RunSummary& other) {
    processed += other.processed;
    skipped += other.skipped;
    errored += other.errored;
    elapsed_seconds += other.elapsed_seconds;
    for (const auto& [key, value] : other.details) {
        details[key] += value;
    }
}

void RunSummary::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Run Summary: " << pipeline << "\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "  Processed: " << processed << "\n";
    std::cout << "  Skipped: " << skipped << "\n";
    std::cout << "  Errored: " << errored << "\n";

    if (!details.empty()) {
        std::cout << "\nDetails:\n";
        for (const auto& [key, value] : details) {
            std::cout << "  " << key << ": " << value << "\n";
        }
    }

    std::cout << "\n  Total time: " << elapsed_seconds << " seconds\n";
    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

nlohmann::json RunSummary::to_json() const {
    nlohmann::json j;
    j["pipeline"] = pipeline;
    j["processed"] = processed;
    j["skipped"] = skipped;
    j["errored"] = errored;
    j["elapsed_seconds"] = elapsed_seconds;
    j["details"] = details;
    return j;
}

} // namespace atlas
