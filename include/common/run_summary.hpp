#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>

namespace atlas {

/**
 * @brief Outcome counts of one pipeline run
 *
 * Partial processing is the normal case, so runs report counts instead of a
 * bare success flag.
 */
struct RunSummary {
    std::string pipeline;                   ///< Pipeline name ("index", "taxonomy", ...)
    int processed = 0;                      ///< Items fully processed
    int skipped = 0;                        ///< Items skipped by a safe fallback
    int errored = 0;                        ///< Items dropped after an error
    double elapsed_seconds = 0.0;

    std::map<std::string, int> details;     ///< Named sub-counters

    /**
     * @brief Increment a named detail counter
     */
    void count(const std::string& key, int amount = 1) { details[key] += amount; }

    /**
     * @brief Merge another summary's counts into this one
     */
    void merge(const RunSummary& other);

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

} // namespace atlas
