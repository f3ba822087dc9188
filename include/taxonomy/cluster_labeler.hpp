#pragma once

#include "llm/llm_provider.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Human-readable name of a cluster
 */
struct ClusterLabel {
    std::string label;
    std::string description;                ///< At most 300 characters
    std::vector<std::string> keywords;      ///< 3 to 5 entries

    /**
     * @brief Placeholder used when labeling fails: "Cluster {id}"
     */
    static ClusterLabel placeholder(int cluster_id);
};

// ============================================================================
// Text Labeler Interface
// ============================================================================

/**
 * @brief Names a cluster from representative document samples
 */
class TextLabeler {
public:
    virtual ~TextLabeler() = default;

    /**
     * @brief Produce a label for the given samples
     * @throws LabelerError on failure or malformed output
     */
    virtual ClusterLabel label(const std::vector<std::string>& samples) = 0;

    /**
     * @brief Model identifier recorded with the taxonomy
     */
    virtual std::string model_name() const = 0;
};

/**
 * @brief Labeler backed by a chat-completion provider
 */
class LLMTextLabeler : public TextLabeler {
public:
    explicit LLMTextLabeler(std::shared_ptr<LLMProvider> provider);

    ClusterLabel label(const std::vector<std::string>& samples) override;
    std::string model_name() const override;

private:
    std::shared_ptr<LLMProvider> provider_;
};

/**
 * @brief Parse and validate a labeler JSON answer
 *
 * Requires a non-empty "label", a "description" of at most 300 characters
 * and 3 to 5 non-empty "keywords". Markdown fences are tolerated.
 *
 * @throws LabelerError if any requirement fails
 */
ClusterLabel parse_label_json(const std::string& text);

/**
 * @brief Outcome of labeling every cluster
 */
struct LabelingResult {
    std::vector<ClusterLabel> labels;       ///< One per cluster, in cluster order
    int failed = 0;                         ///< Placeholders due to errors
    int timed_out = 0;                      ///< Placeholders due to timeouts
};

/**
 * @brief Label clusters in parallel with bounded concurrency
 *
 * Starts max_parallel labeler calls per wave. A call that throws or does
 * not finish within timeout of its wave start yields the placeholder label.
 * A timed-out call is abandoned: it keeps running in the background, holding
 * its own reference to the labeler, and its answer is discarded.
 *
 * @param labeler Shared labeler; must tolerate concurrent label() calls
 * @throws std::invalid_argument if labeler is null
 * @param samples_per_cluster Samples for cluster i at index i
 */
LabelingResult label_clusters(
    std::shared_ptr<TextLabeler> labeler,
    const std::vector<std::vector<std::string>>& samples_per_cluster,
    size_t max_parallel,
    std::chrono::milliseconds timeout
);

} // namespace atlas
