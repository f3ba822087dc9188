#include "taxonomy/cluster_labeler.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace atlas {

namespace {

constexpr size_t kMaxDescriptionLength = 300;
constexpr size_t kMinKeywords = 3;
constexpr size_t kMaxKeywords = 5;

} // anonymous namespace

ClusterLabel ClusterLabel::placeholder(int cluster_id) {
    ClusterLabel label;
    label.label = "Cluster " + std::to_string(cluster_id);
    label.description = "Cluster description pending.";
    return label;
}

// ============================================================================
// LLMTextLabeler
// ============================================================================

LLMTextLabeler::LLMTextLabeler(std::shared_ptr<LLMProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("LLMTextLabeler needs a provider");
    }
}

ClusterLabel LLMTextLabeler::label(const std::vector<std::string>& samples) {
    std::vector<Message> messages = {
        Message(Message::Role::System, PromptTemplates::cluster_label_system_prompt()),
        Message(Message::Role::User, PromptTemplates::cluster_label_user_prompt(samples))
    };

    LLMResponse response = provider_->chat(messages);
    if (!response.success) {
        throw LabelerError("Labeling request failed: " + response.error_message);
    }
    return parse_label_json(response.content);
}

std::string LLMTextLabeler::model_name() const {
    return provider_->get_model();
}

// ============================================================================
// Parsing
// ============================================================================

ClusterLabel parse_label_json(const std::string& text) {
    json j;
    try {
        j = json::parse(clean_json_response(text));
    } catch (const json::parse_error& e) {
        throw LabelerError(std::string("Label response is not JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw LabelerError("Label response is not a JSON object");
    }

    ClusterLabel label;

    if (!j.contains("label") || !j["label"].is_string() || j["label"].get<std::string>().empty()) {
        throw LabelerError("Label response has no label");
    }
    label.label = j["label"].get<std::string>();

    if (j.contains("description")) {
        if (!j["description"].is_string()) {
            throw LabelerError("Label description is not a string");
        }
        label.description = j["description"].get<std::string>();
    }
    if (label.description.size() > kMaxDescriptionLength) {
        throw LabelerError(
            "Label description has " + std::to_string(label.description.size()) +
            " characters, limit is " + std::to_string(kMaxDescriptionLength)
        );
    }

    if (!j.contains("keywords") || !j["keywords"].is_array()) {
        throw LabelerError("Label response has no keyword list");
    }
    for (const auto& keyword : j["keywords"]) {
        if (!keyword.is_string() || keyword.get<std::string>().empty()) {
            throw LabelerError("Label keywords must be non-empty strings");
        }
        label.keywords.push_back(keyword.get<std::string>());
    }
    if (label.keywords.size() < kMinKeywords || label.keywords.size() > kMaxKeywords) {
        throw LabelerError(
            "Label has " + std::to_string(label.keywords.size()) + " keywords, expected 3 to 5"
        );
    }

    return label;
}

// ============================================================================
// Parallel Labeling
// ============================================================================

LabelingResult label_clusters(
    std::shared_ptr<TextLabeler> labeler,
    const std::vector<std::vector<std::string>>& samples_per_cluster,
    size_t max_parallel,
    std::chrono::milliseconds timeout
) {
    if (!labeler) {
        throw std::invalid_argument("label_clusters needs a labeler");
    }

    LabelingResult result;
    const size_t count = samples_per_cluster.size();
    result.labels.resize(count);

    const size_t wave = std::max<size_t>(1, max_parallel);

    for (size_t begin = 0; begin < count; begin += wave) {
        size_t end = std::min(count, begin + wave);
        std::vector<std::future<ClusterLabel>> futures;
        auto deadline = std::chrono::steady_clock::now() + timeout;

        // Workers own the labeler and their samples, so a late call can be
        // abandoned without being joined
        for (size_t i = begin; i < end; ++i) {
            auto promise = std::make_shared<std::promise<ClusterLabel>>();
            futures.push_back(promise->get_future());
            std::thread([labeler, promise, samples = samples_per_cluster[i]]() {
                try {
                    promise->set_value(labeler->label(samples));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            }).detach();
        }

        for (size_t i = begin; i < end; ++i) {
            auto& future = futures[i - begin];
            int cluster_id = static_cast<int>(i);

            if (future.wait_until(deadline) != std::future_status::ready) {
                std::cerr << "Warning: labeling cluster " << cluster_id
                          << " timed out, using placeholder" << std::endl;
                result.labels[i] = ClusterLabel::placeholder(cluster_id);
                result.timed_out++;
                continue;
            }

            try {
                result.labels[i] = future.get();
            } catch (const std::exception& e) {
                std::cerr << "Warning: labeling cluster " << cluster_id
                          << " failed (" << e.what() << "), using placeholder" << std::endl;
                result.labels[i] = ClusterLabel::placeholder(cluster_id);
                result.failed++;
            }
        }
    }

    return result;
}

} // namespace atlas
