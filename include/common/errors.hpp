#pragma once

#include <stdexcept>
#include <string>

namespace atlas {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief A storage backend or remote service could not be reached or
 * rejected the request.
 *
 * Fatal for the whole run: there is no automatic fallback to another
 * backend because switching requires a full rebuild.
 */
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message, long http_status = 0)
        : std::runtime_error(message), http_status_(http_status) {}

    /**
     * @brief HTTP status code, or 0 for transport-level failures
     */
    long http_status() const { return http_status_; }

private:
    long http_status_;
};

/**
 * @brief Data violates an index invariant (dimensionality, embedding version,
 * dangling document reference)
 */
class ConsistencyError : public std::runtime_error {
public:
    explicit ConsistencyError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The text labeler failed or returned a malformed structure
 */
class LabelerError : public std::runtime_error {
public:
    explicit LabelerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A duplicate link would introduce a cycle or self-loop
 */
class DuplicateCycleError : public std::logic_error {
public:
    explicit DuplicateCycleError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace atlas
