#pragma once

#include "common/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace atlas {

// ============================================================================
// HTTP Helpers (libcurl)
// ============================================================================

/**
 * @brief Response of a completed HTTP exchange
 */
struct HttpResponse {
    long status = 0;                        ///< HTTP status code
    std::string body;                       ///< Response body
    std::vector<std::string> headers;       ///< Raw response header lines
};

/**
 * @brief Perform an HTTP request
 *
 * @param method "GET", "POST", "PATCH" or "DELETE"
 * @param url Full request URL
 * @param body Request body (ignored for GET)
 * @param headers Header lines, e.g. "Content-Type: application/json"
 * @param timeout_seconds Total request timeout
 * @return Response with a 2xx status
 * @throws BackendError on transport failure or a non-2xx status
 */
HttpResponse http_request(
    const std::string& method,
    const std::string& url,
    const std::string& body,
    const std::vector<std::string>& headers,
    int timeout_seconds = 60
);

/**
 * @brief POST a JSON payload and return the response body
 */
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds = 60
);

/**
 * @brief Percent-encode a string for use in a query parameter
 */
std::string url_encode(const std::string& value);

/**
 * @brief Whether a failed call may succeed when repeated
 *
 * Transport failures, rate limiting (429) and server errors are retryable;
 * other client errors are not.
 */
inline bool is_retryable(const BackendError& e) {
    return e.http_status() == 0 || e.http_status() == 429 || e.http_status() >= 500;
}

/**
 * @brief Call func until it succeeds, backing off 1 s, 2 s, 4 s, ...
 *
 * @throws BackendError the last failure, or the first non-retryable one
 */
template<typename Func>
auto with_retries(Func&& func, int max_retries, bool verbose, const std::string& operation)
    -> decltype(func()) {
    const int limit = std::max(1, max_retries);
    for (int attempt = 1;; ++attempt) {
        try {
            return func();
        } catch (const BackendError& e) {
            if (attempt >= limit || !is_retryable(e)) {
                throw;
            }
            if (verbose) {
                std::cerr << "Attempt " << attempt << " failed for " << operation
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1 << std::min(attempt - 1, 5)));
        }
    }
}

} // namespace atlas
