#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Thin client for a PostgREST endpoint in front of PostgreSQL
 *
 * Every call is one HTTP request authenticated with the service key.
 * Failures surface as BackendError.
 */
class PostgrestClient {
public:
    /**
     * @param base_url Project URL, e.g. https://xyz.supabase.co (the
     *        /rest/v1 suffix is appended when missing)
     * @param api_key Service key sent as apikey and bearer token
     */
    PostgrestClient(const std::string& base_url, const std::string& api_key,
                    int timeout_seconds = 30);

    /**
     * @brief Call a SQL function: POST /rpc/<function>
     */
    nlohmann::json rpc(const std::string& function, const nlohmann::json& args) const;

    /**
     * @brief GET /<table>?<query>
     */
    nlohmann::json select(const std::string& table, const std::string& query) const;

    /**
     * @brief POST rows, merging on the primary key
     */
    void upsert(const std::string& table, const nlohmann::json& rows) const;

    /**
     * @brief PATCH /<table>?<filter>
     */
    void patch(const std::string& table, const std::string& filter,
               const nlohmann::json& values) const;

    /**
     * @brief DELETE /<table>?<filter>; PostgREST requires a filter
     */
    void remove(const std::string& table, const std::string& filter) const;

    /**
     * @brief Build "column=eq.<value>" with the value percent-encoded
     */
    static std::string eq(const std::string& column, const std::string& value);

    const std::string& rest_url() const { return rest_url_; }

private:
    std::string rest_url_;
    std::string api_key_;
    int timeout_seconds_;

    std::vector<std::string> headers(const std::string& prefer = "") const;
    nlohmann::json parse_body(const std::string& body) const;
};

/**
 * @brief Render a vector in pgvector text form: "[0.1,0.2,...]"
 */
std::string to_pgvector(const std::vector<float>& v);

/**
 * @brief Parse a pgvector column as returned by PostgREST (text or array)
 */
std::vector<float> from_pgvector(const nlohmann::json& value);

} // namespace atlas
