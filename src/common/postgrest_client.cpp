#include "common/postgrest_client.hpp"
#include "common/errors.hpp"
#include "common/http_client.hpp"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace atlas {

PostgrestClient::PostgrestClient(const std::string& base_url, const std::string& api_key,
                                 int timeout_seconds)
    : api_key_(api_key), timeout_seconds_(timeout_seconds) {
    rest_url_ = base_url;
    while (!rest_url_.empty() && rest_url_.back() == '/') {
        rest_url_.pop_back();
    }
    if (rest_url_.size() < 8 || rest_url_.compare(rest_url_.size() - 8, 8, "/rest/v1") != 0) {
        rest_url_ += "/rest/v1";
    }
}

std::vector<std::string> PostgrestClient::headers(const std::string& prefer) const {
    std::vector<std::string> h = {
        "Content-Type: application/json",
        "Accept: application/json",
        "apikey: " + api_key_,
        "Authorization: Bearer " + api_key_
    };
    if (!prefer.empty()) {
        h.push_back("Prefer: " + prefer);
    }
    return h;
}

json PostgrestClient::parse_body(const std::string& body) const {
    if (body.empty()) {
        return json();
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw BackendError(std::string("Malformed response from database: ") + e.what());
    }
}

json PostgrestClient::rpc(const std::string& function, const json& args) const {
    HttpResponse response = http_request(
        "POST", rest_url_ + "/rpc/" + function, args.dump(), headers(), timeout_seconds_
    );
    return parse_body(response.body);
}

json PostgrestClient::select(const std::string& table, const std::string& query) const {
    std::string url = rest_url_ + "/" + table;
    if (!query.empty()) url += "?" + query;
    HttpResponse response = http_request("GET", url, "", headers(), timeout_seconds_);
    return parse_body(response.body);
}

void PostgrestClient::upsert(const std::string& table, const json& rows) const {
    http_request(
        "POST", rest_url_ + "/" + table, rows.dump(),
        headers("resolution=merge-duplicates,return=minimal"), timeout_seconds_
    );
}

void PostgrestClient::patch(const std::string& table, const std::string& filter,
                            const json& values) const {
    http_request(
        "PATCH", rest_url_ + "/" + table + "?" + filter, values.dump(),
        headers("return=minimal"), timeout_seconds_
    );
}

void PostgrestClient::remove(const std::string& table, const std::string& filter) const {
    if (filter.empty()) {
        throw std::invalid_argument("Refusing DELETE without a filter on " + table);
    }
    http_request(
        "DELETE", rest_url_ + "/" + table + "?" + filter, "",
        headers("return=minimal"), timeout_seconds_
    );
}

std::string PostgrestClient::eq(const std::string& column, const std::string& value) {
    return column + "=eq." + url_encode(value);
}

std::string to_pgvector(const std::vector<float>& v) {
    std::ostringstream ss;
    ss.precision(9);
    ss << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) ss << ",";
        ss << v[i];
    }
    ss << "]";
    return ss.str();
}

std::vector<float> from_pgvector(const json& value) {
    if (value.is_array()) {
        return value.get<std::vector<float>>();
    }
    if (value.is_string()) {
        try {
            return json::parse(value.get<std::string>()).get<std::vector<float>>();
        } catch (const json::exception& e) {
            throw BackendError(std::string("Malformed vector column: ") + e.what());
        }
    }
    return {};
}

} // namespace atlas
