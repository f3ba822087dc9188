#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace atlas {

/**
 * @brief Replace a file's content so readers see either the old or the new
 * version, never a partial write
 *
 * Writes "<path>.tmp" and renames it over path. Parent directories are
 * created as needed.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void write_file_atomically(const std::string& path, const std::string& content);

/**
 * @brief Read and parse a JSON file
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
nlohmann::json read_json_file(const std::string& path);

/**
 * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string utc_timestamp();

} // namespace atlas
