#include "common/file_utils.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace atlas {

void write_file_atomically(const std::string& path, const std::string& content) {
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + tmp_path);
        }
        file << content;
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write file: " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, target, ec);
    if (ec) {
        fs::remove(tmp_path);
        throw std::runtime_error("Failed to replace " + path + ": " + ec.message());
    }
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace atlas
