#include "corpus/document.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace atlas {

namespace {

std::optional<int> parse_year(const json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    const auto& value = j[key];
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_number()) return static_cast<int>(value.get<double>());
    if (value.is_string()) {
        std::string s = value.get<std::string>();
        if (s.empty()) return std::nullopt;
        try {
            return std::stoi(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string string_or(const json& j, const std::string& key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::vector<std::string> parse_authors(const json& j) {
    std::vector<std::string> authors;
    if (!j.contains("authors")) return authors;
    const auto& value = j["authors"];
    if (value.is_array()) {
        for (const auto& a : value) {
            if (a.is_string()) authors.push_back(a.get<std::string>());
        }
    } else if (value.is_string()) {
        std::stringstream ss(value.get<std::string>());
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t first = item.find_first_not_of(' ');
            if (first == std::string::npos) continue;
            authors.push_back(item.substr(first));
        }
    }
    return authors;
}

std::string default_heading(SourceType type) {
    return type == SourceType::Transcript ? "Transcript" : "Introduction";
}

} // anonymous namespace

// ============================================================================
// SourceType
// ============================================================================

std::string source_type_to_string(SourceType type) {
    switch (type) {
        case SourceType::Paper: return "paper";
        case SourceType::Transcript: return "transcript";
        default: return "paper";
    }
}

SourceType source_type_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "paper") return SourceType::Paper;
    if (lower == "transcript") return SourceType::Transcript;
    throw std::invalid_argument("Unknown source type: " + value);
}

// ============================================================================
// Document
// ============================================================================

std::vector<Section> Document::effective_sections() const {
    std::vector<Section> declared;
    for (const auto& section : sections) {
        Section s = section;
        s.start_offset = std::min(s.start_offset, text.size());
        s.end_offset = std::min(s.end_offset, text.size());
        if (s.end_offset <= s.start_offset) continue;
        if (s.heading.empty()) s.heading = default_heading(source_type);
        declared.push_back(s);
    }

    std::stable_sort(declared.begin(), declared.end(),
        [](const Section& a, const Section& b) { return a.start_offset < b.start_offset; });

    std::vector<Section> result;
    for (const auto& s : declared) {
        if (!result.empty() && s.start_offset < result.back().end_offset) {
            continue;  // overlapping declaration, keep the earlier one
        }
        result.push_back(s);
    }

    if (result.empty()) {
        Section whole;
        whole.heading = default_heading(source_type);
        whole.start_offset = 0;
        whole.end_offset = text.size();
        result.push_back(whole);
        return result;
    }

    // Sections partition the text: gaps go to the preceding section
    result.front().start_offset = 0;
    for (size_t i = 0; i + 1 < result.size(); ++i) {
        result[i].end_offset = result[i + 1].start_offset;
    }
    result.back().end_offset = text.size();
    return result;
}

json Document::to_json() const {
    json j;
    j["document_id"] = document_id;
    j["title"] = title;
    j["text"] = text;
    j["source_type"] = source_type_to_string(source_type);
    j["year"] = year ? json(*year) : json(nullptr);
    j["authors"] = authors;
    j["abstract"] = abstract_text;
    j["source_path"] = source_path;
    if (!episode_id.empty()) j["episode_id"] = episode_id;

    j["sections"] = json::array();
    for (const auto& s : sections) {
        j["sections"].push_back({
            {"heading", s.heading},
            {"start_offset", s.start_offset},
            {"end_offset", s.end_offset},
            {"page", s.page_number}
        });
    }
    return j;
}

Document Document::from_json(const json& j) {
    Document doc;

    doc.document_id = string_or(j, "document_id", string_or(j, "paper_id", string_or(j, "id")));
    if (doc.document_id.empty()) {
        throw std::invalid_argument("Document record has no id");
    }

    doc.title = string_or(j, "title");
    doc.text = string_or(j, "text", string_or(j, "full_text"));
    if (j.contains("source_type") && j["source_type"].is_string()) {
        doc.source_type = source_type_from_string(j["source_type"]);
    }
    doc.year = parse_year(j, "year");
    doc.authors = parse_authors(j);
    doc.abstract_text = string_or(j, "abstract");
    doc.source_path = string_or(j, "source_path");
    doc.episode_id = string_or(j, "episode_id", string_or(j, "podcast_id"));

    if (!j.contains("sections") || !j["sections"].is_array()) {
        return doc;
    }

    const auto& sections = j["sections"];
    bool has_offsets = !sections.empty() && sections[0].contains("start_offset");

    if (has_offsets) {
        for (const auto& s : sections) {
            Section section;
            section.heading = string_or(s, "heading");
            section.start_offset = s.value("start_offset", size_t{0});
            section.end_offset = s.value("end_offset", size_t{0});
            section.page_number = s.value("page", -1);
            doc.sections.push_back(section);
        }
        return doc;
    }

    // Sections given as text: build or locate them in the full text
    bool build_text = doc.text.empty();
    size_t cursor = 0;
    for (const auto& s : sections) {
        std::string section_text = string_or(s, "text");
        if (section_text.empty()) continue;

        Section section;
        section.heading = s.contains("heading") && s["heading"].is_string()
            ? s["heading"].get<std::string>() : "";
        section.page_number = s.value("page", -1);

        if (build_text) {
            if (!doc.text.empty()) doc.text += "\n\n";
            section.start_offset = doc.text.size();
            doc.text += section_text;
            section.end_offset = doc.text.size();
        } else {
            size_t pos = doc.text.find(section_text, cursor);
            if (pos == std::string::npos) continue;
            section.start_offset = pos;
            section.end_offset = pos + section_text.size();
            cursor = section.end_offset;
        }
        doc.sections.push_back(section);
    }

    return doc;
}

// ============================================================================
// ChunkMetadata
// ============================================================================

json ChunkMetadata::to_json() const {
    json j;
    j["schema_version"] = schema_version;
    j["source_type"] = source_type_to_string(source_type);
    j["document_title"] = document_title;
    j["authors"] = authors;
    j["year"] = year ? json(*year) : json(nullptr);
    j["source_path"] = source_path;
    if (source_type == SourceType::Transcript) {
        j["episode_id"] = episode_id;
    }
    return j;
}

ChunkMetadata ChunkMetadata::from_json(const json& j) {
    ChunkMetadata meta;

    if (!j.contains("schema_version")) {
        // Version 1: flat map written by the first indexer
        meta.source_type = SourceType::Paper;
        if (j.contains("source_type") && j["source_type"].is_string()) {
            meta.source_type = source_type_from_string(j["source_type"]);
        }
        meta.document_title = string_or(j, "paper_title", string_or(j, "document_title"));
        meta.authors = parse_authors(j);
        meta.year = parse_year(j, "year");
        meta.source_path = string_or(j, "source_path");
        meta.episode_id = string_or(j, "episode_id");
        return meta;
    }

    int version = j["schema_version"].get<int>();
    if (version > kChunkSchemaVersion || version < 1) {
        throw std::invalid_argument(
            "Unsupported chunk metadata schema version " + std::to_string(version)
        );
    }

    meta.source_type = source_type_from_string(string_or(j, "source_type", "paper"));
    meta.document_title = string_or(j, "document_title");
    meta.authors = parse_authors(j);
    meta.year = parse_year(j, "year");
    meta.source_path = string_or(j, "source_path");
    meta.episode_id = string_or(j, "episode_id");
    return meta;
}

// ============================================================================
// Chunk
// ============================================================================

std::string Chunk::generate_chunk_id(const std::string& document_id, int ordinal) {
    return document_id + "_chunk_" + std::to_string(ordinal);
}

json Chunk::to_json() const {
    json j;
    j["chunk_id"] = chunk_id;
    j["document_id"] = document_id;
    j["section_heading"] = section_heading;
    j["text"] = text;
    j["ordinal"] = ordinal;
    j["token_count"] = token_count;
    j["page"] = page_number;
    j["start_offset"] = start_offset;
    j["core_offset"] = core_offset;
    j["end_offset"] = end_offset;
    j["metadata"] = metadata.to_json();
    return j;
}

Chunk Chunk::from_json(const json& j) {
    Chunk chunk;
    chunk.document_id = string_or(j, "document_id", string_or(j, "paper_id"));
    chunk.ordinal = j.value("ordinal", j.value("chunk_index", 0));
    chunk.chunk_id = string_or(j, "chunk_id", generate_chunk_id(chunk.document_id, chunk.ordinal));
    chunk.section_heading = string_or(j, "section_heading");
    chunk.text = string_or(j, "text", string_or(j, "chunk_text"));
    chunk.token_count = j.value("token_count", 0);
    chunk.page_number = (j.contains("page") && j["page"].is_number()) ? j["page"].get<int>() : -1;
    chunk.start_offset = j.value("start_offset", size_t{0});
    chunk.core_offset = j.value("core_offset", chunk.start_offset);
    chunk.end_offset = j.value("end_offset", chunk.start_offset + chunk.text.size());
    if (j.contains("metadata") && j["metadata"].is_object()) {
        chunk.metadata = ChunkMetadata::from_json(j["metadata"]);
    }
    return chunk;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<Document> load_documents(const std::string& path) {
    std::vector<std::string> files;

    if (fs::is_directory(path)) {
        for (const auto& entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path().string());
            }
        }
        std::sort(files.begin(), files.end());
    } else {
        files.push_back(path);
    }

    std::vector<Document> documents;
    for (const auto& file_path : files) {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open documents file: " + file_path);
        }

        json j;
        try {
            file >> j;
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Failed to parse " + file_path + ": " + e.what());
        }

        const json* records = &j;
        if (j.is_object() && j.contains("documents")) {
            records = &j["documents"];
        }

        if (records->is_array()) {
            for (const auto& record : *records) {
                documents.push_back(Document::from_json(record));
            }
        } else if (records->is_object()) {
            documents.push_back(Document::from_json(*records));
        }
    }

    return documents;
}

std::optional<std::string> chunk_field_value(const Chunk& chunk, const std::string& field) {
    if (field == "document_id") return chunk.document_id;
    if (field == "source_type") return source_type_to_string(chunk.metadata.source_type);
    if (field == "section_heading") return chunk.section_heading;
    if (field == "document_title") return chunk.metadata.document_title;
    if (field == "source_path") return chunk.metadata.source_path;
    if (field == "episode_id") {
        // Stored metadata carries episode_id for transcripts only
        if (chunk.metadata.source_type != SourceType::Transcript) return std::nullopt;
        return chunk.metadata.episode_id;
    }
    if (field == "page") {
        if (chunk.page_number < 0) return std::nullopt;
        return std::to_string(chunk.page_number);
    }
    if (field == "year") {
        if (!chunk.metadata.year) return std::nullopt;
        return std::to_string(*chunk.metadata.year);
    }
    return std::nullopt;
}

} // namespace atlas
