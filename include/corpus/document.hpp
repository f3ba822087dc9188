#pragma once

#include "common/vector_math.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Kind of source a document was ingested from
 */
enum class SourceType {
    Paper,
    Transcript
};

std::string source_type_to_string(SourceType type);

/**
 * @brief Parse "paper" or "transcript"
 * @throws std::invalid_argument for any other value
 */
SourceType source_type_from_string(const std::string& value);

/**
 * @brief A declared section of a document
 *
 * Offsets are byte positions into Document::text.
 */
struct Section {
    std::string heading;
    size_t start_offset = 0;       ///< First byte of the section
    size_t end_offset = 0;         ///< One past the last byte
    int page_number = -1;          ///< Page number (1-indexed), -1 if unknown
};

/**
 * @brief A paper or transcript produced by the upstream extractor
 */
struct Document {
    std::string document_id;       ///< Stable identifier
    std::string title;
    std::string text;              ///< Cleaned full text
    std::vector<Section> sections; ///< Ordered, non-overlapping sections
    SourceType source_type = SourceType::Paper;
    std::optional<int> year;       ///< Publication year (nullable for transcripts)

    std::vector<std::string> authors;
    std::string abstract_text;
    std::string source_path;
    std::string episode_id;        ///< Transcripts only

    /**
     * @brief Sections to chunk by
     *
     * Returns the declared sections clamped to the text, or a single
     * default section spanning the whole text when none are declared.
     */
    std::vector<Section> effective_sections() const;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a document record
     *
     * Accepts either explicit section offsets or a list of
     * {"heading", "text"} sections, in which case the full text is built by
     * joining section texts with blank lines.
     */
    static Document from_json(const nlohmann::json& j);
};

/// Current ChunkMetadata layout
constexpr int kChunkSchemaVersion = 2;

/**
 * @brief Typed, versioned provenance carried by every chunk
 *
 * Version 1 records were flat string maps without a "schema_version"
 * field; from_json migrates them.
 */
struct ChunkMetadata {
    int schema_version = kChunkSchemaVersion;
    SourceType source_type = SourceType::Paper;
    std::string document_title;
    std::vector<std::string> authors;
    std::optional<int> year;
    std::string source_path;
    std::string episode_id;

    nlohmann::json to_json() const;

    /**
     * @throws std::invalid_argument for an unknown future schema version
     */
    static ChunkMetadata from_json(const nlohmann::json& j);
};

/**
 * @brief A contiguous token-bounded slice of a document
 *
 * text == document.text.substr(start_offset, end_offset - start_offset).
 * The bytes in [start_offset, core_offset) repeat the tail of the previous
 * chunk; [core_offset, end_offset) is new content.
 */
struct Chunk {
    std::string chunk_id;          ///< "<document_id>_chunk_<ordinal>"
    std::string document_id;
    std::string section_heading;
    std::string text;
    int ordinal = 0;               ///< Index within the document
    int token_count = 0;
    int page_number = -1;          ///< -1 if unknown
    size_t start_offset = 0;
    size_t core_offset = 0;
    size_t end_offset = 0;
    ChunkMetadata metadata;

    /**
     * @brief Create chunk ID from document and ordinal
     */
    static std::string generate_chunk_id(const std::string& document_id, int ordinal);

    /**
     * @brief Number of overlap bytes repeated from the previous chunk
     */
    size_t overlap_length() const { return core_offset - start_offset; }

    nlohmann::json to_json() const;
    static Chunk from_json(const nlohmann::json& j);
};

/**
 * @brief Chunk paired with its embedding, the unit written to a vector index
 */
struct EmbeddedChunk {
    Chunk chunk;
    Vector embedding;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Load documents from a JSON file (array or {"documents": [...]})
 * or from every *.json file in a directory
 *
 * @throws std::runtime_error if the path cannot be read or parsed
 */
std::vector<Document> load_documents(const std::string& path);

/**
 * @brief Value of a scalar chunk field by name, used for metadata filters
 *
 * Known fields: document_id, source_type, section_heading, year, page,
 * episode_id, source_path, document_title. A field the stored metadata
 * omits (episode_id on papers, an unknown year or page) has no value, so it
 * matches no equality filter.
 */
std::optional<std::string> chunk_field_value(const Chunk& chunk, const std::string& field);

} // namespace atlas
