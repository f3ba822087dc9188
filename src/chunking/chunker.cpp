#include "chunking/chunker.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace atlas {

namespace {

ChunkMetadata metadata_for(const Document& document) {
    ChunkMetadata meta;
    meta.source_type = document.source_type;
    meta.document_title = document.title;
    meta.authors = document.authors;
    meta.year = document.year;
    meta.source_path = document.source_path;
    if (document.source_type == SourceType::Transcript) {
        meta.episode_id = document.episode_id;
    }
    return meta;
}

} // anonymous namespace

Chunker::Chunker(const ChunkerConfig& config, std::shared_ptr<Tokenizer> tokenizer)
    : config_(config), tokenizer_(std::move(tokenizer)) {
    if (config_.target_tokens == 0) {
        throw std::invalid_argument("target_tokens must be positive");
    }
    if (config_.overlap_tokens >= config_.target_tokens) {
        throw std::invalid_argument(
            "overlap_tokens (" + std::to_string(config_.overlap_tokens) +
            ") must be smaller than target_tokens (" +
            std::to_string(config_.target_tokens) + ")"
        );
    }
    if (!tokenizer_) {
        tokenizer_ = create_tokenizer(config_.tokenizer);
    }
}

std::vector<Chunk> Chunker::chunk(const Document& document) const {
    std::vector<Chunk> chunks;
    const std::string& text = document.text;

    std::vector<Token> tokens = tokenizer_->tokenize(text);
    if (tokens.empty()) {
        return chunks;
    }

    const std::vector<Section> sections = document.effective_sections();
    const size_t n = tokens.size();

    // Section of every token, and first token of every section
    std::vector<size_t> token_section(n, 0);
    std::vector<size_t> section_first_token(sections.size(), n);
    size_t s = 0;
    for (size_t t = 0; t < n; ++t) {
        while (s + 1 < sections.size() && tokens[t].begin >= sections[s + 1].start_offset) {
            ++s;
        }
        token_section[t] = s;
        if (section_first_token[s] == n) {
            section_first_token[s] = t;
        }
    }

    const ChunkMetadata meta = metadata_for(document);
    const size_t target = config_.target_tokens;
    const size_t min_section_break = std::max<size_t>(1, target / 4);

    size_t start = 0;        // first token of the chunk, overlap included
    size_t core = 0;         // first new token
    size_t core_offset = 0;  // byte where new content starts
    int ordinal = 0;

    while (core < n) {
        size_t end = std::min(start + target, n);
        bool section_break = false;

        if (end < n) {
            // Last section start in (core, end]
            for (size_t b = end; b > core; --b) {
                if (b < n && token_section[b] != token_section[b - 1]) {
                    if (b - start >= min_section_break) {
                        end = b;
                        section_break = true;
                    }
                    break;
                }
            }
        }

        Chunk chunk;
        chunk.document_id = document.document_id;
        chunk.ordinal = ordinal;
        chunk.chunk_id = Chunk::generate_chunk_id(document.document_id, ordinal);

        const Section& section = sections[token_section[core]];
        chunk.section_heading = section.heading;
        chunk.page_number = section.page_number;

        chunk.core_offset = core_offset;
        chunk.start_offset = (start == core) ? core_offset : tokens[start].begin;
        chunk.end_offset = (end == n) ? text.size() : tokens[end].begin;
        chunk.text = text.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset);
        chunk.token_count = static_cast<int>(end - start);
        chunk.metadata = meta;

        core_offset = chunk.end_offset;
        chunks.push_back(std::move(chunk));
        ordinal++;

        if (end >= n) {
            break;
        }

        core = end;
        if (section_break || config_.overlap_tokens == 0) {
            start = end;
        } else {
            size_t floor = section_first_token[token_section[end]];
            size_t back = end > config_.overlap_tokens ? end - config_.overlap_tokens : 0;
            start = std::max(back, floor);
        }
    }

    return chunks;
}

std::vector<Chunk> Chunker::chunk_documents(
    const std::vector<Document>& documents,
    RunSummary* summary
) const {
    std::vector<Chunk> all_chunks;

    for (const auto& document : documents) {
        std::vector<Chunk> chunks = chunk(document);

        if (chunks.empty()) {
            std::cerr << "Warning: document " << document.document_id
                      << " has no text, skipping" << std::endl;
            if (summary) summary->skipped++;
            continue;
        }

        if (summary) {
            summary->processed++;
            summary->count("chunks", static_cast<int>(chunks.size()));
        }

        all_chunks.insert(all_chunks.end(),
                          std::make_move_iterator(chunks.begin()),
                          std::make_move_iterator(chunks.end()));
    }

    return all_chunks;
}

} // namespace atlas
