#include <gtest/gtest.h>
#include "chunking/chunker.hpp"
#include <sstream>

using namespace atlas;
using json = nlohmann::json;

namespace {

std::string numbered_words(const std::string& prefix, int count) {
    std::ostringstream ss;
    for (int i = 0; i < count; ++i) {
        if (i > 0) ss << ' ';
        ss << prefix << i;
    }
    return ss.str();
}

} // anonymous namespace

class ChunkerTest : public ::testing::Test {
protected:
    ChunkerConfig config;

    void SetUp() override {
        config.target_tokens = 10;
        config.overlap_tokens = 3;
        config.tokenizer = "whitespace";
    }

    Document make_document(const std::string& text) {
        Document doc;
        doc.document_id = "doc";
        doc.title = "A Document";
        doc.text = text;
        return doc;
    }
};

// ==========================================
// Tokenizer Tests
// ==========================================

TEST_F(ChunkerTest, WordTokenizerSplitsPunctuation) {
    WordTokenizer tokenizer;
    auto tokens = tokenizer.tokenize("GPT-4 works, mostly.");
    // GPT - 4 works , mostly .
    EXPECT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].begin, 0u);
    EXPECT_EQ(tokens[0].length(), 3u);
}

TEST_F(ChunkerTest, UnknownTokenizerThrows) {
    EXPECT_THROW(create_tokenizer("bpe"), std::invalid_argument);
}

// ==========================================
// Configuration Tests
// ==========================================

TEST_F(ChunkerTest, RejectsOverlapNotBelowTarget) {
    config.overlap_tokens = 10;
    EXPECT_THROW(Chunker{config}, std::invalid_argument);
    config.target_tokens = 0;
    config.overlap_tokens = 0;
    EXPECT_THROW(Chunker{config}, std::invalid_argument);
}

// ==========================================
// Chunking Tests
// ==========================================

TEST_F(ChunkerTest, EmptyDocumentHasNoChunks) {
    Chunker chunker(config);
    EXPECT_TRUE(chunker.chunk(make_document("")).empty());
    EXPECT_TRUE(chunker.chunk(make_document("   \n\t ")).empty());
}

TEST_F(ChunkerTest, ShortDocumentIsOneChunk) {
    Chunker chunker(config);
    auto chunks = chunker.chunk(make_document("just a few words"));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "just a few words");
    EXPECT_EQ(chunks[0].token_count, 4);
    EXPECT_EQ(chunks[0].chunk_id, "doc_chunk_0");
    EXPECT_EQ(chunks[0].metadata.document_title, "A Document");
}

TEST_F(ChunkerTest, SlidingWindowWithOverlap) {
    Chunker chunker(config);
    auto chunks = chunker.chunk(make_document(numbered_words("w", 100)));

    // 10 tokens, then 7 new tokens per chunk
    ASSERT_EQ(chunks.size(), 14u);
    EXPECT_EQ(chunks[1].text.substr(0, 3), "w7 ");
    EXPECT_EQ(chunks[1].token_count, 10);
    EXPECT_EQ(chunks[1].text.substr(chunks[1].overlap_length(), 4), "w10 ");
}

TEST_F(ChunkerTest, CoverageAndTokenBound) {
    Chunker chunker(config);
    Document doc = make_document(numbered_words("token", 257));
    auto chunks = chunker.chunk(doc);
    ASSERT_FALSE(chunks.empty());

    std::string rebuilt;
    size_t expected_core = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& c = chunks[i];
        EXPECT_LE(c.token_count, static_cast<int>(config.target_tokens));
        EXPECT_EQ(c.ordinal, static_cast<int>(i));
        EXPECT_EQ(c.core_offset, expected_core);
        EXPECT_EQ(c.text, doc.text.substr(c.start_offset, c.end_offset - c.start_offset));
        rebuilt += doc.text.substr(c.core_offset, c.end_offset - c.core_offset);
        expected_core = c.end_offset;
    }
    EXPECT_EQ(rebuilt, doc.text);
    EXPECT_EQ(chunks.back().end_offset, doc.text.size());
}

TEST_F(ChunkerTest, BreaksAtSectionStartWithoutOverlap) {
    config.target_tokens = 20;
    config.overlap_tokens = 5;
    Chunker chunker(config);

    json j = {
        {"id", "paper"},
        {"sections", {
            {{"heading", "Introduction"}, {"text", numbered_words("a", 30)}},
            {{"heading", "Methods"}, {"text", numbered_words("b", 30)}}
        }}
    };
    Document doc = Document::from_json(j);
    auto chunks = chunker.chunk(doc);

    ASSERT_GE(chunks.size(), 3u);
    EXPECT_EQ(chunks[1].section_heading, "Introduction");
    EXPECT_EQ(chunks[1].end_offset, doc.sections[1].start_offset);
    EXPECT_EQ(chunks[2].section_heading, "Methods");
    EXPECT_EQ(chunks[2].overlap_length(), 0u);
    EXPECT_EQ(chunks[2].text.substr(0, 3), "b0 ");

    for (const auto& c : chunks) {
        if (c.section_heading == "Methods") {
            EXPECT_GE(c.start_offset, doc.sections[1].start_offset);
        }
    }
}

TEST_F(ChunkerTest, TranscriptChunksCarryEpisode) {
    Chunker chunker(config);
    Document doc = make_document("speaker one says something");
    doc.source_type = SourceType::Transcript;
    doc.episode_id = "ep-42";

    auto chunks = chunker.chunk(doc);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].metadata.episode_id, "ep-42");
    EXPECT_EQ(chunks[0].section_heading, "Transcript");
}

TEST_F(ChunkerTest, ChunkDocumentsCountsSkipped) {
    Chunker chunker(config);
    std::vector<Document> docs = {make_document("some words"), make_document("")};
    docs[1].document_id = "empty";

    RunSummary summary;
    auto chunks = chunker.chunk_documents(docs, &summary);
    EXPECT_EQ(chunks.size(), 1u);
    EXPECT_EQ(summary.processed, 1);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.details["chunks"], 1);
}
