#pragma once

#include <memory>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief A token as a byte span [begin, end) into the tokenized text
 */
struct Token {
    size_t begin = 0;
    size_t end = 0;

    size_t length() const { return end - begin; }
};

// ============================================================================
// Tokenizers
// ============================================================================

/**
 * @brief Abstract base class for tokenizers used to bound chunk sizes
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /**
     * @brief Split text into tokens, ordered by position
     *
     * Tokens never overlap; bytes between tokens are whitespace.
     */
    virtual std::vector<Token> tokenize(const std::string& text) const = 0;

    /**
     * @brief Number of tokens in text
     */
    virtual size_t count_tokens(const std::string& text) const {
        return tokenize(text).size();
    }

    /**
     * @brief Get tokenizer name
     */
    virtual std::string get_name() const = 0;
};

/**
 * @brief Word-piece approximation of subword token counts
 *
 * Runs of letters and digits (bytes >= 0x80 count as letters, so UTF-8
 * sequences stay whole) form one token; every other non-space character is
 * its own token.
 */
class WordTokenizer : public Tokenizer {
public:
    std::vector<Token> tokenize(const std::string& text) const override;
    std::string get_name() const override { return "word"; }
};

/**
 * @brief Whitespace-delimited tokens
 */
class WhitespaceTokenizer : public Tokenizer {
public:
    std::vector<Token> tokenize(const std::string& text) const override;
    std::string get_name() const override { return "whitespace"; }
};

/**
 * @brief Create tokenizer by name ("word" or "whitespace")
 * @throws std::invalid_argument for unknown names
 */
std::unique_ptr<Tokenizer> create_tokenizer(const std::string& name);

} // namespace atlas
