#include "chunking/tokenizer.hpp"
#include <cctype>
#include <stdexcept>

namespace atlas {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) != 0;
}

} // anonymous namespace

std::vector<Token> WordTokenizer::tokenize(const std::string& text) const {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        if (is_space(text[i])) {
            ++i;
            continue;
        }

        Token token;
        token.begin = i;
        if (is_word_char(text[i])) {
            while (i < n && is_word_char(text[i])) ++i;
        } else {
            ++i;
        }
        token.end = i;
        tokens.push_back(token);
    }

    return tokens;
}

std::vector<Token> WhitespaceTokenizer::tokenize(const std::string& text) const {
    std::vector<Token> tokens;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        if (is_space(text[i])) {
            ++i;
            continue;
        }
        Token token;
        token.begin = i;
        while (i < n && !is_space(text[i])) ++i;
        token.end = i;
        tokens.push_back(token);
    }

    return tokens;
}

std::unique_ptr<Tokenizer> create_tokenizer(const std::string& name) {
    if (name == "word") {
        return std::make_unique<WordTokenizer>();
    }
    if (name == "whitespace") {
        return std::make_unique<WhitespaceTokenizer>();
    }
    throw std::invalid_argument("Unknown tokenizer: " + name);
}

} // namespace atlas
