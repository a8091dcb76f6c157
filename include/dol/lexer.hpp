// Tokenizer for DOL source text. Tokens are views into the lexed text and
// concatenating their texts reproduces it byte for byte.
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dol {

enum class TokenKind { Word, Space, Newline, LBrace, RBrace, Comment, Punct };

struct Token
{
    TokenKind kind;
    std::string_view text;
    size_t offset = 0;
    int line = 1;
    int col = 1;

    bool is(TokenKind k) const { return kind == k; }
    bool is_punct(char c) const { return kind == TokenKind::Punct && text.size() == 1 && text[0] == c; }
    bool is_whitespace() const { return kind == TokenKind::Space || kind == TokenKind::Newline; }
    size_t end() const { return offset + text.size(); }
};

const char* to_string(TokenKind k);

namespace detail {
    inline bool is_word_char(char c)
    {
        unsigned char u = static_cast<unsigned char>(c);
        return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') || u == '_' || u >= 0x80;
    }
    inline bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }
    inline bool is_space(char c) { return is_blank(c) || c == '\n'; }
} // namespace detail

class Lexer
{
public:
    // The lexer does not copy its input; `src` must outlive the tokens.
    explicit Lexer(std::string_view src) : d_(src) {}

    bool eof() const { return p_ >= d_.size(); }
    Token next();
    std::vector<Token> tokenize();

private:
    std::string_view d_;
    size_t p_ = 0;
    int line_ = 1, col_ = 1;

    char peek(size_t ahead = 0) const { return p_ + ahead < d_.size() ? d_[p_ + ahead] : '\0'; }
    void advance();
};

inline std::vector<Token> tokenize(std::string_view src) { return Lexer(src).tokenize(); }

} // namespace dol
