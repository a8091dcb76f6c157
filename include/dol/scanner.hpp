// Sequential declaration scanner: a small recursive-descent parser over the
// token stream of comment-free text.
#pragma once
#include "dol/declaration.hpp"
#include "dol/lexer.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace dol {

class Scanner
{
public:
    // `text` must already be comment-free and must outlive the scanner.
    explicit Scanner(std::string_view text);

    // Next declaration in source order, std::nullopt once no header remains.
    // Throws unterminated_block when a body or exegesis block never closes.
    std::optional<Declaration> next();

    // Offset just past the last byte consumed by a declaration.
    size_t cursor() const { return cursor_; }

private:
    std::string_view text_;
    std::vector<Token> toks_;
    size_t pos_ = 0;    // token index of the cursor
    size_t cursor_ = 0; // byte offset of the cursor

    std::optional<Declaration> parse_declaration(size_t& i);
    bool parse_name(size_t& i, std::string& name);
    std::optional<std::string_view> parse_exegesis(size_t& i);
    size_t skip_whitespace(size_t i) const;
    size_t token_at(size_t offset) const;
    size_t next_line_start(size_t i) const;
};

// Scan comment-free text to completion.
std::vector<Declaration> scan_all(std::string_view text);

} // namespace dol
