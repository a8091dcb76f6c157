#include "dol/lexer.hpp"

namespace dol {

const char* to_string(TokenKind k)
{
    switch (k)
    {
    case TokenKind::Word:
        return "word";
    case TokenKind::Space:
        return "space";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::LBrace:
        return "lbrace";
    case TokenKind::RBrace:
        return "rbrace";
    case TokenKind::Comment:
        return "comment";
    case TokenKind::Punct:
        return "punct";
    }
    return "?";
}

void Lexer::advance()
{
    if (eof())
        return;
    if (d_[p_++] == '\n')
    {
        ++line_;
        col_ = 1;
    }
    else
    {
        ++col_;
    }
}

Token Lexer::next()
{
    Token t{TokenKind::Punct, {}, p_, line_, col_};
    const size_t start = p_;
    char c = peek();
    if (c == '\n')
    {
        t.kind = TokenKind::Newline;
        advance();
    }
    else if (c == '{')
    {
        t.kind = TokenKind::LBrace;
        advance();
    }
    else if (c == '}')
    {
        t.kind = TokenKind::RBrace;
        advance();
    }
    else if (c == '/' && peek(1) == '/')
    {
        // runs to end of line; the newline belongs to the next token
        t.kind = TokenKind::Comment;
        while (!eof() && peek() != '\n')
            advance();
    }
    else if (detail::is_blank(c))
    {
        t.kind = TokenKind::Space;
        while (!eof() && detail::is_blank(peek()))
            advance();
    }
    else if (detail::is_word_char(c))
    {
        t.kind = TokenKind::Word;
        while (!eof() && detail::is_word_char(peek()))
            advance();
    }
    else
    {
        advance();
    }
    t.text = d_.substr(start, p_ - start);
    return t;
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> out;
    while (!eof())
        out.push_back(next());
    return out;
}

} // namespace dol
