#include "dol/scanner.hpp"
#include "dol/braces.hpp"
#include "dol/env.hpp"
#include <algorithm>
#include <cstdio>

namespace dol {

namespace {

    bool is_name_token(const Token& t)
    {
        return t.is(TokenKind::Word) || t.is_whitespace() || t.is_punct('.') || t.is_punct('@') || t.is_punct('>');
    }

    std::string trim(std::string_view s)
    {
        size_t a = 0, b = s.size();
        while (a < b && detail::is_space(s[a]))
            ++a;
        while (b > a && detail::is_space(s[b - 1]))
            --b;
        return std::string(s.substr(a, b - a));
    }

} // namespace

Scanner::Scanner(std::string_view text) : text_(text), toks_(tokenize(text)) {}

size_t Scanner::skip_whitespace(size_t i) const
{
    while (i < toks_.size() && toks_[i].is_whitespace())
        ++i;
    return i;
}

// Index of the token starting at `offset`; tokens cover the text contiguously.
size_t Scanner::token_at(size_t offset) const
{
    auto it = std::lower_bound(toks_.begin(), toks_.end(), offset,
                               [](const Token& t, size_t off) { return t.offset < off; });
    return static_cast<size_t>(it - toks_.begin());
}

size_t Scanner::next_line_start(size_t i) const
{
    while (i < toks_.size() && !toks_[i].is(TokenKind::Newline))
        ++i;
    return i < toks_.size() ? i + 1 : i;
}

std::optional<Declaration> Scanner::next()
{
    // The cursor counts as a line start, as does the token after every newline.
    size_t i = pos_;
    while (i < toks_.size())
    {
        size_t head = skip_whitespace(i);
        if (head >= toks_.size())
            break;
        size_t j = head;
        if (auto decl = parse_declaration(j))
        {
            pos_ = j;
            cursor_ = j < toks_.size() ? toks_[j].offset : text_.size();
            return decl;
        }
        i = next_line_start(head);
    }
    pos_ = toks_.size();
    return std::nullopt;
}

// header := kind-keyword whitespace+ name-run '{'
std::optional<Declaration> Scanner::parse_declaration(size_t& i)
{
    const Token& kw = toks_[i];
    if (!kw.is(TokenKind::Word))
        return std::nullopt;
    auto kind = kind_from_keyword(kw.text);
    if (!kind)
        return std::nullopt;
    size_t j = i + 1;
    if (j >= toks_.size() || !toks_[j].is_whitespace())
        return std::nullopt;
    Declaration d;
    d.kind = *kind;
    d.line = kw.line;
    d.col = kw.col;
    if (!parse_name(j, d.name))
        return std::nullopt;

    const Token& open = toks_[j];
    BraceSpan body = match_braces(text_, open.offset);
    d.body = std::string(body.body);
    j = token_at(body.close + 1);

    size_t k = j;
    if (auto ex = parse_exegesis(k))
    {
        d.exegesis = std::string(*ex);
        d.has_exegesis = true;
        j = k;
    }
    if (detail::env_flag_enabled("DOL_DEBUG_SCAN"))
        std::fprintf(stderr, "[dbg][scan] %s '%s' line=%d body=%zu exegesis=%s\n", keyword_of(d.kind), d.name.c_str(), d.line, d.body.size(), d.has_exegesis ? "yes" : "no");
    i = j;
    return d;
}

// Name tokens run lazily up to the first '{'; anything else rejects the header.
// A blank name is accepted once at least two whitespace bytes separate the
// keyword from the '{' ("gene  {" yes, "gene {" no).
bool Scanner::parse_name(size_t& i, std::string& name)
{
    size_t b = i;
    while (i < toks_.size() && !toks_[i].is(TokenKind::LBrace))
    {
        if (!is_name_token(toks_[i]))
            return false;
        ++i;
    }
    if (i >= toks_.size())
        return false;
    size_t from = toks_[b].offset;
    name = trim(text_.substr(from, toks_[i].offset - from));
    return !name.empty() || toks_[i].offset - from >= 2;
}

// exegesis := whitespace* "exegesis" whitespace* '{' ... '}'
std::optional<std::string_view> Scanner::parse_exegesis(size_t& i)
{
    size_t j = skip_whitespace(i);
    if (j >= toks_.size() || !toks_[j].is(TokenKind::Word) || toks_[j].text != "exegesis")
        return std::nullopt;
    j = skip_whitespace(j + 1);
    if (j >= toks_.size() || !toks_[j].is(TokenKind::LBrace))
        return std::nullopt;
    BraceSpan span = match_braces(text_, toks_[j].offset);
    i = token_at(span.close + 1);
    return span.body;
}

std::vector<Declaration> scan_all(std::string_view text)
{
    std::vector<Declaration> out;
    Scanner sc(text);
    while (auto d = sc.next())
        out.push_back(std::move(*d));
    return out;
}

} // namespace dol
