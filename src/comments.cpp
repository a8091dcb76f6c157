#include "dol/comments.hpp"
#include "dol/lexer.hpp"

namespace dol {

StrippedSource strip_comments(std::string_view src)
{
    StrippedSource out;
    out.text.reserve(src.size());
    Lexer lx(src);
    while (!lx.eof())
    {
        Token t = lx.next();
        if (t.is(TokenKind::Comment))
        {
            out.comments.push_back(CommentSpan{t.line, t.col, std::string(t.text)});
            continue;
        }
        out.text.append(t.text);
    }
    return out;
}

} // namespace dol
