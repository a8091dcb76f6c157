#include "dol/braces.hpp"
#include "dol/errors.hpp"
#include <string>

namespace dol {

std::pair<int, int> line_col(std::string_view text, size_t offset)
{
    int line = 1, col = 1;
    for (size_t i = 0; i < offset && i < text.size(); ++i)
    {
        if (text[i] == '\n')
        {
            ++line;
            col = 1;
        }
        else
        {
            ++col;
        }
    }
    return {line, col};
}

BraceSpan match_braces(std::string_view text, size_t open)
{
    if (open >= text.size())
        throw malformed_input("expected '{' at offset " + std::to_string(open) + ", found end of text");
    if (text[open] != '{')
    {
        auto [l, c] = line_col(text, open);
        throw malformed_input("expected '{' at offset " + std::to_string(open) + ", found '" + std::string(1, text[open]) + "'", l, c);
    }
    size_t depth = 0;
    for (size_t i = open; i < text.size(); ++i)
    {
        if (text[i] == '{')
            ++depth;
        else if (text[i] == '}' && --depth == 0)
            return BraceSpan{text.substr(open + 1, i - open - 1), open, i};
    }
    auto [l, c] = line_col(text, open);
    throw unterminated_block("unterminated block: '{' at line " + std::to_string(l) + " has no matching '}'", l, c);
}

} // namespace dol
