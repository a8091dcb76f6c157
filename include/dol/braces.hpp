// Balanced brace extraction over comment-free text.
#pragma once
#include <cstddef>
#include <string_view>
#include <utility>

namespace dol {

struct BraceSpan
{
    std::string_view body; // strictly between the braces
    size_t open = 0;       // offset of '{'
    size_t close = 0;      // offset of the matching '}'
};

// `text[open]` must be '{'. Throws malformed_input otherwise and
// unterminated_block when the text ends before the brace is closed.
BraceSpan match_braces(std::string_view text, size_t open);

// 1-based line/column of a byte offset.
std::pair<int, int> line_col(std::string_view text, size_t offset);

} // namespace dol
