// Line comment elimination. Comments are removed from the text that gets
// scanned but kept on the side as metadata.
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace dol {

struct CommentSpan
{
    int line = -1;
    int col = -1;
    std::string text; // including the leading "//"
};

struct StrippedSource
{
    std::string text;                  // input minus every "//..." span, newlines kept
    std::vector<CommentSpan> comments; // in source order
};

StrippedSource strip_comments(std::string_view src);

} // namespace dol
