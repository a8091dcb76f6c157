// Body normalizer: per-line rewriting of legacy clause forms into the
// canonical grammar, driven by an ordered rule table per declaration kind.
#pragma once
#include "dol/declaration.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dol {

struct LineRule
{
    const char* name;
    // Receives trimmed content; returns the rewrite or std::nullopt when the rule does not apply.
    std::function<std::optional<std::string>(std::string_view)> apply;
};

// Global rules, subject dequalification, then the kind's own rules.
const std::vector<LineRule>& rules_for(DeclKind kind);

// Blank and "//" lines pass through untouched. Other lines keep their leading
// indentation, lose trailing whitespace and are rewritten until stable.
std::string normalize_line(std::string_view line, DeclKind kind);

// Line count is preserved; normalize_body(normalize_body(b)) == normalize_body(b).
std::string normalize_body(std::string_view body, DeclKind kind);

} // namespace dol
