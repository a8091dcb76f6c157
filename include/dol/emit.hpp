// Output side of the splitter: exegesis sanitizing, filename derivation and
// rendering of the canonical per-declaration file.
#pragma once
#include "dol/declaration.hpp"
#include <string>
#include <string_view>

namespace dol {

// "{word}" placeholders become "<word>"; every other brace becomes a parenthesis.
std::string sanitize_exegesis(std::string_view text);

// Space, '@', '>' and '.' become '_'. Distinct names may collide.
std::string derive_filename(std::string_view name);

// "<kind> <name> {<body>}\n\nexegesis {<exegesis>}\n"
std::string render_declaration(DeclKind kind, std::string_view name, std::string_view body, std::string_view exegesis);

struct EmittedFile
{
    DeclKind kind = DeclKind::Gene;
    std::string name;
    std::string path; // "<kind directory>/<filename>.dol"
    std::string content;
};

// Normalizes the body, sanitizes the exegesis and renders the file.
EmittedFile emit(const Declaration& d);

} // namespace dol
