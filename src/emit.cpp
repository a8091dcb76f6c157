#include "dol/emit.hpp"
#include "dol/errors.hpp"
#include "dol/normalize.hpp"
#include "rules/actions.hpp"
#include <algorithm>

namespace dol {

std::string sanitize_exegesis(std::string_view text)
{
    rules::captures c;
    c.out.reserve(text.size());
    if (!rules::match<rules::grammar::exegesis_text>(text, c, "exegesis"))
        throw malformed_input("exegesis text could not be sanitized");
    return c.out;
}

std::string derive_filename(std::string_view name)
{
    std::string out(name);
    std::replace_if(out.begin(), out.end(), [](char c) { return c == ' ' || c == '@' || c == '>' || c == '.'; }, '_');
    return out;
}

std::string render_declaration(DeclKind kind, std::string_view name, std::string_view body, std::string_view exegesis)
{
    std::string out;
    out.reserve(name.size() + body.size() + exegesis.size() + 32);
    out.append(keyword_of(kind)).append(" ").append(name).append(" {").append(body).append("}\n\n");
    out.append("exegesis {").append(exegesis).append("}\n");
    return out;
}

EmittedFile emit(const Declaration& d)
{
    EmittedFile f;
    f.kind = d.kind;
    f.name = d.name;
    f.path = std::string(directory_of(d.kind)) + "/" + derive_filename(d.name) + ".dol";
    f.content = render_declaration(d.kind, d.name, normalize_body(d.body, d.kind), sanitize_exegesis(d.exegesis));
    return f;
}

} // namespace dol
