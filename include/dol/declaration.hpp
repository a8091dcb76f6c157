// Declaration model: the four DOL declaration kinds and the unit of output.
#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace dol {

enum class DeclKind { Gene, Trait, Constraint, System };

// Keyword as written in source and the output directory the kind is split into.
struct KindInfo
{
    DeclKind kind;
    const char* keyword;
    const char* directory;
};

inline constexpr std::array<KindInfo, 4> kKinds{{
    {DeclKind::Gene, "gene", "genes"},
    {DeclKind::Trait, "trait", "traits"},
    {DeclKind::Constraint, "constraint", "constraints"},
    {DeclKind::System, "system", "systems"},
}};

inline const KindInfo& kind_info(DeclKind k) { return kKinds[static_cast<size_t>(k)]; }
inline const char* keyword_of(DeclKind k) { return kind_info(k).keyword; }
inline const char* directory_of(DeclKind k) { return kind_info(k).directory; }

inline std::optional<DeclKind> kind_from_keyword(std::string_view word)
{
    for (const auto& info : kKinds)
        if (word == info.keyword)
            return info.kind;
    return std::nullopt;
}

struct Declaration
{
    DeclKind kind = DeclKind::Gene;
    std::string name;     // trimmed header name, verbatim otherwise
    std::string body;     // text strictly inside the body braces
    std::string exegesis; // text strictly inside the exegesis braces, empty if absent
    bool has_exegesis = false;
    int line = -1; // position of the kind keyword
    int col = -1;
};

} // namespace dol
