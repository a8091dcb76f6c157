#include "dol/normalize.hpp"
#include "dol/env.hpp"
#include "dol/lexer.hpp"
#include "rules/actions.hpp"
#include <cstdio>

namespace dol {

namespace {

    using namespace rules;
    namespace g = rules::grammar;

    // Upper bound on rewrite rounds for one line; real input settles after one or two.
    // Rounds that lengthen a line (prefixes, default version) apply at most
    // once each; every other change shortens it.
    constexpr size_t kLengtheningRounds = 8;

    template <typename Target>
    std::optional<std::string> rewrite_everywhere(std::string_view s)
    {
        captures c;
        if (!match<g::rewrite_all<Target>>(s, c) || c.out == s)
            return std::nullopt;
        return c.out;
    }

    std::optional<std::string> dequalify_subject(std::string_view s)
    {
        captures c;
        if (!match<g::subject_clause>(s, c) || c.subject.find('.') == std::string::npos)
            return std::nullopt;
        return c.subject.substr(c.subject.rfind('.') + 1) + c.tail;
    }

    std::optional<std::string> uses_drop_subject(std::string_view s)
    {
        captures c;
        if (!match<g::uses_clause>(s, c))
            return std::nullopt;
        return "uses " + c.tail;
    }

    template <typename Lead>
    std::optional<std::string> prefix_when(std::string_view s, const char* prefix)
    {
        captures c;
        if (!match<Lead>(s, c))
            return std::nullopt;
        return std::string(prefix) + std::string(s);
    }

    std::optional<std::string> matches_reorder(std::string_view s)
    {
        captures c;
        if (!match<g::matches_clause>(s, c))
            return std::nullopt;
        return c.subject + " matches " + c.tail;
    }

    std::optional<std::string> system_requires_prefix(std::string_view s)
    {
        captures c;
        if (!match<g::system_requires>(s, c))
            return std::nullopt;
        return "requires " + c.tail;
    }

    std::optional<std::string> all_quantifier(std::string_view s)
    {
        captures c;
        if (!match<g::all_quantifier>(s, c))
            return std::nullopt;
        return c.subject + " is " + c.tail;
    }

    // 0.0.1 is the floor when no minimum version is given
    std::optional<std::string> requires_default_version(std::string_view s)
    {
        captures c;
        if (!match<g::unversioned_requires>(s, c))
            return std::nullopt;
        return "requires " + c.subject + " >= 0.0.1";
    }

    std::vector<LineRule> common_rules()
    {
        return {
            {"derive-from", rewrite_everywhere<g::derive_from>},
            {"bare-require", rewrite_everywhere<g::bare_require>},
            {"dequalify-subject", dequalify_subject},
        };
    }

    std::vector<LineRule> build_rules(DeclKind kind)
    {
        auto rules = common_rules();
        switch (kind)
        {
        case DeclKind::Gene:
            break;
        case DeclKind::Trait:
            rules.push_back({"uses-drop-subject", uses_drop_subject});
            rules.push_back({"emits-action", [](std::string_view s) { return prefix_when<g::emits_lead>(s, "action "); }});
            rules.push_back({"is-behavior", [](std::string_view s) { return prefix_when<g::is_lead>(s, "behavior "); }});
            break;
        case DeclKind::Constraint:
            rules.push_back({"matches-reorder", matches_reorder});
            rules.push_back({"never-invariant", [](std::string_view s) { return prefix_when<g::never_lead>(s, "invariant "); }});
            break;
        case DeclKind::System:
            rules.push_back({"system-requires-prefix", system_requires_prefix});
            rules.push_back({"all-quantifier", all_quantifier});
            rules.push_back({"requires-default-version", requires_default_version});
            break;
        }
        return rules;
    }

    bool passes_through(std::string_view line, size_t first)
    {
        return first == line.size() || line.compare(first, 2, "//") == 0;
    }

    std::string rewrite_round(std::string_view line, DeclKind kind)
    {
        size_t first = 0;
        while (first < line.size() && detail::is_space(line[first]))
            ++first;
        if (passes_through(line, first))
            return std::string(line);
        size_t last = line.size();
        while (last > first && detail::is_space(line[last - 1]))
            --last;
        std::string content(line.substr(first, last - first));
        const bool trace = detail::env_flag_enabled("DOL_DEBUG_NORMALIZE");
        for (const auto& rule : rules_for(kind))
        {
            if (auto out = rule.apply(content))
            {
                if (trace)
                    std::fprintf(stderr, "[dbg][normalize][%s] %s: '%s' -> '%s'\n", keyword_of(kind), rule.name, content.c_str(), out->c_str());
                content = std::move(*out);
            }
        }
        return std::string(line.substr(0, first)) + content;
    }

} // namespace

const std::vector<LineRule>& rules_for(DeclKind kind)
{
    static const std::vector<LineRule> tables[] = {
        build_rules(DeclKind::Gene),
        build_rules(DeclKind::Trait),
        build_rules(DeclKind::Constraint),
        build_rules(DeclKind::System),
    };
    return tables[static_cast<size_t>(kind)];
}

std::string normalize_line(std::string_view line, DeclKind kind)
{
    std::string current(line);
    const size_t max_rounds = line.size() + kLengtheningRounds;
    for (size_t round = 0; round < max_rounds; ++round)
    {
        std::string next = rewrite_round(current, kind);
        if (next == current)
            break;
        current = std::move(next);
    }
    return current;
}

std::string normalize_body(std::string_view body, DeclKind kind)
{
    std::string out;
    out.reserve(body.size() + 16);
    size_t start = 0;
    while (true)
    {
        size_t nl = body.find('\n', start);
        std::string_view line = body.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        out += normalize_line(line, kind);
        if (nl == std::string_view::npos)
            break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

} // namespace dol
