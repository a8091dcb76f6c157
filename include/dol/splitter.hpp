// Pipeline glue: comment elimination -> scanning -> normalizing/emitting ->
// sink, for one text, one module or a list of modules.
#pragma once
#include "dol/emit.hpp"
#include "dol/errors.hpp"
#include "dol/io.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace dol {

inline const std::vector<std::string>& default_modules()
{
    static const std::vector<std::string> mods{"container", "state", "cluster", "api", "events"};
    return mods;
}

// Every declaration of `src` as a canonical file, in source order. The whole
// text is scanned before returning; extraction errors propagate.
std::vector<EmittedFile> split_text(std::string_view src);

struct ModuleReport
{
    std::string module;
    bool found = false;
    size_t declarations = 0;
    std::vector<std::string> created; // "<module>/<kind directory>/<filename>.dol"
};

struct SplitReport
{
    bool success = true;
    std::vector<ModuleReport> modules;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;

    size_t total() const
    {
        size_t n = 0;
        for (const auto& m : modules)
            n += m.declarations;
        return n;
    }
};

// Nothing reaches the sink when the module's text fails to split.
ModuleReport split_module(Source& source, Sink& sink, const std::string& module);

// Missing modules are skipped with a warning; a module that fails is recorded
// as an error and the run continues with the next one. Progress lines go to
// `progress` when given.
SplitReport split_modules(Source& source, Sink& sink, const std::vector<std::string>& modules, std::ostream* progress = nullptr);

} // namespace dol
