#include "dol/splitter.hpp"
#include "dol/comments.hpp"
#include "dol/scanner.hpp"

namespace dol {

std::vector<EmittedFile> split_text(std::string_view src)
{
    StrippedSource stripped = strip_comments(src);
    std::vector<EmittedFile> out;
    Scanner sc(stripped.text);
    while (auto d = sc.next())
        out.push_back(emit(*d));
    return out;
}

ModuleReport split_module(Source& source, Sink& sink, const std::string& module)
{
    ModuleReport rep;
    rep.module = module;
    auto text = source.read(module);
    if (!text)
        return rep;
    rep.found = true;
    auto files = split_text(*text);
    sink.begin_module(module);
    for (const auto& f : files)
    {
        sink.write(module, f);
        rep.created.push_back(module + "/" + f.path);
    }
    rep.declarations = files.size();
    return rep;
}

SplitReport split_modules(Source& source, Sink& sink, const std::vector<std::string>& modules, std::ostream* progress)
{
    SplitReport report;
    for (const auto& module : modules)
    {
        try
        {
            ModuleReport m = split_module(source, sink, module);
            if (!m.found)
            {
                report.warnings.push_back(Diagnostic{kMissingSource, "no input for module '" + module + "'", "expected " + module + ".dol", module, -1, -1});
                continue;
            }
            if (progress)
            {
                *progress << "\nSplitting " << module << ".dol:\n";
                for (const auto& path : m.created)
                    *progress << "  Created: " << path << "\n";
                *progress << "  Split into " << m.declarations << " files\n";
            }
            report.modules.push_back(std::move(m));
        }
        catch (const split_error& e)
        {
            report.success = false;
            report.errors.push_back(Diagnostic{e.code, e.what(), "module " + module + " was not split", module, e.line, e.col});
            if (progress)
                *progress << "\nSplitting " << module << ".dol:\n  error[" << e.code << "]: " << e.what() << "\n";
        }
    }
    if (progress)
        *progress << "\nTotal: " << report.total() << " individual .dol files created\n";
    return report;
}

} // namespace dol
