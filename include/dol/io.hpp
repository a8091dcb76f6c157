// Source and Sink collaborators: where module text comes from and where the
// split files go.
#pragma once
#include "dol/emit.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dol {

class Source
{
public:
    virtual ~Source() = default;
    // Text of `<module>.dol`, std::nullopt when the module has no input file.
    virtual std::optional<std::string> read(const std::string& module) = 0;
};

class Sink
{
public:
    virtual ~Sink() = default;
    // Called once per module before its files are written.
    virtual void begin_module(const std::string& module) { (void)module; }
    virtual void write(const std::string& module, const EmittedFile& file) = 0;
};

class FileSystemSource : public Source
{
public:
    explicit FileSystemSource(std::filesystem::path root) : root_(std::move(root)) {}
    std::optional<std::string> read(const std::string& module) override;
    std::filesystem::path path_of(const std::string& module) const { return root_ / (module + ".dol"); }

private:
    std::filesystem::path root_;
};

// Writes <root>/<module>/<kind directory>/<filename>.dol, creating every kind
// directory of a module up front.
class FileSystemSink : public Sink
{
public:
    explicit FileSystemSink(std::filesystem::path root) : root_(std::move(root)) {}
    void begin_module(const std::string& module) override;
    void write(const std::string& module, const EmittedFile& file) override;

private:
    std::filesystem::path root_;
};

class MemorySource : public Source
{
public:
    MemorySource& add(std::string module, std::string text)
    {
        modules_[std::move(module)] = std::move(text);
        return *this;
    }
    std::optional<std::string> read(const std::string& module) override
    {
        auto it = modules_.find(module);
        if (it == modules_.end())
            return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, std::string> modules_;
};

// Keyed by "<module>/<path>"; a later file with the same key replaces the earlier one.
class MemorySink : public Sink
{
public:
    void begin_module(const std::string& module) override { modules.push_back(module); }
    void write(const std::string& module, const EmittedFile& file) override
    {
        files[module + "/" + file.path] = file.content;
        order.push_back(module + "/" + file.path);
    }

    std::vector<std::string> modules;
    std::map<std::string, std::string> files;
    std::vector<std::string> order;
};

} // namespace dol
