#include "dol/io.hpp"
#include "dol/env.hpp"
#include "dol/errors.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace dol {

std::optional<std::string> FileSystemSource::read(const std::string& module)
{
    auto path = path_of(module);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return std::nullopt;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw io_error("failed to open: " + path.string());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (detail::env_flag_enabled("DOL_DEBUG_IO"))
        std::fprintf(stderr, "[dbg][io] read %s (%zu bytes)\n", path.string().c_str(), oss.str().size());
    return oss.str();
}

void FileSystemSink::begin_module(const std::string& module)
{
    for (const auto& info : kKinds)
    {
        auto dir = root_ / module / info.directory;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw io_error("failed to create directory " + dir.string() + ": " + ec.message());
    }
}

void FileSystemSink::write(const std::string& module, const EmittedFile& file)
{
    auto path = root_ / module / file.path;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
        throw io_error("failed to open for writing: " + path.string());
    ofs << file.content;
    ofs.close();
    if (!ofs)
        throw io_error("failed to write: " + path.string());
    if (detail::env_flag_enabled("DOL_DEBUG_IO"))
        std::fprintf(stderr, "[dbg][io] wrote %s (%zu bytes)\n", path.string().c_str(), file.content.size());
}

} // namespace dol
