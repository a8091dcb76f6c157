// Error taxonomy and diagnostics shared by the scanner, splitter and tool.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace dol {

// Diagnostic codes
inline constexpr const char* kUnterminatedBlock = "E0101";
inline constexpr const char* kMalformedInput = "E0102";
inline constexpr const char* kIoFailure = "E0301";
inline constexpr const char* kMissingSource = "W0201";

struct split_error : std::runtime_error
{
    split_error(std::string code, const std::string& message, int line = -1, int col = -1)
        : std::runtime_error(message), code(std::move(code)), line(line), col(col) {}
    std::string code;
    int line;
    int col;
};

// A '{' with no matching '}' before end of text.
struct unterminated_block : split_error
{
    unterminated_block(const std::string& message, int line, int col)
        : split_error(kUnterminatedBlock, message, line, col) {}
};

// Brace matcher invoked on something that is not '{' (scanner contract violation).
struct malformed_input : split_error
{
    malformed_input(const std::string& message, int line = -1, int col = -1)
        : split_error(kMalformedInput, message, line, col) {}
};

struct io_error : split_error
{
    explicit io_error(const std::string& message)
        : split_error(kIoFailure, message) {}
};

struct Diagnostic
{
    std::string code;
    std::string message;
    std::string hint;
    std::string module;
    int line = -1;
    int col = -1;
};

} // namespace dol
