#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace jsxform {

// Invalid request option or malformed import map. Raised before parsing.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source text could not be tokenized or parsed at the requested target.
// Line and column are 1-based.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, uint32_t line, uint32_t column)
        : std::runtime_error(message + " (" + std::to_string(line) + ":" + std::to_string(column) + ")")
        , message_(message)
        , line_(line)
        , column_(column)
    {
    }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] uint32_t line() const noexcept { return line_; }
    [[nodiscard]] uint32_t column() const noexcept { return column_; }

private:
    std::string message_;
    uint32_t line_;
    uint32_t column_;
};

// The pipeline produced a tree or output it cannot serialize. Always a defect.
class EmitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Non-fatal: a specifier was left as written.
struct ResolutionWarning {
    std::string specifier;
    std::string message;
};

}  // namespace jsxform
