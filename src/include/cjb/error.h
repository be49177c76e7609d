#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cjb {

// Base of every exception thrown by the binding.
struct Error : public std::runtime_error {
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// cJSON returned NULL where it allocates (create, print, duplicate).
struct AllocationError : public Error {
    explicit AllocationError(const std::string& what_failed)
        : Error("cJSON allocation failed: " + what_failed) {}
};

// The operation does not apply to the value's kind, or the input was rejected.
struct TypeMismatch : public Error {
    explicit TypeMismatch(const std::string& msg) : Error(msg) {}
};

// Index out of bounds or key missing.
struct NotFound : public TypeMismatch {
    explicit NotFound(const std::string& msg) : TypeMismatch(msg) {}
};

struct ParseError : public Error {
    // offset is the byte position where cJSON stopped; line and column are 1-based.
    ParseError(const std::string& msg, std::size_t offset, std::size_t line, std::size_t column)
        : Error(msg), offset(offset), line(line), column(column) {}

    std::size_t offset;
    std::size_t line;
    std::size_t column;
};

}  // namespace cjb
