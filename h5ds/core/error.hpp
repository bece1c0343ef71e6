#pragma once

#include "h5ds/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: h5ds/core/error.hpp
// BRIEF: h5ds Exception System
// =============================================================================

namespace h5ds {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    RANGE_ERROR = 13,

    // Type errors
    TYPE_ERROR = 20,
    TYPE_MISMATCH = 21,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,

    // Datastore errors
    SCHEMA_ERROR = 60,
    UNKNOWN_VARIABLE = 61,
    DEGENERATE_VARIABLE = 62,
    EXHAUSTED = 63,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class H5DS_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class NullPointerError : public RuntimeError {
public:
    explicit NullPointerError(const std::string& msg = "Null pointer encountered")
        : RuntimeError(ErrorCode::NULL_POINTER, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal h5ds Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class TypeError : public Exception {
public:
    explicit TypeError(const std::string& msg)
        : Exception(ErrorCode::TYPE_ERROR, msg) {}

protected:
    explicit TypeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class TypeMismatchError : public TypeError {
public:
    explicit TypeMismatchError(const std::string& msg)
        : TypeError(ErrorCode::TYPE_MISMATCH, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg)
        : IOError(ErrorCode::READ_ERROR, msg) {}
};

// =============================================================================
// Datastore Errors
// =============================================================================

/// No baseline schema could be established: the file list is empty or a
/// file could not be opened or described.
class SchemaError : public Exception {
public:
    explicit SchemaError(const std::string& msg)
        : Exception(ErrorCode::SCHEMA_ERROR, msg) {}
};

/// A selection named variables that are not in the unified schema.
class UnknownVariableError : public ValueError {
public:
    explicit UnknownVariableError(std::vector<std::string> names)
        : ValueError(ErrorCode::UNKNOWN_VARIABLE, format(names)),
          names_(std::move(names)) {}

    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& {
        return names_;
    }

private:
    static auto format(const std::vector<std::string>& names) -> std::string {
        std::string msg = "Invalid variable names specified: ";
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += names[i];
        }
        return msg;
    }

    std::vector<std::string> names_;
};

/// A variable with zero bytes per row cannot be mapped to row windows.
class DegenerateVariableError : public Exception {
public:
    explicit DegenerateVariableError(const std::string& variable)
        : Exception(ErrorCode::DEGENERATE_VARIABLE,
                    "Variable '" + variable + "' has zero bytes per row"),
          variable_(variable) {}

    [[nodiscard]] auto variable() const noexcept -> const std::string& {
        return variable_;
    }

private:
    std::string variable_;
};

/// Read or next was called with no split left. Recoverable via reset().
class ExhaustedError : public RuntimeError {
public:
    explicit ExhaustedError(const std::string& msg = "No more data to read")
        : RuntimeError(ErrorCode::EXHAUSTED, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define H5DS_ASSERT(condition, msg) \
    do { \
        if (H5DS_UNLIKELY(!(condition))) { \
            throw h5ds::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define H5DS_CHECK_ARG(condition, msg) \
    do { \
        if (H5DS_UNLIKELY(!(condition))) { \
            throw h5ds::ValueError(msg); \
        } \
    } while(0)

// Validation for null pointers
#define H5DS_CHECK_NULL(ptr, msg) \
    do { \
        if (H5DS_UNLIKELY((ptr) == nullptr)) { \
            throw h5ds::NullPointerError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace h5ds
