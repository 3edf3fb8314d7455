#pragma once

#include "ooc/core/macros.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: ooc/core/error.hpp
// BRIEF: OOC Exception System
// =============================================================================

namespace ooc {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,

    // Argument errors
    INVALID_ARGUMENT = 10,
    PARSE_ERROR = 11,

    // Schema errors
    UNKNOWN_COLUMN = 20,
    DUPLICATE_NAME = 21,
    TYPE_MISMATCH = 22,

    // I/O errors
    IO_ERROR = 30,
    CORRUPT_METADATA = 31,
    CONCURRENT_WRITE = 32,

    // Resource errors
    MEMORY_BUDGET_EXCEEDED = 40,

    // Feature errors
    FEATURE_UNAVAILABLE = 50,
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::UNKNOWN:                return "UNKNOWN";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
        case ErrorCode::INVALID_ARGUMENT:       return "INVALID_ARGUMENT";
        case ErrorCode::PARSE_ERROR:            return "PARSE_ERROR";
        case ErrorCode::UNKNOWN_COLUMN:         return "UNKNOWN_COLUMN";
        case ErrorCode::DUPLICATE_NAME:         return "DUPLICATE_NAME";
        case ErrorCode::TYPE_MISMATCH:          return "TYPE_MISMATCH";
        case ErrorCode::IO_ERROR:               return "IO_ERROR";
        case ErrorCode::CORRUPT_METADATA:       return "CORRUPT_METADATA";
        case ErrorCode::CONCURRENT_WRITE:       return "CONCURRENT_WRITE";
        case ErrorCode::MEMORY_BUDGET_EXCEEDED: return "MEMORY_BUDGET_EXCEEDED";
        case ErrorCode::FEATURE_UNAVAILABLE:    return "FEATURE_UNAVAILABLE";
        default:                                return "UNKNOWN";
    }
}

// =============================================================================
// Base Exception Class
// =============================================================================

class OOC_EXPORT Exception : public std::exception {
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

class InternalError : public Exception {
public:
    explicit InternalError(const std::string& msg)
        : Exception(ErrorCode::INTERNAL_ERROR, "Internal OOC Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

/// Malformed input record or predicate text. `line()` is 1-based; 0 means
/// the location is unknown.
class ParseError : public ValueError {
public:
    ParseError(const std::string& msg, std::size_t line)
        : ValueError(ErrorCode::PARSE_ERROR, format(msg, line)), line_(line) {}

    [[nodiscard]] auto line() const noexcept -> std::size_t {
        return line_;
    }

private:
    static auto format(const std::string& msg, std::size_t line) -> std::string {
        if (line == 0) {
            return msg;
        }
        return "line " + std::to_string(line) + ": " + msg;
    }

    std::size_t line_;
};

class SchemaError : public Exception {
protected:
    SchemaError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class UnknownColumnError : public SchemaError {
public:
    explicit UnknownColumnError(const std::string& column)
        : SchemaError(ErrorCode::UNKNOWN_COLUMN, "Unknown column: '" + column + "'"),
          column_(column) {}

    [[nodiscard]] auto column() const noexcept -> const std::string& {
        return column_;
    }

private:
    std::string column_;
};

class DuplicateNameError : public SchemaError {
public:
    explicit DuplicateNameError(const std::string& column)
        : SchemaError(ErrorCode::DUPLICATE_NAME, "Duplicate column name: '" + column + "'"),
          column_(column) {}

    [[nodiscard]] auto column() const noexcept -> const std::string& {
        return column_;
    }

private:
    std::string column_;
};

class TypeMismatchError : public SchemaError {
public:
    explicit TypeMismatchError(const std::string& msg)
        : SchemaError(ErrorCode::TYPE_MISMATCH, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class CorruptMetadataError : public IOError {
public:
    explicit CorruptMetadataError(const std::string& msg)
        : IOError(ErrorCode::CORRUPT_METADATA, "Corrupt dataset metadata: " + msg) {}
};

class ConcurrentWriteError : public IOError {
public:
    explicit ConcurrentWriteError(const std::string& destination)
        : IOError(ErrorCode::CONCURRENT_WRITE,
                  "Another writer is active on destination: " + destination) {}
};

class MemoryBudgetExceededError : public Exception {
public:
    MemoryBudgetExceededError(const std::string& what_for, std::size_t required, std::size_t budget)
        : Exception(ErrorCode::MEMORY_BUDGET_EXCEEDED,
                    what_for + " needs more than " + std::to_string(budget) +
                    " bytes (reached " + std::to_string(required) + ")"),
          required_(required), budget_(budget) {}

    [[nodiscard]] auto required() const noexcept -> std::size_t { return required_; }
    [[nodiscard]] auto budget() const noexcept -> std::size_t { return budget_; }

private:
    std::size_t required_;
    std::size_t budget_;
};

class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(const std::string& msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

// Assertion for internal invariants (active in all builds)
#define OOC_ASSERT(condition, msg) \
    do { \
        if (OOC_UNLIKELY(!(condition))) { \
            throw ::ooc::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define OOC_CHECK_ARG(condition, msg) \
    do { \
        if (OOC_UNLIKELY(!(condition))) { \
            throw ::ooc::ValueError(msg); \
        } \
    } while(0)

// Validation for system calls and stream states
#define OOC_CHECK_IO(condition, msg) \
    do { \
        if (OOC_UNLIKELY(!(condition))) { \
            throw ::ooc::IOError(msg); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace ooc
