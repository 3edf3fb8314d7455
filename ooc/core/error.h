// =============================================================================
// FILE: ooc/core/error.h
// BRIEF: API reference for the OOC exception system
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include <exception>
#include <string>

namespace ooc {

// =============================================================================
// ERROR CODES
// =============================================================================

/* -----------------------------------------------------------------------------
 * ENUM: ErrorCode
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Numeric identifier carried by every ooc exception.
 *
 * VALUES:
 *     OK                     (0)  - No error
 *     UNKNOWN                (1)  - Generic failure
 *     INTERNAL_ERROR         (2)  - Broken internal invariant
 *     INVALID_ARGUMENT       (10) - Bad argument value
 *     PARSE_ERROR            (11) - Malformed input record or predicate
 *     UNKNOWN_COLUMN         (20) - Column name not in the schema
 *     DUPLICATE_NAME         (21) - Column name already taken
 *     TYPE_MISMATCH          (22) - Operand or value of the wrong type
 *     IO_ERROR               (30) - File system failure
 *     CORRUPT_METADATA       (31) - Dataset files disagree with metadata
 *     CONCURRENT_WRITE       (32) - Destination held by another writer
 *     MEMORY_BUDGET_EXCEEDED (40) - Result or join build side too large
 *     FEATURE_UNAVAILABLE    (50) - Optional feature not compiled in
 *
 * INVARIANTS:
 *     - OK is always zero
 *     - Related errors are grouped by tens
 * -------------------------------------------------------------------------- */
enum class ErrorCode : int32_t;

// =============================================================================
// EXCEPTION HIERARCHY
// =============================================================================

/* -----------------------------------------------------------------------------
 * CLASS: Exception
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Base of every exception thrown by ooc. Catch this to handle any
 *     library failure.
 *
 * METHODS:
 *     what()     Message text
 *     code()     ErrorCode
 *     message()  Message as std::string
 *
 * HIERARCHY:
 *     Exception
 *     +-- InternalError
 *     +-- ValueError
 *     |   +-- ParseError              line() gives the 1-based input line
 *     +-- SchemaError
 *     |   +-- UnknownColumnError      column() gives the name
 *     |   +-- DuplicateNameError      column() gives the name
 *     |   +-- TypeMismatchError
 *     +-- IOError
 *     |   +-- CorruptMetadataError
 *     |   +-- ConcurrentWriteError
 *     +-- MemoryBudgetExceededError   required() and budget() in bytes
 *     +-- FeatureUnavailableError
 * -------------------------------------------------------------------------- */
class Exception : public std::exception {};

// =============================================================================
// CHECK MACROS
// =============================================================================

/* -----------------------------------------------------------------------------
 * MACROS: OOC_ASSERT, OOC_CHECK_ARG, OOC_CHECK_IO
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Throw on a failed condition. Active in all builds.
 *
 *     OOC_ASSERT(cond, msg)     InternalError with file and line appended
 *     OOC_CHECK_ARG(cond, msg)  ValueError
 *     OOC_CHECK_IO(cond, msg)   IOError
 *
 * USAGE:
 *     OOC_CHECK_ARG(chunk_row_count > 0, "chunk_row_count must be positive");
 * -------------------------------------------------------------------------- */

} // namespace ooc
