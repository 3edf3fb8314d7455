#pragma once

#include "ooc/core/config.hpp"
#include "ooc/core/type.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: ooc/io/delimited.hpp
// BRIEF: Delimited flat file tokenizer, writer and column type inference
// =============================================================================

namespace ooc::io {

// =============================================================================
// SECTION 1: Reading
// =============================================================================

/// One logical record. `line` is the 1-based line where the record starts.
struct Record {
    std::vector<std::string> fields;
    std::vector<bool> quoted;
    std::size_t line = 0;

    void clear() {
        fields.clear();
        quoted.clear();
        line = 0;
    }
};

/// Pulls records from a stream. Quoted fields may span lines and contain
/// separators; a doubled quote is a literal quote. CRLF endings are
/// accepted and blank lines are skipped unless keep_blank_lines is set.
class RecordReader {
public:
    RecordReader(std::istream& in, char separator, char quote);

    /// Returns false at end of input. Throws ParseError on an unterminated
    /// quote and IOError if the stream fails.
    bool next(Record& out);

    OOC_NODISCARD std::size_t line() const noexcept { return line_; }

    /// Return a blank line as a record with one empty field. A one-column
    /// file writes an NA row that way.
    void keep_blank_lines(bool keep) noexcept { keep_blank_ = keep; }

private:
    int get();
    int peek();

    std::istream& in_;
    char sep_;
    char quote_;
    std::size_t line_ = 1;
    bool keep_blank_ = false;
};

// =============================================================================
// SECTION 2: Type Inference
// =============================================================================

/// Narrows the candidate type of one column as sample fields are observed.
/// Order of preference: integer, float, date, string.
class TypeGuesser {
public:
    void observe(std::string_view field);

    /// String (or categorical) when nothing but NA was observed.
    OOC_NODISCARD ColumnType result(bool strings_as_categorical) const noexcept;

private:
    bool can_integer_ = true;
    bool can_float_ = true;
    bool can_date_ = true;
    bool seen_ = false;
};

/// True when `field` is empty or listed in `na_strings`.
bool is_na_token(std::string_view field, const std::vector<std::string>& na_strings);

// =============================================================================
// SECTION 3: Writing
// =============================================================================

class DelimitedWriter {
public:
    DelimitedWriter(std::ostream& out, const WriteOptions& opts);

    void write_header(const std::vector<std::string>& names);
    void write_row(const Row& row);

    /// Throws IOError if the stream is in a failed state.
    void flush();

private:
    void write_field(std::string_view text);

    std::ostream& out_;
    WriteOptions opts_;
};

} // namespace ooc::io
