#include "ooc/io/delimited.hpp"
#include "ooc/core/error.hpp"

#include <algorithm>

namespace ooc::io {

// =============================================================================
// RecordReader
// =============================================================================

RecordReader::RecordReader(std::istream& in, char separator, char quote)
    : in_(in), sep_(separator), quote_(quote)
{
    OOC_CHECK_ARG(separator != quote, "Separator and quote character must differ");
    OOC_CHECK_ARG(separator != '\n' && separator != '\r', "Separator cannot be a line break");
}

int RecordReader::get() {
    return in_.get();
}

int RecordReader::peek() {
    return in_.peek();
}

bool RecordReader::next(Record& out) {
    out.clear();

    // Skip blank lines
    for (;;) {
        int c = peek();
        if (c == std::char_traits<char>::eof()) {
            OOC_CHECK_IO(!in_.bad(), "Failed to read input stream");
            return false;
        }
        if (keep_blank_ && (c == '\n' || c == '\r')) {
            out.line = line_;
            get();
            if (c == '\r' && peek() == '\n') get();
            ++line_;
            out.fields.emplace_back();
            out.quoted.push_back(false);
            return true;
        }
        if (c == '\n') {
            get();
            ++line_;
            continue;
        }
        if (c == '\r') {
            get();
            if (peek() == '\n') get();
            ++line_;
            continue;
        }
        break;
    }

    out.line = line_;

    enum class State { FieldStart, Unquoted, Quoted, AfterQuote };
    State state = State::FieldStart;
    std::string field;
    bool quoted = false;

    auto push = [&] {
        out.fields.push_back(std::move(field));
        out.quoted.push_back(quoted);
        field.clear();
        quoted = false;
    };

    auto end_of_line = [&](char ch) {
        if (ch == '\r' && peek() == '\n') get();
        ++line_;
        push();
    };

    for (;;) {
        int c = get();
        if (c == std::char_traits<char>::eof()) {
            OOC_CHECK_IO(!in_.bad(), "Failed to read input stream");
            if (state == State::Quoted) {
                throw ParseError("unterminated quoted field", out.line);
            }
            push();
            return true;
        }
        const char ch = static_cast<char>(c);

        switch (state) {
            case State::FieldStart:
                if (ch == quote_) {
                    state = State::Quoted;
                    quoted = true;
                    break;
                }
                [[fallthrough]];
            case State::Unquoted:
                if (ch == sep_) {
                    push();
                    state = State::FieldStart;
                } else if (ch == '\n' || ch == '\r') {
                    end_of_line(ch);
                    return true;
                } else {
                    field += ch;
                    state = State::Unquoted;
                }
                break;
            case State::Quoted:
                if (ch == quote_) {
                    if (peek() == quote_) {
                        get();
                        field += quote_;
                    } else {
                        state = State::AfterQuote;
                    }
                } else {
                    if (ch == '\n') ++line_;
                    field += ch;
                }
                break;
            case State::AfterQuote:
                if (ch == sep_) {
                    push();
                    state = State::FieldStart;
                } else if (ch == '\n' || ch == '\r') {
                    end_of_line(ch);
                    return true;
                } else {
                    throw ParseError("unexpected character after closing quote", out.line);
                }
                break;
        }
    }
}

// =============================================================================
// Type Inference
// =============================================================================

void TypeGuesser::observe(std::string_view field) {
    seen_ = true;
    if (can_integer_ && !parse_value(field, ColumnType::Integer)) {
        can_integer_ = false;
    }
    if (!can_integer_ && can_float_ && !parse_value(field, ColumnType::Float)) {
        can_float_ = false;
    }
    if (can_date_ && !parse_value(field, ColumnType::Date)) {
        can_date_ = false;
    }
}

ColumnType TypeGuesser::result(bool strings_as_categorical) const noexcept {
    const ColumnType text = strings_as_categorical ? ColumnType::Categorical : ColumnType::String;
    if (!seen_) return text;
    if (can_integer_) return ColumnType::Integer;
    if (can_float_) return ColumnType::Float;
    if (can_date_) return ColumnType::Date;
    return text;
}

bool is_na_token(std::string_view field, const std::vector<std::string>& na_strings) {
    if (field.empty()) return true;
    return std::find(na_strings.begin(), na_strings.end(), field) != na_strings.end();
}

// =============================================================================
// DelimitedWriter
// =============================================================================

DelimitedWriter::DelimitedWriter(std::ostream& out, const WriteOptions& opts)
    : out_(out), opts_(opts)
{
    OOC_CHECK_ARG(opts.separator != opts.quote, "Separator and quote character must differ");
}

void DelimitedWriter::write_field(std::string_view text) {
    bool needs_quote = false;
    for (char c : text) {
        if (c == opts_.separator || c == opts_.quote || c == '\n' || c == '\r') {
            needs_quote = true;
            break;
        }
    }
    if (!needs_quote) {
        out_ << text;
        return;
    }
    out_.put(opts_.quote);
    for (char c : text) {
        if (c == opts_.quote) out_.put(opts_.quote);
        out_.put(c);
    }
    out_.put(opts_.quote);
}

void DelimitedWriter::write_header(const std::vector<std::string>& names) {
    if (!opts_.header) return;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out_.put(opts_.separator);
        write_field(names[i]);
    }
    out_.put('\n');
}

void DelimitedWriter::write_row(const Row& row) {
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out_.put(opts_.separator);
        const auto* text = std::get_if<std::string>(&row[i]);
        if (text != nullptr && text->empty()) {
            // Quoted so it reads back as an empty string, not NA
            out_.put(opts_.quote);
            out_.put(opts_.quote);
            continue;
        }
        write_field(format_value(row[i]));
    }
    out_.put('\n');
    OOC_CHECK_IO(out_.good(), "Failed to write delimited output");
}

void DelimitedWriter::flush() {
    out_.flush();
    OOC_CHECK_IO(out_.good(), "Failed to flush delimited output");
}

} // namespace ooc::io
