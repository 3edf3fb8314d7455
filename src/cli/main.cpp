// =============================================================================
// FILE: src/cli/main.cpp
// BRIEF: `ooc` command-line front end: import, describe, query, export
// =============================================================================

#include "ooc/config.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"
#include "ooc/exec/executor.hpp"
#include "ooc/query/plan.hpp"
#include "ooc/store/chunk_store.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::uint64_t kDefaultChunkRows = 100000;

/// Bad command line; reported with exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Help
// =============================================================================

void print_help(const char* prog_name) {
    std::printf(R"(
OOC %s - out-of-core tabular engine

Usage:
  %s import <input.csv> <dataset-dir> [options]
      --chunk-rows <n>      Rows per chunk (default %llu)
      --sep <c>             Field separator, "tab" for a tab (default ,)
      --no-header           First record is data; columns are V1..Vn
      --type <name=type>    Column type: integer|float|string|categorical|date
      --categorical         Inferred string columns become categorical
      --na <token>          Extra token read as NA
      --codec <none|zstd>   Chunk compression (default none)

  %s describe <dataset-dir>

  %s query <dataset-dir> [operations] [output]
      --filter <expr>       Keep rows where expr is true
      --select <a,b,c>      Keep and reorder columns
      --join <dir:key>      Inner join with another dataset on key
      --head <n>            Keep the first n rows
    Operations apply in the order given.
      --out <dir>           Write the result as a new dataset
      --csv <file>          Write the result as a delimited file (default stdout)
      --sep <c>             Separator for delimited output
      --memory-budget <b>   Byte budget for join build sides
      --explain             Print the physical pipeline instead of running

  %s export <dataset-dir> <out.csv> [--sep <c>] [--no-header]

Environment Variables:
  OOC_LOG_LEVEL           debug|info|warn|error|off (default warn)

Exit status: 0 on success, 1 on a runtime error, 2 on a usage error.

)",
        OOC_VERSION_STRING, prog_name, static_cast<unsigned long long>(kDefaultChunkRows),
        prog_name, prog_name, prog_name);
}

// =============================================================================
// Argument Helpers
// =============================================================================

class Args {
public:
    Args(int argc, char* argv[], int first) : argc_(argc), argv_(argv), pos_(first) {}

    bool done() const noexcept { return pos_ >= argc_; }
    const char* peek() const noexcept { return argv_[pos_]; }
    const char* take() noexcept { return argv_[pos_++]; }

    const char* value(const char* flag) {
        if (done()) {
            throw UsageError(std::string("Option ") + flag + " needs a value");
        }
        return take();
    }

    const char* positional(const char* what) {
        if (done() || (peek()[0] == '-' && peek()[1] != '\0')) {
            throw UsageError(std::string("Missing ") + what);
        }
        return take();
    }

private:
    int argc_;
    char** argv_;
    int pos_;
};

std::uint64_t parse_count(const char* text, const char* flag) {
    std::uint64_t v = 0;
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, v);
    if (ec != std::errc() || ptr != end) {
        throw UsageError(std::string("Option ") + flag + " expects a non-negative integer, got '" +
                         text + "'");
    }
    return v;
}

char parse_separator(const char* text) {
    if (std::strcmp(text, "tab") == 0 || std::strcmp(text, "\\t") == 0) {
        return '\t';
    }
    if (std::strlen(text) != 1) {
        throw UsageError(std::string("Separator must be one character, got '") + text + "'");
    }
    return text[0];
}

std::vector<std::string> split_names(const char* text) {
    std::vector<std::string> out;
    std::string_view rest(text);
    for (;;) {
        const auto comma = rest.find(',');
        out.emplace_back(rest.substr(0, comma));
        if (out.back().empty()) {
            throw UsageError(std::string("Empty column name in '") + text + "'");
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return out;
}

[[noreturn]] void unknown_option(const char* arg) {
    throw UsageError(std::string("Unknown option: ") + arg);
}

/// Remove a partial dataset left by a failed write. The original error is
/// the one reported, so a cleanup failure is only logged.
void discard_quietly(const ooc::ChunkStore& store, const std::filesystem::path& destination) {
    try {
        store.discard(destination);
    } catch (const ooc::Exception& e) {
        OOC_LOG_WARN("Could not remove partial dataset %s: %s", destination.c_str(), e.what());
    }
}

// =============================================================================
// import
// =============================================================================

int cmd_import(Args& args) {
    const std::filesystem::path input = args.positional("input file");
    const std::filesystem::path destination = args.positional("dataset directory");

    std::uint64_t chunk_rows = kDefaultChunkRows;
    ooc::ReadOptions opts;
    ooc::StoreConfig config;

    while (!args.done()) {
        const char* arg = args.take();
        if (std::strcmp(arg, "--chunk-rows") == 0) {
            chunk_rows = parse_count(args.value(arg), arg);
            if (chunk_rows == 0) {
                throw UsageError("--chunk-rows must be positive");
            }
        }
        else if (std::strcmp(arg, "--sep") == 0) {
            opts.separator = parse_separator(args.value(arg));
        }
        else if (std::strcmp(arg, "--no-header") == 0) {
            opts.header = false;
        }
        else if (std::strcmp(arg, "--type") == 0) {
            const std::string assignment = args.value(arg);
            const auto eq = assignment.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw UsageError("--type expects name=type, got '" + assignment + "'");
            }
            try {
                opts.column_types[assignment.substr(0, eq)] = ooc::parse_type_name(assignment.substr(eq + 1));
            } catch (const ooc::ValueError& e) {
                throw UsageError(e.message());
            }
        }
        else if (std::strcmp(arg, "--categorical") == 0) {
            opts.strings_as_categorical = true;
        }
        else if (std::strcmp(arg, "--na") == 0) {
            opts.na_strings.emplace_back(args.value(arg));
        }
        else if (std::strcmp(arg, "--codec") == 0) {
            try {
                config.codec = ooc::parse_codec(args.value(arg));
            } catch (const ooc::ValueError& e) {
                throw UsageError(e.message());
            }
        }
        else {
            unknown_option(arg);
        }
    }

    ooc::ChunkStore store(config);
    std::error_code ec;
    const bool existed = std::filesystem::exists(store.resolve(destination), ec);
    try {
        ooc::Dataset ds = store.create_from_file(input, chunk_rows, destination, opts);
        std::printf("imported %llu rows in %zu chunks into %s\n",
                    static_cast<unsigned long long>(ds.row_count()), ds.chunk_count(),
                    ds.directory().c_str());
    } catch (const ooc::Exception&) {
        if (!existed) {
            discard_quietly(store, destination);
        }
        throw;
    }
    return 0;
}

// =============================================================================
// describe
// =============================================================================

int cmd_describe(Args& args) {
    const std::filesystem::path dir = args.positional("dataset directory");
    if (!args.done()) {
        unknown_option(args.peek());
    }

    const ooc::Dataset ds = ooc::ChunkStore().open_existing(dir);
    const auto& d = ds.describe();
    std::printf("dataset  %s\n", ds.directory().c_str());
    std::printf("rows     %llu\n", static_cast<unsigned long long>(d.row_count));
    std::printf("chunks   %zu (capacity %llu rows, codec %s)\n", d.chunk_count,
                static_cast<unsigned long long>(ds.chunk_row_capacity()),
                ooc::codec_name(ds.index().codec()));
    std::printf("columns  %zu\n", d.column_count);
    for (std::size_t i = 0; i < d.column_count; ++i) {
        std::printf("  %-24s %s\n", d.column_names[i].c_str(), ooc::type_name(d.column_types[i]));
    }
    return 0;
}

// =============================================================================
// query
// =============================================================================

int cmd_query(Args& args) {
    const std::filesystem::path dir = args.positional("dataset directory");

    ooc::ChunkStore store;
    ooc::query::QueryPlan plan = ooc::query::QueryPlan::scan(store.open_existing(dir));

    ooc::ExecConfig exec_config;
    ooc::WriteOptions write_opts;
    const char* out_dir = nullptr;
    const char* csv_file = nullptr;
    bool explain = false;

    while (!args.done()) {
        const char* arg = args.take();
        if (std::strcmp(arg, "--filter") == 0) {
            plan = plan.filter(std::string_view(args.value(arg)));
        }
        else if (std::strcmp(arg, "--select") == 0) {
            plan = plan.select(split_names(args.value(arg)));
        }
        else if (std::strcmp(arg, "--join") == 0) {
            const std::string target = args.value(arg);
            const auto colon = target.rfind(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
                throw UsageError("--join expects dir:key, got '" + target + "'");
            }
            plan = plan.join(store.open_existing(target.substr(0, colon)), target.substr(colon + 1));
        }
        else if (std::strcmp(arg, "--head") == 0) {
            plan = plan.head(parse_count(args.value(arg), arg));
        }
        else if (std::strcmp(arg, "--out") == 0) {
            out_dir = args.value(arg);
        }
        else if (std::strcmp(arg, "--csv") == 0) {
            csv_file = args.value(arg);
        }
        else if (std::strcmp(arg, "--sep") == 0) {
            write_opts.separator = parse_separator(args.value(arg));
        }
        else if (std::strcmp(arg, "--memory-budget") == 0) {
            exec_config.join_memory_budget = parse_count(args.value(arg), arg);
        }
        else if (std::strcmp(arg, "--explain") == 0) {
            explain = true;
        }
        else {
            unknown_option(arg);
        }
    }
    if (out_dir != nullptr && csv_file != nullptr) {
        throw UsageError("--out and --csv are mutually exclusive");
    }

    const ooc::exec::Executor executor(exec_config);
    if (explain) {
        std::printf("%s\n", executor.explain(plan).c_str());
        return 0;
    }

    if (out_dir != nullptr) {
        std::error_code ec;
        const bool existed = std::filesystem::exists(store.resolve(out_dir), ec);
        try {
            const ooc::Dataset ds = executor.compute_to_chunk_store(plan, out_dir);
            std::printf("wrote %llu rows in %zu chunks to %s\n",
                        static_cast<unsigned long long>(ds.row_count()), ds.chunk_count(),
                        ds.directory().c_str());
        } catch (const ooc::Exception&) {
            if (!existed) {
                discard_quietly(store, out_dir);
            }
            throw;
        }
        return 0;
    }

    if (csv_file != nullptr) {
        std::ofstream out(csv_file, std::ios::binary | std::ios::trunc);
        OOC_CHECK_IO(out.is_open(), std::string("Failed to open output file: ") + csv_file);
        const auto rows = executor.write_delimited(plan, out, write_opts);
        OOC_LOG_INFO("query: wrote %llu rows to %s", static_cast<unsigned long long>(rows), csv_file);
        return 0;
    }

    executor.write_delimited(plan, std::cout, write_opts);
    return 0;
}

// =============================================================================
// export
// =============================================================================

int cmd_export(Args& args) {
    const std::filesystem::path dir = args.positional("dataset directory");
    const std::filesystem::path file = args.positional("output file");

    ooc::WriteOptions opts;
    while (!args.done()) {
        const char* arg = args.take();
        if (std::strcmp(arg, "--sep") == 0) {
            opts.separator = parse_separator(args.value(arg));
        }
        else if (std::strcmp(arg, "--no-header") == 0) {
            opts.header = false;
        }
        else {
            unknown_option(arg);
        }
    }

    const ooc::Dataset ds = ooc::ChunkStore().open_existing(dir);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    OOC_CHECK_IO(out.is_open(), "Failed to open output file: " + file.string());
    const auto rows = ooc::exec::Executor().write_delimited(ooc::query::QueryPlan::scan(ds), out, opts);
    std::printf("exported %llu rows to %s\n", static_cast<unsigned long long>(rows), file.c_str());
    return 0;
}

} // namespace

// =============================================================================
// Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 2;
    }
    const char* command = argv[1];
    if (std::strcmp(command, "--help") == 0 || std::strcmp(command, "-h") == 0) {
        print_help(argv[0]);
        return 0;
    }
    if (std::strcmp(command, "--version") == 0) {
        std::printf("ooc %s\n", OOC_VERSION_STRING);
        return 0;
    }

    Args args(argc, argv, 2);
    try {
        if (std::strcmp(command, "import") == 0)   return cmd_import(args);
        if (std::strcmp(command, "describe") == 0) return cmd_describe(args);
        if (std::strcmp(command, "query") == 0)    return cmd_query(args);
        if (std::strcmp(command, "export") == 0)   return cmd_export(args);
        throw UsageError(std::string("Unknown command: ") + command);
    } catch (const UsageError& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        std::fprintf(stderr, "Use --help for usage information\n");
        return 2;
    } catch (const ooc::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
