#pragma once

#include "ooc/core/type.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: ooc/core/config.hpp
// BRIEF: Runtime configuration values for storage, ingestion and execution
// =============================================================================

namespace ooc {

// =============================================================================
// Storage
// =============================================================================

enum class Codec : std::uint32_t {
    None = 0,
    Zstd = 1
};

inline const char* codec_name(Codec codec) noexcept {
    switch (codec) {
        case Codec::None: return "none";
        case Codec::Zstd: return "zstd";
        default:          return "unknown";
    }
}

/// Throws ValueError on an unknown name.
Codec parse_codec(std::string_view name);

struct StoreConfig {
    std::string root = ".";         // relative destinations resolve against this
    Codec codec = Codec::None;
    int compression_level = 3;
};

// =============================================================================
// Ingestion
// =============================================================================

struct ReadOptions {
    char separator = ',';
    char quote = '"';
    bool header = true;
    std::map<std::string, ColumnType> column_types;
    bool strings_as_categorical = false;
    std::vector<std::string> na_strings;
};

// =============================================================================
// Execution
// =============================================================================

inline constexpr std::size_t kDefaultMemoryBudget = std::size_t{256} << 20;

struct ExecConfig {
    std::size_t result_memory_budget = kDefaultMemoryBudget;
    std::size_t join_memory_budget = kDefaultMemoryBudget;
    std::size_t output_chunk_rows = 0;  // 0: base dataset's chunk size
};

// =============================================================================
// Delimited Output
// =============================================================================

struct WriteOptions {
    char separator = ',';
    char quote = '"';
    bool header = true;
};

} // namespace ooc
