#pragma once

#include "ooc/core/config.hpp"
#include "ooc/store/schema.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// =============================================================================
// FILE: ooc/store/metadata.hpp
// BRIEF: In-memory schema and chunk location table of a dataset
// =============================================================================

namespace ooc::store {

inline constexpr const char* kMetadataFileName = "metadata.h5";
inline constexpr std::uint32_t kFormatVersion = 1;

struct ChunkEntry {
    std::string file;           // file name relative to the dataset directory
    std::uint64_t rows = 0;
    std::uint64_t bytes = 0;
};

/// Summary answered without touching chunk files.
struct Description {
    std::size_t column_count = 0;
    std::uint64_t row_count = 0;
    std::vector<ColumnType> column_types;
    std::vector<std::string> column_names;
    std::size_t chunk_count = 0;
};

class MetadataIndex {
public:
    /// `levels[i]` is the dictionary of column i; empty for non-categorical
    /// columns. An empty `levels` means no categorical dictionaries at all.
    MetadataIndex(Schema schema,
                  std::uint64_t chunk_row_capacity,
                  Codec codec,
                  std::vector<ChunkEntry> chunks,
                  std::vector<std::vector<std::string>> levels = {});

    OOC_NODISCARD const Schema& schema() const noexcept { return schema_; }
    OOC_NODISCARD std::uint64_t row_count() const noexcept { return describe_.row_count; }
    OOC_NODISCARD std::uint64_t chunk_row_capacity() const noexcept { return capacity_; }
    OOC_NODISCARD Codec codec() const noexcept { return codec_; }
    OOC_NODISCARD const std::vector<ChunkEntry>& chunks() const noexcept { return chunks_; }

    /// Dictionary of a categorical column, nullptr otherwise.
    OOC_NODISCARD const std::vector<std::string>* levels(std::size_t column) const noexcept;

    OOC_NODISCARD const Description& describe() const noexcept { return describe_; }

    /// Schema with one column renamed; chunks are untouched.
    OOC_NODISCARD Schema rename(const std::string& old_name, const std::string& new_name) const {
        return schema_.rename(old_name, new_name);
    }

    /// Same chunks under a schema with identical column types.
    OOC_NODISCARD MetadataIndex with_schema(Schema schema) const;

    /// Write `metadata.h5` into `dir`. The file is written under a temporary
    /// name and renamed into place.
    void save(const std::filesystem::path& dir) const;

    /// Read `metadata.h5` from `dir`. Any missing, unreadable or
    /// inconsistent entry raises CorruptMetadataError.
    static MetadataIndex load(const std::filesystem::path& dir);

private:
    void build_description();

    Schema schema_;
    std::uint64_t capacity_;
    Codec codec_;
    std::vector<ChunkEntry> chunks_;
    std::vector<std::vector<std::string>> levels_;
    Description describe_;
};

} // namespace ooc::store
