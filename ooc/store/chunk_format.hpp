#pragma once

#include "ooc/core/config.hpp"
#include "ooc/core/type.hpp"
#include "ooc/io/file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: ooc/store/chunk_format.hpp
// BRIEF: Binary columnar layout of one chunk file
// =============================================================================
//
// header   : magic "OOCCHNK1", u32 version, u32 codec, u64 row_count,
//            u32 column_count, u32 reserved
// directory: column_count x ColumnDirEntry
// blocks   : one block per column, compressed with the chunk codec
//
// A block is the validity bitmap (ceil(rows/8) bytes, bit set = present)
// followed by the payload for the column type:
//   integer i64[rows] | float f64[rows] | date i32[rows]
//   categorical u32 code[rows] | string u32 offsets[rows+1] + bytes
// =============================================================================

namespace ooc::store {

inline constexpr char kChunkMagic[8] = {'O', 'O', 'C', 'C', 'H', 'N', 'K', '1'};
inline constexpr std::uint32_t kChunkVersion = 1;

struct ChunkHeader {
    char magic[8];
    std::uint32_t version;
    std::uint32_t codec;
    std::uint64_t row_count;
    std::uint32_t column_count;
    std::uint32_t reserved;
};
static_assert(sizeof(ChunkHeader) == 32, "ChunkHeader layout");

struct ColumnDirEntry {
    std::uint32_t type;
    std::uint32_t reserved;
    std::uint64_t offset;
    std::uint64_t stored_bytes;
    std::uint64_t raw_bytes;
};
static_assert(sizeof(ColumnDirEntry) == 32, "ColumnDirEntry layout");

// =============================================================================
// SECTION 1: Categorical Dictionary
// =============================================================================

/// Level table for one categorical column, shared by every chunk of a
/// dataset. Codes are assigned in order of first appearance.
class CategoryDictionary {
public:
    std::uint32_t code_for(const std::string& level);

    OOC_NODISCARD const std::vector<std::string>& levels() const noexcept { return levels_; }

private:
    std::vector<std::string> levels_;
    std::unordered_map<std::string, std::uint32_t> index_;
};

// =============================================================================
// SECTION 2: Encoding
// =============================================================================

/// Accumulates the cells of one column for the chunk being written.
class ColumnBuilder {
public:
    explicit ColumnBuilder(ColumnType type) : type_(type) {}

    /// `v` must be NA or hold the storage alternative of the column type.
    /// `dict` is required for categorical columns.
    void append(const Value& v, CategoryDictionary* dict);

    /// Serialize the uncompressed block and reset the builder.
    std::vector<std::byte> finish();

    OOC_NODISCARD ColumnType type() const noexcept { return type_; }
    OOC_NODISCARD std::size_t rows() const noexcept { return rows_; }

private:
    ColumnType type_;
    std::size_t rows_ = 0;
    std::vector<std::uint8_t> validity_;
    std::vector<std::byte> fixed_;
    std::vector<std::uint32_t> offsets_{0};
    std::string bytes_;
};

/// Compress a raw block with `codec`. Throws FeatureUnavailableError when
/// the codec is not built in.
std::vector<std::byte> compress_block(const std::vector<std::byte>& raw, Codec codec, int level);

std::vector<std::byte> decompress_block(const std::vector<std::byte>& stored,
                                        std::size_t raw_bytes, Codec codec);

/// Write a complete chunk file (header, directory, blocks). `path` must not
/// exist. Returns the file size in bytes.
std::uint64_t write_chunk_file(const std::filesystem::path& path,
                               Codec codec, int level,
                               std::size_t rows,
                               std::vector<ColumnBuilder>& columns);

// =============================================================================
// SECTION 3: Decoding
// =============================================================================

struct ChunkLayout {
    ChunkHeader header;
    std::vector<ColumnDirEntry> directory;
};

/// Read and validate the header and column directory. Throws
/// CorruptMetadataError for a bad magic, unknown version or codec, or
/// blocks that fall outside the file.
ChunkLayout read_chunk_layout(const io::File& file);

/// Decoded column of one chunk.
class ColumnBlock {
public:
    ColumnBlock() = default;

    /// Decode the block raw bytes. Throws CorruptMetadataError if the
    /// payload size does not match the row count.
    ColumnBlock(ColumnType type, std::size_t rows, std::vector<std::byte> raw);

    OOC_NODISCARD bool present(std::size_t row) const noexcept {
        return (raw_[row >> 3] & std::byte{static_cast<unsigned char>(1u << (row & 7))}) != std::byte{0};
    }

    /// Categorical cells are resolved through `levels`.
    OOC_NODISCARD Value value(std::size_t row, const std::vector<std::string>* levels) const;

    OOC_NODISCARD std::size_t rows() const noexcept { return rows_; }

private:
    ColumnType type_ = ColumnType::String;
    std::size_t rows_ = 0;
    std::size_t payload_ = 0;       // byte offset of the payload in raw_
    std::size_t string_bytes_ = 0;  // byte offset of the string data in raw_
    std::vector<std::byte> raw_;
};

/// Read and decode one column block from an open chunk file.
ColumnBlock read_column_block(const io::File& file, const ChunkLayout& layout, std::size_t column);

} // namespace ooc::store
