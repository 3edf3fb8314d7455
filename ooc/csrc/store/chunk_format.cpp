#include "ooc/store/chunk_format.hpp"
#include "ooc/core/error.hpp"

#include <bit>
#include <cstring>
#include <limits>

#if OOC_HAS_ZSTD
#include <zstd.h>
#endif

namespace ooc::store {

static_assert(std::endian::native == std::endian::little,
              "Chunk files are written in host order and require a little-endian host");

namespace {

template <typename T>
void append_pod(std::vector<std::byte>& out, const T& value) {
    const auto* p = reinterpret_cast<const std::byte*>(&value);
    out.insert(out.end(), p, p + sizeof(T));
}

template <typename T>
T load_pod(const std::byte* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(T));
    return value;
}

std::size_t fixed_width(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Integer:
        case ColumnType::Float:
            return 8;
        case ColumnType::Date:
        case ColumnType::Categorical:
            return 4;
        default:
            return 0;
    }
}

[[noreturn]] void wrong_cell(ColumnType type) {
    throw TypeMismatchError(std::string("Cell value does not match column type ") + type_name(type));
}

} // namespace

// =============================================================================
// CategoryDictionary
// =============================================================================

std::uint32_t CategoryDictionary::code_for(const std::string& level) {
    auto it = index_.find(level);
    if (it != index_.end()) {
        return it->second;
    }
    OOC_CHECK_ARG(levels_.size() < std::numeric_limits<std::uint32_t>::max(),
                  "Too many categorical levels");
    auto code = static_cast<std::uint32_t>(levels_.size());
    levels_.push_back(level);
    index_.emplace(level, code);
    return code;
}

// =============================================================================
// ColumnBuilder
// =============================================================================

void ColumnBuilder::append(const Value& v, CategoryDictionary* dict) {
    if ((rows_ & 7) == 0) {
        validity_.push_back(0);
    }
    const bool present = !is_na(v);
    if (present) {
        validity_.back() |= static_cast<std::uint8_t>(1u << (rows_ & 7));
    }

    switch (type_) {
        case ColumnType::Integer: {
            std::int64_t x = 0;
            if (present) {
                const auto* p = std::get_if<std::int64_t>(&v);
                if (!p) wrong_cell(type_);
                x = *p;
            }
            append_pod(fixed_, x);
            break;
        }
        case ColumnType::Float: {
            double x = 0.0;
            if (present) {
                if (const auto* f = std::get_if<double>(&v)) {
                    x = *f;
                } else if (const auto* i = std::get_if<std::int64_t>(&v)) {
                    x = static_cast<double>(*i);
                } else {
                    wrong_cell(type_);
                }
            }
            append_pod(fixed_, x);
            break;
        }
        case ColumnType::Date: {
            std::int32_t x = 0;
            if (present) {
                const auto* p = std::get_if<Date>(&v);
                if (!p) wrong_cell(type_);
                x = p->days;
            }
            append_pod(fixed_, x);
            break;
        }
        case ColumnType::Categorical: {
            OOC_ASSERT(dict != nullptr, "Categorical column without dictionary");
            std::uint32_t code = 0;
            if (present) {
                const auto* p = std::get_if<std::string>(&v);
                if (!p) wrong_cell(type_);
                code = dict->code_for(*p);
            }
            append_pod(fixed_, code);
            break;
        }
        case ColumnType::String: {
            if (present) {
                const auto* p = std::get_if<std::string>(&v);
                if (!p) wrong_cell(type_);
                bytes_ += *p;
            }
            OOC_CHECK_ARG(bytes_.size() <= std::numeric_limits<std::uint32_t>::max(),
                          "String data of one chunk exceeds 4 GiB; use a smaller chunk size");
            offsets_.push_back(static_cast<std::uint32_t>(bytes_.size()));
            break;
        }
    }
    ++rows_;
}

std::vector<std::byte> ColumnBuilder::finish() {
    std::vector<std::byte> raw;
    const std::size_t payload = (type_ == ColumnType::String)
        ? offsets_.size() * sizeof(std::uint32_t) + bytes_.size()
        : fixed_.size();
    raw.reserve(validity_.size() + payload);

    for (std::uint8_t b : validity_) {
        raw.push_back(static_cast<std::byte>(b));
    }
    if (type_ == ColumnType::String) {
        const auto* p = reinterpret_cast<const std::byte*>(offsets_.data());
        raw.insert(raw.end(), p, p + offsets_.size() * sizeof(std::uint32_t));
        const auto* s = reinterpret_cast<const std::byte*>(bytes_.data());
        raw.insert(raw.end(), s, s + bytes_.size());
    } else {
        raw.insert(raw.end(), fixed_.begin(), fixed_.end());
    }

    rows_ = 0;
    validity_.clear();
    fixed_.clear();
    offsets_.assign(1, 0);
    bytes_.clear();
    return raw;
}

// =============================================================================
// Compression
// =============================================================================

std::vector<std::byte> compress_block(const std::vector<std::byte>& raw, Codec codec, int level) {
    switch (codec) {
        case Codec::None:
            return raw;
        case Codec::Zstd: {
#if OOC_HAS_ZSTD
            std::vector<std::byte> out(ZSTD_compressBound(raw.size()));
            std::size_t n = ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), level);
            if (ZSTD_isError(n)) {
                throw IOError(std::string("zstd compression failed: ") + ZSTD_getErrorName(n));
            }
            out.resize(n);
            return out;
#else
            OOC_UNUSED(level);
            throw FeatureUnavailableError("This build of ooc was compiled without zstd support");
#endif
        }
    }
    throw ValueError("Unknown codec id " + std::to_string(static_cast<std::uint32_t>(codec)));
}

std::vector<std::byte> decompress_block(const std::vector<std::byte>& stored,
                                        std::size_t raw_bytes, Codec codec) {
    switch (codec) {
        case Codec::None:
            if (stored.size() != raw_bytes) {
                throw CorruptMetadataError("uncompressed block size mismatch");
            }
            return stored;
        case Codec::Zstd: {
#if OOC_HAS_ZSTD
            std::vector<std::byte> out(raw_bytes);
            std::size_t n = ZSTD_decompress(out.data(), out.size(), stored.data(), stored.size());
            if (ZSTD_isError(n) || n != raw_bytes) {
                throw CorruptMetadataError("zstd block failed to decompress to its recorded size");
            }
            return out;
#else
            OOC_UNUSED(raw_bytes);
            throw FeatureUnavailableError("Chunk is zstd-compressed but this build lacks zstd support");
#endif
        }
    }
    throw CorruptMetadataError("unknown codec id " + std::to_string(static_cast<std::uint32_t>(codec)));
}

// =============================================================================
// Chunk Files
// =============================================================================

std::uint64_t write_chunk_file(const std::filesystem::path& path,
                               Codec codec, int level,
                               std::size_t rows,
                               std::vector<ColumnBuilder>& columns) {
    std::vector<std::vector<std::byte>> blocks;
    std::vector<ColumnDirEntry> directory;
    blocks.reserve(columns.size());
    directory.reserve(columns.size());

    std::uint64_t offset = sizeof(ChunkHeader) + columns.size() * sizeof(ColumnDirEntry);
    for (auto& column : columns) {
        OOC_ASSERT(column.rows() == rows, "Column builder row count disagrees with chunk");
        const ColumnType type = column.type();
        std::vector<std::byte> raw = column.finish();
        std::vector<std::byte> stored = compress_block(raw, codec, level);

        ColumnDirEntry entry{};
        entry.type = static_cast<std::uint32_t>(type);
        entry.offset = offset;
        entry.stored_bytes = stored.size();
        entry.raw_bytes = raw.size();
        directory.push_back(entry);

        offset += stored.size();
        blocks.push_back(std::move(stored));
    }

    ChunkHeader header{};
    std::memcpy(header.magic, kChunkMagic, sizeof(kChunkMagic));
    header.version = kChunkVersion;
    header.codec = static_cast<std::uint32_t>(codec);
    header.row_count = rows;
    header.column_count = static_cast<std::uint32_t>(columns.size());

    io::File file(path, io::OpenMode::Create);
    file.write_all(&header, sizeof(header));
    if (!directory.empty()) {
        file.write_all(directory.data(), directory.size() * sizeof(ColumnDirEntry));
    }
    for (const auto& block : blocks) {
        if (!block.empty()) {
            file.write_all(block.data(), block.size());
        }
    }
    file.sync();
    return offset;
}

ChunkLayout read_chunk_layout(const io::File& file) {
    const std::size_t size = file.size();
    const std::string name = file.path().filename().string();
    if (size < sizeof(ChunkHeader)) {
        throw CorruptMetadataError("chunk file " + name + " is truncated");
    }

    ChunkLayout layout{};
    file.read_at(0, &layout.header, sizeof(ChunkHeader));

    if (std::memcmp(layout.header.magic, kChunkMagic, sizeof(kChunkMagic)) != 0) {
        throw CorruptMetadataError("chunk file " + name + " has a bad magic number");
    }
    if (layout.header.version != kChunkVersion) {
        throw CorruptMetadataError("chunk file " + name + " has unknown format version " +
                                   std::to_string(layout.header.version));
    }
    if (layout.header.codec > static_cast<std::uint32_t>(Codec::Zstd)) {
        throw CorruptMetadataError("chunk file " + name + " has unknown codec " +
                                   std::to_string(layout.header.codec));
    }

    const std::uint64_t dir_bytes =
        static_cast<std::uint64_t>(layout.header.column_count) * sizeof(ColumnDirEntry);
    if (sizeof(ChunkHeader) + dir_bytes > size) {
        throw CorruptMetadataError("chunk file " + name + " has a truncated column directory");
    }
    layout.directory.resize(layout.header.column_count);
    if (dir_bytes > 0) {
        file.read_at(sizeof(ChunkHeader), layout.directory.data(), dir_bytes);
    }

    for (const auto& entry : layout.directory) {
        if (entry.type >= kColumnTypeCount ||
            entry.offset > size || entry.stored_bytes > size - entry.offset) {
            throw CorruptMetadataError("chunk file " + name + " has a column block outside the file");
        }
    }
    return layout;
}

ColumnBlock read_column_block(const io::File& file, const ChunkLayout& layout, std::size_t column) {
    OOC_ASSERT(column < layout.directory.size(), "Column index out of range");
    const ColumnDirEntry& entry = layout.directory[column];

    std::vector<std::byte> stored(entry.stored_bytes);
    if (!stored.empty()) {
        file.read_at(entry.offset, stored.data(), stored.size());
    }
    auto raw = decompress_block(stored, entry.raw_bytes, static_cast<Codec>(layout.header.codec));
    return ColumnBlock(static_cast<ColumnType>(entry.type), layout.header.row_count, std::move(raw));
}

// =============================================================================
// ColumnBlock
// =============================================================================

ColumnBlock::ColumnBlock(ColumnType type, std::size_t rows, std::vector<std::byte> raw)
    : type_(type), rows_(rows), payload_((rows + 7) / 8), raw_(std::move(raw))
{
    if (type_ == ColumnType::String) {
        const std::size_t offsets_bytes = (rows_ + 1) * sizeof(std::uint32_t);
        if (raw_.size() < payload_ + offsets_bytes) {
            throw CorruptMetadataError("string block is shorter than its offset table");
        }
        string_bytes_ = payload_ + offsets_bytes;
        const std::size_t data_bytes = raw_.size() - string_bytes_;

        std::uint32_t prev = 0;
        for (std::size_t i = 0; i <= rows_; ++i) {
            auto off = load_pod<std::uint32_t>(raw_.data() + payload_ + i * sizeof(std::uint32_t));
            if (off < prev || off > data_bytes || (i == 0 && off != 0)) {
                throw CorruptMetadataError("string block has inconsistent offsets");
            }
            prev = off;
        }
        if (prev != data_bytes) {
            throw CorruptMetadataError("string block has trailing bytes");
        }
    } else if (raw_.size() != payload_ + rows_ * fixed_width(type_)) {
        throw CorruptMetadataError(std::string("block size does not match row count for ") +
                                   type_name(type_) + " column");
    }
}

Value ColumnBlock::value(std::size_t row, const std::vector<std::string>* levels) const {
    OOC_ASSERT(row < rows_, "Row index out of range");
    if (!present(row)) {
        return Value{};
    }
    const std::byte* base = raw_.data() + payload_;
    switch (type_) {
        case ColumnType::Integer:
            return Value{load_pod<std::int64_t>(base + row * 8)};
        case ColumnType::Float:
            return Value{load_pod<double>(base + row * 8)};
        case ColumnType::Date:
            return Value{Date{load_pod<std::int32_t>(base + row * 4)}};
        case ColumnType::Categorical: {
            auto code = load_pod<std::uint32_t>(base + row * 4);
            if (levels == nullptr || code >= levels->size()) {
                throw CorruptMetadataError("categorical code " + std::to_string(code) +
                                           " has no dictionary level");
            }
            return Value{(*levels)[code]};
        }
        case ColumnType::String: {
            auto begin = load_pod<std::uint32_t>(base + row * 4);
            auto end = load_pod<std::uint32_t>(base + (row + 1) * 4);
            const auto* chars = reinterpret_cast<const char*>(raw_.data() + string_bytes_);
            return Value{std::string(chars + begin, end - begin)};
        }
    }
    return Value{};
}

} // namespace ooc::store
