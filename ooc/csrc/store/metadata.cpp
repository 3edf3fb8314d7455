#include "ooc/store/metadata.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"
#include "ooc/io/file.hpp"
#include "ooc/io/hdf5.hpp"

#include <system_error>

namespace ooc::store {

namespace {

// Each entry is followed by a NUL byte.
std::vector<std::uint8_t> pack_strings(const std::vector<std::string>& items) {
    std::vector<std::uint8_t> out;
    for (const auto& s : items) {
        out.insert(out.end(), s.begin(), s.end());
        out.push_back(0);
    }
    return out;
}

std::vector<std::string> unpack_strings(const std::vector<std::uint8_t>& blob, const char* what) {
    std::vector<std::string> out;
    if (blob.empty()) {
        return out;
    }
    if (blob.back() != 0) {
        throw CorruptMetadataError(std::string(what) + " is not NUL-terminated");
    }
    std::string current;
    for (std::uint8_t b : blob) {
        if (b == 0) {
            out.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(static_cast<char>(b));
        }
    }
    return out;
}

template <typename T>
std::vector<T> read_optional(const io::h5::File& file, const std::string& name) {
    if (!file.exists(name)) {
        return {};
    }
    return file.read_vector<T>(name);
}

template <typename T>
T read_scalar(const io::h5::File& file, const std::string& name) {
    if (!file.exists(name)) {
        throw CorruptMetadataError("missing entry '" + name + "'");
    }
    auto v = file.read_vector<T>(name);
    if (v.size() != 1) {
        throw CorruptMetadataError("entry '" + name + "' is not a scalar");
    }
    return v.front();
}

template <typename T>
void write_optional(io::h5::File& file, const std::string& name, const std::vector<T>& data) {
    if (!data.empty()) {
        file.write_vector(name, data);
    }
}

} // namespace

// =============================================================================
// MetadataIndex
// =============================================================================

MetadataIndex::MetadataIndex(Schema schema,
                             std::uint64_t chunk_row_capacity,
                             Codec codec,
                             std::vector<ChunkEntry> chunks,
                             std::vector<std::vector<std::string>> levels)
    : schema_(std::move(schema))
    , capacity_(chunk_row_capacity)
    , codec_(codec)
    , chunks_(std::move(chunks))
    , levels_(std::move(levels))
{
    OOC_CHECK_ARG(capacity_ > 0, "Chunk row capacity must be positive");
    OOC_CHECK_ARG(levels_.empty() || levels_.size() == schema_.size(),
                  "Categorical dictionaries do not match the column count");
    build_description();
}

void MetadataIndex::build_description() {
    describe_.column_count = schema_.size();
    describe_.column_types = schema_.types();
    describe_.column_names = schema_.names();
    describe_.chunk_count = chunks_.size();
    describe_.row_count = 0;
    for (const auto& c : chunks_) {
        describe_.row_count += c.rows;
    }
}

const std::vector<std::string>* MetadataIndex::levels(std::size_t column) const noexcept {
    if (column >= schema_.size() || schema_[column].type != ColumnType::Categorical) {
        return nullptr;
    }
    static const std::vector<std::string> kNoLevels;
    if (levels_.empty()) {
        return &kNoLevels;
    }
    return &levels_[column];
}

MetadataIndex MetadataIndex::with_schema(Schema schema) const {
    OOC_CHECK_ARG(schema.types() == schema_.types(),
                  "Replacement schema must keep the column types");
    return MetadataIndex(std::move(schema), capacity_, codec_, chunks_, levels_);
}

void MetadataIndex::save(const std::filesystem::path& dir) const {
    const auto final_path = dir / kMetadataFileName;
    const auto tmp_path = dir / (std::string(kMetadataFileName) + ".tmp");

    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);

    {
        std::lock_guard<std::mutex> lock(io::h5::library_mutex());
        auto file = io::h5::File::create(tmp_path.string());

        file.write_vector<std::uint32_t>("format_version", {kFormatVersion});
        file.write_vector<std::uint64_t>("row_count", {describe_.row_count});
        file.write_vector<std::uint64_t>("chunk_row_capacity", {capacity_});
        file.write_vector<std::uint32_t>("codec", {static_cast<std::uint32_t>(codec_)});

        write_optional(file, "column_names", pack_strings(schema_.names()));
        std::vector<std::uint32_t> types;
        for (auto t : schema_.types()) {
            types.push_back(static_cast<std::uint32_t>(t));
        }
        write_optional(file, "column_types", types);

        std::vector<std::string> files;
        std::vector<std::uint64_t> rows;
        std::vector<std::uint64_t> bytes;
        for (const auto& c : chunks_) {
            files.push_back(c.file);
            rows.push_back(c.rows);
            bytes.push_back(c.bytes);
        }
        write_optional(file, "chunk_files", pack_strings(files));
        write_optional(file, "chunk_rows", rows);
        write_optional(file, "chunk_bytes", bytes);

        for (std::size_t i = 0; i < schema_.size(); ++i) {
            const auto* lv = levels(i);
            if (lv != nullptr) {
                write_optional(file, "levels_" + std::to_string(i), pack_strings(*lv));
            }
        }
        file.flush();
    }

    // Chunks are already synced; metadata must reach disk before it names them
    io::File(tmp_path, io::OpenMode::Read).sync();
    std::filesystem::rename(tmp_path, final_path, ec);
    OOC_CHECK_IO(!ec, "Failed to move metadata into place in " + dir.string() + ": " + ec.message());
    io::File(dir, io::OpenMode::Read).sync();
}

MetadataIndex MetadataIndex::load(const std::filesystem::path& dir) {
    const auto path = dir / kMetadataFileName;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        OOC_LOG_ERROR("Dataset metadata not found: %s", path.c_str());
        throw CorruptMetadataError(path.string() + " is missing");
    }

    try {
        std::lock_guard<std::mutex> lock(io::h5::library_mutex());
        auto file = io::h5::File::open_read_only(path.string());

        const auto version = read_scalar<std::uint32_t>(file, "format_version");
        if (version != kFormatVersion) {
            throw CorruptMetadataError("unknown format version " + std::to_string(version));
        }
        const auto row_count = read_scalar<std::uint64_t>(file, "row_count");
        const auto capacity = read_scalar<std::uint64_t>(file, "chunk_row_capacity");
        const auto codec_id = read_scalar<std::uint32_t>(file, "codec");
        if (capacity == 0) {
            throw CorruptMetadataError("chunk row capacity is zero");
        }
        if (codec_id > static_cast<std::uint32_t>(Codec::Zstd)) {
            throw CorruptMetadataError("unknown codec id " + std::to_string(codec_id));
        }

        auto names = unpack_strings(read_optional<std::uint8_t>(file, "column_names"), "column_names");
        auto type_ids = read_optional<std::uint32_t>(file, "column_types");
        if (names.size() != type_ids.size()) {
            throw CorruptMetadataError("column name and type counts differ");
        }
        std::vector<ColumnSpec> columns;
        bool any_categorical = false;
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (type_ids[i] >= kColumnTypeCount) {
                throw CorruptMetadataError("unknown column type id " + std::to_string(type_ids[i]));
            }
            auto type = static_cast<ColumnType>(type_ids[i]);
            any_categorical = any_categorical || type == ColumnType::Categorical;
            columns.push_back(ColumnSpec{std::move(names[i]), type});
        }

        auto files = unpack_strings(read_optional<std::uint8_t>(file, "chunk_files"), "chunk_files");
        auto rows = read_optional<std::uint64_t>(file, "chunk_rows");
        auto bytes = read_optional<std::uint64_t>(file, "chunk_bytes");
        if (files.size() != rows.size() || files.size() != bytes.size()) {
            throw CorruptMetadataError("chunk table columns have different lengths");
        }

        std::vector<ChunkEntry> chunks;
        std::uint64_t total = 0;
        for (std::size_t i = 0; i < files.size(); ++i) {
            if (rows[i] == 0 || rows[i] > capacity) {
                throw CorruptMetadataError("chunk " + files[i] + " has invalid row count " +
                                           std::to_string(rows[i]));
            }
            total += rows[i];
            chunks.push_back(ChunkEntry{std::move(files[i]), rows[i], bytes[i]});
        }
        if (total != row_count) {
            throw CorruptMetadataError("chunk row counts sum to " + std::to_string(total) +
                                       " but the dataset records " + std::to_string(row_count));
        }

        std::vector<std::vector<std::string>> levels;
        if (any_categorical) {
            levels.resize(columns.size());
            for (std::size_t i = 0; i < columns.size(); ++i) {
                if (columns[i].type == ColumnType::Categorical) {
                    const std::string name = "levels_" + std::to_string(i);
                    levels[i] = unpack_strings(read_optional<std::uint8_t>(file, name), "levels");
                }
            }
        }

        return MetadataIndex(Schema(std::move(columns)), capacity,
                             static_cast<Codec>(codec_id), std::move(chunks), std::move(levels));
    } catch (const CorruptMetadataError& e) {
        OOC_LOG_ERROR("%s: %s", path.c_str(), e.what());
        throw;
    } catch (const Exception& e) {
        OOC_LOG_ERROR("%s: %s", path.c_str(), e.what());
        throw CorruptMetadataError(path.string() + ": " + e.what());
    }
}

} // namespace ooc::store
