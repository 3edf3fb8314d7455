#include "ooc/store/chunk_store.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"
#include "ooc/io/delimited.hpp"
#include "ooc/io/file.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace ooc {

namespace {

constexpr const char* kChunkPrefix = "chunk_";
constexpr const char* kChunkSuffix = ".oocc";

bool is_dataset_entry(const std::string& name) {
    if (name == store::kMetadataFileName || name == store::kLockFileName ||
        name == std::string(store::kMetadataFileName) + ".tmp") {
        return true;
    }
    return name.rfind(kChunkPrefix, 0) == 0 &&
           name.size() > std::char_traits<char>::length(kChunkSuffix) &&
           name.compare(name.size() - 5, 5, kChunkSuffix) == 0;
}

Row to_row(const io::Record& record, const Schema& schema, const ReadOptions& opts) {
    Row row;
    row.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
        const std::string& field = record.fields[i];
        if (field.empty() && record.quoted[i] && is_text(schema[i].type)) {
            row.emplace_back(std::string());
            continue;
        }
        if (!record.quoted[i] && io::is_na_token(field, opts.na_strings)) {
            row.emplace_back();
            continue;
        }
        auto v = parse_value(field, schema[i].type);
        if (!v) {
            throw ParseError("column '" + schema[i].name + "': cannot parse '" + field +
                             "' as " + type_name(schema[i].type), record.line);
        }
        row.push_back(std::move(*v));
    }
    return row;
}

void check_width(const io::Record& record, std::size_t width) {
    if (record.fields.size() != width) {
        throw ParseError("expected " + std::to_string(width) + " fields, found " +
                         std::to_string(record.fields.size()), record.line);
    }
}

} // namespace

std::string chunk_file_name(std::size_t id) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%06zu%s", kChunkPrefix, id, kChunkSuffix);
    return buf;
}

// =============================================================================
// Dataset
// =============================================================================

Dataset Dataset::rename(const std::string& old_name, const std::string& new_name) const {
    OOC_CHECK_ARG(valid(), "Dataset handle is empty");
    auto renamed = index_->with_schema(index_->rename(old_name, new_name));
    return Dataset(directory_, std::make_shared<const store::MetadataIndex>(std::move(renamed)));
}

ChunkReader Dataset::read_chunk(std::size_t chunk_id, const std::vector<std::string>& columns) const {
    OOC_CHECK_ARG(valid(), "Dataset handle is empty");
    std::vector<std::size_t> indices;
    if (columns.empty()) {
        indices.resize(schema().size());
        for (std::size_t i = 0; i < indices.size(); ++i) {
            indices[i] = i;
        }
    } else {
        indices.reserve(columns.size());
        for (const auto& name : columns) {
            indices.push_back(schema().require(name));
        }
    }
    return read_chunk_columns(chunk_id, std::move(indices));
}

ChunkReader Dataset::read_chunk_columns(std::size_t chunk_id, std::vector<std::size_t> columns) const {
    OOC_CHECK_ARG(valid(), "Dataset handle is empty");
    if (chunk_id >= chunk_count()) {
        throw ValueError("Chunk id " + std::to_string(chunk_id) + " out of range (dataset has " +
                         std::to_string(chunk_count()) + " chunks)");
    }
    for (auto c : columns) {
        OOC_CHECK_ARG(c < schema().size(), "Column position out of range");
    }
    const auto& entry = index_->chunks()[chunk_id];
    return ChunkReader(directory_ / entry.file, index_, std::move(columns), entry.rows);
}

// =============================================================================
// ChunkReader
// =============================================================================

ChunkReader::ChunkReader(std::filesystem::path file,
                         std::shared_ptr<const store::MetadataIndex> index,
                         std::vector<std::size_t> columns,
                         std::uint64_t expected_rows)
    : file_(std::move(file))
    , index_(std::move(index))
    , columns_(std::move(columns))
    , expected_rows_(expected_rows)
{}

void ChunkReader::load() {
    io::File file(file_, io::OpenMode::Read);
    const store::ChunkLayout layout = store::read_chunk_layout(file);

    if (layout.header.row_count != expected_rows_) {
        throw CorruptMetadataError(file_.filename().string() + " holds " +
                                   std::to_string(layout.header.row_count) + " rows, expected " +
                                   std::to_string(expected_rows_));
    }
    const Schema& schema = index_->schema();
    if (layout.directory.size() != schema.size()) {
        throw CorruptMetadataError(file_.filename().string() + " has " +
                                   std::to_string(layout.directory.size()) + " columns, expected " +
                                   std::to_string(schema.size()));
    }

    blocks_.clear();
    blocks_.reserve(columns_.size());
    for (auto c : columns_) {
        if (layout.directory[c].type != static_cast<std::uint32_t>(schema[c].type)) {
            throw CorruptMetadataError(file_.filename().string() + ": column '" + schema[c].name +
                                       "' has a different stored type");
        }
        blocks_.push_back(store::read_column_block(file, layout, c));
    }
    loaded_ = true;
}

bool ChunkReader::next(Row& out) {
    if (!loaded_) {
        load();
    }
    if (position_ >= expected_rows_) {
        return false;
    }
    out.clear();
    out.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.push_back(blocks_[i].value(position_, index_->levels(columns_[i])));
    }
    ++position_;
    return true;
}

// =============================================================================
// DatasetWriter
// =============================================================================

DatasetWriter::DatasetWriter(store::WriterLock lock, Schema schema,
                             std::uint64_t chunk_rows, const StoreConfig& config)
    : lock_(std::move(lock))
    , schema_(std::move(schema))
    , chunk_rows_(chunk_rows)
    , codec_(config.codec)
    , level_(config.compression_level)
    , dicts_(schema_.size())
{
    OOC_CHECK_ARG(chunk_rows_ > 0, "Chunk row count must be positive");
    OOC_ASSERT(lock_.owns(), "Dataset writer without destination lock");
    builders_.reserve(schema_.size());
    for (const auto& column : schema_.columns()) {
        builders_.emplace_back(column.type);
    }
}

void DatasetWriter::append(const Row& row) {
    OOC_CHECK_ARG(!finished_, "Dataset writer already finished");
    OOC_CHECK_ARG(!failed_, "Dataset writer failed earlier; discard the destination");
    OOC_CHECK_ARG(row.size() == schema_.size(),
                  "Row has " + std::to_string(row.size()) + " cells, schema has " +
                  std::to_string(schema_.size()));

    try {
        for (std::size_t i = 0; i < row.size(); ++i) {
            builders_[i].append(row[i], &dicts_[i]);
        }
    } catch (const Exception&) {
        // Builders may now disagree on their row count
        failed_ = true;
        throw;
    }
    ++pending_;
    ++rows_written_;
    if (pending_ == chunk_rows_) {
        flush_chunk();
    }
}

void DatasetWriter::flush_chunk() {
    if (pending_ == 0) {
        return;
    }
    const std::string name = chunk_file_name(chunks_.size());
    try {
        const std::uint64_t bytes = store::write_chunk_file(
            lock_.directory() / name, codec_, level_, pending_, builders_);
        chunks_.push_back(store::ChunkEntry{name, pending_, bytes});
        pending_ = 0;
    } catch (const Exception& e) {
        failed_ = true;
        OOC_LOG_ERROR("Chunk write failed for %s: %s", name.c_str(), e.what());
        throw;
    }
}

Dataset DatasetWriter::finish() {
    OOC_CHECK_ARG(!finished_, "Dataset writer already finished");
    OOC_CHECK_ARG(!failed_, "Dataset writer failed earlier; discard the destination");

    flush_chunk();

    std::vector<std::vector<std::string>> levels;
    for (std::size_t i = 0; i < schema_.size(); ++i) {
        if (schema_[i].type == ColumnType::Categorical) {
            levels.resize(schema_.size());
            break;
        }
    }
    if (!levels.empty()) {
        for (std::size_t i = 0; i < schema_.size(); ++i) {
            levels[i] = dicts_[i].levels();
        }
    }

    auto index = std::make_shared<const store::MetadataIndex>(
        schema_, chunk_rows_, codec_, chunks_, std::move(levels));
    const std::filesystem::path dir = lock_.directory();
    index->save(dir);

    finished_ = true;
    lock_.release();

    OOC_LOG_INFO("Created dataset %s: %llu rows in %zu chunks", dir.c_str(),
                 static_cast<unsigned long long>(index->row_count()), index->chunks().size());
    return Dataset(dir, std::move(index));
}

// =============================================================================
// ChunkStore
// =============================================================================

ChunkStore::ChunkStore(StoreConfig config)
    : config_(std::move(config))
{
    OOC_CHECK_ARG(!config_.root.empty(), "Store root cannot be empty");
}

std::filesystem::path ChunkStore::resolve(const std::filesystem::path& path) const {
    if (path.is_absolute()) {
        return path;
    }
    return std::filesystem::path(config_.root) / path;
}

DatasetWriter ChunkStore::open_writer(const std::filesystem::path& destination,
                                      const Schema& schema, std::uint64_t chunk_row_count) const {
    OOC_CHECK_ARG(chunk_row_count > 0, "Chunk row count must be positive");
    if (config_.codec == Codec::Zstd && !kHasZstd) {
        throw FeatureUnavailableError("This build of ooc was compiled without zstd support");
    }

    const auto dir = resolve(destination);
    auto lock = store::WriterLock::acquire(dir);

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name == store::kLockFileName) {
            continue;
        }
        if (name == store::kMetadataFileName) {
            throw IOError("Destination already holds a dataset: " + dir.string() +
                          " (discard it first)");
        }
        throw IOError("Destination is not empty: " + dir.string());
    }
    OOC_CHECK_IO(!ec, "Failed to list destination " + dir.string() + ": " + ec.message());

    return DatasetWriter(std::move(lock), schema, chunk_row_count, config_);
}

Dataset ChunkStore::create(std::istream& input, std::uint64_t chunk_row_count,
                           const std::filesystem::path& destination,
                           const ReadOptions& opts) const {
    OOC_CHECK_ARG(chunk_row_count > 0, "Chunk row count must be positive");

    io::RecordReader reader(input, opts.separator, opts.quote);
    io::Record record;

    // Column names
    std::vector<std::string> names;
    std::vector<io::Record> sample;
    bool have_width = false;
    if (opts.header) {
        if (reader.next(record)) {
            names = record.fields;
            for (std::size_t i = 0; i < names.size(); ++i) {
                if (names[i].empty()) {
                    names[i] = "V" + std::to_string(i + 1);
                }
            }
            have_width = true;
            reader.keep_blank_lines(names.size() == 1);
        }
    }

    // First chunk of records drives type inference
    while (sample.size() < chunk_row_count && reader.next(record)) {
        if (!have_width) {
            for (std::size_t i = 0; i < record.fields.size(); ++i) {
                names.push_back("V" + std::to_string(i + 1));
            }
            have_width = true;
            reader.keep_blank_lines(names.size() == 1);
        }
        check_width(record, names.size());
        sample.push_back(record);
    }

    for (const auto& entry : opts.column_types) {
        if (std::find(names.begin(), names.end(), entry.first) == names.end()) {
            throw UnknownColumnError(entry.first);
        }
    }

    std::vector<ColumnSpec> columns;
    columns.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto it = opts.column_types.find(names[i]);
        if (it != opts.column_types.end()) {
            columns.push_back(ColumnSpec{names[i], it->second});
            continue;
        }
        io::TypeGuesser guesser;
        for (const auto& r : sample) {
            if (r.quoted[i] || !io::is_na_token(r.fields[i], opts.na_strings)) {
                guesser.observe(r.fields[i]);
            }
        }
        columns.push_back(ColumnSpec{names[i], guesser.result(opts.strings_as_categorical)});
    }
    Schema schema(std::move(columns));

    DatasetWriter writer = open_writer(destination, schema, chunk_row_count);
    for (const auto& r : sample) {
        writer.append(to_row(r, schema, opts));
    }
    sample.clear();
    sample.shrink_to_fit();

    while (reader.next(record)) {
        check_width(record, schema.size());
        writer.append(to_row(record, schema, opts));
    }
    return writer.finish();
}

Dataset ChunkStore::create_from_file(const std::filesystem::path& input, std::uint64_t chunk_row_count,
                                     const std::filesystem::path& destination,
                                     const ReadOptions& opts) const {
    std::ifstream in(resolve(input), std::ios::binary);
    OOC_CHECK_IO(in.is_open(), "Failed to open input file: " + resolve(input).string());
    return create(in, chunk_row_count, destination, opts);
}

Dataset ChunkStore::open_existing(const std::filesystem::path& path) const {
    const auto dir = resolve(path);
    store::MetadataIndex index = store::MetadataIndex::load(dir);

    if (index.codec() == Codec::Zstd && !kHasZstd) {
        OOC_LOG_WARN("Dataset %s is zstd-compressed; this build cannot read its chunks", dir.c_str());
    }

    for (const auto& entry : index.chunks()) {
        const auto file_path = dir / entry.file;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            OOC_LOG_ERROR("Chunk file missing: %s", file_path.c_str());
            throw CorruptMetadataError("chunk file " + entry.file + " is missing");
        }
        try {
            io::File file(file_path, io::OpenMode::Read);
            if (file.size() != entry.bytes) {
                throw CorruptMetadataError("chunk file " + entry.file + " is " +
                                           std::to_string(file.size()) + " bytes, expected " +
                                           std::to_string(entry.bytes));
            }
            const auto layout = store::read_chunk_layout(file);
            if (layout.header.row_count != entry.rows) {
                throw CorruptMetadataError("chunk file " + entry.file + " holds " +
                                           std::to_string(layout.header.row_count) +
                                           " rows, metadata records " + std::to_string(entry.rows));
            }
            if (layout.header.column_count != index.schema().size() ||
                layout.header.codec != static_cast<std::uint32_t>(index.codec())) {
                throw CorruptMetadataError("chunk file " + entry.file +
                                           " disagrees with the dataset schema or codec");
            }
        } catch (const CorruptMetadataError& e) {
            OOC_LOG_ERROR("%s: %s", dir.c_str(), e.what());
            throw;
        } catch (const IOError& e) {
            OOC_LOG_ERROR("%s: %s", dir.c_str(), e.what());
            throw CorruptMetadataError("chunk file " + entry.file + " is unreadable: " + e.what());
        }
    }

    OOC_LOG_INFO("Opened dataset %s: %llu rows in %zu chunks", dir.c_str(),
                 static_cast<unsigned long long>(index.row_count()), index.chunks().size());
    return Dataset(dir, std::make_shared<const store::MetadataIndex>(std::move(index)));
}

void ChunkStore::discard(const std::filesystem::path& destination) const {
    const auto dir = resolve(destination);
    if (store::WriterRegistry::instance().is_active(store::writer_key(dir)) ||
        store::lock_file_held(dir)) {
        throw ConcurrentWriteError(dir.string());
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return;
    }
    OOC_CHECK_IO(std::filesystem::is_directory(dir, ec), "Not a dataset directory: " + dir.string());

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (!is_dataset_entry(name)) {
            throw IOError("Refusing to discard " + dir.string() + ": unexpected entry '" + name + "'");
        }
    }
    OOC_CHECK_IO(!ec, "Failed to list " + dir.string() + ": " + ec.message());

    std::filesystem::remove_all(dir, ec);
    OOC_CHECK_IO(!ec, "Failed to remove " + dir.string() + ": " + ec.message());
    OOC_LOG_INFO("Discarded dataset %s", dir.c_str());
}

} // namespace ooc
