#pragma once

#include "ooc/core/config.hpp"
#include "ooc/core/type.hpp"
#include "ooc/store/chunk_format.hpp"
#include "ooc/store/metadata.hpp"
#include "ooc/store/schema.hpp"
#include "ooc/store/writer_lock.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

// =============================================================================
// FILE: ooc/store/chunk_store.hpp
// BRIEF: Chunked on-disk datasets: creation, reopening and chunk reads
// =============================================================================

namespace ooc {

class ChunkReader;

// =============================================================================
// Dataset - Value Handle on a Materialized Directory
// =============================================================================

class Dataset {
public:
    Dataset() = default;

    Dataset(std::filesystem::path directory,
            std::shared_ptr<const store::MetadataIndex> index)
        : directory_(std::move(directory)), index_(std::move(index)) {}

    OOC_NODISCARD bool valid() const noexcept { return index_ != nullptr; }

    OOC_NODISCARD const std::filesystem::path& directory() const noexcept { return directory_; }
    OOC_NODISCARD const store::MetadataIndex& index() const noexcept { return *index_; }
    OOC_NODISCARD const Schema& schema() const noexcept { return index_->schema(); }

    OOC_NODISCARD std::uint64_t row_count() const noexcept { return index_->row_count(); }
    OOC_NODISCARD std::size_t chunk_count() const noexcept { return index_->chunks().size(); }
    OOC_NODISCARD std::uint64_t chunk_row_capacity() const noexcept { return index_->chunk_row_capacity(); }

    /// O(1); never touches chunk files.
    OOC_NODISCARD const store::Description& describe() const noexcept { return index_->describe(); }

    /// New handle over the same chunks with one column renamed.
    OOC_NODISCARD Dataset rename(const std::string& old_name, const std::string& new_name) const;

    /// Lazy reader over chunk `chunk_id`, yielding `columns` in that order
    /// (all columns when empty). Throws ValueError for an out-of-range id and
    /// UnknownColumnError for an unknown name.
    OOC_NODISCARD ChunkReader read_chunk(std::size_t chunk_id,
                                         const std::vector<std::string>& columns = {}) const;

    /// Same as read_chunk but with resolved column positions.
    OOC_NODISCARD ChunkReader read_chunk_columns(std::size_t chunk_id,
                                                 std::vector<std::size_t> columns) const;

private:
    std::filesystem::path directory_;
    std::shared_ptr<const store::MetadataIndex> index_;
};

// =============================================================================
// ChunkReader - Restartable Row Cursor over One Chunk
// =============================================================================

class ChunkReader {
public:
    ChunkReader(std::filesystem::path file,
                std::shared_ptr<const store::MetadataIndex> index,
                std::vector<std::size_t> columns,
                std::uint64_t expected_rows);

    /// Fills `out` with the next row. Column blocks are read on the first
    /// call. Returns false when the chunk is exhausted.
    bool next(Row& out);

    /// Rewind to the first row. Already loaded blocks are kept.
    void reset() noexcept { position_ = 0; }

    OOC_NODISCARD std::uint64_t rows() const noexcept { return expected_rows_; }
    OOC_NODISCARD std::uint64_t position() const noexcept { return position_; }
    OOC_NODISCARD const std::vector<std::size_t>& columns() const noexcept { return columns_; }
    OOC_NODISCARD bool loaded() const noexcept { return loaded_; }

private:
    void load();

    std::filesystem::path file_;
    std::shared_ptr<const store::MetadataIndex> index_;
    std::vector<std::size_t> columns_;
    std::uint64_t expected_rows_;
    std::uint64_t position_ = 0;
    bool loaded_ = false;
    std::vector<store::ColumnBlock> blocks_;
};

// =============================================================================
// DatasetWriter - Streaming Chunk Writer Holding the Destination Lock
// =============================================================================

class DatasetWriter {
public:
    DatasetWriter(store::WriterLock lock, Schema schema,
                  std::uint64_t chunk_rows, const StoreConfig& config);

    DatasetWriter(DatasetWriter&&) noexcept = default;
    DatasetWriter& operator=(DatasetWriter&&) noexcept = default;
    DatasetWriter(const DatasetWriter&) = delete;
    DatasetWriter& operator=(const DatasetWriter&) = delete;

    /// Buffer one row; a full chunk is written to disk immediately.
    void append(const Row& row);

    /// Write the tail chunk and the metadata, release the lock and return
    /// the new Dataset. The writer cannot be used afterwards.
    Dataset finish();

    OOC_NODISCARD const Schema& schema() const noexcept { return schema_; }
    OOC_NODISCARD std::uint64_t rows_written() const noexcept { return rows_written_; }
    OOC_NODISCARD std::size_t chunks_written() const noexcept { return chunks_.size(); }

private:
    void flush_chunk();

    store::WriterLock lock_;
    Schema schema_;
    std::uint64_t chunk_rows_;
    Codec codec_;
    int level_;
    std::vector<store::ColumnBuilder> builders_;
    std::vector<store::CategoryDictionary> dicts_;
    std::vector<store::ChunkEntry> chunks_;
    std::uint64_t pending_ = 0;
    std::uint64_t rows_written_ = 0;
    bool finished_ = false;
    bool failed_ = false;
};

// =============================================================================
// ChunkStore - Entry Point
// =============================================================================

class ChunkStore {
public:
    explicit ChunkStore(StoreConfig config = {});

    OOC_NODISCARD const StoreConfig& config() const noexcept { return config_; }

    /// Ingest a delimited stream into `destination`, `chunk_row_count` rows
    /// per chunk. Column types come from `opts.column_types` or are inferred
    /// from the first chunk of records.
    Dataset create(std::istream& input, std::uint64_t chunk_row_count,
                   const std::filesystem::path& destination,
                   const ReadOptions& opts = {}) const;

    /// create() over a file path. Throws IOError if it cannot be opened.
    Dataset create_from_file(const std::filesystem::path& input, std::uint64_t chunk_row_count,
                             const std::filesystem::path& destination,
                             const ReadOptions& opts = {}) const;

    /// Reload a dataset from its metadata and chunk headers only.
    Dataset open_existing(const std::filesystem::path& path) const;

    /// Exclusive streaming writer. The destination must not exist or be empty.
    DatasetWriter open_writer(const std::filesystem::path& destination,
                              const Schema& schema, std::uint64_t chunk_row_count) const;

    /// Remove a dataset directory, including partial chunks of a failed
    /// write. Refuses directories holding anything but dataset files.
    void discard(const std::filesystem::path& destination) const;

    OOC_NODISCARD ChunkReader read_chunk(const Dataset& dataset, std::size_t chunk_id,
                                         const std::vector<std::string>& columns = {}) const {
        return dataset.read_chunk(chunk_id, columns);
    }

    /// `path` if absolute, otherwise relative to the configured root.
    OOC_NODISCARD std::filesystem::path resolve(const std::filesystem::path& path) const;

private:
    StoreConfig config_;
};

/// File name of chunk `id` ("chunk_000042.oocc").
std::string chunk_file_name(std::size_t id);

} // namespace ooc
