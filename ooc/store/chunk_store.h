// =============================================================================
// FILE: ooc/store/chunk_store.h
// BRIEF: API reference for the chunk store and its dataset handles
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "ooc/core/config.hpp"
#include "ooc/store/schema.hpp"

namespace ooc {

/* -----------------------------------------------------------------------------
 * ON-DISK LAYOUT
 * -----------------------------------------------------------------------------
 *     <dataset>/
 *         metadata.h5          schema, chunk index, categorical levels
 *         chunk_000000.oocc    first chunk
 *         chunk_000001.oocc    ...
 *         .ooc.lock            present while a writer is active
 *
 *     Chunk file:
 *         32-byte header       magic "OOCCHNK1", version, codec,
 *                              row_count, column_count
 *         column directory     per column: type, offset, stored size,
 *                              raw size
 *         column blocks        validity bitmap then values, each block
 *                              compressed with the dataset codec
 *
 *     Every chunk except the last holds exactly chunk_row_capacity rows.
 * -------------------------------------------------------------------------- */

/* -----------------------------------------------------------------------------
 * CLASS: ChunkStore
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Entry point for creating, opening and removing chunked datasets.
 *     Stateless apart from its StoreConfig; relative paths resolve against
 *     config.root.
 *
 * THREAD SAFETY:
 *     Safe - concurrent readers share nothing mutable. Writers to the same
 *     destination exclude each other through the dataset lock file and an
 *     in-process registry.
 * -------------------------------------------------------------------------- */
class ChunkStore {
public:
    /* -------------------------------------------------------------------------
     * METHOD: create
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Stream a delimited text source into a new dataset.
     *
     * PARAMETERS:
     *     input            [in] Delimited text; the first record is the
     *                           header unless opts.header is false
     *     chunk_row_count  [in] Rows per chunk, > 0
     *     destination      [in] Directory; must not exist or be empty
     *     opts             [in] Separator, NA tokens, type overrides
     *
     * POSTCONDITIONS:
     *     - Dataset rows equal the input records in order
     *     - Column types are opts.column_types where given, otherwise
     *       inferred from the first chunk of records
     *
     * THROWS:
     *     ValueError           - chunk_row_count == 0
     *     UnknownColumnError   - a type override names no column
     *     ParseError           - record width or value does not parse
     *     IOError              - destination not empty
     *     FeatureUnavailableError - zstd codec without zstd support
     *
     * ON FAILURE:
     *     Partial chunks stay in the destination; remove them with discard.
     * ---------------------------------------------------------------------- */
    Dataset create(std::istream& input, std::uint64_t chunk_row_count,
                   const std::filesystem::path& destination,
                   const ReadOptions& opts = {}) const;

    /* -------------------------------------------------------------------------
     * METHOD: open_existing
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Reload a dataset handle. Reads metadata and each chunk header;
     *     column data is not touched.
     *
     * THROWS:
     *     CorruptMetadataError - metadata missing or unreadable, a chunk
     *                            missing, or a chunk header or size that
     *                            disagrees with the index
     * ---------------------------------------------------------------------- */
    Dataset open_existing(const std::filesystem::path& path) const;

    /* -------------------------------------------------------------------------
     * METHOD: open_writer
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Exclusive streaming writer used by create and by the executor.
     *     Rows are appended one at a time; a chunk is flushed every
     *     chunk_row_count rows and metadata is written by finish().
     *
     * THROWS:
     *     ConcurrentWriteError - another writer holds the destination
     *     IOError              - destination not empty
     *
     * LIFETIME:
     *     Destroying an unfinished writer releases the lock and leaves the
     *     partial dataset without metadata.
     * ---------------------------------------------------------------------- */
    DatasetWriter open_writer(const std::filesystem::path& destination,
                              const Schema& schema, std::uint64_t chunk_row_count) const;

    /* -------------------------------------------------------------------------
     * METHOD: discard
     * -------------------------------------------------------------------------
     * SUMMARY:
     *     Remove a dataset directory, complete or partial. A missing
     *     directory is a no-op.
     *
     * THROWS:
     *     ConcurrentWriteError - a writer is active on the directory
     *     IOError              - the directory holds foreign files
     * ---------------------------------------------------------------------- */
    void discard(const std::filesystem::path& destination) const;
};

/* -----------------------------------------------------------------------------
 * CLASS: Dataset
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Cheap, copyable handle over an opened dataset: directory, schema and
 *     metadata index. Renames act on the handle only and are never
 *     written back.
 *
 * METHODS:
 *     schema()          Column names and types
 *     row_count()       Total rows
 *     chunk_count()     Number of chunk files
 *     describe()        Summary (columns, rows, types, names, chunks)
 *     rename(a, b)      New handle with column a called b
 *     read_chunk(i, c)  Lazy reader over chunk i restricted to columns c
 *
 * THROWS:
 *     UnknownColumnError - rename or read_chunk names a missing column
 *     DuplicateNameError - rename target already exists
 *     ValueError         - chunk id out of range
 * -------------------------------------------------------------------------- */

} // namespace ooc
