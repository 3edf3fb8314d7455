// =============================================================================
// OOC - Chunk Store Tests
// =============================================================================
//
// Ingestion, reopening, chunk reads, writer exclusivity and discard.
//
// =============================================================================

#include "test.hpp"

#include "ooc/config.hpp"
#include "ooc/core/error.hpp"
#include "ooc/store/chunk_store.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <latch>
#include <optional>
#include <thread>

using namespace ooc;

namespace {

/// Data lines of a delimited text, header dropped.
std::vector<std::string> body_lines(const std::string& csv) {
    std::vector<std::string> lines;
    std::istringstream in(csv);
    std::string line;
    std::getline(in, line);
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

ReadOptions numbered_types() {
    ReadOptions opts;
    opts.column_types["score"] = ColumnType::Float;
    return opts;
}

} // namespace

OOC_TEST_BEGIN

// =============================================================================
// Creation
// =============================================================================

OOC_TEST_UNIT(create_splits_rows_into_chunks) {
    test::TempDir dir;
    test::Random rng(7);
    const std::string csv = test::numbered_csv(25, rng);

    Dataset ds = test::make_dataset(dir, "numbers", csv, 10, numbered_types());
    OOC_ASSERT_EQ(ds.row_count(), std::uint64_t{25});
    OOC_ASSERT_EQ(ds.chunk_count(), std::size_t{3});
    OOC_ASSERT_EQ(ds.index().chunks()[0].rows, std::uint64_t{10});
    OOC_ASSERT_EQ(ds.index().chunks()[2].rows, std::uint64_t{5});

    OOC_ASSERT_TRUE(std::filesystem::exists(dir / "numbers" / "chunk_000002.oocc"));
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "numbers" / store::kLockFileName));

    const auto rows = test::rows_text(test::read_all(ds));
    OOC_ASSERT_TRUE(rows == body_lines(csv));
}

OOC_TEST_UNIT(create_infers_column_types) {
    test::TempDir dir;
    test::Random rng;
    Dataset ds = test::make_dataset(dir, "numbers", test::numbered_csv(40, rng), 1000);

    const Schema& s = ds.schema();
    OOC_ASSERT_STR_EQ("id:integer, score:float, grade:string, day:date", s.to_string());
    OOC_ASSERT_EQ(ds.chunk_count(), std::size_t{1});
}

OOC_TEST_UNIT(chunk_file_names) {
    OOC_ASSERT_STR_EQ("chunk_000000.oocc", chunk_file_name(0));
    OOC_ASSERT_STR_EQ("chunk_000042.oocc", chunk_file_name(42));
}

OOC_TEST_UNIT(create_without_header) {
    test::TempDir dir;
    ReadOptions opts;
    opts.header = false;
    Dataset ds = test::make_dataset(dir, "plain", "1,x\n2,y\n", 10, opts);
    OOC_ASSERT_EQ(ds.row_count(), std::uint64_t{2});
    OOC_ASSERT_STR_EQ("V1:integer, V2:string", ds.schema().to_string());
}

OOC_TEST_UNIT(create_names_empty_header_cells) {
    test::TempDir dir;
    Dataset ds = test::make_dataset(dir, "blank", "a,,c\n1,2,3\n", 10);
    OOC_ASSERT_STR_EQ("V2", ds.schema()[1].name);
}

OOC_TEST_UNIT(create_header_only) {
    test::TempDir dir;
    Dataset ds = test::make_dataset(dir, "empty", "a,b\n", 10);
    OOC_ASSERT_EQ(ds.row_count(), std::uint64_t{0});
    OOC_ASSERT_EQ(ds.chunk_count(), std::size_t{0});
    OOC_ASSERT_EQ(ds.schema().size(), std::size_t{2});

    ChunkStore store;
    Dataset reopened = store.open_existing(dir / "empty");
    OOC_ASSERT_EQ(reopened.row_count(), std::uint64_t{0});
    OOC_ASSERT_THROWS((void)reopened.read_chunk(0), ValueError);
}

OOC_TEST_UNIT(create_handles_na_and_empty_strings) {
    test::TempDir dir;
    ReadOptions opts;
    opts.na_strings = {"NA"};
    Dataset ds = test::make_dataset(dir, "na", "n,s\n1,NA\nNA,\"\"\n3,\"NA\"\n", 10, opts);
    OOC_ASSERT_TRUE(ds.schema()[0].type == ColumnType::Integer);

    auto rows = test::read_all(ds);
    OOC_ASSERT_EQ(rows.size(), std::size_t{3});
    OOC_ASSERT_TRUE(is_na(rows[0][1]));
    OOC_ASSERT_TRUE(is_na(rows[1][0]));
    OOC_ASSERT_FALSE(is_na(rows[1][1]));
    OOC_ASSERT_STR_EQ("", std::get<std::string>(rows[1][1]));
    OOC_ASSERT_STR_EQ("NA", std::get<std::string>(rows[2][1]));
}

OOC_TEST_UNIT(create_categorical_levels_survive_reopen) {
    test::TempDir dir;
    ReadOptions opts;
    opts.strings_as_categorical = true;
    Dataset ds = test::make_dataset(dir, "cat", "g\nred\nblue\nred\n\ngreen\n", 2, opts);
    OOC_ASSERT_TRUE(ds.schema()[0].type == ColumnType::Categorical);

    ChunkStore store;
    Dataset reopened = store.open_existing(dir / "cat");
    OOC_ASSERT_NOT_NULL(reopened.index().levels(0));
    OOC_ASSERT_EQ(reopened.index().levels(0)->size(), std::size_t{3});

    std::vector<std::string> expected = {"red", "blue", "red", "", "green"};
    const auto rows = test::read_all(reopened);
    OOC_ASSERT_TRUE(test::rows_text(rows) == expected);
    OOC_ASSERT_TRUE(is_na(rows[3][0]));
}

OOC_TEST_UNIT(create_respects_explicit_types) {
    test::TempDir dir;
    ReadOptions opts;
    opts.column_types["code"] = ColumnType::String;
    Dataset ds = test::make_dataset(dir, "typed", "code,v\n007,1\n010,2\n", 10, opts);
    OOC_ASSERT_TRUE(ds.schema()[0].type == ColumnType::String);
    OOC_ASSERT_STR_EQ("007", std::get<std::string>(test::read_all(ds)[0][0]));
}

OOC_TEST_UNIT(create_rejects_unknown_type_override) {
    test::TempDir dir;
    ReadOptions opts;
    opts.column_types["missing"] = ColumnType::Integer;
    OOC_ASSERT_THROWS(test::make_dataset(dir, "bad", "a\n1\n", 10, opts), UnknownColumnError);
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "bad"));
}

OOC_TEST_UNIT(create_reports_bad_width_line) {
    test::TempDir dir;
    try {
        test::make_dataset(dir, "ragged", "a,b\n1,2\n3\n", 10);
        OOC_FAIL("expected ParseError");
    } catch (const ParseError& e) {
        OOC_ASSERT_EQ(e.line(), std::size_t{3});
    }
}

OOC_TEST_UNIT(create_reports_bad_value_line) {
    test::TempDir dir;
    ReadOptions opts;
    opts.column_types["id"] = ColumnType::Integer;
    try {
        test::make_dataset(dir, "badvalue", "id\n1\n2\nx\n", 2, opts);
        OOC_FAIL("expected ParseError");
    } catch (const ParseError& e) {
        OOC_ASSERT_EQ(e.line(), std::size_t{4});
        OOC_ASSERT_STR_CONTAINS(e.what(), "'x'");
    }

    // The partial output is left for discard
    OOC_ASSERT_TRUE(std::filesystem::exists(dir / "badvalue" / "chunk_000000.oocc"));
    ChunkStore store;
    store.discard(dir / "badvalue");
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "badvalue"));
}

OOC_TEST_UNIT(create_rejects_non_empty_destination) {
    test::TempDir dir;
    std::filesystem::create_directories(dir / "busy");
    test::write_text(dir / "busy" / "notes.txt", "keep me");
    OOC_ASSERT_THROWS(test::make_dataset(dir, "busy", "a\n1\n", 10), IOError);
    OOC_ASSERT_TRUE(std::filesystem::exists(dir / "busy" / "notes.txt"));

    test::make_dataset(dir, "done", "a\n1\n", 10);
    OOC_ASSERT_THROWS(test::make_dataset(dir, "done", "a\n2\n", 10), IOError);
}

OOC_TEST_UNIT(create_from_missing_file) {
    test::TempDir dir;
    ChunkStore store;
    OOC_ASSERT_THROWS(store.create_from_file(dir / "nope.csv", 10, dir / "out"), IOError);
}

OOC_TEST_UNIT(create_from_file_with_relative_root) {
    test::TempDir dir;
    test::write_text(dir / "in.tsv", "a\tb\n1\t2\n");
    StoreConfig config;
    config.root = dir.path().string();
    ChunkStore store(config);

    ReadOptions opts;
    opts.separator = '\t';
    Dataset ds = store.create_from_file("in.tsv", 10, "tsv", opts);
    OOC_ASSERT_TRUE(ds.directory() == dir / "tsv");
    OOC_ASSERT_EQ(store.open_existing("tsv").row_count(), std::uint64_t{1});
}

OOC_TEST_UNIT(zstd_store) {
    test::TempDir dir;
    StoreConfig config;
    config.codec = Codec::Zstd;
    test::Random rng;
    const std::string csv = test::numbered_csv(50, rng);

    if (!kHasZstd) {
        OOC_ASSERT_THROWS(test::make_dataset(dir, "z", csv, 20, numbered_types(), config),
                          FeatureUnavailableError);
        OOC_SKIP("built without zstd");
    }
    Dataset ds = test::make_dataset(dir, "z", csv, 20, numbered_types(), config);
    OOC_ASSERT_TRUE(ds.index().codec() == Codec::Zstd);
    Dataset reopened = ChunkStore(config).open_existing(dir / "z");
    OOC_ASSERT_TRUE(test::rows_text(test::read_all(reopened)) == body_lines(csv));
}

// =============================================================================
// Reopen and Read
// =============================================================================

OOC_TEST_UNIT(open_existing_matches_created) {
    test::TempDir dir;
    test::Random rng(3);
    Dataset created = test::make_dataset(dir, "n", test::numbered_csv(33, rng), 8, numbered_types());

    ChunkStore store;
    Dataset opened = store.open_existing(dir / "n");
    OOC_ASSERT_TRUE(opened.schema() == created.schema());
    OOC_ASSERT_EQ(opened.row_count(), created.row_count());
    OOC_ASSERT_EQ(opened.chunk_count(), std::size_t{5});
    OOC_ASSERT_EQ(opened.chunk_row_capacity(), std::uint64_t{8});
    OOC_ASSERT_TRUE(test::rows_text(test::read_all(opened)) == test::rows_text(test::read_all(created)));

    const auto& d = opened.describe();
    OOC_ASSERT_EQ(d.row_count, std::uint64_t{33});
    OOC_ASSERT_EQ(d.chunk_count, std::size_t{5});
    OOC_ASSERT_STR_EQ("day", d.column_names[3]);
}

OOC_TEST_UNIT(read_chunk_is_lazy_and_restartable) {
    test::TempDir dir;
    test::Random rng;
    Dataset ds = test::make_dataset(dir, "n", test::numbered_csv(12, rng), 5, numbered_types());

    ChunkStore store;
    ChunkReader reader = store.read_chunk(ds, 1, {"grade", "id"});
    OOC_ASSERT_FALSE(reader.loaded());
    OOC_ASSERT_EQ(reader.rows(), std::uint64_t{5});

    std::vector<std::string> first;
    Row row;
    while (reader.next(row)) {
        OOC_ASSERT_EQ(row.size(), std::size_t{2});
        first.push_back(test::row_text(row));
    }
    OOC_ASSERT_TRUE(reader.loaded());
    OOC_ASSERT_STR_EQ("b,5", first[0]);

    reader.reset();
    OOC_ASSERT_EQ(reader.position(), std::uint64_t{0});
    std::vector<std::string> second;
    while (reader.next(row)) {
        second.push_back(test::row_text(row));
    }
    OOC_ASSERT_TRUE(first == second);
}

OOC_TEST_UNIT(read_chunk_argument_errors) {
    test::TempDir dir;
    Dataset ds = test::make_dataset(dir, "small", "a,b\n1,2\n", 10);
    OOC_ASSERT_THROWS((void)ds.read_chunk(1), ValueError);
    OOC_ASSERT_THROWS((void)ds.read_chunk(0, {"zzz"}), UnknownColumnError);
    OOC_ASSERT_THROWS((void)Dataset().read_chunk(0), ValueError);
}

OOC_TEST_UNIT(rename_is_a_new_handle) {
    test::TempDir dir;
    Dataset ds = test::make_dataset(dir, "r", "a,b\n1,x\n2,y\n", 10);
    Dataset renamed = ds.rename("b", "label");

    OOC_ASSERT_TRUE(renamed.schema().contains("label"));
    OOC_ASSERT_TRUE(ds.schema().contains("b"));

    ChunkReader reader = renamed.read_chunk(0, {"label"});
    Row row;
    OOC_ASSERT_TRUE(reader.next(row));
    OOC_ASSERT_STR_EQ("x", std::get<std::string>(row[0]));

    // Not persisted
    ChunkStore store;
    OOC_ASSERT_TRUE(store.open_existing(dir / "r").schema().contains("b"));

    OOC_ASSERT_THROWS((void)ds.rename("a", "b"), DuplicateNameError);
    OOC_ASSERT_THROWS((void)ds.rename("q", "z"), UnknownColumnError);
}

// =============================================================================
// Corruption Detection
// =============================================================================

OOC_TEST_UNIT(open_missing_metadata) {
    test::TempDir dir;
    ChunkStore store;
    OOC_ASSERT_THROWS(store.open_existing(dir.path()), CorruptMetadataError);
}

OOC_TEST_UNIT(open_detects_missing_chunk) {
    test::TempDir dir;
    test::Random rng;
    test::make_dataset(dir, "n", test::numbered_csv(30, rng), 10, numbered_types());
    std::filesystem::remove(dir / "n" / "chunk_000001.oocc");

    ChunkStore store;
    OOC_ASSERT_THROWS(store.open_existing(dir / "n"), CorruptMetadataError);
}

OOC_TEST_UNIT(open_detects_truncated_chunk) {
    test::TempDir dir;
    test::Random rng;
    test::make_dataset(dir, "n", test::numbered_csv(30, rng), 10, numbered_types());
    const auto chunk = dir / "n" / "chunk_000002.oocc";
    std::filesystem::resize_file(chunk, std::filesystem::file_size(chunk) - 3);

    ChunkStore store;
    OOC_ASSERT_THROWS(store.open_existing(dir / "n"), CorruptMetadataError);
}

OOC_TEST_UNIT(open_detects_row_count_mismatch) {
    test::TempDir dir;
    test::Random rng;
    Dataset ds = test::make_dataset(dir, "n", test::numbered_csv(30, rng), 10, numbered_types());

    auto chunks = ds.index().chunks();
    chunks[0].rows = 9;
    std::vector<std::vector<std::string>> levels;
    store::MetadataIndex tampered(ds.schema(), 10, Codec::None, chunks, levels);
    tampered.save(dir / "n");

    ChunkStore store;
    OOC_ASSERT_THROWS(store.open_existing(dir / "n"), CorruptMetadataError);
}

OOC_TEST_UNIT(reader_detects_chunk_replaced_after_open) {
    test::TempDir dir;
    Dataset ds = test::make_dataset(dir, "a", "x\n1\n2\n3\n", 2);
    test::make_dataset(dir, "b", "x\n7\n8\n9\n", 3);
    std::filesystem::remove(dir / "a" / "chunk_000000.oocc");
    std::filesystem::copy_file(dir / "b" / "chunk_000000.oocc", dir / "a" / "chunk_000000.oocc");

    ChunkReader reader = ds.read_chunk(0);
    Row row;
    OOC_ASSERT_THROWS(reader.next(row), CorruptMetadataError);
}

// =============================================================================
// Writers and Discard
// =============================================================================

OOC_TEST_UNIT(writer_streams_rows) {
    test::TempDir dir;
    ChunkStore store;
    Schema schema({{"k", ColumnType::Integer}, {"v", ColumnType::String}});

    DatasetWriter writer = store.open_writer(dir / "w", schema, 3);
    for (std::int64_t i = 0; i < 7; ++i) {
        writer.append(Row{Value{i}, Value{std::to_string(i * i)}});
    }
    OOC_ASSERT_EQ(writer.chunks_written(), std::size_t{2});
    OOC_ASSERT_THROWS(writer.append(Row{Value{std::int64_t{1}}}), ValueError);

    Dataset ds = writer.finish();
    OOC_ASSERT_EQ(ds.row_count(), std::uint64_t{7});
    OOC_ASSERT_EQ(ds.chunk_count(), std::size_t{3});
    OOC_ASSERT_STR_EQ("6,36", test::rows_text(test::read_all(ds)).back());
    OOC_ASSERT_THROWS(writer.finish(), ValueError);
}

OOC_TEST_UNIT(second_writer_is_rejected) {
    test::TempDir dir;
    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});

    DatasetWriter first = store.open_writer(dir / "out", schema, 4);
    OOC_ASSERT_THROWS((void)store.open_writer(dir / "out", schema, 4), ConcurrentWriteError);
    OOC_ASSERT_THROWS(store.discard(dir / "out"), ConcurrentWriteError);

    first.append(Row{Value{std::int64_t{1}}});
    Dataset ds = first.finish();
    OOC_ASSERT_EQ(ds.row_count(), std::uint64_t{1});
    OOC_ASSERT_THROWS((void)store.open_writer(dir / "out", schema, 4), IOError);
}

OOC_TEST_UNIT(abandoned_writer_releases_destination) {
    test::TempDir dir;
    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});
    {
        DatasetWriter writer = store.open_writer(dir / "out", schema, 4);
        writer.append(Row{Value{std::int64_t{1}}});
    }
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "out" / store::kLockFileName));
    DatasetWriter again = store.open_writer(dir / "out", schema, 4);
    OOC_ASSERT_EQ(again.finish().row_count(), std::uint64_t{0});
}

OOC_TEST_UNIT(live_lock_file_blocks_writer) {
    test::TempDir dir;
    std::filesystem::create_directories(dir / "out");
    test::write_text(dir / "out" / store::kLockFileName, std::to_string(::getpid()) + "\n");

    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});
    OOC_ASSERT_THROWS((void)store.open_writer(dir / "out", schema, 4), ConcurrentWriteError);
    OOC_ASSERT_THROWS(store.discard(dir / "out"), ConcurrentWriteError);
}

OOC_TEST_UNIT(stale_lock_file_is_taken_over) {
    test::TempDir dir;
    std::filesystem::create_directories(dir / "out");
    test::write_text(dir / "out" / store::kLockFileName, "999999999\n");

    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});
    DatasetWriter writer = store.open_writer(dir / "out", schema, 4);
    writer.append(Row{Value{std::int64_t{5}}});
    OOC_ASSERT_EQ(writer.finish().row_count(), std::uint64_t{1});
}

OOC_TEST_UNIT(empty_lock_file_expires) {
    test::TempDir dir;
    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});

    std::filesystem::create_directories(dir / "fresh");
    test::write_text(dir / "fresh" / store::kLockFileName, "");
    OOC_ASSERT_THROWS((void)store.open_writer(dir / "fresh", schema, 4), ConcurrentWriteError);
    OOC_ASSERT_THROWS(store.discard(dir / "fresh"), ConcurrentWriteError);

    std::filesystem::create_directories(dir / "old");
    const auto lock_path = dir / "old" / store::kLockFileName;
    test::write_text(lock_path, "");
    std::filesystem::last_write_time(
        lock_path, std::filesystem::file_time_type::clock::now() - std::chrono::minutes(5));

    DatasetWriter writer = store.open_writer(dir / "old", schema, 4);
    writer.append(Row{Value{std::int64_t{7}}});
    OOC_ASSERT_EQ(writer.finish().row_count(), std::uint64_t{1});
    OOC_ASSERT_NO_THROW(store.discard(dir / "old"));
}

OOC_TEST_UNIT(racing_writers_admit_exactly_one) {
    test::TempDir dir;
    ChunkStore store;
    Schema schema({{"a", ColumnType::Integer}});

    constexpr int kWriters = 2;
    std::latch attempted(kWriters);
    std::atomic<int> rejected{0};
    std::atomic<int> admitted{0};
    std::vector<std::exception_ptr> errors(kWriters);

    std::vector<std::thread> threads;
    for (int t = 0; t < kWriters; ++t) {
        threads.emplace_back([&, t] {
            std::optional<DatasetWriter> writer;
            try {
                writer.emplace(store.open_writer(dir / "out", schema, 4));
                ++admitted;
            } catch (const ConcurrentWriteError&) {
                ++rejected;
            } catch (const std::exception&) {
                errors[t] = std::current_exception();
            }
            // The winner holds its writer until both attempts are made
            attempted.arrive_and_wait();
            if (writer) {
                try {
                    writer->append(Row{Value{std::int64_t{t}}});
                    (void)writer->finish();
                } catch (const std::exception&) {
                    errors[t] = std::current_exception();
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    OOC_ASSERT_EQ(admitted.load(), 1);
    OOC_ASSERT_EQ(rejected.load(), 1);
    OOC_ASSERT_EQ(store.open_existing(dir / "out").row_count(), std::uint64_t{1});
}

OOC_TEST_UNIT(discard_removes_dataset) {
    test::TempDir dir;
    test::make_dataset(dir, "gone", "a\n1\n2\n", 1);
    ChunkStore store;
    store.discard(dir / "gone");
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "gone"));
    OOC_ASSERT_NO_THROW(store.discard(dir / "gone"));
}

OOC_TEST_UNIT(discard_refuses_foreign_directory) {
    test::TempDir dir;
    test::make_dataset(dir, "mixed", "a\n1\n", 10);
    test::write_text(dir / "mixed" / "README", "mine");

    ChunkStore store;
    OOC_ASSERT_THROWS(store.discard(dir / "mixed"), IOError);
    OOC_ASSERT_TRUE(std::filesystem::exists(dir / "mixed" / store::kMetadataFileName));
}

OOC_TEST_END

OOC_TEST_MAIN()
