// =============================================================================
// OOC - Chunk Format and Metadata Index Tests
// =============================================================================
//
// Block encoding, chunk file layout checks and metadata.h5 persistence.
//
// =============================================================================

#include "test.hpp"

#include "ooc/config.hpp"
#include "ooc/core/error.hpp"
#include "ooc/io/file.hpp"
#include "ooc/store/chunk_format.hpp"
#include "ooc/store/metadata.hpp"

#include <filesystem>

using namespace ooc;
using namespace ooc::store;

namespace {

Schema sample_schema() {
    return Schema({{"id", ColumnType::Integer},
                   {"score", ColumnType::Float},
                   {"grade", ColumnType::Categorical},
                   {"note", ColumnType::String},
                   {"day", ColumnType::Date}});
}

} // namespace

OOC_TEST_BEGIN

// =============================================================================
// Block Encoding
// =============================================================================

OOC_TEST_UNIT(block_roundtrip_all_types) {
    CategoryDictionary dict;
    std::vector<ColumnBuilder> builders;
    const Schema schema = sample_schema();
    for (const auto& c : schema.columns()) {
        builders.emplace_back(c.type);
    }

    const Date day = *parse_date("2021-06-15");
    const std::vector<Row> rows = {
        {Value{std::int64_t{1}}, Value{0.5}, Value{std::string("x")}, Value{std::string("hello")}, Value{day}},
        {Value{}, Value{}, Value{}, Value{}, Value{}},
        {Value{std::int64_t{-3}}, Value{std::int64_t{2}}, Value{std::string("y")}, Value{std::string()}, Value{Date{0}}},
    };
    for (const auto& r : rows) {
        for (std::size_t i = 0; i < r.size(); ++i) {
            builders[i].append(r[i], &dict);
        }
    }

    std::vector<ColumnBlock> blocks;
    for (std::size_t i = 0; i < builders.size(); ++i) {
        blocks.emplace_back(schema[i].type, rows.size(), builders[i].finish());
    }

    const auto& levels = dict.levels();
    OOC_ASSERT_EQ(levels.size(), std::size_t{2});
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < schema.size(); ++c) {
            const Value got = blocks[c].value(r, schema[c].type == ColumnType::Categorical ? &levels : nullptr);
            Value want = rows[r][c];
            if (const auto* i = std::get_if<std::int64_t>(&want); i && schema[c].type == ColumnType::Float) {
                want = Value{static_cast<double>(*i)};
            }
            OOC_ASSERT_TRUE(got == want);
        }
    }
    OOC_ASSERT_FALSE(blocks[0].present(1));
    OOC_ASSERT_TRUE(blocks[3].present(2));
}

OOC_TEST_UNIT(builder_rejects_wrong_alternative) {
    ColumnBuilder b(ColumnType::Integer);
    OOC_ASSERT_THROWS(b.append(Value{std::string("1")}, nullptr), TypeMismatchError);
    ColumnBuilder d(ColumnType::Date);
    OOC_ASSERT_THROWS(d.append(Value{1.5}, nullptr), TypeMismatchError);
}

OOC_TEST_UNIT(dictionary_codes_follow_first_appearance) {
    CategoryDictionary dict;
    OOC_ASSERT_EQ(dict.code_for("b"), std::uint32_t{0});
    OOC_ASSERT_EQ(dict.code_for("a"), std::uint32_t{1});
    OOC_ASSERT_EQ(dict.code_for("b"), std::uint32_t{0});
    OOC_ASSERT_STR_EQ("a", dict.levels()[1]);
}

OOC_TEST_UNIT(block_rejects_bad_size) {
    std::vector<std::byte> raw(5);
    OOC_ASSERT_THROWS(ColumnBlock(ColumnType::Integer, 3, raw), CorruptMetadataError);
}

OOC_TEST_UNIT(codec_none_is_identity) {
    std::vector<std::byte> raw = {std::byte{1}, std::byte{2}, std::byte{3}};
    auto stored = compress_block(raw, Codec::None, 0);
    OOC_ASSERT_TRUE(stored == raw);
    OOC_ASSERT_TRUE(decompress_block(stored, raw.size(), Codec::None) == raw);
}

OOC_TEST_UNIT(codec_zstd) {
    std::vector<std::byte> raw(4096, std::byte{7});
    if (!kHasZstd) {
        OOC_ASSERT_THROWS(compress_block(raw, Codec::Zstd, 3), FeatureUnavailableError);
        OOC_SKIP("built without zstd");
    }
    auto stored = compress_block(raw, Codec::Zstd, 3);
    OOC_ASSERT_LT(stored.size(), raw.size());
    OOC_ASSERT_TRUE(decompress_block(stored, raw.size(), Codec::Zstd) == raw);
    OOC_ASSERT_THROWS(decompress_block(stored, raw.size() + 1, Codec::Zstd), CorruptMetadataError);
}

// =============================================================================
// Chunk Files
// =============================================================================

OOC_TEST_UNIT(chunk_file_layout) {
    test::TempDir dir;
    std::vector<ColumnBuilder> builders;
    builders.emplace_back(ColumnType::Integer);
    builders.emplace_back(ColumnType::String);
    for (std::int64_t i = 0; i < 10; ++i) {
        builders[0].append(Value{i}, nullptr);
        builders[1].append(Value{std::string(static_cast<std::size_t>(i), 'z')}, nullptr);
    }
    const auto path = dir / "chunk_000000.oocc";
    const auto bytes = write_chunk_file(path, Codec::None, 0, 10, builders);
    OOC_ASSERT_EQ(bytes, static_cast<std::uint64_t>(std::filesystem::file_size(path)));

    io::File file(path, io::OpenMode::Read);
    const auto layout = read_chunk_layout(file);
    OOC_ASSERT_EQ(layout.header.row_count, std::uint64_t{10});
    OOC_ASSERT_EQ(layout.header.column_count, std::uint32_t{2});
    OOC_ASSERT_EQ(layout.directory.size(), std::size_t{2});

    const auto block = read_column_block(file, layout, 1);
    OOC_ASSERT_STR_EQ("zzzz", std::get<std::string>(block.value(4, nullptr)));
}

OOC_TEST_UNIT(file_sync_on_written_chunk_and_directory) {
    test::TempDir dir;
    std::vector<ColumnBuilder> builders;
    builders.emplace_back(ColumnType::Float);
    builders[0].append(Value{1.5}, nullptr);
    const auto path = dir / "chunk_000000.oocc";
    (void)write_chunk_file(path, Codec::None, 0, 1, builders);

    OOC_ASSERT_NO_THROW(io::File(path, io::OpenMode::Read).sync());
    OOC_ASSERT_NO_THROW(io::File(dir.path(), io::OpenMode::Read).sync());

    io::File closed;
    OOC_ASSERT_THROWS(closed.sync(), IOError);
}

OOC_TEST_UNIT(chunk_file_bad_magic) {
    test::TempDir dir;
    const auto path = dir / "chunk_000000.oocc";
    test::write_text(path, std::string(64, 'x'));
    io::File file(path, io::OpenMode::Read);
    OOC_ASSERT_THROWS(read_chunk_layout(file), CorruptMetadataError);
}

OOC_TEST_UNIT(chunk_file_truncated) {
    test::TempDir dir;
    const auto path = dir / "chunk_000000.oocc";
    test::write_text(path, "OOCCHNK1");
    io::File file(path, io::OpenMode::Read);
    OOC_ASSERT_THROWS(read_chunk_layout(file), CorruptMetadataError);
}

// =============================================================================
// Metadata Index
// =============================================================================

OOC_TEST_UNIT(metadata_save_load) {
    test::TempDir dir;
    std::vector<ChunkEntry> chunks = {{"chunk_000000.oocc", 4, 100}, {"chunk_000001.oocc", 2, 60}};
    std::vector<std::vector<std::string>> levels(5);
    levels[2] = {"a", "b", "c"};
    MetadataIndex index(sample_schema(), 4, Codec::None, chunks, levels);
    index.save(dir.path());

    OOC_ASSERT_TRUE(std::filesystem::exists(dir / kMetadataFileName));
    OOC_ASSERT_FALSE(std::filesystem::exists(dir / "metadata.h5.tmp"));

    MetadataIndex loaded = MetadataIndex::load(dir.path());
    OOC_ASSERT_TRUE(loaded.schema() == index.schema());
    OOC_ASSERT_EQ(loaded.row_count(), std::uint64_t{6});
    OOC_ASSERT_EQ(loaded.chunk_row_capacity(), std::uint64_t{4});
    OOC_ASSERT_EQ(loaded.chunks().size(), std::size_t{2});
    OOC_ASSERT_STR_EQ("chunk_000001.oocc", loaded.chunks()[1].file);
    OOC_ASSERT_EQ(loaded.chunks()[1].bytes, std::uint64_t{60});

    OOC_ASSERT_NULL(loaded.levels(0));
    OOC_ASSERT_NOT_NULL(loaded.levels(2));
    OOC_ASSERT_EQ(loaded.levels(2)->size(), std::size_t{3});
    OOC_ASSERT_STR_EQ("c", (*loaded.levels(2))[2]);
}

OOC_TEST_UNIT(metadata_describe) {
    std::vector<ChunkEntry> chunks = {{"chunk_000000.oocc", 3, 10}, {"chunk_000001.oocc", 3, 10},
                                      {"chunk_000002.oocc", 1, 10}};
    MetadataIndex index(sample_schema(), 3, Codec::None, chunks, {{}, {}, {"a"}, {}, {}});
    const auto& d = index.describe();
    OOC_ASSERT_EQ(d.column_count, std::size_t{5});
    OOC_ASSERT_EQ(d.row_count, std::uint64_t{7});
    OOC_ASSERT_EQ(d.chunk_count, std::size_t{3});
    OOC_ASSERT_STR_EQ("grade", d.column_names[2]);
    OOC_ASSERT_TRUE(d.column_types[4] == ColumnType::Date);
}

OOC_TEST_UNIT(metadata_empty_dataset) {
    test::TempDir dir;
    MetadataIndex index(Schema({{"a", ColumnType::String}}), 10, Codec::None, {});
    index.save(dir.path());
    MetadataIndex loaded = MetadataIndex::load(dir.path());
    OOC_ASSERT_EQ(loaded.row_count(), std::uint64_t{0});
    OOC_ASSERT_TRUE(loaded.chunks().empty());
    OOC_ASSERT_EQ(loaded.schema().size(), std::size_t{1});
}

OOC_TEST_UNIT(metadata_rename_keeps_chunks) {
    MetadataIndex index(sample_schema(), 4, Codec::None, {{"chunk_000000.oocc", 4, 1}},
                        {{}, {}, {"a"}, {}, {}});
    MetadataIndex renamed = index.with_schema(index.rename("score", "points"));
    OOC_ASSERT_TRUE(renamed.schema().contains("points"));
    OOC_ASSERT_EQ(renamed.chunks().size(), std::size_t{1});
    OOC_ASSERT_NOT_NULL(renamed.levels(2));
    OOC_ASSERT_THROWS((void)index.rename("nope", "x"), UnknownColumnError);
}

OOC_TEST_UNIT(metadata_missing_file) {
    test::TempDir dir;
    OOC_ASSERT_THROWS(MetadataIndex::load(dir.path()), CorruptMetadataError);
}

OOC_TEST_UNIT(metadata_garbage_file) {
    test::TempDir dir;
    test::write_text(dir / kMetadataFileName, "this is not hdf5");
    OOC_ASSERT_THROWS(MetadataIndex::load(dir.path()), CorruptMetadataError);
}

OOC_TEST_END

OOC_TEST_MAIN()
