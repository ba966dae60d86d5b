#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/util/compression.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include "fswriter/csv_writer.hpp"
#include "fswriter/data_writer_builder.hpp"
#include "fswriter/errors.hpp"
#include "fswriter/parquet_writer.hpp"
#include "fswriter/simple_data_writer.hpp"
#include "test_file_system.hpp"

namespace fswriter {
namespace test {

namespace {

std::shared_ptr<arrow::Schema> event_schema() {
    return arrow::schema({
        arrow::field("id", arrow::int64()),
        arrow::field("name", arrow::utf8()),
        arrow::field("score", arrow::float64()),
    });
}

RecordBatchPtr make_batch(const std::vector<int64_t>& ids,
                          const std::vector<std::optional<std::string>>& names,
                          const std::vector<double>& scores) {
    arrow::Int64Builder id_builder;
    arrow::StringBuilder name_builder;
    arrow::DoubleBuilder score_builder;

    for (size_t i = 0; i < ids.size(); ++i) {
        check_status(id_builder.Append(ids[i]), "append id");
        if (names[i]) {
            check_status(name_builder.Append(*names[i]), "append name");
        } else {
            check_status(name_builder.AppendNull(), "append null");
        }
        check_status(score_builder.Append(scores[i]), "append score");
    }

    auto id_array = value_or_throw(id_builder.Finish(), "finish id");
    auto name_array = value_or_throw(name_builder.Finish(), "finish name");
    auto score_array = value_or_throw(score_builder.Finish(), "finish score");
    return arrow::RecordBatch::Make(event_schema(), static_cast<int64_t>(ids.size()),
                                    {id_array, name_array, score_array});
}

std::unique_ptr<parquet::arrow::FileReader> open_parquet(const std::string& path) {
    auto infile = value_or_throw(arrow::io::ReadableFile::Open(path), "open " + path);
    parquet::arrow::FileReaderBuilder builder;
    check_status(builder.Open(infile), "open parquet");
    std::unique_ptr<parquet::arrow::FileReader> reader;
    check_status(builder.Build(&reader), "build reader");
    return reader;
}

}  // namespace

class RecordWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        props.set(keys::WRITER_STAGING_DIR, dir / "staging");
        props.set(keys::WRITER_OUTPUT_DIR, dir / "output");
    }

    WriterIdentity identity(const std::string& file_name) const {
        WriterIdentity id;
        id.id = "w1";
        id.file_name = file_name;
        return id;
    }

    std::string output_file(const std::string& name) const {
        return dir / ("output/" + name);
    }

    TempDir dir;
    Properties props;
    std::shared_ptr<FaultInjectingFileSystem> storage = std::make_shared<FaultInjectingFileSystem>();
};

// =====================================================================
// CsvDataWriter
// =====================================================================

TEST(CsvEscapeTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(CsvDataWriter::escape_csv_value("plain"), "plain");
    EXPECT_EQ(CsvDataWriter::escape_csv_value("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvDataWriter::escape_csv_value("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CsvDataWriter::escape_csv_value("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(CsvDataWriter::escape_csv_value(""), "");
}

TEST_F(RecordWriterTest, CsvWritesHeaderOnceAndRows) {
    CsvDataWriter writer(identity("events.csv"), props, storage);
    writer.write(make_batch({1, 2}, {"alice", std::nullopt}, {1.5, 2.0}));
    writer.write(make_batch({3}, {"smith, john"}, {0.25}));
    writer.commit();

    EXPECT_EQ(read_file(output_file("events.csv")),
              "id,name,score\n"
              "1,alice,1.5\n"
              "2,,2\n"
              "3,\"smith, john\",0.25\n");
    EXPECT_EQ(writer.records_written(), 3);
    EXPECT_EQ(writer.bytes_written(),
              static_cast<int64_t>(fs::file_size(output_file("events.csv"))));
}

TEST_F(RecordWriterTest, CsvRejectsNullBatch) {
    CsvDataWriter writer(identity("events.csv"), props, storage);
    EXPECT_THROW(writer.write(nullptr), std::invalid_argument);
}

TEST_F(RecordWriterTest, CsvRecordCountInFileName) {
    props.set(keys::WRITER_INCLUDE_RECORD_COUNT_IN_FILE_NAMES, "true");
    CsvDataWriter writer(identity("events.csv"), props, storage);
    writer.write(make_batch({1, 2, 3, 4}, {"a", "b", "c", "d"}, {1, 2, 3, 4}));
    writer.commit();

    EXPECT_TRUE(fs::exists(output_file("events.4.csv")));
}

TEST_F(RecordWriterTest, CsvCleanupDiscardsRows) {
    CsvDataWriter writer(identity("events.csv"), props, storage);
    writer.write(make_batch({1}, {"a"}, {1}));
    writer.cleanup();

    EXPECT_FALSE(fs::exists(dir / "staging/events.csv"));
    EXPECT_FALSE(fs::exists(output_file("events.csv")));
}

// =====================================================================
// ParquetDataWriter
// =====================================================================

TEST_F(RecordWriterTest, ParquetReadBack) {
    ParquetDataWriter writer(identity("events.parquet"), props, storage, {}, event_schema());
    writer.write(make_batch({1, 2, 3}, {"a", "b", std::nullopt}, {0.1, 0.2, 0.3}));
    writer.write(make_batch({4, 5}, {"d", "e"}, {0.4, 0.5}));
    writer.commit();

    EXPECT_EQ(writer.records_written(), 5);
    std::string path = output_file("events.parquet");
    EXPECT_EQ(writer.bytes_written(), static_cast<int64_t>(fs::file_size(path)));

    auto reader = open_parquet(path);
    EXPECT_EQ(reader->parquet_reader()->metadata()->num_rows(), 5);

    std::shared_ptr<arrow::Table> table;
    check_status(reader->ReadTable(&table), "read table");
    ASSERT_EQ(table->num_rows(), 5);
    EXPECT_TRUE(table->schema()->Equals(*event_schema(), false));

    auto ids = std::static_pointer_cast<arrow::Int64Array>(table->column(0)->chunk(0));
    EXPECT_EQ(ids->Value(0), 1);
    EXPECT_EQ(table->column(1)->null_count(), 1);
}

TEST_F(RecordWriterTest, ParquetSchemaFromFirstBatch) {
    ParquetDataWriter writer(identity("events.parquet"), props, storage);
    writer.write(make_batch({1}, {"a"}, {1.0}));

    auto other = arrow::RecordBatch::Make(
        arrow::schema({arrow::field("other", arrow::int64())}), 0,
        {value_or_throw(arrow::Int64Builder().Finish(), "finish")});
    EXPECT_THROW(writer.write(other), std::invalid_argument);

    writer.commit();
    auto reader = open_parquet(output_file("events.parquet"));
    EXPECT_EQ(reader->parquet_reader()->metadata()->num_rows(), 1);
}

TEST_F(RecordWriterTest, ParquetEmptyWithSchemaIsValidFile) {
    ParquetDataWriter writer(identity("events.parquet"), props, storage, {}, event_schema());
    writer.commit();

    auto reader = open_parquet(output_file("events.parquet"));
    EXPECT_EQ(reader->parquet_reader()->metadata()->num_rows(), 0);
    EXPECT_EQ(writer.records_written(), 0);
}

TEST_F(RecordWriterTest, ParquetEmptyWithoutSchemaIsEmptyFile) {
    ParquetDataWriter writer(identity("events.parquet"), props, storage);
    writer.commit();
    EXPECT_EQ(fs::file_size(output_file("events.parquet")), 0u);
}

TEST_F(RecordWriterTest, ParquetCompressionSetting) {
    props.set(keys::WRITER_PARQUET_COMPRESSION, "uncompressed");
    ParquetDataWriter writer(identity("events.parquet"), props, storage, {}, event_schema());
    EXPECT_EQ(writer.compression(), arrow::Compression::UNCOMPRESSED);
    writer.write(make_batch({1}, {"a"}, {1.0}));
    writer.commit();

    auto reader = open_parquet(output_file("events.parquet"));
    auto metadata = reader->parquet_reader()->metadata();
    ASSERT_EQ(metadata->num_row_groups(), 1);
    auto row_group = metadata->RowGroup(0);
    auto column = row_group->ColumnChunk(0);
    EXPECT_EQ(column->compression(), arrow::Compression::UNCOMPRESSED);
}

TEST_F(RecordWriterTest, ParquetUnknownCompressionThrows) {
    props.set(keys::WRITER_PARQUET_COMPRESSION, "deflate64");
    EXPECT_THROW(ParquetDataWriter(identity("events.parquet"), props, storage), std::invalid_argument);
}

TEST_F(RecordWriterTest, ParquetSpeculativeAttemptSafety) {
    auto id = identity("events.parquet");
    id.attempt_id = "attempt_0";
    ParquetDataWriter writer(id, props, storage);
    EXPECT_TRUE(writer.is_speculative_attempt_safe());
    writer.cleanup();
}

// =====================================================================
// DataWriterBuilder
// =====================================================================

TEST_F(RecordWriterTest, BuilderDefaultFileNames) {
    DataWriterBuilder builder(props);
    builder.with_writer_id("task-7");
    EXPECT_EQ(builder.identity().file_name, "part.task-7.txt");
    builder.with_format("csv");
    EXPECT_EQ(builder.identity().file_name, "part.task-7.csv");
    builder.with_format("parquet");
    EXPECT_EQ(builder.identity().file_name, "part.task-7.parquet");
}

TEST_F(RecordWriterTest, BuilderBranchScopedFileNameAndCodecs) {
    props.set("writer.file.name.1", "custom.txt");
    props.set("writer.codec.types.1", "base64");
    props.set("writer.codec.types.0", "");

    DataWriterBuilder builder(props);
    builder.with_writer_id("w").with_branches(2).for_branch(1);

    EXPECT_EQ(builder.identity().file_name, "custom.txt");
    ASSERT_EQ(builder.encoders().size(), 1u);
    EXPECT_EQ(builder.encoders()[0]->tag(), "base64");

    builder.for_branch(0);
    EXPECT_EQ(builder.identity().file_name, "part.w.txt");
    EXPECT_TRUE(builder.encoders().empty());
}

TEST_F(RecordWriterTest, BuilderValidatesIdentity) {
    DataWriterBuilder builder(props);
    EXPECT_THROW(builder.identity(), std::invalid_argument);

    builder.with_writer_id("w").with_branches(2).for_branch(2);
    EXPECT_THROW(builder.identity(), std::invalid_argument);

    builder.for_branch(0).with_format("avro");
    EXPECT_THROW(builder.identity(), std::invalid_argument);
}

TEST_F(RecordWriterTest, BuilderRejectsFormatMismatch) {
    DataWriterBuilder builder(props);
    builder.with_writer_id("w").with_file_system(storage).with_format("csv");
    EXPECT_THROW(builder.build_simple(), std::invalid_argument);

    builder.with_format("simple");
    EXPECT_THROW(builder.build_batch_writer(), std::invalid_argument);
}

TEST_F(RecordWriterTest, BuilderBuildsSimpleWriterWithCodecs) {
    props.set(keys::WRITER_CODEC_TYPES, "base64");
    DataWriterBuilder builder(props);
    builder.with_writer_id("w").with_attempt_id("attempt_2").with_file_system(storage);

    auto writer = builder.build_simple();
    EXPECT_TRUE(fs::exists(dir / "staging/attempt_2/part.w.txt"));
    writer->write("abc");
    writer->commit();

    EXPECT_EQ(read_file(output_file("part.w.txt")), "YWJj");
    EXPECT_TRUE(writer->is_speculative_attempt_safe());
}

TEST_F(RecordWriterTest, BuilderBuildsBatchWriters) {
    DataWriterBuilder builder(props);
    builder.with_writer_id("w").with_file_system(storage).for_partition("day=1");

    builder.with_format("csv");
    auto csv = builder.build_batch_writer();
    csv->write(make_batch({1}, {"a"}, {1.0}));
    csv->commit();
    EXPECT_TRUE(fs::exists(output_file("day=1/part.w.csv")));

    builder.with_format("parquet").with_schema(event_schema());
    auto parquet = builder.build_batch_writer();
    parquet->write(make_batch({1, 2}, {"a", "b"}, {1.0, 2.0}));
    parquet->commit();

    auto reader = open_parquet(output_file("day=1/part.w.parquet"));
    EXPECT_EQ(reader->parquet_reader()->metadata()->num_rows(), 2);
    EXPECT_EQ(props.get_set(keys::WRITER_FINAL_OUTPUT_FILE_PATHS),
              (std::vector<std::string>{output_file("day=1/part.w.csv"),
                                        output_file("day=1/part.w.parquet")}));
}

TEST_F(RecordWriterTest, CompressedCsvThroughBuilder) {
    if (!arrow::util::Codec::IsAvailable(arrow::Compression::GZIP)) {
        GTEST_SKIP() << "gzip is not available in this Arrow build";
    }
    props.set(keys::WRITER_CODEC_TYPES, "gzip");
    DataWriterBuilder builder(props);
    builder.with_writer_id("w").with_file_system(storage).with_format("csv");

    auto writer = builder.build_batch_writer();
    writer->write(make_batch({1}, {"a"}, {1.0}));
    writer->commit();

    auto decoders = builder.encoders();
    auto in = decode_chain(storage->open(output_file("part.w.csv")), decoders);
    EXPECT_EQ(read_all(*in), "id,name,score\n1,a,1\n");
}

}  // namespace test
}  // namespace fswriter
