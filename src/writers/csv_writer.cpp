#include "fswriter/csv_writer.hpp"
#include "fswriter/errors.hpp"

#include <sstream>
#include <stdexcept>

#include <arrow/api.h>

namespace fswriter {

namespace {

void append_value(const arrow::Array& array, int64_t row, std::ostringstream& out) {
    switch (array.type_id()) {
        case arrow::Type::INT64:
            out << static_cast<const arrow::Int64Array&>(array).Value(row);
            break;
        case arrow::Type::INT32:
            out << static_cast<const arrow::Int32Array&>(array).Value(row);
            break;
        case arrow::Type::DOUBLE:
            out << static_cast<const arrow::DoubleArray&>(array).Value(row);
            break;
        case arrow::Type::FLOAT:
            out << static_cast<const arrow::FloatArray&>(array).Value(row);
            break;
        case arrow::Type::BOOL:
            out << (static_cast<const arrow::BooleanArray&>(array).Value(row) ? "true" : "false");
            break;
        case arrow::Type::STRING:
            out << CsvDataWriter::escape_csv_value(
                static_cast<const arrow::StringArray&>(array).GetString(row));
            break;
        default: {
            // Fallback: Arrow's scalar rendering
            auto scalar = value_or_throw(array.GetScalar(row), "Failed to read CSV value");
            out << CsvDataWriter::escape_csv_value(scalar->ToString());
            break;
        }
    }
}

}  // namespace

CsvDataWriter::CsvDataWriter(WriterIdentity identity,
                             Properties& properties,
                             FileSystemPtr fs,
                             std::vector<StreamCodecPtr> encoders,
                             RetryClock retry_clock)
    : StagedDataWriter<RecordBatchPtr>(std::move(identity), properties, std::move(fs),
                                       std::move(encoders), std::move(retry_clock)) {
    staging_stream();
}

void CsvDataWriter::write_header(const arrow::Schema& schema, std::string& out) {
    for (int i = 0; i < schema.num_fields(); ++i) {
        if (i > 0) out += ',';
        out += escape_csv_value(schema.field(i)->name());
    }
    out += '\n';
}

std::string CsvDataWriter::escape_csv_value(const std::string& value) {
    bool needs_quoting = false;
    for (char c : value) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') {
            needs_quoting = true;
            break;
        }
    }

    if (!needs_quoting) {
        return value;
    }

    // Quote the value and double internal quotes
    std::string escaped;
    escaped += '"';
    for (char c : value) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped += c;
        }
    }
    escaped += '"';
    return escaped;
}

void CsvDataWriter::write(const RecordBatchPtr& batch) {
    if (!batch) {
        throw std::invalid_argument("Cannot write null batch");
    }

    std::string header;
    if (!header_written_) {
        write_header(*batch->schema(), header);
    }

    std::ostringstream rows;
    for (int64_t row = 0; row < batch->num_rows(); ++row) {
        for (int col = 0; col < batch->num_columns(); ++col) {
            if (col > 0) rows << ',';
            const auto& array = *batch->column(col);
            // Null values are written as empty fields
            if (!array.IsNull(row)) {
                append_value(array, row, rows);
            }
        }
        rows << '\n';
    }

    auto& out = staging_stream();
    if (!header_written_) {
        check_status(out->Write(header.data(), static_cast<int64_t>(header.size())),
                     "Failed to write CSV header");
        header_written_ = true;
    }
    std::string data = rows.str();
    check_status(out->Write(data.data(), static_cast<int64_t>(data.size())),
                 "Failed to write CSV rows");

    rows_written_ += batch->num_rows();
}

bool CsvDataWriter::is_speculative_attempt_safe() const {
    return fs_writer_.has_attempt_id();
}

}  // namespace fswriter
