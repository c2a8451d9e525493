#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace wealthcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_final_values(const SimulationResult& result, const std::string& filepath) {
    if (result.final_values.empty()) {
        throw std::runtime_error("SimulationResult has no final values to write");
    }

    auto schema = arrow::schema({
        arrow::field("simulation_id", arrow::uint32()),
        arrow::field("final_value", arrow::float64())
    });

    arrow::UInt32Builder id_builder;
    arrow::DoubleBuilder value_builder;
    check(id_builder.Reserve(result.final_values.size()), "Failed to reserve simulation_id column");
    check(value_builder.Reserve(result.final_values.size()), "Failed to reserve final_value column");

    for (size_t i = 0; i < result.final_values.size(); ++i) {
        check(id_builder.Append(static_cast<uint32_t>(i)), "Failed to append simulation_id");
        check(value_builder.Append(result.final_values[i]), "Failed to append final_value");
    }

    std::shared_ptr<arrow::Array> id_array;
    std::shared_ptr<arrow::Array> value_array;
    check(id_builder.Finish(&id_array), "Failed to finish simulation_id array");
    check(value_builder.Finish(&value_array), "Failed to finish final_value array");

    write_table(arrow::Table::Make(schema, {id_array, value_array}), filepath);
}

void ParquetWriter::write_paths(const SimulationResult& result, const std::string& filepath) {
    if (result.paths.empty()) {
        throw std::runtime_error("SimulationResult has no paths to write. Ensure SimulationConfig.store_paths is true.");
    }

    auto schema = arrow::schema({
        arrow::field("simulation_id", arrow::uint32()),
        arrow::field("year", arrow::uint8()),
        arrow::field("portfolio_value", arrow::float64())
    });

    const size_t rows = result.paths.size() * result.paths.front().points.size();

    arrow::UInt32Builder id_builder;
    arrow::UInt8Builder year_builder;
    arrow::DoubleBuilder value_builder;
    check(id_builder.Reserve(rows), "Failed to reserve simulation_id column");
    check(year_builder.Reserve(rows), "Failed to reserve year column");
    check(value_builder.Reserve(rows), "Failed to reserve portfolio_value column");

    for (size_t i = 0; i < result.paths.size(); ++i) {
        for (const PathPoint& point : result.paths[i].points) {
            check(id_builder.Append(static_cast<uint32_t>(i)), "Failed to append simulation_id");
            check(year_builder.Append(static_cast<uint8_t>(point.year)), "Failed to append year");
            check(value_builder.Append(point.portfolio_value), "Failed to append portfolio_value");
        }
    }

    std::shared_ptr<arrow::Array> id_array;
    std::shared_ptr<arrow::Array> year_array;
    std::shared_ptr<arrow::Array> value_array;
    check(id_builder.Finish(&id_array), "Failed to finish simulation_id array");
    check(year_builder.Finish(&year_array), "Failed to finish year array");
    check(value_builder.Finish(&value_array), "Failed to finish portfolio_value array");

    write_table(arrow::Table::Make(schema, {id_array, year_array, value_array}), filepath);
}

#else // !HAVE_ARROW

void ParquetWriter::write_final_values(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow and Parquet installed to enable Parquet export.");
}

void ParquetWriter::write_paths(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow and Parquet installed to enable Parquet export.");
}

#endif // HAVE_ARROW

} // namespace wealthcalc
