// src/data/csv_bar_loader.cpp
#include "barsim/data/csv_bar_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include "barsim/core/logger.hpp"

namespace barsim {

nlohmann::json CsvLoadOptions::to_json() const {
    nlohmann::json j;
    j["timestamp_column"] = columns.timestamp;
    j["open_column"] = columns.open;
    j["high_column"] = columns.high;
    j["low_column"] = columns.low;
    j["close_column"] = columns.close;
    j["volume_column"] = columns.volume;
    j["delimiter"] = std::string(1, delimiter);
    j["epoch_seconds"] = epoch_seconds;
    return j;
}

void CsvLoadOptions::from_json(const nlohmann::json& j) {
    if (j.contains("timestamp_column"))
        columns.timestamp = j.at("timestamp_column").get<std::string>();
    if (j.contains("open_column"))
        columns.open = j.at("open_column").get<std::string>();
    if (j.contains("high_column"))
        columns.high = j.at("high_column").get<std::string>();
    if (j.contains("low_column"))
        columns.low = j.at("low_column").get<std::string>();
    if (j.contains("close_column"))
        columns.close = j.at("close_column").get<std::string>();
    if (j.contains("volume_column"))
        columns.volume = j.at("volume_column").get<std::string>();
    if (j.contains("delimiter")) {
        auto delim = j.at("delimiter").get<std::string>();
        if (!delim.empty())
            delimiter = delim.front();
    }
    if (j.contains("epoch_seconds"))
        epoch_seconds = j.at("epoch_seconds").get<bool>();
}

Result<std::vector<Bar>> CsvBarLoader::load(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<std::vector<Bar>>(ErrorCode::FILE_NOT_FOUND,
                                            "CSV file not found: " + path, "CsvBarLoader");
    }

    auto input_result = arrow::io::ReadableFile::Open(path);
    if (!input_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + path + ": " + input_result.status().ToString(), "CsvBarLoader");
    }
    std::shared_ptr<arrow::io::ReadableFile> input = input_result.ValueOrDie();

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = options_.delimiter;

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types[options_.columns.timestamp] =
        options_.epoch_seconds ? arrow::int64() : arrow::timestamp(arrow::TimeUnit::SECOND);
    for (const auto& name : {options_.columns.open, options_.columns.high, options_.columns.low,
                             options_.columns.close, options_.columns.volume}) {
        convert_options.column_types[name] = arrow::float64();
    }

    auto reader_result =
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options,
                                      parse_options, convert_options);
    if (!reader_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to create CSV reader for " + path + ": " + reader_result.status().ToString(),
            "CsvBarLoader");
    }

    auto table_result = reader_result.ValueOrDie()->Read();
    if (!table_result.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to parse " + path + ": " + table_result.status().ToString(), "CsvBarLoader");
    }

    auto bars = DataConversionUtils::arrow_table_to_bars(table_result.ValueOrDie(),
                                                         options_.columns);
    if (bars.is_ok()) {
        INFO("Read " << bars.value().size() << " bars from " << path);
    }
    return bars;
}

std::vector<Bar> CsvBarLoader::slice(const std::vector<Bar>& bars, const Timestamp& start,
                                     const Timestamp& end) {
    std::vector<Bar> selected;
    for (const auto& bar : bars) {
        if (bar.timestamp >= start && bar.timestamp <= end) {
            selected.push_back(bar);
        }
    }
    return selected;
}

}  // namespace barsim
