// src/data/conversion_utils.cpp
#include "barsim/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include <chrono>

namespace barsim {

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table, const BarColumnNames& columns) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    const std::vector<std::string> required_columns = {columns.timestamp, columns.open,
                                                       columns.high,      columns.low,
                                                       columns.close,     columns.volume};

    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col,
                                                "DataConversionUtils");
        }
    }

    std::vector<Bar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<Bar>>(std::move(bars));
    }

    // CSV reads arrive in blocks; flatten so every column is a single chunk
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine table chunks: " + combined.status().ToString(),
            "DataConversionUtils");
    }
    const std::shared_ptr<arrow::Table> flat = combined.ValueOrDie();

    auto time_array = flat->GetColumnByName(columns.timestamp)->chunk(0);
    auto open_array = flat->GetColumnByName(columns.open)->chunk(0);
    auto high_array = flat->GetColumnByName(columns.high)->chunk(0);
    auto low_array = flat->GetColumnByName(columns.low)->chunk(0);
    auto close_array = flat->GetColumnByName(columns.close)->chunk(0);
    auto volume_array = flat->GetColumnByName(columns.volume)->chunk(0);

    bars.reserve(static_cast<size_t>(flat->num_rows()));

    for (int64_t i = 0; i < flat->num_rows(); ++i) {
        auto ts_result = extract_timestamp(time_array, i);
        if (ts_result.is_error()) {
            return make_error<std::vector<Bar>>(ts_result.error()->code(),
                                                ts_result.error()->what(),
                                                "DataConversionUtils");
        }

        auto open_result = extract_double(open_array, i);
        auto high_result = extract_double(high_array, i);
        auto low_result = extract_double(low_array, i);
        auto close_result = extract_double(close_array, i);
        auto volume_result = extract_double(volume_array, i);

        for (const auto* field : {&open_result, &high_result, &low_result, &close_result,
                                  &volume_result}) {
            if (field->is_error()) {
                return make_error<std::vector<Bar>>(
                    field->error()->code(),
                    "Row " + std::to_string(i) + ": " + field->error()->what(),
                    "DataConversionUtils");
            }
        }

        bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                          low_result.value(), close_result.value(), volume_result.value());
    }

    return Result<std::vector<Bar>>(std::move(bars));
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::Array>& array, int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }

    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            const int64_t raw = ts_array->Value(index);
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    return Result<Timestamp>(Timestamp(std::chrono::seconds(raw)));
                case arrow::TimeUnit::MILLI:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::milliseconds(raw))));
                case arrow::TimeUnit::MICRO:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::microseconds(raw))));
                case arrow::TimeUnit::NANO:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::nanoseconds(raw))));
            }
            break;
        }
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            return Result<Timestamp>(
                Timestamp(std::chrono::hours(24 * static_cast<int64_t>(date_array->Value(index)))));
        }
        case arrow::Type::INT64: {
            auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
            return Result<Timestamp>(Timestamp(std::chrono::seconds(int_array->Value(index))));
        }
        default:
            break;
    }

    return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                 "Unsupported timestamp column type: " + array->type()->ToString(),
                                 "DataConversionUtils");
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }

    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null numeric value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return Result<double>(std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        case arrow::Type::INT64:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(array)->Value(index)));
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Unsupported numeric column type: " +
                                          array->type()->ToString(),
                                      "DataConversionUtils");
    }
}

}  // namespace barsim
