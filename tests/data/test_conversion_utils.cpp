#include <gtest/gtest.h>
#include <arrow/api.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "barsim/core/time_utils.hpp"
#include "barsim/data/conversion_utils.hpp"
#include "barsim/data/csv_bar_loader.hpp"

using namespace barsim;
using namespace barsim::testing;

namespace {

std::shared_ptr<arrow::Array> int64_array(const std::vector<int64_t>& values) {
    arrow::Int64Builder builder;
    EXPECT_TRUE(builder.AppendValues(values).ok());
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return array;
}

std::shared_ptr<arrow::Array> double_array(const std::vector<double>& values,
                                           bool null_last = false) {
    arrow::DoubleBuilder builder;
    EXPECT_TRUE(builder.AppendValues(values).ok());
    if (null_last) {
        EXPECT_TRUE(builder.AppendNull().ok());
    }
    std::shared_ptr<arrow::Array> array;
    EXPECT_TRUE(builder.Finish(&array).ok());
    return array;
}

std::shared_ptr<arrow::Table> ohlcv_table(std::shared_ptr<arrow::Array> close) {
    auto schema = arrow::schema({arrow::field("timestamp", arrow::int64()),
                                 arrow::field("open", arrow::float64()),
                                 arrow::field("high", arrow::float64()),
                                 arrow::field("low", arrow::float64()),
                                 arrow::field("close", arrow::float64()),
                                 arrow::field("volume", arrow::int64())});
    return arrow::Table::Make(schema, {int64_array({1641168000, 1641254400, 1641340800}),
                                       double_array({10.0, 10.5, 11.0}),
                                       double_array({11.0, 11.5, 12.0}),
                                       double_array({9.5, 10.0, 10.5}),
                                       close,
                                       int64_array({100, 200, 300})});
}

}  // namespace

class ConversionUtilsTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir_ = std::filesystem::temp_directory_path() / "barsim_csv_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        TestBase::TearDown();
    }

    std::string write_csv(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConversionUtilsTest, ConvertsTableToBars) {
    auto table = ohlcv_table(double_array({10.5, 11.0, 11.5}));

    auto result = DataConversionUtils::arrow_table_to_bars(table);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& bars = result.value();
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(core::to_epoch_seconds(bars[0].timestamp), 1641168000);
    EXPECT_DOUBLE_EQ(bars[1].open, 10.5);
    EXPECT_DOUBLE_EQ(bars[1].high, 11.5);
    EXPECT_DOUBLE_EQ(bars[1].low, 10.0);
    EXPECT_DOUBLE_EQ(bars[2].close, 11.5);
    EXPECT_DOUBLE_EQ(bars[2].volume, 300.0);

    EXPECT_TRUE(BarSeries::load(bars).is_ok());
}

TEST_F(ConversionUtilsTest, MissingColumnIsInvalidData) {
    auto schema = arrow::schema({arrow::field("timestamp", arrow::int64()),
                                 arrow::field("close", arrow::float64())});
    auto table = arrow::Table::Make(
        schema, {int64_array({1641168000}), double_array({10.0})});

    auto result = DataConversionUtils::arrow_table_to_bars(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConversionUtilsTest, NullValueIsInvalidData) {
    auto table = ohlcv_table(double_array({10.5, 11.0}, true));

    auto result = DataConversionUtils::arrow_table_to_bars(table);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConversionUtilsTest, CsvLoaderReadsIsoTimestamps) {
    auto path = write_csv("bars.csv",
                          "timestamp,open,high,low,close,volume\n"
                          "2022-01-03 00:00:00,10,11,9.5,10.5,100\n"
                          "2022-01-04 00:00:00,10.5,11.5,10,11,200\n");

    CsvBarLoader loader;
    auto result = loader.load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& bars = result.value();
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(core::format_timestamp(bars[1].timestamp), "2022-01-04 00:00:00");
    EXPECT_DOUBLE_EQ(bars[1].close, 11.0);
}

TEST_F(ConversionUtilsTest, CsvLoaderReadsEpochSecondsWithCustomColumns) {
    auto path = write_csv("epoch.csv",
                          "time;o;h;l;c;v\n"
                          "1641168000;10;11;9.5;10.5;100\n");

    CsvLoadOptions options;
    options.delimiter = ';';
    options.epoch_seconds = true;
    options.columns.timestamp = "time";
    options.columns.open = "o";
    options.columns.high = "h";
    options.columns.low = "l";
    options.columns.close = "c";
    options.columns.volume = "v";

    CsvBarLoader loader(options);
    auto result = loader.load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(core::to_epoch_seconds(result.value()[0].timestamp), 1641168000);
}

TEST_F(ConversionUtilsTest, CsvLoaderMissingFile) {
    CsvBarLoader loader;
    auto result = loader.load((test_dir_ / "missing.csv").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConversionUtilsTest, CsvLoaderUnparsableValue) {
    auto path = write_csv("bad.csv",
                          "timestamp,open,high,low,close,volume\n"
                          "2022-01-03 00:00:00,ten,11,9.5,10.5,100\n");

    CsvBarLoader loader;
    auto result = loader.load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(ConversionUtilsTest, SliceKeepsInclusiveRange) {
    auto bars = make_bars({10.0, 11.0, 12.0, 13.0});
    auto sliced = CsvBarLoader::slice(bars, bars[1].timestamp, bars[2].timestamp);
    ASSERT_EQ(sliced.size(), 2u);
    EXPECT_DOUBLE_EQ(sliced[0].close, 11.0);
    EXPECT_DOUBLE_EQ(sliced[1].close, 12.0);
}

TEST_F(ConversionUtilsTest, CsvOptionsJsonRoundTrip) {
    CsvLoadOptions options;
    options.delimiter = '\t';
    options.columns.close = "adj_close";

    CsvLoadOptions loaded;
    loaded.from_json(options.to_json());
    EXPECT_EQ(loaded.delimiter, '\t');
    EXPECT_EQ(loaded.columns.close, "adj_close");
    EXPECT_FALSE(loaded.epoch_seconds);
}
