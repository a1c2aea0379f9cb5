// include/barsim/data/csv_bar_loader.hpp
#pragma once

#include <string>
#include <vector>
#include "barsim/core/config_base.hpp"
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"
#include "barsim/data/conversion_utils.hpp"

namespace barsim {

/**
 * @brief Options for reading an OHLCV CSV file
 */
struct CsvLoadOptions : public ConfigBase {
    BarColumnNames columns;
    char delimiter{','};
    bool epoch_seconds{false};  // timestamp column holds integer seconds, not ISO-8601 text

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Data collaborator that reads bars from a CSV file through Arrow
 *
 * Returns bars in file order without validating them; hand the result to
 * BarSeries::load before running a backtest.
 */
class CsvBarLoader {
public:
    explicit CsvBarLoader(CsvLoadOptions options = CsvLoadOptions()) : options_(std::move(options)) {}

    /**
     * @brief Read every row of a CSV file
     * @param path File to read
     * @return Bars, FILE_NOT_FOUND / FILE_IO_ERROR / CONVERSION_ERROR on failure
     */
    Result<std::vector<Bar>> load(const std::string& path) const;

    /**
     * @brief Keep only the bars with start <= timestamp <= end
     */
    static std::vector<Bar> slice(const std::vector<Bar>& bars, const Timestamp& start,
                                  const Timestamp& end);

private:
    CsvLoadOptions options_;
};

}  // namespace barsim
