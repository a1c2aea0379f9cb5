// include/barsim/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "barsim/core/error.hpp"
#include "barsim/core/types.hpp"

namespace barsim {

/**
 * @brief Column names expected in an OHLCV Arrow table
 */
struct BarColumnNames {
    std::string timestamp{"timestamp"};
    std::string open{"open"};
    std::string high{"high"};
    std::string low{"low"};
    std::string close{"close"};
    std::string volume{"volume"};
};

class DataConversionUtils {
public:
    /**
     * @brief Convert Arrow Table to vector of Bars
     *
     * The timestamp column may be an Arrow timestamp (any unit), date32, or
     * int64 seconds since the epoch. Price and volume columns may be double
     * or int64. Rows are returned in table order; ordering and OHLC checks
     * are left to BarSeries::load.
     *
     * @param table Arrow table containing OHLCV data
     * @param columns Column names to read
     * @return Result containing vector of Bars
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(
        const std::shared_ptr<arrow::Table>& table, const BarColumnNames& columns = {});

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);
};

}  // namespace barsim
