// include/barsim/signal/crossover.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "barsim/core/types.hpp"

namespace barsim {

/**
 * @brief Whether series a has just crossed above series b at step
 *
 * True iff a[step-1] <= b[step-1] and a[step] > b[step]. False at step 0,
 * for a step outside either series, and whenever one of the four operands
 * is undefined.
 */
bool crossover(const IndicatorSeries& a, const IndicatorSeries& b, std::size_t step);

/**
 * @brief Same as above on raw columns, NaN counts as undefined
 */
bool crossover(const std::vector<double>& a, const std::vector<double>& b, std::size_t step);

}  // namespace barsim
