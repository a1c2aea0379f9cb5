// src/signal/crossover.cpp

#include "barsim/signal/crossover.hpp"
#include <cmath>

namespace barsim {

namespace {

bool crossed(double prev_a, double prev_b, double cur_a, double cur_b) {
    return prev_a <= prev_b && cur_a > cur_b;
}

}  // namespace

bool crossover(const IndicatorSeries& a, const IndicatorSeries& b, std::size_t step) {
    if (step == 0 || step >= a.size() || step >= b.size()) {
        return false;
    }

    const auto& prev_a = a[step - 1];
    const auto& prev_b = b[step - 1];
    const auto& cur_a = a[step];
    const auto& cur_b = b[step];
    if (!prev_a || !prev_b || !cur_a || !cur_b) {
        return false;
    }
    return crossed(*prev_a, *prev_b, *cur_a, *cur_b);
}

bool crossover(const std::vector<double>& a, const std::vector<double>& b, std::size_t step) {
    if (step == 0 || step >= a.size() || step >= b.size()) {
        return false;
    }
    if (std::isnan(a[step - 1]) || std::isnan(b[step - 1]) || std::isnan(a[step]) ||
        std::isnan(b[step])) {
        return false;
    }
    return crossed(a[step - 1], b[step - 1], a[step], b[step]);
}

}  // namespace barsim
