// src/indicator/incremental.cpp

#include "barsim/indicator/incremental.hpp"
#include <cmath>

namespace barsim {

IncrementalSma::IncrementalSma(std::size_t period, PriceField source)
    : period_(period), source_(source) {}

std::string IncrementalSma::name() const {
    return "sma(" + price_field_to_string(source_).substr(0, 1) + "," + std::to_string(period_) +
           ")";
}

IndicatorValue IncrementalSma::update(const Bar& bar) {
    if (period_ == 0) {
        return std::nullopt;
    }

    window_.push_back(bar_field(bar, source_));
    if (window_.size() > period_) {
        window_.pop_front();
    }
    if (window_.size() < period_) {
        return std::nullopt;
    }

    // Same summation order as the batch function
    double sum = 0.0;
    for (double v : window_) {
        sum += v;
    }
    return sum / static_cast<double>(period_);
}

IncrementalEma::IncrementalEma(std::size_t span, PriceField source, std::size_t min_periods)
    : span_(span),
      source_(source),
      required_(min_periods == 0 ? span : min_periods),
      alpha_(2.0 / (static_cast<double>(span) + 1.0)) {}

std::string IncrementalEma::name() const {
    return "ema(" + price_field_to_string(source_).substr(0, 1) + "," + std::to_string(span_) +
           ")";
}

IndicatorValue IncrementalEma::update(const Bar& bar) {
    if (span_ == 0) {
        return std::nullopt;
    }

    const double x = bar_field(bar, source_);
    if (!std::isfinite(x)) {
        return std::nullopt;
    }

    if (!seeded_) {
        state_ = x;
        seeded_ = true;
    } else {
        state_ = (1.0 - alpha_) * state_ + alpha_ * x;
    }
    ++observed_;

    if (observed_ < required_) {
        return std::nullopt;
    }
    return state_;
}

void IncrementalEma::reset() {
    seeded_ = false;
    state_ = 0.0;
    observed_ = 0;
}

}  // namespace barsim
