// include/barsim/indicator/incremental.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include "barsim/core/types.hpp"

namespace barsim {

/**
 * @brief Indicator that is extended one bar at a time
 *
 * Implementations must produce, after N updates, exactly the value the
 * matching batch function returns at index N-1 of an N-bar window.
 */
class IncrementalIndicator {
public:
    virtual ~IncrementalIndicator() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Number of bars needed before the first defined value
     */
    virtual std::size_t warmup() const = 0;

    /**
     * @brief Consume the next bar and return the value at that bar
     */
    virtual IndicatorValue update(const Bar& bar) = 0;

    /**
     * @brief Forget all consumed bars
     */
    virtual void reset() = 0;
};

/**
 * @brief Incremental counterpart of indicators::sma
 */
class IncrementalSma : public IncrementalIndicator {
public:
    explicit IncrementalSma(std::size_t period, PriceField source = PriceField::CLOSE);

    std::string name() const override;
    std::size_t warmup() const override {
        return period_;
    }
    IndicatorValue update(const Bar& bar) override;
    void reset() override {
        window_.clear();
    }

private:
    std::size_t period_;
    PriceField source_;
    std::deque<double> window_;
};

/**
 * @brief Incremental counterpart of indicators::ema
 */
class IncrementalEma : public IncrementalIndicator {
public:
    explicit IncrementalEma(std::size_t span, PriceField source = PriceField::CLOSE,
                            std::size_t min_periods = 0);

    std::string name() const override;
    std::size_t warmup() const override {
        return required_;
    }
    IndicatorValue update(const Bar& bar) override;
    void reset() override;

private:
    std::size_t span_;
    PriceField source_;
    std::size_t required_;
    double alpha_;
    bool seeded_{false};
    double state_{0.0};
    std::size_t observed_{0};
};

}  // namespace barsim
