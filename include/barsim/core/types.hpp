// include/barsim/core/types.hpp

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace barsim {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price-related calculations
 */
using Price = double;

/**
 * @brief Quantity type for position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Market data bar structure
 * One OHLCV observation for a fixed time interval
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

/**
 * @brief Column of a bar that an indicator can read
 */
enum class PriceField { OPEN, HIGH, LOW, CLOSE, VOLUME };

inline std::string price_field_to_string(PriceField field) {
    switch (field) {
        case PriceField::OPEN:
            return "open";
        case PriceField::HIGH:
            return "high";
        case PriceField::LOW:
            return "low";
        case PriceField::CLOSE:
            return "close";
        case PriceField::VOLUME:
            return "volume";
        default:
            return "unknown";
    }
}

inline double bar_field(const Bar& bar, PriceField field) {
    switch (field) {
        case PriceField::OPEN:
            return bar.open;
        case PriceField::HIGH:
            return bar.high;
        case PriceField::LOW:
            return bar.low;
        case PriceField::VOLUME:
            return bar.volume;
        case PriceField::CLOSE:
        default:
            return bar.close;
    }
}

/**
 * @brief Value of an indicator at one step
 * std::nullopt marks an undefined value (warm-up, missing input)
 */
using IndicatorValue = std::optional<double>;

/**
 * @brief Indicator sequence aligned index-for-index with a bar window
 */
using IndicatorSeries = std::vector<IndicatorValue>;

/**
 * @brief Per-step trading request emitted by a strategy
 */
enum class Decision { LONG, SHORT, CLOSE, HOLD };

inline bool is_valid_decision(Decision decision) {
    switch (decision) {
        case Decision::LONG:
        case Decision::SHORT:
        case Decision::CLOSE:
        case Decision::HOLD:
            return true;
        default:
            return false;
    }
}

inline std::string decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::LONG:
            return "LONG";
        case Decision::SHORT:
            return "SHORT";
        case Decision::CLOSE:
            return "CLOSE";
        case Decision::HOLD:
            return "HOLD";
        default:
            return "UNKNOWN(" + std::to_string(static_cast<int>(decision)) + ")";
    }
}

/**
 * @brief Side of the single open position
 */
enum class PositionSide { FLAT, LONG, SHORT };

inline std::string position_side_to_string(PositionSide side) {
    switch (side) {
        case PositionSide::FLAT:
            return "FLAT";
        case PositionSide::LONG:
            return "LONG";
        case PositionSide::SHORT:
            return "SHORT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Position structure
 * At most one position is open at a time
 */
struct Position {
    PositionSide side{PositionSide::FLAT};
    Quantity size{0.0};
    Price entry_price{0.0};
    std::size_t entry_step{0};
    Timestamp entry_time;
    double entry_commission{0.0};

    bool has_position() const {
        return side != PositionSide::FLAT;
    }
};

/**
 * @brief Completed round trip recorded when a position is closed
 */
struct TradeRecord {
    PositionSide side{PositionSide::FLAT};
    Quantity size{0.0};
    std::size_t entry_step{0};
    std::size_t exit_step{0};
    Timestamp entry_time;
    Timestamp exit_time;
    Price entry_price{0.0};
    Price exit_price{0.0};
    double gross_pnl{0.0};
    double commission{0.0};  // open + close
    double pnl{0.0};         // gross_pnl - commission
};

/**
 * @brief Equity snapshot taken after every simulated step
 */
using EquityPoint = std::pair<Timestamp, double>;

}  // namespace barsim
