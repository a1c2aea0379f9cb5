// src/indicator/indicator_engine.cpp

#include "barsim/indicator/indicator_engine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "barsim/core/logger.hpp"

namespace barsim {

namespace {

// Undefined inside the declared warm-up and for non-finite output
IndicatorValue normalize(IndicatorValue v, std::size_t index, std::size_t warmup) {
    if (index + 1 < warmup || (v && !std::isfinite(*v))) {
        return std::nullopt;
    }
    return v;
}

}  // namespace

IndicatorHandle IndicatorEngine::define(std::string name, ColumnFunction fn, PriceField source,
                                        std::vector<double> params, std::size_t warmup) {
    WindowFunction on_column = [fn = std::move(fn), source](const BarWindow& window,
                                                            const std::vector<double>& p) {
        return fn(window.column(source), p);
    };
    return define_window(std::move(name), std::move(on_column), std::move(params), warmup);
}

IndicatorHandle IndicatorEngine::define_window(std::string name, WindowFunction fn,
                                               std::vector<double> params, std::size_t warmup) {
    Entry entry;
    entry.name = std::move(name);
    entry.fn = std::move(fn);
    entry.params = std::move(params);
    entry.warmup = warmup;
    entries_.push_back(std::move(entry));

    DEBUG("Registered indicator " << entries_.back().name << " (warm-up " << warmup << ")");
    return IndicatorHandle{entries_.size() - 1};
}

IndicatorHandle IndicatorEngine::define_incremental(
    std::unique_ptr<IncrementalIndicator> indicator) {
    if (!indicator) {
        throw std::invalid_argument("Incremental indicator must not be null");
    }

    Entry entry;
    entry.name = indicator->name();
    entry.warmup = indicator->warmup();
    entry.incremental = std::move(indicator);
    entries_.push_back(std::move(entry));

    DEBUG("Registered incremental indicator " << entries_.back().name);
    return IndicatorHandle{entries_.size() - 1};
}

Result<void> IndicatorEngine::advance(const BarWindow& window) {
    for (auto& entry : entries_) {
        auto result = entry.incremental ? advance_incremental(entry, window)
                                        : advance_batch(entry, window);
        if (result.is_error()) {
            return result;
        }
    }
    visible_length_ = window.size();
    return Result<void>();
}

Result<void> IndicatorEngine::advance_batch(Entry& entry, const BarWindow& window) {
    IndicatorSeries values;
    try {
        values = entry.fn(window, entry.params);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INDICATOR_ERROR,
                                "Indicator \"" + entry.name + "\" errored with exception: " +
                                    e.what(),
                                "IndicatorEngine");
    }

    if (values.size() != window.size()) {
        return make_error<void>(ErrorCode::INDICATOR_ERROR,
                                "Indicator \"" + entry.name + "\" returned " +
                                    std::to_string(values.size()) + " values for a window of " +
                                    std::to_string(window.size()) + " bars",
                                "IndicatorEngine");
    }

    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = normalize(values[i], i, entry.warmup);
    }
    entry.values = std::move(values);
    return Result<void>();
}

Result<void> IndicatorEngine::advance_incremental(Entry& entry, const BarWindow& window) {
    // Anything but a forward extension means replaying from the first bar
    if (window.size() < entry.values.size()) {
        entry.incremental->reset();
        entry.values.clear();
    }

    try {
        for (std::size_t i = entry.values.size(); i < window.size(); ++i) {
            entry.values.push_back(
                normalize(entry.incremental->update(window[i]), i, entry.warmup));
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INDICATOR_ERROR,
                                "Indicator \"" + entry.name + "\" errored with exception: " +
                                    e.what(),
                                "IndicatorEngine");
    }
    return Result<void>();
}

const IndicatorEngine::Entry& IndicatorEngine::entry(IndicatorHandle handle) const {
    if (handle.id >= entries_.size()) {
        throw std::out_of_range("Unknown indicator handle " + std::to_string(handle.id));
    }
    return entries_[handle.id];
}

IndicatorValue IndicatorEngine::value_at(IndicatorHandle handle, std::size_t step) const {
    if (handle.id >= entries_.size()) {
        return std::nullopt;
    }
    const auto& e = entries_[handle.id];
    if (step >= visible_length_ || step >= e.values.size() || step + 1 < e.warmup) {
        return std::nullopt;
    }
    return e.values[step];
}

const IndicatorSeries& IndicatorEngine::series(IndicatorHandle handle) const {
    return entry(handle).values;
}

const std::string& IndicatorEngine::name(IndicatorHandle handle) const {
    return entry(handle).name;
}

std::size_t IndicatorEngine::warmup(IndicatorHandle handle) const {
    return entry(handle).warmup;
}

std::size_t IndicatorEngine::warmup_period() const {
    std::size_t period = 0;
    for (const auto& e : entries_) {
        period = std::max(period, e.warmup);
    }
    return period;
}

void IndicatorEngine::reset() {
    for (auto& e : entries_) {
        e.values.clear();
        if (e.incremental) {
            e.incremental->reset();
        }
    }
    visible_length_ = 0;
}

void IndicatorEngine::clear() {
    entries_.clear();
    visible_length_ = 0;
}

}  // namespace barsim
