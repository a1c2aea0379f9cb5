// src/strategy/base_strategy.cpp

#include "barsim/strategy/base_strategy.hpp"
#include <sstream>
#include <stdexcept>
#include "barsim/signal/crossover.hpp"

namespace barsim {

namespace {

std::string format_param(double p) {
    std::ostringstream oss;
    oss << p;
    return oss.str();
}

}  // namespace

std::string indicator_display_name(const std::string& fn_name, PriceField source,
                                   const std::vector<double>& params) {
    std::string name = fn_name + "(" + price_field_to_string(source).substr(0, 1);
    for (double p : params) {
        name += "," + format_param(p);
    }
    return name + ")";
}

BaseStrategy::BaseStrategy(std::string id, std::shared_ptr<const BarSeries> data)
    : id_(std::move(id)), data_(std::move(data)) {
    Logger::register_component("BaseStrategy");
}

void BaseStrategy::clear_indicators() {
    engine_.clear();
}

Result<void> BaseStrategy::prepare(std::size_t step) {
    if (!data_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Strategy " + id_ + " has no bar series", "BaseStrategy");
    }

    auto window = data_->window(step);
    if (window.is_error()) {
        return make_error<void>(window.error()->code(), window.error()->what(), "BaseStrategy");
    }
    return engine_.advance(window.value());
}

std::size_t BaseStrategy::warmup_period() const {
    return engine_.warmup_period();
}

IndicatorHandle BaseStrategy::indicator(const std::string& fn_name, ColumnFunction fn,
                                        PriceField source, std::vector<double> params,
                                        std::size_t warmup) {
    std::string display = indicator_display_name(fn_name, source, params);
    return engine_.define(std::move(display), std::move(fn), source, std::move(params), warmup);
}

IndicatorHandle BaseStrategy::indicator(const std::string& fn_name, WindowFunction fn,
                                        std::vector<double> params, std::size_t warmup) {
    std::string display = fn_name + "(";
    for (std::size_t i = 0; i < params.size(); ++i) {
        display += (i == 0 ? "" : ",") + format_param(params[i]);
    }
    display += ")";
    return engine_.define_window(std::move(display), std::move(fn), std::move(params), warmup);
}

IndicatorHandle BaseStrategy::indicator(std::unique_ptr<IncrementalIndicator> incremental) {
    return engine_.define_incremental(std::move(incremental));
}

bool BaseStrategy::crossover(IndicatorHandle fast, IndicatorHandle slow, std::size_t step) const {
    if (step >= engine_.visible_length()) {
        return false;
    }
    return ::barsim::crossover(engine_.series(fast), engine_.series(slow), step);
}

double BaseStrategy::close(std::size_t step) const {
    if (step >= engine_.visible_length()) {
        throw std::out_of_range("Bar " + std::to_string(step) + " is not visible yet");
    }
    return data_->at(step).close;
}

}  // namespace barsim
