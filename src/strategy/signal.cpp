#include "strategy/signal.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>

namespace strat {

Signal evaluate_signal(const ind::IndicatorFrame& prev, const ind::IndicatorFrame& last){
    const bool above = prev.bar.close > prev.vwap && last.bar.close > last.vwap;
    const bool below = prev.bar.close < prev.vwap && last.bar.close < last.vwap;
    if (above && prev.uptrend && last.uptrend) return Signal::Long;
    if (below && !prev.uptrend && !last.uptrend) return Signal::Short;
    return Signal::Neutral;
}

const ind::IndicatorFrame& latest_closed(const std::vector<ind::IndicatorFrame>& frames){
    if (frames.size() < 3)
        throw InsufficientData(fmt::format("need 3 frames for signal evaluation, got {}", frames.size()));
    return frames[frames.size()-2];
}

Signal evaluate_latest(const std::vector<ind::IndicatorFrame>& frames){
    const auto& last = latest_closed(frames);
    return evaluate_signal(frames[frames.size()-3], last);
}

} // namespace strat
