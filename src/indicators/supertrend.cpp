#include "indicators/supertrend.hpp"
#include "indicators/vwap.hpp"
#include "indicators/atr.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>

namespace ind {
std::vector<IndicatorFrame> annotate(const std::vector<Bar>& bars){
    if (bars.size() < kVwapWindow)
        throw InsufficientData(fmt::format("need at least {} candles, got {}", kVwapWindow, bars.size()));

    const auto vwap = compute_vwap(bars, kVwapWindow);
    const auto atr  = compute_atr(bars, kAtrWindow);

    std::vector<IndicatorFrame> out(bars.size());
    for (std::size_t i=0;i<bars.size();++i){
        auto& f = out[i];
        f.bar  = bars[i];
        f.vwap = vwap[i];
        f.atr  = atr[i];
        const double hl2 = (bars[i].high + bars[i].low)/2.0;
        f.basic_upper = hl2 + kBandMultiplier*atr[i];
        f.basic_lower = hl2 - kBandMultiplier*atr[i];
    }

    // 0. index: final sávok 0.0, irány fel (a rekurzió kezdőértéke)
    out[0].final_upper = 0.0;
    out[0].final_lower = 0.0;
    out[0].uptrend = true;

    for (std::size_t i=1;i<out.size();++i){
        const auto& p = out[i-1];
        auto& f = out[i];

        if (f.basic_upper < p.final_upper || p.bar.close > p.final_upper) f.final_upper = f.basic_upper;
        else f.final_upper = p.final_upper;

        if (f.basic_lower > p.final_lower || p.bar.close < p.final_lower) f.final_lower = f.basic_lower;
        else f.final_lower = p.final_lower;

        if (f.bar.close > f.final_upper)      f.uptrend = true;
        else if (f.bar.close < f.final_lower) f.uptrend = false;
        else                                  f.uptrend = p.uptrend;
    }
    return out;
}
} // namespace ind
