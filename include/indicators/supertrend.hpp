#pragma once
#include <vector>
#include "core/types.hpp"

namespace ind {

constexpr double kBandMultiplier = 2.0;

// Bar + a rá számolt indikátorok
struct IndicatorFrame {
    Bar bar;
    double vwap{0.0};
    double atr{0.0};
    double basic_upper{0.0};
    double basic_lower{0.0};
    double final_upper{0.0};
    double final_lower{0.0};
    bool uptrend{true};
};

// VWAP(14), ATR(7) és Supertrend egyetlen előre haladó menetben.
// A 0. indexen a végső sávok 0.0-ról, az irány felfelé indul.
// InsufficientData, ha kevesebb mint kVwapWindow bar jön.
std::vector<IndicatorFrame> annotate(const std::vector<Bar>& bars);

} // namespace ind
