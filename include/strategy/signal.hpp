#pragma once
#include <vector>
#include "core/types.hpp"
#include "indicators/supertrend.hpp"

namespace strat {

// Long: mindkét gyertya close>vwap és felfelé trend.
// Short: mindkettő close<vwap és lefelé trend. Egyébként Neutral.
Signal evaluate_signal(const ind::IndicatorFrame& prev, const ind::IndicatorFrame& last);

// A két utolsó lezárt gyertya: frames[n-3], frames[n-2]
// (az utolsó még nyitott lehet). InsufficientData, ha n<3.
Signal evaluate_latest(const std::vector<ind::IndicatorFrame>& frames);

// Az utolsó lezárt gyertya (frames[n-2])
const ind::IndicatorFrame& latest_closed(const std::vector<ind::IndicatorFrame>& frames);

} // namespace strat
