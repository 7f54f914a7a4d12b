#pragma once
#include <vector>
#include <cstddef>
#include "core/types.hpp"

namespace ind {

constexpr std::size_t kVwapWindow = 14;

// Gördülő VWAP: sum(tp*vol)/sum(vol) az utolsó `window` baron, tp=(h+l+c)/3.
// A sor elején rövidebb ablakkal számol.
std::vector<double> compute_vwap(const std::vector<Bar>& bars, std::size_t window = kVwapWindow);

} // namespace ind
