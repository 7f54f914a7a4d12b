#pragma once
#include <vector>
#include <cstddef>
#include "core/types.hpp"

namespace ind {

constexpr std::size_t kAtrWindow = 7;

std::vector<double> compute_true_range(const std::vector<Bar>& bars);

// TR gördülő átlaga; az első teljes ablak előtt 0
std::vector<double> compute_atr(const std::vector<Bar>& bars, std::size_t window = kAtrWindow);

} // namespace ind
