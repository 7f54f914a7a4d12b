#include "indicators/atr.hpp"
#include <algorithm>

namespace ind {
std::vector<double> compute_true_range(const std::vector<Bar>& bars){
    std::vector<double> tr(bars.size(), 0.0);
    for (std::size_t i=0;i<bars.size();++i){
        const auto& b = bars[i];
        if (i==0){ tr[i] = b.high - b.low; continue; }
        const double pc = bars[i-1].close;
        tr[i] = std::max(b.high, pc) - std::min(b.low, pc);
    }
    return tr;
}

std::vector<double> compute_atr(const std::vector<Bar>& bars, std::size_t window){
    const auto tr = compute_true_range(bars);
    std::vector<double> atr(bars.size(), 0.0);
    if (window==0) return atr;
    double sum=0.0;
    for (std::size_t i=0;i<tr.size();++i){
        sum += tr[i];
        if (i>=window) sum -= tr[i-window];
        if (i+1>=window) atr[i] = sum/static_cast<double>(window);
    }
    return atr;
}
} // namespace ind
