#include "indicators/vwap.hpp"

namespace ind {
std::vector<double> compute_vwap(const std::vector<Bar>& bars, std::size_t window){
    std::vector<double> out(bars.size(), 0.0);
    if (window==0) window = 1;
    double pv=0.0, vol=0.0;
    for (std::size_t i=0;i<bars.size();++i){
        const auto& b = bars[i];
        pv  += (b.high + b.low + b.close)/3.0 * b.volume;
        vol += b.volume;
        if (i>=window){
            const auto& old = bars[i-window];
            pv  -= (old.high + old.low + old.close)/3.0 * old.volume;
            vol -= old.volume;
        }
        // nulla forgalmú ablak: a bar tipikus ára
        out[i] = (vol>0.0 ? pv/vol : (b.high + b.low + b.close)/3.0);
    }
    return out;
}
} // namespace ind
