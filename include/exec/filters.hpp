#pragma once
#include <cmath>

namespace exec {

// Szimbólumfüggő ár paraméterek (a limit puffer és a tick méret nem globális konstans)
struct SymbolFilters {
    double tick_size{0.01};
    double price_buffer{0.5};   // stop -> limit távolság árban
    double qty_step{0.001};
};

inline double round_step(double v, double step){
    if (step<=0) return v;
    return std::round(v/step)*step;
}

// Két ár azonos, ha fél ticken belül vannak
inline bool same_price(double a, double b, double tick){
    const double tol = tick>0 ? tick/2.0 : 1e-9;
    return std::abs(a-b) < tol;
}

} // namespace exec
