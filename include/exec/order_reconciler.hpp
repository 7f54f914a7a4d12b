#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"
#include "exec/exchange_port.hpp"
#include "exec/filters.hpp"
#include "indicators/supertrend.hpp"

namespace exec {

struct EntryParams {
    std::string symbol;
    double quantity{0.0};
    SymbolFilters filters;
};

struct ReconcileReport {
    int placed{0};
    int cancelled{0};
    int failures{0};
    int exchange_calls() const { return placed + cancelled + failures; }
};

// Lapos állapotban: pontosan egy nyugvó stop-limit belépő order tükrözze a jelet.
// A nyitott orderek listáját a hívó kéri le ciklusonként egyszer.
class OrderReconciler {
public:
    explicit OrderReconciler(IExchangePort& port) : port_(port) {}

    ReconcileReport reconcile(const EntryParams& p, Signal sig,
                              const ind::IndicatorFrame& latest_closed,
                              const std::vector<Order>& open_orders);

private:
    // false: a törlés nem sikerült (NotFound sikernek számít)
    bool cancel(const std::string& symbol, const Order& o, ReconcileReport& rep);

    IExchangePort& port_;
};

} // namespace exec
