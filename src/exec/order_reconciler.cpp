#include "exec/order_reconciler.hpp"
#include <spdlog/spdlog.h>

namespace exec {

bool OrderReconciler::cancel(const std::string& symbol, const Order& o, ReconcileReport& rep){
    auto r = port_.cancel_order(symbol, o.id);
    if (!r){
        ++rep.failures;
        spdlog::warn("cancel entry {} {} @ {} failed: {} {}", o.id, to_string(o.side), o.trigger_price,
                     to_string(r.error().kind), r.error().message);
        return false;
    }
    ++rep.cancelled;
    if (*r == CancelOutcome::NotFound) spdlog::info("entry order {} already gone", o.id);
    else spdlog::info("cancelled {} entry order {} @ {}", to_string(o.side), o.id, o.trigger_price);
    return true;
}

ReconcileReport OrderReconciler::reconcile(const EntryParams& p, Signal sig,
                                           const ind::IndicatorFrame& latest_closed,
                                           const std::vector<Order>& open_orders){
    ReconcileReport rep;

    if (sig == Signal::Neutral){
        // nincs jel: minden nyugvó stop-limit belépő törlése, mindkét oldalon
        for (const auto& o : open_orders){
            if (o.type == OrderType::StopLimit) cancel(p.symbol, o, rep);
        }
        return rep;
    }

    const Side side = (sig == Signal::Long ? Side::Buy : Side::Sell);
    const double tick = p.filters.tick_size;
    const double trigger = round_step(side==Side::Buy ? latest_closed.bar.high : latest_closed.bar.low, tick);
    const double limit = round_step(side==Side::Buy ? trigger + p.filters.price_buffer
                                                     : trigger - p.filters.price_buffer, tick);

    const Order* keep = nullptr;
    for (const auto& o : open_orders){
        if (o.type==OrderType::StopLimit && o.side==side && same_price(o.trigger_price, trigger, tick)){
            keep = &o;
            break;
        }
    }

    bool clear = true;
    for (const auto& o : open_orders){
        if (o.type != OrderType::StopLimit || &o == keep) continue;
        // ellentétes oldali elavult belépő, vagy régi trigger árú / duplikált azonos oldali
        if (!cancel(p.symbol, o, rep) && o.side==side) clear = false;
    }

    if (keep) return rep;
    if (!clear){
        // a régi order még élhet: inkább nem teszünk mellé egy másodikat
        spdlog::warn("{} entry not replaced this cycle, stale order still live", to_string(side));
        return rep;
    }

    const double qty = round_step(p.quantity, p.filters.qty_step);
    StopOrderRequest req{p.symbol, side, trigger, limit, qty, false};
    auto placed = port_.place_conditional_stop(req);
    if (!placed){
        ++rep.failures;
        spdlog::warn("place {} entry stop @ {} failed: {} {}", to_string(side), trigger,
                     to_string(placed.error().kind), placed.error().message);
        return rep;
    }
    ++rep.placed;
    spdlog::info("placed {} stop-limit entry {} trigger={} limit={} qty={}",
                 to_string(side), placed->id, trigger, limit, qty);
    return rep;
}

} // namespace exec
