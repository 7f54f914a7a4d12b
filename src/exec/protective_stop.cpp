#include "exec/protective_stop.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace exec {

// long: magasabb stop védőbb; short: alacsonyabb
static inline bool more_protective(PositionSide side, double a, double b){
    return side==PositionSide::Long ? a > b : a < b;
}

double ProtectiveStopManager::initial_stop_price(const Position& pos, double sl_amount){
    return pos.side==PositionSide::Long ? pos.entry_price - sl_amount : pos.entry_price + sl_amount;
}

double ProtectiveStopManager::limit_for(PositionSide side, double stop_price, double buffer){
    // puffer a vesztes irányba
    return side==PositionSide::Long ? stop_price - buffer : stop_price + buffer;
}

// a védőstop a teljes pozíciót fedi-e
static inline bool covers(const Order& o, const Position& pos, const SymbolFilters& f){
    return same_price(o.quantity, pos.quantity, f.qty_step);
}

StopPhase ProtectiveStopManager::derive_phase(PositionSide side, double entry, double stop_price, double tick){
    if (same_price(stop_price, entry, tick)) return StopPhase::BreakEvenSet;
    return more_protective(side, stop_price, entry) ? StopPhase::Trailing : StopPhase::InitialStopSet;
}

ProtectiveStopState ProtectiveStopManager::place(const StopParams& p, ProtectiveStopState state,
                                                 const Position& pos, double stop_price, StopPhase next){
    const double tick = p.filters.tick_size;
    stop_price = round_step(stop_price, tick);
    const double limit = round_step(limit_for(pos.side, stop_price, p.filters.price_buffer), tick);

    StopOrderRequest req{p.symbol, closing_side(pos.side), stop_price, limit, pos.quantity, true};
    auto r = port_.place_conditional_stop(req);
    if (!r){
        spdlog::warn("place protective stop @ {} failed: {} {}", stop_price,
                     to_string(r.error().kind), r.error().message);
        return state;   // nincs élő stop; a következő ciklus pótolja
    }
    state.order_id = r->id;
    state.stop_price = stop_price;
    state.phase = next;
    spdlog::info("protective stop {} {} trigger={} limit={} qty={} -> {}", r->id,
                 to_string(req.side), stop_price, limit, pos.quantity, to_string(next));
    return state;
}

ProtectiveStopState ProtectiveStopManager::move(const StopParams& p, ProtectiveStopState state,
                                                const Position& pos, double stop_price, StopPhase next){
    const auto old_id = *state.order_id;
    auto c = port_.cancel_order(p.symbol, old_id);
    if (!c){
        spdlog::warn("cancel protective stop {} failed: {} {}", old_id,
                     to_string(c.error().kind), c.error().message);
        return state;
    }
    if (*c == CancelOutcome::NotFound) spdlog::warn("protective stop {} was already gone", old_id);

    // a törlés megtörtént: innentől nincs élő stop, amíg az új le nem megy
    state.order_id.reset();
    return place(p, state, pos, stop_price, next);
}

// Minden záró oldali stop-limit törlése a megtartott kivételével. Egy sikertelen törlést
// a következő ciklus újrapróbál, mert ez minden pozíciós ciklusban lefut.
void ProtectiveStopManager::cancel_extra_stops(const StopParams& p, const Position& pos,
                                               const std::vector<Order>& open_orders,
                                               std::optional<std::uint64_t> keep){
    const Side cs = closing_side(pos.side);
    for (const auto& o : open_orders){
        if (o.type!=OrderType::StopLimit || o.side!=cs) continue;
        if (keep && o.id==*keep) continue;
        auto c = port_.cancel_order(p.symbol, o.id);
        if (!c) spdlog::warn("cancel extra stop {} failed: {} {}", o.id, to_string(c.error().kind), c.error().message);
        else spdlog::info("cancelled extra closing stop {} @ {}", o.id, o.trigger_price);
    }
}

ProtectiveStopState ProtectiveStopManager::recover_or_place(const StopParams& p, ProtectiveStopState state,
                                                            const Position& pos,
                                                            const std::vector<Order>& open_orders){
    const Side cs = closing_side(pos.side);
    const double tick = p.filters.tick_size;

    std::vector<const Order*> live;
    for (const auto& o : open_orders)
        if (o.type==OrderType::StopLimit && o.side==cs) live.push_back(&o);
    std::sort(live.begin(), live.end(), [&](const Order* a, const Order* b){
        return more_protective(pos.side, a->trigger_price, b->trigger_price);
    });

    const Order* adopt = nullptr;
    if (!live.empty()){
        const Order* best = live.front();
        if (state.phase==StopPhase::NoPosition || !more_protective(pos.side, state.stop_price, best->trigger_price))
            adopt = best;
    }

    cancel_extra_stops(p, pos, open_orders, adopt ? std::optional<std::uint64_t>{adopt->id} : std::nullopt);

    if (adopt){
        const StopPhase derived = derive_phase(pos.side, pos.entry_price, adopt->trigger_price, tick);
        state.order_id = adopt->id;
        state.stop_price = adopt->trigger_price;
        state.phase = std::max(state.phase, derived);   // a break-even sosem lép vissza
        spdlog::info("adopted live stop {} @ {} as {}", adopt->id, adopt->trigger_price, to_string(state.phase));
        if (!covers(*adopt, pos, p.filters)){
            spdlog::warn("adopted stop {} qty={} does not cover position qty={}, resizing",
                         adopt->id, adopt->quantity, pos.quantity);
            return move(p, state, pos, state.stop_price, state.phase);
        }
        return state;
    }

    if (state.phase==StopPhase::NoPosition)
        return place(p, state, pos, initial_stop_price(pos, p.sl_amount), StopPhase::InitialStopSet);

    spdlog::warn("repairing protective stop @ {} ({})", state.stop_price, to_string(state.phase));
    return place(p, state, pos, state.stop_price, state.phase);
}

ProtectiveStopState ProtectiveStopManager::step(const StopParams& p, ProtectiveStopState state,
                                                const std::optional<Position>& pos,
                                                const std::vector<Order>& open_orders){
    if (!pos){
        if (state.phase!=StopPhase::NoPosition || state.order_id)
            spdlog::info("position closed, protective stop state reset (was {})", to_string(state.phase));
        return ProtectiveStopState{};
    }

    const double tick = p.filters.tick_size;
    if (state.phase!=StopPhase::NoPosition &&
        (pos->side!=state.position_side || !same_price(pos->entry_price, state.entry_price, tick))){
        spdlog::info("new {} position @ {} detected, resetting protective stop", to_string(pos->side), pos->entry_price);
        state = ProtectiveStopState{};
    }
    state.position_side = pos->side;
    state.entry_price = pos->entry_price;

    const Order* tracked = nullptr;
    if (state.order_id){
        const auto id = *state.order_id;
        auto it = std::find_if(open_orders.begin(), open_orders.end(),
                               [id](const Order& o){ return o.id==id; });
        if (it==open_orders.end()){
            spdlog::warn("protective stop {} no longer open", id);
            state.order_id.reset();
        } else {
            tracked = &*it;
        }
    }

    if (!tracked)
        return recover_or_place(p, state, *pos, open_orders);

    cancel_extra_stops(p, *pos, open_orders, state.order_id);

    if (!covers(*tracked, *pos, p.filters)){
        spdlog::warn("protective stop {} qty={} does not cover position qty={}, resizing",
                     tracked->id, tracked->quantity, pos->quantity);
        return move(p, state, *pos, state.stop_price, state.phase);
    }

    auto mark = port_.get_mark_price(p.symbol);
    if (!mark){
        spdlog::warn("mark price unavailable: {} {}", to_string(mark.error().kind), mark.error().message);
        return state;
    }

    const bool is_long = pos->side==PositionSide::Long;
    const double profit = is_long ? *mark - pos->entry_price : pos->entry_price - *mark;
    const double threshold = p.sl_amount + p.tsl_step;
    if (profit < threshold) return state;

    if (!state.break_even_applied()){
        spdlog::info("profit {} >= {}, moving stop to break-even {}", profit, threshold, pos->entry_price);
        return move(p, state, *pos, pos->entry_price, StopPhase::BreakEvenSet);
    }

    // egy lépés az aktuális stoptól, amíg a stop legalább threshold távolságra marad a marktól
    const double locked = is_long ? *mark - state.stop_price : state.stop_price - *mark;
    if (locked < threshold) return state;

    const double next = is_long ? state.stop_price + p.tsl_step : state.stop_price - p.tsl_step;
    spdlog::info("trailing stop by {} from {} to {}", p.tsl_step, state.stop_price, next);
    return move(p, state, *pos, next, StopPhase::Trailing);
}

} // namespace exec
