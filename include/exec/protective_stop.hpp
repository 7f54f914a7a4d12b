#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "exec/exchange_port.hpp"
#include "exec/filters.hpp"

namespace exec {

// NoPosition -> InitialStopSet -> BreakEvenSet -> Trailing (ismételten)
enum class StopPhase { NoPosition, InitialStopSet, BreakEvenSet, Trailing };

inline const char* to_string(StopPhase p) {
    switch (p) {
        case StopPhase::NoPosition:     return "NoPosition";
        case StopPhase::InitialStopSet: return "InitialStopSet";
        case StopPhase::BreakEvenSet:   return "BreakEvenSet";
        default:                        return "Trailing";
    }
}

// Munkamenet-szintű állapot (memóriában, nem perzisztált). A control loop birtokolja,
// lépésenként explicit adja át és kapja vissza.
struct ProtectiveStopState {
    StopPhase phase{StopPhase::NoPosition};
    std::optional<std::uint64_t> order_id;   // élő védőstop, ha van
    double stop_price{0.0};                  // utolsó ismert stop (trigger) ár
    PositionSide position_side{PositionSide::Long};
    double entry_price{0.0};

    bool break_even_applied() const {
        return phase==StopPhase::BreakEvenSet || phase==StopPhase::Trailing;
    }
};

struct StopParams {
    std::string symbol;
    double sl_amount{0.0};
    double tsl_step{0.0};
    SymbolFilters filters;
};

class ProtectiveStopManager {
public:
    explicit ProtectiveStopManager(IExchangePort& port) : port_(port) {}

    // Egy ciklus. `pos` és `open_orders` az ebben a ciklusban lekért tőzsdei állapot.
    // Tőzsdei hiba esetén az átmenet elmarad, a következő ciklus újrapróbálja.
    ProtectiveStopState step(const StopParams& p, ProtectiveStopState state,
                             const std::optional<Position>& pos,
                             const std::vector<Order>& open_orders);

    static double initial_stop_price(const Position& pos, double sl_amount);
    static double limit_for(PositionSide side, double stop_price, double buffer);

    // Élő stop árából visszafejtett fázis (újraindítás utáni helyreállítás)
    static StopPhase derive_phase(PositionSide side, double entry, double stop_price, double tick);

private:
    ProtectiveStopState recover_or_place(const StopParams& p, ProtectiveStopState state,
                                         const Position& pos, const std::vector<Order>& open_orders);
    void cancel_extra_stops(const StopParams& p, const Position& pos, const std::vector<Order>& open_orders,
                            std::optional<std::uint64_t> keep);
    ProtectiveStopState place(const StopParams& p, ProtectiveStopState state, const Position& pos,
                              double stop_price, StopPhase next);
    ProtectiveStopState move(const StopParams& p, ProtectiveStopState state, const Position& pos,
                             double stop_price, StopPhase next);

    IExchangePort& port_;
};

} // namespace exec
