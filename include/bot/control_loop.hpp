#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include "bot/config.hpp"
#include "exec/exchange_port.hpp"
#include "exec/order_reconciler.hpp"
#include "exec/protective_stop.hpp"

namespace bot {

constexpr int kCandleLimit = 100;
constexpr std::size_t kMinCandles = 15;

enum class CycleOutcome {
    Idle,          // running=false
    OutOfSession,
    Flat,          // belépő orderek egyeztetve
    Positioned,    // védőstop kezelve
    Skipped,       // kevés adat
    Failed         // tőzsdei / konfigurációs hiba, back-off
};

const char* to_string(CycleOutcome o);

struct LoopTiming {
    std::chrono::milliseconds cadence{1000};
    std::chrono::milliseconds idle_wait{5000};
    std::chrono::milliseconds failure_backoff{5000};
};

// Egyszálú vezérlő ciklus. A védőstop állapotot kizárólag ez birtokolja.
class ControlLoop {
public:
    using Clock = std::function<strat::TimePoint()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ControlLoop(IConfigSource& config, exec::IExchangePort& port);
    ControlLoop(IConfigSource& config, exec::IExchangePort& port, Clock now, Sleeper sleep,
                LoopTiming timing = {});

    // Egy iteráció, alvás nélkül. Nem várt hibánál kivételt dobhat; run() kezeli.
    CycleOutcome run_once();

    // Fut, amíg stop igaz nem lesz; a flaget minden iteráció elején nézi
    void run(const std::atomic<bool>& stop);

    const exec::ProtectiveStopState& stop_state() const { return stop_state_; }

private:
    CycleOutcome trade_cycle(const BotConfig& cfg);
    CycleOutcome flat_cycle(const BotConfig& cfg, const std::vector<Order>& orders);

    IConfigSource& config_;
    exec::IExchangePort& port_;
    exec::OrderReconciler reconciler_;
    exec::ProtectiveStopManager stops_;
    exec::ProtectiveStopState stop_state_;
    std::string symbol_;
    Clock now_;
    Sleeper sleep_;
    LoopTiming timing_;
};

} // namespace bot
