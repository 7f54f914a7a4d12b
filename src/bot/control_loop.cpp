#include "bot/control_loop.hpp"
#include "core/errors.hpp"
#include "indicators/supertrend.hpp"
#include "strategy/signal.hpp"
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bot {

const char* to_string(CycleOutcome o){
    switch (o) {
        case CycleOutcome::Idle:         return "idle";
        case CycleOutcome::OutOfSession: return "out-of-session";
        case CycleOutcome::Flat:         return "flat";
        case CycleOutcome::Positioned:   return "positioned";
        case CycleOutcome::Skipped:      return "skipped";
        default:                         return "failed";
    }
}

ControlLoop::ControlLoop(IConfigSource& config, exec::IExchangePort& port)
    : ControlLoop(config, port,
                  []{ return std::chrono::system_clock::now(); },
                  [](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); }) {}

ControlLoop::ControlLoop(IConfigSource& config, exec::IExchangePort& port, Clock now, Sleeper sleep,
                         LoopTiming timing)
    : config_(config), port_(port), reconciler_(port), stops_(port),
      now_(std::move(now)), sleep_(std::move(sleep)), timing_(timing) {}

CycleOutcome ControlLoop::flat_cycle(const BotConfig& cfg, const std::vector<Order>& orders){
    auto candles = port_.get_candles(cfg.symbol, cfg.timeframe, kCandleLimit);
    if (!candles){
        spdlog::error("fetching {} {} candles failed: {} {}", cfg.symbol, to_string(cfg.timeframe),
                      to_string(candles.error().kind), candles.error().message);
        return CycleOutcome::Failed;
    }
    if (candles->size() < kMinCandles)
        throw InsufficientData(fmt::format("got {} candles, need {}", candles->size(), kMinCandles));

    const auto frames = ind::annotate(*candles);
    const auto sig = strat::evaluate_latest(frames);
    const auto& last = strat::latest_closed(frames);
    spdlog::debug("signal {} close={} vwap={} uptrend={}", to_string(sig), last.bar.close, last.vwap, last.uptrend);

    exec::EntryParams ep{cfg.symbol, cfg.trade_quantity, cfg.filters};
    const auto rep = reconciler_.reconcile(ep, sig, last, orders);
    if (rep.exchange_calls() > 0)
        spdlog::info("entry reconcile {}: placed={} cancelled={} failed={}", to_string(sig),
                     rep.placed, rep.cancelled, rep.failures);
    return CycleOutcome::Flat;
}

CycleOutcome ControlLoop::trade_cycle(const BotConfig& cfg){
    auto orders = port_.get_open_orders(cfg.symbol);
    if (!orders){
        spdlog::error("fetching open orders failed: {} {}", to_string(orders.error().kind), orders.error().message);
        return CycleOutcome::Failed;
    }
    auto pos = port_.get_position(cfg.symbol);
    if (!pos){
        spdlog::error("fetching position failed: {} {}", to_string(pos.error().kind), pos.error().message);
        return CycleOutcome::Failed;
    }

    exec::StopParams sp{cfg.symbol, cfg.sl_amount, cfg.tsl_step, cfg.filters};
    stop_state_ = stops_.step(sp, stop_state_, *pos, *orders);

    if (pos->has_value()) return CycleOutcome::Positioned;

    try {
        return flat_cycle(cfg, *orders);
    } catch (const InsufficientData& e) {
        spdlog::warn("skipping cycle: {}", e.what());
        return CycleOutcome::Skipped;
    }
}

CycleOutcome ControlLoop::run_once(){
    BotConfig cfg;
    try {
        cfg = config_.load();
    } catch (const InvalidConfiguration& e) {
        spdlog::error("config unusable: {}", e.what());
        return CycleOutcome::Failed;
    }

    if (!cfg.running) return CycleOutcome::Idle;

    if (cfg.symbol != symbol_){
        if (!symbol_.empty()){
            spdlog::info("symbol changed {} -> {}, protective stop state reset", symbol_, cfg.symbol);
            stop_state_ = exec::ProtectiveStopState{};
        }
        symbol_ = cfg.symbol;
    }

    if (!strat::in_session(now_(), cfg.session_start, cfg.session_length))
        return CycleOutcome::OutOfSession;

    return trade_cycle(cfg);
}

void ControlLoop::run(const std::atomic<bool>& stop){
    spdlog::info("control loop started");
    while (!stop.load()){
        CycleOutcome out = CycleOutcome::Failed;
        try {
            out = run_once();
        } catch (const std::exception& e) {
            spdlog::error("unexpected error in cycle: {}", e.what());
        }

        if (out == CycleOutcome::Idle)        sleep_(timing_.idle_wait);
        else if (out == CycleOutcome::Failed) sleep_(timing_.failure_backoff);
        else                                  sleep_(timing_.cadence);
    }
    spdlog::info("control loop stopped");
}

} // namespace bot
