#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "bot/config.hpp"
#include "bot/control_loop.hpp"
#include "exec/binance_futures.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int){ g_stop.store(true); }

static void setup_logging(const std::string& log_file){
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, 10*1024*1024, 5);
    auto logger = std::make_shared<spdlog::logger>("trendbot", spdlog::sinks_init_list{console, file});
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %l %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Hasznalat: trendbot <config.json> [log_file] [--debug]\n";
        return 1;
    }
    const std::string cfg_path = argv[1];
    std::string log_file = "bot.log";
    bool debug = false;
    for (int i=2;i<argc;++i){
        const std::string a = argv[i];
        if (a=="--debug") debug = true;
        else log_file = a;
    }

    try {
        setup_logging(log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log init sikertelen: " << e.what() << "\n";
        return 2;
    }
    if (debug) spdlog::set_level(spdlog::level::debug);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto api = exec::api_config_from_env();
    if (api.api_key.empty() || api.api_secret.empty())
        spdlog::warn("BINANCE_API_KEY / BINANCE_API_SECRET not set, signed requests will fail");
    spdlog::info("trendbot starting, config={} testnet={}", cfg_path, api.testnet);

    exec::BinanceFutures exchange(api);
    bot::JsonConfigStore store(cfg_path);
    bot::ControlLoop loop(store, exchange);
    loop.run(g_stop);

    spdlog::shutdown();
    return 0;
}
