#include <iostream>
#include <string>


#include "bot/config.hpp"
#include "core/errors.hpp"
#include "exec/binance_futures.hpp"

// Admin felület: konfiguráció szerkesztése és kézi beavatkozás
static void usage(){
    std::cout << "Hasznalat: trendctl <config.json> <parancs>\n"
                 "  show                 konfiguracio kiirasa\n"
                 "  init                 alapertelmezett konfiguracio irasa\n"
                 "  start | stop         running flag\n"
                 "  set <kulcs> <ertek>  mezo beallitasa (symbol, timeframe, session_start,\n"
                 "                       sl_amount, tsl_step, trade_quantity, price_buffer, tick_size, qty_step)\n"
                 "  close-position       pozicio zarasa MARKET orderrel\n"
                 "  cancel-entries       nyugvo stop-limit orderek torlese\n";
}

static int close_position(const bot::BotConfig& cfg){
    exec::BinanceFutures ex(exec::api_config_from_env());
    auto r = ex.close_position_market(cfg.symbol);
    if (!r){
        std::cerr << "Zaras sikertelen: " << to_string(r.error().kind) << " " << r.error().message << "\n";
        return 3;
    }
    if (!r->has_value()) std::cout << "Nincs nyitott pozicio (" << cfg.symbol << ")\n";
    else std::cout << "Pozicio zarva, order " << (*r)->id << "\n";
    return 0;
}

static int cancel_entries(const bot::BotConfig& cfg){
    exec::BinanceFutures ex(exec::api_config_from_env());
    auto orders = ex.get_open_orders(cfg.symbol);
    if (!orders){
        std::cerr << "Nyitott orderek lekerese sikertelen: " << orders.error().message << "\n";
        return 3;
    }
    int failed = 0;
    for (const auto& o : *orders){
        if (o.type != OrderType::StopLimit) continue;
        auto c = ex.cancel_order(cfg.symbol, o.id);
        if (!c){ ++failed; std::cerr << "Torles sikertelen " << o.id << ": " << c.error().message << "\n"; }
        else std::cout << "Torolve " << o.id << " " << to_string(o.side) << " @ " << o.trigger_price << "\n";
    }
    return failed ? 3 : 0;
}

int main(int argc, char** argv) {
    if (argc < 3) { usage(); return 1; }
    bot::JsonConfigStore store(argv[1]);
    const std::string cmd = argv[2];

    try {
        if (cmd=="init"){ store.save(bot::BotConfig{}); return 0; }

        auto cfg = store.load();
        if (cmd=="show"){
            std::cout << bot::config_to_json(cfg).dump(2) << "\n";
        } else if (cmd=="start" || cmd=="stop"){
            const bool want = (cmd=="start");
            if (cfg.running == want){
                std::cout << (want ? "A bot mar fut.\n" : "A bot nem fut.\n");
                return 0;
            }
            cfg.running = want;
            store.save(cfg);
            std::cout << (want ? "Bot elinditva.\n" : "Bot leallitva.\n");
        } else if (cmd=="set"){
            if (argc < 5) { usage(); return 1; }
            bot::apply_setting(cfg, argv[3], argv[4]);
            store.save(cfg);
            std::cout << "Konfiguracio frissitve.\n";
        } else if (cmd=="close-position"){
            return close_position(cfg);
        } else if (cmd=="cancel-entries"){
            return cancel_entries(cfg);
        } else {
            usage();
            return 1;
        }
    } catch (const InvalidConfiguration& e) {
        // a fájl változatlan marad
        std::cerr << "Ervenytelen konfiguracio: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Hiba: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
