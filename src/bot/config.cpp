#include "bot/config.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace bot {

static double parse_number(const std::string& key, const std::string& s){
    std::size_t used = 0;
    double v = 0.0;
    try { v = std::stod(s, &used); }
    catch (const std::exception&) { used = 0; }
    if (used==0 || used!=s.size() || !std::isfinite(v))
        throw InvalidConfiguration(fmt::format("{} must be numeric, got '{}'", key, s));
    return v;
}

// szám vagy számot tartalmazó string is elfogadott
static double number_field(const json& j, const char* key, double def){
    if (!j.contains(key)) return def;
    const auto& v = j[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parse_number(key, v.get<std::string>());
    throw InvalidConfiguration(fmt::format("{} must be numeric", key));
}

static bool parse_bool(const std::string& key, const std::string& s){
    if (s=="true" || s=="1" || s=="on")   return true;
    if (s=="false" || s=="0" || s=="off") return false;
    throw InvalidConfiguration(fmt::format("{} must be true/false, got '{}'", key, s));
}

void validate(const BotConfig& c){
    if (c.symbol.empty()) throw InvalidConfiguration("symbol must not be empty");
    if (!(c.sl_amount > 0.0))      throw InvalidConfiguration("sl_amount must be positive");
    if (!(c.tsl_step > 0.0))       throw InvalidConfiguration("tsl_step must be positive");
    if (!(c.trade_quantity > 0.0)) throw InvalidConfiguration("trade_quantity must be positive");
    if (!(c.filters.tick_size > 0.0))     throw InvalidConfiguration("tick_size must be positive");
    if (c.filters.price_buffer < 0.0)     throw InvalidConfiguration("price_buffer must not be negative");
}

BotConfig config_from_json(const json& j){
    if (!j.is_object()) throw InvalidConfiguration("config must be a JSON object");
    BotConfig c;
    try {
        c.symbol = j.value("symbol", c.symbol);
        const std::string tf = j.value("timeframe", std::string(to_string(c.timeframe)));
        auto parsed = parse_timeframe(tf);
        if (!parsed) throw InvalidConfiguration(fmt::format("unknown timeframe '{}'", tf));
        c.timeframe = *parsed;
        if (j.contains("session_start"))
            c.session_start = strat::parse_session_time(j["session_start"].get<std::string>());
        c.running = j.value("running", c.running);
    } catch (const json::exception& e) {
        throw InvalidConfiguration(fmt::format("config field has wrong type: {}", e.what()));
    }
    c.sl_amount      = number_field(j, "sl_amount", c.sl_amount);
    c.tsl_step       = number_field(j, "tsl_step", c.tsl_step);
    c.trade_quantity = number_field(j, "trade_quantity", c.trade_quantity);
    c.filters.price_buffer = number_field(j, "price_buffer", c.filters.price_buffer);
    c.filters.tick_size    = number_field(j, "tick_size", c.filters.tick_size);
    c.filters.qty_step     = number_field(j, "qty_step", c.filters.qty_step);
    validate(c);
    return c;
}

json config_to_json(const BotConfig& c){
    return json{
        {"symbol", c.symbol},
        {"timeframe", to_string(c.timeframe)},
        {"session_start", strat::format_session_time(c.session_start)},
        {"sl_amount", c.sl_amount},
        {"tsl_step", c.tsl_step},
        {"trade_quantity", c.trade_quantity},
        {"price_buffer", c.filters.price_buffer},
        {"tick_size", c.filters.tick_size},
        {"qty_step", c.filters.qty_step},
        {"running", c.running}
    };
}

void apply_setting(BotConfig& c, const std::string& key, const std::string& value){
    if (key=="symbol"){
        std::string s = value;
        for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        c.symbol = s;
    }
    else if (key=="timeframe"){
        auto tf = parse_timeframe(value);
        if (!tf) throw InvalidConfiguration(fmt::format("unknown timeframe '{}'", value));
        c.timeframe = *tf;
    }
    else if (key=="session_start")  c.session_start = strat::parse_session_time(value);
    else if (key=="sl_amount")      c.sl_amount = parse_number(key, value);
    else if (key=="tsl_step")       c.tsl_step = parse_number(key, value);
    else if (key=="trade_quantity") c.trade_quantity = parse_number(key, value);
    else if (key=="price_buffer")   c.filters.price_buffer = parse_number(key, value);
    else if (key=="tick_size")      c.filters.tick_size = parse_number(key, value);
    else if (key=="qty_step")       c.filters.qty_step = parse_number(key, value);
    else if (key=="running")        c.running = parse_bool(key, value);
    else throw InvalidConfiguration(fmt::format("unknown config key '{}'", key));
}

BotConfig JsonConfigStore::load(){
    std::ifstream f(path_);
    if (!f.good()) throw InvalidConfiguration(fmt::format("cannot open config '{}'", path_));
    json j;
    try { j = json::parse(f); }
    catch (const json::parse_error& e) {
        throw InvalidConfiguration(fmt::format("config '{}' is not valid JSON: {}", path_, e.what()));
    }
    return config_from_json(j);
}

void JsonConfigStore::save(const BotConfig& c){
    validate(c);
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.good()) throw std::runtime_error(fmt::format("cannot write '{}'", tmp));
        f << config_to_json(c).dump(2) << "\n";
        if (!f.good()) throw std::runtime_error(fmt::format("write to '{}' failed", tmp));
    }
    // rename: az olvasó vagy a régi, vagy az új teljes rekordot látja
    if (std::rename(tmp.c_str(), path_.c_str()) != 0)
        throw std::runtime_error(fmt::format("cannot replace '{}'", path_));
    spdlog::info("config saved to {}", path_);
}

} // namespace bot
