#include "exec/binance_codec.hpp"
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

using json = nlohmann::json;

namespace exec {
namespace binance {

// a Binance a számokat többnyire stringként adja
double to_d(const json& j, const char* k){
    if (!j.contains(k)) return 0.0;
    if (j[k].is_string()) return std::strtod(j[k].get_ref<const std::string&>().c_str(), nullptr);
    if (j[k].is_number()) return j[k].get<double>();
    return 0.0;
}

static double elem_d(const json& v){
    if (v.is_string()) return std::strtod(v.get_ref<const std::string&>().c_str(), nullptr);
    if (v.is_number()) return v.get<double>();
    return 0.0;
}

std::vector<Bar> parse_klines(const json& j){
    std::vector<Bar> out;
    if (!j.is_array()) return out;
    out.reserve(j.size());
    // [openTime, open, high, low, close, volume, closeTime, ...]
    for (const auto& k : j){
        if (!k.is_array() || k.size() < 6) continue;
        Bar b;
        b.open_time_ms = k[0].is_number() ? k[0].get<std::int64_t>() : 0;
        b.open   = elem_d(k[1]);
        b.high   = elem_d(k[2]);
        b.low    = elem_d(k[3]);
        b.close  = elem_d(k[4]);
        b.volume = elem_d(k[5]);
        out.push_back(b);
    }
    return out;
}

OrderType parse_order_type(const std::string& s){
    // futures stop-limit: "STOP"; a spot megfelelője "STOP_LOSS_LIMIT"
    if (s=="STOP" || s=="STOP_LOSS_LIMIT") return OrderType::StopLimit;
    if (s=="MARKET") return OrderType::Market;
    return OrderType::Other;
}

Side parse_side(const std::string& s){
    return s=="SELL" ? Side::Sell : Side::Buy;
}

Order parse_order(const json& j){
    Order o;
    o.id            = j.value("orderId", 0ULL);
    o.side          = parse_side(j.value("side", std::string{}));
    o.type          = parse_order_type(j.value("type", std::string{}));
    o.trigger_price = to_d(j, "stopPrice");
    o.limit_price   = to_d(j, "price");
    o.quantity      = to_d(j, "origQty");
    return o;
}

std::vector<Order> parse_orders(const json& j){
    std::vector<Order> v;
    if (!j.is_array()) return v;
    for (const auto& o : j) v.push_back(parse_order(o));
    return v;
}

std::optional<Position> parse_position(const json& j){
    if (!j.is_array()) return std::nullopt;
    for (const auto& p : j){
        const double amt = to_d(p, "positionAmt");
        if (amt == 0.0) continue;
        Position pos;
        pos.side = amt > 0 ? PositionSide::Long : PositionSide::Short;
        pos.entry_price = to_d(p, "entryPrice");
        pos.quantity = std::abs(amt);
        return pos;
    }
    return std::nullopt;
}

double parse_mark_price(const json& j){
    return to_d(j, "markPrice");
}

ExchangeError classify_error(long status, const std::string& body){
    if (status == 0) return {ErrorKind::TransientNetwork, body.empty() ? "no response" : body};
    // 418/429: rate limit, 5xx: szerveroldali — mind átmeneti
    if (status >= 500 || status == 429 || status == 418)
        return {ErrorKind::TransientNetwork, fmt::format("HTTP {} {}", status, body)};

    int code = 0;
    std::string msg = body;
    try {
        auto j = json::parse(body);
        code = j.value("code", 0);
        msg  = j.value("msg", body);
    } catch (const json::exception&) {}

    if (code == kUnknownOrder) return {ErrorKind::NotFound, msg};
    return {ErrorKind::Rejected, fmt::format("HTTP {} code={} {}", status, code, msg)};
}

std::string format_decimal(double v){
    std::string s = fmt::format("{:.8f}", v);
    while (!s.empty() && s.back()=='0') s.pop_back();
    if (!s.empty() && s.back()=='.') s.pop_back();
    return s.empty() || s=="-" ? "0" : s;
}

} // namespace binance
} // namespace exec
