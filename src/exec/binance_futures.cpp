#include "exec/binance_futures.hpp"
#include "exec/binance_codec.hpp"
#include <cpr/cpr.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <chrono>
#include <cstdlib>
#include <iomanip>

using json = nlohmann::json;

namespace exec {

static inline uint64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static std::string env_or(const char* name, const std::string& def){
    const char* v = std::getenv(name);
    return v ? std::string(v) : def;
}

ApiConfig api_config_from_env(){
    ApiConfig c;
    c.api_key    = env_or("BINANCE_API_KEY", "");
    c.api_secret = env_or("BINANCE_API_SECRET", "");
    const auto tn = env_or("BINANCE_TESTNET", "1");
    c.testnet = !(tn=="0" || tn=="false");
    try { c.timeout_ms = std::stoi(env_or("BINANCE_TIMEOUT_MS", "5000")); }
    catch (const std::exception&) { spdlog::warn("BINANCE_TIMEOUT_MS not numeric, using {}", c.timeout_ms); }
    return c;
}

BinanceFutures::BinanceFutures(ApiConfig cfg) : cfg_(std::move(cfg)) {}

std::string BinanceFutures::rest_base() const {
    return cfg_.testnet? "https://testnet.binancefuture.com" : "https://fapi.binance.com";
}

std::string BinanceFutures::sign_query(const std::string& query) const {
    unsigned int len = 0;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(),
         reinterpret_cast<const unsigned char*>(cfg_.api_secret.data()),
         (int)cfg_.api_secret.size(),
         reinterpret_cast<const unsigned char*>(query.data()),
         (int)query.size(),
         md, &len);
    std::ostringstream oss;
    for (unsigned int i=0;i<len;++i) oss<< std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
    return oss.str();
}

Result<json> BinanceFutures::request(Method m, const std::string& path, std::string q, bool signed_req){
    if (signed_req){
        if (!q.empty()) q.push_back('&');
        q += "recvWindow=5000&timestamp="+std::to_string(now_ms());
        q += "&signature="+sign_query(q);
    }
    const std::string url = rest_base() + path + (q.empty() ? "" : "?" + q);
    cpr::Header hdr = signed_req ? cpr::Header{{"X-MBX-APIKEY", cfg_.api_key}} : cpr::Header{};

    cpr::Response r;
    switch (m) {
        case Method::Get:    r = cpr::Get(cpr::Url{url}, hdr, cpr::Timeout{cfg_.timeout_ms}, cpr::VerifySsl{true}); break;
        case Method::Post:   r = cpr::Post(cpr::Url{url}, hdr, cpr::Timeout{cfg_.timeout_ms}, cpr::VerifySsl{true}); break;
        case Method::Delete: r = cpr::Delete(cpr::Url{url}, hdr, cpr::Timeout{cfg_.timeout_ms}, cpr::VerifySsl{true}); break;
    }

    if (r.error.code != cpr::ErrorCode::OK)
        return Result<json>::failure(ErrorKind::TransientNetwork, path + ": " + r.error.message);
    if (r.status_code >= 400 || r.status_code == 0){
        auto err = binance::classify_error(r.status_code, r.text);
        spdlog::warn("{} : {} {}", path, r.status_code, r.text);
        return Result<json>::failure(std::move(err));
    }
    try {
        return Result<json>::success(json::parse(r.text.empty()?"{}":r.text));
    } catch (const json::parse_error& e) {
        return Result<json>::failure(ErrorKind::TransientNetwork, path + ": bad JSON: " + e.what());
    }
}

Result<std::vector<Bar>> BinanceFutures::get_candles(const std::string& symbol, Timeframe tf, int limit){
    std::ostringstream q; q<<"symbol="<<symbol<<"&interval="<<to_string(tf)<<"&limit="<<limit;
    auto j = request(Method::Get, "/fapi/v1/klines", q.str(), false);
    if (!j) return Result<std::vector<Bar>>::failure(j.error());
    return Result<std::vector<Bar>>::success(binance::parse_klines(*j));
}

Result<std::vector<Order>> BinanceFutures::get_open_orders(const std::string& symbol){
    auto j = request(Method::Get, "/fapi/v1/openOrders", "symbol="+symbol, true);
    if (!j) return Result<std::vector<Order>>::failure(j.error());
    if (!j->is_array()) return Result<std::vector<Order>>::failure(ErrorKind::TransientNetwork, "openOrders: unexpected payload");
    return Result<std::vector<Order>>::success(binance::parse_orders(*j));
}

Result<Order> BinanceFutures::place_conditional_stop(const StopOrderRequest& req){
    // POST /fapi/v1/order  type=STOP (stop-limit), GTC
    std::ostringstream q;
    q << "symbol=" << req.symbol
      << "&side=" << to_string(req.side)
      << "&type=STOP&timeInForce=GTC"
      << "&quantity=" << binance::format_decimal(req.quantity)
      << "&price=" << binance::format_decimal(req.limit_price)
      << "&stopPrice=" << binance::format_decimal(req.trigger_price);
    if (req.reduce_only) q << "&reduceOnly=true";
    auto j = request(Method::Post, "/fapi/v1/order", q.str(), true);
    if (!j) return Result<Order>::failure(j.error());
    if (!j->contains("orderId")) return Result<Order>::failure(ErrorKind::Rejected, "order: " + j->dump());
    return Result<Order>::success(binance::parse_order(*j));
}

Result<CancelOutcome> BinanceFutures::cancel_order(const std::string& symbol, std::uint64_t order_id){
    std::ostringstream q; q<<"symbol="<<symbol<<"&orderId="<<order_id;
    auto j = request(Method::Delete, "/fapi/v1/order", q.str(), true);
    if (j) return Result<CancelOutcome>::success(CancelOutcome::Cancelled);
    // már nem létező order törlése nem hiba
    if (j.error().kind == ErrorKind::NotFound) return Result<CancelOutcome>::success(CancelOutcome::NotFound);
    return Result<CancelOutcome>::failure(j.error());
}

Result<std::optional<Position>> BinanceFutures::get_position(const std::string& symbol){
    auto j = request(Method::Get, "/fapi/v2/positionRisk", "symbol="+symbol, true);
    if (!j) return Result<std::optional<Position>>::failure(j.error());
    if (!j->is_array()) return Result<std::optional<Position>>::failure(ErrorKind::TransientNetwork, "positionRisk: unexpected payload");
    return Result<std::optional<Position>>::success(binance::parse_position(*j));
}

Result<double> BinanceFutures::get_mark_price(const std::string& symbol){
    auto j = request(Method::Get, "/fapi/v1/premiumIndex", "symbol="+symbol, false);
    if (!j) return Result<double>::failure(j.error());
    const double p = binance::parse_mark_price(*j);
    if (p <= 0.0) return Result<double>::failure(ErrorKind::TransientNetwork, "premiumIndex: no markPrice");
    return Result<double>::success(p);
}

Result<std::optional<Order>> BinanceFutures::close_position_market(const std::string& symbol){
    auto pos = get_position(symbol);
    if (!pos) return Result<std::optional<Order>>::failure(pos.error());
    if (!pos->has_value()) return Result<std::optional<Order>>::success(std::nullopt);

    const auto& p = **pos;
    std::ostringstream q;
    q << "symbol=" << symbol
      << "&side=" << to_string(closing_side(p.side))
      << "&type=MARKET&reduceOnly=true"
      << "&quantity=" << binance::format_decimal(p.quantity);
    auto j = request(Method::Post, "/fapi/v1/order", q.str(), true);
    if (!j) return Result<std::optional<Order>>::failure(j.error());
    spdlog::info("closed {} {} position with MARKET {}", symbol, to_string(p.side), to_string(closing_side(p.side)));
    return Result<std::optional<Order>>::success(binance::parse_order(*j));
}

} // namespace exec
