#pragma once
#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "exec/exchange_port.hpp"

namespace exec {

// --- Alap config
struct ApiConfig {
    std::string api_key;
    std::string api_secret;
    bool testnet{true};
    int timeout_ms{5000};
};

// BINANCE_API_KEY, BINANCE_API_SECRET, BINANCE_TESTNET, BINANCE_TIMEOUT_MS
ApiConfig api_config_from_env();

// Binance USD-M perpetual futures REST kliens (HMAC-SHA256 aláírt kérések)
class BinanceFutures final : public IExchangePort {
public:
    explicit BinanceFutures(ApiConfig cfg);

    Result<std::vector<Bar>> get_candles(const std::string& symbol, Timeframe tf, int limit) override;
    Result<std::vector<Order>> get_open_orders(const std::string& symbol) override;
    Result<Order> place_conditional_stop(const StopOrderRequest& req) override;
    Result<CancelOutcome> cancel_order(const std::string& symbol, std::uint64_t order_id) override;
    Result<std::optional<Position>> get_position(const std::string& symbol) override;
    Result<double> get_mark_price(const std::string& symbol) override;
    Result<std::optional<Order>> close_position_market(const std::string& symbol) override;

private:
    enum class Method { Get, Post, Delete };

    std::string rest_base() const;
    std::string sign_query(const std::string& query) const; // HMAC-SHA256

    Result<nlohmann::json> request(Method m, const std::string& path, std::string query, bool signed_req);

    ApiConfig cfg_;
};

} // namespace exec
