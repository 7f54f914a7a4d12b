#pragma once
#include <string>
#include <vector>
#include <optional>
#include "core/types.hpp"
#include "exec/result.hpp"

namespace exec {

enum class CancelOutcome { Cancelled, NotFound };

// Feltételes stop-limit order kérés
struct StopOrderRequest {
    std::string symbol;
    Side side{Side::Buy};
    double trigger_price{0.0};
    double limit_price{0.0};
    double quantity{0.0};
    bool reduce_only{false};   // védőstop: csak pozíciót zárhat
};

// Absztrakt tőzsdei port — a mag minden I/O-ja ezen keresztül megy.
// Hiba esetén Result::failure, sosem dob kivételt.
class IExchangePort {
public:
    virtual ~IExchangePort() = default;

    virtual Result<std::vector<Bar>> get_candles(const std::string& symbol, Timeframe tf, int limit) = 0;
    virtual Result<std::vector<Order>> get_open_orders(const std::string& symbol) = 0;
    virtual Result<Order> place_conditional_stop(const StopOrderRequest& req) = 0;
    virtual Result<CancelOutcome> cancel_order(const std::string& symbol, std::uint64_t order_id) = 0;
    virtual Result<std::optional<Position>> get_position(const std::string& symbol) = 0;
    virtual Result<double> get_mark_price(const std::string& symbol) = 0;

    // Kézi beavatkozáshoz; a mag automatikusan nem hívja
    virtual Result<std::optional<Order>> close_position_market(const std::string& symbol) = 0;
};

} // namespace exec
