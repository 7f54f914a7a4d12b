#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "exec/result.hpp"

namespace exec {

// Binance USD-M futures JSON <-> mag típusok
namespace binance {

// Binance hibakód: "Unknown order sent."
constexpr int kUnknownOrder = -2011;

double to_d(const nlohmann::json& j, const char* k);

std::vector<Bar> parse_klines(const nlohmann::json& j);
Order parse_order(const nlohmann::json& j);
std::vector<Order> parse_orders(const nlohmann::json& j);
// positionRisk tömb: az első nem nulla positionAmt, vagy nullopt
std::optional<Position> parse_position(const nlohmann::json& j);
double parse_mark_price(const nlohmann::json& j);

OrderType parse_order_type(const std::string& s);
Side parse_side(const std::string& s);

// HTTP státusz + válasz törzs -> hibafajta
ExchangeError classify_error(long status, const std::string& body);

// max 8 tizedes, záró nullák nélkül ("2301.50000000" -> "2301.5")
std::string format_decimal(double v);

} // namespace binance
} // namespace exec
