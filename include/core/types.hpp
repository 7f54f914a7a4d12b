#pragma once
#include <cstdint>
#include <string>
#include <optional>

// Időkeret
enum class Timeframe { M1, M3, M5, M15, M30, H1, H4, D1 };

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "1m";
        case Timeframe::M3:  return "3m";
        case Timeframe::M5:  return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1:  return "1h";
        case Timeframe::H4:  return "4h";
        default:             return "1d";
    }
}

inline std::optional<Timeframe> parse_timeframe(const std::string& s) {
    if (s=="1m")  return Timeframe::M1;
    if (s=="3m")  return Timeframe::M3;
    if (s=="5m")  return Timeframe::M5;
    if (s=="15m") return Timeframe::M15;
    if (s=="30m") return Timeframe::M30;
    if (s=="1h")  return Timeframe::H1;
    if (s=="4h")  return Timeframe::H4;
    if (s=="1d")  return Timeframe::D1;
    return std::nullopt;
}

// OHLCV bar (gyertya)
struct Bar {
    std::int64_t open_time_ms{}; // kline open time (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

// Jel típus
enum class Signal { Long, Short, Neutral };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::Long:  return "LONG";
        case Signal::Short: return "SHORT";
        default:            return "WAIT";
    }
}

// Order oldal és típus — a mag saját szókészlete, független a tőzsdei klienstől
enum class Side { Buy, Sell };
enum class OrderType { StopLimit, Market, Other };
enum class PositionSide { Long, Short };

inline const char* to_string(Side s) { return s==Side::Buy ? "BUY" : "SELL"; }
inline const char* to_string(PositionSide s) { return s==PositionSide::Long ? "LONG" : "SHORT"; }

inline Side opposite(Side s) { return s==Side::Buy ? Side::Sell : Side::Buy; }

// Pozíció zárásához szükséges order oldal
inline Side closing_side(PositionSide p) { return p==PositionSide::Long ? Side::Sell : Side::Buy; }

struct Order {
    std::uint64_t id{0};
    Side side{Side::Buy};
    OrderType type{OrderType::Other};
    double trigger_price{0.0}; // stopPrice
    double limit_price{0.0};   // price
    double quantity{0.0};
};

struct Position {
    PositionSide side{PositionSide::Long};
    double entry_price{0.0};
    double quantity{0.0};      // mindig pozitív
};
