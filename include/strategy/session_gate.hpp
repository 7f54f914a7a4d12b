#pragma once
#include <chrono>
#include <string>

namespace strat {

using TimePoint = std::chrono::system_clock::time_point;

constexpr std::chrono::hours kSessionLength{21};

// Kereskedési ablak kezdete (UTC napszak)
struct SessionTime {
    int hour{8};
    int minute{0};
    int second{0};
};

// "HH:MM" vagy "HH:MM:SS"; hibás formátumra InvalidConfiguration
SessionTime parse_session_time(const std::string& s);
std::string format_session_time(const SessionTime& t);

struct SessionWindow {
    TimePoint begin;
    TimePoint end;   // kizárólagos
    bool contains(TimePoint t) const { return begin <= t && t < end; }
};

// A `now`-t tartalmazó, vagy a `now` előtti legutolsó kezdetű ablak
SessionWindow session_window(TimePoint now, const SessionTime& start,
                             std::chrono::seconds length = kSessionLength);

// Igaz, ha now a [start, start+length) félig nyitott intervallumban van
// (mai vagy tegnapi kezdéssel — éjfélen átnyúló ablak is egy intervallum)
bool in_session(TimePoint now, const SessionTime& start,
                std::chrono::seconds length = kSessionLength);

} // namespace strat
