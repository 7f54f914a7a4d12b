#include "strategy/session_gate.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <cstdio>

namespace strat {

using namespace std::chrono;

static inline seconds day_start(TimePoint t){
    // UTC napkezdet epoch óta; negatív időre is lefelé kerekít
    const auto s = duration_cast<seconds>(t.time_since_epoch()).count();
    constexpr long long day = 86400;
    long long d = s / day;
    if (s % day < 0) --d;
    return seconds{d*day};
}

SessionTime parse_session_time(const std::string& s){
    int h=-1, m=-1, sec=0, used=0;
    bool ok = std::sscanf(s.c_str(), "%d:%d%n", &h, &m, &used) == 2;
    if (ok && used < static_cast<int>(s.size())){
        int more = 0;
        ok = std::sscanf(s.c_str()+used, ":%d%n", &sec, &more) == 1
             && used+more == static_cast<int>(s.size());
    }
    if (!ok)
        throw InvalidConfiguration(fmt::format("invalid session time '{}', expected HH:MM (24-hour)", s));
    if (h<0 || h>23 || m<0 || m>59 || sec<0 || sec>59)
        throw InvalidConfiguration(fmt::format("session time '{}' out of range", s));
    return {h, m, sec};
}

std::string format_session_time(const SessionTime& t){
    return fmt::format("{:02}:{:02}:{:02}", t.hour, t.minute, t.second);
}

SessionWindow session_window(TimePoint now, const SessionTime& start, seconds length){
    const seconds offset = hours{start.hour} + minutes{start.minute} + seconds{start.second};
    TimePoint begin{day_start(now) + offset};
    if (now < begin) begin -= hours{24}; // tegnapi kezdés, ami még tarthat
    return {begin, begin + length};
}

bool in_session(TimePoint now, const SessionTime& start, seconds length){
    return session_window(now, start, length).contains(now);
}

} // namespace strat
