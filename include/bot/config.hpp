#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "exec/filters.hpp"
#include "strategy/session_gate.hpp"

namespace bot {

// A bot konfigurációja. Kívülről szerkesztett, a loop minden ciklusban frissen olvassa.
struct BotConfig {
    std::string symbol{"ETHUSDT"};
    Timeframe timeframe{Timeframe::M1};
    strat::SessionTime session_start{8, 0, 0};
    std::chrono::hours session_length{strat::kSessionLength};   // fix, nem tárolt
    double sl_amount{25.0};
    double tsl_step{10.0};
    double trade_quantity{1.0};
    exec::SymbolFilters filters;
    bool running{false};
};

// InvalidConfiguration, ha valamelyik mező hibás
void validate(const BotConfig& c);

BotConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const BotConfig& c);

// Egy mező szöveges beállítása (trendctl set <key> <value>)
void apply_setting(BotConfig& c, const std::string& key, const std::string& value);

class IConfigSource {
public:
    virtual ~IConfigSource() = default;
    virtual BotConfig load() = 0;
};

// JSON fájl alapú tároló. A mentés validál, majd atomikusan cseréli a fájlt,
// így az olvasó mindig teljes rekordot lát.
class JsonConfigStore final : public IConfigSource {
public:
    explicit JsonConfigStore(std::string path) : path_(std::move(path)) {}

    BotConfig load() override;
    void save(const BotConfig& c);
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace bot
