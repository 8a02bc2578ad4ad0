#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "sim/statistics.hpp"
#include "sim/trade_simulator.hpp"
#include "strategy/decision.hpp"

namespace sim {

// Egy szimbólum teljes futása: indikátorok -> jelek -> szimuláció -> statisztika
struct RunOutput {
    std::vector<strategy::SignalRow> table;   // dúsított bar tábla
    SimResult sim;
    Stats stats;
};

// InsufficientData / SchemaError / InvalidConfiguration kivételt dob
RunOutput run_backtest(const core::BarSeries& bars, const core::BacktestConfig& cfg);

struct SymbolJob {
    std::string symbol;
    std::function<core::BarSeries()> load;   // a betöltési hiba is a szimbólumhoz tartozik
};

struct SymbolOutcome {
    std::string symbol;
    bool ok{false};
    core::ErrorKind error{core::ErrorKind::None};
    std::string reason;
    std::optional<Stats> stats;
    std::optional<RunOutput> output;   // csak keep_outputs esetén
};

// Szimbólumok párhuzamosan; egy futás hibája nem állítja meg a többit.
std::vector<SymbolOutcome> run_batch(const std::vector<SymbolJob>& jobs,
                                     const core::BacktestConfig& cfg,
                                     bool keep_outputs = false);

// Összesítő sor; hibás futásnál NaN mezők
struct SummaryRow {
    std::string label;
    double return_pct;
    double max_drawdown_pct;
    double avg_drawdown_pct;
    double win_rate_pct;
    double trades;
    double exposure_pct;
};

// Szimbólumonként egy sor + "AVERAGE" (a sikeres futások átlaga)
std::vector<SummaryRow> summarize(const std::vector<SymbolOutcome>& outcomes);

} // namespace sim
