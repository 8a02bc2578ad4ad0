#pragma once
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "sim/statistics.hpp"

namespace sim {

enum class Metric { Return, Sharpe, Sortino, WinRate, ProfitFactor, MaxDrawdown };

std::optional<Metric> parse_metric(const std::string& s);
const char* to_string(Metric m);

// Nagyobb = jobb. A max drawdown <= 0, így a legkisebb visszaesés nyer.
// Nem értelmezhető értékre (pl. win rate trade nélkül) NaN.
double metric_value(const Stats& s, Metric m);

// "--timeout-ms" értéke: pozitív egész ezredmásodperc, különben nullopt
std::optional<std::chrono::milliseconds> parse_timeout_ms(const std::string& s);

struct GridSpec {
    std::vector<double> atr_mult_sl;
    std::vector<double> rr_mult_tp;

    // 1.0..2.4 és 1.0..2.9, 0.1-es lépéssel
    static GridSpec defaults();
};

struct GridCell {
    double atr_mult_sl{0.0};
    double rr_mult_tp{0.0};
    double score{0.0};
    bool evaluated{false};
    Stats stats;
};

struct OptimizeOptions {
    Metric metric{Metric::Return};
    const std::atomic<bool>* cancel{nullptr};                      // kooperatív leállítás
    std::optional<std::chrono::steady_clock::duration> timeout;    // cellák között ellenőrizzük
    unsigned threads{1};
};

struct OptimizeResult {
    std::vector<GridCell> heatmap;   // atr_mult_sl szerint sorfolytonos
    std::optional<GridCell> best;
    std::size_t evaluated{0};
    std::size_t total{0};
    bool completed{false};
    std::string stop_reason;         // "cancelled" / "timeout", ha nem futott végig
};

// Az indikátorok és jelek egyszer számolódnak (nem függnek az SL/TP szorzóktól),
// cellánként csak a szimuláció fut újra.
OptimizeResult optimize(const core::BarSeries& bars,
                        const core::BacktestConfig& base,
                        const GridSpec& grid,
                        const OptimizeOptions& opt);

} // namespace sim
