#pragma once
#include <algorithm>
#include <deque>
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/atr.hpp"
#include "indicators/midpoint.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

// Egy bar az összes indikátorral. Minden érték nyers, nincs előre tolva;
// a t. sor csak a [0..t] bar-okból számolódik.
struct IndicatorRow {
    std::size_t bar_index{0};   // index az eredeti bar sorozatban
    core::Bar bar;
    double tenkan{0.0};
    double kijun{0.0};
    double span_a{0.0};
    double span_b{0.0};
    double atr{0.0};
    double ema{0.0};
    bool chikou_long_ok{false};   // close[t-kijun] > felhő teteje[t-kijun]
    bool chikou_short_ok{false};  // close[t-kijun] < felhő alja[t-kijun]

    double cloud_top() const { return std::max(span_a, span_b); }
    double cloud_bottom() const { return std::min(span_a, span_b); }
};

// Bar-onként etethető motor; warm-up alatt nincs sor.
class IchimokuEngine {
public:
    IchimokuEngine(const core::CloudParams& p, int ema_length);

    std::optional<IndicatorRow> on_bar(const core::Bar& b);

    // Ennyi bar kell az első teljes sorhoz
    std::size_t warmup_bars() const { return warmup_; }
    void reset();

private:
    struct Past { double close; double top; double bottom; bool valid; };

    MidpointModule tenkan_;
    MidpointModule kijun_;
    MidpointModule span_b_;
    AtrModule atr_;
    EmaModule ema_;
    std::deque<Past> past_;   // az utolsó kijun+1 bar
    std::size_t lag_;
    std::size_t index_{0};
    std::size_t warmup_;
};

// A teljes tábla: validálja a bar-okat (SchemaError), InsufficientData-t dob,
// ha a leghosszabb ablaknál kevesebb bar van, és eldobja a warm-up sorokat.
std::vector<IndicatorRow> compute_indicators(const core::BarSeries& bars, const core::BacktestConfig& cfg);

std::size_t required_bars(const core::BacktestConfig& cfg);

// Csak megjelenítéshez: close[t+kijun], ha az a bar létezik. Döntési logika nem olvassa.
std::vector<std::optional<double>> chikou_display(const std::vector<IndicatorRow>& rows, int kijun);

} // namespace ind
