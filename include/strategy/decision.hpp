#pragma once
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/ichimoku.hpp"
#include "indicators/rolling.hpp"

namespace strategy {

// Indikátor sor + minden, amiből a jel született (a charting ezt kapja)
struct SignalRow {
    ind::IndicatorRow ind;
    int trend_signal{0};            // +1 minden bar EMA fölött, -1 minden alatta, 0 egyébként
    double cloud_top{0.0};
    double cloud_bottom{0.0};
    std::size_t above_count{0};     // teljesen felhő fölötti bar-ok a lookback ablakban
    std::size_t below_count{0};
    bool counts_ready{false};       // tele van-e már a lookback ablak
    bool pierce_up{false};          // open a felhő teteje alatt, close fölötte
    bool pierce_down{false};
    bool long_cond{false};
    bool short_cond{false};
    core::Signal signal{core::Signal::Neutral};
};

// Long és short egyszerre -> Neutral, soha nem választunk oldalt
inline core::Signal decide(bool long_cond, bool short_cond){
    if (long_cond && !short_cond) return core::Signal::Long;
    if (short_cond && !long_cond) return core::Signal::Short;
    return core::Signal::Neutral;
}

// Soronként etethető jelgenerátor futó számlálókkal
class SignalGenerator {
public:
    explicit SignalGenerator(const core::SignalParams& p);

    SignalRow on_row(const ind::IndicatorRow& r);
    void reset();

private:
    std::size_t min_confirm_;
    ind::RollingCount ema_above_;    // (back_candles + 1) ablak
    ind::RollingCount ema_below_;
    ind::RollingCount cloud_above_;  // lookback ablak
    ind::RollingCount cloud_below_;
};

std::vector<SignalRow> generate_signals(const std::vector<ind::IndicatorRow>& rows, const core::SignalParams& p);

} // namespace strategy
