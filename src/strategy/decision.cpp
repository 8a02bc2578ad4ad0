#include "strategy/decision.hpp"
#include <spdlog/spdlog.h>

namespace strategy {

SignalGenerator::SignalGenerator(const core::SignalParams& p)
: min_confirm_(static_cast<std::size_t>(p.min_confirm)),
  ema_above_(static_cast<std::size_t>(p.ema_back_candles) + 1),
  ema_below_(static_cast<std::size_t>(p.ema_back_candles) + 1),
  cloud_above_(static_cast<std::size_t>(p.lookback_window)),
  cloud_below_(static_cast<std::size_t>(p.lookback_window)) {}

void SignalGenerator::reset(){
    ema_above_.reset(); ema_below_.reset();
    cloud_above_.reset(); cloud_below_.reset();
}

SignalRow SignalGenerator::on_row(const ind::IndicatorRow& r){
    SignalRow s;
    s.ind = r;
    const auto& b = r.bar;

    // 1. EMA trendszűrő: az ablak MINDEN bar-ja kell, nem többségi szavazás
    ema_above_.push(b.open > r.ema && b.close > r.ema);
    ema_below_.push(b.open < r.ema && b.close < r.ema);
    s.trend_signal = ema_above_.all() ? 1 : (ema_below_.all() ? -1 : 0);

    // 2-3. felhő határok, teljesen fölötte / alatta
    s.cloud_top    = r.cloud_top();
    s.cloud_bottom = r.cloud_bottom();
    cloud_above_.push(b.open > s.cloud_top && b.close > s.cloud_top);
    cloud_below_.push(b.open < s.cloud_bottom && b.close < s.cloud_bottom);

    // 4. megerősítés csak tele ablakkal
    s.counts_ready = cloud_above_.full();
    s.above_count  = cloud_above_.count();
    s.below_count  = cloud_below_.count();
    const bool up_ok   = s.counts_ready && s.above_count >= min_confirm_;
    const bool down_ok = s.counts_ready && s.below_count >= min_confirm_;

    // 5. a mostani bar átszúrja a határt
    s.pierce_up   = b.open < s.cloud_top && b.close > s.cloud_top;
    s.pierce_down = b.open > s.cloud_bottom && b.close < s.cloud_bottom;

    // 6.
    s.long_cond  = up_ok && s.pierce_up && s.trend_signal == 1;
    s.short_cond = down_ok && s.pierce_down && s.trend_signal == -1;
    s.signal = decide(s.long_cond, s.short_cond);
    return s;
}

std::vector<SignalRow> generate_signals(const std::vector<ind::IndicatorRow>& rows, const core::SignalParams& p){
    SignalGenerator gen(p);
    std::vector<SignalRow> out;
    out.reserve(rows.size());
    std::size_t longs = 0, shorts = 0;
    for (const auto& r : rows) {
        out.push_back(gen.on_row(r));
        if (out.back().signal == core::Signal::Long) ++longs;
        else if (out.back().signal == core::Signal::Short) ++shorts;
    }
    spdlog::debug("signals: {} rows, {} long, {} short", out.size(), longs, shorts);
    return out;
}

} // namespace strategy
