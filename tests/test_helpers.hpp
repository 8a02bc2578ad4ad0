#pragma once
#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/ichimoku.hpp"
#include "strategy/decision.hpp"

namespace testutil {

// tesztekben csend
inline const bool quiet_logs = (spdlog::set_level(spdlog::level::off), true);

constexpr std::int64_t kDayMs = 86'400'000;

// Referencia EMA a teljes sorozatra: SMA seed, utána alpha = 2/(p+1)
inline std::optional<double> reference_ema(const std::deque<double>& v, std::size_t p) {
    if (p == 0 || v.size() < p) return std::nullopt;
    double e = 0.0;
    for (std::size_t i=0; i<p; ++i) e += v[i];
    e /= static_cast<double>(p);
    const double k = 2.0/(p+1.0);
    for (std::size_t i=p; i<v.size(); ++i) e = v[i]*k + e*(1.0-k);
    return e;
}

inline core::Bar bar(std::int64_t i, double o, double h, double l, double c) {
    core::Bar b;
    b.open_time_ms = 1'600'000'000'000LL + i * kDayMs;
    b.open = o; b.high = h; b.low = l; b.close = c;
    return b;
}

// Monoton emelkedő záró, állandó (2.0) tartomány
inline core::BarSeries rising(std::size_t n, double start = 100.0, double step = 1.0) {
    core::BarSeries v;
    for (std::size_t i=0; i<n; ++i) {
        const double c = start + step * static_cast<double>(i);
        v.push_back(bar(static_cast<std::int64_t>(i), c - 0.5 * step, c + 1.0, c - 1.0, c));
    }
    return v;
}

// Determinisztikus véletlen bolyongás (LCG)
inline core::BarSeries random_walk(std::size_t n, std::uint32_t seed = 7, double start = 100.0) {
    core::BarSeries v;
    std::uint32_t s = seed;
    auto next = [&]() { s = s * 1664525u + 1013904223u; return (s >> 8) / double(1u << 24); };
    double prev = start;
    for (std::size_t i=0; i<n; ++i) {
        const double o = prev;
        const double c = std::max(1.0, o + (next() - 0.48) * 3.0);
        const double h = std::max(o, c) + next() * 1.5;
        const double l = std::max(0.5, std::min(o, c) - next() * 1.5);
        v.push_back(bar(static_cast<std::int64_t>(i), o, h, l, c));
        prev = c;
    }
    return v;
}

// Rövid ablakok, hogy kis sorozatokon is legyen mit nézni
inline core::BacktestConfig small_config() {
    core::BacktestConfig cfg;
    cfg.cloud.tenkan = 3;
    cfg.cloud.kijun = 6;
    cfg.cloud.senkou_b = 12;
    cfg.cloud.atr_length = 5;
    cfg.signal.ema_length = 10;
    cfg.signal.ema_back_candles = 2;
    cfg.signal.lookback_window = 5;
    cfg.signal.min_confirm = 3;
    cfg.account.cash = 100'000.0;
    cfg.account.commission = 0.0;
    cfg.account.margin = 1.0;
    cfg.account.position_size = 1.0;
    return cfg;
}

// Kézzel összerakott indikátor sor a jelgenerátor / szimulátor tesztekhez
inline ind::IndicatorRow ind_row(std::size_t i, double o, double h, double l, double c,
                                 double span_a, double span_b, double ema, double atr = 1.0) {
    ind::IndicatorRow r;
    r.bar_index = i;
    r.bar = bar(static_cast<std::int64_t>(i), o, h, l, c);
    r.tenkan = span_a;
    r.kijun = span_a;
    r.span_a = span_a;
    r.span_b = span_b;
    r.ema = ema;
    r.atr = atr;
    return r;
}

inline strategy::SignalRow sig_row(std::size_t i, double o, double h, double l, double c,
                                   double atr, core::Signal s) {
    strategy::SignalRow r;
    r.ind = ind_row(i, o, h, l, c, 0.0, 0.0, 0.0, atr);
    r.signal = s;
    return r;
}

} // namespace testutil
