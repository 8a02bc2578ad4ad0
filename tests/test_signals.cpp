#include <gtest/gtest.h>
#include <vector>
#include "core/config.hpp"
#include "strategy/decision.hpp"
#include "test_helpers.hpp"

using namespace testutil;
using core::Signal;

namespace {

core::SignalParams params(int back, int lookback, int min_confirm) {
    core::SignalParams p;
    p.ema_length = 10;
    p.ema_back_candles = back;
    p.lookback_window = lookback;
    p.min_confirm = min_confirm;
    return p;
}

// felhő 95..100, 5 bar teljesen fölötte, aztán egy bar alulról átszúrja a tetejét
std::vector<ind::IndicatorRow> long_setup(double ema) {
    std::vector<ind::IndicatorRow> rows;
    for (std::size_t i=0; i<5; ++i) rows.push_back(ind_row(i, 102, 104, 101, 103, 100, 95, ema));
    rows.push_back(ind_row(5, 99, 102, 98, 101, 100, 95, ema));
    return rows;
}

std::vector<ind::IndicatorRow> short_setup(double ema) {
    std::vector<ind::IndicatorRow> rows;
    for (std::size_t i=0; i<5; ++i) rows.push_back(ind_row(i, 93, 94, 91, 92, 100, 95, ema));
    rows.push_back(ind_row(5, 96, 97, 93, 94, 100, 95, ema));
    return rows;
}

std::size_t count_of(const std::vector<strategy::SignalRow>& v, Signal s) {
    std::size_t n = 0;
    for (const auto& r : v) if (r.signal == s) ++n;
    return n;
}

} // namespace

TEST(DecideTest, AmbiguityResolvesToNeutral) {
    EXPECT_EQ(strategy::decide(true, false), Signal::Long);
    EXPECT_EQ(strategy::decide(false, true), Signal::Short);
    EXPECT_EQ(strategy::decide(true, true), Signal::Neutral);
    EXPECT_EQ(strategy::decide(false, false), Signal::Neutral);
}

TEST(SignalGeneratorTest, PierceAfterConfirmationGoesLong) {
    const auto out = strategy::generate_signals(long_setup(90.0), params(1, 4, 3));
    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(count_of(out, Signal::Long), 1u);
    EXPECT_EQ(count_of(out, Signal::Short), 0u);
    const auto& last = out.back();
    EXPECT_EQ(last.signal, Signal::Long);
    EXPECT_TRUE(last.pierce_up);
    EXPECT_FALSE(last.pierce_down);
    EXPECT_EQ(last.trend_signal, 1);
    EXPECT_EQ(last.above_count, 3u);
    EXPECT_DOUBLE_EQ(last.cloud_top, 100.0);
    EXPECT_DOUBLE_EQ(last.cloud_bottom, 95.0);
}

TEST(SignalGeneratorTest, MirroredSetupGoesShort) {
    const auto out = strategy::generate_signals(short_setup(110.0), params(1, 4, 3));
    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(count_of(out, Signal::Short), 1u);
    EXPECT_EQ(count_of(out, Signal::Long), 0u);
    EXPECT_EQ(out.back().signal, Signal::Short);
    EXPECT_EQ(out.back().trend_signal, -1);
    EXPECT_EQ(out.back().below_count, 3u);
}

TEST(SignalGeneratorTest, NotEnoughConfirmationNoSignal) {
    // a lookback ablakban csak 3 felhő fölötti bar van, min_confirm 4
    const auto out = strategy::generate_signals(long_setup(90.0), params(1, 4, 4));
    EXPECT_EQ(count_of(out, Signal::Long), 0u);
    EXPECT_FALSE(out.back().long_cond);
}

TEST(SignalGeneratorTest, CountsNeedFullLookbackWindow) {
    // csak 3 sor: a 6-os ablak sosem telik meg
    std::vector<ind::IndicatorRow> rows;
    rows.push_back(ind_row(0, 102, 104, 101, 103, 100, 95, 90));
    rows.push_back(ind_row(1, 102, 104, 101, 103, 100, 95, 90));
    rows.push_back(ind_row(2, 99, 102, 98, 101, 100, 95, 90));
    const auto out = strategy::generate_signals(rows, params(1, 6, 1));
    for (const auto& r : out) {
        EXPECT_FALSE(r.counts_ready);
        EXPECT_EQ(r.signal, Signal::Neutral);
    }
    EXPECT_TRUE(out.back().pierce_up);
}

TEST(SignalGeneratorTest, TrendFilterIsAllOrNothing) {
    // az átszúró bar előtti bar open-je az EMA alatt van -> nincs +1 trend
    auto rows = long_setup(100.5);
    rows[4].bar.open = 100.4;
    rows[4].bar.low = 100.2;
    rows[5].bar.open = 100.7;   // felhő teteje (100) fölött nyit: így pierce sincs
    auto out = strategy::generate_signals(rows, params(1, 4, 3));
    EXPECT_EQ(out[4].trend_signal, 0);
    EXPECT_EQ(count_of(out, Signal::Long), 0u);

    // ugyanaz a felállás, de egyetlen bar is elrontja a trendet
    rows = long_setup(90.0);
    rows[4].bar.open = 89.0;
    rows[4].bar.low = 88.0;
    out = strategy::generate_signals(rows, params(1, 4, 3));
    EXPECT_EQ(out[5].trend_signal, 0);
    EXPECT_TRUE(out[5].pierce_up);
    EXPECT_EQ(out[5].signal, Signal::Neutral);
}

TEST(SignalGeneratorTest, LongerTrendWindowNeedsEveryBar) {
    auto rows = long_setup(90.0);
    rows[2].bar.close = 89.0;
    rows[2].bar.low = 88.0;
    // back=1: a 2. bar kiesik az ablakból
    EXPECT_EQ(strategy::generate_signals(rows, params(1, 4, 2)).back().trend_signal, 1);
    // back=3: a [2..5] ablakban benne van
    EXPECT_EQ(strategy::generate_signals(rows, params(3, 4, 2)).back().trend_signal, 0);
}

TEST(SignalGeneratorTest, StreamingMatchesBatch) {
    const auto cfg = small_config();
    const auto rows = ind::compute_indicators(random_walk(300, 21), cfg);
    const auto batch = strategy::generate_signals(rows, cfg.signal);
    strategy::SignalGenerator gen(cfg.signal);
    for (std::size_t i=0; i<rows.size(); ++i) {
        const auto s = gen.on_row(rows[i]);
        EXPECT_EQ(s.signal, batch[i].signal);
        EXPECT_EQ(s.above_count, batch[i].above_count);
        EXPECT_EQ(s.trend_signal, batch[i].trend_signal);
    }
}

TEST(SignalGeneratorTest, RisingSeriesNeverShorts) {
    const auto cfg = small_config();
    const auto rows = ind::compute_indicators(rising(200), cfg);
    const auto out = strategy::generate_signals(rows, cfg.signal);
    EXPECT_EQ(count_of(out, Signal::Short), 0u);
}

TEST(SignalGeneratorTest, ResetForgetsPreviousRows) {
    const auto cfg = small_config();
    const auto rows = ind::compute_indicators(random_walk(300, 21), cfg);
    const auto batch = strategy::generate_signals(rows, cfg.signal);
    strategy::SignalGenerator gen(cfg.signal);
    for (const auto& r : long_setup(90.0)) gen.on_row(r);
    gen.reset();
    for (std::size_t i=0; i<rows.size(); ++i) {
        const auto s = gen.on_row(rows[i]);
        EXPECT_EQ(s.signal, batch[i].signal) << "row " << i;
        EXPECT_EQ(s.counts_ready, batch[i].counts_ready) << "row " << i;
        EXPECT_EQ(s.above_count, batch[i].above_count) << "row " << i;
        EXPECT_EQ(s.trend_signal, batch[i].trend_signal) << "row " << i;
    }
}
