#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

using nlohmann::json;

TEST(ConfigTest, DefaultsAreValid) {
    core::BacktestConfig cfg;
    EXPECT_NO_THROW(core::validate(cfg));
    EXPECT_EQ(cfg.cloud.tenkan, 9);
    EXPECT_EQ(cfg.cloud.kijun, 26);
    EXPECT_EQ(cfg.cloud.senkou_b, 52);
    EXPECT_EQ(cfg.cloud.atr_length, 14);
    EXPECT_EQ(cfg.signal.ema_length, 100);
    EXPECT_EQ(cfg.signal.ema_back_candles, 7);
    EXPECT_EQ(cfg.signal.lookback_window, 10);
    EXPECT_EQ(cfg.signal.min_confirm, 5);
    EXPECT_DOUBLE_EQ(cfg.risk.atr_mult_sl, 1.5);
    EXPECT_DOUBLE_EQ(cfg.risk.rr_mult_tp, 2.0);
    EXPECT_DOUBLE_EQ(cfg.account.cash, 1'000'000.0);
    EXPECT_DOUBLE_EQ(cfg.account.commission, 0.0002);
    EXPECT_EQ(cfg.timeframe, core::Timeframe::D1);
}

TEST(ConfigTest, PartialJsonKeepsDefaults) {
    const auto cfg = core::from_json(json::parse(R"({
        "ichimoku": {"tenkan": 7},
        "risk": {"atr_mult_sl": 2.2},
        "timeframe": "1h"
    })"));
    EXPECT_EQ(cfg.cloud.tenkan, 7);
    EXPECT_EQ(cfg.cloud.kijun, 26);
    EXPECT_DOUBLE_EQ(cfg.risk.atr_mult_sl, 2.2);
    EXPECT_DOUBLE_EQ(cfg.risk.rr_mult_tp, 2.0);
    EXPECT_EQ(cfg.timeframe, core::Timeframe::H1);
}

TEST(ConfigTest, JsonRoundTrip) {
    auto cfg = testutil::small_config();
    cfg.timeframe = core::Timeframe::M15;
    cfg.worker_threads = 3;
    const auto back = core::from_json(core::to_json(cfg));
    EXPECT_EQ(back.cloud.senkou_b, 12);
    EXPECT_EQ(back.signal.min_confirm, 3);
    EXPECT_DOUBLE_EQ(back.account.cash, 100'000.0);
    EXPECT_EQ(back.timeframe, core::Timeframe::M15);
    EXPECT_EQ(back.worker_threads, 3);
}

TEST(ConfigTest, WrongTypeIsInvalidConfiguration) {
    EXPECT_THROW(core::from_json(json::parse(R"({"ichimoku": {"tenkan": "nine"}})")), core::InvalidConfiguration);
    EXPECT_THROW(core::from_json(json::parse(R"({"risk": 3})")), core::InvalidConfiguration);
    EXPECT_THROW(core::from_json(json::parse(R"([1, 2])")), core::InvalidConfiguration);
    EXPECT_THROW(core::from_json(json::parse(R"({"timeframe": "7x"})")), core::InvalidConfiguration);
}

TEST(ConfigTest, RejectsNonPositiveValues) {
    auto bad = [](auto mutate) {
        core::BacktestConfig cfg;
        mutate(cfg);
        return cfg;
    };
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.cloud.tenkan = 0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.cloud.senkou_b = -1; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.signal.ema_length = 0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.risk.atr_mult_sl = 0.0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.risk.rr_mult_tp = -2.0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.account.cash = 0.0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.account.commission = -0.1; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.account.margin = 1.5; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.account.position_size = 0.0; })), core::InvalidConfiguration);
    EXPECT_THROW(core::validate(bad([](core::BacktestConfig& c){ c.signal.ema_back_candles = -1; })), core::InvalidConfiguration);
    EXPECT_NO_THROW(core::validate(bad([](core::BacktestConfig& c){ c.signal.ema_back_candles = 0; })));
}

TEST(ConfigTest, MinConfirmCannotExceedLookback) {
    core::BacktestConfig cfg;
    cfg.signal.lookback_window = 4;
    cfg.signal.min_confirm = 5;
    EXPECT_THROW(core::validate(cfg), core::InvalidConfiguration);
    cfg.signal.min_confirm = 4;
    EXPECT_NO_THROW(core::validate(cfg));
}

TEST(ConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "kumo_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"signal": {"ema_length": 50, "min_confirm": 2}, "log_level": "warn"})";
    }
    const auto cfg = core::load_config(path);
    EXPECT_EQ(cfg.signal.ema_length, 50);
    EXPECT_EQ(cfg.signal.min_confirm, 2);
    EXPECT_EQ(cfg.log_level, "warn");
    std::remove(path.c_str());

    EXPECT_THROW(core::load_config(path), core::InvalidConfiguration);
}

TEST(ConfigTest, ParseTimeframeAliases) {
    EXPECT_EQ(core::parse_timeframe("1d"), core::Timeframe::D1);
    EXPECT_EQ(core::parse_timeframe("D1"), core::Timeframe::D1);
    EXPECT_EQ(core::parse_timeframe("daily"), core::Timeframe::D1);
    EXPECT_EQ(core::parse_timeframe("4h"), core::Timeframe::H4);
    EXPECT_FALSE(core::parse_timeframe("week").has_value());
}

TEST(ConfigTest, UnknownLogLevelIsRejected) {
    EXPECT_THROW(core::from_json(json::parse(R"({"log_level": "verbose"})")), core::InvalidConfiguration);
    EXPECT_THROW(core::from_json(json::parse(R"({"log_level": "INFO"})")), core::InvalidConfiguration);
    EXPECT_EQ(core::from_json(json::parse(R"({"log_level": "debug"})")).log_level, "debug");
    EXPECT_EQ(core::from_json(json::parse(R"({"log_level": "off"})")).log_level, "off");

    core::BacktestConfig cfg;
    cfg.log_level = "";
    EXPECT_THROW(core::validate(cfg), core::InvalidConfiguration);
}
