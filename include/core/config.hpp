#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace core {

// --- Ichimoku ablakok
struct CloudParams {
    int tenkan{9};       // gyors vonal
    int kijun{26};       // lassú vonal, chikou eltolás
    int senkou_b{52};    // lassú felhő
    int atr_length{14};
};

// --- EMA trendszűrő + felhő jel
struct SignalParams {
    int ema_length{100};
    int ema_back_candles{7};
    int lookback_window{10};
    int min_confirm{5};
};

// --- ATR alapú SL/TP
struct RiskParams {
    double atr_mult_sl{1.5};  // stop távolság = ATR * ez
    double rr_mult_tp{2.0};   // target távolság = stop távolság * ez
};

// --- Számla
struct AccountParams {
    double cash{1'000'000.0};
    double commission{0.0002};   // notional arányában, belépéskor és kilépéskor is
    double margin{0.1};          // 1:10 tőkeáttét
    double position_size{0.99};  // a vásárlóerő ekkora része megy egy pozícióba
    bool whole_units{true};      // egész darabszámra kerekítünk lefelé
};

struct BacktestConfig {
    CloudParams cloud;
    SignalParams signal;
    RiskParams risk;
    AccountParams account;
    Timeframe timeframe{Timeframe::D1};
    std::string log_level{"info"};
    int worker_threads{0};       // 0 -> hardware_concurrency
};

// InvalidConfiguration-t dob, minden számítás előtt hívandó
void validate(const BacktestConfig& cfg);

// Hiányzó kulcs -> alapérték, rossz típus -> InvalidConfiguration
BacktestConfig from_json(const nlohmann::json& j);
nlohmann::json to_json(const BacktestConfig& cfg);
BacktestConfig load_config(const std::string& path);

} // namespace core
