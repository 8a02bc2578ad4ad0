#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "exec/position_tracker.hpp"
#include "exec/risk.hpp"
#include "strategy/decision.hpp"

namespace sim {

enum class PositionState { Flat, Long, Short };

inline const char* to_string(PositionState s) {
    switch (s) {
        case PositionState::Long:  return "LONG";
        case PositionState::Short: return "SHORT";
        default:                   return "FLAT";
    }
}

struct EquityPoint {
    std::int64_t time_ms{0};
    double equity{0.0};   // cash + nyitott pozíció nem realizált PnL-je
};

struct SimResult {
    double initial_cash{0.0};
    double final_cash{0.0};
    double final_equity{0.0};
    std::vector<exec::Trade> trades;
    std::vector<EquityPoint> equity;         // bar-onként egy
    std::vector<PositionState> states;       // állapot a bar feldolgozása után
    std::size_t exposed_bars{0};             // bar-ok, amelyeken volt nyitott pozíció
    std::optional<exec::Position> open_position;  // a végén nyitva hagyott pozíció
    std::size_t skipped_signals{0};          // jel ATR<=0, 0 méret vagy csőd miatt kihagyva
    bool ruined{false};
    std::optional<std::size_t> ruin_row;     // az első nem pozitív equity sora
    std::optional<std::int64_t> ruin_time_ms;
};

// Bar-onkénti állapotgép: Flat -> Long/Short -> Flat.
// Belépés a bar záróárán; a kilépést a következő bar-októl a high/low tartomány
// vizsgálja. Ha egy bar-on a stop és a target is elérhető, a stop teljesül.
// A végén nyitott pozíció nyitva marad, az equity mark-to-market.
class TradeSimulator {
public:
    TradeSimulator(const core::RiskParams& risk, const core::AccountParams& account);

    void on_row(const strategy::SignalRow& row);

    PositionState state() const;
    double cash() const { return cash_; }
    const SimResult& result() const { return res_; }
    SimResult finish();

private:
    void try_exit(const strategy::SignalRow& row, std::size_t i);
    void try_entry(const strategy::SignalRow& row, std::size_t i);

    exec::RiskManager risk_;
    exec::PositionTracker book_;
    double cash_;
    std::size_t row_{0};
    SimResult res_;
};

SimResult simulate(const std::vector<strategy::SignalRow>& rows, const core::BacktestConfig& cfg);

} // namespace sim
