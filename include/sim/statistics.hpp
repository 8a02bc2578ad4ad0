#pragma once
#include <vector>
#include "core/types.hpp"
#include "exec/position_tracker.hpp"
#include "sim/trade_simulator.hpp"
#include "strategy/decision.hpp"

namespace sim {

struct Stats {
    std::size_t bars{0};
    double start_equity{0.0};
    double final_equity{0.0};
    double peak_equity{0.0};
    double return_pct{0.0};
    double buy_hold_return_pct{0.0};
    double max_drawdown_pct{0.0};      // <= 0
    double avg_drawdown_pct{0.0};      // <= 0, drawdown periódusok mélységének átlaga
    std::size_t max_drawdown_bars{0};  // leghosszabb csúcs -> új csúcs szakasz
    double exposure_pct{0.0};
    std::size_t trades{0};
    double win_rate_pct{0.0};
    double best_trade_pct{0.0};
    double worst_trade_pct{0.0};
    double avg_trade_pct{0.0};
    double profit_factor{0.0};         // +inf, ha nincs vesztes, de van nyerő
    bool profit_factor_defined{false}; // false, ha nincs trade (ilyenkor 0)
    double sharpe{0.0};                // évesített, bar hozamokból
    double sortino{0.0};
    bool ruined{false};
};

struct StatsContext {
    double initial_cash{0.0};
    double first_close{0.0};
    double last_close{0.0};
    double bars_per_year{252.0};
    std::size_t exposed_bars{0};
    bool ruined{false};
};

Stats compute_stats(const std::vector<EquityPoint>& equity,
                    const std::vector<exec::Trade>& trades,
                    const StatsContext& ctx);

// Kényelmi változat egy lefutott szimulációhoz
Stats compute_stats(const SimResult& res, const std::vector<strategy::SignalRow>& rows, core::Timeframe tf);

// Csúcs -> mélypont statisztikák (százalékban, <= 0)
struct DrawdownInfo {
    double max_pct{0.0};
    double avg_pct{0.0};
    std::size_t max_bars{0};
};
DrawdownInfo drawdowns(const std::vector<EquityPoint>& equity);

} // namespace sim
