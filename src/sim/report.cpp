#include "sim/report.hpp"
#include "indicators/ichimoku.hpp"
#include <cmath>

using json = nlohmann::json;

namespace sim {

static json num(double v){
    return std::isfinite(v) ? json(v) : json(nullptr);
}

json to_json(const Stats& s){
    return json{
        {"bars", s.bars},
        {"start_equity", num(s.start_equity)},
        {"final_equity", num(s.final_equity)},
        {"peak_equity", num(s.peak_equity)},
        {"return_pct", num(s.return_pct)},
        {"buy_hold_return_pct", num(s.buy_hold_return_pct)},
        {"max_drawdown_pct", num(s.max_drawdown_pct)},
        {"avg_drawdown_pct", num(s.avg_drawdown_pct)},
        {"max_drawdown_bars", s.max_drawdown_bars},
        {"exposure_pct", num(s.exposure_pct)},
        {"trades", s.trades},
        {"win_rate_pct", num(s.win_rate_pct)},
        {"best_trade_pct", num(s.best_trade_pct)},
        {"worst_trade_pct", num(s.worst_trade_pct)},
        {"avg_trade_pct", num(s.avg_trade_pct)},
        // +inf nem JSON szám
        {"profit_factor", std::isinf(s.profit_factor) ? json("inf") : num(s.profit_factor)},
        {"profit_factor_defined", s.profit_factor_defined},
        {"sharpe", num(s.sharpe)},
        {"sortino", std::isinf(s.sortino) ? json("inf") : num(s.sortino)},
        {"ruined", s.ruined},
    };
}

json to_json(const exec::Trade& t){
    return json{
        {"side", core::to_string(t.side)},
        {"size", t.size},
        {"entry_time_ms", t.entry_time_ms},
        {"exit_time_ms", t.exit_time_ms},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"stop", t.stop},
        {"target", t.target},
        {"exit_reason", exec::to_string(t.reason)},
        {"commission", t.commission},
        {"pnl", t.pnl},
        {"return_pct", t.return_pct},
    };
}

json to_json(const std::vector<EquityPoint>& equity){
    json a = json::array();
    for (const auto& p : equity) a.push_back({{"time_ms", p.time_ms}, {"equity", num(p.equity)}});
    return a;
}

json to_json(const strategy::SignalRow& r, const std::optional<double>& chikou){
    const auto& i = r.ind;
    json j{
        {"time_ms", i.bar.open_time_ms},
        {"open", i.bar.open}, {"high", i.bar.high}, {"low", i.bar.low}, {"close", i.bar.close},
        {"tenkan", i.tenkan}, {"kijun", i.kijun},
        {"span_a", i.span_a}, {"span_b", i.span_b},
        {"cloud_top", r.cloud_top}, {"cloud_bottom", r.cloud_bottom},
        {"atr", i.atr}, {"ema", i.ema},
        {"chikou_long_ok", i.chikou_long_ok}, {"chikou_short_ok", i.chikou_short_ok},
        {"trend_signal", r.trend_signal},
        {"above_count", r.above_count}, {"below_count", r.below_count},
        {"pierce_up", r.pierce_up}, {"pierce_down", r.pierce_down},
        {"signal", core::sign_of(r.signal)},
    };
    if (i.bar.volume) j["volume"] = *i.bar.volume;
    j["chikou_plot"] = chikou ? json(*chikou) : json(nullptr);
    return j;
}

json to_json(const RunOutput& run, int kijun){
    std::vector<ind::IndicatorRow> rows;
    rows.reserve(run.table.size());
    for (const auto& r : run.table) rows.push_back(r.ind);
    const auto chikou = ind::chikou_display(rows, kijun);

    json table = json::array();
    for (std::size_t i=0; i<run.table.size(); ++i) table.push_back(to_json(run.table[i], chikou[i]));
    json trades = json::array();
    for (const auto& t : run.sim.trades) trades.push_back(to_json(t));

    json j{
        {"stats", to_json(run.stats)},
        {"trades", trades},
        {"equity", to_json(run.sim.equity)},
        {"table", table},
    };
    if (run.sim.open_position) {
        const auto& p = *run.sim.open_position;
        j["open_position"] = {{"side", core::to_string(p.side)}, {"size", p.size},
                              {"entry_price", p.entry_price}, {"stop", p.stop}, {"target", p.target},
                              {"entry_time_ms", p.entry_time_ms}};
    }
    if (run.sim.ruin_time_ms) j["ruin_time_ms"] = *run.sim.ruin_time_ms;
    return j;
}

json to_json(const std::vector<SummaryRow>& summary){
    json a = json::array();
    for (const auto& r : summary) {
        a.push_back({{"symbol", r.label},
                     {"return_pct", num(r.return_pct)},
                     {"max_drawdown_pct", num(r.max_drawdown_pct)},
                     {"avg_drawdown_pct", num(r.avg_drawdown_pct)},
                     {"win_rate_pct", num(r.win_rate_pct)},
                     {"trades", num(r.trades)},
                     {"exposure_pct", num(r.exposure_pct)}});
    }
    return a;
}

json to_json(const SymbolOutcome& o){
    json j{{"symbol", o.symbol}, {"ok", o.ok}};
    if (!o.ok) {
        j["error"] = core::to_string(o.error);
        j["reason"] = o.reason;
    }
    if (o.stats) j["stats"] = to_json(*o.stats);
    return j;
}

json to_json(const OptimizeResult& r){
    json cells = json::array();
    for (const auto& c : r.heatmap) {
        if (!c.evaluated) continue;
        cells.push_back({{"atr_mult_sl", c.atr_mult_sl}, {"rr_mult_tp", c.rr_mult_tp}, {"score", num(c.score)}});
    }
    json j{
        {"completed", r.completed},
        {"evaluated", r.evaluated},
        {"total", r.total},
        {"heatmap", cells},
    };
    if (!r.stop_reason.empty()) j["stop_reason"] = r.stop_reason;
    if (r.best) {
        j["best"] = {{"atr_mult_sl", r.best->atr_mult_sl}, {"rr_mult_tp", r.best->rr_mult_tp},
                     {"score", num(r.best->score)}, {"stats", to_json(r.best->stats)}};
    }
    return j;
}

} // namespace sim
