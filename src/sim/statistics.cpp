#include "sim/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace sim {

DrawdownInfo drawdowns(const std::vector<EquityPoint>& equity){
    DrawdownInfo d;
    if (equity.empty()) return d;
    double peak = equity.front().equity;
    std::size_t peak_i = 0;
    double period_min = 0.0;       // aktuális szakasz legmélyebb pontja
    double depth_sum = 0.0;
    std::size_t periods = 0;
    for (std::size_t i=0; i<equity.size(); ++i) {
        const double e = equity[i].equity;
        if (e >= peak) {
            if (period_min < 0.0) { depth_sum += period_min; ++periods; }
            period_min = 0.0;
            peak = e;
            peak_i = i;
            continue;
        }
        const double dd = peak > 0.0 ? e / peak - 1.0 : -1.0;
        period_min = std::min(period_min, dd);
        d.max_pct  = std::min(d.max_pct, dd * 100.0);
        d.max_bars = std::max(d.max_bars, i - peak_i);
    }
    if (period_min < 0.0) { depth_sum += period_min; ++periods; }
    d.avg_pct = periods ? depth_sum / periods * 100.0 : 0.0;
    return d;
}

namespace {

struct RatioPair { double sharpe{0.0}; double sortino{0.0}; };

RatioPair risk_ratios(const std::vector<EquityPoint>& equity, double bars_per_year){
    RatioPair out;
    std::vector<double> r;
    r.reserve(equity.size());
    for (std::size_t i=1; i<equity.size(); ++i) {
        const double prev = equity[i-1].equity;
        if (prev <= 0.0) break;   // csőd után nincs értelmes hozam
        r.push_back(equity[i].equity / prev - 1.0);
    }
    if (r.size() < 2) return out;

    const double n = static_cast<double>(r.size());
    const double mean = std::accumulate(r.begin(), r.end(), 0.0) / n;
    double var = 0.0, down = 0.0;
    for (double x : r) {
        var += (x - mean) * (x - mean);
        if (x < 0.0) down += x * x;
    }
    const double sd  = std::sqrt(var / (n - 1.0));
    const double dsd = std::sqrt(down / n);
    const double ann = std::sqrt(bars_per_year);
    if (sd > 0.0)  out.sharpe  = mean / sd * ann;
    if (dsd > 0.0) out.sortino = mean / dsd * ann;
    else if (mean > 0.0) out.sortino = std::numeric_limits<double>::infinity();
    return out;
}

} // namespace

Stats compute_stats(const std::vector<EquityPoint>& equity,
                    const std::vector<exec::Trade>& trades,
                    const StatsContext& ctx){
    Stats s;
    s.bars = equity.size();
    s.start_equity = ctx.initial_cash;
    s.final_equity = equity.empty() ? ctx.initial_cash : equity.back().equity;
    s.peak_equity = ctx.initial_cash;
    for (const auto& p : equity) s.peak_equity = std::max(s.peak_equity, p.equity);
    s.ruined = ctx.ruined;

    if (ctx.initial_cash > 0.0) s.return_pct = (s.final_equity / ctx.initial_cash - 1.0) * 100.0;
    if (ctx.first_close > 0.0)  s.buy_hold_return_pct = (ctx.last_close / ctx.first_close - 1.0) * 100.0;

    const auto dd = drawdowns(equity);
    s.max_drawdown_pct  = dd.max_pct;
    s.avg_drawdown_pct  = dd.avg_pct;
    s.max_drawdown_bars = dd.max_bars;

    if (!equity.empty())
        s.exposure_pct = static_cast<double>(ctx.exposed_bars) / static_cast<double>(equity.size()) * 100.0;

    s.trades = trades.size();
    if (!trades.empty()) {
        std::size_t wins = 0;
        double gross_win = 0.0, gross_loss = 0.0, ret_sum = 0.0;
        s.best_trade_pct  = -std::numeric_limits<double>::infinity();
        s.worst_trade_pct =  std::numeric_limits<double>::infinity();
        for (const auto& t : trades) {
            if (t.pnl > 0.0) { ++wins; gross_win += t.pnl; }
            else if (t.pnl < 0.0) gross_loss += -t.pnl;
            ret_sum += t.return_pct;
            s.best_trade_pct  = std::max(s.best_trade_pct, t.return_pct);
            s.worst_trade_pct = std::min(s.worst_trade_pct, t.return_pct);
        }
        s.win_rate_pct  = static_cast<double>(wins) / trades.size() * 100.0;
        s.avg_trade_pct = ret_sum / trades.size();
        s.profit_factor_defined = true;
        if (gross_loss > 0.0)     s.profit_factor = gross_win / gross_loss;
        else if (gross_win > 0.0) s.profit_factor = std::numeric_limits<double>::infinity();
        else                      s.profit_factor = 0.0;
    }

    const auto rr = risk_ratios(equity, ctx.bars_per_year);
    s.sharpe  = rr.sharpe;
    s.sortino = rr.sortino;
    return s;
}

Stats compute_stats(const SimResult& res, const std::vector<strategy::SignalRow>& rows, core::Timeframe tf){
    StatsContext ctx;
    ctx.initial_cash  = res.initial_cash;
    ctx.bars_per_year = core::bars_per_year(tf);
    ctx.exposed_bars  = res.exposed_bars;
    ctx.ruined        = res.ruined;
    if (!rows.empty()) {
        ctx.first_close = rows.front().ind.bar.close;
        ctx.last_close  = rows.back().ind.bar.close;
    }
    return compute_stats(res.equity, res.trades, ctx);
}

} // namespace sim
