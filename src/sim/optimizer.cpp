#include "sim/optimizer.hpp"
#include "core/errors.hpp"
#include "indicators/ichimoku.hpp"
#include "sim/worker_pool.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sim {

std::optional<std::chrono::milliseconds> parse_timeout_ms(const std::string& s){
    std::size_t used = 0;
    long v = 0;
    try {
        v = std::stol(s, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (used != s.size() || v <= 0) return std::nullopt;
    return std::chrono::milliseconds(v);
}

std::optional<Metric> parse_metric(const std::string& s){
    if (s == "return" || s == "Return [%]")             return Metric::Return;
    if (s == "sharpe" || s == "Sharpe Ratio")           return Metric::Sharpe;
    if (s == "sortino" || s == "Sortino Ratio")         return Metric::Sortino;
    if (s == "win_rate" || s == "Win Rate [%]")         return Metric::WinRate;
    if (s == "profit_factor" || s == "Profit Factor")   return Metric::ProfitFactor;
    if (s == "max_drawdown" || s == "Max. Drawdown [%]") return Metric::MaxDrawdown;
    return std::nullopt;
}

const char* to_string(Metric m){
    switch (m) {
        case Metric::Sharpe:       return "sharpe";
        case Metric::Sortino:      return "sortino";
        case Metric::WinRate:      return "win_rate";
        case Metric::ProfitFactor: return "profit_factor";
        case Metric::MaxDrawdown:  return "max_drawdown";
        default:                   return "return";
    }
}

double metric_value(const Stats& s, Metric m){
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    switch (m) {
        case Metric::Sharpe:       return s.sharpe;
        case Metric::Sortino:      return s.sortino;
        case Metric::WinRate:      return s.trades ? s.win_rate_pct : nan;
        case Metric::ProfitFactor: return s.profit_factor_defined ? s.profit_factor : nan;
        case Metric::MaxDrawdown:  return s.max_drawdown_pct;
        default:                   return s.return_pct;
    }
}

GridSpec GridSpec::defaults(){
    GridSpec g;
    for (int i=10; i<25; ++i) g.atr_mult_sl.push_back(i / 10.0);
    for (int i=10; i<30; ++i) g.rr_mult_tp.push_back(i / 10.0);
    return g;
}

OptimizeResult optimize(const core::BarSeries& bars,
                        const core::BacktestConfig& base,
                        const GridSpec& grid,
                        const OptimizeOptions& opt){
    core::validate(base);
    if (grid.atr_mult_sl.empty() || grid.rr_mult_tp.empty())
        throw core::InvalidConfiguration("optimizer grid must not be empty");
    for (double v : grid.atr_mult_sl)
        if (!(v > 0.0)) throw core::InvalidConfiguration(fmt::format("grid atr_mult_sl must be > 0 (got {})", v));
    for (double v : grid.rr_mult_tp)
        if (!(v > 0.0)) throw core::InvalidConfiguration(fmt::format("grid rr_mult_tp must be > 0 (got {})", v));

    const auto table = strategy::generate_signals(ind::compute_indicators(bars, base), base.signal);

    OptimizeResult res;
    res.total = grid.atr_mult_sl.size() * grid.rr_mult_tp.size();
    res.heatmap.resize(res.total);
    for (std::size_t a=0; a<grid.atr_mult_sl.size(); ++a)
        for (std::size_t r=0; r<grid.rr_mult_tp.size(); ++r) {
            auto& c = res.heatmap[a * grid.rr_mult_tp.size() + r];
            c.atr_mult_sl = grid.atr_mult_sl[a];
            c.rr_mult_tp  = grid.rr_mult_tp[r];
            c.score = std::numeric_limits<double>::quiet_NaN();
        }

    spdlog::info("optimize: {} cells, maximize {}", res.total, to_string(opt.metric));
    const auto deadline = opt.timeout ? std::optional<std::chrono::steady_clock::time_point>(
                                            std::chrono::steady_clock::now() + *opt.timeout)
                                      : std::nullopt;
    std::atomic<int> stop{0};   // 1 = cancelled, 2 = timeout

    parallel_for(res.total, opt.threads, [&](std::size_t i){
        if (stop.load()) return;
        if (opt.cancel && opt.cancel->load()) { stop.store(1); return; }
        if (deadline && std::chrono::steady_clock::now() >= *deadline) { stop.store(2); return; }

        auto& c = res.heatmap[i];
        core::BacktestConfig cfg = base;
        cfg.risk.atr_mult_sl = c.atr_mult_sl;
        cfg.risk.rr_mult_tp  = c.rr_mult_tp;
        const auto sim = simulate(table, cfg);
        c.stats = compute_stats(sim, table, cfg.timeframe);
        c.score = metric_value(c.stats, opt.metric);
        c.evaluated = true;
    });

    for (const auto& c : res.heatmap) {
        if (!c.evaluated) continue;
        ++res.evaluated;
        if (std::isnan(c.score)) continue;
        if (!res.best || c.score > res.best->score) res.best = c;
    }
    res.completed = res.evaluated == res.total;
    if (!res.completed) {
        res.stop_reason = stop.load() == 2 ? "timeout" : "cancelled";
        spdlog::warn("optimize stopped ({}) after {}/{} cells", res.stop_reason, res.evaluated, res.total);
    }
    if (res.best)
        spdlog::info("optimize best: atr_mult_sl={:.2f} rr_mult_tp={:.2f} {}={:.4f}",
                     res.best->atr_mult_sl, res.best->rr_mult_tp, to_string(opt.metric), res.best->score);
    else
        spdlog::warn("optimize: no cell produced a defined {}", to_string(opt.metric));
    return res;
}

} // namespace sim
