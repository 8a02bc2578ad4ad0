#include "sim/batch_runner.hpp"
#include "indicators/ichimoku.hpp"
#include "sim/worker_pool.hpp"
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace sim {

RunOutput run_backtest(const core::BarSeries& bars, const core::BacktestConfig& cfg){
    core::validate(cfg);
    const auto rows = ind::compute_indicators(bars, cfg);
    RunOutput out;
    out.table = strategy::generate_signals(rows, cfg.signal);
    out.sim   = simulate(out.table, cfg);
    out.stats = compute_stats(out.sim, out.table, cfg.timeframe);
    return out;
}

namespace {

void fail(SymbolOutcome& o, core::ErrorKind kind, const char* what){
    o.ok = false;
    o.error = kind;
    o.reason = what;
    spdlog::error("[{}] {}: {}", o.symbol, core::to_string(kind), what);
}

} // namespace

std::vector<SymbolOutcome> run_batch(const std::vector<SymbolJob>& jobs,
                                     const core::BacktestConfig& cfg,
                                     bool keep_outputs){
    core::validate(cfg);
    std::vector<SymbolOutcome> out(jobs.size());
    spdlog::info("batch: {} symbols", jobs.size());

    parallel_for(jobs.size(), static_cast<unsigned>(cfg.worker_threads), [&](std::size_t i){
        const auto& job = jobs[i];
        auto& o = out[i];   // csak ez a szál írja
        o.symbol = job.symbol;
        try {
            const auto bars = job.load();
            auto run = run_backtest(bars, cfg);
            o.ok = true;
            o.stats = run.stats;
            if (keep_outputs) o.output = std::move(run);
            spdlog::info("[{}] return {:.2f}% | maxDD {:.2f}% | trades {} | win {:.1f}%",
                         o.symbol, o.stats->return_pct, o.stats->max_drawdown_pct,
                         o.stats->trades, o.stats->win_rate_pct);
        } catch (const std::exception& e) {
            fail(o, core::classify(e), e.what());
        } catch (...) {
            // nem std::exception: a szimbólum hibás, a batch megy tovább
            fail(o, core::ErrorKind::Internal, "unknown exception");
        }
    });
    return out;
}

std::vector<SummaryRow> summarize(const std::vector<SymbolOutcome>& outcomes){
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<SummaryRow> rows;
    rows.reserve(outcomes.size() + 1);
    SummaryRow sum{"AVERAGE", 0, 0, 0, 0, 0, 0};
    std::size_t n = 0;
    for (const auto& o : outcomes) {
        if (!o.ok || !o.stats) {
            rows.push_back({o.symbol, nan, nan, nan, nan, nan, nan});
            continue;
        }
        const auto& s = *o.stats;
        SummaryRow r{o.symbol, s.return_pct, s.max_drawdown_pct, s.avg_drawdown_pct,
                     s.trades ? s.win_rate_pct : nan, static_cast<double>(s.trades), s.exposure_pct};
        rows.push_back(r);
        ++n;
        sum.return_pct       += r.return_pct;
        sum.max_drawdown_pct += r.max_drawdown_pct;
        sum.avg_drawdown_pct += r.avg_drawdown_pct;
        sum.trades           += r.trades;
        sum.exposure_pct     += r.exposure_pct;
    }
    // win rate átlag csak a trade-del rendelkező futásokra
    std::size_t n_win = 0;
    double win_sum = 0.0;
    for (const auto& r : rows) if (!std::isnan(r.win_rate_pct)) { win_sum += r.win_rate_pct; ++n_win; }

    if (n == 0) {
        rows.push_back({"AVERAGE", nan, nan, nan, nan, nan, nan});
        return rows;
    }
    const double dn = static_cast<double>(n);
    sum.return_pct /= dn; sum.max_drawdown_pct /= dn; sum.avg_drawdown_pct /= dn;
    sum.trades /= dn; sum.exposure_pct /= dn;
    sum.win_rate_pct = n_win ? win_sum / n_win : nan;
    rows.push_back(sum);
    return rows;
}

} // namespace sim
