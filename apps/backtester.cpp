#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "data/bar_table.hpp"
#include "sim/batch_runner.hpp"
#include "sim/optimizer.hpp"
#include "sim/report.hpp"

namespace {

std::atomic<bool> g_cancel{false};

void on_sigint(int) { g_cancel.store(true); }

struct Args {
    std::string command;
    std::vector<std::string> inputs;
    std::string config_path;
    std::string out_path;
    std::string metric{"return"};
    std::optional<std::chrono::milliseconds> timeout;
};

void usage() {
    std::cout <<
        "Hasznalat:\n"
        "  kumo_backtester backtest <csv> [--config cfg.json] [--out report.json]\n"
        "  kumo_backtester multi <csv>... [--config cfg.json] [--out report.json]\n"
        "  kumo_backtester optimize <csv> [--metric return|sharpe|sortino|win_rate|profit_factor|max_drawdown]\n"
        "                           [--timeout-ms N] [--config cfg.json] [--out report.json]\n";
}

bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.command = argv[1];
    for (int i=2; i<argc; ++i) {
        const std::string s = argv[i];
        auto next = [&]() -> const char* { return (i+1 < argc) ? argv[++i] : nullptr; };
        if (s == "--config")      { auto v = next(); if (!v) return false; a.config_path = v; }
        else if (s == "--out")    { auto v = next(); if (!v) return false; a.out_path = v; }
        else if (s == "--metric") { auto v = next(); if (!v) return false; a.metric = v; }
        else if (s == "--timeout-ms") {
            auto v = next();
            if (!v) return false;
            a.timeout = sim::parse_timeout_ms(v);
            if (!a.timeout) {
                spdlog::error("--timeout-ms needs a positive integer (got '{}')", v);
                return false;
            }
        }
        else a.inputs.push_back(s);
    }
    return !a.inputs.empty();
}

// fájlnév kiterjesztés nélkül -> szimbólum címke
std::string symbol_of(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = base.rfind('.');
    return dot == std::string::npos ? base : base.substr(0, dot);
}

void print_stats(const std::string& label, const sim::Stats& s) {
    std::cout << fmt::format(
        "{}\n"
        "  Return:         {:>10.2f} %\n"
        "  Buy & Hold:     {:>10.2f} %\n"
        "  Max Drawdown:   {:>10.2f} %\n"
        "  Avg Drawdown:   {:>10.2f} %\n"
        "  Win Rate:       {:>10.2f} %\n"
        "  # Trades:       {:>10}\n"
        "  Exposure Time:  {:>10.2f} %\n"
        "  Profit Factor:  {:>10}\n"
        "  Sharpe:         {:>10.3f}\n"
        "  Sortino:        {:>10.3f}\n"
        "  Final Equity:   {:>10.2f}{}\n",
        label, s.return_pct, s.buy_hold_return_pct, s.max_drawdown_pct, s.avg_drawdown_pct,
        s.win_rate_pct, s.trades, s.exposure_pct,
        s.profit_factor_defined ? fmt::format("{:.3f}", s.profit_factor) : std::string("n/a"),
        s.sharpe, s.sortino, s.final_equity, s.ruined ? "  (RUINED)" : "");
}

void print_summary(const std::vector<sim::SummaryRow>& rows) {
    std::cout << fmt::format("{:<14}{:>12}{:>12}{:>12}{:>12}{:>10}{:>12}\n",
                             "Pair", "Return [%]", "Max DD [%]", "Avg DD [%]", "Win [%]", "# Trades", "Exposure");
    for (const auto& r : rows) {
        std::cout << fmt::format("{:<14}{:>12.2f}{:>12.2f}{:>12.2f}{:>12.2f}{:>10.1f}{:>12.2f}\n",
                                 r.label, r.return_pct, r.max_drawdown_pct, r.avg_drawdown_pct,
                                 r.win_rate_pct, r.trades, r.exposure_pct);
    }
}

bool write_json(const std::string& path, const nlohmann::json& j) {
    if (path.empty()) return true;
    std::ofstream f(path);
    if (!f.good()) {
        spdlog::error("cannot write report to {}", path);
        return false;
    }
    f << j.dump(2) << "\n";
    spdlog::info("report written to {}", path);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage();
        return 1;
    }

    core::BacktestConfig cfg;
    try {
        if (!args.config_path.empty()) cfg = core::load_config(args.config_path);
        core::validate(cfg);
    } catch (const core::InvalidConfiguration& e) {
        spdlog::error("invalid configuration: {}", e.what());
        return core::exit_code(core::ErrorKind::InvalidConfiguration);
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    std::signal(SIGINT, on_sigint);

    try {
        if (args.command == "backtest") {
            const auto bars = data::load_bars_csv(args.inputs.front());
            const auto run = sim::run_backtest(bars, cfg);
            print_stats(symbol_of(args.inputs.front()), run.stats);
            return write_json(args.out_path, sim::to_json(run, cfg.cloud.kijun)) ? 0 : 3;
        }

        if (args.command == "multi") {
            std::vector<sim::SymbolJob> jobs;
            for (const auto& p : args.inputs)
                jobs.push_back({symbol_of(p), [p]() { return data::load_bars_csv(p); }});
            const auto outcomes = sim::run_batch(jobs, cfg);
            const auto summary = sim::summarize(outcomes);
            print_summary(summary);
            nlohmann::json j{{"summary", sim::to_json(summary)}, {"runs", nlohmann::json::array()}};
            for (const auto& o : outcomes) j["runs"].push_back(sim::to_json(o));
            return write_json(args.out_path, j) ? 0 : 3;
        }

        if (args.command == "optimize") {
            auto metric = sim::parse_metric(args.metric);
            if (!metric) {
                spdlog::error("unknown metric '{}'", args.metric);
                return 1;
            }
            sim::OptimizeOptions opt;
            opt.metric = *metric;
            opt.cancel = &g_cancel;
            opt.threads = static_cast<unsigned>(cfg.worker_threads);
            if (args.timeout) opt.timeout = *args.timeout;

            const auto bars = data::load_bars_csv(args.inputs.front());
            const auto res = sim::optimize(bars, cfg, sim::GridSpec::defaults(), opt);
            if (res.best) {
                std::cout << fmt::format("Best atr_mult_sl={:.2f} rr_mult_tp={:.2f} ({} = {:.4f})\n",
                                         res.best->atr_mult_sl, res.best->rr_mult_tp,
                                         sim::to_string(opt.metric), res.best->score);
                print_stats(symbol_of(args.inputs.front()), res.best->stats);
            }
            return write_json(args.out_path, sim::to_json(res)) ? 0 : 3;
        }
    } catch (const core::InsufficientData& e) {
        spdlog::warn("not enough data: {}", e.what());
        return core::exit_code(core::ErrorKind::InsufficientData);
    } catch (const core::SchemaError& e) {
        spdlog::error("bad input: {}", e.what());
        return core::exit_code(core::ErrorKind::SchemaError);
    } catch (const core::InvalidConfiguration& e) {
        spdlog::error("invalid configuration: {}", e.what());
        return core::exit_code(core::ErrorKind::InvalidConfiguration);
    } catch (const std::exception& e) {
        spdlog::error("internal error: {}", e.what());
        return core::exit_code(core::ErrorKind::Internal);
    }

    usage();
    return 1;
}
