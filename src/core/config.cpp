#include "core/config.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace core {

namespace {

void require_positive(int v, const char* name) {
    if (v < 1) throw InvalidConfiguration(fmt::format("{} must be >= 1 (got {})", name, v));
}

void require_positive(double v, const char* name) {
    if (!(v > 0.0)) throw InvalidConfiguration(fmt::format("{} must be > 0 (got {})", name, v));
}

void require_unit(double v, const char* name) {
    if (!(v > 0.0 && v <= 1.0))
        throw InvalidConfiguration(fmt::format("{} must be in (0, 1] (got {})", name, v));
}

template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return; // alapérték marad
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw InvalidConfiguration(fmt::format("config key '{}': {}", key, e.what()));
    }
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end()) return empty;
    if (!it->is_object()) throw InvalidConfiguration(fmt::format("config section '{}' must be an object", key));
    return *it;
}

} // namespace

void validate(const BacktestConfig& cfg) {
    require_positive(cfg.cloud.tenkan, "tenkan");
    require_positive(cfg.cloud.kijun, "kijun");
    require_positive(cfg.cloud.senkou_b, "senkou_b");
    require_positive(cfg.cloud.atr_length, "atr_length");

    require_positive(cfg.signal.ema_length, "ema_length");
    if (cfg.signal.ema_back_candles < 0)
        throw InvalidConfiguration(fmt::format("ema_back_candles must be >= 0 (got {})", cfg.signal.ema_back_candles));
    require_positive(cfg.signal.lookback_window, "lookback_window");
    require_positive(cfg.signal.min_confirm, "min_confirm");
    if (cfg.signal.min_confirm > cfg.signal.lookback_window)
        throw InvalidConfiguration(fmt::format("min_confirm ({}) cannot exceed lookback_window ({})",
                                               cfg.signal.min_confirm, cfg.signal.lookback_window));

    require_positive(cfg.risk.atr_mult_sl, "atr_mult_sl");
    require_positive(cfg.risk.rr_mult_tp, "rr_mult_tp");

    require_positive(cfg.account.cash, "cash");
    if (!(cfg.account.commission >= 0.0 && cfg.account.commission < 1.0))
        throw InvalidConfiguration(fmt::format("commission must be in [0, 1) (got {})", cfg.account.commission));
    require_unit(cfg.account.margin, "margin");
    require_unit(cfg.account.position_size, "position_size");

    if (cfg.worker_threads < 0)
        throw InvalidConfiguration(fmt::format("worker_threads must be >= 0 (got {})", cfg.worker_threads));

    // spdlog::level::from_str ismeretlen névre csendben "off"-ot adna
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(kLevels), std::end(kLevels), cfg.log_level) == std::end(kLevels))
        throw InvalidConfiguration(fmt::format("log_level must be one of trace/debug/info/warn/error/critical/off (got '{}')",
                                               cfg.log_level));
}

BacktestConfig from_json(const json& j) {
    if (!j.is_object()) throw InvalidConfiguration("config root must be a JSON object");
    BacktestConfig cfg;

    const auto& ic = section(j, "ichimoku");
    read(ic, "tenkan", cfg.cloud.tenkan);
    read(ic, "kijun", cfg.cloud.kijun);
    read(ic, "senkou_b", cfg.cloud.senkou_b);
    read(ic, "atr_length", cfg.cloud.atr_length);

    const auto& sg = section(j, "signal");
    read(sg, "ema_length", cfg.signal.ema_length);
    read(sg, "ema_back_candles", cfg.signal.ema_back_candles);
    read(sg, "lookback_window", cfg.signal.lookback_window);
    read(sg, "min_confirm", cfg.signal.min_confirm);

    const auto& rk = section(j, "risk");
    read(rk, "atr_mult_sl", cfg.risk.atr_mult_sl);
    read(rk, "rr_mult_tp", cfg.risk.rr_mult_tp);

    const auto& ac = section(j, "account");
    read(ac, "cash", cfg.account.cash);
    read(ac, "commission", cfg.account.commission);
    read(ac, "margin", cfg.account.margin);
    read(ac, "position_size", cfg.account.position_size);
    read(ac, "whole_units", cfg.account.whole_units);

    std::string tf = to_string(cfg.timeframe);
    read(j, "timeframe", tf);
    auto parsed = parse_timeframe(tf);
    if (!parsed) throw InvalidConfiguration(fmt::format("unknown timeframe '{}'", tf));
    cfg.timeframe = *parsed;

    read(j, "log_level", cfg.log_level);
    read(j, "worker_threads", cfg.worker_threads);

    validate(cfg);
    return cfg;
}

json to_json(const BacktestConfig& cfg) {
    return json{
        {"ichimoku", {{"tenkan", cfg.cloud.tenkan},
                      {"kijun", cfg.cloud.kijun},
                      {"senkou_b", cfg.cloud.senkou_b},
                      {"atr_length", cfg.cloud.atr_length}}},
        {"signal", {{"ema_length", cfg.signal.ema_length},
                    {"ema_back_candles", cfg.signal.ema_back_candles},
                    {"lookback_window", cfg.signal.lookback_window},
                    {"min_confirm", cfg.signal.min_confirm}}},
        {"risk", {{"atr_mult_sl", cfg.risk.atr_mult_sl},
                  {"rr_mult_tp", cfg.risk.rr_mult_tp}}},
        {"account", {{"cash", cfg.account.cash},
                     {"commission", cfg.account.commission},
                     {"margin", cfg.account.margin},
                     {"position_size", cfg.account.position_size},
                     {"whole_units", cfg.account.whole_units}}},
        {"timeframe", to_string(cfg.timeframe)},
        {"log_level", cfg.log_level},
        {"worker_threads", cfg.worker_threads},
    };
}

BacktestConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw InvalidConfiguration(fmt::format("cannot open config file '{}'", path));
    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw InvalidConfiguration(fmt::format("config '{}' parse error: {}", path, e.what()));
    }
    auto cfg = from_json(j);
    spdlog::info("config loaded from {} (tf={}, tenkan={}, kijun={}, senkou_b={})",
                 path, to_string(cfg.timeframe), cfg.cloud.tenkan, cfg.cloud.kijun, cfg.cloud.senkou_b);
    return cfg;
}

} // namespace core
