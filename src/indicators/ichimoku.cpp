#include "indicators/ichimoku.hpp"
#include "core/errors.hpp"
#include "data/bar_table.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ind {

IchimokuEngine::IchimokuEngine(const core::CloudParams& p, int ema_length)
: tenkan_(p.tenkan), kijun_(p.kijun), span_b_(p.senkou_b), atr_(p.atr_length), ema_(ema_length),
  lag_(static_cast<std::size_t>(p.kijun))
{
    warmup_ = std::max({tenkan_.warmup_bars(), kijun_.warmup_bars(), span_b_.warmup_bars(),
                        atr_.warmup_bars(), ema_.warmup_bars()});
}

void IchimokuEngine::reset(){
    tenkan_.reset(); kijun_.reset(); span_b_.reset(); atr_.reset(); ema_.reset();
    past_.clear();
    index_ = 0;
}

std::optional<IndicatorRow> IchimokuEngine::on_bar(const core::Bar& b){
    const auto tk  = tenkan_.on_bar(b);
    const auto kj  = kijun_.on_bar(b);
    const auto sb  = span_b_.on_bar(b);
    const auto atr = atr_.on_bar(b);
    const auto ema = ema_.on_bar(b);
    const std::size_t i = index_++;

    // felhő a mostani bar-on, ha már van mindkét span
    Past cur{b.close, 0.0, 0.0, false};
    if (tk && kj && sb) {
        const double sa = (*tk + *kj) / 2.0;
        cur = {b.close, std::max(sa, *sb), std::min(sa, *sb), true};
    }
    past_.push_back(cur);
    if (past_.size() > lag_ + 1) past_.pop_front();

    if (!(tk && kj && sb && atr && ema)) return std::nullopt;

    IndicatorRow r;
    r.bar_index = i;
    r.bar    = b;
    r.tenkan = *tk;
    r.kijun  = *kj;
    r.span_a = (*tk + *kj) / 2.0;
    r.span_b = *sb;
    r.atr    = *atr;
    r.ema    = *ema;
    // kijun bar-ral korábbi close vs. az akkori felhő – teljesen a múltban
    if (past_.size() == lag_ + 1 && past_.front().valid) {
        const Past& then = past_.front();
        r.chikou_long_ok  = then.close > then.top;
        r.chikou_short_ok = then.close < then.bottom;
    }
    return r;
}

std::size_t required_bars(const core::BacktestConfig& cfg){
    core::validate(cfg);
    return IchimokuEngine(cfg.cloud, cfg.signal.ema_length).warmup_bars();
}

std::vector<IndicatorRow> compute_indicators(const core::BarSeries& bars, const core::BacktestConfig& cfg){
    core::validate(cfg);
    data::validate_bars(bars);

    IchimokuEngine engine(cfg.cloud, cfg.signal.ema_length);
    const std::size_t need = engine.warmup_bars();
    if (bars.size() < need) {
        throw core::InsufficientData(bars.size(), need,
            fmt::format("need at least {} bars for the longest window, got {}", need, bars.size()));
    }

    std::vector<IndicatorRow> rows;
    rows.reserve(bars.size() - need + 1);
    for (const auto& b : bars) {
        if (auto r = engine.on_bar(b)) rows.push_back(*r);
    }
    spdlog::debug("ichimoku: {} bars -> {} rows (warm-up {} bars)", bars.size(), rows.size(), need - 1);
    return rows;
}

std::vector<std::optional<double>> chikou_display(const std::vector<IndicatorRow>& rows, int kijun){
    std::vector<std::optional<double>> out(rows.size());
    const std::size_t lag = static_cast<std::size_t>(std::max(kijun, 0));
    for (std::size_t i=0; i + lag < rows.size(); ++i) out[i] = rows[i + lag].bar.close;
    return out;
}

} // namespace ind
