#include "sim/trade_simulator.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace sim {

TradeSimulator::TradeSimulator(const core::RiskParams& risk, const core::AccountParams& account)
: risk_(risk, account), book_(account.commission), cash_(account.cash)
{
    res_.initial_cash = account.cash;
    res_.final_cash = account.cash;
    res_.final_equity = account.cash;
}

PositionState TradeSimulator::state() const {
    const auto& p = book_.get();
    if (!p) return PositionState::Flat;
    return p->side == core::Signal::Long ? PositionState::Long : PositionState::Short;
}

void TradeSimulator::try_exit(const strategy::SignalRow& row, std::size_t i){
    const auto& p = *book_.get();
    const auto& b = row.ind.bar;
    bool stop_hit, target_hit;
    if (p.side == core::Signal::Long) {
        stop_hit   = b.low  <= p.stop;
        target_hit = b.high >= p.target;
    } else {
        stop_hit   = b.high >= p.stop;
        target_hit = b.low  <= p.target;
    }
    if (!stop_hit && !target_hit) return;

    // mindkettő a bar-on belül: a rosszabbat feltételezzük
    const auto reason = stop_hit ? exec::ExitReason::StopLoss : exec::ExitReason::TakeProfit;
    const double price = stop_hit ? p.stop : p.target;
    const double gross = book_.unrealized(price);
    const double exit_commission = book_.commission_rate() * price * p.size;
    auto t = book_.close(price, b.open_time_ms, i, reason);  // p innen érvénytelen
    cash_ += gross - exit_commission;
    spdlog::debug("exit {} {} @ {:.5f} row={} pnl={:.2f}", core::to_string(t->side), exec::to_string(reason),
                  price, i, t->pnl);
    res_.trades.push_back(*t);
}

void TradeSimulator::try_entry(const strategy::SignalRow& row, std::size_t i){
    if (row.signal == core::Signal::Neutral) return;
    const double atr = row.ind.atr;
    if (!(atr > 0.0) || !std::isfinite(atr)) {  // 0 ATR-rel nincs méretezés
        ++res_.skipped_signals;
        return;
    }
    if (!risk_.allow_trade()) {
        ++res_.skipped_signals;
        return;
    }
    const auto& b = row.ind.bar;
    const double size = risk_.position_size(cash_, b.close);
    if (size <= 0.0) {
        ++res_.skipped_signals;
        spdlog::debug("entry skipped at row {}: size 0 (cash={:.2f}, price={:.5f})", i, cash_, b.close);
        return;
    }
    const auto br = exec::make_bracket(row.signal, b.close, atr, risk_.params());
    if (!book_.open(row.signal, b.close, size, br.stop, br.target, b.open_time_ms, i)) return;
    cash_ -= book_.get()->entry_commission;
    spdlog::debug("entry {} @ {:.5f} size={} sl={:.5f} tp={:.5f} row={}", core::to_string(row.signal),
                  b.close, size, br.stop, br.target, i);
}

void TradeSimulator::on_row(const strategy::SignalRow& row){
    const std::size_t i = row_++;
    if (book_.is_open()) {
        ++res_.exposed_bars;
        try_exit(row, i);            // egy bar-on egy átmenet: kilépés után nincs újranyitás
    } else {
        try_entry(row, i);
        if (book_.is_open()) ++res_.exposed_bars;
    }

    const double eq = cash_ + book_.unrealized(row.ind.bar.close);
    res_.equity.push_back({row.ind.bar.open_time_ms, eq});
    res_.states.push_back(state());
    if (risk_.on_equity(eq)) {
        res_.ruined = true;
        res_.ruin_row = i;
        res_.ruin_time_ms = row.ind.bar.open_time_ms;
        spdlog::warn("equity {:.2f} <= 0 at row {}: no new entries for the rest of the run", eq, i);
    }
}

SimResult TradeSimulator::finish(){
    res_.final_cash = cash_;
    res_.final_equity = res_.equity.empty() ? cash_ : res_.equity.back().equity;
    res_.open_position = book_.get();
    return res_;
}

SimResult simulate(const std::vector<strategy::SignalRow>& rows, const core::BacktestConfig& cfg){
    core::validate(cfg);
    TradeSimulator s(cfg.risk, cfg.account);
    for (const auto& r : rows) s.on_row(r);
    auto res = s.finish();
    spdlog::debug("simulation: {} rows, {} trades, final equity {:.2f}{}", rows.size(), res.trades.size(),
                  res.final_equity, res.ruined ? " (ruined)" : "");
    return res;
}

} // namespace sim
