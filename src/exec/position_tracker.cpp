#include "exec/position_tracker.hpp"

namespace exec {

bool PositionTracker::open(core::Signal side, double price, double size, double stop, double target,
                           std::int64_t time_ms, std::size_t bar){
    if (pos_ || size <= 0.0 || side == core::Signal::Neutral) return false;
    Position p;
    p.side = side;
    p.entry_price = price;
    p.size = size;
    p.stop = stop;
    p.target = target;
    p.entry_time_ms = time_ms;
    p.entry_bar = bar;
    p.entry_commission = commission_ * price * size;
    pos_ = p;
    return true;
}

double PositionTracker::unrealized(double price) const {
    if (!pos_) return 0.0;
    return (price - pos_->entry_price) * pos_->size * core::sign_of(pos_->side);
}

std::optional<Trade> PositionTracker::close(double price, std::int64_t time_ms, std::size_t bar, ExitReason reason){
    if (!pos_) return std::nullopt;
    const Position& p = *pos_;
    Trade t;
    t.side = p.side;
    t.size = p.size;
    t.entry_price = p.entry_price;
    t.exit_price = price;
    t.stop = p.stop;
    t.target = p.target;
    t.entry_time_ms = p.entry_time_ms;
    t.exit_time_ms = time_ms;
    t.entry_bar = p.entry_bar;
    t.exit_bar = bar;
    t.reason = reason;
    // (exit-entry)*size*irány - jutalék(belépés) - jutalék(kilépés)
    const double exit_commission = commission_ * price * p.size;
    t.commission = p.entry_commission + exit_commission;
    t.pnl = unrealized(price) - t.commission;
    const double notional = p.entry_price * p.size;
    t.return_pct = notional > 0.0 ? t.pnl / notional * 100.0 : 0.0;
    pos_.reset();
    return t;
}

} // namespace exec
