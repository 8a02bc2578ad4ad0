#include "exec/risk.hpp"
#include "core/module.hpp"
#include "filters.hpp"
#include <algorithm>

namespace exec {

Bracket make_bracket(core::Signal side, double entry, double atr, const core::RiskParams& p){
    Bracket b;
    b.stop_distance   = atr * p.atr_mult_sl;
    b.target_distance = b.stop_distance * p.rr_mult_tp;
    const int dir = core::sign_of(side);
    b.stop   = entry - dir * b.stop_distance;
    b.target = entry + dir * b.target_distance;
    return b;
}

double RiskManager::position_size(double equity, double price) const {
    if (!(equity > 0.0) || !(price > 0.0)) return 0.0;
    const double buying_power = equity / account_.margin;
    const double adjusted_price = price * (1.0 + account_.commission);
    const double units = core::clamp01(account_.position_size) * buying_power / adjusted_price;
    return account_.whole_units ? floor_step(units, 1.0) : units;
}

} // namespace exec
