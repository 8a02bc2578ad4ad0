#pragma once
#include "core/config.hpp"
#include "core/types.hpp"

namespace exec {

// SL / TP szintek egy belépéshez
struct Bracket {
    double stop{0.0};
    double target{0.0};
    double stop_distance{0.0};
    double target_distance{0.0};
};

// stop távolság = ATR * atr_mult_sl, target távolság = stop távolság * rr_mult_tp.
// Long: stop alatta, target fölötte; short fordítva.
Bracket make_bracket(core::Signal side, double entry, double atr, const core::RiskParams& p);

class RiskManager {
public:
    RiskManager(const core::RiskParams& risk, const core::AccountParams& account)
    : risk_(risk), account_(account) {}

    const core::RiskParams& params() const { return risk_; }

    // Új belépés engedélyezett-e (csőd után soha többé)
    bool allow_trade() const { return !ruined_; }
    bool ruined() const { return ruined_; }

    // Bar végén hívjuk a mark-to-market equity-vel; nem pozitív -> csőd flag.
    // true, ha most váltott csődbe.
    bool on_equity(double equity) {
        if (ruined_ || equity > 0.0) return false;
        ruined_ = true;
        return true;
    }

    // Darabszám: position_size * vásárlóerő (equity / margin), jutalékkal
    // korrigált árral osztva. Sosem lépi túl a margin szerinti vásárlóerőt.
    double position_size(double equity, double price) const;

private:
    core::RiskParams risk_;
    core::AccountParams account_;
    bool ruined_{false};
};

} // namespace exec
