#pragma once
#include <optional>
#include <string>
#include "core/module.hpp"

namespace ind {

// true range = max(h-l, |h-prevC|, |l-prevC|); az első bar-nak nincs előző zárója
double true_range(const core::Bar& b, double prev_close);

// Wilder ATR: az első érték az első p true range egyszerű átlaga (bar index p),
// utána ATR = (ATR_prev*(p-1) + TR) / p
class AtrModule final : public core::IModule {
    std::size_t period;
    std::size_t seen{0};
    double prev_close{0.0};
    double tr_sum{0.0};
    double atr{0.0};
public:
    explicit AtrModule(std::size_t p=14): period(p) {}
    std::string id() const override { return "ATR_" + std::to_string(period); }
    std::size_t warmup_bars() const override { return period + 1; }
    void reset() override { seen = 0; prev_close = 0.0; tr_sum = 0.0; atr = 0.0; }
    std::optional<double> on_bar(const core::Bar&) override;
};

} // namespace ind
