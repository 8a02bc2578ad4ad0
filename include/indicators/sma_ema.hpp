#pragma once
#include <optional>
#include <string>
#include "core/module.hpp"

namespace ind {

// Streaming EMA a záróárra – trendszűrő. SMA seed (az első p záró átlaga),
// utána alpha = 2/(p+1).
class EmaModule final : public core::IModule {
    std::size_t period;
    std::size_t seen{0};
    double seed_sum{0.0};
    double ema{0.0};
public:
    explicit EmaModule(std::size_t p=100): period(p) {}
    std::string id() const override { return "EMA_" + std::to_string(period); }
    std::size_t warmup_bars() const override { return period; }
    void reset() override { seen = 0; seed_sum = 0.0; ema = 0.0; }
    std::optional<double> on_bar(const core::Bar&) override;
};

} // namespace ind
