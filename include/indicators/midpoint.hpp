#pragma once
#include <optional>
#include <string>
#include "core/module.hpp"
#include "indicators/rolling.hpp"

namespace ind {

// (max(high, N) + min(low, N)) / 2 – tenkan, kijun és a nyers span B is ez
class MidpointModule final : public core::IModule {
    RollingMax highs_;
    RollingMin lows_;
public:
    explicit MidpointModule(std::size_t p): highs_(p), lows_(p) {}
    std::string id() const override { return "MID_" + std::to_string(highs_.period()); }
    std::size_t warmup_bars() const override { return highs_.period(); }
    void reset() override { highs_.reset(); lows_.reset(); }
    std::optional<double> on_bar(const core::Bar& b) override {
        highs_.push(b.high);
        lows_.push(b.low);
        if (!highs_.full()) return std::nullopt;
        return (highs_.value() + lows_.value()) / 2.0;
    }
};

} // namespace ind
