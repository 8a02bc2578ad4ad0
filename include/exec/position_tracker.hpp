#pragma once
#include <cstdint>
#include <optional>
#include "core/types.hpp"

namespace exec {

// Nyitott pozíció: belépési fill és kilépési fill között él
struct Position {
    core::Signal side{core::Signal::Long};
    double entry_price{0.0};
    double size{0.0};              // darab, mindig pozitív
    double stop{0.0};
    double target{0.0};
    std::int64_t entry_time_ms{0};
    std::size_t entry_bar{0};
    double entry_commission{0.0};
};

enum class ExitReason { StopLoss, TakeProfit };

inline const char* to_string(ExitReason r) {
    return r == ExitReason::StopLoss ? "SL" : "TP";
}

// Lezárt kör
struct Trade {
    core::Signal side{core::Signal::Long};
    double size{0.0};
    double entry_price{0.0};
    double exit_price{0.0};
    double stop{0.0};
    double target{0.0};
    std::int64_t entry_time_ms{0};
    std::int64_t exit_time_ms{0};
    std::size_t entry_bar{0};
    std::size_t exit_bar{0};
    ExitReason reason{ExitReason::StopLoss};
    double commission{0.0};        // belépés + kilépés
    double pnl{0.0};               // nettó, jutalék után
    double return_pct{0.0};        // pnl / belépési notional * 100
};

// Egy instrumentum, nincs hedge: egyszerre legfeljebb egy nyitott pozíció.
class PositionTracker {
public:
    explicit PositionTracker(double commission_rate) : commission_(commission_rate) {}

    bool is_open() const { return pos_.has_value(); }
    const std::optional<Position>& get() const { return pos_; }

    // false, ha már van nyitott pozíció vagy a méret nem pozitív
    bool open(core::Signal side, double price, double size, double stop, double target,
              std::int64_t time_ms, std::size_t bar);

    // Lezárja a pozíciót a megadott áron; üres optional, ha nincs nyitott pozíció
    std::optional<Trade> close(double price, std::int64_t time_ms, std::size_t bar, ExitReason reason);

    // Mark-to-market PnL a belépési jutalék nélkül
    double unrealized(double price) const;

    double commission_rate() const { return commission_; }

private:
    double commission_;
    std::optional<Position> pos_;
};

} // namespace exec
