#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include "core/types.hpp"

namespace core {

// Modul interfész – minden streaming indikátor ezt valósítja meg.
// Egy bar-t kap időrendben, és csak az eddig látott bar-okból számol,
// így a t. kimenet a [0..t] bar-ok tiszta függvénye.
class IModule {
public:
    virtual ~IModule() = default;

    // Egyedi azonosító (pl. "MID_9", "ATR_14", "EMA_100")
    virtual std::string id() const = 0;

    // Hány bar kell, mire értelmes értéket ad a modul
    virtual std::size_t warmup_bars() const = 0;

    // Modul állapotának nullázása
    virtual void reset() = 0;

    // Új bar érkezésekor hívjuk; warm-up alatt nincs érték
    virtual std::optional<double> on_bar(const Bar&) = 0;
};

// Kényelmi clamp 0..1 közé
inline double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

} // namespace core
