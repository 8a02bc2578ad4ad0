#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

// Időkeret
enum class Timeframe { M1, M3, M5, M15, M30, H1, H4, D1 };

// OHLCV bar
struct Bar {
    std::int64_t open_time_ms{}; // bar open time (ms), szigorúan növekvő
    double open{};
    double high{};
    double low{};
    double close{};
    std::optional<double> volume;
};

using BarSeries = std::vector<Bar>;

// Jel típus
enum class Signal { Long, Short, Neutral };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::Long:  return "LONG";
        case Signal::Short: return "SHORT";
        default:            return "NONE";
    }
}

inline int sign_of(Signal s) {
    return s == Signal::Long ? 1 : (s == Signal::Short ? -1 : 0);
}

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "1m";
        case Timeframe::M3:  return "3m";
        case Timeframe::M5:  return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1:  return "1h";
        case Timeframe::H4:  return "4h";
        default:             return "1d";
    }
}

std::optional<Timeframe> parse_timeframe(const std::string& s);

// Évesítéshez: hány bar egy kereskedési évben (252 nap)
double bars_per_year(Timeframe tf);

} // namespace core
