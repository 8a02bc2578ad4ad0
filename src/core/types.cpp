#include "core/types.hpp"
#include <algorithm>
#include <cctype>

namespace core {

std::optional<Timeframe> parse_timeframe(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "1m"  || v == "m1")  return Timeframe::M1;
    if (v == "3m"  || v == "m3")  return Timeframe::M3;
    if (v == "5m"  || v == "m5")  return Timeframe::M5;
    if (v == "15m" || v == "m15") return Timeframe::M15;
    if (v == "30m" || v == "m30") return Timeframe::M30;
    if (v == "1h"  || v == "h1")  return Timeframe::H1;
    if (v == "4h"  || v == "h4")  return Timeframe::H4;
    if (v == "1d"  || v == "d1" || v == "daily") return Timeframe::D1;
    return std::nullopt;
}

double bars_per_year(Timeframe tf) {
    constexpr double days = 252.0;
    switch (tf) {
        case Timeframe::M1:  return days * 24 * 60;
        case Timeframe::M3:  return days * 24 * 20;
        case Timeframe::M5:  return days * 24 * 12;
        case Timeframe::M15: return days * 24 * 4;
        case Timeframe::M30: return days * 24 * 2;
        case Timeframe::H1:  return days * 24;
        case Timeframe::H4:  return days * 6;
        default:             return days;
    }
}

} // namespace core
