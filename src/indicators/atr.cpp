#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

double true_range(const core::Bar& b, double prev_close){
    return std::max({b.high - b.low,
                     std::abs(b.high - prev_close),
                     std::abs(b.low - prev_close)});
}

std::optional<double> AtrModule::on_bar(const core::Bar& b){
    ++seen;
    if (seen == 1) { prev_close = b.close; return std::nullopt; }
    const double tr = true_range(b, prev_close);
    prev_close = b.close;
    const std::size_t n_tr = seen - 1;
    if (n_tr < period) { tr_sum += tr; return std::nullopt; }
    if (n_tr == period) {
        tr_sum += tr;
        atr = tr_sum / static_cast<double>(period);
        return atr;
    }
    atr = (atr*(period-1.0) + tr) / static_cast<double>(period);
    return atr;
}

} // namespace ind
