#include "indicators/sma_ema.hpp"

namespace ind {

std::optional<double> EmaModule::on_bar(const core::Bar& b){
    ++seen;
    if (seen < period) { seed_sum += b.close; return std::nullopt; }
    if (seen == period) {
        seed_sum += b.close;
        ema = seed_sum / static_cast<double>(period);
        return ema;
    }
    const double k = 2.0/(period+1.0);
    ema = b.close*k + ema*(1.0-k);
    return ema;
}

} // namespace ind
