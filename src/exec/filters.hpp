#pragma once
#include <cmath>

namespace exec {
// Lefelé kerekítés lépésközre (pl. egész darab = 1.0), hogy a méret ne lépje túl a keretet
inline double floor_step(double v, double step){
    if (step<=0) return v;
    return std::floor(v/step)*step;
}
} // namespace exec
