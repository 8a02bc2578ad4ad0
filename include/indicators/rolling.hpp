#pragma once
#include <cstddef>
#include <deque>
#include <utility>

namespace ind {

// Csúszó ablak szélsőérték monoton deque-val, amortizált O(1) / bar.
// Better(a, b) igaz, ha a "erősebb" mint b (max-hoz: a >= b).
template <typename Better>
class RollingExtremum {
    std::deque<std::pair<std::size_t, double>> q_; // (index, érték), monoton
    std::size_t period_;
    std::size_t seen_{0};
    Better better_{};
public:
    explicit RollingExtremum(std::size_t period) : period_(period) {}

    void push(double v) {
        while (!q_.empty() && better_(v, q_.back().second)) q_.pop_back();
        q_.emplace_back(seen_, v);
        ++seen_;
        // ablak: [seen_ - period_, seen_ - 1]
        while (q_.front().first + period_ < seen_) q_.pop_front();
    }

    bool full() const { return seen_ >= period_; }
    double value() const { return q_.front().second; }
    std::size_t period() const { return period_; }
    void reset() { q_.clear(); seen_ = 0; }
};

struct GreaterEq { bool operator()(double a, double b) const { return a >= b; } };
struct LessEq    { bool operator()(double a, double b) const { return a <= b; } };

using RollingMax = RollingExtremum<GreaterEq>;
using RollingMin = RollingExtremum<LessEq>;

// "Hány igaz az utolsó N-ben" futó számlálóval, min_periods = N
class RollingCount {
    std::deque<bool> win_;
    std::size_t period_;
    std::size_t count_{0};
public:
    explicit RollingCount(std::size_t period) : period_(period) {}

    void push(bool v) {
        win_.push_back(v);
        if (v) ++count_;
        if (win_.size() > period_) {
            if (win_.front()) --count_;
            win_.pop_front();
        }
    }

    bool full() const { return win_.size() == period_; }
    std::size_t count() const { return count_; }
    bool all() const { return full() && count_ == period_; }
    std::size_t period() const { return period_; }
    void reset() { win_.clear(); count_ = 0; }
};

} // namespace ind
