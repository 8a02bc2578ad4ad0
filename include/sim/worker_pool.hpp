#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sim {

// n független feladat, `threads` szálon. A feladatok egymástól függetlenek,
// mindegyik a saját kimeneti slotjába ír. Egy hibás feladat nem állítja meg a többit;
// az első kivételt a join után újradobjuk.
inline void parallel_for(std::size_t n, unsigned threads, const std::function<void(std::size_t)>& fn) {
    if (n == 0) return;
    if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
    threads = static_cast<unsigned>(std::min<std::size_t>(threads, n));

    std::atomic<std::size_t> next{0};
    std::exception_ptr first_error;
    std::mutex err_mtx;

    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= n) return;
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lk(err_mtx);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    if (threads == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (unsigned t=0; t<threads; ++t) pool.emplace_back(worker);
        for (auto& th : pool) th.join();
    }
    if (first_error) std::rethrow_exception(first_error);
}

} // namespace sim
