#include "search_budget.h"

#include <limits>

namespace kopt {
    SearchBudget::SearchBudget(const uint64_t time_limit_ms, const uint64_t iteration_limit)
        : has_deadline(time_limit_ms != std::numeric_limits<uint64_t>::max()),
          iteration_limit(iteration_limit) {
        if (has_deadline) {
            // clamp so the addition below cannot overflow the clock representation
            constexpr uint64_t max_ms = 1000ull * 60 * 60 * 24 * 365;
            const uint64_t ms = time_limit_ms < max_ms ? time_limit_ms : max_ms;
            deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        }
    }

    bool SearchBudget::consume() {
        if (stop_requested.load(std::memory_order_relaxed) || tripped.load(std::memory_order_relaxed)) {
            return false;
        }
        const uint64_t used = iterations.fetch_add(1, std::memory_order_relaxed);
        if (used >= iteration_limit) {
            tripped.store(true, std::memory_order_relaxed);
            return false;
        }
        if (has_deadline && used % 64 == 0 && std::chrono::steady_clock::now() >= deadline) {
            tripped.store(true, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    bool SearchBudget::exhausted() {
        if (stop_requested.load(std::memory_order_relaxed) || tripped.load(std::memory_order_relaxed)) {
            return true;
        }
        if (iterations.load(std::memory_order_relaxed) >= iteration_limit
            || (has_deadline && std::chrono::steady_clock::now() >= deadline)) {
            tripped.store(true, std::memory_order_relaxed);
            return true;
        }
        return false;
    }
} // namespace kopt
