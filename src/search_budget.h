#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace kopt {
    /// Cooperative cancellation shared by every worker of a solve.
    /// Counts scan iterations and watches a wall clock deadline. Once tripped it stays tripped.
    /// A stop request halts the search the same way without counting as a cancellation.
    class SearchBudget {
        std::chrono::steady_clock::time_point deadline;
        bool has_deadline;
        uint64_t iteration_limit;
        std::atomic<uint64_t> iterations{0};
        std::atomic<bool> tripped{false};
        std::atomic<bool> stop_requested{false};

    public:
        /// UINT64_MAX disables either limit.
        SearchBudget(uint64_t time_limit_ms, uint64_t iteration_limit);

        SearchBudget(const SearchBudget &) = delete;

        SearchBudget &operator=(const SearchBudget &) = delete;

        /// Accounts for one scan iteration. Returns false once the budget is exhausted.
        /// The clock is read on the first iteration and every 64th after it.
        [[nodiscard]] bool consume();

        /// Whether the search has to stop, either on a stop request or because the budget ran out. Reads the clock.
        [[nodiscard]] bool exhausted();

        /// Stops every worker at its next check, e.g. once a target cost has been reached.
        void request_stop() {
            stop_requested.store(true, std::memory_order_relaxed);
        }

        /// Whether a time or iteration limit has tripped.
        [[nodiscard]] bool cancelled() const {
            return tripped.load(std::memory_order_relaxed);
        }

        [[nodiscard]] uint64_t iterations_used() const {
            return iterations.load(std::memory_order_relaxed);
        }
    };
} // namespace kopt
