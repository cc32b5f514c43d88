#pragma once

#include "candidate_set.h"
#include "local_search.h"
#include "search_budget.h"

#include <exception>
#include <mutex>
#include <random>
#include <vector>

namespace kopt {
    struct run_controller_options_t {
        uint32_t runs = 10;
        KoptInitialTour initial_tour = KOPT_INIT_NEAREST_NEIGHBOR;
        uint64_t seed = 1;
        uint32_t num_threads = 1;
        uint64_t time_limit_ms = UINT64_MAX;
        uint64_t iteration_limit = UINT64_MAX;

        /// Negative values disable the check.
        cost_t stop_at_cost = -1;
        uint32_t verbosity = 0;
        local_search_options_t local_search{};
    };

    struct run_result_t {
        std::vector<node_idx> best_tour{};
        cost_t best_cost = COST_POSITIVE_INFINITY;

        /// Cost of the tour run 0 started from
        cost_t initial_cost = COST_POSITIVE_INFINITY;
        uint32_t runs_completed = 0;
        uint32_t best_run = 0;

        /// Whether the time or iteration budget tripped before every run completed
        bool cancelled = false;

        /// Summed over all runs
        local_search_stats_t stats{};
    };

    /// Runs the multi-start search: run 0 starts from a constructed (or given) tour, later runs from a
    /// double-bridge kick of the best tour of their worker. Runs are spread over num_threads workers,
    /// run r going to worker r % num_threads.
    class RunController {
        const CostMatrix &cost_matrix;
        const CandidateSet &candidate_set;
        run_controller_options_t options;
        SearchBudget budget;

        std::mutex result_mutex;
        run_result_t result;
        std::exception_ptr worker_error;

        void RunWorker(uint32_t worker, uint32_t num_workers, const std::vector<node_idx> *initial_tour);

        [[nodiscard]] std::vector<node_idx> ConstructTour(std::mt19937_64 &rng) const;

        /// Returns the best cost over all merged runs.
        cost_t MergeRun(uint32_t run, const std::vector<node_idx> &tour, cost_t cost, bool completed,
                        const local_search_stats_t &stats);

    public:
        RunController(const CostMatrix &cost_matrix, const CandidateSet &candidate_set,
                      const run_controller_options_t &options);

        /// Executes all runs, or as many as the budget allows. initial_tour may be null; otherwise it must be a
        /// permutation of [0, n) and replaces the construction of run 0.
        /// Returns KOPT_STATUS_CANCELLED if the budget tripped; run_result still holds the best tour found.
        [[nodiscard]] KoptStatus Solve(const std::vector<node_idx> *initial_tour, run_result_t &run_result);
    };

    /// Seeds the generator of a run from the solver seed and the run index, independent of the thread count.
    [[nodiscard]] std::mt19937_64 CreateRunGenerator(uint64_t seed, uint32_t run);
} // namespace kopt
