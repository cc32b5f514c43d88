#include "run_controller.h"

#include "construction.h"
#include "trace.h"

#include <algorithm>
#include <cassert>
#include <thread>

namespace {
    void AccumulateStats(kopt::local_search_stats_t &total, const kopt::local_search_stats_t &run) {
        total.two_opt_moves += run.two_opt_moves;
        total.or_opt_moves += run.or_opt_moves;
        total.three_opt_moves += run.three_opt_moves;
        total.sweeps += run.sweeps;
        total.scan_iterations += run.scan_iterations;
        total.total_gain += run.total_gain;
    }
} // end anonymous namespace

namespace kopt {
    std::mt19937_64 CreateRunGenerator(const uint64_t seed, const uint32_t run) {
        std::seed_seq sequence{
            static_cast<uint32_t>(seed & 0xffffffffu),
            static_cast<uint32_t>(seed >> 32),
            run
        };
        return std::mt19937_64(sequence);
    }

    RunController::RunController(const CostMatrix &cost_matrix, const CandidateSet &candidate_set,
                                 const run_controller_options_t &options)
        : cost_matrix(cost_matrix),
          candidate_set(candidate_set),
          options(options),
          budget(options.time_limit_ms, options.iteration_limit) {
    }

    std::vector<node_idx> RunController::ConstructTour(std::mt19937_64 &rng) const {
        switch (options.initial_tour) {
            case KOPT_INIT_RANDOM:
                return GenerateRandomTour(cost_matrix.num_nodes, rng);
            case KOPT_INIT_NEAREST_NEIGHBOR:
            default:
                return GetNearestNeighborTour(cost_matrix, rng);
        }
    }

    cost_t RunController::MergeRun(const uint32_t run, const std::vector<node_idx> &tour, const cost_t cost,
                                   const bool completed, const local_search_stats_t &stats) {
        std::lock_guard lock(result_mutex);
        ::AccumulateStats(result.stats, stats);
        if (completed) {
            ++result.runs_completed;
        }
        // the lowest (cost, run) pair wins so the outcome does not depend on thread scheduling
        if (cost < result.best_cost || (cost == result.best_cost && run < result.best_run)) {
            result.best_tour = tour;
            result.best_cost = cost;
            result.best_run = run;
        }
        if (options.stop_at_cost >= 0 && result.best_cost <= options.stop_at_cost) {
            budget.request_stop();
        }
        return result.best_cost;
    }

    void RunController::RunWorker(const uint32_t worker, const uint32_t num_workers,
                                  const std::vector<node_idx> *initial_tour) {
        LocalSearch local_search(cost_matrix, candidate_set, options.local_search, &budget);

        std::vector<node_idx> worker_best{};
        cost_t worker_best_cost = COST_POSITIVE_INFINITY;

        for (uint32_t run = worker; run < options.runs; run += num_workers) {
            // run 0 always executes so that there is a tour to report
            if (run != 0 && budget.exhausted()) {
                break;
            }
            std::mt19937_64 rng = CreateRunGenerator(options.seed, run);

            std::vector<node_idx> start{};
            if (run == 0 && initial_tour != nullptr) {
                start = *initial_tour;
            } else if (worker_best.empty()) {
                start = ConstructTour(rng);
            } else {
                start = DoubleBridgeKick(worker_best, rng);
            }
            Tour tour(std::move(start));
            const cost_t start_cost = tour.total_cost(cost_matrix);
            if (run == 0) {
                std::lock_guard lock(result_mutex);
                result.initial_cost = start_cost;
            }

            const SearchState state = local_search.Run(tour);
            const bool completed = state == SearchState::Converged;

            std::vector<node_idx> run_tour = tour.to_vector();
            const cost_t run_cost = tour.total_cost(cost_matrix);
#ifdef KOPT_IS_DEBUG
            assert(IsPermutation(run_tour, cost_matrix.num_nodes));
#endif

            if (run_cost < worker_best_cost) {
                worker_best = run_tour;
                worker_best_cost = run_cost;
            }

            const local_search_stats_t &stats = local_search.statistics();
            const cost_t best_cost = MergeRun(run, run_tour, run_cost, completed, stats);
            Trace(options.verbosity, 1, "run {}: start {:.2f} -> {:.2f} after {} moves, best {:.2f}{}",
                  run, start_cost, run_cost, stats.total_moves(), best_cost, completed ? "" : " (interrupted)");
            Trace(options.verbosity, 2, "run {}: 2-opt {} / or-opt {} / 3-opt {} moves, {} sweeps, {} scans",
                  run, stats.two_opt_moves, stats.or_opt_moves, stats.three_opt_moves, stats.sweeps,
                  stats.scan_iterations);
        }
    }

    KoptStatus RunController::Solve(const std::vector<node_idx> *initial_tour, run_result_t &run_result) {
        result = {};
        worker_error = nullptr;

        const uint32_t num_workers = std::max(1u, std::min(options.num_threads, options.runs));
        Trace(options.verbosity, 2, "{} nodes, {} candidate edges, {} runs on {} worker(s)",
              cost_matrix.num_nodes, candidate_set.total_candidates(), options.runs, num_workers);

        if (num_workers == 1) {
            RunWorker(0, 1, initial_tour);
        } else {
            std::vector<std::thread> workers{};
            workers.reserve(num_workers);
            for (uint32_t worker = 0; worker < num_workers; ++worker) {
                workers.emplace_back([this, worker, num_workers, initial_tour] {
                    try {
                        RunWorker(worker, num_workers, initial_tour);
                    } catch (...) {
                        std::lock_guard lock(result_mutex);
                        if (!worker_error) {
                            worker_error = std::current_exception();
                        }
                        budget.request_stop();
                    }
                });
            }
            for (auto &thread: workers) {
                thread.join();
            }
            if (worker_error) {
                std::rethrow_exception(worker_error);
            }
        }

        result.cancelled = budget.cancelled();
        Trace(options.verbosity, 1, "best {:.2f} from run {}, {} of {} runs completed{}",
              result.best_cost, result.best_run, result.runs_completed, options.runs,
              result.cancelled ? ", budget exhausted" : "");

        run_result = std::move(result);
        return run_result.cancelled ? KOPT_STATUS_CANCELLED : KOPT_STATUS_SUCCESS;
    }
} // namespace kopt
