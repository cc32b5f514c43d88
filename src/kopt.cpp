#include <libkopt.h>

#include "candidate_set.h"
#include "cost_matrix.h"
#include "run_controller.h"
#include "trace.h"

#include <algorithm>
#include <cmath>
#include <new>
#include <system_error>
#include <vector>

namespace {
    using kopt::cost_t;
    using kopt::node_idx;

    /// A problem that passed validation
    struct problem_shape_t {
        size_t num_nodes = 0;
        bool symmetric = false;
    };

    /// Validate the shape of the problem before any allocation.
    /// Exactly one of distances or coordinates must be given. A distance matrix must be square with finite,
    /// non-negative off-diagonal entries, and symmetric if KOPT_PROBLEM_SYMMETRIC is requested.
    /// There must be at least 3 nodes.
    KoptStatus ValidateProblem(const KoptProblemDescriptor &problem, problem_shape_t &shape) {
        const bool has_distances = problem.distances != nullptr;
        const bool has_coordinates = problem.coordinates != nullptr;
        if (has_distances == has_coordinates) {
            return KOPT_STATUS_ERROR_INVALID_ARG;
        }
        if (problem.problem_type != KOPT_PROBLEM_AUTO
            && problem.problem_type != KOPT_PROBLEM_SYMMETRIC
            && problem.problem_type != KOPT_PROBLEM_ASYMMETRIC) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }

        if (has_distances) {
            if (problem.num_rows != problem.num_cols) {
                return KOPT_STATUS_ERROR_INVALID_INPUT;
            }
            const size_t n = problem.num_rows;
            if (n < 3) {
                return KOPT_STATUS_ERROR_INVALID_INPUT;
            }
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = 0; j < n; ++j) {
                    if (i == j) {
                        continue;
                    }
                    const cost_t cost = problem.distances[i * n + j];
                    if (!std::isfinite(cost) || cost < 0) {
                        return KOPT_STATUS_ERROR_INVALID_INPUT;
                    }
                }
            }

            const bool is_symmetric = kopt::IsSymmetricMatrix(problem.distances, n);
            if (problem.problem_type == KOPT_PROBLEM_SYMMETRIC && !is_symmetric) {
                return KOPT_STATUS_ERROR_INVALID_INPUT;
            }
            shape.num_nodes = n;
            shape.symmetric = problem.problem_type != KOPT_PROBLEM_ASYMMETRIC && is_symmetric;
            return KOPT_STATUS_SUCCESS;
        }

        if (problem.rounding != KOPT_ROUND_NEAREST_INTEGER
            && problem.rounding != KOPT_ROUND_CEIL
            && problem.rounding != KOPT_ROUND_NONE) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        const size_t n = problem.num_coordinates;
        if (n < 3) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        for (size_t i = 0; i < n; ++i) {
            if (!std::isfinite(problem.coordinates[i].x) || !std::isfinite(problem.coordinates[i].y)) {
                return KOPT_STATUS_ERROR_INVALID_INPUT;
            }
        }
        shape.num_nodes = n;
        shape.symmetric = problem.problem_type != KOPT_PROBLEM_ASYMMETRIC;
        return KOPT_STATUS_SUCCESS;
    }

    KoptStatus ValidateOptions(const KoptSolverOptionsDescriptor &options) {
        if (options.runs < 1
            || options.candidate_count < 1
            || options.num_threads < 1
            || options.or_opt_max_segment < 1) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        if (options.candidate_set_type != KOPT_CANDIDATES_NEAREST_NEIGHBOR
            && options.candidate_set_type != KOPT_CANDIDATES_ALPHA_NEARNESS) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        if (options.initial_tour != KOPT_INIT_NEAREST_NEIGHBOR && options.initial_tour != KOPT_INIT_RANDOM) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        if (std::isnan(options.stop_at_cost)) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        return KOPT_STATUS_SUCCESS;
    }

    /// Converts the caller's tour into node indices. It must visit each of the num_nodes nodes exactly once.
    KoptStatus ReadInitialTour(const KoptSolutionDescriptor &initial_solution, const size_t num_nodes,
                               std::vector<node_idx> &tour) {
        if (initial_solution.tour == nullptr) {
            return KOPT_STATUS_ERROR_INVALID_ARG;
        }
        if (initial_solution.num_nodes != num_nodes) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        tour.clear();
        tour.reserve(num_nodes);
        for (size_t i = 0; i < num_nodes; ++i) {
            const nodeid_t node = initial_solution.tour[i];
            if (node >= num_nodes) {
                return KOPT_STATUS_ERROR_INVALID_INPUT;
            }
            tour.push_back(static_cast<node_idx>(node));
        }
        if (!kopt::IsPermutation(tour, num_nodes)) {
            return KOPT_STATUS_ERROR_INVALID_INPUT;
        }
        return KOPT_STATUS_SUCCESS;
    }

    kopt::run_controller_options_t ToRunControllerOptions(const KoptSolverOptionsDescriptor &options) {
        return kopt::run_controller_options_t{
            .runs = options.runs,
            .initial_tour = options.initial_tour,
            .seed = options.seed,
            .num_threads = options.num_threads,
            .time_limit_ms = options.time_limit_ms,
            .iteration_limit = options.iteration_limit,
            .stop_at_cost = options.stop_at_cost,
            .verbosity = options.verbosity,
            .local_search = {
                .enable_or_opt = options.enable_or_opt,
                .or_opt_max_segment = options.or_opt_max_segment,
                .enable_3opt = options.enable_3opt,
            },
        };
    }

    KoptStatus SolveProblem(const KoptProblemDescriptor &problem,
                            const KoptSolutionDescriptor *initial_solution,
                            const KoptSolverOptionsDescriptor &options,
                            KoptSolutionDescriptor &output_descriptor) {
        problem_shape_t shape{};
        if (const auto status = ::ValidateProblem(problem, shape); status != KOPT_STATUS_SUCCESS) {
            return status;
        }
        if (const auto status = ::ValidateOptions(options); status != KOPT_STATUS_SUCCESS) {
            return status;
        }

        std::vector<node_idx> initial_tour{};
        if (initial_solution != nullptr) {
            if (const auto status = ::ReadInitialTour(*initial_solution, shape.num_nodes, initial_tour);
                status != KOPT_STATUS_SUCCESS) {
                return status;
            }
        }

        const kopt::CostMatrix cost_matrix = problem.distances != nullptr
                                                 ? kopt::CostMatrix::FromDistances(
                                                     problem.distances, shape.num_nodes, shape.symmetric)
                                                 : kopt::CostMatrix::FromCoordinates(
                                                     problem.coordinates, shape.num_nodes, problem.rounding,
                                                     shape.symmetric);
        kopt::Trace(options.verbosity, 1, "{} problem with {} nodes",
                    shape.symmetric ? "symmetric" : "asymmetric", shape.num_nodes);

        kopt::CandidateSet candidate_set{};
        if (const auto status = kopt::CandidateSet::Build(cost_matrix, options.candidate_set_type,
                                                          options.candidate_count, candidate_set);
            status != KOPT_STATUS_SUCCESS) {
            return status;
        }

        kopt::RunController controller(cost_matrix, candidate_set, ::ToRunControllerOptions(options));
        kopt::run_result_t result{};
        const KoptStatus status = controller.Solve(initial_solution != nullptr ? &initial_tour : nullptr, result);
        if (status != KOPT_STATUS_SUCCESS && status != KOPT_STATUS_CANCELLED) {
            return status;
        }
        if (!kopt::IsPermutation(result.best_tour, shape.num_nodes)) {
            return KOPT_STATUS_ERROR_INTERNAL;
        }

        // report the tour starting at node 0
        std::ranges::rotate(result.best_tour, std::ranges::find(result.best_tour, 0));

        const cost_t best_cost = result.best_cost;

        output_descriptor.num_nodes = result.best_tour.size();
        output_descriptor.solution_cost = best_cost;
        output_descriptor.initial_cost = result.initial_cost;
        output_descriptor.runs_completed = result.runs_completed;
        if (initial_solution == nullptr) {
            output_descriptor.solution_type = KOPT_SOLUTION_TYPE_APPROXIMATE;
        } else if (best_cost < result.initial_cost - kopt::MIN_IMPROVEMENT_GAIN) {
            output_descriptor.solution_type = KOPT_SOLUTION_TYPE_IMPROVED;
        } else {
            output_descriptor.solution_type = KOPT_SOLUTION_TYPE_NO_IMPROVEMENT;
        }
        output_descriptor.tour = new nodeid_t[result.best_tour.size()];
        std::ranges::copy(result.best_tour, output_descriptor.tour);
        return status;
    }

    KoptStatus SolveGuarded(const KoptProblemDescriptor &problem,
                            const KoptSolutionDescriptor *initial_solution,
                            const KoptSolverOptionsDescriptor &options,
                            KoptSolutionDescriptor &output_descriptor) {
        try {
            return ::SolveProblem(problem, initial_solution, options, output_descriptor);
        } catch (const std::bad_alloc &) {
            return KOPT_STATUS_OUT_OF_MEMORY;
        } catch (const std::system_error &error) {
            // thread creation failed
            kopt::Trace(options.verbosity, 1, "internal error: {}", error.what());
            return KOPT_STATUS_ERROR_INTERNAL;
        }
    }
} // end anonymous namespace

KoptStatus koptSolve(const KoptProblemDescriptor *problem,
                     const KoptSolverOptionsDescriptor *solver_options,
                     KoptSolutionDescriptor *output_descriptor) {
    if (problem == nullptr || output_descriptor == nullptr || solver_options == nullptr) {
        return KOPT_STATUS_ERROR_INVALID_ARG;
    }
    return ::SolveGuarded(*problem, nullptr, *solver_options, *output_descriptor);
}

KoptStatus koptImproveSolution(const KoptProblemDescriptor *problem,
                               const KoptSolutionDescriptor *initial_solution,
                               const KoptSolverOptionsDescriptor *solver_options,
                               KoptSolutionDescriptor *output_descriptor) {
    if (problem == nullptr || initial_solution == nullptr || output_descriptor == nullptr
        || solver_options == nullptr) {
        return KOPT_STATUS_ERROR_INVALID_ARG;
    }
    return ::SolveGuarded(*problem, initial_solution, *solver_options, *output_descriptor);
}

void koptDisposeSolution(KoptSolutionDescriptor *solution) {
    if (solution == nullptr) {
        return;
    }
    delete[] solution->tour;
    *solution = KoptSolutionDescriptor{};
}

const char *koptStatusString(const KoptStatus status) {
    switch (status) {
        case KOPT_STATUS_SUCCESS:
            return "success";
        case KOPT_STATUS_ERROR_INVALID_INPUT:
            return "invalid input";
        case KOPT_STATUS_ERROR_INVALID_ARG:
            return "invalid argument";
        case KOPT_STATUS_ERROR_INFEASIBLE_CANDIDATE_SET:
            return "infeasible candidate set";
        case KOPT_STATUS_CANCELLED:
            return "cancelled";
        case KOPT_STATUS_OUT_OF_MEMORY:
            return "out of memory";
        case KOPT_STATUS_ERROR_INTERNAL:
            return "internal error";
    }
    return "unknown status";
}
