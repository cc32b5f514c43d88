#pragma once

#ifndef __cplusplus
#include <stdint.h>
#include <stddef.h>
#else
#include <cstdint>
#include <cstddef>
#endif


#define KOPT_EXPORT extern "C"

typedef enum KoptResult {
    KOPT_STATUS_SUCCESS = 0, /**< Operation completed successfully. */
    KOPT_STATUS_ERROR_INVALID_INPUT = 1, /**< The problem or the solver configuration is invalid. */
    KOPT_STATUS_ERROR_INVALID_ARG = 2, /**< Invalid argument provided. */
    KOPT_STATUS_ERROR_INFEASIBLE_CANDIDATE_SET = 3, /**< Some node ended up without candidate edges. */
    KOPT_STATUS_CANCELLED = 4, /**< The time or iteration budget ran out. The best tour so far is still returned. */
    KOPT_STATUS_OUT_OF_MEMORY = 5, /**< Out of memory. */
    KOPT_STATUS_ERROR_INTERNAL = 6 /**< An internal error occurred. */
} KoptStatus;

typedef double cost_t;
typedef uint64_t nodeid_t;

/**
 * A point in the plane.
 */
typedef struct KoptCoordinate2D {
    double x = 0.0;
    double y = 0.0;
} KoptCoordinate2D;

/**
 * How the costs of a problem are interpreted.
 */
typedef enum KoptProblemType {
    /**
     * Detects symmetry from the distance matrix. Coordinates are always symmetric.
     */
    KOPT_PROBLEM_AUTO = 0,

    /**
     * Requires cost(i, j) == cost(j, i) for every pair.
     */
    KOPT_PROBLEM_SYMMETRIC = 1,

    /**
     * Treats every cost as directed, even if the matrix happens to be symmetric.
     */
    KOPT_PROBLEM_ASYMMETRIC = 2
} KoptProblemType;

/**
 * Rounding applied to Euclidean distances computed from coordinates.
 */
typedef enum KoptEuclideanRounding {
    /**
     * Rounds to the nearest integer (TSPLIB EUC_2D).
     */
    KOPT_ROUND_NEAREST_INTEGER = 0,

    /**
     * Rounds up to the next integer (TSPLIB CEIL_2D).
     */
    KOPT_ROUND_CEIL = 1,

    /**
     * Uses the exact distance.
     */
    KOPT_ROUND_NONE = 2
} KoptEuclideanRounding;

/**
 * Input descriptor to the solver.
 * Exactly one of distances or coordinates must be provided.
 */
typedef struct KoptProblemDescriptor {
    /**
     * Row-major distance matrix. distances[i * num_cols + j] is the cost of travelling from node i to node j.
     * Off-diagonal entries must be finite and non-negative. The diagonal is ignored.
     */
    const cost_t *distances{};

    /**
     * The number of rows of the distance matrix.
     */
    size_t num_rows{};

    /**
     * The number of columns of the distance matrix. Must be equal to num_rows.
     */
    size_t num_cols{};

    /**
     * Node coordinates. The cost between two nodes is their (rounded) Euclidean distance.
     */
    const KoptCoordinate2D *coordinates{};

    /**
     * The number of elements in the coordinates array.
     */
    size_t num_coordinates{};

    /**
     * Whether the problem is symmetric, asymmetric, or should be detected.
     */
    KoptProblemType problem_type = KOPT_PROBLEM_AUTO;

    /**
     * Rounding of Euclidean distances. Only meaningful with coordinates.
     */
    KoptEuclideanRounding rounding = KOPT_ROUND_NEAREST_INTEGER;
} KoptProblemDescriptor;

/**
 * The type of solution returned by the solver
 */
typedef enum KoptSolutionType {
    /**
     * The solution is approximate.
     */
    KOPT_SOLUTION_TYPE_APPROXIMATE = 0,

    /**
     * When requesting an improved solution, whether the solution was actually improved.
     */
    KOPT_SOLUTION_TYPE_IMPROVED = 1,

    /**
     * When requesting an improved solution, whether the solution could not be improved.
     */
    KOPT_SOLUTION_TYPE_NO_IMPROVEMENT = 2
} KoptSolutionType;

typedef struct KoptSolutionDescriptor {
    /**
     * The tour as an array of zero-based node indices, starting at node 0.
     * An implicit wrap-around edge is assumed from tour[n-1] to tour[0].
     */
    nodeid_t *tour{};

    /**
     * The number of elements in the tour array.
     * Num nodes will be equal to the number of nodes in the problem for a valid solution.
     */
    size_t num_nodes{};

    /**
     * The cost of the solution, including the wrap-around edge from tour[n-1] to tour[0].
     */
    cost_t solution_cost{};

    /**
     * The cost of the first tour the solver started from (constructed or provided), before any local search.
     */
    cost_t initial_cost{};

    /**
     * The number of runs that completed before the solver stopped.
     */
    uint32_t runs_completed{};

    /**
     * The type of the solution.
     */
    KoptSolutionType solution_type{};
} KoptSolutionDescriptor;

/**
 * How the candidate edges of each node are ranked.
 */
typedef enum KoptCandidateSetType {
    /**
     * The nearest nodes by cost. Ties are broken by lower node index.
     */
    KOPT_CANDIDATES_NEAREST_NEIGHBOR = 0,

    /**
     * The nodes with the smallest alpha value with respect to a minimum spanning tree.
     * Falls back to nearest neighbor for asymmetric problems.
     */
    KOPT_CANDIDATES_ALPHA_NEARNESS = 1
} KoptCandidateSetType;

/**
 * A simple enum for choosing the initial-constructive heuristic of the first run.
 */
typedef enum KoptInitialTour {
    /**
     * Uses the nearest neighbor heuristic from a random starting node.
     */
    KOPT_INIT_NEAREST_NEIGHBOR = 0,

    /**
     * Uses a random initial tour.
     */
    KOPT_INIT_RANDOM = 1
} KoptInitialTour;

/**
 * Solver configuration descriptor.
 */
typedef struct KoptSolverOptionsDescriptor {
    /**
     * The number of runs. The first run starts from a constructed tour, every later run
     * from a double-bridge kick of the best tour found so far. Must be at least 1.
     */
    uint32_t runs = 10;

    /**
     * The maximum number of candidate edges per node. Must be at least 1.
     */
    uint32_t candidate_count = 8;

    /**
     * How candidate edges are ranked.
     */
    KoptCandidateSetType candidate_set_type = KOPT_CANDIDATES_NEAREST_NEIGHBOR;

    /**
     * Which initial heuristic to use for the first run.
     */
    KoptInitialTour initial_tour = KOPT_INIT_NEAREST_NEIGHBOR;

    /**
     * The seed for the random number generator
     */
    uint64_t seed = 1;

    /**
     * Wall clock budget in milliseconds. UINT64_MAX disables the limit.
     */
    uint64_t time_limit_ms = UINT64_MAX;

    /**
     * Budget of local search scan iterations over the whole solve. UINT64_MAX disables the limit.
     */
    uint64_t iteration_limit = UINT64_MAX;

    /**
     * The number of worker threads runs are distributed over. Must be at least 1.
     */
    uint32_t num_threads = 1;

    /**
     * Whether to perform Or-opt moves during the local search.
     */
    bool enable_or_opt = true;

    /**
     * The longest segment an Or-opt move relocates. Must be at least 1.
     */
    uint32_t or_opt_max_segment = 3;

    /**
     * Whether to perform segment exchange 3-Opt moves during the local search.
     */
    bool enable_3opt = true;

    /**
     * Stop as soon as a tour of at most this cost is found. Negative values disable the check.
     */
    cost_t stop_at_cost = -1;

    /**
     * 0 is silent, 1 reports every run on stderr, 2 also reports search statistics.
     */
    uint32_t verbosity = 0;
} KoptSolverOptionsDescriptor;

/**
 * Solves the (a)symmetric TSP problem described by the given problem heuristically.
 * On KOPT_STATUS_SUCCESS and KOPT_STATUS_CANCELLED the solution descriptor holds a tour
 * that must be released with koptDisposeSolution.
 * @param problem the input problem
 * @param solver_options options to configure the solver
 * @param output_descriptor the output descriptor to write the solution to
 * @return the result status of the operation
 */
KOPT_EXPORT KoptStatus koptSolve(const KoptProblemDescriptor *problem,
                                 const KoptSolverOptionsDescriptor *solver_options,
                                 KoptSolutionDescriptor *output_descriptor);

/**
 * Improves upon an existing tour provided for the given problem.
 * The first run starts from the initial solution instead of a constructed tour.
 * @param problem the input problem
 * @param initial_solution the initial solution to improve upon; only tour and num_nodes are read
 * @param solver_options options to configure the solver
 * @param output_descriptor the output descriptor to write the solution to
 * @return the result status of the operation
 */
KOPT_EXPORT KoptStatus koptImproveSolution(const KoptProblemDescriptor *problem,
                                           const KoptSolutionDescriptor *initial_solution,
                                           const KoptSolverOptionsDescriptor *solver_options,
                                           KoptSolutionDescriptor *output_descriptor);

/**
 * Releases the tour owned by a solution descriptor and resets it.
 */
KOPT_EXPORT void koptDisposeSolution(KoptSolutionDescriptor *solution);

/**
 * Returns a static, human readable name for a status.
 */
KOPT_EXPORT const char *koptStatusString(KoptStatus status);

/**
 * Reads solver options from a JSON object. Keys absent from the document keep their current value.
 * On failure the options are left untouched.
 * @param json null-terminated JSON text
 * @param solver_options the options to update
 * @return KOPT_STATUS_ERROR_INVALID_ARG if the text is not a JSON object of known keys with the right types
 */
KOPT_EXPORT KoptStatus koptParseOptionsJson(const char *json, KoptSolverOptionsDescriptor *solver_options);
