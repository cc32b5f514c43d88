#include <gtest/gtest.h>
#include <libkopt.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <numeric>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

// Helper function to flatten a square matrix into the row-major layout the solver expects.
static std::vector<cost_t> flatten(const std::vector<std::vector<cost_t>> &matrix) {
    std::vector<cost_t> flat{};
    for (const auto &row: matrix) {
        flat.insert(flat.end(), row.begin(), row.end());
    }
    return flat;
}

static KoptProblemDescriptor createMatrixProblem(const std::vector<cost_t> &flat, const size_t n,
                                                 const KoptProblemType type = KOPT_PROBLEM_AUTO) {
    KoptProblemDescriptor problem{};
    problem.distances = flat.data();
    problem.num_rows = n;
    problem.num_cols = n;
    problem.problem_type = type;
    return problem;
}

static KoptProblemDescriptor createCoordinateProblem(const std::vector<KoptCoordinate2D> &points,
                                                     const KoptEuclideanRounding rounding) {
    KoptProblemDescriptor problem{};
    problem.coordinates = points.data();
    problem.num_coordinates = points.size();
    problem.rounding = rounding;
    return problem;
}

// Points on a circle; the optimal tour visits them in index order.
static std::vector<KoptCoordinate2D> createCircle(const size_t n, const double radius) {
    std::vector<KoptCoordinate2D> points{};
    for (size_t i = 0; i < n; ++i) {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(n);
        points.push_back({.x = radius * std::cos(angle), .y = radius * std::sin(angle)});
    }
    return points;
}

static double circlePerimeter(const std::vector<KoptCoordinate2D> &points) {
    double cost = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        const auto &a = points[i];
        const auto &b = points[(i + 1) % points.size()];
        cost += std::hypot(a.x - b.x, a.y - b.y);
    }
    return cost;
}

// Asserts that the solution is a permutation starting at node 0 and returns its cost under the matrix.
static double checkTour(const KoptSolutionDescriptor &solution, const std::vector<cost_t> &flat, const size_t n) {
    EXPECT_EQ(solution.num_nodes, n);
    EXPECT_NE(solution.tour, nullptr);
    if (solution.tour == nullptr || solution.num_nodes != n) {
        return -1;
    }
    EXPECT_EQ(solution.tour[0], 0u);
    std::unordered_set<nodeid_t> visited{};
    double cost = 0;
    for (size_t i = 0; i < n; ++i) {
        EXPECT_LT(solution.tour[i], n);
        EXPECT_TRUE(visited.insert(solution.tour[i]).second) << "duplicate node " << solution.tour[i];
        if (!flat.empty()) {
            cost += flat[solution.tour[i] * n + solution.tour[(i + 1) % n]];
        }
    }
    return cost;
}

TEST(KoptSolverTest, NullArguments) {
    EXPECT_EQ(koptSolve(nullptr, nullptr, nullptr), KOPT_STATUS_ERROR_INVALID_ARG);

    KoptSolutionDescriptor output{};
    EXPECT_EQ(koptSolve(nullptr, nullptr, &output), KOPT_STATUS_ERROR_INVALID_ARG);

    constexpr KoptSolverOptionsDescriptor options{.runs = 1, .seed = 42};
    EXPECT_EQ(koptSolve(nullptr, &options, nullptr), KOPT_STATUS_ERROR_INVALID_ARG);

    KoptProblemDescriptor problem{};
    EXPECT_EQ(koptImproveSolution(&problem, nullptr, &options, &output), KOPT_STATUS_ERROR_INVALID_ARG);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, NeitherOrBothInputs) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2}, {1, 0, 3}, {2, 3, 0}});
    const std::vector<KoptCoordinate2D> points{{0, 0}, {1, 0}, {0, 1}};
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};

    KoptProblemDescriptor empty{};
    EXPECT_EQ(koptSolve(&empty, &options, &output), KOPT_STATUS_ERROR_INVALID_ARG);

    KoptProblemDescriptor both = createMatrixProblem(flat, 3);
    both.coordinates = points.data();
    both.num_coordinates = points.size();
    EXPECT_EQ(koptSolve(&both, &options, &output), KOPT_STATUS_ERROR_INVALID_ARG);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, ZeroRunsIsInvalidInput) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2}, {1, 0, 3}, {2, 3, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 3);
    constexpr KoptSolverOptionsDescriptor options{.runs = 0};
    KoptSolutionDescriptor output{};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, TwoNodesIsInvalidInput) {
    const std::vector<cost_t> flat = flatten({{0, 1}, {1, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 2);
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    const std::vector<KoptCoordinate2D> points{{0, 0}, {1, 1}};
    const KoptProblemDescriptor coordinates = createCoordinateProblem(points, KOPT_ROUND_NONE);
    EXPECT_EQ(koptSolve(&coordinates, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, NonSquareMatrix) {
    const std::vector<cost_t> flat(12, 1.0);
    KoptProblemDescriptor problem{};
    problem.distances = flat.data();
    problem.num_rows = 3;
    problem.num_cols = 4;
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);
}

TEST(KoptSolverTest, BadMatrixEntries) {
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};

    const std::vector<cost_t> negative = flatten({{0, -1, 2}, {1, 0, 3}, {2, 3, 0}});
    KoptProblemDescriptor problem = createMatrixProblem(negative, 3);
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    const std::vector<cost_t> not_a_number = flatten({{0, 1, 2}, {NAN, 0, 3}, {2, 3, 0}});
    problem = createMatrixProblem(not_a_number, 3);
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    const std::vector<cost_t> infinite = flatten({{0, 1, 2}, {1, 0, INFINITY}, {2, 3, 0}});
    problem = createMatrixProblem(infinite, 3);
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    // the diagonal is ignored
    const std::vector<cost_t> diagonal = flatten({{-5, 1, 2}, {1, NAN, 3}, {2, 3, 7}});
    problem = createMatrixProblem(diagonal, 3);
    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
    EXPECT_DOUBLE_EQ(output.solution_cost, 6.0);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, SymmetricRequestedOnAsymmetricMatrix) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2}, {5, 0, 3}, {2, 3, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 3, KOPT_PROBLEM_SYMMETRIC);
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);
}

TEST(KoptSolverTest, InvalidOptions) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2}, {1, 0, 3}, {2, 3, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 3);
    KoptSolutionDescriptor output{};

    KoptSolverOptionsDescriptor options{.candidate_count = 0};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    options = {.num_threads = 0};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    options = {.or_opt_max_segment = 0};
    EXPECT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, ThreeNodeAsymmetricWithZeroEdges) {
    const std::vector<cost_t> flat = flatten({{0, 4, 0}, {0, 0, 5}, {0, 0, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 3);
    constexpr KoptSolverOptionsDescriptor options{.seed = 7};
    KoptSolutionDescriptor output{};

    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
    const double cost = checkTour(output, flat, 3);
    EXPECT_DOUBLE_EQ(output.solution_cost, cost);

    // 0 -> 2 -> 1 -> 0 uses only zero cost edges; the other orientation costs 4 + 5 + 0
    EXPECT_DOUBLE_EQ(output.solution_cost, 0.0);
    EXPECT_EQ(output.tour[1], 2u);
    EXPECT_EQ(output.tour[2], 1u);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, ThreeCoordinates) {
    const std::vector<KoptCoordinate2D> points{{0, 0}, {0, 4}, {5, 0}};
    constexpr KoptSolverOptionsDescriptor options{};

    {
        const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
        KoptSolutionDescriptor output{};
        ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
        checkTour(output, {}, 3);
        EXPECT_NEAR(output.solution_cost, 4.0 + std::sqrt(41.0) + 5.0, 1e-9);
        koptDisposeSolution(&output);
    }
    {
        // sqrt(41) rounds to 6
        const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NEAREST_INTEGER);
        KoptSolutionDescriptor output{};
        ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
        EXPECT_DOUBLE_EQ(output.solution_cost, 15.0);
        koptDisposeSolution(&output);
    }
    {
        const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_CEIL);
        KoptSolutionDescriptor output{};
        ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
        EXPECT_DOUBLE_EQ(output.solution_cost, 16.0);
        koptDisposeSolution(&output);
    }
}

TEST(KoptSolverTest, FixedSeedIsDeterministic) {
    const std::vector<KoptCoordinate2D> points = [] {
        std::vector<KoptCoordinate2D> result{};
        std::mt19937_64 rng(1234);
        std::uniform_real_distribution dist(0.0, 1000.0);
        for (size_t i = 0; i < 150; ++i) {
            result.push_back({.x = dist(rng), .y = dist(rng)});
        }
        return result;
    }();
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);

    for (const uint32_t threads: {1u, 4u}) {
        SCOPED_TRACE("threads: " + std::to_string(threads));
        const KoptSolverOptionsDescriptor options{.runs = 8, .seed = 99, .num_threads = threads};

        KoptSolutionDescriptor first{};
        KoptSolutionDescriptor second{};
        ASSERT_EQ(koptSolve(&problem, &options, &first), KOPT_STATUS_SUCCESS);
        ASSERT_EQ(koptSolve(&problem, &options, &second), KOPT_STATUS_SUCCESS);

        ASSERT_EQ(first.num_nodes, second.num_nodes);
        EXPECT_EQ(first.solution_cost, second.solution_cost);
        EXPECT_TRUE(std::equal(first.tour, first.tour + first.num_nodes, second.tour));
        EXPECT_EQ(first.runs_completed, 8u);
        EXPECT_LE(first.solution_cost, first.initial_cost);

        koptDisposeSolution(&first);
        koptDisposeSolution(&second);
    }
}

TEST(KoptSolverTest, ZeroTimeLimitIsCancelledWithTour) {
    const std::vector<KoptCoordinate2D> points = createCircle(40, 100.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
    constexpr KoptSolverOptionsDescriptor options{.initial_tour = KOPT_INIT_RANDOM, .time_limit_ms = 0};
    KoptSolutionDescriptor output{};

    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_CANCELLED);
    checkTour(output, {}, points.size());
    EXPECT_EQ(output.runs_completed, 0u);
    EXPECT_NEAR(output.solution_cost, output.initial_cost, 1e-9);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, ZeroIterationLimitIsCancelledWithTour) {
    const std::vector<KoptCoordinate2D> points = createCircle(40, 100.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
    constexpr KoptSolverOptionsDescriptor options{.iteration_limit = 0, .num_threads = 2};
    KoptSolutionDescriptor output{};

    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_CANCELLED);
    checkTour(output, {}, points.size());
    EXPECT_EQ(output.runs_completed, 0u);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, StopAtCostEndsEarly) {
    const std::vector<KoptCoordinate2D> points = createCircle(30, 100.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
    constexpr KoptSolverOptionsDescriptor options{.runs = 50, .stop_at_cost = 1e12};
    KoptSolutionDescriptor output{};

    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
    EXPECT_EQ(output.runs_completed, 1u);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, SolvesCircleFromRandomTours) {
    const std::vector<KoptCoordinate2D> points = createCircle(64, 500.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);

    for (const auto candidates: {KOPT_CANDIDATES_NEAREST_NEIGHBOR, KOPT_CANDIDATES_ALPHA_NEARNESS}) {
        const KoptSolverOptionsDescriptor options{
            .runs = 5, .candidate_set_type = candidates, .initial_tour = KOPT_INIT_RANDOM
        };
        KoptSolutionDescriptor output{};
        ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
        checkTour(output, {}, points.size());
        EXPECT_GE(output.solution_cost, circlePerimeter(points) - 1e-6);
        EXPECT_LE(output.solution_cost, 1.05 * circlePerimeter(points));
        EXPECT_LT(output.solution_cost, output.initial_cost);
        EXPECT_EQ(output.solution_type, KOPT_SOLUTION_TYPE_APPROXIMATE);
        koptDisposeSolution(&output);
    }
}

TEST(KoptSolverTest, ImproveOptimalTourReportsNoImprovement) {
    const std::vector<KoptCoordinate2D> points = createCircle(12, 50.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
    constexpr KoptSolverOptionsDescriptor options{.runs = 3};

    std::vector<nodeid_t> tour(points.size());
    std::iota(tour.begin(), tour.end(), 0);
    KoptSolutionDescriptor initial{};
    initial.tour = tour.data();
    initial.num_nodes = tour.size();

    KoptSolutionDescriptor output{};
    ASSERT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_SUCCESS);
    EXPECT_EQ(output.solution_type, KOPT_SOLUTION_TYPE_NO_IMPROVEMENT);
    EXPECT_NEAR(output.initial_cost, circlePerimeter(points), 1e-9);
    EXPECT_NEAR(output.solution_cost, circlePerimeter(points), 1e-9);
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, ImproveCrossingTour) {
    const std::vector<KoptCoordinate2D> points = createCircle(12, 50.0);
    const KoptProblemDescriptor problem = createCoordinateProblem(points, KOPT_ROUND_NONE);
    constexpr KoptSolverOptionsDescriptor options{.runs = 3};

    std::vector<nodeid_t> tour{0, 6, 1, 7, 2, 8, 3, 9, 4, 10, 5, 11};
    KoptSolutionDescriptor initial{};
    initial.tour = tour.data();
    initial.num_nodes = tour.size();

    KoptSolutionDescriptor output{};
    ASSERT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_SUCCESS);
    EXPECT_EQ(output.solution_type, KOPT_SOLUTION_TYPE_IMPROVED);
    EXPECT_GT(output.initial_cost, output.solution_cost);
    EXPECT_GE(output.solution_cost, circlePerimeter(points) - 1e-6);
    EXPECT_LE(output.solution_cost, 1.05 * circlePerimeter(points));
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, ImproveRejectsBadTour) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2, 3}, {1, 0, 3, 4}, {2, 3, 0, 5}, {3, 4, 5, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 4);
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};

    std::vector<nodeid_t> duplicate{0, 1, 1, 3};
    KoptSolutionDescriptor initial{};
    initial.tour = duplicate.data();
    initial.num_nodes = duplicate.size();
    EXPECT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    std::vector<nodeid_t> out_of_range{0, 1, 2, 4};
    initial.tour = out_of_range.data();
    EXPECT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    std::vector<nodeid_t> too_short{0, 1, 2};
    initial.tour = too_short.data();
    initial.num_nodes = too_short.size();
    EXPECT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_ERROR_INVALID_INPUT);

    initial.tour = nullptr;
    initial.num_nodes = 4;
    EXPECT_EQ(koptImproveSolution(&problem, &initial, &options, &output), KOPT_STATUS_ERROR_INVALID_ARG);
    EXPECT_EQ(output.tour, nullptr);
}

TEST(KoptSolverTest, ForcedAsymmetricOnSymmetricMatrix) {
    const std::vector<KoptCoordinate2D> points = createCircle(20, 10.0);
    std::vector<cost_t> flat(points.size() * points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = 0; j < points.size(); ++j) {
            flat[i * points.size() + j] = std::hypot(points[i].x - points[j].x, points[i].y - points[j].y);
        }
    }
    const KoptProblemDescriptor problem = createMatrixProblem(flat, points.size(), KOPT_PROBLEM_ASYMMETRIC);
    constexpr KoptSolverOptionsDescriptor options{.runs = 20};
    KoptSolutionDescriptor output{};

    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);
    const double cost = checkTour(output, flat, points.size());
    EXPECT_NEAR(output.solution_cost, cost, 1e-9);
    EXPECT_NEAR(output.solution_cost, circlePerimeter(points), 0.05 * circlePerimeter(points));
    koptDisposeSolution(&output);
}

TEST(KoptSolverTest, DisposeResetsSolution) {
    const std::vector<cost_t> flat = flatten({{0, 1, 2}, {1, 0, 3}, {2, 3, 0}});
    const KoptProblemDescriptor problem = createMatrixProblem(flat, 3);
    constexpr KoptSolverOptionsDescriptor options{};
    KoptSolutionDescriptor output{};
    ASSERT_EQ(koptSolve(&problem, &options, &output), KOPT_STATUS_SUCCESS);

    koptDisposeSolution(&output);
    EXPECT_EQ(output.tour, nullptr);
    EXPECT_EQ(output.num_nodes, 0u);
    koptDisposeSolution(nullptr);
}

TEST(KoptSolverTest, StatusStrings) {
    EXPECT_STREQ(koptStatusString(KOPT_STATUS_SUCCESS), "success");
    EXPECT_STREQ(koptStatusString(KOPT_STATUS_ERROR_INVALID_INPUT), "invalid input");
    EXPECT_STREQ(koptStatusString(KOPT_STATUS_CANCELLED), "cancelled");
    EXPECT_STREQ(koptStatusString(static_cast<KoptStatus>(42)), "unknown status");
}
