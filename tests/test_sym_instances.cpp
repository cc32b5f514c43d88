#include <gtest/gtest.h>
#include <libkopt.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * Loads the symmetric instances from "sym_instances.json" and runs the solver for each one.
 * The brute-forced optimum bounds the result from below; the solver has to come within 2% of it.
 */
TEST(KoptSolverJsonTest, SymmetricInstances) {
    using nlohmann::json;

    const std::string path = std::string(KOPT_TEST_DATA_DIR) + "/sym_instances.json";
    std::ifstream in_file(path);
    ASSERT_TRUE(in_file.is_open()) << "Could not open " << path << " for reading.";

    json test_data;
    in_file >> test_data;
    in_file.close();

    for (const auto &instance: test_data) {
        // {
        //   "description": "Euclidean instance with N=5",
        //   "n": 5,
        //   "distances": [[...], ...],
        //   "solution": {"path": [...], "num_nodes": 5, "solution_cost": 2255.228}
        // }
        const auto description = instance["description"].get<std::string>();
        SCOPED_TRACE("Testing instance: " + description);

        const auto n = instance["n"].get<size_t>();
        std::vector<cost_t> distances{};
        distances.reserve(n * n);
        for (const auto &row: instance["distances"]) {
            for (const auto &cost: row) {
                distances.push_back(cost.get<cost_t>());
            }
        }
        ASSERT_EQ(distances.size(), n * n);

        KoptProblemDescriptor problem{};
        problem.distances = distances.data();
        problem.num_rows = n;
        problem.num_cols = n;
        problem.problem_type = KOPT_PROBLEM_SYMMETRIC;

        constexpr KoptSolverOptionsDescriptor options{.runs = 20, .seed = 0};
        KoptSolutionDescriptor output{};

        const auto start = std::chrono::steady_clock::now();
        const KoptStatus status = koptSolve(&problem, &options, &output);
        const auto end = std::chrono::steady_clock::now();
        ASSERT_EQ(status, KOPT_STATUS_SUCCESS) << "Solver did not return SUCCESS for instance: " << description;

        const auto &solution = instance["solution"];
        const double optimal_cost = solution["solution_cost"].get<double>();
        ASSERT_EQ(output.num_nodes, solution["num_nodes"].get<size_t>());

        // the tour visits every node exactly once
        std::unordered_set<nodeid_t> visited{};
        for (size_t i = 0; i < output.num_nodes; ++i) {
            EXPECT_TRUE(visited.insert(output.tour[i]).second)
                << "Path contains duplicate node ID for instance: " << description;
        }

        // the reported cost matches the tour
        double path_cost = 0;
        for (size_t i = 0; i < output.num_nodes; ++i) {
            path_cost += distances[output.tour[i] * n + output.tour[(i + 1) % n]];
        }
        EXPECT_NEAR(path_cost, output.solution_cost, 1e-6) << "Path cost mismatch for instance: " << description;

        EXPECT_GE(output.solution_cost, optimal_cost - 1e-6);
        EXPECT_LE(output.solution_cost, optimal_cost * 1.02) << "Cost mismatch for instance: " << description;

        std::cout << "Solved \"" << description << "\" with error: " << output.solution_cost - optimal_cost << " ("
                << std::fixed << std::setprecision(2) << (output.solution_cost - optimal_cost) / optimal_cost * 100
                << "%) in " << std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() << "us"
                << std::endl;

        koptDisposeSolution(&output);
    }
}
