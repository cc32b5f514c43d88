#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>
#include <libkopt.h>

static std::vector<KoptCoordinate2D> createRandomPoints(const size_t n, const double max_coordinate) {
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution dist(0.0, max_coordinate);

    std::vector<KoptCoordinate2D> points{};
    points.reserve(n);
    for (size_t i = 0; i < n; i++) {
        points.push_back({.x = dist(rng), .y = dist(rng)});
    }
    return points;
}

static void freeOutput(KoptSolutionDescriptor &output) {
    koptDisposeSolution(&output);
}

int main(const int argc, const char **argv) {
    KoptSolverOptionsDescriptor options{.runs = 10};
    if (argc > 1) {
        if (const KoptStatus status = koptParseOptionsJson(argv[1], &options); status != KOPT_STATUS_SUCCESS) {
            std::cerr << "Error: could not read options: " << koptStatusString(status) << std::endl;
            return 1;
        }
    }

    for (const std::vector<size_t> test_sizes{100, 200, 500, 1000, 2000, 5000}; const auto n: test_sizes) {
        const std::vector<KoptCoordinate2D> points = createRandomPoints(n, 1'000'000.0);
        KoptProblemDescriptor problem{};
        problem.coordinates = points.data();
        problem.num_coordinates = points.size();

        constexpr size_t iterations = 3;
        long long total_ns = 0;
        double total_gap = 0;

        for (size_t i = 0; i < iterations; i++) {
            KoptSolutionDescriptor output{};

            auto start = std::chrono::steady_clock::now();
            const KoptStatus status = koptSolve(&problem, &options, &output);
            if (status != KOPT_STATUS_SUCCESS && status != KOPT_STATUS_CANCELLED) {
                std::cerr << "Error: koptSolve returned " << koptStatusString(status) << std::endl;
                freeOutput(output);
                return 1;
            }
            auto end = std::chrono::steady_clock::now();

            total_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
            total_gap += (output.initial_cost - output.solution_cost) / output.initial_cost;

            freeOutput(output);
        }

        const double avg_ms = (static_cast<double>(total_ns) / iterations) / 1e6;

        // Print a summary for this n
        std::cout << "N = " << n
                  << ", Average Solve Time = " << std::fixed << std::setprecision(3) << avg_ms
                  << " ms, Average Improvement over Initial Tour = " << std::setprecision(2)
                  << total_gap / iterations * 100 << "% (over " << iterations << " runs)" << std::endl;
    }

    return 0;
}
