#include "construction.h"

#include <algorithm>
#include <numeric>

namespace kopt {
    std::vector<node_idx> GenerateRandomTour(const size_t num_nodes, std::mt19937_64 &rng) {
        std::vector<node_idx> tour(num_nodes);
        std::iota(tour.begin(), tour.end(), 0);
        std::ranges::shuffle(tour, rng);
        return tour;
    }

    std::vector<node_idx> GetNearestNeighborTour(const CostMatrix &cost_matrix, std::mt19937_64 &rng) {
        const auto n = static_cast<node_idx>(cost_matrix.num_nodes);
        std::vector<node_idx> tour{};
        tour.reserve(n);
        if (n == 0) {
            return tour;
        }
        std::vector<char> visited(n, 0);

        // pick random starting point
        std::uniform_int_distribution<node_idx> dist(0, n - 1);
        const node_idx starting_point = dist(rng);
        tour.push_back(starting_point);
        visited[starting_point] = 1;

        // build the tour
        while (static_cast<node_idx>(tour.size()) < n) {
            const node_idx last_node = tour.back();
            cost_t min_cost = COST_POSITIVE_INFINITY;
            node_idx nearest_node = -1;
            for (node_idx node = 0; node < n; ++node) {
                if (visited[node]) {
                    continue;
                }
                const cost_t cost = cost_matrix.get_cost(last_node, node);
                if (nearest_node == -1 || cost < min_cost) {
                    min_cost = cost;
                    nearest_node = node;
                }
            }
            tour.push_back(nearest_node);
            visited[nearest_node] = 1;
        }
        return tour;
    }

    std::vector<node_idx> DoubleBridgeKick(const std::vector<node_idx> &tour, std::mt19937_64 &rng) {
        const size_t n = tour.size();
        if (n < 4) {
            return GenerateRandomTour(n, rng);
        }

        std::uniform_int_distribution<size_t> rotation(0, n - 1);
        std::vector<node_idx> rotated(n);
        std::rotate_copy(tour.begin(), tour.begin() + static_cast<std::ptrdiff_t>(rotation(rng)), tour.end(),
                         rotated.begin());

        // 3 * max(1, n / 4) < n, so D is never empty
        std::uniform_int_distribution<size_t> segment_length(1, std::max<size_t>(1, n / 4));
        const size_t a = segment_length(rng);
        const size_t b = a + segment_length(rng);
        const size_t c = b + segment_length(rng);

        std::vector<node_idx> kicked{};
        kicked.reserve(n);
        const auto at = [&rotated](const size_t pos) {
            return rotated.begin() + static_cast<std::ptrdiff_t>(pos);
        };
        // A B C D -> A D C B replaces all four edges between the segments
        kicked.insert(kicked.end(), at(0), at(a));
        kicked.insert(kicked.end(), at(c), rotated.end());
        kicked.insert(kicked.end(), at(b), at(c));
        kicked.insert(kicked.end(), at(a), at(b));
        return kicked;
    }
} // namespace kopt
