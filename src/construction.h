#pragma once

#include "cost_matrix.h"

#include <random>
#include <vector>

namespace kopt {
    [[nodiscard]] std::vector<node_idx> GenerateRandomTour(size_t num_nodes, std::mt19937_64 &rng);

    /// Greedy nearest neighbor walk from a random starting node. Ties go to the lower node index.
    [[nodiscard]] std::vector<node_idx> GetNearestNeighborTour(const CostMatrix &cost_matrix, std::mt19937_64 &rng);

    /// Double-bridge kick: rotates the tour by a random offset, cuts it into A B C D and returns A D C B.
    /// Segment lengths are drawn from [1, max(1, n / 4)]. Tours shorter than 4 nodes are replaced by a random tour.
    [[nodiscard]] std::vector<node_idx> DoubleBridgeKick(const std::vector<node_idx> &tour, std::mt19937_64 &rng);
} // namespace kopt
