#include "cost_matrix.h"

#include <algorithm>

namespace kopt {
    CostMatrix CostMatrix::FromDistances(const cost_t *distances, const size_t num_nodes, const bool symmetric) {
        CostMatrix mat{num_nodes, symmetric};
        mat.distances = std::make_unique<cost_t[]>(num_nodes * num_nodes);
        std::copy_n(distances, num_nodes * num_nodes, mat.distances.get());

        // the diagonal never takes part in a tour
        for (size_t i = 0; i < num_nodes; ++i) {
            mat.distances[i * num_nodes + i] = 0;
        }
        return mat;
    }

    CostMatrix CostMatrix::FromCoordinates(const KoptCoordinate2D *coordinates, const size_t num_nodes,
                                           const KoptEuclideanRounding rounding, const bool symmetric) {
        CostMatrix mat{num_nodes, symmetric};
        mat.coordinates.assign(coordinates, coordinates + num_nodes);
        mat.rounding = rounding;
        return mat;
    }

    cost_t CostMatrix::get_euclidean_cost(const node_idx from, const node_idx to) const {
        if (from == to) {
            return 0;
        }
        const double dx = coordinates[from].x - coordinates[to].x;
        const double dy = coordinates[from].y - coordinates[to].y;
        return RoundDistance(std::sqrt(dx * dx + dy * dy), rounding);
    }

    KoptStatus CostMatrix::try_get_cost(const node_idx from, const node_idx to, cost_t *cost) const {
        if (cost == nullptr) {
            return KOPT_STATUS_ERROR_INVALID_ARG;
        }
        const auto n = static_cast<node_idx>(num_nodes);
        if (from < 0 || from >= n || to < 0 || to >= n) {
            return KOPT_STATUS_ERROR_INVALID_ARG;
        }
        *cost = get_cost(from, to);
        return KOPT_STATUS_SUCCESS;
    }

    bool IsSymmetricMatrix(const cost_t *distances, const size_t num_nodes) {
        for (size_t i = 0; i < num_nodes; ++i) {
            for (size_t j = i + 1; j < num_nodes; ++j) {
                if (distances[i * num_nodes + j] != distances[j * num_nodes + i]) {
                    return false;
                }
            }
        }
        return true;
    }

    cost_t RoundDistance(const double distance, const KoptEuclideanRounding rounding) {
        switch (rounding) {
            case KOPT_ROUND_NEAREST_INTEGER:
                return std::floor(distance + 0.5);
            case KOPT_ROUND_CEIL:
                return std::ceil(distance);
            case KOPT_ROUND_NONE:
            default:
                return distance;
        }
    }
} // namespace kopt
