#pragma once

#include "kopt_internal.h"

#include <cmath>
#include <memory>
#include <vector>

namespace kopt {
    /// Distance oracle over n nodes, backed by a dense matrix or by coordinates.
    /// All const methods are safe to call concurrently.
    class CostMatrix {
        std::unique_ptr<cost_t[]> distances;
        std::vector<KoptCoordinate2D> coordinates;
        KoptEuclideanRounding rounding = KOPT_ROUND_NEAREST_INTEGER;

        explicit CostMatrix(const size_t num_nodes, const bool symmetric)
            : num_nodes(num_nodes), symmetric(symmetric) {
        }

        [[nodiscard]] cost_t get_euclidean_cost(node_idx from, node_idx to) const;

    public:
        size_t num_nodes;

        /// Whether the search may treat cost(i, j) and cost(j, i) as equal.
        bool symmetric;

        CostMatrix(const CostMatrix &) = delete;

        CostMatrix &operator=(const CostMatrix &) = delete;

        CostMatrix(CostMatrix &&other) noexcept
            : distances(std::move(other.distances)),
              coordinates(std::move(other.coordinates)),
              rounding(other.rounding),
              num_nodes(other.num_nodes),
              symmetric(other.symmetric) {
            other.num_nodes = 0;
        }

        /// Copies a row-major num_nodes x num_nodes matrix. The diagonal is stored as zero.
        [[nodiscard]] static CostMatrix FromDistances(const cost_t *distances, size_t num_nodes, bool symmetric);

        [[nodiscard]] static CostMatrix FromCoordinates(const KoptCoordinate2D *coordinates, size_t num_nodes,
                                                        KoptEuclideanRounding rounding, bool symmetric);

        /// Unchecked lookup for the search hot paths.
        [[nodiscard]] FORCE_INLINE cost_t get_cost(const node_idx from, const node_idx to) const {
            if (distances) {
                return distances[from * static_cast<node_idx>(num_nodes) + to];
            }
            return get_euclidean_cost(from, to);
        }

        /// Bounds-checked lookup. Fails with KOPT_STATUS_ERROR_INVALID_ARG if an index is outside [0, n).
        [[nodiscard]] KoptStatus try_get_cost(node_idx from, node_idx to, cost_t *cost) const;
    };

    /// Returns true if distances[i * n + j] == distances[j * n + i] for every pair.
    [[nodiscard]] bool IsSymmetricMatrix(const cost_t *distances, size_t num_nodes);

    [[nodiscard]] cost_t RoundDistance(double distance, KoptEuclideanRounding rounding);
} // namespace kopt
