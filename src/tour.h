#pragma once

#include "cost_matrix.h"

#include <vector>

namespace kopt {
    /// A Hamiltonian cycle over nodes [0, n).
    ///
    /// Nodes are kept in an array together with the position of every node and a global orientation bit.
    /// next/prev/sequence_position/between are O(1). reverse flips either the requested path or its
    /// complement, whichever is shorter, and toggles the orientation bit in the latter case, so it runs in
    /// O(min(len, n - len)) while keeping the exact direction of travel (which asymmetric costs depend on).
    class Tour {
        std::vector<node_idx> order;
        std::vector<tour_pos> positions;
        bool reversed = false;

        [[nodiscard]] FORCE_INLINE node_idx raw_next(const node_idx node) const {
            const tour_pos pos = positions[node] + 1;
            return order[pos == static_cast<tour_pos>(order.size()) ? 0 : pos];
        }

        [[nodiscard]] FORCE_INLINE node_idx raw_prev(const node_idx node) const {
            const tour_pos pos = positions[node];
            return order[pos == 0 ? order.size() - 1 : pos - 1];
        }

        /// Reverses the array path from first to last (following raw_next), len nodes long.
        void raw_reverse(node_idx first, node_idx last, size_t len);

    public:
        Tour() = default;

        /// Takes ownership of a permutation of [0, n). The permutation is not validated outside debug builds.
        explicit Tour(std::vector<node_idx> nodes);

        [[nodiscard]] size_t size() const {
            return order.size();
        }

        [[nodiscard]] FORCE_INLINE node_idx next(const node_idx node) const {
            return reversed ? raw_prev(node) : raw_next(node);
        }

        [[nodiscard]] FORCE_INLINE node_idx prev(const node_idx node) const {
            return reversed ? raw_next(node) : raw_prev(node);
        }

        /// Position of node along the current direction of travel, in [0, n).
        [[nodiscard]] FORCE_INLINE tour_pos sequence_position(const node_idx node) const {
            return reversed ? static_cast<tour_pos>(order.size()) - 1 - positions[node] : positions[node];
        }

        /// Whether b lies on the path from a to c (inclusive) in tour order.
        [[nodiscard]] bool between(node_idx a, node_idx b, node_idx c) const;

        /// Reverses the path from `from` to `to` (inclusive, following next).
        /// Afterwards the segment runs from `to` to `from`; reverse(to, from) undoes the call.
        void reverse(node_idx from, node_idx to);

        /// Swaps the adjacent segments [a_first..a_last][b_first..b_last] (b_first == next(a_last)) without
        /// changing their orientation, using three reversals.
        void exchange_segments(node_idx a_first, node_idx a_last, node_idx b_first, node_idx b_last);

        /// Number of nodes on the path from `from` to `to` (inclusive).
        [[nodiscard]] size_t path_length(node_idx from, node_idx to) const;

        [[nodiscard]] cost_t total_cost(const CostMatrix &cost_matrix) const;

        /// The tour in order of travel starting at `start`.
        [[nodiscard]] std::vector<node_idx> to_vector(node_idx start = 0) const;

        /// Checks that order and positions describe one cycle over every node exactly once.
        [[nodiscard]] bool is_valid() const;
    };

    /// Returns true if nodes is a permutation of [0, num_nodes).
    [[nodiscard]] bool IsPermutation(const std::vector<node_idx> &nodes, size_t num_nodes);
} // namespace kopt
