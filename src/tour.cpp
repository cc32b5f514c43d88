#include "tour.h"

#include <cassert>
#include <utility>

namespace kopt {
    Tour::Tour(std::vector<node_idx> nodes)
        : order(std::move(nodes)),
          positions(order.size(), -1) {
        for (size_t pos = 0; pos < order.size(); ++pos) {
            positions[order[pos]] = static_cast<tour_pos>(pos);
        }
#ifdef KOPT_IS_DEBUG
        assert(is_valid());
#endif
    }

    bool Tour::between(const node_idx a, const node_idx b, const node_idx c) const {
        const tour_pos pa = sequence_position(a);
        const tour_pos pb = sequence_position(b);
        const tour_pos pc = sequence_position(c);
        if (pa <= pc) {
            return pa <= pb && pb <= pc;
        }
        // the path wraps around the end of the sequence
        return pb >= pa || pb <= pc;
    }

    void Tour::raw_reverse(const node_idx first, const node_idx last, const size_t len) {
        const auto n = static_cast<tour_pos>(order.size());
        tour_pos i = positions[first];
        tour_pos j = positions[last];
        for (size_t k = 0; k < len / 2; ++k) {
            const node_idx a = order[i];
            const node_idx b = order[j];
            order[i] = b;
            positions[b] = i;
            order[j] = a;
            positions[a] = j;
            i = (i + 1 == n) ? 0 : i + 1;
            j = (j == 0) ? n - 1 : j - 1;
        }
    }

    void Tour::reverse(const node_idx from, const node_idx to) {
        const size_t n = order.size();
        if (n < 2 || from == to) {
            return;
        }

        // translate the path into array direction
        node_idx first = from;
        node_idx last = to;
        if (reversed) {
            std::swap(first, last);
        }
        const size_t len = static_cast<size_t>((positions[last] - positions[first] + static_cast<tour_pos>(n))
                                               % static_cast<tour_pos>(n)) + 1;

        if (2 * len > n) {
            // Reversing the complement and flipping the orientation bit yields the same cycle.
            if (len < n) {
                raw_reverse(raw_next(last), raw_prev(first), n - len);
            }
            reversed = !reversed;
        } else {
            raw_reverse(first, last, len);
        }

#ifdef KOPT_IS_DEBUG
        assert(is_valid());
#endif
    }

    void Tour::exchange_segments(const node_idx a_first, const node_idx a_last,
                                 const node_idx b_first, const node_idx b_last) {
#ifdef KOPT_IS_DEBUG
        assert(next(a_last) == b_first);
#endif
        // a_first..a_last b_first..b_last -> a_last..a_first b_last..b_first -> b_first..b_last a_first..a_last
        reverse(a_first, a_last);
        reverse(b_first, b_last);
        reverse(a_last, b_first);
    }

    size_t Tour::path_length(const node_idx from, const node_idx to) const {
        const auto n = static_cast<tour_pos>(order.size());
        return static_cast<size_t>((sequence_position(to) - sequence_position(from) + n) % n) + 1;
    }

    cost_t Tour::total_cost(const CostMatrix &cost_matrix) const {
        cost_t cost = 0;
        for (const node_idx node: order) {
            cost += cost_matrix.get_cost(node, next(node));
        }
        return cost;
    }

    std::vector<node_idx> Tour::to_vector(const node_idx start) const {
        std::vector<node_idx> nodes{};
        nodes.reserve(order.size());
        node_idx node = start;
        for (size_t i = 0; i < order.size(); ++i) {
            nodes.push_back(node);
            node = next(node);
        }
        return nodes;
    }

    bool Tour::is_valid() const {
        if (order.size() != positions.size()) {
            return false;
        }
        const auto n = static_cast<node_idx>(order.size());
        for (size_t pos = 0; pos < order.size(); ++pos) {
            const node_idx node = order[pos];
            if (node < 0 || node >= n) {
                return false;
            }
            // also rules out duplicates: a node can only sit at the one position it records
            if (positions[node] != static_cast<tour_pos>(pos)) {
                return false;
            }
        }
        return true;
    }

    bool IsPermutation(const std::vector<node_idx> &nodes, const size_t num_nodes) {
        if (nodes.size() != num_nodes) {
            return false;
        }
        std::vector<bool> seen(num_nodes, false);
        for (const node_idx node: nodes) {
            if (node < 0 || static_cast<size_t>(node) >= num_nodes || seen[node]) {
                return false;
            }
            seen[node] = true;
        }
        return true;
    }
} // namespace kopt
