#pragma once

#include "cost_matrix.h"

#include <span>
#include <vector>

namespace kopt {
    /// A candidate edge leaving a node
    struct candidate_t {
        node_idx to = -1;
        cost_t cost = 0;

        /// Alpha value of the edge. Equal to cost for nearest neighbor candidate sets.
        cost_t alpha = 0;
    };

    /// Per-node lists of promising neighbor edges. Read-only once built.
    class CandidateSet {
        std::vector<candidate_t> candidates;
        std::vector<size_t> offsets;

    public:
        CandidateSet() = default;

        /// Builds the candidate lists. For asymmetric problems candidates are out-neighbors by directed cost,
        /// and alpha-nearness falls back to nearest neighbor.
        /// Fails with KOPT_STATUS_ERROR_INFEASIBLE_CANDIDATE_SET if some node ends up without a candidate.
        [[nodiscard]] static KoptStatus Build(const CostMatrix &cost_matrix,
                                              KoptCandidateSetType type,
                                              uint32_t candidate_count,
                                              CandidateSet &candidate_set);

        [[nodiscard]] FORCE_INLINE std::span<const candidate_t> of(const node_idx node) const {
            return {candidates.data() + offsets[node], offsets[node + 1] - offsets[node]};
        }

        [[nodiscard]] size_t num_nodes() const {
            return offsets.empty() ? 0 : offsets.size() - 1;
        }

        [[nodiscard]] size_t total_candidates() const {
            return candidates.size();
        }
    };

    /// beta[j] = largest edge weight on the minimum spanning tree path between `from` and j.
    /// `parents` and `prim_order` describe the tree as returned by BuildMinimumSpanningTree.
    void ComputeTreePathMaxima(const CostMatrix &cost_matrix,
                               const std::vector<node_idx> &parents,
                               const std::vector<node_idx> &prim_order,
                               node_idx from,
                               std::vector<cost_t> &beta,
                               std::vector<char> &on_root_path);

    /// Prim's algorithm over the complete graph, O(n^2). parents[root] == -1.
    /// prim_order lists nodes in the order they joined the tree, so parents always come first.
    void BuildMinimumSpanningTree(const CostMatrix &cost_matrix,
                                  std::vector<node_idx> &parents,
                                  std::vector<node_idx> &prim_order);
} // namespace kopt
