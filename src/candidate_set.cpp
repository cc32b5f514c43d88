#include "candidate_set.h"

#include <algorithm>
#include <cmath>

namespace {
    using kopt::candidate_t;

    /// Orders by cost, then by lower node index.
    [[nodiscard]] bool NearerCandidate(const candidate_t &a, const candidate_t &b) {
        if (a.cost != b.cost) {
            return a.cost < b.cost;
        }
        return a.to < b.to;
    }

    /// Orders by alpha, then cost, then lower node index.
    [[nodiscard]] bool AlphaNearerCandidate(const candidate_t &a, const candidate_t &b) {
        if (a.alpha != b.alpha) {
            return a.alpha < b.alpha;
        }
        return NearerCandidate(a, b);
    }

    /// Keeps the best `count` entries of `pool` according to `less`, in order.
    template<typename Less>
    void KeepBest(std::vector<candidate_t> &pool, const size_t count, Less less) {
        const size_t keep = std::min(count, pool.size());
        std::partial_sort(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(keep), pool.end(), less);
        pool.resize(keep);
    }
} // end anonymous namespace

namespace kopt {
    void BuildMinimumSpanningTree(const CostMatrix &cost_matrix,
                                  std::vector<node_idx> &parents,
                                  std::vector<node_idx> &prim_order) {
        const auto n = static_cast<node_idx>(cost_matrix.num_nodes);
        parents.assign(n, -1);
        prim_order.clear();
        prim_order.reserve(n);

        std::vector<cost_t> dist(n, COST_POSITIVE_INFINITY);
        std::vector<char> in_tree(n, 0);
        if (n == 0) {
            return;
        }
        dist[0] = 0;

        for (node_idx it = 0; it < n; ++it) {
            node_idx best = -1;
            cost_t best_dist = COST_POSITIVE_INFINITY;
            for (node_idx v = 0; v < n; ++v) {
                if (!in_tree[v] && (best == -1 || dist[v] < best_dist)) {
                    best = v;
                    best_dist = dist[v];
                }
            }
            in_tree[best] = 1;
            prim_order.push_back(best);

            for (node_idx v = 0; v < n; ++v) {
                if (in_tree[v]) {
                    continue;
                }
                if (const cost_t c = cost_matrix.get_cost(best, v); c < dist[v]) {
                    dist[v] = c;
                    parents[v] = best;
                }
            }
        }
    }

    void ComputeTreePathMaxima(const CostMatrix &cost_matrix,
                               const std::vector<node_idx> &parents,
                               const std::vector<node_idx> &prim_order,
                               const node_idx from,
                               std::vector<cost_t> &beta,
                               std::vector<char> &on_root_path) {
        const size_t n = cost_matrix.num_nodes;
        beta.assign(n, -COST_POSITIVE_INFINITY);
        on_root_path.assign(n, 0);

        // walk up from `from` to the root first
        on_root_path[from] = 1;
        for (node_idx v = from; parents[v] != -1; v = parents[v]) {
            const node_idx p = parents[v];
            beta[p] = std::max(beta[v], cost_matrix.get_cost(v, p));
            on_root_path[p] = 1;
        }

        // every other node hangs off a parent that was settled before it
        for (const node_idx j: prim_order) {
            if (on_root_path[j]) {
                continue;
            }
            const node_idx p = parents[j];
            beta[j] = std::max(beta[p], cost_matrix.get_cost(j, p));
        }
    }

    KoptStatus CandidateSet::Build(const CostMatrix &cost_matrix,
                                   const KoptCandidateSetType type,
                                   const uint32_t candidate_count,
                                   CandidateSet &candidate_set) {
        const auto n = static_cast<node_idx>(cost_matrix.num_nodes);
        const bool use_alpha = type == KOPT_CANDIDATES_ALPHA_NEARNESS && cost_matrix.symmetric;

        candidate_set.candidates.clear();
        candidate_set.offsets.assign(1, 0);
        candidate_set.candidates.reserve(static_cast<size_t>(n) * std::min<size_t>(candidate_count, n));

        std::vector<node_idx> parents{};
        std::vector<node_idx> prim_order{};
        std::vector<cost_t> beta{};
        std::vector<char> on_root_path{};
        if (use_alpha) {
            BuildMinimumSpanningTree(cost_matrix, parents, prim_order);
        }

        std::vector<candidate_t> pool{};
        pool.reserve(n);
        for (node_idx i = 0; i < n; ++i) {
            if (use_alpha) {
                ComputeTreePathMaxima(cost_matrix, parents, prim_order, i, beta, on_root_path);
            }

            pool.clear();
            for (node_idx j = 0; j < n; ++j) {
                if (i == j) {
                    continue;
                }
                const cost_t cost = cost_matrix.get_cost(i, j);
                // an edge of unknown cost can never be part of a tour
                if (!std::isfinite(cost)) {
                    continue;
                }
                pool.push_back(candidate_t{
                    .to = j,
                    .cost = cost,
                    .alpha = use_alpha ? cost - beta[j] : cost
                });
            }

            if (use_alpha) {
                ::KeepBest(pool, candidate_count, ::AlphaNearerCandidate);
            } else {
                ::KeepBest(pool, candidate_count, ::NearerCandidate);
            }

            if (n >= 2 && pool.empty()) {
                return KOPT_STATUS_ERROR_INFEASIBLE_CANDIDATE_SET;
            }
            candidate_set.candidates.insert(candidate_set.candidates.end(), pool.begin(), pool.end());
            candidate_set.offsets.push_back(candidate_set.candidates.size());
        }
        return KOPT_STATUS_SUCCESS;
    }
} // namespace kopt
