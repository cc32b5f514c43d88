#include "local_search.h"

#include <cassert>

namespace {
    using kopt::cost_t;
    using kopt::node_idx;

    /// Change in cost of travelling the path from `from` to `to` backwards instead of forwards.
    /// Zero for symmetric costs; walks the whole path otherwise.
    [[nodiscard]] cost_t ComputeReversedPathDelta(const kopt::Tour &tour, const kopt::CostMatrix &cost_matrix,
                                                  const node_idx from, const node_idx to) {
        cost_t forward = 0;
        cost_t backward = 0;
        for (node_idx v = from; v != to;) {
            const node_idx w = tour.next(v);
            forward += cost_matrix.get_cost(v, w);
            backward += cost_matrix.get_cost(w, v);
            v = w;
        }
        return backward - forward;
    }

    /// Describes an Or-opt insertion of the segment between the adjacent nodes c -> d
    struct or_opt_t {
        node_idx c = -1;
        node_idx d = -1;
        bool reversed = false;
    };
} // end anonymous namespace

namespace kopt {
    LocalSearch::LocalSearch(const CostMatrix &cost_matrix, const CandidateSet &candidate_set,
                             const local_search_options_t &options, SearchBudget *budget)
        : cost_matrix(cost_matrix),
          candidate_set(candidate_set),
          options(options),
          budget(budget) {
    }

    void LocalSearch::Activate(const node_idx node) {
        if (!queued[node]) {
            queued[node] = 1;
            queue.push_back(node);
        }
    }

    void LocalSearch::Commit(const Tour &tour, const MoveKind kind, const cost_t gain,
                             const std::initializer_list<node_idx> touched) {
        state = SearchState::Applying;
        switch (kind) {
            case MoveKind::TwoOpt:
                ++stats.two_opt_moves;
                break;
            case MoveKind::OrOpt:
                ++stats.or_opt_moves;
                break;
            case MoveKind::ThreeOpt:
                ++stats.three_opt_moves;
                break;
        }
        stats.total_gain += gain;

#ifdef KOPT_IS_DEBUG
        assert(tour.is_valid());
#endif
        if (observer) {
            observer(kind, gain, tour);
        }
        for (const node_idx node: touched) {
            Activate(node);
        }
        state = SearchState::Scanning;
    }

    SearchState LocalSearch::Run(Tour &tour) {
        stats = {};
        const size_t n = tour.size();
        queue.clear();
        queued.assign(n, 0);

        while (true) {
            state = SearchState::Scanning;
            ++stats.sweeps;
            const uint64_t moves_before = stats.total_moves();

            node_idx node = 0;
            for (size_t i = 0; i < n; ++i) {
                Activate(node);
                node = tour.next(node);
            }

            while (!queue.empty()) {
                const node_idx t1 = queue.front();
                queue.pop_front();
                queued[t1] = 0;

                // stay on t1 for as long as it keeps yielding moves
                bool improved = true;
                while (improved) {
                    if (budget != nullptr && !budget->consume()) {
                        state = SearchState::Cancelled;
                        return state;
                    }
                    ++stats.scan_iterations;
                    improved = ImproveNode(tour, t1);
                }
            }

            if (stats.total_moves() == moves_before) {
                state = SearchState::Converged;
                return state;
            }
        }
    }

    bool LocalSearch::ImproveNode(Tour &tour, const node_idx t1) {
        if (cost_matrix.symmetric ? TryTwoOptMove(tour, t1) : TryAsymmetricTwoOptMove(tour, t1)) {
            return true;
        }
        if (options.enable_or_opt && TryOrOptMove(tour, t1)) {
            return true;
        }
        return options.enable_3opt && TryThreeOptMove(tour, t1);
    }

    bool LocalSearch::TryTwoOptMove(Tour &tour, const node_idx t1) {
        for (const bool successor: {true, false}) {
            const node_idx t2 = successor ? tour.next(t1) : tour.prev(t1);
            const cost_t d12 = cost_matrix.get_cost(t1, t2);

            for (const candidate_t &candidate: candidate_set.of(t2)) {
                const node_idx t3 = candidate.to;
                // the new edge (t2, t3) has to be shorter than the one it replaces
                const cost_t g1 = d12 - candidate.cost;
                if (g1 <= 0 || t3 == t1) {
                    continue;
                }
                const node_idx t4 = successor ? tour.prev(t3) : tour.next(t3);
                if (t4 == t2) {
                    continue;
                }

                const cost_t gain = g1 + cost_matrix.get_cost(t3, t4) - cost_matrix.get_cost(t4, t1);
                if (gain <= MIN_IMPROVEMENT_GAIN) {
                    continue;
                }

                // t1 t2 .. t4 t3 -> t1 t4 .. t2 t3, or mirrored for the predecessor side
                if (successor) {
                    tour.reverse(t2, t4);
                } else {
                    tour.reverse(t4, t2);
                }
                Commit(tour, MoveKind::TwoOpt, gain, {t1, t2, t3, t4});
                return true;
            }
        }
        return false;
    }

    bool LocalSearch::TryAsymmetricTwoOptMove(Tour &tour, const node_idx t1) {
        const node_idx t2 = tour.next(t1);
        const cost_t d12 = cost_matrix.get_cost(t1, t2);

        for (const candidate_t &candidate: candidate_set.of(t2)) {
            const node_idx t3 = candidate.to;
            const cost_t g1 = d12 - candidate.cost;
            if (g1 <= 0 || t3 == t1) {
                continue;
            }
            const node_idx t4 = tour.prev(t3);
            if (t4 == t2) {
                continue;
            }

            // For an ASYMMETRIC TSP, also account for edges reversed inside (t2 .. t4)
            const cost_t gain = g1 + cost_matrix.get_cost(t4, t3) - cost_matrix.get_cost(t1, t4)
                                - ::ComputeReversedPathDelta(tour, cost_matrix, t2, t4);
            if (gain <= MIN_IMPROVEMENT_GAIN) {
                continue;
            }

            tour.reverse(t2, t4);
            Commit(tour, MoveKind::TwoOpt, gain, {t1, t2, t3, t4});
            return true;
        }
        return false;
    }

    bool LocalSearch::TryOrOptMove(Tour &tour, const node_idx t1) {
        const size_t n = tour.size();
        const node_idx s1 = t1;
        node_idx s2 = t1;

        for (size_t len = 1; len <= options.or_opt_max_segment && len + 2 <= n; ++len) {
            if (len > 1) {
                s2 = tour.next(s2);
            }
            const node_idx p = tour.prev(s1);
            const node_idx nx = tour.next(s2);

            // gain of closing the gap the segment leaves behind; it may be negative when costs break the
            // triangle inequality and the insertion can still pay for it
            const cost_t removal_gain = cost_matrix.get_cost(p, s1) + cost_matrix.get_cost(s2, nx)
                                        - cost_matrix.get_cost(p, nx);

            const auto in_segment = [&](const node_idx v) {
                return tour.between(s1, v, s2);
            };
            const auto insertion_gain = [&](const or_opt_t &move) {
                const cost_t added = move.reversed
                                         ? cost_matrix.get_cost(move.c, s2) + cost_matrix.get_cost(s1, move.d)
                                         : cost_matrix.get_cost(move.c, s1) + cost_matrix.get_cost(s2, move.d);
                return removal_gain + cost_matrix.get_cost(move.c, move.d) - added;
            };

            or_opt_t best{};
            cost_t best_gain = MIN_IMPROVEMENT_GAIN;
            const auto consider = [&](const or_opt_t &move) {
                if (in_segment(move.c) || in_segment(move.d)) {
                    return;
                }
                if (const cost_t gain = insertion_gain(move); gain > best_gain) {
                    best_gain = gain;
                    best = move;
                }
            };

            // new edge s2 -> x
            for (const candidate_t &candidate: candidate_set.of(s2)) {
                const node_idx x = candidate.to;
                consider({.c = tour.prev(x), .d = x, .reversed = false});
                if (cost_matrix.symmetric) {
                    consider({.c = x, .d = tour.next(x), .reversed = true});
                }
            }
            // new edge x - s1, only usable in both directions when costs are symmetric
            if (cost_matrix.symmetric && len > 1) {
                for (const candidate_t &candidate: candidate_set.of(s1)) {
                    const node_idx x = candidate.to;
                    consider({.c = x, .d = tour.next(x), .reversed = false});
                    consider({.c = tour.prev(x), .d = x, .reversed = true});
                }
            }

            if (best.c == -1) {
                continue;
            }

            // p s1..s2 nx .. c d -> p nx .. c s1..s2 d, moving whichever side is shorter
            if (tour.path_length(nx, best.c) <= tour.path_length(best.d, p)) {
                tour.exchange_segments(s1, s2, nx, best.c);
            } else {
                tour.exchange_segments(best.d, p, s1, s2);
            }
            if (best.reversed) {
                tour.reverse(s1, s2);
            }
            Commit(tour, MoveKind::OrOpt, best_gain, {p, nx, best.c, best.d, s1, s2});
            return true;
        }
        return false;
    }

    bool LocalSearch::TryThreeOptMove(Tour &tour, const node_idx t1) {
        const node_idx t2 = tour.next(t1);
        const cost_t d12 = cost_matrix.get_cost(t1, t2);

        // new edge t1 -> t4
        for (const candidate_t &first: candidate_set.of(t1)) {
            const node_idx t4 = first.to;
            const cost_t g1 = d12 - first.cost;
            if (g1 <= 0 || t4 == t2) {
                continue;
            }
            const node_idx t3 = tour.prev(t4);
            const cost_t g1_closed = g1 + cost_matrix.get_cost(t3, t4);

            // new edge t3 -> t6, with t6 on the path after t4 so that t5 = prev(t6) closes the second segment
            for (const candidate_t &second: candidate_set.of(t3)) {
                const node_idx t6 = second.to;
                const cost_t g2 = g1_closed - second.cost;
                if (g2 <= 0 || t6 == t4 || !tour.between(t4, t6, t1)) {
                    continue;
                }
                const node_idx t5 = tour.prev(t6);

                const cost_t gain = g2 + cost_matrix.get_cost(t5, t6) - cost_matrix.get_cost(t5, t2);
                if (gain <= MIN_IMPROVEMENT_GAIN) {
                    continue;
                }

                // t1 [t2..t3] [t4..t5] t6 -> t1 [t4..t5] [t2..t3] t6
                tour.exchange_segments(t2, t3, t4, t5);
                Commit(tour, MoveKind::ThreeOpt, gain, {t1, t2, t3, t4, t5, t6});
                return true;
            }
        }
        return false;
    }
} // namespace kopt
