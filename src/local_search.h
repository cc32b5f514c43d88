#pragma once

#include "candidate_set.h"
#include "search_budget.h"
#include "tour.h"

#include <deque>
#include <functional>
#include <initializer_list>
#include <vector>

namespace kopt {
    enum class SearchState {
        Scanning,
        Applying,
        Converged,
        Cancelled
    };

    enum class MoveKind {
        TwoOpt,
        OrOpt,
        ThreeOpt
    };

    struct local_search_options_t {
        bool enable_or_opt = true;
        uint32_t or_opt_max_segment = 3;

        /// Segment exchange 3-Opt: swaps two adjacent segments without reversing either.
        bool enable_3opt = true;
    };

    struct local_search_stats_t {
        uint64_t two_opt_moves = 0;
        uint64_t or_opt_moves = 0;
        uint64_t three_opt_moves = 0;
        uint64_t sweeps = 0;
        uint64_t scan_iterations = 0;

        /// Sum of the gains of all applied moves
        cost_t total_gain = 0;

        [[nodiscard]] uint64_t total_moves() const {
            return two_opt_moves + or_opt_moves + three_opt_moves;
        }
    };

    /// Called after every applied move with the move type, its gain and the updated tour.
    using move_observer_t = std::function<void(MoveKind kind, cost_t gain, const Tour &tour)>;

    /// First-improvement local search over 2-Opt, Or-opt and segment exchange 3-Opt moves restricted to
    /// candidate edges.
    ///
    /// Nodes worth examining sit in a queue. A node that yields a move is examined again right away and the
    /// endpoints of every changed edge are queued. When the queue drains, all nodes are queued for a new
    /// sweep; the search has converged once a whole sweep applies no move.
    class LocalSearch {
        const CostMatrix &cost_matrix;
        const CandidateSet &candidate_set;
        local_search_options_t options;
        SearchBudget *budget;
        move_observer_t observer;

        std::deque<node_idx> queue;
        std::vector<char> queued;
        SearchState state = SearchState::Converged;
        local_search_stats_t stats;

        void Activate(node_idx node);

        void Commit(const Tour &tour, MoveKind kind, cost_t gain, std::initializer_list<node_idx> touched);

        [[nodiscard]] bool ImproveNode(Tour &tour, node_idx t1);

        [[nodiscard]] bool TryTwoOptMove(Tour &tour, node_idx t1);

        [[nodiscard]] bool TryAsymmetricTwoOptMove(Tour &tour, node_idx t1);

        [[nodiscard]] bool TryOrOptMove(Tour &tour, node_idx t1);

        [[nodiscard]] bool TryThreeOptMove(Tour &tour, node_idx t1);

    public:
        /// budget may be null for an unbounded search.
        LocalSearch(const CostMatrix &cost_matrix, const CandidateSet &candidate_set,
                    const local_search_options_t &options, SearchBudget *budget);

        void set_observer(move_observer_t move_observer) {
            observer = std::move(move_observer);
        }

        /// Improves the tour in place until it is a local optimum or the budget runs out.
        /// Returns SearchState::Converged or SearchState::Cancelled.
        [[nodiscard]] SearchState Run(Tour &tour);

        [[nodiscard]] SearchState current_state() const {
            return state;
        }

        [[nodiscard]] const local_search_stats_t &statistics() const {
            return stats;
        }
    };
} // namespace kopt
