#ifndef CORE_BRANCH_AND_BOUND_HPP_
#define CORE_BRANCH_AND_BOUND_HPP_

#include "solver.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace WeightSat {

enum class VariableOrder {
    Ascending,        // 1, 2, ..., n
    DescendingWeight  // heaviest first, ties by ascending index
};

struct BranchAndBoundConfig {
    VariableOrder order = VariableOrder::DescendingWeight;
    std::uint64_t node_limit = 0;  // 0 = unlimited
    double time_limit = 0.0;       // seconds, 0 = unlimited

    // Called at every visited node with its partial assignment and upper bound.
    std::function<void(const PartialAssignment&, Weight)> node_observer;

    // Throws std::invalid_argument.
    void validate() const;
};

/**
 * @brief Exact depth-first branch and bound with unit propagation.
 *
 * The search tree is walked with an explicit stack of decision frames over a
 * trail of assigned variables, so memory is O(n + clauses) regardless of the
 * tree size. Per-clause true/false literal counters are maintained
 * incrementally and drive both conflict detection and unit propagation.
 */
class BranchAndBound : public Solver {
public:
    explicit BranchAndBound(BranchAndBoundConfig config = {});

    Result run(const Formula& formula) override;
    std::string name() const override { return "branch-and-bound"; }

    const BranchAndBoundConfig& config() const { return config_; }

private:
    struct Frame {
        std::size_t order_pos;
        std::size_t trail_size;
        bool first_value;
        bool second_tried;
    };

    BranchAndBoundConfig config_;

    // --- Per-run search state ---
    const Formula* formula_ = nullptr;
    std::vector<Variable> order_;
    PartialAssignment values_;
    std::vector<Variable> trail_;
    std::vector<Frame> stack_;
    std::vector<std::size_t> num_true_;
    std::vector<std::size_t> num_false_;
    std::vector<std::size_t> pending_units_;
    Weight assigned_weight_ = 0;
    Weight unassigned_weight_ = 0;

    std::optional<Weight> incumbent_weight_;
    Assignment incumbent_;
    Statistics stats_;
    std::chrono::steady_clock::time_point start_;

    void reset(const Formula& formula);
    std::vector<Variable> buildOrder() const;

    Weight upperBound() const { return assigned_weight_ + unassigned_weight_; }
    bool canPrune() const;
    bool budgetExhausted() const;

    void assign(Variable var, bool value);
    bool propagate();
    void undoTo(std::size_t trail_size);

    // Next variable in the order that is still unassigned, starting at pos.
    std::optional<std::size_t> nextUnassigned(std::size_t pos) const;
    bool decide(std::size_t order_pos);
    bool backtrack();
    void recordSolution();
};

} // namespace WeightSat

#endif // CORE_BRANCH_AND_BOUND_HPP_
