#include "core/branch_and_bound.hpp"
#include "core/evaluator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace WeightSat {

void BranchAndBoundConfig::validate() const {
    if (time_limit < 0.0) {
        throw std::invalid_argument("branch and bound time limit must be >= 0");
    }
}

BranchAndBound::BranchAndBound(BranchAndBoundConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

void BranchAndBound::reset(const Formula& formula) {
    formula_ = &formula;
    order_ = buildOrder();
    values_.assign(formula.numVars(), Value::Unassigned);
    trail_.clear();
    trail_.reserve(formula.numVars());
    stack_.clear();
    num_true_.assign(formula.numClauses(), 0);
    num_false_.assign(formula.numClauses(), 0);
    pending_units_.clear();
    assigned_weight_ = 0;
    unassigned_weight_ = formula.totalWeight();
    incumbent_weight_.reset();
    incumbent_.clear();
    stats_ = Statistics{};
    start_ = std::chrono::steady_clock::now();
}

std::vector<Variable> BranchAndBound::buildOrder() const {
    std::vector<Variable> order(formula_->numVars());
    std::iota(order.begin(), order.end(), 1);
    if (config_.order == VariableOrder::DescendingWeight) {
        const Formula& f = *formula_;
        std::stable_sort(order.begin(), order.end(), [&f](Variable a, Variable b) {
            return f.weightOf(a) > f.weightOf(b);
        });
    }
    return order;
}

bool BranchAndBound::canPrune() const {
    return incumbent_weight_ && upperBound() <= *incumbent_weight_;
}

bool BranchAndBound::budgetExhausted() const {
    if (config_.node_limit > 0 && stats_.nodes >= config_.node_limit) return true;
    if (config_.time_limit > 0.0) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        if (elapsed.count() >= config_.time_limit) return true;
    }
    return false;
}

void BranchAndBound::assign(Variable var, bool value) {
    values_[var - 1] = value ? Value::True : Value::False;
    trail_.push_back(var);

    Weight w = formula_->weightOf(var);
    unassigned_weight_ -= w;
    if (value) assigned_weight_ += w;

    for (const Occurrence& occ : formula_->occurrences(var)) {
        if (occ.polarity == value) {
            ++num_true_[occ.clause];
            continue;
        }
        ++num_false_[occ.clause];
        // Unit or falsified now; propagate() tells which.
        if (num_true_[occ.clause] == 0 &&
            num_false_[occ.clause] + 1 >= formula_->clause(occ.clause).size()) {
            pending_units_.push_back(occ.clause);
        }
    }
}

bool BranchAndBound::propagate() {
    for (std::size_t head = 0; head < pending_units_.size(); ++head) {
        const Clause& clause = formula_->clause(pending_units_[head]);
        ClauseStatus status = classifyClause(clause, values_);
        if (status.state == ClauseState::Falsified) {
            pending_units_.clear();
            ++stats_.conflicts;
            return false;
        }
        if (status.state == ClauseState::Unit) {
            ++stats_.propagations;
            assign(status.unit.var, status.unit.polarity);
        }
    }
    pending_units_.clear();
    return true;
}

void BranchAndBound::undoTo(std::size_t trail_size) {
    while (trail_.size() > trail_size) {
        Variable var = trail_.back();
        trail_.pop_back();
        bool value = values_[var - 1] == Value::True;

        for (const Occurrence& occ : formula_->occurrences(var)) {
            if (occ.polarity == value) {
                --num_true_[occ.clause];
            } else {
                --num_false_[occ.clause];
            }
        }

        Weight w = formula_->weightOf(var);
        unassigned_weight_ += w;
        if (value) assigned_weight_ -= w;
        values_[var - 1] = Value::Unassigned;
    }
}

std::optional<std::size_t> BranchAndBound::nextUnassigned(std::size_t pos) const {
    for (; pos < order_.size(); ++pos) {
        if (values_[order_[pos] - 1] == Value::Unassigned) return pos;
    }
    return std::nullopt;
}

bool BranchAndBound::decide(std::size_t order_pos) {
    Variable var = order_[order_pos];
    // Heavy variables go true first to reach good incumbents early.
    bool first = formula_->weightOf(var) > 0;
    stack_.push_back(Frame{order_pos, trail_.size(), first, false});
    assign(var, first);
    return propagate();
}

bool BranchAndBound::backtrack() {
    while (!stack_.empty()) {
        Frame& frame = stack_.back();
        undoTo(frame.trail_size);
        if (!frame.second_tried) {
            frame.second_tried = true;
            assign(order_[frame.order_pos], !frame.first_value);
            if (propagate()) return true;
            continue;
        }
        stack_.pop_back();
    }
    return false;
}

void BranchAndBound::recordSolution() {
    Assignment candidate(values_.size());
    for (std::size_t i = 0; i < values_.size(); ++i) {
        candidate[i] = values_[i] == Value::True;
    }
    if (!isSatisfied(*formula_, candidate)) return;

    Weight w = weight(*formula_, candidate);
    if (!incumbent_weight_ || w > *incumbent_weight_) {
        incumbent_weight_ = w;
        incumbent_ = std::move(candidate);
        stats_.improvements.push_back(w);
    }
}

Result BranchAndBound::run(const Formula& formula) {
    reset(formula);

    // --- Root propagation ---
    for (std::size_t c = 0; c < formula.numClauses(); ++c) {
        if (formula.clause(c).size() == 1) pending_units_.push_back(c);
    }
    bool alive = propagate();

    // --- Depth-first search ---
    bool interrupted = false;
    while (alive) {
        if (budgetExhausted()) {
            interrupted = true;
            break;
        }
        ++stats_.nodes;
        if (config_.node_observer) config_.node_observer(values_, upperBound());

        if (canPrune()) {
            ++stats_.pruned;
            alive = backtrack();
            continue;
        }

        std::size_t from = stack_.empty() ? 0 : stack_.back().order_pos + 1;
        std::optional<std::size_t> next = nextUnassigned(from);
        if (!next) {
            recordSolution();
            alive = backtrack();
            continue;
        }

        if (!decide(*next)) alive = backtrack();
    }

    Result result;
    if (incumbent_weight_) {
        result.status = interrupted ? Status::Feasible : Status::Optimum;
        result.weight = *incumbent_weight_;
        result.assignment = incumbent_;
    } else {
        result.status = interrupted ? Status::NoFeasibleFound : Status::Unsatisfiable;
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    stats_.elapsed_seconds = elapsed.count();
    result.stats = stats_;
    formula_ = nullptr;
    return result;
}

} // namespace WeightSat
