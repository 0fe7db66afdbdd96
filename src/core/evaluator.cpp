#include "core/evaluator.hpp"

#include <cassert>

namespace WeightSat {

bool isSatisfied(const Clause& clause, const Assignment& assignment) {
    for (const Literal& lit : clause) {
        assert(lit.var >= 1 && static_cast<std::size_t>(lit.var) <= assignment.size());
        if (assignment[lit.var - 1] == lit.polarity) return true;
    }
    return false;
}

bool isSatisfied(const Formula& formula, const Assignment& assignment) {
    for (const Clause& clause : formula.clauses()) {
        if (!isSatisfied(clause, assignment)) return false;
    }
    return true;
}

Weight weight(const Formula& formula, const Assignment& assignment) {
    assert(assignment.size() == static_cast<std::size_t>(formula.numVars()));
    Weight total = 0;
    for (Variable var = 1; var <= formula.numVars(); ++var) {
        if (assignment[var - 1]) total += formula.weightOf(var);
    }
    return total;
}

std::size_t unsatisfiedCount(const Formula& formula, const Assignment& assignment) {
    std::size_t count = 0;
    for (const Clause& clause : formula.clauses()) {
        if (!isSatisfied(clause, assignment)) ++count;
    }
    return count;
}

ClauseStatus classifyClause(const Clause& clause, const PartialAssignment& partial) {
    std::size_t unassigned = 0;
    Literal last_free{0, false};

    for (const Literal& lit : clause) {
        assert(lit.var >= 1 && static_cast<std::size_t>(lit.var) <= partial.size());
        Value value = partial[lit.var - 1];
        if (value == Value::Unassigned) {
            ++unassigned;
            last_free = lit;
        } else if ((value == Value::True) == lit.polarity) {
            return ClauseStatus{ClauseState::Satisfied, Literal{0, false}};
        }
    }

    if (unassigned == 0) return ClauseStatus{ClauseState::Falsified, Literal{0, false}};
    if (unassigned == 1) return ClauseStatus{ClauseState::Unit, last_free};
    return ClauseStatus{ClauseState::Pending, Literal{0, false}};
}

} // namespace WeightSat
