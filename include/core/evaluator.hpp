#ifndef CORE_EVALUATOR_HPP_
#define CORE_EVALUATOR_HPP_

#include "formula.hpp"

#include <cstddef>

namespace WeightSat {

enum class ClauseState { Satisfied, Falsified, Pending, Unit };

struct ClauseStatus {
    ClauseState state;
    Literal unit{0, false}; // only meaningful when state == Unit
};

// --- Total assignments (indexed by var - 1) ---

bool isSatisfied(const Clause& clause, const Assignment& assignment);
bool isSatisfied(const Formula& formula, const Assignment& assignment);

// Sum of weights of true variables. No feasibility check.
Weight weight(const Formula& formula, const Assignment& assignment);

std::size_t unsatisfiedCount(const Formula& formula, const Assignment& assignment);

// --- Partial assignments ---

/**
 * @brief Classifies a clause under a partial assignment.
 *
 * Satisfied if some assigned literal matches its polarity, Falsified if all
 * literals are assigned and none matches, Unit (with the remaining literal)
 * if exactly one literal is unassigned and the others are false, otherwise
 * Pending.
 */
ClauseStatus classifyClause(const Clause& clause, const PartialAssignment& partial);

} // namespace WeightSat

#endif // CORE_EVALUATOR_HPP_
