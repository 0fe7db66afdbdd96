#include "core/evaluator.hpp"
#include "core/formula.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

using namespace WeightSat;
using WeightSat::test_util::makeFormula;

TEST(FormulaTest, RejectsWeightCountMismatch) {
    EXPECT_THROW(makeFormula(2, {{1, -2}}, {3}), std::invalid_argument);
}

TEST(FormulaTest, RejectsNegativeWeight) {
    EXPECT_THROW(makeFormula(2, {{1, -2}}, {3, -1}), std::invalid_argument);
}

TEST(FormulaTest, RejectsWeightsThatOverflowTheTotal) {
    const Weight max = std::numeric_limits<Weight>::max();
    EXPECT_THROW(makeFormula(2, {{1}}, {9223372036854775000, 9223372036854775000}),
                 std::invalid_argument);
    EXPECT_THROW(makeFormula(1, {{1}}, {max}), std::invalid_argument);
    EXPECT_THROW(makeFormula(2, {{1}}, {max - 10, 10}), std::invalid_argument);

    Formula f = makeFormula(2, {{1}}, {max - 10, 9});
    EXPECT_EQ(f.totalWeight(), max - 1);
}

TEST(FormulaTest, RejectsLiteralOutOfRange) {
    EXPECT_THROW(makeFormula(2, {{1, 3}}, {1, 1}), std::invalid_argument);
    EXPECT_THROW(makeFormula(2, {{0}}, {1, 1}), std::invalid_argument);
}

TEST(FormulaTest, RejectsEmptyClause) {
    EXPECT_THROW(Formula(1, {Clause{}}, {1}), std::invalid_argument);
}

TEST(FormulaTest, CollapsesDuplicateLiterals) {
    Formula f = makeFormula(2, {{1, 1, -2, 1}}, {1, 2});
    ASSERT_EQ(f.clause(0).size(), 2u);
    EXPECT_EQ(f.clause(0)[0], Literal::fromDimacs(1));
    EXPECT_EQ(f.clause(0)[1], Literal::fromDimacs(-2));
}

TEST(FormulaTest, KeepsTautologies) {
    Formula f = makeFormula(1, {{1, -1}}, {4});
    EXPECT_EQ(f.clause(0).size(), 2u);
    EXPECT_EQ(f.occurrences(1).size(), 2u);
}

TEST(FormulaTest, WeightTotals) {
    Formula f = makeFormula(3, {{1}}, {3, 7, 0});
    EXPECT_EQ(f.totalWeight(), 10);
    EXPECT_EQ(f.maxWeight(), 7);
    EXPECT_EQ(f.weightOf(2), 7);
}

TEST(FormulaTest, OccurrencesAreGroupedByClause) {
    Formula f = makeFormula(3, {{1, 2}, {-1, 3}, {2, 3}}, {1, 1, 1});
    const auto& occ = f.occurrences(1);
    ASSERT_EQ(occ.size(), 2u);
    EXPECT_EQ(occ[0].clause, 0u);
    EXPECT_TRUE(occ[0].polarity);
    EXPECT_EQ(occ[1].clause, 1u);
    EXPECT_FALSE(occ[1].polarity);
    EXPECT_EQ(f.occurrences(3).size(), 2u);
}

TEST(FormulaTest, ToStringUsesLetters) {
    Formula f = makeFormula(27, {{1, -2}, {26}, {-27}}, std::vector<Weight>(27, 1));
    EXPECT_EQ(f.toString(), "(A V -B) ^ (Z) ^ (-AA)");
}

TEST(EvaluatorTest, SatisfactionAndWeight) {
    Formula f = makeFormula(2, {{1, -2}}, {3, 5});

    EXPECT_TRUE(isSatisfied(f, Assignment{true, false}));
    EXPECT_TRUE(isSatisfied(f, Assignment{true, true}));
    EXPECT_TRUE(isSatisfied(f, Assignment{false, false}));
    EXPECT_FALSE(isSatisfied(f, Assignment{false, true}));

    EXPECT_EQ(weight(f, Assignment{true, true}), 8);
    EXPECT_EQ(weight(f, Assignment{false, true}), 5);
    EXPECT_EQ(weight(f, Assignment{false, false}), 0);
}

TEST(EvaluatorTest, UnsatisfiedCount) {
    Formula f = makeFormula(3, {{1}, {2}, {-3}, {1, 3}}, {1, 1, 1});
    EXPECT_EQ(unsatisfiedCount(f, Assignment{true, true, false}), 0u);
    EXPECT_EQ(unsatisfiedCount(f, Assignment{false, false, true}), 3u);
    EXPECT_EQ(unsatisfiedCount(f, Assignment{false, false, false}), 3u);
}

TEST(EvaluatorTest, EmptyFormulaIsSatisfied) {
    Formula f(2, {}, {1, 2});
    EXPECT_TRUE(isSatisfied(f, Assignment{true, true}));
    EXPECT_EQ(unsatisfiedCount(f, Assignment{false, false}), 0u);
}

TEST(EvaluatorTest, ClassifyClause) {
    Formula f = makeFormula(3, {{1, -2, 3}}, {1, 1, 1});
    const Clause& c = f.clause(0);
    const Value U = Value::Unassigned;

    EXPECT_EQ(classifyClause(c, {U, U, U}).state, ClauseState::Pending);
    EXPECT_EQ(classifyClause(c, {Value::False, U, U}).state, ClauseState::Pending);
    EXPECT_EQ(classifyClause(c, {Value::True, U, U}).state, ClauseState::Satisfied);
    EXPECT_EQ(classifyClause(c, {U, Value::False, U}).state, ClauseState::Satisfied);

    ClauseStatus unit = classifyClause(c, {Value::False, Value::True, U});
    EXPECT_EQ(unit.state, ClauseState::Unit);
    EXPECT_EQ(unit.unit, Literal::fromDimacs(3));

    ClauseStatus neg_unit = classifyClause(c, {Value::False, U, Value::False});
    EXPECT_EQ(neg_unit.state, ClauseState::Unit);
    EXPECT_EQ(neg_unit.unit, Literal::fromDimacs(-2));

    EXPECT_EQ(classifyClause(c, {Value::False, Value::True, Value::False}).state,
              ClauseState::Falsified);
}
