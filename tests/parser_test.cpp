#include "parser/parser.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace WeightSat;

namespace {

Formula parse(const std::string& text) {
    std::istringstream in(text);
    return parse_formula(in);
}

} // namespace

TEST(ParserTest, ReadsWeightedDimacs) {
    Formula f = parse("c example instance\n"
                      "p cnf 3 2\n"
                      "w 3 5 2 0\n"
                      "1 -2 0\n"
                      "2 3 0\n");
    EXPECT_EQ(f.numVars(), 3);
    ASSERT_EQ(f.numClauses(), 2u);
    EXPECT_EQ(f.weights(), (std::vector<Weight>{3, 5, 2}));
    EXPECT_EQ(f.clause(0)[0], Literal::fromDimacs(1));
    EXPECT_EQ(f.clause(0)[1], Literal::fromDimacs(-2));
    EXPECT_EQ(f.clause(1)[1], Literal::fromDimacs(3));
}

TEST(ParserTest, ClausesMaySpanLines) {
    Formula f = parse("p cnf 3 2\nw 1 1 1 0\n1 -2\n3 0 -1\n0\n");
    ASSERT_EQ(f.numClauses(), 2u);
    EXPECT_EQ(f.clause(0).size(), 3u);
    EXPECT_EQ(f.clause(1).size(), 1u);
}

TEST(ParserTest, StopsAtPercentMarker) {
    Formula f = parse("p cnf 2 1\nw 1 2 0\n1 2 0\n%\n0\n\n");
    EXPECT_EQ(f.numClauses(), 1u);
}

TEST(ParserTest, AcceptsLastClauseWithoutTerminator) {
    Formula f = parse("p cnf 2 2\nw 1 2 0\n1 0\n-2");
    ASSERT_EQ(f.numClauses(), 2u);
    EXPECT_EQ(f.clause(1)[0], Literal::fromDimacs(-2));
}

TEST(ParserTest, ZeroWeightsInsideWeightLine) {
    Formula f = parse("p cnf 3 1\nw 0 4 0 0\n1 0\n");
    EXPECT_EQ(f.weights(), (std::vector<Weight>{0, 4, 0}));
}

TEST(ParserTest, InfersVariableCountWithoutHeader) {
    Formula f = parse("w 1 2 3 0\n1 -3 0\n");
    EXPECT_EQ(f.numVars(), 3);
}

TEST(ParserTest, MissingWeightLine) {
    EXPECT_THROW(parse("p cnf 2 1\n1 2 0\n"), std::runtime_error);
}

TEST(ParserTest, WeightCountMismatch) {
    EXPECT_THROW(parse("p cnf 3 1\nw 1 2 0\n1 0\n"), std::runtime_error);
}

TEST(ParserTest, NegativeWeight) {
    EXPECT_THROW(parse("p cnf 2 1\nw 1 -2 0\n1 0\n"), std::runtime_error);
}

TEST(ParserTest, UnterminatedWeightLine) {
    EXPECT_THROW(parse("p cnf 2 1\nw 1 2\n1 0\n"), std::runtime_error);
}

TEST(ParserTest, VariableAboveDeclaredCount) {
    EXPECT_THROW(parse("p cnf 2 1\nw 1 2 0\n1 3 0\n"), std::runtime_error);
}

TEST(ParserTest, GarbageToken) {
    try {
        parse("p cnf 2 1\nw 1 2 0\n1 x 0\n");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(ParserTest, VariableCountBeyondInt) {
    EXPECT_THROW(parse("p cnf 4294967297 1\nw 1 0\n1 0\n"), std::runtime_error);
    EXPECT_THROW(parse("p cnf 2147483648 1\nw 1 0\n1 0\n"), std::runtime_error);
}

TEST(ParserTest, LiteralBeyondInt) {
    EXPECT_THROW(parse("w 1 0\n-9223372036854775808 0\n"), std::runtime_error);
    EXPECT_THROW(parse("w 1 0\n-2147483648 0\n"), std::runtime_error);
    EXPECT_THROW(parse("w 1 0\n2147483648 0\n"), std::runtime_error);
    EXPECT_THROW(parse("w 1 0\n99999999999999999999 0\n"), std::runtime_error);
}

TEST(ParserTest, WeightsOverflowingTheTotal) {
    EXPECT_THROW(parse("p cnf 2 1\nw 9223372036854775000 9223372036854775000 0\n1 0\n"),
                 std::runtime_error);
}

TEST(ParserTest, BadHeader) {
    EXPECT_THROW(parse("p wcnf 2 1\nw 1 2 0\n1 0\n"), std::runtime_error);
}

TEST(ParserTest, MissingFile) {
    EXPECT_THROW(parse_formula_file("/nonexistent/instance.wcnf"), std::runtime_error);
}
