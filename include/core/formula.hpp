#ifndef CORE_FORMULA_HPP_
#define CORE_FORMULA_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace WeightSat {

using Variable = int;
using Weight = std::int64_t;

struct Literal {
    Variable var;
    bool polarity; // true = variable appears unnegated

    static Literal fromDimacs(int lit) { return Literal{lit < 0 ? -lit : lit, lit > 0}; }
    int toDimacs() const { return polarity ? var : -var; }

    bool operator==(const Literal& other) const {
        return var == other.var && polarity == other.polarity;
    }
    bool operator!=(const Literal& other) const { return !(*this == other); }
};

using Clause = std::vector<Literal>;

enum class Value : std::uint8_t { False, True, Unassigned };

using Assignment = std::vector<bool>;
using PartialAssignment = std::vector<Value>;

// Where a variable occurs: clause index and the polarity it has there.
struct Occurrence {
    std::size_t clause;
    bool polarity;
};

/**
 * @brief Immutable weighted CNF formula.
 *
 * Variables are numbered 1..n; per-variable data (weights, occurrence lists)
 * is stored at index var - 1. The constructor validates the input and throws
 * std::invalid_argument on a malformed formula.
 */
class Formula {
public:
    Formula() = default;
    Formula(int num_vars, std::vector<Clause> clauses, std::vector<Weight> weights);

    int numVars() const { return num_vars_; }
    std::size_t numClauses() const { return clauses_.size(); }

    const std::vector<Clause>& clauses() const { return clauses_; }
    const Clause& clause(std::size_t index) const { return clauses_[index]; }

    const std::vector<Weight>& weights() const { return weights_; }
    Weight weightOf(Variable var) const { return weights_[var - 1]; }
    Weight totalWeight() const { return total_weight_; }
    Weight maxWeight() const { return max_weight_; }

    // Clauses containing var, grouped by clause index in ascending order.
    const std::vector<Occurrence>& occurrences(Variable var) const { return occurrences_[var - 1]; }

    // Readable rendering, e.g. "(A V -B) ^ (C)".
    std::string toString() const;

private:
    int num_vars_ = 0;
    std::vector<Clause> clauses_;
    std::vector<Weight> weights_;
    std::vector<std::vector<Occurrence>> occurrences_;
    Weight total_weight_ = 0;
    Weight max_weight_ = 0;
};

} // namespace WeightSat

#endif // CORE_FORMULA_HPP_
