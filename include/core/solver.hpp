#ifndef CORE_SOLVER_HPP_
#define CORE_SOLVER_HPP_

#include "formula.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace WeightSat {

enum class Status {
    Optimum,         // search exhausted, weight is proven optimal
    Unsatisfiable,   // search exhausted, no assignment satisfies the formula
    Feasible,        // best found so far, optimality unproven
    NoFeasibleFound  // no satisfying assignment visited; not a proof of unsat
};

std::string toString(Status status);

struct Statistics {
    // --- Branch and bound ---
    std::uint64_t nodes = 0;
    std::uint64_t propagations = 0;
    std::uint64_t conflicts = 0;
    std::uint64_t pruned = 0;

    // --- Simulated annealing ---
    std::uint64_t moves = 0;
    std::uint64_t accepted = 0;
    std::uint64_t rejected = 0;
    std::uint64_t temperature_steps = 0;
    std::uint64_t restarts = 0;

    // Weight of every new incumbent, in the order they were found.
    std::vector<Weight> improvements;
    double elapsed_seconds = 0.0;
};

struct Result {
    Status status = Status::NoFeasibleFound;
    Weight weight = 0;
    Assignment assignment; // empty unless hasSolution()
    Statistics stats;

    bool hasSolution() const { return status == Status::Optimum || status == Status::Feasible; }
};

/**
 * @brief Common interface of the search engines.
 *
 * Engines take their configuration at construction. Every call to run()
 * builds fresh search state; the formula is only read.
 */
class Solver {
public:
    virtual ~Solver() = default;

    virtual Result run(const Formula& formula) = 0;
    virtual std::string name() const = 0;
};

// Competition style "s", "o" and "v" lines.
void printResult(std::ostream& out, const Result& result, bool print_model);

} // namespace WeightSat

#endif // CORE_SOLVER_HPP_
