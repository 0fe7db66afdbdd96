#ifndef CORE_ANNEALING_HPP_
#define CORE_ANNEALING_HPP_

#include "solver.hpp"

#include <chrono>
#include <optional>
#include <random>

namespace WeightSat {

enum class InitialState { Random, AllFalse, AllTrue };

enum class NeighborStrategy {
    UniformRandom, // flip a uniformly chosen variable
    RandomScan     // walk a shuffled permutation, reshuffle after each pass
};

struct AnnealingConfig {
    // --- Cooling schedule ---
    double initial_temperature = 10.0;
    double cooling_rate = 0.95;          // T <- cooling_rate * T
    std::uint64_t iterations_per_temperature = 100;
    double min_temperature = 0.001;

    // --- Stop conditions (0 disables) ---
    std::uint64_t max_iterations = 1000000;  // total moves over all restarts
    std::uint64_t stall_limit = 200;         // temperature steps without a new best
    double time_limit = 0.0;                 // seconds

    std::uint32_t seed = 5489u;
    unsigned restarts = 1;
    InitialState initial_state = InitialState::Random;
    NeighborStrategy neighbor = NeighborStrategy::UniformRandom;

    // Cost of one unsatisfied clause; defaults to total weight + 1.
    std::optional<Weight> penalty;

    // Formula independent checks. Throws std::invalid_argument.
    void validate() const;

    // Penalty to use on formula; throws std::invalid_argument when an explicit
    // penalty would let an infeasible assignment outscore a feasible one.
    Weight penaltyFor(const Formula& formula) const;
};

// weight(Y) - penalty * unsatisfiedCount(Y)
Weight fitness(const Formula& formula, const Assignment& assignment, Weight penalty);

/**
 * @brief Single trajectory simulated annealing over bit-flip neighbourhoods.
 *
 * Unsatisfied clauses are penalised rather than forbidden so the walk can
 * cross infeasible regions. The answer is the best feasible assignment ever
 * visited, tracked apart from the trajectory.
 */
class SimulatedAnnealing : public Solver {
public:
    explicit SimulatedAnnealing(AnnealingConfig config = {});

    Result run(const Formula& formula) override;
    std::string name() const override { return "simulated-annealing"; }

    const AnnealingConfig& config() const { return config_; }

private:
    AnnealingConfig config_;

    // --- Run State ---
    const Formula* formula_ = nullptr;
    Weight penalty_ = 0;
    std::mt19937 gen_;
    Assignment current_;
    Weight current_weight_ = 0;
    std::vector<std::size_t> true_count_; // true literals per clause
    std::size_t unsatisfied_ = 0;
    std::vector<Variable> scan_;
    std::size_t scan_pos_ = 0;

    std::optional<Weight> best_weight_;
    Assignment best_assignment_;
    Statistics stats_;
    std::chrono::steady_clock::time_point start_;

    // --- Auxiliary Functions ---
    void generateInitialState();
    Variable generateNeighbor();
    Weight fitnessDelta(Variable var) const;
    void flip(Variable var);
    bool updateBest();
    bool budgetExhausted() const;
};

} // namespace WeightSat

#endif // CORE_ANNEALING_HPP_
