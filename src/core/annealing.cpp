#include "core/annealing.hpp"
#include "core/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace WeightSat {

void AnnealingConfig::validate() const {
    if (!(initial_temperature > 0.0)) {
        throw std::invalid_argument("initial temperature must be > 0");
    }
    if (!(cooling_rate > 0.0 && cooling_rate < 1.0)) {
        throw std::invalid_argument("cooling rate must lie in (0, 1)");
    }
    if (iterations_per_temperature == 0) {
        throw std::invalid_argument("iterations per temperature must be > 0");
    }
    if (min_temperature < 0.0) {
        throw std::invalid_argument("minimum temperature must be >= 0");
    }
    if (initial_temperature <= min_temperature) {
        throw std::invalid_argument("initial temperature must exceed the minimum temperature");
    }
    if (min_temperature == 0.0 && max_iterations == 0 && stall_limit == 0 && time_limit == 0.0) {
        throw std::invalid_argument("annealing needs a stop condition");
    }
    if (time_limit < 0.0) {
        throw std::invalid_argument("time limit must be >= 0");
    }
    if (restarts == 0) {
        throw std::invalid_argument("restarts must be >= 1");
    }
    if (penalty && *penalty <= 0) {
        throw std::invalid_argument("penalty must be > 0");
    }
}

Weight AnnealingConfig::penaltyFor(const Formula& formula) const {
    Weight result = penalty ? *penalty : formula.totalWeight() + 1;
    if (result <= formula.totalWeight()) {
        throw std::invalid_argument("penalty " + std::to_string(result) +
                                    " must exceed the total weight " +
                                    std::to_string(formula.totalWeight()));
    }
    // Fitness and flip deltas scale the penalty by at most numClauses + 1.
    Weight factor = static_cast<Weight>(formula.numClauses()) + 1;
    if (result > std::numeric_limits<Weight>::max() / factor) {
        throw std::invalid_argument("penalty " + std::to_string(result) + " overflows with " +
                                    std::to_string(formula.numClauses()) + " clauses");
    }
    return result;
}

Weight fitness(const Formula& formula, const Assignment& assignment, Weight penalty) {
    return weight(formula, assignment) -
           penalty * static_cast<Weight>(unsatisfiedCount(formula, assignment));
}

SimulatedAnnealing::SimulatedAnnealing(AnnealingConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

void SimulatedAnnealing::generateInitialState() {
    const Formula& f = *formula_;
    current_.assign(f.numVars(), false);

    switch (config_.initial_state) {
    case InitialState::Random: {
        std::bernoulli_distribution coin(0.5);
        for (std::size_t i = 0; i < current_.size(); ++i) current_[i] = coin(gen_);
        break;
    }
    case InitialState::AllTrue:
        current_.assign(f.numVars(), true);
        break;
    case InitialState::AllFalse:
        break;
    }

    current_weight_ = weight(f, current_);
    true_count_.assign(f.numClauses(), 0);
    unsatisfied_ = 0;
    for (std::size_t c = 0; c < f.numClauses(); ++c) {
        for (const Literal& lit : f.clause(c)) {
            if (current_[lit.var - 1] == lit.polarity) ++true_count_[c];
        }
        if (true_count_[c] == 0) ++unsatisfied_;
    }
}

Variable SimulatedAnnealing::generateNeighbor() {
    if (config_.neighbor == NeighborStrategy::UniformRandom) {
        std::uniform_int_distribution<Variable> distrib(1, formula_->numVars());
        return distrib(gen_);
    }

    if (scan_pos_ >= scan_.size()) {
        scan_.resize(formula_->numVars());
        std::iota(scan_.begin(), scan_.end(), 1);
        std::shuffle(scan_.begin(), scan_.end(), gen_);
        scan_pos_ = 0;
    }
    return scan_[scan_pos_++];
}

Weight SimulatedAnnealing::fitnessDelta(Variable var) const {
    bool value = current_[var - 1];
    Weight weight_delta = value ? -formula_->weightOf(var) : formula_->weightOf(var);

    // Occurrences of one clause are adjacent; x and -x may share a clause.
    Weight unsat_delta = 0;
    const std::vector<Occurrence>& occs = formula_->occurrences(var);
    for (std::size_t i = 0; i < occs.size();) {
        std::size_t clause = occs[i].clause;
        std::int64_t change = 0;
        for (; i < occs.size() && occs[i].clause == clause; ++i) {
            change += occs[i].polarity == value ? -1 : 1;
        }
        bool before = true_count_[clause] > 0;
        bool after = static_cast<std::int64_t>(true_count_[clause]) + change > 0;
        if (before && !after) ++unsat_delta;
        if (!before && after) --unsat_delta;
    }

    return weight_delta - penalty_ * unsat_delta;
}

void SimulatedAnnealing::flip(Variable var) {
    bool old_value = current_[var - 1];
    current_[var - 1] = !old_value;
    current_weight_ += old_value ? -formula_->weightOf(var) : formula_->weightOf(var);

    for (const Occurrence& occ : formula_->occurrences(var)) {
        if (occ.polarity == old_value) {
            if (--true_count_[occ.clause] == 0) ++unsatisfied_;
        } else {
            if (true_count_[occ.clause]++ == 0) --unsatisfied_;
        }
    }
}

bool SimulatedAnnealing::updateBest() {
    if (unsatisfied_ != 0) return false;
    if (best_weight_ && current_weight_ <= *best_weight_) return false;

    best_weight_ = current_weight_;
    best_assignment_ = current_;
    stats_.improvements.push_back(current_weight_);
    return true;
}

bool SimulatedAnnealing::budgetExhausted() const {
    if (config_.max_iterations > 0 && stats_.moves >= config_.max_iterations) return true;
    if (config_.time_limit > 0.0) {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        if (elapsed.count() >= config_.time_limit) return true;
    }
    return false;
}

Result SimulatedAnnealing::run(const Formula& formula) {
    // Rejected before any search state is touched.
    penalty_ = config_.penaltyFor(formula);

    formula_ = &formula;
    gen_.seed(config_.seed);
    scan_.clear();
    scan_pos_ = 0;
    best_weight_.reset();
    best_assignment_.clear();
    stats_ = Statistics{};
    start_ = std::chrono::steady_clock::now();

    std::uniform_real_distribution<double> distrib(0.0, 1.0);
    bool stopped = false;

    for (unsigned restart = 0; restart < config_.restarts && !stopped; ++restart) {
        ++stats_.restarts;
        generateInitialState();
        updateBest();
        if (formula.numVars() == 0) break;

        double temperature = config_.initial_temperature;
        std::uint64_t stall = 0;

        // --- Simulated Annealing loop ---
        while (temperature > config_.min_temperature &&
               (config_.stall_limit == 0 || stall < config_.stall_limit)) {
            bool improved = false;

            for (std::uint64_t i = 0; i < config_.iterations_per_temperature; ++i) {
                if (budgetExhausted()) {
                    stopped = true;
                    break;
                }
                ++stats_.moves;

                Variable var = generateNeighbor();
                Weight delta = fitnessDelta(var);

                // Worse moves pass with the Boltzmann probability exp(delta / T).
                if (delta >= 0 ||
                    distrib(gen_) < std::exp(static_cast<double>(delta) / temperature)) {
                    flip(var);
                    ++stats_.accepted;
                    if (updateBest()) improved = true;
                } else {
                    ++stats_.rejected;
                }
            }
            if (stopped) break;

            temperature *= config_.cooling_rate;
            ++stats_.temperature_steps;
            stall = improved ? 0 : stall + 1;
        }
    }

    Result result;
    if (best_weight_) {
        result.status = Status::Feasible;
        result.weight = *best_weight_;
        result.assignment = best_assignment_;
    } else {
        result.status = Status::NoFeasibleFound;
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    stats_.elapsed_seconds = elapsed.count();
    result.stats = stats_;
    formula_ = nullptr;
    return result;
}

} // namespace WeightSat
