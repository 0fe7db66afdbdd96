#ifndef CLI_OPTIONS_HPP_
#define CLI_OPTIONS_HPP_

#include "core/annealing.hpp"
#include "core/branch_and_bound.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace WeightSat {

enum class SolverKind { BranchAndBound, SimulatedAnnealing };

struct CliOptions {
    std::filesystem::path input;
    SolverKind solver = SolverKind::BranchAndBound;
    BranchAndBoundConfig bnb;
    AnnealingConfig annealing;
    bool verbose = false;
    bool print_model = true;
};

/**
 * @brief Parses "<file> [-param value]..." (program name excluded).
 *
 * Throws std::invalid_argument on an unknown parameter, a missing value or a
 * value that does not convert. Engine configs are validated as well.
 */
CliOptions parse_options(const std::vector<std::string>& args);

std::string usage();

std::unique_ptr<Solver> make_solver(const CliOptions& options);

} // namespace WeightSat

#endif // CLI_OPTIONS_HPP_
