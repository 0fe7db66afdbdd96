#include <exception>
#include <iostream>

#include "cli/options.hpp"
#include "engine/WeightSat.hpp"

namespace {

int exit_code(WeightSat::Status status) {
    switch (status) {
    case WeightSat::Status::Optimum:
        return 30;
    case WeightSat::Status::Unsatisfiable:
        return 20;
    case WeightSat::Status::Feasible:
        return 10;
    case WeightSat::Status::NoFeasibleFound:
        return 0;
    }
    return 0;
}

void print_statistics(const WeightSat::Statistics& stats) {
    std::cout << "c elapsed: " << stats.elapsed_seconds << " s\n"
              << "c improvements: " << stats.improvements.size() << '\n';
    if (stats.nodes > 0) {
        std::cout << "c nodes: " << stats.nodes << ", pruned: " << stats.pruned
                  << ", conflicts: " << stats.conflicts
                  << ", propagations: " << stats.propagations << '\n';
    }
    if (stats.moves > 0) {
        std::cout << "c moves: " << stats.moves << ", accepted: " << stats.accepted
                  << ", rejected: " << stats.rejected
                  << ", temperature steps: " << stats.temperature_steps
                  << ", restarts: " << stats.restarts << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        std::cout << WeightSat::usage();
        return args.empty() ? 1 : 0;
    }

    try {
        WeightSat::CliOptions options = WeightSat::parse_options(args);

        WeightSat::Formula formula = WeightSat::parse_formula_file(options.input);
        std::cout << "c loaded " << options.input.string() << ": " << formula.numVars()
                  << " variables, " << formula.numClauses() << " clauses, total weight "
                  << formula.totalWeight() << std::endl;
        if (options.verbose) {
            std::cout << "c " << formula.toString() << std::endl;
        }

        auto solver = WeightSat::make_solver(options);
        std::cout << "c running " << solver->name() << std::endl;

        WeightSat::Result result = solver->run(formula);

        if (options.verbose) print_statistics(result.stats);
        WeightSat::printResult(std::cout, result, options.print_model);
        return exit_code(result.status);
    } catch (const std::exception& e) {
        std::cerr << "c weightsat ERROR: " << e.what() << std::endl;
        return 1;
    }
}
