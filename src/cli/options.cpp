#include "cli/options.hpp"

#include <sstream>
#include <stdexcept>

namespace WeightSat {

namespace {

template <typename T>
T convert(const std::string& param, const std::string& value) {
    std::istringstream ss(value);
    T result{};
    if (!(ss >> result) || !(ss >> std::ws).eof()) {
        throw std::invalid_argument("could not convert '" + value + "' for " + param);
    }
    return result;
}

bool to_bool(const std::string& param, const std::string& value) {
    if (value == "0") return false;
    if (value == "1") return true;
    throw std::invalid_argument(param + " expects 0 or 1, got '" + value + "'");
}

} // namespace

std::string usage() {
    return "c Usage: weightsat <instance> [<param> <value>]...\n"
           "c   -solver bnb|sa      search engine (default bnb)\n"
           "c   -verbose 0|1        print formula and statistics (default 0)\n"
           "c   -print-model 0|1    print the 'v' line (default 1)\n"
           "c branch and bound:\n"
           "c   -order asc|weight   variable order (default weight)\n"
           "c   -nodes N            node budget, 0 = unlimited\n"
           "c   -time S             time budget in seconds, 0 = unlimited\n"
           "c simulated annealing:\n"
           "c   -t0 T -alpha A -iters K -tmin T -max-iters N -stall S\n"
           "c   -seed N -restarts R -penalty P -time S\n"
           "c   -init random|false|true  -neighbor uniform|scan\n";
}

CliOptions parse_options(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("missing instance file");
    }
    if (args.size() % 2 == 0) {
        throw std::invalid_argument("parameters must come in <param> <value> pairs");
    }

    CliOptions options;
    options.input = args[0];
    // -time applies to whichever engine runs.
    double time_limit = 0.0;

    for (std::size_t i = 1; i < args.size(); i += 2) {
        const std::string& param = args[i];
        const std::string& value = args[i + 1];

        if (param == "-solver") {
            if (value == "bnb") options.solver = SolverKind::BranchAndBound;
            else if (value == "sa") options.solver = SolverKind::SimulatedAnnealing;
            else throw std::invalid_argument("unknown solver '" + value + "'");
        } else if (param == "-verbose") {
            options.verbose = to_bool(param, value);
        } else if (param == "-print-model") {
            options.print_model = to_bool(param, value);
        } else if (param == "-time") {
            time_limit = convert<double>(param, value);
        } else if (param == "-order") {
            if (value == "asc") options.bnb.order = VariableOrder::Ascending;
            else if (value == "weight") options.bnb.order = VariableOrder::DescendingWeight;
            else throw std::invalid_argument("unknown order '" + value + "'");
        } else if (param == "-nodes") {
            options.bnb.node_limit = convert<std::uint64_t>(param, value);
        } else if (param == "-t0") {
            options.annealing.initial_temperature = convert<double>(param, value);
        } else if (param == "-alpha") {
            options.annealing.cooling_rate = convert<double>(param, value);
        } else if (param == "-iters") {
            options.annealing.iterations_per_temperature = convert<std::uint64_t>(param, value);
        } else if (param == "-tmin") {
            options.annealing.min_temperature = convert<double>(param, value);
        } else if (param == "-max-iters") {
            options.annealing.max_iterations = convert<std::uint64_t>(param, value);
        } else if (param == "-stall") {
            options.annealing.stall_limit = convert<std::uint64_t>(param, value);
        } else if (param == "-seed") {
            options.annealing.seed = convert<std::uint32_t>(param, value);
        } else if (param == "-restarts") {
            options.annealing.restarts = convert<unsigned>(param, value);
        } else if (param == "-penalty") {
            options.annealing.penalty = convert<Weight>(param, value);
        } else if (param == "-init") {
            if (value == "random") options.annealing.initial_state = InitialState::Random;
            else if (value == "false") options.annealing.initial_state = InitialState::AllFalse;
            else if (value == "true") options.annealing.initial_state = InitialState::AllTrue;
            else throw std::invalid_argument("unknown initial state '" + value + "'");
        } else if (param == "-neighbor") {
            if (value == "uniform") options.annealing.neighbor = NeighborStrategy::UniformRandom;
            else if (value == "scan") options.annealing.neighbor = NeighborStrategy::RandomScan;
            else throw std::invalid_argument("unknown neighbor strategy '" + value + "'");
        } else {
            throw std::invalid_argument("unknown parameter '" + param + "'");
        }
    }

    options.bnb.time_limit = time_limit;
    options.annealing.time_limit = time_limit;
    options.bnb.validate();
    options.annealing.validate();
    return options;
}

std::unique_ptr<Solver> make_solver(const CliOptions& options) {
    if (options.solver == SolverKind::SimulatedAnnealing) {
        return std::make_unique<SimulatedAnnealing>(options.annealing);
    }
    return std::make_unique<BranchAndBound>(options.bnb);
}

} // namespace WeightSat
