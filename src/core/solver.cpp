#include "core/solver.hpp"

namespace WeightSat {

std::string toString(Status status) {
    switch (status) {
    case Status::Optimum:
        return "OPTIMUM FOUND";
    case Status::Unsatisfiable:
        return "UNSATISFIABLE";
    case Status::Feasible:
        return "SATISFIABLE";
    case Status::NoFeasibleFound:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

void printResult(std::ostream& out, const Result& result, bool print_model) {
    if (result.status == Status::NoFeasibleFound) {
        out << "c no feasible assignment found\n";
    }
    out << "s " << toString(result.status) << '\n';
    if (!result.hasSolution()) return;

    out << "o " << result.weight << '\n';
    if (print_model) {
        out << 'v';
        for (std::size_t i = 0; i < result.assignment.size(); ++i) {
            out << ' ' << (result.assignment[i] ? "" : "-") << i + 1;
        }
        out << " 0\n";
    }
}

} // namespace WeightSat
