#include "parser/parser.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace WeightSat {

namespace {

[[noreturn]] void fail(std::size_t line_no, const std::string& what) {
    throw std::runtime_error("line " + std::to_string(line_no) + ": " + what);
}

long long to_number(const std::string& token, std::size_t line_no) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(token, &used);
        if (used != token.size()) fail(line_no, "invalid number '" + token + "'");
        return value;
    } catch (const std::invalid_argument&) {
        fail(line_no, "invalid number '" + token + "'");
    } catch (const std::out_of_range&) {
        fail(line_no, "number out of range '" + token + "'");
    }
}

} // namespace

Formula parse_formula(std::istream& in) {
    std::optional<int> declared_vars;
    std::optional<std::vector<Weight>> weights;
    std::vector<Clause> clauses;
    Clause clause;
    int max_var = 0;

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;

        char kind = line[first];
        // Comments, and SATLIB's "%" end marker.
        if (kind == 'c') continue;
        if (kind == '%') break;

        std::stringstream ss(line.substr(first));
        std::string token;

        if (kind == 'p') {
            std::string fmt, vars, count;
            ss >> token >> fmt >> vars >> count;
            if (fmt != "cnf" || vars.empty() || count.empty()) {
                fail(line_no, "expected 'p cnf <vars> <clauses>'");
            }
            long long n = to_number(vars, line_no);
            if (n < 0) fail(line_no, "negative variable count");
            if (n > std::numeric_limits<int>::max()) fail(line_no, "variable count out of range " + vars);
            declared_vars = static_cast<int>(n);
            continue;
        }

        if (kind == 'w') {
            if (weights) fail(line_no, "duplicate weight line");
            ss >> token; // the 'w' itself
            std::vector<Weight> ws;
            bool terminated = false;
            while (ss >> token) {
                long long w = to_number(token, line_no);
                if (w == 0 && !(ss >> std::ws).good()) {
                    terminated = true;
                    break;
                }
                if (w < 0) fail(line_no, "negative weight " + token);
                ws.push_back(w);
            }
            if (!terminated) fail(line_no, "weight line must end with 0");
            weights = std::move(ws);
            continue;
        }

        while (ss >> token) {
            long long lit = to_number(token, line_no);
            if (lit == 0) {
                if (!clause.empty()) clauses.push_back(std::move(clause));
                clause.clear();
                continue;
            }
            if (lit > std::numeric_limits<int>::max() || lit < -std::numeric_limits<int>::max()) {
                fail(line_no, "literal out of range " + token);
            }
            Literal l = Literal::fromDimacs(static_cast<int>(lit));
            if (declared_vars && l.var > *declared_vars) {
                fail(line_no, "variable " + std::to_string(l.var) + " exceeds declared count " +
                                  std::to_string(*declared_vars));
            }
            max_var = std::max(max_var, l.var);
            clause.push_back(l);
        }
    }
    // Last clause may miss its terminating 0.
    if (!clause.empty()) clauses.push_back(std::move(clause));

    if (!weights) {
        throw std::runtime_error("missing weight line 'w ... 0'");
    }

    int num_vars = declared_vars ? *declared_vars
                                 : std::max(max_var, static_cast<int>(weights->size()));
    if (weights->size() != static_cast<std::size_t>(num_vars)) {
        throw std::runtime_error("weight line has " + std::to_string(weights->size()) +
                                 " weights for " + std::to_string(num_vars) + " variables");
    }

    try {
        return Formula(num_vars, std::move(clauses), std::move(*weights));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("invalid formula: ") + e.what());
    }
}

Formula parse_formula_file(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("could not open " + filename.string());
    }
    return parse_formula(file);
}

} // namespace WeightSat
