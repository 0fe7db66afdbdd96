#include "core/formula.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace WeightSat {

namespace {

// 1 -> A, 26 -> Z, 27 -> AA, ...
std::string variableName(Variable var) {
    std::string name;
    while (var > 0) {
        int rem = (var - 1) % 26;
        name.insert(name.begin(), static_cast<char>('A' + rem));
        var = (var - 1) / 26;
    }
    return name;
}

} // namespace

Formula::Formula(int num_vars, std::vector<Clause> clauses, std::vector<Weight> weights)
    : num_vars_(num_vars), clauses_(std::move(clauses)), weights_(std::move(weights))
{
    if (num_vars_ < 0) {
        throw std::invalid_argument("negative variable count");
    }
    if (weights_.size() != static_cast<std::size_t>(num_vars_)) {
        throw std::invalid_argument("weight vector has " + std::to_string(weights_.size()) +
                                    " entries, expected " + std::to_string(num_vars_));
    }
    for (std::size_t i = 0; i < weights_.size(); ++i) {
        if (weights_[i] < 0) {
            throw std::invalid_argument("negative weight for variable " + std::to_string(i + 1));
        }
        // total + 1 must stay representable.
        if (weights_[i] >= std::numeric_limits<Weight>::max() - total_weight_) {
            throw std::invalid_argument("weights overflow at variable " + std::to_string(i + 1));
        }
        total_weight_ += weights_[i];
        max_weight_ = std::max(max_weight_, weights_[i]);
    }

    occurrences_.resize(num_vars_);
    for (std::size_t c = 0; c < clauses_.size(); ++c) {
        Clause& clause = clauses_[c];
        if (clause.empty()) {
            throw std::invalid_argument("clause " + std::to_string(c + 1) + " is empty");
        }

        // A clause is a set of literals: drop repeats, keep first-seen order.
        Clause unique;
        unique.reserve(clause.size());
        for (const Literal& lit : clause) {
            if (lit.var < 1 || lit.var > num_vars_) {
                throw std::invalid_argument("clause " + std::to_string(c + 1) +
                                            " references variable " + std::to_string(lit.var) +
                                            " outside [1, " + std::to_string(num_vars_) + "]");
            }
            if (std::find(unique.begin(), unique.end(), lit) == unique.end()) {
                unique.push_back(lit);
            }
        }
        clause = std::move(unique);

        for (const Literal& lit : clause) {
            occurrences_[lit.var - 1].push_back(Occurrence{c, lit.polarity});
        }
    }
}

std::string Formula::toString() const {
    std::string out;
    for (std::size_t c = 0; c < clauses_.size(); ++c) {
        if (c > 0) out += " ^ ";
        out += '(';
        for (std::size_t i = 0; i < clauses_[c].size(); ++i) {
            const Literal& lit = clauses_[c][i];
            if (i > 0) out += " V ";
            if (!lit.polarity) out += '-';
            out += variableName(lit.var);
        }
        out += ')';
    }
    return out;
}

} // namespace WeightSat
