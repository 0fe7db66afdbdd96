#ifndef WEIGHT_SAT_HPP_
#define WEIGHT_SAT_HPP_

// Everything a caller needs to load a weighted formula and run either engine.

#include "core/annealing.hpp"
#include "core/branch_and_bound.hpp"
#include "core/evaluator.hpp"
#include "core/formula.hpp"
#include "core/solver.hpp"
#include "parser/parser.hpp"

#endif // WEIGHT_SAT_HPP_
