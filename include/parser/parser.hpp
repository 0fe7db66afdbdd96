#ifndef PARSER_PARSER_HPP
#define PARSER_PARSER_HPP

#include "core/formula.hpp"

#include <filesystem>
#include <istream>

namespace WeightSat {

/**
 * @brief Reads DIMACS CNF extended with a weight line "w w_1 ... w_n 0".
 *
 * Throws std::runtime_error, naming the offending line, on malformed input.
 */
Formula parse_formula(std::istream& in);

/**
 * @brief Opens filename and parses it with parse_formula.
 *
 * @param filename The path to the instance file.
 * @return The validated formula.
 */
Formula parse_formula_file(const std::filesystem::path& filename);

} // namespace WeightSat

#endif // PARSER_PARSER_HPP
