#pragma once

#include "array.h"
#include "config.h"
#include <string>

namespace linsolve {

// ============================================================================
// Problem Files
// ============================================================================

enum class SolverKind {
    Linear,
    LogProduct,
    LinProduct
};

std::string solverKindToString(SolverKind kind);
SolverKind parseSolverKind(const std::string& name);

/**
 * @brief Inputs of one solve, as read from a JSON problem file.
 */
struct Problem {
    SolverKind solver = SolverKind::Linear;
    ArrayMap data;
    ArrayMap weights;    // Empty for unit weights
    ArrayMap constants;
    Solution initial;    // Starting point for the linearized product solver
};

/**
 * @brief Parse a problem document.
 *
 * Recognized members are "solver", "data", "weights", "constants", "initial"
 * and "options". Values in "options" are applied on top of the given options.
 * Throws LinsolveError on malformed JSON or values.
 */
Problem parseProblem(const std::string& text, SolverOptions& options);

// Read and parse a problem file. Throws LinsolveError if it cannot be read.
Problem loadProblem(const std::string& path, SolverOptions& options);

/**
 * @brief Parse one array value.
 *
 *     3                                          untyped real scalar
 *     {"re": 1, "im": 2}                         untyped complex scalar
 *     [1, 2, 3]                                  1-D float64
 *     {"dtype": "complex64", "shape": [2],
 *      "real": [1, 2], "imag": [0, 1]}           tagged array
 */
Array arrayFromJSON(const std::string& text);

// Tagged form; "imag" is written only for complex values.
std::string arrayToJSON(const Array& array);

// Object of tagged arrays, keyed by parameter name
std::string solutionToJSON(const Solution& solution, int indent = 2);

}  // namespace linsolve
