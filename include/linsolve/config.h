#pragma once

#include "linear_solver.h"
#include <optional>
#include <string>

namespace linsolve {

// ============================================================================
// Solver Options
// ============================================================================

/**
 * @brief Options shared by the linear and product solvers.
 */
struct SolverOptions {
    SolveMode mode = SolveMode::Default;          // Least-squares strategy
    bool sparse = false;                          // Block-diagonal system, applied when solvers are built
    int maxIterations = 50;                       // LinProductSolver::solveIteratively cap
    std::optional<double> convergenceCriterion;  // Unset: dtypeResolution of the working dtype
    bool verbose = false;                         // Print progress to stdout
};

/**
 * @brief Read "key = value" lines into options.
 *
 * Blank lines and lines starting with '#' are skipped. Recognized keys are
 * mode, sparse, maxIterations, convergenceCriterion and verbose; unknown keys
 * and bad values are reported on stderr and left at their current value.
 *
 * @return false if the file cannot be opened
 */
bool loadSolverOptionsFromFile(const std::string& path, SolverOptions& options);

}  // namespace linsolve
