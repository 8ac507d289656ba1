#pragma once

#include "config.h"
#include "linear_solver.h"
#include "terms.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace linsolve {

// ============================================================================
// Log Product Solver
// ============================================================================

/**
 * @brief Solves equations that are single products of parameters.
 *
 * Taking logarithms turns each product into a sum: log|d| = sum log|p| and
 * arg(d) = sum +-arg(p), with a minus sign for conjugated factors. The two
 * linear systems are solved separately and recombined as exp(amp + i*phase).
 *
 * Systems that only constrain relative phases leave the global phase free;
 * the minimum-norm solve sets it so that the phases sum to zero.
 */
class LogProductSolver {
public:
    LogProductSolver(const ArrayMap& data, const ArrayMap& weights = {}, bool sparse = false);

    const LinearSolver& ampSolver() const { return *ampSolver_; }
    const LinearSolver& phaseSolver() const { return *phaseSolver_; }

    // Dtype of data and weights; solutions come back in this type
    DType dtype() const { return dtype_; }

    // Only the amplitude system is solved when dtype() is real.
    Solution solve(SolveMode mode = SolveMode::Default) const;

private:
    DType dtype_;
    std::unique_ptr<LinearSolver> ampSolver_;
    std::unique_ptr<LinearSolver> phaseSolver_;
};

// ============================================================================
// Lin Product Solver
// ============================================================================

/**
 * @brief Status of an iterated solve.
 */
enum class SolverStatus {
    Converged,     // Relative change fell below the criterion for every sample
    MaxIterations  // Stopped at the iteration cap; solution is best effort
};

std::string statusToString(SolverStatus status);

/**
 * @brief Diagnostics and result of LinProductSolver::solveIteratively().
 */
struct IterationResult {
    int iterations = 0;
    SolverStatus status = SolverStatus::MaxIterations;
    std::vector<Array> chisq;  // One entry per iteration
    Array convergence;         // ||new - old|| / ||new|| of the last step, per sample
    Solution solution;

    std::string toString() const;
};

/**
 * @brief Gauss-Newton refinement of sums of products of parameters.
 *
 * Each equation is expanded to first order around the estimate sol0; the
 * perturbations (sol0 names with a "d" prefix) become the unknowns of one
 * LinearSolver whose data are the residuals d - f(sol0). One solve() is one
 * step; solveIteratively() repeats steps until the solution settles.
 */
class LinProductSolver {
public:
    LinProductSolver(const ArrayMap& data,
                     const Solution& sol0,
                     const ArrayMap& weights = {},
                     const ArrayMap& constants = {},
                     bool sparse = false);

    const LinearSolver& linearSolver() const { return *ls_; }
    const Solution& sol0() const { return sol0_; }
    const std::vector<std::string>& keys() const { return keys_; }
    DType dtype() const { return ls_->dtype(); }

    // Column order by original parameter name
    void setPrmOrder(const std::map<std::string, int>& order);

    // One linearized step: sol0 + perturbations
    Solution solve(SolveMode mode = SolveMode::Default) const;

    /**
     * @brief Repeat linearized steps until the relative change drops below
     * options.convergenceCriterion (default: dtypeResolution of dtype()).
     *
     * Every step keeps the sparse setting this solver was built with;
     * options.sparse only applies where solvers are constructed.
     */
    IterationResult solveIteratively(const SolverOptions& options = SolverOptions()) const;

    // Evaluate the original (unexpanded) equations
    ArrayMap eval(const Solution& solution, const std::vector<std::string>& keys = {}) const;

    // Sum over equations of weight * |eval - data|^2, per sample
    Array chisq(const Solution& solution) const;

private:
    static constexpr const char* kPerturbationPrefix = "d";

    std::vector<std::string> keys_;
    std::vector<std::vector<Term>> terms_;  // Original terms, per key
    ArrayMap data_;
    ArrayMap weights_;
    ArrayMap consts_;
    Solution sol0_;
    bool sparse_;
    std::optional<std::map<std::string, int>> prmOrder_;
    std::unique_ptr<LinearSolver> ls_;
};

}  // namespace linsolve
