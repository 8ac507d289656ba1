#pragma once

#include "array.h"
#include "linear_equation.h"
#include <Eigen/Dense>
#include <array>
#include <map>
#include <string>
#include <vector>

namespace linsolve {

// ============================================================================
// Solve Modes
// ============================================================================

/**
 * @brief Least-squares strategies; all agree on a well-posed system.
 */
enum class SolveMode {
    Default,  // Dense: pseudo-inverse solve. Sparse: sparse least squares
    Lsqr,     // Iterative least squares
    Pinv,     // Pseudo-inverse of A^H A applied to A^H d
    Solve     // Direct solve of the normal equations
};

std::string modeToString(SolveMode mode);
SolveMode parseSolveMode(const std::string& name);

// ============================================================================
// Coefficient Tensor
// ============================================================================

/**
 * @brief Coefficients of shape (equations, parameters, samples).
 *
 * Stored as one dense (equations x parameters) matrix per flattened sample.
 */
class CoefficientTensor {
public:
    CoefficientTensor(std::size_t equations, std::size_t parameters, std::size_t samples);

    std::array<std::size_t, 3> shape() const { return {equations_, parameters_, slices_.size()}; }

    const Eigen::MatrixXcd& slice(std::size_t sample) const { return slices_[sample]; }
    Eigen::MatrixXcd& slice(std::size_t sample) { return slices_[sample]; }

    std::complex<double> operator()(std::size_t eq, std::size_t prm, std::size_t sample) const {
        return slices_[sample](static_cast<Eigen::Index>(eq), static_cast<Eigen::Index>(prm));
    }

private:
    std::size_t equations_;
    std::size_t parameters_;
    std::vector<Eigen::MatrixXcd> slices_;
};

// ============================================================================
// Linear Solver
// ============================================================================

/**
 * @brief One observation of a linear equation.
 *
 * The key labels the equation in eval() results; it need not be unique.
 */
struct Measurement {
    std::string key;
    LinearEquation equation;
    Array data;
    Array weight;
};

/**
 * @brief Weighted least-squares solver over a set of linear equations.
 *
 * Every flattened sample of the broadcast data/weight/constant shape is an
 * independent system sharing the same structure. Rows are scaled by the
 * square root of their weight so that minimizing ||A p - d||^2 implements
 * weighted least squares.
 *
 * When any parameter appears conjugated the equations are not linear over
 * the complex numbers. Each unknown is then split into real and imaginary
 * columns and each equation into real and imaginary rows; the working dtype
 * is the real counterpart and solutions are recombined into complex values.
 */
class LinearSolver {
public:
    /**
     * @brief Build from data keyed by equation text.
     *
     * @param data Expression -> measured value
     * @param weights Expression -> weight (empty for unit weights)
     * @param constants Constant name -> value
     * @param sparse Use a block-diagonal sparse system instead of per-sample
     *               dense solves
     */
    LinearSolver(const ArrayMap& data,
                 const ArrayMap& weights = {},
                 const ArrayMap& constants = {},
                 bool sparse = false);

    // Build from prepared measurements; keys may repeat.
    LinearSolver(std::vector<Measurement> measurements,
                 const ArrayMap& constants = {},
                 bool sparse = false);

    const std::vector<std::string>& keys() const { return keys_; }
    const std::vector<LinearEquation>& eqs() const { return eqs_; }
    const std::vector<std::string>& prms() const { return prms_; }
    ArrayMap data() const;

    DType dtype() const { return dtype_; }
    bool isSparse() const { return sparse_; }
    bool splitsRealImag() const { return splitReIm_; }
    const Shape& sampleShape() const { return sampleShape_; }

    // Parameter -> column; a bijection onto 0..n-1
    const std::map<std::string, int>& prmOrder() const { return prmOrder_; }
    void setPrmOrder(const std::map<std::string, int>& order);

    // (rows, columns, samples) of the assembled real or complex system
    std::array<std::size_t, 3> aShape() const;

    // Unweighted coefficient tensor, rebuilt on every call
    CoefficientTensor getA() const;

    /**
     * @brief Solve for every parameter.
     *
     * Throws UnderdeterminedSystem if there are more unknowns than equation
     * rows, or if SolveMode::Solve meets a singular normal matrix.
     */
    Solution solve(SolveMode mode = SolveMode::Default) const;

    /**
     * @brief Evaluate equations at a solution.
     *
     * @param keys Equations to evaluate (all if empty). A key that is not one
     *             of the solver's equations is parsed with the solver's
     *             constants.
     */
    ArrayMap eval(const Solution& solution, const std::vector<std::string>& keys = {}) const;

    // Sum over equations of weight * |eval - data|^2, per sample
    Array chisq(const Solution& solution) const;

private:
    std::vector<std::string> keys_;
    std::vector<LinearEquation> eqs_;
    std::vector<Array> data_;
    std::vector<Array> weights_;
    ArrayMap consts_;

    std::vector<std::string> prms_;
    std::map<std::string, int> prmOrder_;

    DType dtype_ = DType::Float32;
    bool sparse_ = false;
    bool splitReIm_ = false;
    Shape sampleShape_;

    struct AssembledTerm {
        Eigen::Index row;
        Eigen::Index col;
        bool conjugate;
        Eigen::ArrayXcd coefficient;  // Per sample, weight applied if requested
    };

    struct Assembly {
        std::vector<AssembledTerm> terms;
        std::vector<Eigen::ArrayXcd> data;  // Per equation, per sample
        Eigen::Index rows;
        Eigen::Index cols;
        Eigen::Index samples;
    };

    void initialize(std::vector<Measurement> measurements);
    Assembly assemble(bool weighted) const;

    template <typename Sink>
    void emitEntries(const AssembledTerm& term, Eigen::Index sample, Sink&& sink) const;
    void fillData(const Assembly& assembly, Eigen::Index sample,
                  Eigen::VectorXcd& d, Eigen::Index offset) const;

    Eigen::VectorXcd solveDense(const Eigen::MatrixXcd& A, const Eigen::VectorXcd& d,
                                SolveMode mode) const;
    Eigen::VectorXcd solveSparse(const Assembly& assembly, SolveMode mode) const;
    Solution unpack(const std::vector<Eigen::VectorXcd>& perSample) const;
};

}  // namespace linsolve
