#include "linsolve/linear_solver.h"
#include "linsolve/errors.h"
#include <Eigen/IterativeLinearSolvers>
#include <Eigen/OrderingMethods>
#include <Eigen/SparseCore>
#include <Eigen/SparseLU>
#include <Eigen/SparseQR>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace linsolve {

using SparseMatrix = Eigen::SparseMatrix<std::complex<double>>;
using Triplet = Eigen::Triplet<std::complex<double>>;

namespace {

constexpr double kIterativeTolerance = 1e-14;
constexpr Eigen::Index kMinIterations = 1000;

// Least squares by conjugate gradients on the normal equations. Starting from
// zero with no preconditioning keeps the iterate in the row space of A, so a
// rank-deficient system converges to the minimum-norm solution.
template <typename Preconditioner>
Eigen::VectorXcd iterativeLeastSquares(const SparseMatrix& A, const Eigen::VectorXcd& d) {
    Eigen::LeastSquaresConjugateGradient<SparseMatrix, Preconditioner> lscg;
    lscg.setTolerance(kIterativeTolerance);
    lscg.setMaxIterations(std::max<Eigen::Index>(2 * A.cols(), kMinIterations));
    lscg.compute(A);
    Eigen::VectorXcd guess = Eigen::VectorXcd::Zero(A.cols());
    return lscg.solveWithGuess(d, guess);
}

Eigen::VectorXcd pinvNormalSolve(const Eigen::MatrixXcd& AtA, const Eigen::VectorXcd& Atd) {
    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXcd> cod(AtA);
    return cod.pseudoInverse() * Atd;
}

}  // namespace

// ============================================================================
// Solve Modes
// ============================================================================

std::string modeToString(SolveMode mode) {
    switch (mode) {
        case SolveMode::Default: return "default";
        case SolveMode::Lsqr: return "lsqr";
        case SolveMode::Pinv: return "pinv";
        case SolveMode::Solve: return "solve";
        default: return "unknown";
    }
}

SolveMode parseSolveMode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "default") return SolveMode::Default;
    if (lower == "lsqr") return SolveMode::Lsqr;
    if (lower == "pinv") return SolveMode::Pinv;
    if (lower == "solve") return SolveMode::Solve;
    throw LinsolveError("Unknown solve mode: " + name);
}

// ============================================================================
// Coefficient Tensor
// ============================================================================

CoefficientTensor::CoefficientTensor(std::size_t equations, std::size_t parameters, std::size_t samples)
    : equations_(equations), parameters_(parameters),
      slices_(samples, Eigen::MatrixXcd::Zero(static_cast<Eigen::Index>(equations),
                                               static_cast<Eigen::Index>(parameters))) {}

// ============================================================================
// Construction
// ============================================================================

LinearSolver::LinearSolver(const ArrayMap& data,
                           const ArrayMap& weights,
                           const ArrayMap& constants,
                           bool sparse)
    : consts_(constants), sparse_(sparse) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : data) keys.push_back(key);
    ArrayMap verified = verifyWeights(weights, keys);

    std::vector<Measurement> measurements;
    measurements.reserve(data.size());
    for (const auto& [key, value] : data) {
        measurements.push_back({key, LinearEquation(key, constants), value, verified.at(key)});
    }
    initialize(std::move(measurements));
}

LinearSolver::LinearSolver(std::vector<Measurement> measurements,
                           const ArrayMap& constants,
                           bool sparse)
    : consts_(constants), sparse_(sparse) {
    for (const auto& m : measurements) {
        if (m.weight.isComplex()) {
            throw InvalidWeights("Weight for '" + m.key + "' is complex");
        }
    }
    initialize(std::move(measurements));
}

void LinearSolver::initialize(std::vector<Measurement> measurements) {
    if (measurements.empty()) {
        throw LinsolveError("No equations to solve");
    }

    std::vector<const Array*> typed;
    for (auto& m : measurements) {
        if ((m.weight.values().real() < 0.0).any()) {
            throw InvalidWeights("Weight for '" + m.key + "' is negative");
        }

        keys_.push_back(std::move(m.key));
        eqs_.push_back(std::move(m.equation));
        data_.push_back(std::move(m.data));
        weights_.push_back(std::move(m.weight));
    }

    Shape shape;
    for (std::size_t i = 0; i < eqs_.size(); ++i) {
        shape = broadcastShapes(shape, data_[i].shape());
        shape = broadcastShapes(shape, weights_[i].shape());
        shape = broadcastShapes(shape, eqs_[i].shape());

        typed.push_back(&data_[i]);
        typed.push_back(&weights_[i]);
        for (const auto& [name, value] : eqs_[i].consts()) typed.push_back(&value);

        for (const auto& prm : eqs_[i].prms()) {
            if (prmOrder_.count(prm)) continue;
            prmOrder_.emplace(prm, static_cast<int>(prms_.size()));
            prms_.push_back(prm);
        }
        splitReIm_ = splitReIm_ || eqs_[i].hasConjugatedPrm();
    }
    sampleShape_ = shape;

    dtype_ = inferDtype(typed);
    if (splitReIm_) dtype_ = realCounterpart(dtype_);
}

ArrayMap LinearSolver::data() const {
    ArrayMap result;
    for (std::size_t i = 0; i < keys_.size(); ++i) result.emplace(keys_[i], data_[i]);
    return result;
}

void LinearSolver::setPrmOrder(const std::map<std::string, int>& order) {
    std::set<std::string> expected(prms_.begin(), prms_.end());
    std::set<std::string> provided;
    std::set<int> columns;
    for (const auto& [name, column] : order) {
        provided.insert(name);
        columns.insert(column);
    }

    const int n = static_cast<int>(prms_.size());
    bool valid = provided == expected && static_cast<int>(columns.size()) == n;
    if (valid && n > 0) valid = *columns.begin() == 0 && *columns.rbegin() == n - 1;
    if (!valid) {
        throw LinsolveError("Parameter order must map every parameter to a distinct column in [0, " +
                            std::to_string(n) + ")");
    }
    prmOrder_ = order;
}

// ============================================================================
// Assembly
// ============================================================================

std::array<std::size_t, 3> LinearSolver::aShape() const {
    const std::size_t factor = splitReIm_ ? 2 : 1;
    return {factor * eqs_.size(), factor * prms_.size(), shapeSize(sampleShape_)};
}

LinearSolver::Assembly LinearSolver::assemble(bool weighted) const {
    const auto shape = aShape();
    Assembly assembly;
    assembly.rows = static_cast<Eigen::Index>(shape[0]);
    assembly.cols = static_cast<Eigen::Index>(shape[1]);
    assembly.samples = static_cast<Eigen::Index>(shape[2]);

    for (std::size_t i = 0; i < eqs_.size(); ++i) {
        Eigen::ArrayXcd scale = Eigen::ArrayXcd::Ones(assembly.samples);
        if (weighted) {
            scale = weights_[i].broadcastTo(sampleShape_).values().real().sqrt().cast<std::complex<double>>();
        }

        for (const auto& term : eqs_[i].linearTerms()) {
            AssembledTerm assembled;
            assembled.row = static_cast<Eigen::Index>(i);
            assembled.col = prmOrder_.at(term.prm.name);
            assembled.conjugate = term.prm.conjugate;
            assembled.coefficient = term.coefficient.broadcastTo(sampleShape_).values() * scale;
            assembly.terms.push_back(std::move(assembled));
        }
        assembly.data.push_back(data_[i].broadcastTo(sampleShape_).values() * scale);
    }
    return assembly;
}

// Entries contributed by one term. In real/imaginary form a coefficient
// c = cr + i*ci acting on p = pr + i*pi contributes
//   p:       re row [cr, -ci], im row [ci,  cr]
//   conj(p): re row [cr,  ci], im row [ci, -cr]
template <typename Sink>
void LinearSolver::emitEntries(const AssembledTerm& term, Eigen::Index sample, Sink&& sink) const {
    const std::complex<double> c = term.coefficient(sample);
    if (!splitReIm_) {
        sink(term.row, term.col, c);
        return;
    }
    const double sign = term.conjugate ? -1.0 : 1.0;
    const Eigen::Index row = 2 * term.row;
    const Eigen::Index col = 2 * term.col;
    sink(row, col, c.real());
    sink(row, col + 1, -sign * c.imag());
    sink(row + 1, col, c.imag());
    sink(row + 1, col + 1, sign * c.real());
}

void LinearSolver::fillData(const Assembly& assembly, Eigen::Index sample,
                            Eigen::VectorXcd& d, Eigen::Index offset) const {
    for (std::size_t i = 0; i < assembly.data.size(); ++i) {
        const std::complex<double> value = assembly.data[i](sample);
        const auto row = static_cast<Eigen::Index>(i);
        if (splitReIm_) {
            d(offset + 2 * row) = value.real();
            d(offset + 2 * row + 1) = value.imag();
        } else {
            d(offset + row) = value;
        }
    }
}

CoefficientTensor LinearSolver::getA() const {
    const Assembly assembly = assemble(false);
    CoefficientTensor A(static_cast<std::size_t>(assembly.rows), static_cast<std::size_t>(assembly.cols),
                        static_cast<std::size_t>(assembly.samples));
    for (Eigen::Index s = 0; s < assembly.samples; ++s) {
        auto& slice = A.slice(static_cast<std::size_t>(s));
        for (const auto& term : assembly.terms) {
            emitEntries(term, s, [&](Eigen::Index r, Eigen::Index c, std::complex<double> v) {
                slice(r, c) += v;
            });
        }
    }
    return A;
}

// ============================================================================
// Solving
// ============================================================================

Solution LinearSolver::solve(SolveMode mode) const {
    const auto shape = aShape();
    if (shape[0] < shape[1]) {
        throw UnderdeterminedSystem(std::to_string(eqs_.size()) + " equations for " +
                                    std::to_string(prms_.size()) + " unknowns");
    }

    const Assembly assembly = assemble(true);
    std::vector<Eigen::VectorXcd> perSample;
    perSample.reserve(static_cast<std::size_t>(assembly.samples));

    if (sparse_) {
        Eigen::VectorXcd x = solveSparse(assembly, mode);
        for (Eigen::Index s = 0; s < assembly.samples; ++s) {
            perSample.push_back(x.segment(s * assembly.cols, assembly.cols));
        }
        return unpack(perSample);
    }

    Eigen::MatrixXcd A(assembly.rows, assembly.cols);
    Eigen::VectorXcd d(assembly.rows);
    for (Eigen::Index s = 0; s < assembly.samples; ++s) {
        A.setZero();
        for (const auto& term : assembly.terms) {
            emitEntries(term, s, [&](Eigen::Index r, Eigen::Index c, std::complex<double> v) {
                A(r, c) += v;
            });
        }
        fillData(assembly, s, d, 0);
        perSample.push_back(solveDense(A, d, mode));
    }
    return unpack(perSample);
}

Eigen::VectorXcd LinearSolver::solveDense(const Eigen::MatrixXcd& A, const Eigen::VectorXcd& d,
                                          SolveMode mode) const {
    switch (mode) {
        case SolveMode::Default:
            return A.completeOrthogonalDecomposition().solve(d);
        case SolveMode::Lsqr: {
            SparseMatrix S = A.sparseView();
            return iterativeLeastSquares<Eigen::LeastSquareDiagonalPreconditioner<std::complex<double>>>(S, d);
        }
        case SolveMode::Pinv: {
            const Eigen::MatrixXcd AtA = A.adjoint() * A;
            return pinvNormalSolve(AtA, A.adjoint() * d);
        }
        case SolveMode::Solve: {
            const Eigen::MatrixXcd AtA = A.adjoint() * A;
            Eigen::FullPivLU<Eigen::MatrixXcd> lu(AtA);
            if (!lu.isInvertible()) {
                throw UnderdeterminedSystem("Normal matrix is singular (rank " + std::to_string(lu.rank()) +
                                            " of " + std::to_string(AtA.cols()) + ")");
            }
            return lu.solve(A.adjoint() * d);
        }
    }
    throw LinsolveError("Unknown solve mode");
}

Eigen::VectorXcd LinearSolver::solveSparse(const Assembly& assembly, SolveMode mode) const {
    const Eigen::Index rows = assembly.rows * assembly.samples;
    const Eigen::Index cols = assembly.cols * assembly.samples;

    // Block diagonal: sample s occupies rows [s*m, (s+1)*m) and columns [s*n, (s+1)*n)
    std::vector<Triplet> triplets;
    triplets.reserve(assembly.terms.size() * static_cast<std::size_t>(assembly.samples) * (splitReIm_ ? 4 : 1));
    Eigen::VectorXcd d(rows);
    for (Eigen::Index s = 0; s < assembly.samples; ++s) {
        const Eigen::Index rowOffset = s * assembly.rows;
        const Eigen::Index colOffset = s * assembly.cols;
        for (const auto& term : assembly.terms) {
            emitEntries(term, s, [&](Eigen::Index r, Eigen::Index c, std::complex<double> v) {
                triplets.emplace_back(rowOffset + r, colOffset + c, v);
            });
        }
        fillData(assembly, s, d, rowOffset);
    }

    SparseMatrix A(rows, cols);
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();

    switch (mode) {
        case SolveMode::Default: {
            Eigen::SparseQR<SparseMatrix, Eigen::COLAMDOrdering<int>> qr;
            qr.compute(A);
            if (qr.info() == Eigen::Success && qr.rank() == cols) {
                return qr.solve(d);
            }
            // Rank deficient: minimum-norm solution instead
            return iterativeLeastSquares<Eigen::IdentityPreconditioner>(A, d);
        }
        case SolveMode::Lsqr:
            return iterativeLeastSquares<Eigen::LeastSquareDiagonalPreconditioner<std::complex<double>>>(A, d);
        case SolveMode::Pinv: {
            SparseMatrix At = A.adjoint();
            SparseMatrix AtA = At * A;
            Eigen::VectorXcd Atd = At * d;
            Eigen::VectorXcd x(cols);
            for (Eigen::Index s = 0; s < assembly.samples; ++s) {
                const Eigen::Index offset = s * assembly.cols;
                Eigen::MatrixXcd block = Eigen::MatrixXcd(AtA.block(offset, offset, assembly.cols, assembly.cols));
                x.segment(offset, assembly.cols) = pinvNormalSolve(block, Atd.segment(offset, assembly.cols));
            }
            return x;
        }
        case SolveMode::Solve: {
            SparseMatrix At = A.adjoint();
            SparseMatrix AtA = At * A;
            AtA.makeCompressed();
            Eigen::SparseLU<SparseMatrix, Eigen::COLAMDOrdering<int>> lu;
            lu.compute(AtA);
            if (lu.info() != Eigen::Success) {
                throw UnderdeterminedSystem("Normal matrix is singular: " + lu.lastErrorMessage());
            }
            Eigen::VectorXcd x = lu.solve(At * d);
            if (!x.allFinite()) {
                throw UnderdeterminedSystem("Normal matrix is singular");
            }
            return x;
        }
    }
    throw LinsolveError("Unknown solve mode");
}

Solution LinearSolver::unpack(const std::vector<Eigen::VectorXcd>& perSample) const {
    const DType outType = splitReIm_ ? complexCounterpart(dtype_) : dtype_;
    const auto samples = static_cast<Eigen::Index>(perSample.size());

    Solution solution;
    for (const auto& prm : prms_) {
        const Eigen::Index col = prmOrder_.at(prm);
        Eigen::ArrayXcd values(samples);
        for (Eigen::Index s = 0; s < samples; ++s) {
            const auto& x = perSample[static_cast<std::size_t>(s)];
            values(s) = splitReIm_ ? std::complex<double>(x(2 * col).real(), x(2 * col + 1).real()) : x(col);
        }
        solution.emplace(prm, Array(sampleShape_, std::move(values), outType));
    }
    return solution;
}

// ============================================================================
// Evaluation
// ============================================================================

ArrayMap LinearSolver::eval(const Solution& solution, const std::vector<std::string>& keys) const {
    const std::vector<std::string>& wanted = keys.empty() ? keys_ : keys;

    ArrayMap result;
    for (const auto& key : wanted) {
        if (result.count(key)) continue;
        auto it = std::find(keys_.begin(), keys_.end(), key);
        if (it != keys_.end()) {
            result.emplace(key, eqs_[static_cast<std::size_t>(it - keys_.begin())].eval(solution));
        } else {
            result.emplace(key, LinearEquation(key, consts_).eval(solution));
        }
    }
    return result;
}

Array LinearSolver::chisq(const Solution& solution) const {
    Array total(0.0);
    for (std::size_t i = 0; i < eqs_.size(); ++i) {
        const Array residual = (eqs_[i].eval(solution) - data_[i]).abs();
        total = total + weights_[i] * residual * residual;
    }
    return total;
}

}  // namespace linsolve
