#include "linsolve/product_solvers.h"
#include "linsolve/errors.h"
#include "linsolve/parser.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace linsolve {

// ============================================================================
// Log Product Solver
// ============================================================================

LogProductSolver::LogProductSolver(const ArrayMap& data, const ArrayMap& weights, bool sparse) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : data) keys.push_back(key);
    const ArrayMap verified = verifyWeights(weights, keys);

    std::vector<const Array*> typed;
    for (const auto& [key, value] : data) {
        typed.push_back(&value);
        typed.push_back(&verified.at(key));
    }
    dtype_ = inferDtype(typed);

    std::vector<Measurement> amp;
    std::vector<Measurement> phase;
    for (const auto& [key, value] : data) {
        const auto terms = extractTerms(parseExpression(key));
        if (terms.size() != 1) {
            throw NonLinearTerm("'" + key + "' is not a single product of parameters");
        }

        std::vector<Term> ampTerms;
        std::vector<Term> phaseTerms;
        for (const auto& factor : terms.front()) {
            if (!isSymbol(factor)) {
                throw NonLinearTerm("'" + key + "' has a numeric factor; only parameters may be multiplied");
            }
            const auto& symbol = std::get<Symbol>(factor);
            ampTerms.push_back(Term{Symbol(symbol.name)});
            if (symbol.conjugate) {
                phaseTerms.push_back(Term{Coefficient(-1.0), Symbol(symbol.name)});
            } else {
                phaseTerms.push_back(Term{Symbol(symbol.name)});
            }
        }

        const Array& weight = verified.at(key);
        amp.push_back({joinTerms(ampTerms), LinearEquation(ampTerms), value.abs().log(), weight});
        phase.push_back({joinTerms(phaseTerms), LinearEquation(phaseTerms), value.arg(), weight});
    }

    ampSolver_ = std::make_unique<LinearSolver>(std::move(amp), ArrayMap{}, sparse);
    phaseSolver_ = std::make_unique<LinearSolver>(std::move(phase), ArrayMap{}, sparse);
}

Solution LogProductSolver::solve(SolveMode mode) const {
    const Solution amp = ampSolver_->solve(mode);

    Solution result;
    if (!isComplexType(dtype_)) {
        for (const auto& [name, value] : amp) {
            result.emplace(name, value.exp().astype(dtype_));
        }
        return result;
    }

    const Solution phase = phaseSolver_->solve(mode);
    const Array i(Array::Scalar(0.0, 1.0));
    for (const auto& [name, value] : amp) {
        result.emplace(name, (value + i * phase.at(name)).exp().astype(dtype_));
    }
    return result;
}

// ============================================================================
// Iteration Diagnostics
// ============================================================================

std::string statusToString(SolverStatus status) {
    switch (status) {
        case SolverStatus::Converged: return "Converged";
        case SolverStatus::MaxIterations: return "MaxIterations";
        default: return "Unknown";
    }
}

static double maxValue(const Array& a) {
    return a.size() == 0 ? 0.0 : a.values().real().maxCoeff();
}

std::string IterationResult::toString() const {
    std::ostringstream ss;
    ss << std::scientific << std::setprecision(6);
    ss << "Iteration Summary (" << iterations << " iterations, " << statusToString(status) << ")\n";
    ss << std::setw(6) << "Iter"
       << std::setw(16) << "max chisq" << "\n";
    ss << std::string(22, '-') << "\n";

    for (size_t i = 0; i < chisq.size(); ++i) {
        ss << std::setw(6) << i + 1
           << std::setw(16) << maxValue(chisq[i]) << "\n";
    }
    ss << "Final convergence: " << maxValue(convergence) << "\n";
    return ss.str();
}

// Per sample: ||next - prev|| / ||next|| over all parameters
static Array relativeChange(const Solution& prev, const Solution& next) {
    Shape shape;
    for (const auto& [name, value] : next) {
        shape = broadcastShapes(shape, value.shape());
        shape = broadcastShapes(shape, prev.at(name).shape());
    }

    const auto n = static_cast<Eigen::Index>(shapeSize(shape));
    Eigen::ArrayXd change = Eigen::ArrayXd::Zero(n);
    Eigen::ArrayXd norm = Eigen::ArrayXd::Zero(n);
    for (const auto& [name, value] : next) {
        const Eigen::ArrayXcd a = value.broadcastTo(shape).values();
        const Eigen::ArrayXcd b = prev.at(name).broadcastTo(shape).values();
        change += (a - b).abs2();
        norm += a.abs2();
    }

    Eigen::ArrayXd ratio = (norm > 0.0).select((change / norm).sqrt(), change.sqrt());
    return Array(shape, ratio.cast<std::complex<double>>(), DType::Float64);
}

// ============================================================================
// Lin Product Solver
// ============================================================================

LinProductSolver::LinProductSolver(const ArrayMap& data,
                                   const Solution& sol0,
                                   const ArrayMap& weights,
                                   const ArrayMap& constants,
                                   bool sparse)
    : data_(data), consts_(constants), sol0_(sol0), sparse_(sparse) {
    for (const auto& [key, value] : data_) keys_.push_back(key);
    weights_ = verifyWeights(weights, keys_);

    std::set<std::string> constNames;
    for (const auto& [name, value] : consts_) constNames.insert(name);

    // Current estimate plus constants: everything but the perturbations
    ArrayMap values = sol0_;
    for (const auto& [name, value] : consts_) values.insert_or_assign(name, value);

    std::vector<Measurement> measurements;
    measurements.reserve(keys_.size());
    for (const auto& key : keys_) {
        auto terms = extractTerms(parseExpression(key));
        const auto expanded = taylorExpand(terms, constNames, kPerturbationPrefix);
        std::vector<Term> perturbation(expanded.begin() + static_cast<std::ptrdiff_t>(terms.size()),
                                       expanded.end());
        if (perturbation.empty()) {
            throw NonLinearTerm("'" + key + "' has no free parameters");
        }

        const Array residual = data_.at(key) - evaluateTerms(terms, values);
        measurements.push_back({joinTerms(perturbation), LinearEquation(perturbation, values), residual,
                                weights_.at(key)});
        terms_.push_back(std::move(terms));
    }

    ls_ = std::make_unique<LinearSolver>(std::move(measurements), values, sparse_);
}

void LinProductSolver::setPrmOrder(const std::map<std::string, int>& order) {
    std::map<std::string, int> perturbed;
    for (const auto& [name, column] : order) {
        perturbed.emplace(kPerturbationPrefix + name, column);
    }
    ls_->setPrmOrder(perturbed);
    prmOrder_ = order;
}

Solution LinProductSolver::solve(SolveMode mode) const {
    const Solution delta = ls_->solve(mode);
    const std::string prefix = kPerturbationPrefix;

    Solution result = sol0_;
    for (const auto& [name, value] : delta) {
        const std::string prm = name.substr(prefix.size());
        result.insert_or_assign(prm, sol0_.at(prm) + value);
    }
    return result;
}

IterationResult LinProductSolver::solveIteratively(const SolverOptions& options) const {
    IterationResult result;
    Solution current = sol0_;
    const double criterion = options.convergenceCriterion.value_or(dtypeResolution(dtype()));

    for (int iter = 1; iter <= options.maxIterations; ++iter) {
        Solution next;
        if (iter == 1) {
            next = solve(options.mode);
        } else {
            LinProductSolver step(data_, current, weights_, consts_, sparse_);
            if (prmOrder_) step.setPrmOrder(*prmOrder_);
            next = step.solve(options.mode);
        }

        result.iterations = iter;
        result.chisq.push_back(chisq(next));
        result.convergence = relativeChange(current, next);
        current = std::move(next);

        const double worst = maxValue(result.convergence);
        if (options.verbose) {
            std::cout << "LinProduct iter " << iter << ": max chisq = " << maxValue(result.chisq.back())
                      << ", convergence = " << worst << std::endl;
        }
        if (worst < criterion) {
            result.status = SolverStatus::Converged;
            break;
        }
    }

    if (options.verbose && result.status != SolverStatus::Converged) {
        std::cerr << "Warning: LinProduct stopped after " << result.iterations
                  << " iterations without converging" << std::endl;
    }
    result.solution = std::move(current);
    return result;
}

ArrayMap LinProductSolver::eval(const Solution& solution, const std::vector<std::string>& keys) const {
    ArrayMap values = solution;
    for (const auto& [name, value] : consts_) values.insert_or_assign(name, value);

    const std::vector<std::string>& wanted = keys.empty() ? keys_ : keys;
    ArrayMap result;
    for (const auto& key : wanted) {
        auto it = std::find(keys_.begin(), keys_.end(), key);
        if (it != keys_.end()) {
            result.insert_or_assign(key, evaluateTerms(terms_[static_cast<size_t>(it - keys_.begin())], values));
        } else {
            result.insert_or_assign(key, evaluateTerms(extractTerms(parseExpression(key)), values));
        }
    }
    return result;
}

Array LinProductSolver::chisq(const Solution& solution) const {
    const ArrayMap model = eval(solution);
    Array total(0.0);
    for (const auto& key : keys_) {
        const Array residual = (model.at(key) - data_.at(key)).abs();
        total = total + weights_.at(key) * residual * residual;
    }
    return total;
}

}  // namespace linsolve
