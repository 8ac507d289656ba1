#include "linsolve/runner.h"
#include "linsolve/errors.h"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace linsolve {

LinsolveRunner::LinsolveRunner(const std::string& inputFile)
    : inputFile_(inputFile) {}

bool LinsolveRunner::load(SolverOptions& options) {
    auto t1 = std::chrono::high_resolution_clock::now();
    try {
        problem_ = loadProblem(inputFile_, options);
    } catch (const LinsolveError& e) {
        errorMessage_ = e.what();
        return false;
    }
    auto t2 = std::chrono::high_resolution_clock::now();
    timing_.load_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
    loaded_ = true;
    return true;
}

bool LinsolveRunner::run(const SolverOptions& options) {
    if (!loaded_) {
        errorMessage_ = "No problem loaded";
        return false;
    }

    auto pipeline_start = std::chrono::high_resolution_clock::now();
    decltype(pipeline_start) t1;
    decltype(pipeline_start) t2;

    try {
        switch (problem_.solver) {
            case SolverKind::Linear: {
                t1 = std::chrono::high_resolution_clock::now();
                LinearSolver solver(problem_.data, problem_.weights, problem_.constants, options.sparse);
                t2 = std::chrono::high_resolution_clock::now();
                timing_.build_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
                parameterCount_ = solver.prms().size();

                t1 = std::chrono::high_resolution_clock::now();
                solution_ = solver.solve(options.mode);
                chisq_ = solver.chisq(solution_);
                t2 = std::chrono::high_resolution_clock::now();
                break;
            }
            case SolverKind::LogProduct: {
                t1 = std::chrono::high_resolution_clock::now();
                LogProductSolver solver(problem_.data, problem_.weights, options.sparse);
                t2 = std::chrono::high_resolution_clock::now();
                timing_.build_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
                parameterCount_ = solver.ampSolver().prms().size();

                t1 = std::chrono::high_resolution_clock::now();
                solution_ = solver.solve(options.mode);
                // Chi-square against the original products
                chisq_ = LinProductSolver(problem_.data, solution_, problem_.weights, {}, options.sparse)
                             .chisq(solution_);
                t2 = std::chrono::high_resolution_clock::now();
                break;
            }
            case SolverKind::LinProduct: {
                if (problem_.initial.empty()) {
                    throw LinsolveError("The linproduct solver needs \"initial\" values");
                }
                t1 = std::chrono::high_resolution_clock::now();
                LinProductSolver solver(problem_.data, problem_.initial, problem_.weights,
                                        problem_.constants, options.sparse);
                t2 = std::chrono::high_resolution_clock::now();
                timing_.build_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
                parameterCount_ = solver.linearSolver().prms().size();

                t1 = std::chrono::high_resolution_clock::now();
                iterationResult_ = solver.solveIteratively(options);
                solution_ = iterationResult_->solution;
                chisq_ = solver.chisq(solution_);
                t2 = std::chrono::high_resolution_clock::now();
                if (options.verbose) {
                    std::cout << iterationResult_->toString();
                }
                break;
            }
        }
        timing_.solve_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
    } catch (const LinsolveError& e) {
        errorMessage_ = e.what();
        if (options.verbose) {
            std::cerr << "Solve failed: " << errorMessage_ << std::endl;
        }
        return false;
    }

    auto pipeline_end = std::chrono::high_resolution_clock::now();
    timing_.total_time_ms = timing_.load_time_ms +
                            std::chrono::duration<double, std::milli>(pipeline_end - pipeline_start).count();
    solved_ = true;

    if (options.verbose) {
        std::cout << std::fixed << std::setprecision(3)
                  << "Timing: build " << timing_.build_time_ms << " ms, solve " << timing_.solve_time_ms
                  << " ms, total " << timing_.total_time_ms << " ms" << std::endl;
    }
    return true;
}

bool LinsolveRunner::writeSolution(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << solutionToJSON(solution_) << "\n";
    return true;
}

std::string LinsolveRunner::report() const {
    std::ostringstream stats;
    stats << "# Linsolve Report\n\n";
    stats << "**Input file:** " << inputFile_ << "\n\n";

    stats << "## Model Statistics\n\n";
    stats << "| Metric | Value |\n";
    stats << "|--------|-------|\n";
    stats << "| Solver | " << solverKindToString(problem_.solver) << " |\n";
    stats << "| Equations | " << problem_.data.size() << " |\n";
    stats << "| Parameters | " << parameterCount_ << " |\n";
    stats << "| Constants | " << problem_.constants.size() << " |\n";
    stats << "| Weighted | " << (problem_.weights.empty() ? "No" : "Yes") << " |\n";

    if (solved_) {
        double worst = chisq_.size() == 0 ? 0.0 : chisq_.values().real().maxCoeff();
        stats << "| Status | SUCCESS |\n";
        stats << "| Max chisq | " << std::scientific << std::setprecision(6) << worst << " |\n";
        if (iterationResult_) {
            stats << "| Iterations | " << iterationResult_->iterations << " |\n";
            stats << "| Convergence | " << statusToString(iterationResult_->status) << " |\n";
        }
    } else if (!errorMessage_.empty()) {
        stats << "| Status | FAILED |\n";
        stats << "\n## Errors\n\n- " << errorMessage_ << "\n";
    }

    stats << "\n## Timing\n\n";
    stats << std::fixed << std::setprecision(3);
    stats << "| Stage | ms |\n";
    stats << "|-------|----|\n";
    stats << "| Load | " << timing_.load_time_ms << " |\n";
    stats << "| Build | " << timing_.build_time_ms << " |\n";
    stats << "| Solve | " << timing_.solve_time_ms << " |\n";
    stats << "| Total | " << timing_.total_time_ms << " |\n";
    return stats.str();
}

}  // namespace linsolve
