#pragma once

#include "linsolve/config.h"
#include "linsolve/json_io.h"
#include "linsolve/product_solvers.h"
#include <optional>
#include <string>

namespace linsolve {

class LinsolveRunner {
public:
    LinsolveRunner(const std::string& inputFile);

    // Read the problem file; its "options" are applied on top of options
    bool load(SolverOptions& options);

    // Build the requested solver and solve the loaded problem
    bool run(const SolverOptions& options);

    // Model statistics, timing and outcome as a Markdown report
    std::string report() const;

    bool writeSolution(const std::string& path) const;

    struct PipelineTiming {
        double load_time_ms = 0.0;
        double build_time_ms = 0.0;
        double solve_time_ms = 0.0;
        double total_time_ms = 0.0;
    };

    // Accessors
    const Problem& getProblem() const { return problem_; }
    const Solution& getSolution() const { return solution_; }
    const Array& getChisq() const { return chisq_; }
    const std::optional<IterationResult>& getIterationResult() const { return iterationResult_; }
    const PipelineTiming& getTiming() const { return timing_; }
    const std::string& getErrorMessage() const { return errorMessage_; }

    bool isLoadSuccess() const { return loaded_; }
    bool isSolveSuccess() const { return solved_; }

    std::size_t getParameterCount() const { return parameterCount_; }

private:
    std::string inputFile_;
    Problem problem_;
    Solution solution_;
    Array chisq_;
    std::optional<IterationResult> iterationResult_;
    PipelineTiming timing_;
    std::string errorMessage_;
    std::size_t parameterCount_ = 0;
    bool loaded_ = false;
    bool solved_ = false;
};

}  // namespace linsolve
