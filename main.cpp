#include "linsolve/config.h"
#include "linsolve/errors.h"
#include "linsolve/runner.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <problem.json>\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <file>     Solution file (default: <input_dir>/<input_name>.solution.json)\n";
    std::cerr << "  -m, --mode <mode>       Solve mode: default, lsqr, pinv, solve\n";
    std::cerr << "  --sparse                Solve all samples as one sparse system\n";
    std::cerr << "  -c, --config <file>     Read solver options from a key = value file\n";
    std::cerr << "  -r, --report <file>     Write a Markdown report of the run\n";
    std::cerr << "  -v, --verbose           Print progress and timing\n";
    std::cerr << "  -h, --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string inputFile;
    std::string outputFile;
    std::string configFile;
    std::string reportFile;
    std::optional<linsolve::SolveMode> mode;
    bool sparse = false;
    bool verbose = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--sparse") {
            sparse = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                outputFile = argv[++i];
            } else {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
        } else if (arg == "-m" || arg == "--mode") {
            if (i + 1 < argc) {
                try {
                    mode = linsolve::parseSolveMode(argv[++i]);
                } catch (const linsolve::LinsolveError& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    return 1;
                }
            } else {
                std::cerr << "Error: -m requires an argument\n";
                return 1;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: -c requires an argument\n";
                return 1;
            }
        } else if (arg == "-r" || arg == "--report") {
            if (i + 1 < argc) {
                reportFile = argv[++i];
            } else {
                std::cerr << "Error: -r requires an argument\n";
                return 1;
            }
        } else if (arg[0] != '-') {
            inputFile = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (inputFile.empty()) {
        std::cerr << "Error: No input file specified\n";
        printUsage(argv[0]);
        return 1;
    }

    // Config file first, then the problem's own options, then command line flags
    linsolve::SolverOptions options;
    if (!configFile.empty() && !linsolve::loadSolverOptionsFromFile(configFile, options)) {
        std::cerr << "Error: Could not open config file: " << configFile << "\n";
        return 1;
    }

    linsolve::LinsolveRunner runner(inputFile);
    if (!runner.load(options)) {
        std::cerr << "Load failed: " << runner.getErrorMessage() << "\n";
        return 1;
    }
    if (mode) options.mode = *mode;
    if (sparse) options.sparse = true;
    if (verbose) options.verbose = true;

    bool runSuccess = runner.run(options);

    const auto& problem = runner.getProblem();
    std::cout << "=== Model Statistics ===\n";
    std::cout << "Solver: " << linsolve::solverKindToString(problem.solver) << "\n";
    std::cout << "Equations: " << problem.data.size() << "\n";
    std::cout << "Parameters: " << runner.getParameterCount() << "\n";
    std::cout << "Mode: " << linsolve::modeToString(options.mode) << (options.sparse ? " (sparse)" : "") << "\n";

    if (!reportFile.empty()) {
        std::ofstream report(reportFile);
        if (report.is_open()) {
            report << runner.report();
        } else {
            std::cerr << "Warning: Could not write report file: " << reportFile << "\n";
        }
    }

    if (!runSuccess) {
        std::cout << "\n=== Solver Error ===\n";
        std::cout << "Message: " << runner.getErrorMessage() << "\n";
        return 1;
    }

    if (const auto& iteration = runner.getIterationResult()) {
        std::cout << "\nSolver: " << linsolve::statusToString(iteration->status) << " ("
                  << iteration->iterations << " iterations)\n";
    } else {
        std::cout << "\nSolver: SUCCESS\n";
    }
    std::cout << "Time: " << std::fixed << std::setprecision(3) << runner.getTiming().total_time_ms << " ms\n";

    if (outputFile.empty()) {
        fs::path inputPath(inputFile);
        outputFile = (inputPath.parent_path() / (inputPath.stem().string() + ".solution.json")).string();
    }
    if (!runner.writeSolution(outputFile)) {
        std::cerr << "Error: Could not open output file: " << outputFile << "\n";
        return 1;
    }
    std::cout << "Solution: " << outputFile << "\n";

    return 0;
}
