/**
 * @file test_runner.cpp
 * @brief End-to-end runs of the example problems through LinsolveRunner.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "linsolve/runner.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace linsolve;
using Catch::Matchers::WithinAbs;

static fs::path getExamplesDir() {
    const char* env = std::getenv("LINSOLVE_EXAMPLES_DIR");
    if (env && env[0] != '\0') return fs::path(env);
    return fs::path("../examples");
}

static fs::path exampleFile(const std::string& name) {
    fs::path path = getExamplesDir() / name;
    if (!fs::exists(path)) {
        SKIP("Example not found: " << path.string());
    }
    return path;
}

static fs::path writeTempProblem(const std::string& name, const std::string& text) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream f(path);
    f << text;
    return path;
}

TEST_CASE("Run the linear example", "[runner]") {
    LinsolveRunner runner(exampleFile("linear.json").string());
    SolverOptions options;
    REQUIRE(runner.load(options));
    REQUIRE(runner.getProblem().solver == SolverKind::Linear);

    for (bool sparse : {false, true}) {
        options.sparse = sparse;
        REQUIRE(runner.run(options));
        REQUIRE(runner.isSolveSuccess());
        REQUIRE(runner.getParameterCount() == 2);

        const auto& sol = runner.getSolution();
        REQUIRE(sol.at("x").shape() == Shape{3});
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE_THAT(sol.at("x")[i].real(), WithinAbs(1.0, 1e-8));
            REQUIRE_THAT(sol.at("y")[i].real(), WithinAbs(2.0, 1e-8));
        }
        REQUIRE_THAT(runner.getChisq().values().real().maxCoeff(), WithinAbs(0.0, 1e-10));
    }
    REQUIRE_FALSE(runner.getIterationResult().has_value());
}

TEST_CASE("Run the logproduct example", "[runner]") {
    LinsolveRunner runner(exampleFile("logproduct.json").string());
    SolverOptions options;
    REQUIRE(runner.load(options));
    REQUIRE(runner.run(options));

    const auto& sol = runner.getSolution();
    REQUIRE(sol.size() == 3);
    REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(sol.at("x").item().imag(), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(sol.at("z").item().real(), WithinAbs(3.0, 1e-5));
    REQUIRE_THAT(sol.at("z").item().imag(), WithinAbs(3.0, 1e-5));
    REQUIRE_THAT(runner.getChisq().item().real(), WithinAbs(0.0, 1e-6));
}

TEST_CASE("Run the linproduct example", "[runner]") {
    LinsolveRunner runner(exampleFile("linproduct.json").string());
    SolverOptions options;
    REQUIRE(runner.load(options));
    // Options from the problem document
    REQUIRE(options.maxIterations == 20);
    REQUIRE(options.convergenceCriterion == 1e-12);

    REQUIRE(runner.run(options));
    const auto& iteration = runner.getIterationResult();
    REQUIRE(iteration.has_value());
    REQUIRE(iteration->status == SolverStatus::Converged);
    REQUIRE_THAT(runner.getSolution().at("x").item().real(), WithinAbs(1.5, 1e-8));
    REQUIRE_THAT(runner.getSolution().at("y").item().real(), WithinAbs(-0.5, 1e-8));

    const std::string report = runner.report();
    REQUIRE(report.find("| Solver | linproduct |") != std::string::npos);
    REQUIRE(report.find("| Convergence | Converged |") != std::string::npos);
}

TEST_CASE("Solutions are written as JSON", "[runner]") {
    fs::path problem = writeTempProblem("linsolve_test_write.json", R"({"data": {"x+y": 3, "x-y": -1}})");
    fs::path output = fs::temp_directory_path() / "linsolve_test_write.solution.json";

    LinsolveRunner runner(problem.string());
    SolverOptions options;
    REQUIRE(runner.load(options));
    REQUIRE(runner.run(options));
    REQUIRE(runner.writeSolution(output.string()));

    std::ifstream f(output);
    std::stringstream buffer;
    buffer << f.rdbuf();
    fs::remove(problem);
    fs::remove(output);

    Problem written = parseProblem(R"({"data": )" + buffer.str() + "}", options);
    REQUIRE(written.data.size() == 2);
    REQUIRE(written.data.at("x").dtype() == DType::Float32);
    REQUIRE_THAT(written.data.at("y").item().real(), WithinAbs(2.0, 1e-6));
}

TEST_CASE("Runner failures are reported", "[runner]") {
    SECTION("Missing file") {
        LinsolveRunner runner("/nonexistent/problem.json");
        SolverOptions options;
        REQUIRE_FALSE(runner.load(options));
        REQUIRE_FALSE(runner.run(options));
        REQUIRE_FALSE(runner.getErrorMessage().empty());
    }

    SECTION("Underdetermined problem") {
        fs::path problem = writeTempProblem("linsolve_test_under.json", R"({"data": {"x+y": 3}})");
        LinsolveRunner runner(problem.string());
        SolverOptions options;
        REQUIRE(runner.load(options));
        fs::remove(problem);

        REQUIRE_FALSE(runner.run(options));
        REQUIRE_FALSE(runner.isSolveSuccess());
        REQUIRE(runner.getErrorMessage().find("unknowns") != std::string::npos);
        REQUIRE(runner.report().find("| Status | FAILED |") != std::string::npos);
    }

    SECTION("Linproduct without a start point") {
        fs::path problem = writeTempProblem("linsolve_test_noinit.json",
                                            R"({"solver": "linproduct", "data": {"x*y": 1, "x": 1}})");
        LinsolveRunner runner(problem.string());
        SolverOptions options;
        REQUIRE(runner.load(options));
        fs::remove(problem);
        REQUIRE_FALSE(runner.run(options));
        REQUIRE(runner.getErrorMessage().find("initial") != std::string::npos);
    }
}
