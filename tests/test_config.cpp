/**
 * Tests for linsolve.conf loading (loadSolverOptionsFromFile).
 * Run from build directory; examples are expected at ../examples/.
 */

#include <catch2/catch_test_macros.hpp>
#include "linsolve/config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static fs::path getExamplesDir() {
    const char* env = std::getenv("LINSOLVE_EXAMPLES_DIR");
    if (env && env[0] != '\0') return fs::path(env);
    return fs::path("../examples");
}

TEST_CASE("Load examples/linsolve.conf", "[config]") {
    fs::path configPath = getExamplesDir() / "linsolve.conf";
    if (!fs::exists(configPath)) {
        SKIP("Examples linsolve.conf not found: " << configPath.string());
    }
    linsolve::SolverOptions options;
    bool loaded = linsolve::loadSolverOptionsFromFile(configPath.string(), options);
    REQUIRE(loaded);
    // File is all comments, so defaults are unchanged
    REQUIRE(options.maxIterations == 50);
    REQUIRE(options.mode == linsolve::SolveMode::Default);
    REQUIRE_FALSE(options.sparse);
}

TEST_CASE("Load non-existent config returns false", "[config]") {
    linsolve::SolverOptions options;
    bool loaded = linsolve::loadSolverOptionsFromFile("/nonexistent/linsolve.conf", options);
    REQUIRE_FALSE(loaded);
}

TEST_CASE("Config file options are applied", "[config]") {
    fs::path configPath = fs::temp_directory_path() / "linsolve_test_config.conf";
    std::ofstream f(configPath);
    REQUIRE(f.is_open());
    f << "# test\n"
      << "mode = pinv\n"
      << "sparse = yes\n"
      << "  maxIterations = 99  \n"
      << "convergenceCriterion = 1e-6\n"
      << "verbose = true\n";
    f.close();
    linsolve::SolverOptions options;
    bool loaded = linsolve::loadSolverOptionsFromFile(configPath.string(), options);
    fs::remove(configPath);
    REQUIRE(loaded);
    REQUIRE(options.mode == linsolve::SolveMode::Pinv);
    REQUIRE(options.sparse == true);
    REQUIRE(options.maxIterations == 99);
    REQUIRE(options.convergenceCriterion == 1e-6);
    REQUIRE(options.verbose == true);
}

TEST_CASE("Bad config lines keep the current value", "[config]") {
    fs::path configPath = fs::temp_directory_path() / "linsolve_test_bad_config.conf";
    std::ofstream f(configPath);
    REQUIRE(f.is_open());
    f << "mode = qr\n"
      << "sparse = maybe\n"
      << "maxIterations = many\n"
      << "tolerance = 1e-3\n"
      << "no equals sign\n"
      << "convergenceCriterion = 1e-8\n";
    f.close();
    linsolve::SolverOptions options;
    bool loaded = linsolve::loadSolverOptionsFromFile(configPath.string(), options);
    fs::remove(configPath);
    REQUIRE(loaded);
    REQUIRE(options.mode == linsolve::SolveMode::Default);
    REQUIRE_FALSE(options.sparse);
    REQUIRE(options.maxIterations == 50);
    REQUIRE(options.convergenceCriterion == 1e-8);
}
