#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "linsolve/errors.h"
#include "linsolve/linear_solver.h"
#include <numeric>

using namespace linsolve;
using Catch::Matchers::WithinAbs;

static Array arange(std::size_t n, const Shape& shape) {
    std::vector<double> values(n);
    std::iota(values.begin(), values.end(), 0.0);
    return Array(shape, values, DType::Float64);
}

static void requireAll(const Array& actual, const Array& expected, double tol) {
    REQUIRE(actual.shape() == expected.shape());
    for (size_t i = 0; i < actual.size(); ++i) {
        REQUIRE_THAT(actual[i].real(), WithinAbs(expected[i].real(), tol));
        REQUIRE_THAT(actual[i].imag(), WithinAbs(expected[i].imag(), tol));
    }
}

static const SolveMode kAllModes[] = {SolveMode::Default, SolveMode::Lsqr, SolveMode::Pinv, SolveMode::Solve};

// ============================================================================
// Structure
// ============================================================================

TEST_CASE("LinearSolver basics", "[solver]") {
    const bool sparse = GENERATE(false, true);
    // x = 1, y = 2
    LinearSolver ls({{"x+y", Array(3.0)}, {"x-y", Array(-1.0)}}, {{"x+y", Array(1.0)}, {"x-y", Array(1.0)}}, {},
                    sparse);

    REQUIRE(ls.prms().size() == 2);
    REQUIRE(ls.eqs().size() == 2);
    REQUIRE(joinTerms(ls.eqs()[0].terms()) == "x + y");
    REQUIRE(joinTerms(ls.eqs()[1].terms()) == "x + -1*y");
    REQUIRE(ls.dtype() == DType::Float32);
    REQUIRE(ls.isSparse() == sparse);

    SECTION("Coefficient tensor") {
        ls.setPrmOrder({{"x", 0}, {"y", 1}});
        CoefficientTensor A = ls.getA();
        REQUIRE(A.shape() == std::array<std::size_t, 3>{2, 2, 1});
        REQUIRE(A(0, 0, 0) == Array::Scalar(1.0, 0.0));
        REQUIRE(A(0, 1, 0) == Array::Scalar(1.0, 0.0));
        REQUIRE(A(1, 0, 0) == Array::Scalar(1.0, 0.0));
        REQUIRE(A(1, 1, 0) == Array::Scalar(-1.0, 0.0));

        ls.setPrmOrder({{"x", 1}, {"y", 0}});
        REQUIRE(ls.getA()(1, 0, 0) == Array::Scalar(-1.0, 0.0));
    }

    SECTION("Invalid parameter orders") {
        REQUIRE_THROWS_AS(ls.setPrmOrder({{"x", 0}}), LinsolveError);
        REQUIRE_THROWS_AS(ls.setPrmOrder({{"x", 0}, {"y", 0}}), LinsolveError);
        REQUIRE_THROWS_AS(ls.setPrmOrder({{"x", 0}, {"z", 1}}), LinsolveError);
        REQUIRE_THROWS_AS(ls.setPrmOrder({{"x", 1}, {"y", 2}}), LinsolveError);
    }

    SECTION("Solve") {
        auto sol = ls.solve();
        REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(sol.at("y").item().real(), WithinAbs(2.0, 1e-6));
        REQUIRE(sol.at("x").dtype() == DType::Float32);
        REQUIRE(sol.at("x").isScalar());
    }

    SECTION("Every mode agrees") {
        for (SolveMode mode : kAllModes) {
            CAPTURE(modeToString(mode));
            auto sol = ls.solve(mode);
            REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(1.0, 1e-6));
            REQUIRE_THAT(sol.at("y").item().real(), WithinAbs(2.0, 1e-6));
        }
    }
}

TEST_CASE("A shape follows the broadcast of constants", "[solver]") {
    ArrayMap consts = {{"a", arange(10, {10})}, {"b", Array::full({1, 10}, 0.0, DType::Float64)}};
    LinearSolver ls({{"a*x+b*y", Array(0.0)}}, {{"a*x+b*y", Array(1.0)}}, consts);
    REQUIRE(ls.aShape() == std::array<std::size_t, 3>{1, 2, 10});
    REQUIRE(ls.sampleShape() == Shape{1, 10});
}

// ============================================================================
// Arrays, constants and weights
// ============================================================================

TEST_CASE("Solve arrays in every mode", "[solver]") {
    const bool sparse = GENERATE(false, true);
    Array x = arange(100, {10, 10});
    Array y = arange(100, {10, 10});
    ArrayMap data = {{"2*x+y", Array(2.0) * x + y}, {"-x+3*y", -x + Array(3.0) * y}};

    LinearSolver ls(data, {}, {}, sparse);
    REQUIRE(ls.dtype() == DType::Float64);
    for (SolveMode mode : kAllModes) {
        CAPTURE(modeToString(mode), sparse);
        auto sol = ls.solve(mode);
        requireAll(sol.at("x"), x, 1e-7);
        requireAll(sol.at("y"), y, 1e-7);
    }
}

TEST_CASE("Constant arrays", "[solver]") {
    const bool sparse = GENERATE(false, true);
    Array a(Shape{3}, std::vector<double>{3, 4, 5});
    Array b(Shape{3}, std::vector<double>{1, 2, 3});
    // x = 1, y = 2
    ArrayMap data = {{"a*x+y", a + Array(2.0)}, {"x+b*y", Array(1.0) + Array(2.0) * b}};

    LinearSolver ls(data, {}, {{"a", a}, {"b", b}}, sparse);
    auto sol = ls.solve();
    requireAll(sol.at("x"), Array::full({3}, 1.0, DType::Float64), 1e-7);
    requireAll(sol.at("y"), Array::full({3}, 2.0, DType::Float64), 1e-7);
}

TEST_CASE("Weight arrays", "[solver]") {
    const bool sparse = GENERATE(false, true);
    ArrayMap consts = {{"a", Array(3.0)}, {"b", Array(1.0)}};

    SECTION("Weights set the sample shape") {
        ArrayMap data = {{"a*x+y", Array(5.0)}, {"x+b*y", Array(3.0)}};
        Array ones = Array::full({4}, 1.0, DType::Float64);
        LinearSolver ls(data, {{"a*x+y", ones}, {"x+b*y", ones}}, consts, sparse);
        auto sol = ls.solve();
        requireAll(sol.at("x"), Array::full({4}, 1.0, DType::Float64), 1e-7);
        requireAll(sol.at("y"), Array::full({4}, 2.0, DType::Float64), 1e-7);
    }

    SECTION("Non-unity weights and constant arrays") {
        ArrayMap arrayConsts = {{"a", Array::full({4}, 3.0, DType::Float64)}, {"b", Array(1.0)}};
        ArrayMap data = {{"a*x+y", Array::full({4}, 5.0, DType::Float64)},
                         {"x+b*y", Array::full({4}, 3.0, DType::Float64)}};
        Array twos = Array::full({4}, 2.0, DType::Float64);
        LinearSolver ls(data, {{"a*x+y", twos}, {"x+b*y", twos}}, arrayConsts, sparse);
        auto sol = ls.solve();
        requireAll(sol.at("x"), Array::full({4}, 1.0, DType::Float64), 1e-7);
        requireAll(sol.at("y"), Array::full({4}, 2.0, DType::Float64), 1e-7);
    }

    SECTION("Negative weights are rejected") {
        ArrayMap data = {{"a*x+y", Array(5.0)}, {"x+b*y", Array(3.0)}};
        REQUIRE_THROWS_AS(LinearSolver(data, {{"a*x+y", Array(-1.0)}, {"x+b*y", Array(1.0)}}, consts, sparse),
                          InvalidWeights);
    }

    SECTION("Mismatched weight keys are rejected") {
        ArrayMap data = {{"a*x+y", Array(5.0)}, {"x+b*y", Array(3.0)}};
        REQUIRE_THROWS_AS(LinearSolver(data, {{"a*x+y", Array(1.0)}}, consts, sparse), InvalidWeights);
    }
}

TEST_CASE("Incompatible shapes", "[solver]") {
    ArrayMap data = {{"x+y", Array::full({3}, 1.0, DType::Float64)}, {"x-y", Array::full({4}, 1.0, DType::Float64)}};
    REQUIRE_THROWS_AS(LinearSolver(data), ShapeMismatch);
}

// ============================================================================
// Evaluation
// ============================================================================

TEST_CASE("LinearSolver eval", "[solver]") {
    const bool sparse = GENERATE(false, true);
    ArrayMap consts = {{"a", Array::full({4}, 3.0, DType::Float64)}, {"b", Array(1.0)}};
    ArrayMap data = {{"a*x+y", Array::full({4}, 5.0, DType::Float64)},
                     {"x+b*y", Array::full({4}, 3.0, DType::Float64)}};
    LinearSolver ls(data, {}, consts, sparse);
    auto sol = ls.solve();

    auto result = ls.eval(sol);
    REQUIRE(result.size() == 2);
    for (const auto& [key, value] : data) {
        requireAll(result.at(key), value, 1e-7);
    }

    // An expression that is not one of the equations
    auto extra = ls.eval(sol, {"a*x+b*y"});
    REQUIRE(extra.size() == 1);
    requireAll(extra.at("a*x+b*y"), Array::full({4}, 3.0 * 1 + 1 * 2, DType::Float64), 1e-7);
}

TEST_CASE("LinearSolver chisq", "[solver]") {
    const bool sparse = GENERATE(false, true);

    SECTION("Inconsistent equations") {
        LinearSolver ls({{"x", Array(1.0)}, {"a*x", Array(2.0)}}, {}, {{"a", Array(1.0)}}, sparse);
        auto sol = ls.solve();
        REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(1.5, 1e-6));
        REQUIRE_THAT(ls.chisq(sol).item().real(), WithinAbs(0.5, 1e-6));
    }

    SECTION("Same equation written twice") {
        LinearSolver ls({{"x", Array(1.0)}, {"1.0*x", Array(2.0)}}, {}, {}, sparse);
        auto sol = ls.solve();
        REQUIRE_THAT(ls.chisq(sol).item().real(), WithinAbs(0.5, 1e-6));
    }

    SECTION("Weighted") {
        LinearSolver ls({{"1*x", Array(2.0)}, {"x", Array(1.0)}}, {{"1*x", Array(1.0)}, {"x", Array(0.5)}}, {},
                        sparse);
        auto sol = ls.solve();
        REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(5.0 / 3.0, 1e-6));
        REQUIRE_THAT(ls.chisq(sol).item().real(), WithinAbs(1.0 / 3.0, 1e-6));
    }
}

// ============================================================================
// Precision and conjugates
// ============================================================================

TEST_CASE("LinearSolver dtypes", "[solver][dtype]") {
    const bool sparse = GENERATE(false, true);
    const Array::Scalar onePlusI(1.0, 1.0);

    SECTION("Conjugated unknown splits real and imaginary parts") {
        LinearSolver ls({{"x_", Array(onePlusI)}}, {}, {}, sparse);
        REQUIRE(ls.splitsRealImag());
        REQUIRE(ls.dtype() == DType::Float32);
        REQUIRE(ls.aShape() == std::array<std::size_t, 3>{2, 2, 1});
        auto x = ls.solve().at("x");
        REQUIRE(x.dtype() == DType::Complex64);
        REQUIRE_THAT(x.item().real(), WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(x.item().imag(), WithinAbs(-1.0, 1e-6));
    }

    SECTION("Complex data") {
        LinearSolver ls({{"x", Array(onePlusI)}}, {}, {}, sparse);
        REQUIRE(ls.dtype() == DType::Complex64);
        REQUIRE(ls.solve().at("x").dtype() == DType::Complex64);
    }

    SECTION("Typed complex64 data") {
        LinearSolver conj({{"x_", Array(1.0, DType::Complex64)}}, {}, {}, sparse);
        REQUIRE(conj.dtype() == DType::Float32);
        REQUIRE(conj.solve().at("x").dtype() == DType::Complex64);

        LinearSolver plain({{"x", Array(1.0, DType::Complex64)}}, {}, {}, sparse);
        REQUIRE(plain.dtype() == DType::Complex64);
        REQUIRE(plain.solve().at("x").dtype() == DType::Complex64);
    }

    SECTION("Complex constant") {
        LinearSolver ls({{"c*x", Array(1.0)}}, {}, {{"c", Array(onePlusI)}}, sparse);
        REQUIRE(ls.dtype() == DType::Complex64);
        auto x = ls.solve().at("x");
        REQUIRE(x.dtype() == DType::Complex64);
        REQUIRE_THAT(x.item().real(), WithinAbs(0.5, 1e-6));
        REQUIRE_THAT(x.item().imag(), WithinAbs(-0.5, 1e-6));
    }

    SECTION("Double precision weight promotes") {
        LinearSolver ls({{"c*x", Array(1.0, DType::Float32)}}, {{"c*x", Array(1.0, DType::Float64)}},
                        {{"c", Array(1.0, DType::Float32)}}, sparse);
        REQUIRE(ls.dtype() == DType::Float64);
        REQUIRE(ls.solve().at("x").dtype() == DType::Float64);
    }

    SECTION("Mixed conjugated and plain unknowns") {
        // x = 1 + 2i, y = 3 - i
        const Array::Scalar x(1.0, 2.0);
        const Array::Scalar y(3.0, -1.0);
        ArrayMap data = {{"x+y", Array(x + y)}, {"x_-y", Array(std::conj(x) - y)}, {"2*y_", Array(2.0 * std::conj(y))}};
        LinearSolver ls(data, {}, {}, sparse);
        auto sol = ls.solve();
        REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(1.0, 1e-5));
        REQUIRE_THAT(sol.at("x").item().imag(), WithinAbs(2.0, 1e-5));
        REQUIRE_THAT(sol.at("y").item().real(), WithinAbs(3.0, 1e-5));
        REQUIRE_THAT(sol.at("y").item().imag(), WithinAbs(-1.0, 1e-5));
    }
}

// ============================================================================
// Degenerate systems
// ============================================================================

TEST_CASE("Underdetermined systems", "[solver]") {
    const bool sparse = GENERATE(false, true);

    SECTION("More unknowns than equations") {
        LinearSolver ls({{"x+y", Array(1.0)}}, {}, {}, sparse);
        REQUIRE_THROWS_AS(ls.solve(), UnderdeterminedSystem);
    }

    SECTION("Rank deficient") {
        LinearSolver ls({{"x+y", Array(1.0)}, {"2*x+2*y", Array(2.0)}}, {}, {}, sparse);
        REQUIRE_THROWS_AS(ls.solve(SolveMode::Solve), UnderdeterminedSystem);

        // The default mode picks the minimum-norm solution
        auto sol = ls.solve();
        REQUIRE_THAT(sol.at("x").item().real(), WithinAbs(0.5, 1e-5));
        REQUIRE_THAT(sol.at("y").item().real(), WithinAbs(0.5, 1e-5));
    }
}

TEST_CASE("Solve mode names", "[solver]") {
    REQUIRE(parseSolveMode("lsqr") == SolveMode::Lsqr);
    REQUIRE(parseSolveMode("PINV") == SolveMode::Pinv);
    REQUIRE(modeToString(SolveMode::Solve) == "solve");
    REQUIRE_THROWS_AS(parseSolveMode("qr"), LinsolveError);
}
