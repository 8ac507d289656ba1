#include "linsolve/json_io.h"
#include "linsolve/errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace linsolve {

using nlohmann::json;

std::string solverKindToString(SolverKind kind) {
    switch (kind) {
        case SolverKind::Linear: return "linear";
        case SolverKind::LogProduct: return "logproduct";
        case SolverKind::LinProduct: return "linproduct";
        default: return "unknown";
    }
}

SolverKind parseSolverKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "linear") return SolverKind::Linear;
    if (lower == "logproduct") return SolverKind::LogProduct;
    if (lower == "linproduct") return SolverKind::LinProduct;
    throw LinsolveError("Unknown solver: " + name);
}

// ============================================================================
// Arrays
// ============================================================================

static bool isComplexLiteral(const json& j) {
    return j.is_object() && !j.contains("dtype") && (j.contains("re") || j.contains("im"));
}

static Array::Scalar scalarFromJSON(const json& j) {
    if (j.is_number()) return {j.get<double>(), 0.0};
    if (isComplexLiteral(j)) return {j.value("re", 0.0), j.value("im", 0.0)};
    throw LinsolveError("Expected a number or {\"re\", \"im\"} object, got " + j.dump());
}

static Array arrayFromValue(const json& j) {
    if (j.is_number() || isComplexLiteral(j)) {
        return Array(scalarFromJSON(j));
    }

    if (j.is_array()) {
        std::vector<Array::Scalar> values;
        bool complex = false;
        for (const auto& item : j) {
            complex = complex || !item.is_number();
            values.push_back(scalarFromJSON(item));
        }
        return Array(Shape{values.size()}, values, complex ? DType::Complex128 : DType::Float64);
    }

    if (j.is_object() && j.contains("dtype")) {
        const DType dtype = parseDType(j.at("dtype").get<std::string>());
        const auto real = j.at("real").get<std::vector<double>>();
        const auto imag = j.value("imag", std::vector<double>(real.size(), 0.0));
        if (imag.size() != real.size()) {
            throw ShapeMismatch("\"real\" has " + std::to_string(real.size()) + " values but \"imag\" has " +
                                std::to_string(imag.size()));
        }
        Shape shape = j.contains("shape") ? j.at("shape").get<Shape>() : Shape{real.size()};

        std::vector<Array::Scalar> values(real.size());
        for (size_t i = 0; i < real.size(); ++i) values[i] = {real[i], imag[i]};
        return Array(std::move(shape), values, dtype);
    }

    throw LinsolveError("Cannot read an array from " + j.dump());
}

static json arrayToValue(const Array& array) {
    json j;
    j["dtype"] = dtypeName(array.dtype());
    j["shape"] = array.shape();

    std::vector<double> real(array.size());
    std::vector<double> imag(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        real[i] = array[i].real();
        imag[i] = array[i].imag();
    }
    j["real"] = real;
    if (array.isComplex()) j["imag"] = imag;
    return j;
}

static ArrayMap arrayMapFromValue(const json& j, const char* member) {
    ArrayMap result;
    if (!j.contains(member)) return result;
    const json& object = j.at(member);
    if (!object.is_object()) {
        throw LinsolveError(std::string("\"") + member + "\" must be an object");
    }
    for (const auto& [key, value] : object.items()) {
        result.emplace(key, arrayFromValue(value));
    }
    return result;
}

Array arrayFromJSON(const std::string& text) {
    try {
        return arrayFromValue(json::parse(text));
    } catch (const json::exception& e) {
        throw LinsolveError(std::string("Invalid array JSON: ") + e.what());
    }
}

std::string arrayToJSON(const Array& array) {
    return arrayToValue(array).dump();
}

std::string solutionToJSON(const Solution& solution, int indent) {
    json j = json::object();
    for (const auto& [name, value] : solution) {
        j[name] = arrayToValue(value);
    }
    return j.dump(indent);
}

// ============================================================================
// Problems
// ============================================================================

static void applyOptions(const json& j, SolverOptions& options) {
    if (j.contains("mode")) options.mode = parseSolveMode(j.at("mode").get<std::string>());
    if (j.contains("sparse")) options.sparse = j.at("sparse").get<bool>();
    if (j.contains("maxIterations")) options.maxIterations = j.at("maxIterations").get<int>();
    if (j.contains("convergenceCriterion")) {
        options.convergenceCriterion = j.at("convergenceCriterion").get<double>();
    }
    if (j.contains("verbose")) options.verbose = j.at("verbose").get<bool>();
}

Problem parseProblem(const std::string& text, SolverOptions& options) {
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            throw LinsolveError("Problem must be a JSON object");
        }

        Problem problem;
        problem.solver = parseSolverKind(j.value("solver", std::string("linear")));
        problem.data = arrayMapFromValue(j, "data");
        problem.weights = arrayMapFromValue(j, "weights");
        problem.constants = arrayMapFromValue(j, "constants");
        problem.initial = arrayMapFromValue(j, "initial");
        if (problem.data.empty()) {
            throw LinsolveError("Problem has no \"data\"");
        }
        if (j.contains("options")) applyOptions(j.at("options"), options);
        return problem;
    } catch (const json::exception& e) {
        throw LinsolveError(std::string("Invalid problem JSON: ") + e.what());
    }
}

Problem loadProblem(const std::string& path, SolverOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LinsolveError("Could not open problem file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseProblem(buffer.str(), options);
}

}  // namespace linsolve
