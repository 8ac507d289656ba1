#include "linsolve/config.h"
#include "linsolve/errors.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace linsolve {

static std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

static bool parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    throw LinsolveError("Expected a boolean, got '" + value + "'");
}

bool loadSolverOptionsFromFile(const std::string& path, SolverOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": expected 'key = value'" << std::endl;
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        try {
            if (key == "mode") {
                options.mode = parseSolveMode(value);
            } else if (key == "sparse") {
                options.sparse = parseBool(value);
            } else if (key == "maxIterations") {
                options.maxIterations = std::stoi(value);
            } else if (key == "convergenceCriterion") {
                options.convergenceCriterion = std::stod(value);
            } else if (key == "verbose") {
                options.verbose = parseBool(value);
            } else {
                std::cerr << "Warning: " << path << ":" << lineNumber << ": unknown option '" << key << "'"
                          << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: " << path << ":" << lineNumber << ": bad value for '" << key
                      << "': " << e.what() << std::endl;
        }
    }
    return true;
}

}  // namespace linsolve
