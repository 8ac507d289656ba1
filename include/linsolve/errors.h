#pragma once

#include <stdexcept>
#include <string>

namespace linsolve {

// ============================================================================
// Error Taxonomy
// ============================================================================

// Base class for every error raised by the library.
class LinsolveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed expression text.
class ParseError : public LinsolveError {
public:
    ParseError(const std::string& expression, int column, const std::string& message);

    const std::string& expression() const { return expression_; }
    int column() const { return column_; }

private:
    std::string expression_;
    int column_;
};

// A linear equation term with zero or several free parameters.
class NonLinearTerm : public LinsolveError {
public:
    using LinsolveError::LinsolveError;
};

// Weight keys do not match the data keys, or a weight is complex.
class InvalidWeights : public LinsolveError {
public:
    using LinsolveError::LinsolveError;
};

// Fewer equation rows than unknowns, or a singular normal matrix.
class UnderdeterminedSystem : public LinsolveError {
public:
    using LinsolveError::LinsolveError;
};

// Data, weight or constant shapes that cannot be broadcast together.
class ShapeMismatch : public LinsolveError {
public:
    using LinsolveError::LinsolveError;
};

}  // namespace linsolve
