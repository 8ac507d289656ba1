#pragma once

#include "ast.h"
#include <memory>
#include <string>
#include <vector>

namespace linsolve {

// ============================================================================
// Expression Parser
// ============================================================================

/**
 * @brief PEG parser for the equation grammar.
 *
 * Accepts sums and products of numeric literals and identifiers with unary
 * minus/plus and parentheses:
 *
 *     3*x - y      a*x + a*b*c*y      2*x_*y_ + z*w - 1.0j*z*w
 *
 * Numbers may carry an exponent and a trailing 'j' for imaginary values.
 * Identifiers ending in '_' denote conjugated symbols.
 */
class ExpressionParser {
public:
    ExpressionParser();
    ~ExpressionParser();

    // Parse expression text into a tree. Throws ParseError.
    ExprPtr parse(const std::string& expression);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Parse with a per-thread shared parser instance
ExprPtr parseExpression(const std::string& expression);

// ============================================================================
// Utility functions
// ============================================================================

// Collect all symbols from an expression, in order of appearance
void collectSymbols(const ExprPtr& expr, std::vector<Symbol>& symbols);

// Convert AST to string representation (for debugging)
std::string astToString(const ExprPtr& expr);

}  // namespace linsolve
