#pragma once

#include "array.h"
#include "ast.h"
#include <complex>
#include <ostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace linsolve {

// ============================================================================
// Terms
// ============================================================================

using Coefficient = std::complex<double>;

// A factor is either a numeric coefficient or a (possibly conjugated) symbol.
using Factor = std::variant<Coefficient, Symbol>;

// A multiplicative chain of factors. A term without a numeric factor has an
// implicit coefficient of 1.
using Term = std::vector<Factor>;

inline bool isCoefficient(const Factor& factor) { return std::holds_alternative<Coefficient>(factor); }
inline bool isSymbol(const Factor& factor) { return std::holds_alternative<Symbol>(factor); }

/**
 * @brief Flatten an expression tree into a list of additive terms.
 *
 * Sums concatenate, differences negate the right-hand terms, unary minus
 * negates every term, and products distribute: each left term is joined with
 * each right term. A leading numeric literal stays as the term's coefficient.
 *
 *     3*x-y          -> [[3, x], [-1, y]]
 *     -a*x+a*b*c*y   -> [[-1, a, x], [a, b, c, y]]
 */
std::vector<Term> extractTerms(const ExprPtr& expr);

// Multiply a term by -1: scales a leading coefficient or inserts -1.
Term negateTerm(const Term& term);

/**
 * @brief First-order (product rule) expansion of a list of terms.
 *
 * Returns the original terms followed by one perturbation term per
 * occurrence of a non-constant symbol, in which that occurrence is renamed
 * prefix + name. Constants and numeric factors are never perturbed.
 *
 *     [[x, y, z]]              -> [[x,y,z], [dx,y,z], [x,dy,z], [x,y,dz]]
 *     [[1, y, z]], consts {y}  -> [[1,y,z], [1,y,dz]]
 */
std::vector<Term> taylorExpand(const std::vector<Term>& terms,
                               const std::set<std::string>& constants = {},
                               const std::string& prefix = "d");

// Source text of a term / term list, e.g. "-1*a*x + y_"
std::string termToString(const Term& term);
std::string joinTerms(const std::vector<Term>& terms);

// Product of the numeric factors of a term (1 if there are none)
Coefficient termCoefficient(const Term& term);

// Sum over terms of coefficient times the product of symbol values, each
// conjugated where flagged. Throws LinsolveError for a symbol with no value.
Array evaluateTerms(const std::vector<Term>& terms, const ArrayMap& values);

std::ostream& operator<<(std::ostream& os, const Symbol& symbol);

}  // namespace linsolve
