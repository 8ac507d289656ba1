#pragma once

#include "array.h"
#include "terms.h"
#include <string>
#include <vector>

namespace linsolve {

// ============================================================================
// Linear Equation
// ============================================================================

/**
 * @brief A coefficient and the free parameter it multiplies.
 *
 * The coefficient folds the numeric factors of a term with the values of its
 * constant symbols and is broadcast over samples.
 */
struct LinearTerm {
    Array coefficient;
    Symbol prm;
};

/**
 * @brief One equation that is linear in its free parameters.
 *
 * Every symbol that is not found in the constants is a free parameter, and
 * every term must contain exactly one of them. Terms are stored in canonical
 * order: numeric factors, constant symbols sorted by name, parameter last.
 */
class LinearEquation {
public:
    LinearEquation(const std::string& expression, const ArrayMap& constants = {});
    LinearEquation(const std::vector<Term>& terms, const ArrayMap& constants = {});

    const std::vector<Term>& terms() const { return terms_; }
    const ArrayMap& consts() const { return consts_; }
    const std::vector<std::string>& prms() const { return prms_; }

    /**
     * @brief Canonicalize factor order within each term.
     *
     * Throws NonLinearTerm when a term does not have exactly one parameter.
     */
    std::vector<Term> orderTerms(const std::vector<Term>& terms) const;

    // Coefficient/parameter pairs, one per term
    std::vector<LinearTerm> linearTerms() const;

    // Broadcast shape of the referenced constants
    Shape shape() const;

    bool hasConjugatedPrm() const;

    // Evaluate the equation for the given parameter values
    Array eval(const Solution& solution) const;

private:
    std::vector<Term> terms_;
    ArrayMap consts_;
    std::vector<std::string> prms_;

    void build(const std::vector<Term>& terms, const ArrayMap& constants);
};

}  // namespace linsolve
