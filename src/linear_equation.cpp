#include "linsolve/linear_equation.h"
#include "linsolve/errors.h"
#include "linsolve/parser.h"
#include <algorithm>

namespace linsolve {

LinearEquation::LinearEquation(const std::string& expression, const ArrayMap& constants) {
    build(extractTerms(parseExpression(expression)), constants);
}

LinearEquation::LinearEquation(const std::vector<Term>& terms, const ArrayMap& constants) {
    build(terms, constants);
}

void LinearEquation::build(const std::vector<Term>& terms, const ArrayMap& constants) {
    // Keep only the constants this equation refers to
    for (const auto& term : terms) {
        for (const auto& factor : term) {
            if (!isSymbol(factor)) continue;
            const auto& name = std::get<Symbol>(factor).name;
            auto it = constants.find(name);
            if (it != constants.end()) consts_.emplace(name, it->second);
        }
    }

    terms_ = orderTerms(terms);

    for (const auto& term : terms_) {
        const auto& name = std::get<Symbol>(term.back()).name;
        if (std::find(prms_.begin(), prms_.end(), name) == prms_.end()) {
            prms_.push_back(name);
        }
    }
}

std::vector<Term> LinearEquation::orderTerms(const std::vector<Term>& terms) const {
    std::vector<Term> ordered;
    ordered.reserve(terms.size());

    for (const auto& term : terms) {
        Term numbers;
        std::vector<Symbol> constants;
        std::vector<Symbol> prms;
        for (const auto& factor : term) {
            if (isCoefficient(factor)) {
                numbers.push_back(factor);
                continue;
            }
            const auto& symbol = std::get<Symbol>(factor);
            if (consts_.count(symbol.name)) {
                constants.push_back(symbol);
            } else {
                prms.push_back(symbol);
            }
        }

        if (prms.size() != 1) {
            throw NonLinearTerm("Term '" + termToString(term) + "' has " + std::to_string(prms.size()) +
                                " free parameters; linear terms need exactly one");
        }

        std::sort(constants.begin(), constants.end());
        Term result = std::move(numbers);
        result.insert(result.end(), constants.begin(), constants.end());
        result.push_back(prms.front());
        ordered.push_back(std::move(result));
    }
    return ordered;
}

std::vector<LinearTerm> LinearEquation::linearTerms() const {
    std::vector<LinearTerm> result;
    result.reserve(terms_.size());
    for (const auto& term : terms_) {
        Array coefficient(termCoefficient(term));
        // Canonical order: every symbol but the last is a constant
        for (size_t i = 0; i + 1 < term.size(); ++i) {
            if (!isSymbol(term[i])) continue;
            const auto& symbol = std::get<Symbol>(term[i]);
            const Array& value = consts_.at(symbol.name);
            coefficient = coefficient * (symbol.conjugate ? value.conj() : value);
        }
        result.push_back({coefficient, std::get<Symbol>(term.back())});
    }
    return result;
}

Shape LinearEquation::shape() const {
    Shape shape;
    for (const auto& [name, value] : consts_) {
        shape = broadcastShapes(shape, value.shape());
    }
    return shape;
}

bool LinearEquation::hasConjugatedPrm() const {
    return std::any_of(terms_.begin(), terms_.end(), [](const Term& term) {
        return std::get<Symbol>(term.back()).conjugate;
    });
}

Array LinearEquation::eval(const Solution& solution) const {
    ArrayMap values = solution;
    for (const auto& [name, value] : consts_) {
        values.insert_or_assign(name, value);
    }
    return evaluateTerms(terms_, values);
}

}  // namespace linsolve
