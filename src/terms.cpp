#include "linsolve/terms.h"
#include "linsolve/errors.h"
#include <iomanip>
#include <sstream>

namespace linsolve {

// ============================================================================
// Term Extraction
// ============================================================================

Term negateTerm(const Term& term) {
    Term result = term;
    if (!result.empty() && isCoefficient(result.front())) {
        result.front() = -std::get<Coefficient>(result.front());
    } else {
        result.insert(result.begin(), Coefficient(-1.0));
    }
    return result;
}

static std::vector<Term> negateTerms(const std::vector<Term>& terms) {
    std::vector<Term> result;
    result.reserve(terms.size());
    for (const auto& term : terms) result.push_back(negateTerm(term));
    return result;
}

// Distribute a product over both term lists
static std::vector<Term> multiplyTerms(const std::vector<Term>& left, const std::vector<Term>& right) {
    std::vector<Term> result;
    result.reserve(left.size() * right.size());
    for (const auto& l : left) {
        for (const auto& r : right) {
            Term product = l;
            product.insert(product.end(), r.begin(), r.end());
            result.push_back(std::move(product));
        }
    }
    return result;
}

std::vector<Term> extractTerms(const ExprPtr& expr) {
    if (!expr) {
        throw LinsolveError("Null expression pointer");
    }

    return std::visit([](const auto& node) -> std::vector<Term> {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            return {Term{Factor(node.value)}};
        } else if constexpr (std::is_same_v<T, Variable>) {
            return {Term{Factor(node.symbol)}};
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            auto terms = extractTerms(node.operand);
            if (node.op == '-') return negateTerms(terms);
            if (node.op == '+') return terms;
            throw LinsolveError(std::string("Unknown unary operator: ") + node.op);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            auto left = extractTerms(node.left);
            auto right = extractTerms(node.right);
            switch (node.op) {
                case '+':
                    left.insert(left.end(), right.begin(), right.end());
                    return left;
                case '-': {
                    auto negated = negateTerms(right);
                    left.insert(left.end(), negated.begin(), negated.end());
                    return left;
                }
                case '*':
                    return multiplyTerms(left, right);
                default:
                    throw LinsolveError(std::string("Unknown binary operator: ") + node.op);
            }
        }
        throw LinsolveError("Unknown expression type");
    }, expr->node);
}

// ============================================================================
// Taylor Expansion
// ============================================================================

std::vector<Term> taylorExpand(const std::vector<Term>& terms,
                               const std::set<std::string>& constants,
                               const std::string& prefix) {
    std::vector<Term> result(terms);
    for (const auto& term : terms) {
        for (size_t i = 0; i < term.size(); ++i) {
            if (!isSymbol(term[i])) continue;
            const auto& symbol = std::get<Symbol>(term[i]);
            if (constants.count(symbol.name)) continue;

            Term perturbed = term;
            perturbed[i] = Symbol(prefix + symbol.name, symbol.conjugate);
            result.push_back(std::move(perturbed));
        }
    }
    return result;
}

// ============================================================================
// Formatting and Evaluation
// ============================================================================

static std::string coefficientToString(Coefficient c) {
    std::ostringstream ss;
    ss << std::setprecision(15);
    if (c.imag() == 0.0) {
        ss << c.real();
    } else if (c.real() == 0.0) {
        ss << c.imag() << "j";
    } else {
        ss << "(" << c.real() << (c.imag() < 0 ? "" : "+") << c.imag() << "j)";
    }
    return ss.str();
}

std::string termToString(const Term& term) {
    std::string result;
    for (size_t i = 0; i < term.size(); ++i) {
        if (i > 0) result += "*";
        if (isCoefficient(term[i])) {
            result += coefficientToString(std::get<Coefficient>(term[i]));
        } else {
            result += std::get<Symbol>(term[i]).toString();
        }
    }
    return result;
}

std::string joinTerms(const std::vector<Term>& terms) {
    std::string result;
    for (size_t i = 0; i < terms.size(); ++i) {
        if (i > 0) result += " + ";
        result += termToString(terms[i]);
    }
    return result;
}

Coefficient termCoefficient(const Term& term) {
    Coefficient c(1.0, 0.0);
    for (const auto& factor : term) {
        if (isCoefficient(factor)) c *= std::get<Coefficient>(factor);
    }
    return c;
}

Array evaluateTerms(const std::vector<Term>& terms, const ArrayMap& values) {
    Array total(0.0);
    for (const auto& term : terms) {
        Array product(termCoefficient(term));
        for (const auto& factor : term) {
            if (!isSymbol(factor)) continue;
            const auto& symbol = std::get<Symbol>(factor);
            auto it = values.find(symbol.name);
            if (it == values.end()) {
                throw LinsolveError("No value for symbol: " + symbol.name);
            }
            product = product * (symbol.conjugate ? it->second.conj() : it->second);
        }
        total = total + product;
    }
    return total;
}

std::ostream& operator<<(std::ostream& os, const Symbol& symbol) {
    return os << symbol.toString();
}

}  // namespace linsolve
