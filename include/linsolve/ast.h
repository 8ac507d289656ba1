#pragma once

#include <complex>
#include <memory>
#include <string>
#include <variant>

namespace linsolve {

// Forward declarations
struct Expression;

// Type aliases for smart pointers
using ExprPtr = std::shared_ptr<Expression>;

// Trailing identifier character marking a conjugated symbol ("x_" = conj(x))
constexpr char kConjugateMarker = '_';

// ============================================================================
// Symbols
// ============================================================================

struct Symbol {
    std::string name;        // Bare name, marker stripped
    bool conjugate = false;

    Symbol() = default;
    Symbol(std::string name, bool conjugate = false)
        : name(std::move(name)), conjugate(conjugate) {}

    // Split a source identifier: "x_" -> {x, true}, "x" -> {x, false}
    static Symbol fromIdentifier(const std::string& identifier);

    // Source form, marker restored
    std::string toString() const;

    bool operator==(const Symbol& other) const {
        return name == other.name && conjugate == other.conjugate;
    }
    bool operator!=(const Symbol& other) const { return !(*this == other); }
    bool operator<(const Symbol& other) const {
        if (name != other.name) return name < other.name;
        return conjugate < other.conjugate;
    }
};

// ============================================================================
// Expression Types
// ============================================================================

struct NumberLiteral {
    std::complex<double> value;  // Imaginary literals such as 1.0j carry value.imag()
};

struct Variable {
    Symbol symbol;
};

struct UnaryOp {
    char op;  // '-', '+'
    ExprPtr operand;
};

struct BinaryOp {
    char op;  // '+', '-', '*'
    ExprPtr left;
    ExprPtr right;
};

// Expression is a variant of all possible expression types
struct Expression {
    std::variant<
        NumberLiteral,
        Variable,
        UnaryOp,
        BinaryOp
    > node;

    int sourceColumn = 0;  // For error reporting

    template<typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& as() const { return std::get<T>(node); }

    template<typename T>
    T& as() { return std::get<T>(node); }
};

// ============================================================================
// Helper functions for AST construction
// ============================================================================

inline ExprPtr makeNumber(std::complex<double> value, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = NumberLiteral{value};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeVariable(const std::string& identifier, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = Variable{Symbol::fromIdentifier(identifier)};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeUnaryOp(char op, ExprPtr operand, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = UnaryOp{op, std::move(operand)};
    expr->sourceColumn = column;
    return expr;
}

inline ExprPtr makeBinaryOp(char op, ExprPtr left, ExprPtr right, int column = 0) {
    auto expr = std::make_shared<Expression>();
    expr->node = BinaryOp{op, std::move(left), std::move(right)};
    expr->sourceColumn = column;
    return expr;
}

}  // namespace linsolve
