#include "linsolve/parser.h"
#include "linsolve/errors.h"
#include <peglib.h>
#include <sstream>
#include <stdexcept>

namespace linsolve {

// ============================================================================
// Errors and Symbols
// ============================================================================

ParseError::ParseError(const std::string& expression, int column, const std::string& message)
    : LinsolveError("Parse error in '" + expression + "' at column " + std::to_string(column) + ": " + message),
      expression_(expression),
      column_(column) {}

Symbol Symbol::fromIdentifier(const std::string& identifier) {
    if (identifier.size() > 1 && identifier.back() == kConjugateMarker) {
        return Symbol(identifier.substr(0, identifier.size() - 1), true);
    }
    return Symbol(identifier, false);
}

std::string Symbol::toString() const {
    return conjugate ? name + kConjugateMarker : name;
}

// ============================================================================
// Equation Grammar (PEG format)
// ============================================================================

// Unary minus binds tighter than '*', so "-a*x" is (-a)*x.
static const char* EQUATION_GRAMMAR = R"(
    Expression      <- Sum

    # Additive and multiplicative chains, left associative
    Sum             <- Product (AddOp Product)*
    Product         <- Signed ('*' Signed)*

    # Unary operators
    Signed          <- Negation / Positive / Primary
    Negation        <- '-' Signed
    Positive        <- '+' Signed

    Primary         <- '(' Sum ')' / Number / Identifier

    AddOp           <- < [-+] >

    # Numbers: integer, decimal, scientific notation, optional imaginary suffix
    Number          <- < ([0-9]+ ('.' [0-9]*)? / '.' [0-9]+) ([eE] [+-]? [0-9]+)? [jJ]? >

    # Identifiers; a trailing '_' marks the conjugate
    Identifier      <- < [a-zA-Z_] [a-zA-Z0-9_]* >

    %whitespace     <- [ \t\r\n]*
)";

// ============================================================================
// Parser Implementation
// ============================================================================

class ExpressionParser::Impl {
public:
    Impl() {
        initializeGrammar();
    }

    ExprPtr parse(const std::string& expression) {
        if (!grammarValid_) {
            throw ParseError(expression, 0, "Grammar initialization failed: " + errorMessage_);
        }

        expression_ = expression;
        errorColumn_ = 0;
        errorMessage_.clear();

        ExprPtr result;
        if (!parser_.parse(expression, result) || !result) {
            std::string message = errorMessage_.empty() ? "syntax error" : errorMessage_;
            throw ParseError(expression, errorColumn_, message);
        }
        return result;
    }

private:
    peg::parser parser_;
    bool grammarValid_ = false;
    std::string expression_;
    int errorColumn_ = 0;
    std::string errorMessage_;

    static int columnOf(const peg::SemanticValues& vs) {
        return static_cast<int>(vs.line_info().second);
    }

    void initializeGrammar() {
        parser_.set_logger([this](size_t /*line*/, size_t col, const std::string& msg) {
            errorColumn_ = static_cast<int>(col);
            errorMessage_ = msg;
        });

        grammarValid_ = parser_.load_grammar(EQUATION_GRAMMAR);
        if (!grammarValid_) return;

        parser_["Expression"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Sum"] = [](const peg::SemanticValues& vs) {
            auto result = std::any_cast<ExprPtr>(vs[0]);
            for (size_t i = 1; i + 1 < vs.size(); i += 2) {
                char op = std::any_cast<char>(vs[i]);
                auto rhs = std::any_cast<ExprPtr>(vs[i + 1]);
                result = makeBinaryOp(op, result, rhs, columnOf(vs));
            }
            return result;
        };

        parser_["Product"] = [](const peg::SemanticValues& vs) {
            auto result = std::any_cast<ExprPtr>(vs[0]);
            for (size_t i = 1; i < vs.size(); ++i) {
                result = makeBinaryOp('*', result, std::any_cast<ExprPtr>(vs[i]), columnOf(vs));
            }
            return result;
        };

        parser_["Signed"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["Negation"] = [](const peg::SemanticValues& vs) {
            return makeUnaryOp('-', std::any_cast<ExprPtr>(vs[0]), columnOf(vs));
        };

        parser_["Positive"] = [](const peg::SemanticValues& vs) {
            return makeUnaryOp('+', std::any_cast<ExprPtr>(vs[0]), columnOf(vs));
        };

        parser_["Primary"] = [](const peg::SemanticValues& vs) {
            return std::any_cast<ExprPtr>(vs[0]);
        };

        parser_["AddOp"] = [](const peg::SemanticValues& vs) {
            return static_cast<char>(vs.token()[0]);
        };

        parser_["Number"] = [this](const peg::SemanticValues& vs) {
            std::string token(vs.token());
            bool imaginary = !token.empty() && (token.back() == 'j' || token.back() == 'J');
            if (imaginary) token.pop_back();
            double value = 0.0;
            try {
                value = std::stod(token);
            } catch (const std::out_of_range&) {
                throw ParseError(expression_, columnOf(vs),
                                 "number '" + std::string(vs.token()) + "' is out of range");
            }
            std::complex<double> number = imaginary ? std::complex<double>(0.0, value)
                                                    : std::complex<double>(value, 0.0);
            return makeNumber(number, columnOf(vs));
        };

        parser_["Identifier"] = [](const peg::SemanticValues& vs) {
            return makeVariable(std::string(vs.token()), columnOf(vs));
        };
    }
};

// ============================================================================
// ExpressionParser Public Interface
// ============================================================================

ExpressionParser::ExpressionParser() : pImpl(std::make_unique<Impl>()) {}
ExpressionParser::~ExpressionParser() = default;

ExprPtr ExpressionParser::parse(const std::string& expression) {
    return pImpl->parse(expression);
}

ExprPtr parseExpression(const std::string& expression) {
    thread_local ExpressionParser parser;
    return parser.parse(expression);
}

// ============================================================================
// Utility Functions
// ============================================================================

void collectSymbols(const ExprPtr& expr, std::vector<Symbol>& symbols) {
    if (!expr) return;

    std::visit([&symbols](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, Variable>) {
            symbols.push_back(node.symbol);
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            collectSymbols(node.operand, symbols);
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            collectSymbols(node.left, symbols);
            collectSymbols(node.right, symbols);
        }
    }, expr->node);
}

static std::string numberToString(std::complex<double> value) {
    std::ostringstream ss;
    if (value.imag() == 0.0) {
        ss << value.real();
    } else if (value.real() == 0.0) {
        ss << value.imag() << "j";
    } else {
        ss << "(" << value.real() << (value.imag() < 0 ? "" : "+") << value.imag() << "j)";
    }
    return ss.str();
}

std::string astToString(const ExprPtr& expr) {
    if (!expr) return "<null>";

    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, NumberLiteral>) {
            return numberToString(node.value);
        } else if constexpr (std::is_same_v<T, Variable>) {
            return node.symbol.toString();
        } else if constexpr (std::is_same_v<T, UnaryOp>) {
            return std::string("(") + node.op + astToString(node.operand) + ")";
        } else if constexpr (std::is_same_v<T, BinaryOp>) {
            return "(" + astToString(node.left) + " " + node.op + " " + astToString(node.right) + ")";
        }
        return "<unknown>";
    }, expr->node);
}

}  // namespace linsolve
