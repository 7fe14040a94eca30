#include "token.hpp"

#include <utility>

namespace logic {

Token Token::makeLiteral(bool value) {
    Token token;
    token.type = TokenType::Literal;
    token.literal = value;
    return token;
}

Token Token::makeVariable(std::string variableName) {
    Token token;
    token.type = TokenType::Variable;
    token.name = std::move(variableName);
    return token;
}

Token Token::makeOperator(OperatorKind kind) {
    Token token;
    token.type = TokenType::Operator;
    token.op = kind;
    return token;
}

bool Token::isOperator(OperatorKind kind) const {
    return type == TokenType::Operator && op == kind;
}

std::string Token::toString() const {
    switch (type) {
    case TokenType::Literal:
        return literal ? "1" : "0";
    case TokenType::Variable:
        return name;
    case TokenType::Operator:
        return operatorSymbol(op);
    }
    return "?";
}

const char* operatorSymbol(OperatorKind kind) {
    switch (kind) {
    case OperatorKind::Equivalence:
        return "<=>";
    case OperatorKind::Implication:
        return "=>";
    case OperatorKind::Or:
        return "v";
    case OperatorKind::And:
        return "^";
    case OperatorKind::Not:
        return "~";
    case OperatorKind::ParenOpen:
        return "(";
    case OperatorKind::ParenClose:
        return ")";
    case OperatorKind::Assign:
        return ":=";
    }
    return "?";
}

} // namespace logic
