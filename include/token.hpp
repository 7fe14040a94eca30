#pragma once

#include <string>

namespace logic {

// Виды операторов.
// Порядок перечисления не задаёт приоритет: таблица приоритетов находится в parser.cpp
enum class OperatorKind {
    Equivalence, // <=>
    Implication, // =>
    Or,          // v
    And,         // ^
    Not,         // ~
    ParenOpen,   // (
    ParenClose,  // )
    Assign       // :=
};

enum class TokenType {
    Literal,
    Variable,
    Operator
};

// Лексема высказывания.
// Позиция в исходной строке не хранится: ошибки лексера сообщают её сразу.
struct Token {
    TokenType type = TokenType::Literal;
    bool literal = false;                     // Значение для TokenType::Literal
    std::string name;                         // Имя для TokenType::Variable
    OperatorKind op = OperatorKind::And;      // Вид для TokenType::Operator

    static Token makeLiteral(bool value);
    static Token makeVariable(std::string variableName);
    static Token makeOperator(OperatorKind kind);

    bool isOperator(OperatorKind kind) const;

    // Текстовое представление: "1", "0", имя переменной или символ оператора
    std::string toString() const;

    bool operator==(const Token& other) const = default;
};

// Символ оператора в исходной записи ("^", "v", "<=>", ...)
const char* operatorSymbol(OperatorKind kind);

} // namespace logic
