#pragma once

#include <stdexcept>
#include <string>

namespace logic {

// Общая база всех диагностик конвейера (лексер -> парсер -> вычисление).
// Первая ошибка прерывает обработку высказывания.
class LogicError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Недопустимый символ или незавершённый составной оператор
class LexError : public LogicError {
public:
    using LogicError::LogicError;
};

// Синтаксическая ошибка: нарушено чередование значений и операторов,
// несогласованные скобки, пустое выражение, некорректное присваивание
class ParseError : public LogicError {
public:
    using LogicError::LogicError;
};

// Ошибка вычисления дерева
class EvalError : public LogicError {
public:
    using LogicError::LogicError;
};

// Обращение к переменной, которой не присвоено значение
class UndefinedVariableError final : public EvalError {
public:
    explicit UndefinedVariableError(const std::string& variableName)
        : EvalError("Неопределённая переменная '" + variableName + "'"), name(variableName) {}

    const std::string& variableName() const { return name; }

private:
    std::string name;
};

// Узлу дерева не хватает обязательного потомка
class MalformedTreeError final : public EvalError {
public:
    using EvalError::EvalError;
};

} // namespace logic
