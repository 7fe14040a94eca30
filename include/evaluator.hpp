#pragma once

#include <string>

#include "parser.hpp"

namespace logic {

// Полный результат обработки высказывания: дерево, таблица присваиваний и значение
struct Analysis {
    ParseResult parsed;
    bool value = false;
};

// Класс-фасад для вычисления логических высказываний.
// Объединяет этапы токенизации, парсинга и вычисления дерева.
// Не хранит состояния между вызовами.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;

    // Вычисляет значение высказывания, заданного строкой.
    // Пример: "p := 1 q := 0 p => q" -> false
    // Выбрасывает LexError, ParseError или EvalError
    bool evaluate(const std::string& statement) const;

    // То же, но возвращает также построенное дерево и таблицу присваиваний
    Analysis analyze(const std::string& statement) const;
};

} // namespace logic
