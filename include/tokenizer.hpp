#pragma once

#include <optional>
#include <string>
#include <vector>

#include "token.hpp"

namespace logic {

// Класс лексического анализатора (лексера)
// Преобразует строку с логическим высказыванием в последовательность лексем.
// Лексемы выдаются по одной, по требованию парсера. Пробельные символы игнорируются.
class Tokenizer {
public:
    // Конструктор принимает исходную строку высказывания
    explicit Tokenizer(std::string sourceText);

    // Возвращает очередную лексему или std::nullopt, если вход исчерпан.
    // Выбрасывает LexError при недопустимом символе или незавершённом операторе
    std::optional<Token> next();

    // Разбирает всю строку с начала и возвращает вектор лексем
    std::vector<Token> tokenize();

    // Возвращает чтение к началу строки
    void reset();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Сдвигает позицию, если текущий символ равен expected
    bool match(char expected);

    void skipWhitespace();

    // "<=>": после '<' обязательно должны идти '=' и '>'
    Token makeEquivalence(std::size_t start);

    // "=>": после '=' обязательно должен идти '>'
    Token makeImplication(std::size_t start);
};

} // namespace logic
