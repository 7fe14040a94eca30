#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>
#include <utility>

namespace logic {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Выделяет одну лексему, начиная с текущей позиции
std::optional<Token> Tokenizer::next() {
    while (true) {
        skipWhitespace();
        if (isAtEnd()) {
            return std::nullopt;
        }

        std::size_t start = index;
        char ch = advance();
        switch (ch) {
        // Односимвольные операторы
        case '^':
            return Token::makeOperator(OperatorKind::And);
        case 'v':
            // Единственная зарезервированная буква
            return Token::makeOperator(OperatorKind::Or);
        case '~':
            return Token::makeOperator(OperatorKind::Not);
        case '(':
            return Token::makeOperator(OperatorKind::ParenOpen);
        case ')':
            return Token::makeOperator(OperatorKind::ParenClose);

        // Литералы
        case '0':
            return Token::makeLiteral(false);
        case '1':
            return Token::makeLiteral(true);

        // Составные операторы
        case '<':
            return makeEquivalence(start);
        case '=':
            return makeImplication(start);
        case ':':
            if (match('=')) {
                return Token::makeOperator(OperatorKind::Assign);
            }
            // Одиночное двоеточие пропускается
            continue;

        default:
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                throw LexError("Недопустимая цифра '" + std::string(1, ch) + "' в позиции " +
                               std::to_string(start) + ": допустимы только 0 и 1");
            }
            if (std::isalpha(static_cast<unsigned char>(ch))) {
                return Token::makeVariable(std::string(1, ch));
            }
            throw LexError("Недопустимый символ '" + std::string(1, ch) + "' в позиции " +
                           std::to_string(start));
        }
    }
}

std::vector<Token> Tokenizer::tokenize() {
    reset();
    std::vector<Token> tokens;
    while (auto token = next()) {
        tokens.push_back(std::move(*token));
    }
    return tokens;
}

void Tokenizer::reset() {
    index = 0;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

bool Tokenizer::match(char expected) {
    if (isAtEnd() || peek() != expected) {
        return false;
    }
    ++index;
    return true;
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

Token Tokenizer::makeEquivalence(std::size_t start) {
    if (match('=') && match('>')) {
        return Token::makeOperator(OperatorKind::Equivalence);
    }
    throw LexError("Ожидался оператор '<=>' в позиции " + std::to_string(start));
}

Token Tokenizer::makeImplication(std::size_t start) {
    if (match('>')) {
        return Token::makeOperator(OperatorKind::Implication);
    }
    throw LexError("Ожидался оператор '=>' в позиции " + std::to_string(start));
}

} // namespace logic
