#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stack>
#include <string>

#include "ast.hpp"
#include "bindings.hpp"
#include "token.hpp"
#include "tokenizer.hpp"

namespace logic {

// Результат разбора: корень дерева и таблица присваиваний
struct ParseResult {
    std::unique_ptr<AstNode> tree;
    BindingsTable bindings;
};

// Класс синтаксического анализатора (парсера)
// Строит дерево выражения модифицированным алгоритмом сортировочной станции:
// вместо постфиксной очереди свёртка операторов сразу собирает поддеревья.
// Присваивания "p := 1", стоящие перед выражением, попадают в таблицу значений.
class Parser {
public:
    // Лексемы забираются у лексера по одной
    explicit Parser(Tokenizer& tokenizer);

    // Разбирает высказывание целиком.
    // Выбрасывает ParseError при синтаксических ошибках и пробрасывает LexError лексера
    ParseResult parse();

private:
    Tokenizer& tokenizer;
    std::optional<Token> lookahead;                // Предпросмотр на одну лексему

    std::stack<OperatorKind> operators;            // Ожидающие операторы и открывающие скобки
    std::stack<std::unique_ptr<AstNode>> nodes;    // Готовые поддеревья
    BindingsTable bindings;

    bool expectOperand = true;          // Следующей должна идти лексема-значение
    bool assignmentsAllowed = true;     // Выражение ещё не началось
    std::size_t openParentheses = 0;    // Незакрытые скобки на стеке операторов

    void reset();

    std::optional<Token> nextToken();
    const std::optional<Token>& peekToken();

    // Разбор правой части присваивания "name := <литерал | переменная>"
    void parseAssignment(const std::string& name);

    void pushValue(const Token& token);
    void pushOperator(OperatorKind kind);
    void closeParenthesis();

    // Снимает с вершины стека операнды для op и кладёт обратно собранный узел
    void reduce(OperatorKind op);

    std::unique_ptr<AstNode> popNode();

    // Сворачивает оставшиеся операторы и проверяет, что осталось ровно одно дерево
    std::unique_ptr<AstNode> finish();
};

} // namespace logic
