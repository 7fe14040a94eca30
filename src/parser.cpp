#include "parser.hpp"

#include "errors.hpp"

#include <utility>

namespace logic {

namespace {
// Приоритеты операторов: чем больше число, тем сильнее связывание.
// Скобки в таблицу не входят - открывающая скобка служит барьером на стеке
int precedence(OperatorKind kind) {
    switch (kind) {
    case OperatorKind::Equivalence:
        return 1;
    case OperatorKind::Implication:
        return 2;
    case OperatorKind::Or:
        return 3;
    case OperatorKind::And:
        return 4;
    case OperatorKind::Not:
        return 5;
    default:
        return 0;
    }
}

std::string quoted(OperatorKind kind) {
    return std::string("'") + operatorSymbol(kind) + "'";
}
}

Parser::Parser(Tokenizer& tokenizer) : tokenizer(tokenizer) {}

// Основной цикл: присваивания в начале, затем одно выражение
ParseResult Parser::parse() {
    reset();

    while (auto token = nextToken()) {
        if (assignmentsAllowed && token->type == TokenType::Variable) {
            const auto& following = peekToken();
            if (following && following->isOperator(OperatorKind::Assign)) {
                nextToken();
                parseAssignment(token->name);
                continue;
            }
        }
        // Первая лексема не из присваивания открывает выражение
        assignmentsAllowed = false;

        if (token->type == TokenType::Operator) {
            pushOperator(token->op);
        } else {
            pushValue(*token);
        }
    }

    ParseResult result;
    result.tree = finish();
    result.bindings = std::move(bindings);
    return result;
}

void Parser::reset() {
    lookahead.reset();
    operators = std::stack<OperatorKind>();
    nodes = std::stack<std::unique_ptr<AstNode>>();
    bindings = BindingsTable();
    expectOperand = true;
    assignmentsAllowed = true;
    openParentheses = 0;
}

std::optional<Token> Parser::nextToken() {
    if (lookahead) {
        std::optional<Token> token = std::move(lookahead);
        lookahead.reset();
        return token;
    }
    return tokenizer.next();
}

const std::optional<Token>& Parser::peekToken() {
    if (!lookahead) {
        lookahead = tokenizer.next();
    }
    return lookahead;
}

void Parser::parseAssignment(const std::string& name) {
    auto value = nextToken();
    if (!value) {
        throw ParseError("Ожидалось значение после ':=' для переменной '" + name + "'");
    }

    switch (value->type) {
    case TokenType::Literal:
        bindings.assign(name, value->literal);
        return;
    case TokenType::Variable: {
        // Переменная справа должна быть присвоена раньше
        auto resolved = bindings.lookup(value->name);
        if (!resolved) {
            throw ParseError("Переменной '" + name + "' присваивается неопределённая переменная '" +
                             value->name + "'");
        }
        bindings.assign(name, *resolved);
        return;
    }
    case TokenType::Operator:
        break;
    }
    throw ParseError("После '" + name + " :=' ожидался литерал или переменная, получено '" +
                     value->toString() + "'");
}

void Parser::pushValue(const Token& token) {
    if (!expectOperand) {
        throw ParseError("Ожидался оператор перед значением '" + token.toString() + "'");
    }

    if (token.type == TokenType::Literal) {
        nodes.push(std::make_unique<LiteralNode>(token.literal));
    } else {
        nodes.push(std::make_unique<VariableNode>(token.name));
    }
    expectOperand = false;
}

void Parser::pushOperator(OperatorKind kind) {
    switch (kind) {
    case OperatorKind::ParenOpen:
        if (!expectOperand) {
            throw ParseError("Ожидался оператор перед '('");
        }
        operators.push(kind);
        ++openParentheses;
        return;

    case OperatorKind::ParenClose:
        if (openParentheses == 0) {
            throw ParseError("Лишняя закрывающая скобка");
        }
        if (expectOperand) {
            throw ParseError("Ожидалось значение перед ')'");
        }
        closeParenthesis();
        return;

    case OperatorKind::Not:
        // Префиксный оператор: левого операнда ещё нет, стек не сворачивается
        if (!expectOperand) {
            throw ParseError("Оператор '~' не может стоять после значения");
        }
        operators.push(kind);
        return;

    case OperatorKind::Assign:
        throw ParseError("Присваивание ':=' допустимо только для переменной перед выражением");

    default:
        break;
    }

    // Бинарные операторы левоассоциативны: сворачиваем всё с приоритетом не ниже текущего
    if (expectOperand) {
        throw ParseError("Ожидалось значение перед оператором " + quoted(kind));
    }
    while (!operators.empty() && operators.top() != OperatorKind::ParenOpen &&
           precedence(operators.top()) >= precedence(kind)) {
        OperatorKind top = operators.top();
        operators.pop();
        reduce(top);
    }
    operators.push(kind);
    expectOperand = true;
}

void Parser::closeParenthesis() {
    while (!operators.empty() && operators.top() != OperatorKind::ParenOpen) {
        OperatorKind top = operators.top();
        operators.pop();
        reduce(top);
    }
    if (operators.empty()) {
        throw ParseError("Лишняя закрывающая скобка");
    }
    operators.pop();
    --openParentheses;
}

void Parser::reduce(OperatorKind op) {
    if (nodes.empty()) {
        throw ParseError("Оператору " + quoted(op) + " не хватает операнда");
    }
    auto right = popNode();

    if (op == OperatorKind::Not) {
        nodes.push(std::make_unique<UnaryNode>(op, std::move(right)));
        return;
    }

    if (nodes.empty()) {
        throw ParseError("Оператору " + quoted(op) + " требуется два операнда");
    }
    auto left = popNode();
    nodes.push(std::make_unique<BinaryNode>(op, std::move(left), std::move(right)));
}

std::unique_ptr<AstNode> Parser::popNode() {
    auto node = std::move(nodes.top());
    nodes.pop();
    return node;
}

std::unique_ptr<AstNode> Parser::finish() {
    if (nodes.empty() && operators.empty()) {
        throw ParseError("Пустое выражение");
    }
    if (expectOperand) {
        throw ParseError("Неожиданный конец выражения: ожидалось значение");
    }

    while (!operators.empty()) {
        OperatorKind top = operators.top();
        operators.pop();
        if (top == OperatorKind::ParenOpen) {
            throw ParseError("Не закрыта открывающая скобка");
        }
        reduce(top);
    }

    if (nodes.size() != 1) {
        throw ParseError("Внутренняя ошибка разбора: после свёртки осталось " +
                         std::to_string(nodes.size()) + " поддеревьев");
    }
    return popNode();
}

} // namespace logic
