#pragma once

#include <memory>
#include <string>
#include <utility>

#include "bindings.hpp"
#include "token.hpp"

namespace logic {

// Базовый класс для узла дерева логического выражения.
// Узел единолично владеет своими потомками; после построения дерево не изменяется.
class AstNode {
public:
    virtual ~AstNode() = default;

    // Рекурсивно вычисляет значение поддерева.
    // Выбрасывает EvalError при неопределённой переменной или неполном узле
    virtual bool evaluate(const BindingsTable& bindings) const = 0;

    // Подпись узла: "1", "0", имя переменной или символ оператора
    virtual std::string label() const = 0;

    virtual bool isOperator() const = 0;

    // Потомки (nullptr, если отсутствуют). У отрицания единственный потомок - левый
    virtual const AstNode* leftChild() const { return nullptr; }
    virtual const AstNode* rightChild() const { return nullptr; }

    // Префиксная запись поддерева со скобками, например "(v (^ 1 0) 1)".
    // Одинаковые строки означают одинаковую форму деревьев
    virtual std::string toString() const = 0;
};

// Логическая константа 0 или 1 (лист дерева)
class LiteralNode final : public AstNode {
public:
    explicit LiteralNode(bool value) : value(value) {}

    bool evaluate(const BindingsTable&) const override { return value; }
    std::string label() const override { return value ? "1" : "0"; }
    bool isOperator() const override { return false; }
    std::string toString() const override { return label(); }

private:
    bool value;
};

// Ссылка на переменную (лист дерева), значение берётся из таблицы
class VariableNode final : public AstNode {
public:
    explicit VariableNode(std::string name) : name(std::move(name)) {}

    bool evaluate(const BindingsTable& bindings) const override;
    std::string label() const override { return name; }
    bool isOperator() const override { return false; }
    std::string toString() const override { return name; }

private:
    std::string name;
};

// Узел унарной операции (отрицание)
class UnaryNode final : public AstNode {
public:
    UnaryNode(OperatorKind op, std::unique_ptr<AstNode> child)
        : op(op), child(std::move(child)) {}

    bool evaluate(const BindingsTable& bindings) const override;
    std::string label() const override { return operatorSymbol(op); }
    bool isOperator() const override { return true; }
    const AstNode* leftChild() const override { return child.get(); }
    std::string toString() const override;

private:
    OperatorKind op;
    std::unique_ptr<AstNode> child;
};

// Узел бинарной логической операции (^, v, =>, <=>)
class BinaryNode final : public AstNode {
public:
    BinaryNode(OperatorKind op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
        : op(op), left(std::move(left)), right(std::move(right)) {}

    bool evaluate(const BindingsTable& bindings) const override;
    std::string label() const override { return operatorSymbol(op); }
    bool isOperator() const override { return true; }
    const AstNode* leftChild() const override { return left.get(); }
    const AstNode* rightChild() const override { return right.get(); }
    std::string toString() const override;

private:
    OperatorKind op;                // Вид операции
    std::unique_ptr<AstNode> left;  // Левый операнд
    std::unique_ptr<AstNode> right; // Правый операнд
};

} // namespace logic
