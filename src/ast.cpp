#include "ast.hpp"

#include "errors.hpp"

namespace logic {

namespace {
// Обозначение отсутствующего потомка в текстовой записи
constexpr const char* kMissing = "_";

std::string describe(const AstNode* node) {
    return node ? node->toString() : kMissing;
}
}

bool VariableNode::evaluate(const BindingsTable& bindings) const {
    auto value = bindings.lookup(name);
    if (!value) {
        throw UndefinedVariableError(name);
    }
    return *value;
}

// Вычисление отрицания
bool UnaryNode::evaluate(const BindingsTable& bindings) const {
    if (!child) {
        throw MalformedTreeError("Отрицанию не хватает операнда");
    }
    if (op != OperatorKind::Not) {
        throw MalformedTreeError(std::string("Неизвестная унарная операция '") + operatorSymbol(op) + "'");
    }
    return !child->evaluate(bindings);
}

std::string UnaryNode::toString() const {
    return "(" + label() + " " + describe(child.get()) + ")";
}

// Вычисление бинарной операции: сначала левый операнд, затем правый
bool BinaryNode::evaluate(const BindingsTable& bindings) const {
    if (!left && !right) {
        throw MalformedTreeError(std::string("Операции '") + operatorSymbol(op) + "' не хватает обоих операндов");
    }
    if (!left) {
        throw MalformedTreeError(std::string("Операции '") + operatorSymbol(op) + "' не хватает левого операнда");
    }
    if (!right) {
        throw MalformedTreeError(std::string("Операции '") + operatorSymbol(op) + "' не хватает правого операнда");
    }

    bool leftValue = left->evaluate(bindings);
    bool rightValue = right->evaluate(bindings);

    switch (op) {
    case OperatorKind::And:
        return leftValue && rightValue;
    case OperatorKind::Or:
        return leftValue || rightValue;
    case OperatorKind::Equivalence:
        return leftValue == rightValue;
    case OperatorKind::Implication:
        // Ложна только при истинной посылке и ложном следствии
        return !(leftValue && !rightValue);
    default:
        throw MalformedTreeError(std::string("Неизвестная бинарная операция '") + operatorSymbol(op) + "'");
    }
}

std::string BinaryNode::toString() const {
    return "(" + label() + " " + describe(left.get()) + " " + describe(right.get()) + ")";
}

} // namespace logic
