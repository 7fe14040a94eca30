#include "evaluator.hpp"

#include "parser.hpp"
#include "tokenizer.hpp"

namespace logic {

bool ExpressionEvaluator::evaluate(const std::string& statement) const {
    return analyze(statement).value;
}

// Полный цикл обработки высказывания:
// 1. Токенизация (Tokenizer) - лексемы выдаются парсеру по одной
// 2. Парсинг (Parser) -> дерево и таблица присваиваний
// 3. Вычисление дерева с подстановкой значений переменных
Analysis ExpressionEvaluator::analyze(const std::string& statement) const {
    Tokenizer tokenizer(statement);
    Parser parser(tokenizer);

    Analysis analysis;
    analysis.parsed = parser.parse();
    analysis.value = analysis.parsed.tree->evaluate(analysis.parsed.bindings);
    return analysis;
}

} // namespace logic
