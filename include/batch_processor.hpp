#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "csv_writer.hpp"
#include "evaluator.hpp"

namespace logic {

// Итоги пакетной обработки файла
struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::chrono::milliseconds elapsed{0};
};

// Вычисляет одну строку файла. Ошибка вычисления попадает в запись, а не наружу
EvaluationRecord evaluateLine(const ExpressionEvaluator& evaluator, std::size_t lineNumber,
                              const std::string& text);

// Построчная обработка файла: каждая строка - отдельное высказывание.
// Результаты пишутся в CSV по мере вычисления
BatchSummary processStatementFile(const std::filesystem::path& inputPath,
                                  const ExpressionEvaluator& evaluator, CsvWriter& writer);

} // namespace logic
