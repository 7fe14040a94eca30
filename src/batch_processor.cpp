#include "batch_processor.hpp"

#include "errors.hpp"

#include <fstream>
#include <stdexcept>

namespace logic {

EvaluationRecord evaluateLine(const ExpressionEvaluator& evaluator, std::size_t lineNumber,
                              const std::string& text) {
    EvaluationRecord record;
    record.lineNumber = lineNumber;
    record.statement = text;

    if (text.find_first_not_of(" \t") == std::string::npos) {
        record.status = "error";
        record.message = "Пустая строка";
        return record;
    }

    try {
        record.value = evaluator.evaluate(text);
        record.status = "success";
    }
    catch (const LogicError& ex) {
        record.value.reset();
        record.status = "error";
        record.message = ex.what();
    }
    return record;
}

BatchSummary processStatementFile(const std::filesystem::path& inputPath,
                                  const ExpressionEvaluator& evaluator, CsvWriter& writer) {
    std::ifstream input(inputPath);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + inputPath.string());
    }

    BatchSummary summary;
    auto start = std::chrono::steady_clock::now();

    std::string line;
    std::size_t lineNumber = 1;
    while (std::getline(input, line)) {
        // Файлы с переводами строк Windows
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        EvaluationRecord record = evaluateLine(evaluator, lineNumber++, line);
        if (record.status == "success") {
            ++summary.succeeded;
        } else {
            ++summary.failed;
        }
        ++summary.total;
        writer.writeRecord(record);
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return summary;
}

} // namespace logic
