#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "batch_processor.hpp"
#include "cli_options.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"
#include "generate_mode.hpp"
#include "graphviz_writer.hpp"
#include "tokenizer.hpp"
#include "user_input.hpp"

namespace {

    // Вычисление одного высказывания с выводом результата и, по запросу, графа
    void runEvaluation(const std::string& statement, const CliOptions& options) {
        logic::ExpressionEvaluator evaluator;
        logic::Analysis analysis = evaluator.analyze(statement);

        if (options.dotPath) {
            logic::GraphvizWriter(*options.dotPath).write(*analysis.parsed.tree);
            std::cout << Color::GRAY << "Граф записан в " << *options.dotPath << Color::RESET << "\n";
        }
        printTruthValue(analysis.value);
    }

    // Вывод потока лексем по одной в строке
    void printTokens(const std::string& statement) {
        logic::Tokenizer tokenizer(statement);
        for (const auto& token : tokenizer.tokenize()) {
            std::cout << token.toString() << "\n";
        }
    }

    // Вывод дерева, таблицы присваиваний и значения
    void printTree(const std::string& statement) {
        logic::ExpressionEvaluator evaluator;
        logic::Analysis analysis = evaluator.analyze(statement);

        std::cout << Color::BOLD << "Дерево:     " << Color::RESET << analysis.parsed.tree->toString() << "\n";
        std::cout << Color::BOLD << "Переменные: " << Color::RESET;
        if (analysis.parsed.bindings.empty()) {
            std::cout << Color::GRAY << "нет" << Color::RESET;
        }
        for (const auto& [name, value] : analysis.parsed.bindings.entries()) {
            std::cout << name << "=" << (value ? 1 : 0) << " ";
        }
        std::cout << "\n" << Color::BOLD << "Значение:   " << Color::RESET;
        printTruthValue(analysis.value);
    }

    // Пакетная обработка файла с выводом статистики
    void runBatch(const std::filesystem::path& inputPath, const std::filesystem::path& outputPath) {
        std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
        std::cout << "  Входной файл:  " << Color::YELLOW << inputPath << Color::RESET << "\n";
        std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

        logic::ExpressionEvaluator evaluator;
        logic::BatchSummary summary;
        {
            logic::CsvWriter writer(outputPath);
            summary = logic::processStatementFile(inputPath, evaluator, writer);
        }

        std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
        std::cout << "  Всего высказываний: " << Color::CYAN << summary.total << Color::RESET << "\n";
        std::cout << "  Успешно:            " << Color::GREEN << summary.succeeded << Color::RESET << "\n";
        if (summary.failed > 0) {
            std::cout << "  Ошибок:             " << Color::RED << summary.failed << Color::RESET << "\n";
        }
        std::cout << "  Время обработки:    " << Color::MAGENTA << summary.elapsed.count()
            << " мс" << Color::RESET << "\n\n";
        std::cout << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
    }

    // Интерактивный режим: выбор файла, пакетная обработка, повтор по запросу
    int runInteractive() {
        printHeader();

        bool continueProcessing = true;
        while (continueProcessing) {
            try {
                std::filesystem::path inputPath = selectInputFile();
                std::filesystem::path outputPath = selectOutputFile(inputPath);
                std::cout << "\n";
                runBatch(inputPath, outputPath);
            }
            catch (const std::exception& ex) {
                printError(ex.what());
                std::cerr << "\n";
            }

            continueProcessing = askContinue();
            if (continueProcessing) {
                std::cout << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
        return 0;
    }

    int run(const CliOptions& options) {
        switch (options.command) {
        case Command::Interactive:
            return runInteractive();
        case Command::Help:
            std::cout << usageText();
            return 0;
        case Command::Eval:
            runEvaluation(options.statement, options);
            return 0;
        case Command::File:
            runEvaluation(readFile(options.inputPath), options);
            return 0;
        case Command::Tokens:
            printTokens(options.statement);
            return 0;
        case Command::Tree:
            printTree(options.statement);
            return 0;
        case Command::Batch:
            runBatch(options.inputPath, options.outputPath.value_or(defaultResultsPath(options.inputPath)));
            return 0;
        case Command::Generate:
            runGenerateMode(options.count, *options.outputPath, options.depth, options.seed);
            return 0;
        }
        return 1;
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        CliOptions options = parseArguments(std::vector<std::string>(argv + 1, argv + argc));
        return run(options);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
}
