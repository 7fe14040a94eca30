#include "generate_mode.hpp"
#include "console.hpp"
#include "statement_generator.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

void runGenerateMode(std::size_t count, const std::filesystem::path& outputPath, int depth,
                     std::optional<unsigned int> seed) {
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество высказываний: " << Color::CYAN << count << Color::RESET << "\n";
    std::cout << "  Глубина:                 " << Color::CYAN << depth << ".." << depth + 3 << Color::RESET << "\n";
    std::cout << "  Выходной файл:           " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    auto start = std::chrono::steady_clock::now();

    logic::StatementGenerator generator = seed ? logic::StatementGenerator(*seed) : logic::StatementGenerator();
    std::ofstream output(outputPath, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    for (std::size_t i = 0; i < count; ++i) {
        output << generator.generate(depth + static_cast<int>(i % 4)) << "\n";

        // Показываем прогресс для больших файлов
        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << count
                << " высказываний сгенерировано..." << Color::RESET << std::flush;
        }
    }

    output.close();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << count << " высказываний, " << elapsed.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
