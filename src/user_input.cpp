#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
std::string readLine() {
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод завершён");
    }
    return trim(input);
}

bool isNumber(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}
}

std::string trim(const std::string& value) {
    std::size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::size_t parseNumber(const std::string& value) {
    if (!isNumber(value)) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Слишком большое число: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::filesystem::path selectInputFile() {
    std::filesystem::path samplesDir = findProjectRoot() / "samples";
    auto txtFiles = findTxtFiles(samplesDir);

    if (txtFiles.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено .txt файлов в папке samples.\n";
        std::cout << "Директория: " << Color::CYAN << samplesDir << Color::RESET << "\n\n";
    }
    else {
        std::cout << Color::BOLD << "Найденные файлы с высказываниями:\n" << Color::RESET;
        for (std::size_t i = 0; i < txtFiles.size(); ++i) {
            std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
                << Color::YELLOW << txtFiles[i].filename().string() << Color::RESET << "\n";
        }
        std::cout << "\n";
    }

    std::cout << Color::BOLD << "Введите номер файла или путь до входного файла: " << Color::RESET;
    std::string input = readLine();
    if (input.empty()) {
        throw std::runtime_error("Пустой ввод");
    }

    if (isNumber(input) && !txtFiles.empty()) {
        std::size_t index = parseNumber(input);
        if (index > txtFiles.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return txtFiles[index - 1];
    }

    // Пользователь ввел путь
    std::filesystem::path inputPath = input;
    if (!std::filesystem::exists(inputPath)) {
        throw std::runtime_error("Файл не найден: " + inputPath.string());
    }
    return inputPath;
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Название по умолчанию (имя входного файла + _results_ + время)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Своё название\n\n";
    std::cout << Color::BOLD << "Ваш выбор (1 или 2): " << Color::RESET;

    std::string choice = readLine();
    if (choice == "1") {
        return defaultResultsPath(inputPath);
    }
    if (choice != "2") {
        throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
    }

    std::cout << Color::BOLD << "Введите название выходного файла (расширение .csv добавится автоматически): " << Color::RESET;
    std::string customName = readLine();
    if (customName.empty()) {
        throw std::runtime_error("Пустое название файла");
    }

    // Относительный путь отсчитывается от директории входного файла
    std::filesystem::path outputPath(customName);
    if (outputPath.is_relative()) {
        outputPath = inputPath.parent_path() / outputPath;
    }
    if (outputPath.extension() != ".csv") {
        outputPath.replace_extension(".csv");
    }
    return outputPath;
}

bool askContinue() {
    std::cout << Color::BOLD << "Обработать еще один файл? (y/n): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }

    input = trim(input);
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return input == "y" || input == "yes" || input == "д" || input == "да";
}
