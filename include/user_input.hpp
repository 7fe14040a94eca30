#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& value);

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Интерактивный выбор входного файла из папки samples или по пути
std::filesystem::path selectInputFile();

// Интерактивный выбор выходного CSV файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Запрос продолжения работы с другим файлом
bool askContinue();
