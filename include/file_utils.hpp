#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Чтение всего файла в строку (высказывание может занимать несколько строк)
std::string readFile(const std::filesystem::path& path);

// Поиск корневой директории проекта (ищет папку samples или файл CMakeLists.txt)
std::filesystem::path findProjectRoot();

// Поиск всех .txt файлов в директории
std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();

// Путь к CSV с результатами по умолчанию: <имя входного файла>_results_<время>.csv рядом с ним
std::filesystem::path defaultResultsPath(const std::filesystem::path& inputPath);
