#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
// Сравнение расширений файлов без учёта регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.size() != ext.size()) {
        return false;
    }
    return std::equal(pathExt.begin(), pathExt.end(), ext.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return contents.str();
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path(error);
    if (error) {
        return {};
    }

    // Поднимаемся вверх по директориям, пока не найдем папку samples или CMakeLists.txt
    while (!current.empty()) {
        if (std::filesystem::is_directory(current / "samples", error) ||
            std::filesystem::is_regular_file(current / "CMakeLists.txt", error)) {
            return current;
        }

        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            // Достигли корня файловой системы
            break;
        }
        current = parent;
    }

    return std::filesystem::current_path(error);
}

std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> txtFiles;

    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return txtFiles;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, error)) {
        if (entry.is_regular_file(error) && hasExtension(entry.path(), ".txt")) {
            txtFiles.push_back(entry.path());
        }
    }

    std::sort(txtFiles.begin(), txtFiles.end());
    return txtFiles;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::filesystem::path defaultResultsPath(const std::filesystem::path& inputPath) {
    return inputPath.parent_path() /
        (inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv");
}
