#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

// Режим генерации высказываний: записывает count строк в outputPath.
// Глубина выражений чередуется от depth до depth + 3
void runGenerateMode(std::size_t count, const std::filesystem::path& outputPath, int depth,
                     std::optional<unsigned int> seed);
