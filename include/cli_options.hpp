#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Режим работы программы, выбранный аргументами командной строки
enum class Command {
    Interactive, // Без аргументов: выбор файла и пакетная обработка
    Eval,        // eval "<высказывание>"
    File,        // file <путь>: весь файл - одно высказывание
    Tokens,      // tokens "<высказывание>"
    Tree,        // tree "<высказывание>"
    Batch,       // batch <вход> [<выход.csv>]
    Generate,    // generate <количество> <выход>
    Help
};

struct CliOptions {
    Command command = Command::Interactive;
    std::string statement;                          // eval, tokens, tree
    std::filesystem::path inputPath;                // file, batch
    std::optional<std::filesystem::path> outputPath; // batch, generate
    std::optional<std::filesystem::path> dotPath;   // eval, file: --dot <файл>
    std::size_t count = 0;                          // generate: количество высказываний
    int depth = 4;                                  // generate: --depth N
    std::optional<unsigned int> seed;               // generate: --seed N
};

// Разбор аргументов (без имени программы).
// Выбрасывает std::runtime_error при неизвестной команде или недостающем аргументе
CliOptions parseArguments(const std::vector<std::string>& args);

// Текст справки по использованию
std::string usageText();
