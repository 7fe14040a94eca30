#pragma once

#include <filesystem>
#include <string>

#include "ast.hpp"

namespace logic {

// Запись дерева выражения в формате Graphviz DOT для отладки.
// Узлы нумеруются обходом в ширину начиная с 0; операторы рисуются прямоугольниками.
class GraphvizWriter {
public:
    explicit GraphvizWriter(std::filesystem::path targetPath);

    // Записывает граф в файл (перезаписывая его)
    void write(const AstNode& root) const;

    // Формирует текст графа "graph G { ... }"
    static std::string render(const AstNode& root);

private:
    std::filesystem::path path; // Путь к выходному файлу
};

} // namespace logic
