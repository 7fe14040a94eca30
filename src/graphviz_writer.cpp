#include "graphviz_writer.hpp"

#include <fstream>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace logic {

namespace {
// Описание вершины: операторы - прямоугольники, листья - просто подпись
void writeVertex(std::ostringstream& out, std::size_t id, const AstNode& node) {
    out << "    " << id << " [label=\"" << node.label() << "\"";
    if (node.isOperator()) {
        out << " shape=\"box\"";
    }
    out << "]\n";
}
}

GraphvizWriter::GraphvizWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {}

std::string GraphvizWriter::render(const AstNode& root) {
    std::ostringstream vertices;
    std::ostringstream edges;

    // Очередь обхода: (номер вершины, узел)
    std::queue<std::pair<std::size_t, const AstNode*>> pending;
    std::size_t nextId = 0;
    pending.emplace(nextId++, &root);

    while (!pending.empty()) {
        auto [id, node] = pending.front();
        pending.pop();
        writeVertex(vertices, id, *node);

        for (const AstNode* child : {node->leftChild(), node->rightChild()}) {
            if (child) {
                std::size_t childId = nextId++;
                edges << "    " << id << " -- " << childId << "\n";
                pending.emplace(childId, child);
            }
        }
    }

    return "graph G {\n" + vertices.str() + edges.str() + "}\n";
}

void GraphvizWriter::write(const AstNode& root) const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи графа: " + path.string());
    }
    stream << render(root);
    if (!stream) {
        throw std::runtime_error("Ошибка записи графа в файл: " + path.string());
    }
}

} // namespace logic
