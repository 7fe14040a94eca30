#include "console.hpp"

#include <iostream>

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Вычислитель логических высказываний v1.0               ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

void printTruthValue(bool value) {
    std::cout << Color::BOLD << (value ? Color::GREEN : Color::RED)
        << (value ? "1" : "0") << Color::RESET << "\n";
}
