// Генератор логических высказываний для тестирования пакетного режима.
// Высказывание начинается с присваиваний для всех использованных переменных,
// затем идёт выражение со скобками, отрицаниями и всеми бинарными операторами.
// С малой вероятностью вносит ошибки (незакрытая скобка, лишний символ,
// неопределённая переменная).

#pragma once

#include <random>
#include <set>
#include <string>
#include <vector>

namespace logic {

// Переменные, из которых собираются высказывания ('v' зарезервирована под "или")
const std::vector<char> kVariablePool = {'p', 'q', 'r', 's', 't'};

// Вероятность генерации ошибки по умолчанию (5%)
constexpr double kDefaultErrorProbability = 0.05;

class StatementGenerator {
public:
    StatementGenerator() : StatementGenerator(std::random_device{}()) {}

    // Фиксированное зерно даёт воспроизводимую последовательность
    explicit StatementGenerator(unsigned int seed)
        : gen(seed),
          bool_dist(0, 1),
          op_dist(0, static_cast<int>(operations.size()) - 1),
          var_dist(0, static_cast<int>(kVariablePool.size()) - 1),
          type_roll_dist(0, 9),
          error_dist(0.0, 1.0),
          error_type_dist(0, 2),
          junk_dist(0, static_cast<int>(junkCharacters.size()) - 1) {}

    void setErrorProbability(double probability) { errorProbability = probability; }

    std::string generate(int depth) {
        std::set<char> used;
        std::string expression = generateExpression(depth, used);

        std::string statement;
        for (char name : used) {
            statement.append(1, name);
            statement.append(" := ");
            statement.append(bool_dist(gen) ? "1" : "0");
            statement.append(" ");
        }
        statement.append(expression);
        return introduceError(statement);
    }

private:
    std::mt19937 gen;
    std::uniform_int_distribution<> bool_dist;
    std::uniform_int_distribution<> op_dist;
    std::uniform_int_distribution<> var_dist;
    std::uniform_int_distribution<> type_roll_dist;
    std::uniform_real_distribution<> error_dist;
    std::uniform_int_distribution<> error_type_dist;
    std::uniform_int_distribution<> junk_dist;
    double errorProbability = kDefaultErrorProbability;

    inline static const std::vector<std::string> operations = {"^", "v", "=>", "<=>"};
    inline static const std::string junkCharacters = "#$%&@!?2";

    std::string generateExpression(int depth, std::set<char>& used) {
        if (depth <= 0) {
            return generateOperand(used);
        }

        int type_roll = type_roll_dist(gen);
        if (type_roll < 6) { // Бинарная операция: (A op B) (60%)
            std::string left = generateExpression(depth - 1, used);
            std::string right = generateExpression(depth - 1, used);
            return "(" + left + " " + operations[op_dist(gen)] + " " + right + ")";
        } else if (type_roll < 9) { // Отрицание: ~A (30%)
            return "~" + generateExpression(depth - 1, used);
        } else { // Просто значение (10%)
            return generateOperand(used);
        }
    }

    std::string generateOperand(std::set<char>& used) {
        if (bool_dist(gen)) {
            return bool_dist(gen) ? "1" : "0";
        }
        char name = kVariablePool[var_dist(gen)];
        used.insert(name);
        return std::string(1, name);
    }

    // Вносит ошибки в высказывание с малой вероятностью
    std::string introduceError(const std::string& statement) {
        if (error_dist(gen) >= errorProbability) {
            return statement; // Без ошибки
        }

        std::string result = statement;
        switch (error_type_dist(gen)) {
        case 0: // Незакрытая скобка - убираем последнюю закрывающую скобку
            for (std::size_t i = result.length(); i > 0; --i) {
                if (result[i - 1] == ')') {
                    result.erase(i - 1, 1);
                    break;
                }
            }
            return result;

        case 1: // Лишний символ посередине
            result.insert(result.length() / 2, 1, junkCharacters[junk_dist(gen)]);
            return result;

        case 2: // Переменная, которой ничего не присвоено
            return result + " ^ z";

        default:
            return result;
        }
    }
};

} // namespace logic
