#include "cli_options.hpp"
#include "user_input.hpp"

#include <limits>
#include <stdexcept>

namespace {
// Последовательное чтение аргументов с проверкой наличия
class ArgumentReader {
public:
    explicit ArgumentReader(const std::vector<std::string>& args) : args(args) {}

    bool hasMore() const { return position < args.size(); }

    const std::string& take(const std::string& what) {
        if (!hasMore()) {
            throw std::runtime_error("Не указан аргумент: " + what);
        }
        return args[position++];
    }

private:
    const std::vector<std::string>& args;
    std::size_t position = 0;
};

// Необязательные флаги после позиционных аргументов
void parseFlags(ArgumentReader& reader, CliOptions& options) {
    while (reader.hasMore()) {
        const std::string& flag = reader.take("флаг");
        if (flag == "--dot" && (options.command == Command::Eval || options.command == Command::File)) {
            options.dotPath = reader.take("путь к файлу графа после --dot");
        } else if (flag == "--seed" && options.command == Command::Generate) {
            std::size_t seed = parseNumber(reader.take("значение --seed"));
            if (seed > std::numeric_limits<unsigned int>::max()) {
                throw std::runtime_error("Слишком большое значение --seed");
            }
            options.seed = static_cast<unsigned int>(seed);
        } else if (flag == "--depth" && options.command == Command::Generate) {
            std::size_t depth = parseNumber(reader.take("значение --depth"));
            if (depth > 16) {
                throw std::runtime_error("Глубина --depth не может превышать 16");
            }
            options.depth = static_cast<int>(depth);
        } else if (options.command == Command::Batch && !options.outputPath && flag.rfind("--", 0) != 0) {
            options.outputPath = flag;
        } else {
            throw std::runtime_error("Неизвестный аргумент: " + flag);
        }
    }
}
}

CliOptions parseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    if (args.empty()) {
        return options;
    }

    ArgumentReader reader(args);
    const std::string& command = reader.take("команда");

    if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    }

    if (command == "eval") {
        options.command = Command::Eval;
        options.statement = reader.take("высказывание");
    } else if (command == "tokens") {
        options.command = Command::Tokens;
        options.statement = reader.take("высказывание");
    } else if (command == "tree") {
        options.command = Command::Tree;
        options.statement = reader.take("высказывание");
    } else if (command == "file") {
        options.command = Command::File;
        options.inputPath = reader.take("путь к файлу");
    } else if (command == "batch") {
        options.command = Command::Batch;
        options.inputPath = reader.take("путь к входному файлу");
    } else if (command == "generate") {
        options.command = Command::Generate;
        options.count = parseNumber(reader.take("количество высказываний"));
        options.outputPath = reader.take("путь к выходному файлу");
    } else {
        throw std::runtime_error("Неизвестная команда: " + command);
    }

    parseFlags(reader, options);
    return options;
}

std::string usageText() {
    return
        "Использование:\n"
        "  logic_solver                                  интерактивная пакетная обработка\n"
        "  logic_solver eval \"<высказывание>\" [--dot <файл>]\n"
        "  logic_solver file <путь> [--dot <файл>]\n"
        "  logic_solver tokens \"<высказывание>\"\n"
        "  logic_solver tree \"<высказывание>\"\n"
        "  logic_solver batch <вход.txt> [<выход.csv>]\n"
        "  logic_solver generate <количество> <выход.txt> [--seed N] [--depth N]\n"
        "\n"
        "Операторы: ~ (не), ^ (и), v (или), => (импликация), <=> (эквивалентность)\n"
        "Присваивания перед выражением: p := 1 q := p p ^ q\n";
}
