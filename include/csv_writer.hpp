#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace logic {

// Структура для хранения результата вычисления одной строки
struct EvaluationRecord {
    std::size_t lineNumber = 0;   // Номер строки в исходном файле
    std::string statement;        // Исходный текст высказывания
    std::optional<bool> value;    // Результат (если вычисление успешно)
    std::string status;           // Статус (success или error)
    std::string message;          // Сообщение об ошибке (если есть)
};

// Класс для записи результатов в формате CSV (Comma-Separated Values)
// Формат: line,statement,status,result,message
class CsvWriter {
public:
    // Конструктор открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает один результат (для потоковой записи)
    void writeRecord(const EvaluationRecord& record);

    // Записывает пакет результатов
    void write(const std::vector<EvaluationRecord>& records);

    const std::filesystem::path& targetPath() const { return path; }

private:
    std::filesystem::path path; // Путь к выходному файлу
    std::ofstream stream;
};

} // namespace logic
