#include "csv_writer.hpp"

#include <stdexcept>
#include <utility>

namespace logic {

namespace {
// Экранирование текстового поля: двойные кавычки заменяются на одинарные,
// значение оборачивается в кавычки
std::string quoteField(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,statement,status,result,message\n";
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ',' << quoteField(record.statement) << ',' << record.status << ',';

    // Значение записывается только при успешном вычислении
    if (record.value.has_value()) {
        stream << (*record.value ? '1' : '0');
    }
    stream << ',' << quoteField(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи CSV: " + path.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    stream.flush();
}

} // namespace logic
