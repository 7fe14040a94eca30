#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace logic {

// Таблица значений переменных, заполняемая присваиваниями "p := 1".
// Повторное присваивание перезаписывает прежнее значение.
class BindingsTable {
public:
    void assign(const std::string& name, bool value);

    // Значение переменной или std::nullopt, если она не определена
    std::optional<bool> lookup(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::size_t size() const;
    bool empty() const;

    // Пары (имя, значение), отсортированные по имени
    std::vector<std::pair<std::string, bool>> entries() const;

private:
    std::unordered_map<std::string, bool> values;
};

} // namespace logic
