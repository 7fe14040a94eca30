#include "bindings.hpp"

#include <algorithm>

namespace logic {

void BindingsTable::assign(const std::string& name, bool value) {
    values[name] = value;
}

std::optional<bool> BindingsTable::lookup(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool BindingsTable::contains(const std::string& name) const {
    return values.contains(name);
}

std::size_t BindingsTable::size() const {
    return values.size();
}

bool BindingsTable::empty() const {
    return values.empty();
}

std::vector<std::pair<std::string, bool>> BindingsTable::entries() const {
    std::vector<std::pair<std::string, bool>> result(values.begin(), values.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace logic
