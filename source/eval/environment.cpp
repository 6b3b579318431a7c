#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "environment.hpp"

#include <fmt/format.h>

auto environment::define(const std::string& name, bool value) -> bool
{
    return store.emplace(name, value).second;
}

auto environment::get(const std::string& name) const -> std::optional<bool>
{
    if (const auto itr = store.find(name); itr != store.end()) {
        return itr->second;
    }
    return std::nullopt;
}

auto environment::contains(const std::string& name) const -> bool
{
    return store.contains(name);
}

auto environment::size() const -> std::size_t
{
    return store.size();
}

auto environment::debug() const -> void
{
    auto bindings = std::vector<std::pair<std::string, bool>>(store.cbegin(), store.cend());
    std::sort(bindings.begin(), bindings.end());
    for (const auto& [k, v] : bindings) {
        fmt::print("[{}] = {}\n", k, v ? 1 : 0);
    }
}
