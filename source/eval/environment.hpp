#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

struct environment final
{
    /// Binds `name` to `value`. Returns false and leaves the existing binding
    /// untouched if `name` is already bound.
    auto define(const std::string& name, bool value) -> bool;
    [[nodiscard]] auto get(const std::string& name) const -> std::optional<bool>;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

    void debug() const;

    std::unordered_map<std::string, bool> store;
};
