#include <string>

#include "program.hpp"

#include <fmt/format.h>

auto program::string() const -> std::string
{
    auto result = std::string {};
    for (const auto& assign : assignments) {
        result += fmt::format("{} := {}\n", assign.name, assign.value ? 1 : 0);
    }
    return result + expr->string();
}
