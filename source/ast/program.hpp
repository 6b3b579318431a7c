#pragma once

#include <memory>
#include <string>
#include <vector>

#include <lexer/location.hpp>

#include "expression.hpp"

struct assignment final
{
    std::string name;
    bool value {};
    location loc;
};

struct program final
{
    [[nodiscard]] auto string() const -> std::string;

    std::vector<assignment> assignments;
    expression_ptr expr;
};

using program_ptr = std::unique_ptr<program>;
