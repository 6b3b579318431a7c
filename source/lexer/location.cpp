#include <ostream>

#include "location.hpp"

auto operator<<(std::ostream& os, const location& loc) -> std::ostream&
{
    return os << loc.filename << ':' << loc.line << ':' << loc.column;
}
