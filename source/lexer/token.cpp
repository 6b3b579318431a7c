#include <ostream>

#include "token.hpp"

#include "location.hpp"
#include "token_type.hpp"

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&
{
    if (tok.type == token_type::newline || tok.type == token_type::eof) {
        return ostream << tok.loc << ": " << tok.type;
    }
    return ostream << tok.loc << ": " << tok.type << " `" << tok.literal << '`';
}
