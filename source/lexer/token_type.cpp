#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "illegal";
        case eof:
            return ostream << "eof";
        case newline:
            return ostream << "newline";
        case caret:
            return ostream << "^";
        case lparen:
            return ostream << "(";
        case one:
            return ostream << "1";
        case rparen:
            return ostream << ")";
        case tilde:
            return ostream << "~";
        case zero:
            return ostream << "0";
        case assign:
            return ostream << ":=";
        case iff:
            return ostream << "<=>";
        case implies:
            return ostream << "=>";
        case ident:
            return ostream << "identifier";
        case vee:
            return ostream << "v";
    }
    throw std::invalid_argument("invalid token_type");
}
