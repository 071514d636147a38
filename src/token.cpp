#include "evalexpr/token.h"

#include "llvm/Support/ErrorHandling.h"

using namespace evalexpr;

llvm::StringRef Token::spelling(TokenKind kind) {
    switch (kind) {
    case eof:             return "end of input";
    case identifier:      return "identifier";
    case integer_literal:
    case float_literal:   return "number";
    case kw_if:           return "'if'";
    case kw_then:         return "'then'";
    case kw_else:         return "'else'";
    case kw_end:          return "'end'";
    case kw_while:        return "'while'";
    case kw_do:           return "'do'";
    case kw_true:         return "'TRUE'";
    case kw_false:        return "'FALSE'";
    case kw_none:         return "'NONE'";
    case plus:            return "'+'";
    case minus:           return "'-'";
    case star:            return "'*'";
    case slash:           return "'/'";
    case l_paren:         return "'('";
    case r_paren:         return "')'";
    case equal:           return "'='";
    case semi:            return "';'";
    case comma:           return "','";
    case less:            return "'<'";
    case less_equal:      return "'<='";
    case greater:         return "'>'";
    case greater_equal:   return "'>='";
    case equal_equal:     return "'=='";
    case not_equal:       return "'!='";
    }
    llvm_unreachable("unknown token kind");
}

std::string Token::describe() const {
    switch (kind) {
    case identifier:
        return "identifier '" + text + "'";
    case integer_literal:
    case float_literal:
        return "number " + text;
    default:
        return spelling(kind).str();
    }
}
