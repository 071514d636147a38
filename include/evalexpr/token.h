#ifndef EVALEXPR_TOKEN_H
#define EVALEXPR_TOKEN_H

#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"

#include "evalexpr/fault.h"

namespace evalexpr {

/// Token - one lexeme together with the position of its first character.
class Token {
public:
    enum TokenKind : unsigned short {
        eof,
        identifier,
        integer_literal,
        float_literal,

        // keywords
        kw_if,
        kw_then,
        kw_else,
        kw_end,
        kw_while,
        kw_do,
        kw_true,
        kw_false,
        kw_none,

        // operators and punctuation
        plus,
        minus,
        star,
        slash,
        l_paren,
        r_paren,
        equal,
        semi,
        comma,
        less,
        less_equal,
        greater,
        greater_equal,
        equal_equal,
        not_equal
    };

    Token() = default;
    Token(TokenKind kind, llvm::StringRef text, SourceLoc loc)
        : kind(kind), text(text.str()), loc(loc) {}

    TokenKind getKind() const { return kind; }
    llvm::StringRef getText() const { return text; }
    SourceLoc getLoc() const { return loc; }

    int64_t getIntValue() const { return intVal; }     // integer_literal
    double getFloatValue() const { return floatVal; }  // float_literal
    void setIntValue(int64_t v) { intVal = v; }
    void setFloatValue(double v) { floatVal = v; }

    bool is(TokenKind k) const { return kind == k; }
    bool isOneOf(TokenKind k1, TokenKind k2) const { return is(k1) || is(k2); }
    template <typename... Ts>
    bool isOneOf(TokenKind k1, TokenKind k2, Ts... ks) const {
        return is(k1) || isOneOf(k2, ks...);
    }

    /// Human readable description used in syntax faults, e.g. "')'" or
    /// "identifier 'x'".
    std::string describe() const;

    static llvm::StringRef spelling(TokenKind kind);

private:
    TokenKind kind = eof;
    std::string text;
    SourceLoc loc;
    int64_t intVal = 0;
    double floatVal = 0.0;
};

} // end namespace evalexpr

#endif // EVALEXPR_TOKEN_H
