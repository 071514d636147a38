#ifndef EVALEXPR_LEXER_H
#define EVALEXPR_LEXER_H

#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include "evalexpr/token.h"

namespace evalexpr {

//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//
// The lexer keeps exactly one token, the current one. The parser looks at it
// with current() and asks for the following one with next().
class Lexer {
public:
    /// Creates a lexer and lexes the first token, so current() is valid
    /// as soon as construction succeeds.
    static llvm::Expected<Lexer> create(llvm::StringRef source, llvm::StringRef filename);

    const Token& current() const { return curTok; }

    /// Advances past the current token.
    llvm::Error next();

    llvm::StringRef getFilename() const { return filename; }

private:
    llvm::StringRef source;
    std::string filename;
    size_t pos = 0;
    unsigned row = 1;
    unsigned col = 1;
    Token curTok;

    Lexer(llvm::StringRef source, llvm::StringRef filename)
        : source(source), filename(filename.str()) {}

    char peek(size_t ahead = 0) const {
        return pos + ahead < source.size() ? source[pos + ahead] : '\0';
    }
    bool atEnd() const { return pos >= source.size(); }
    /// Decodes the UTF-8 code point starting at byte offset at. A malformed
    /// sequence decodes as its first byte with length 1.
    uint32_t decodeAt(size_t at, unsigned& length) const;
    /// Advances one code point; the column counts code points, not bytes.
    void advanceChar();
    /// Up to count code points of source starting at pos.
    std::string snippet(unsigned count) const;
    SourceLoc here() const { return SourceLoc{row, col}; }

    llvm::Error lexToken();
    void lexIdentifier();
    llvm::Error lexNumber();
    llvm::Error lexPunctuation();
    void formToken(Token::TokenKind kind, size_t start, SourceLoc loc);
};

} // end namespace evalexpr

#endif // EVALEXPR_LEXER_H
