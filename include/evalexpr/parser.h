#ifndef EVALEXPR_PARSER_H
#define EVALEXPR_PARSER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include "evalexpr/instruction.h"
#include "evalexpr/lexer.h"

namespace evalexpr {

/// Parser - recursive-descent compiler. Every parse method validates one
/// production and appends its instructions to the tape; no AST is built.
class Parser {
public:
    Parser(Lexer& lexer, Tape& tape) : lexer(lexer), tape(tape) {}

    // program ::= exprlist END
    llvm::Error parseProgram();

private:
    Lexer& lexer;
    Tape& tape;

    const Token& curTok() const { return lexer.current(); }
    llvm::Error advance() { return lexer.next(); }

    llvm::Error error(const llvm::Twine& expected);
    /// Eats the current token if it has the given kind, faults otherwise.
    llvm::Error consume(Token::TokenKind kind);

    size_t emit(Instruction inst) { return tape.emit(std::move(inst), curTok().getLoc()); }
    size_t emit(Instruction inst, SourceLoc loc) { return tape.emit(std::move(inst), loc); }

    // For each non-terminal of the grammar, a method to parse the rule.
    llvm::Error parseExprList();
    llvm::Error parseExpr();
    llvm::Error parseArExpr();
    llvm::Error parseTerm();
    llvm::Error parseFactor();
    llvm::Error parsePrimary();
    llvm::Error parseIdentifier();
    llvm::Error parseIf();
    llvm::Error parseWhile();
    llvm::Error parseArgs();
};

/// Compiles a whole program. Lexical and syntax faults abort compilation;
/// no partial tape is returned.
llvm::Expected<Tape> compile(llvm::StringRef source, llvm::StringRef filename);

} // end namespace evalexpr

#endif // EVALEXPR_PARSER_H
