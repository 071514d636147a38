#include "evalexpr/parser.h"

using namespace evalexpr;

llvm::Error Parser::error(const llvm::Twine& expected) {
    return makeFault(FaultKind::Syntax, lexer.getFilename(), curTok().getLoc(),
                     "expected " + expected + ", but got " + curTok().describe());
}

llvm::Error Parser::consume(Token::TokenKind kind) {
    if (!curTok().is(kind))
        return error(Token::spelling(kind));
    return advance();
}

static BinaryOpKind relationalOp(Token::TokenKind kind) {
    switch (kind) {
    case Token::less:          return BinaryOpKind::Lt;
    case Token::less_equal:    return BinaryOpKind::Le;
    case Token::greater:       return BinaryOpKind::Gt;
    case Token::greater_equal: return BinaryOpKind::Ge;
    case Token::equal_equal:   return BinaryOpKind::Eq;
    default:                   return BinaryOpKind::Ne;
    }
}

// program ::= exprlist END
llvm::Error Parser::parseProgram() {
    if (llvm::Error err = parseExprList())
        return err;
    if (!curTok().is(Token::eof))
        return error("';' or end of input");
    return llvm::Error::success();
}

// exprlist ::= expr { ';' expr }
// The value of an exprlist is the value of its last expression; the ones
// before it are discarded.
llvm::Error Parser::parseExprList() {
    if (llvm::Error err = parseExpr())
        return err;

    while (curTok().is(Token::semi)) {
        emit(Discard{});
        if (llvm::Error err = advance())  // eat ;
            return err;
        if (llvm::Error err = parseExpr())
            return err;
    }
    return llvm::Error::success();
}

// expr ::= arexpr [ relop arexpr ]
llvm::Error Parser::parseExpr() {
    if (llvm::Error err = parseArExpr())
        return err;

    if (!curTok().isOneOf(Token::less, Token::less_equal, Token::greater,
                          Token::greater_equal, Token::equal_equal, Token::not_equal))
        return llvm::Error::success();

    BinaryOpKind op = relationalOp(curTok().getKind());
    SourceLoc opLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat relop
        return err;
    if (llvm::Error err = parseArExpr())
        return err;
    emit(BinaryOp{op}, opLoc);
    return llvm::Error::success();
}

// arexpr ::= [ '+' | '-' ] term { ('+' | '-') term }
// A leading sign applies to the first term only.
llvm::Error Parser::parseArExpr() {
    bool negate = false;
    SourceLoc signLoc;
    if (curTok().isOneOf(Token::plus, Token::minus)) {
        negate = curTok().is(Token::minus);
        signLoc = curTok().getLoc();
        if (llvm::Error err = advance())
            return err;
    }

    if (llvm::Error err = parseTerm())
        return err;
    if (negate)
        emit(Negate{}, signLoc);

    while (curTok().isOneOf(Token::plus, Token::minus)) {
        BinaryOpKind op = curTok().is(Token::plus) ? BinaryOpKind::Add : BinaryOpKind::Sub;
        SourceLoc opLoc = curTok().getLoc();
        if (llvm::Error err = advance())
            return err;
        if (llvm::Error err = parseTerm())
            return err;
        emit(BinaryOp{op}, opLoc);
    }
    return llvm::Error::success();
}

// term ::= factor { ('*' | '/') factor }
llvm::Error Parser::parseTerm() {
    if (llvm::Error err = parseFactor())
        return err;

    while (curTok().isOneOf(Token::star, Token::slash)) {
        BinaryOpKind op = curTok().is(Token::star) ? BinaryOpKind::Mul : BinaryOpKind::Div;
        SourceLoc opLoc = curTok().getLoc();
        if (llvm::Error err = advance())
            return err;
        if (llvm::Error err = parseFactor())
            return err;
        emit(BinaryOp{op}, opLoc);
    }
    return llvm::Error::success();
}

// factor ::= primary { args } | NUMBER | '(' exprlist ')'
llvm::Error Parser::parseFactor() {
    switch (curTok().getKind()) {
    case Token::integer_literal:
        emit(PushConst{Value::integer(curTok().getIntValue())});
        return advance();
    case Token::float_literal:
        emit(PushConst{Value::floating(curTok().getFloatValue())});
        return advance();
    case Token::l_paren:
        // Parentheses leave nothing on the tape.
        if (llvm::Error err = advance())  // eat (
            return err;
        if (llvm::Error err = parseExprList())
            return err;
        return consume(Token::r_paren);
    case Token::identifier:
    case Token::kw_true:
    case Token::kw_false:
    case Token::kw_none:
    case Token::kw_if:
    case Token::kw_while:
        if (llvm::Error err = parsePrimary())
            return err;
        while (curTok().is(Token::l_paren))
            if (llvm::Error err = parseArgs())
                return err;
        return llvm::Error::success();
    default:
        return error("number, identifier, 'if', 'while' or '('");
    }
}

// primary ::= IDENT [ '=' expr ] | valkeyword | statement
llvm::Error Parser::parsePrimary() {
    switch (curTok().getKind()) {
    case Token::identifier:
        return parseIdentifier();
    case Token::kw_true:
        emit(PushConst{Value::boolean(true)});
        return advance();
    case Token::kw_false:
        emit(PushConst{Value::boolean(false)});
        return advance();
    case Token::kw_none:
        emit(PushConst{Value::none()});
        return advance();
    case Token::kw_if:
        return parseIf();
    case Token::kw_while:
        return parseWhile();
    default:
        return error("identifier, value keyword or statement");
    }
}

// An identifier followed by '=' is an assignment; anything else loads it.
llvm::Error Parser::parseIdentifier() {
    std::string name = curTok().getText().str();
    SourceLoc nameLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat identifier
        return err;

    if (!curTok().is(Token::equal)) {
        emit(LoadVar{name}, nameLoc);
        return llvm::Error::success();
    }

    emit(PushVarName{name}, nameLoc);
    SourceLoc assignLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat =
        return err;
    if (llvm::Error err = parseExpr())
        return err;
    emit(Assign{}, assignLoc);
    return llvm::Error::success();
}

// if_stmt ::= 'if' expr 'then' exprlist [ 'else' exprlist ] 'end'
llvm::Error Parser::parseIf() {
    SourceLoc ifLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat if
        return err;

    if (llvm::Error err = parseExpr())
        return err;
    if (llvm::Error err = consume(Token::kw_then))
        return err;
    size_t falseJump = emit(JumpIfFalse{Tape::UnpatchedTarget}, ifLoc);

    if (llvm::Error err = parseExprList())
        return err;
    size_t endJump = emit(Jump{Tape::UnpatchedTarget});
    tape.patchTarget(falseJump, tape.size());

    if (curTok().is(Token::kw_else)) {
        if (llvm::Error err = advance())  // eat else
            return err;
        if (llvm::Error err = parseExprList())
            return err;
    } else {
        // Without an else branch the construct still yields a value.
        emit(PushConst{Value::none()});
    }

    if (llvm::Error err = consume(Token::kw_end))
        return err;
    tape.patchTarget(endJump, tape.size());
    return llvm::Error::success();
}

// while_stmt ::= 'while' expr 'do' exprlist 'end'
// NONE is pushed first so a loop that never runs still yields a value. Each
// iteration discards the previous value before running the body.
llvm::Error Parser::parseWhile() {
    SourceLoc whileLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat while
        return err;

    emit(PushConst{Value::none()}, whileLoc);
    size_t loopHead = tape.size();

    if (llvm::Error err = parseExpr())
        return err;
    if (llvm::Error err = consume(Token::kw_do))
        return err;
    size_t exitJump = emit(JumpIfFalse{Tape::UnpatchedTarget}, whileLoc);
    emit(Discard{}, whileLoc);

    if (llvm::Error err = parseExprList())
        return err;
    SourceLoc endLoc = curTok().getLoc();
    if (llvm::Error err = consume(Token::kw_end))
        return err;
    emit(Jump{loopHead}, endLoc);
    tape.patchTarget(exitJump, tape.size());
    return llvm::Error::success();
}

// args ::= '(' [ expr { ',' expr } ] ')'
// The callee is already on the stack; the arguments are collected into a
// list and the call combines the two.
llvm::Error Parser::parseArgs() {
    SourceLoc callLoc = curTok().getLoc();
    if (llvm::Error err = advance())  // eat (
        return err;
    emit(MakeEmptyList{}, callLoc);

    if (!curTok().is(Token::r_paren)) {
        while (true) {
            SourceLoc argLoc = curTok().getLoc();
            if (llvm::Error err = parseExpr())
                return err;
            emit(BinaryOp{BinaryOpKind::ListAppend}, argLoc);

            if (curTok().is(Token::r_paren))
                break;
            if (!curTok().is(Token::comma))
                return error("')' or ',' in argument list");
            if (llvm::Error err = advance())  // eat ,
                return err;
        }
    }

    if (llvm::Error err = advance())  // eat )
        return err;
    emit(BinaryOp{BinaryOpKind::Call}, callLoc);
    return llvm::Error::success();
}

llvm::Expected<Tape> evalexpr::compile(llvm::StringRef source, llvm::StringRef filename) {
    llvm::Expected<Lexer> lexer = Lexer::create(source, filename);
    if (!lexer)
        return lexer.takeError();

    Tape tape;
    Parser parser(*lexer, tape);
    if (llvm::Error err = parser.parseProgram())
        return std::move(err);
    return std::move(tape);
}
