#include <cctype>
#include <cstdlib>

#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/UnicodeCharRanges.h"

#include "evalexpr/lexer.h"

using namespace evalexpr;

// Letters outside ASCII that may appear in identifiers: the alphabetic
// blocks of the Latin, Greek, Cyrillic, Armenian, Hebrew, Arabic, Devanagari,
// Thai, Georgian, Hangul, kana and CJK scripts.
static const llvm::sys::UnicodeCharRange LetterRanges[] = {
    {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA}, {0x00C0, 0x00D6},
    {0x00D8, 0x00F6}, {0x00F8, 0x02C1}, {0x0370, 0x0373}, {0x0376, 0x0377},
    {0x037B, 0x037D}, {0x0386, 0x0386}, {0x0388, 0x03F5}, {0x03F7, 0x0481},
    {0x048A, 0x052F}, {0x0531, 0x0556}, {0x0561, 0x0587}, {0x05D0, 0x05EA},
    {0x0620, 0x064A}, {0x0671, 0x06D3}, {0x0904, 0x0939}, {0x0E01, 0x0E30},
    {0x10A0, 0x10FF}, {0x1100, 0x11FF}, {0x1E00, 0x1FBC}, {0x3041, 0x3096},
    {0x30A1, 0x30FA}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xAC00, 0xD7A3},
};

static bool isLetter(uint32_t cp) {
    static const llvm::sys::UnicodeCharSet Letters(LetterRanges);
    if (cp < 0x80)
        return isalpha(static_cast<int>(cp));
    return Letters.contains(cp);
}

static bool isLetterOrDigit(uint32_t cp) {
    return (cp < 0x80 && isdigit(static_cast<int>(cp))) || isLetter(cp);
}

llvm::Expected<Lexer> Lexer::create(llvm::StringRef source, llvm::StringRef filename) {
    Lexer lexer(source, filename);
    if (llvm::Error err = lexer.lexToken())
        return std::move(err);
    return std::move(lexer);
}

llvm::Error Lexer::next() {
    return lexToken();
}

uint32_t Lexer::decodeAt(size_t at, unsigned& length) const {
    unsigned char first = static_cast<unsigned char>(source[at]);
    length = 1;
    if (first < 0x80)
        return first;

    const llvm::UTF8* begin = reinterpret_cast<const llvm::UTF8*>(source.data() + at);
    const llvm::UTF8* end = reinterpret_cast<const llvm::UTF8*>(source.data() + source.size());
    const llvm::UTF8* cursor = begin;
    llvm::UTF32 cp;
    if (llvm::convertUTF8Sequence(&cursor, end, &cp, llvm::strictConversion) != llvm::conversionOK)
        return first;
    length = static_cast<unsigned>(cursor - begin);
    return cp;
}

void Lexer::advanceChar() {
    if (atEnd())
        return;
    unsigned length;
    if (decodeAt(pos, length) == '\n') {
        ++row;
        col = 1;
    } else {
        ++col;
    }
    pos += length;
}

std::string Lexer::snippet(unsigned count) const {
    size_t end = pos;
    for (unsigned i = 0; i != count && end < source.size(); ++i) {
        unsigned length;
        decodeAt(end, length);
        end += length;
    }
    return source.slice(pos, end).str();
}

void Lexer::formToken(Token::TokenKind kind, size_t start, SourceLoc loc) {
    curTok = Token(kind, source.slice(start, pos), loc);
}

/// lexToken - Lex the next token into curTok.
llvm::Error Lexer::lexToken() {
    while (isspace(static_cast<unsigned char>(peek())))  // Skip any whitespace
        advanceChar();

    if (atEnd()) {
        formToken(Token::eof, pos, here());
        return llvm::Error::success();
    }

    unsigned length;
    if (isLetter(decodeAt(pos, length))) {  // identifier: letter (letter | digit)*
        lexIdentifier();
        return llvm::Error::success();
    }
    if (isdigit(static_cast<unsigned char>(peek())))  // number: [0-9]+ ('.' [0-9]*)?
        return lexNumber();

    return lexPunctuation();
}

void Lexer::lexIdentifier() {
    size_t start = pos;
    SourceLoc loc = here();
    unsigned length;
    while (!atEnd() && isLetterOrDigit(decodeAt(pos, length)))
        advanceChar();

    Token::TokenKind kind = llvm::StringSwitch<Token::TokenKind>(source.slice(start, pos))
        .Case("if", Token::kw_if)
        .Case("then", Token::kw_then)
        .Case("else", Token::kw_else)
        .Case("end", Token::kw_end)
        .Case("while", Token::kw_while)
        .Case("do", Token::kw_do)
        .Case("TRUE", Token::kw_true)
        .Case("FALSE", Token::kw_false)
        .Case("NONE", Token::kw_none)
        .Default(Token::identifier);
    formToken(kind, start, loc);
}

llvm::Error Lexer::lexNumber() {
    size_t start = pos;
    SourceLoc loc = here();
    while (isdigit(static_cast<unsigned char>(peek())))
        advanceChar();

    if (peek() != '.') {
        formToken(Token::integer_literal, start, loc);
        int64_t value;
        if (curTok.getText().getAsInteger(10, value))
            return llvm::make_error<Fault>(FaultKind::Lexical, filename, loc,
                                           "integer literal '" + curTok.getText().str() +
                                               "' is too large",
                                           curTok.getText().str());
        curTok.setIntValue(value);
        return llvm::Error::success();
    }

    advanceChar();  // eat '.'
    while (isdigit(static_cast<unsigned char>(peek())))
        advanceChar();
    formToken(Token::float_literal, start, loc);
    curTok.setFloatValue(strtod(curTok.getText().str().c_str(), nullptr));
    return llvm::Error::success();
}

llvm::Error Lexer::lexPunctuation() {
    size_t start = pos;
    SourceLoc loc = here();
    char ch = peek();

    // Two-character operators are tried before their one-character prefixes.
    if (peek(1) == '=') {
        Token::TokenKind kind = Token::eof;
        switch (ch) {
        case '<': kind = Token::less_equal; break;
        case '>': kind = Token::greater_equal; break;
        case '=': kind = Token::equal_equal; break;
        case '!': kind = Token::not_equal; break;
        default: break;
        }
        if (kind != Token::eof) {
            advanceChar();
            advanceChar();
            formToken(kind, start, loc);
            return llvm::Error::success();
        }
    }

    Token::TokenKind kind;
    switch (ch) {
    case '+': kind = Token::plus; break;
    case '-': kind = Token::minus; break;
    case '*': kind = Token::star; break;
    case '/': kind = Token::slash; break;
    case '(': kind = Token::l_paren; break;
    case ')': kind = Token::r_paren; break;
    case '=': kind = Token::equal; break;
    case ';': kind = Token::semi; break;
    case ',': kind = Token::comma; break;
    case '<': kind = Token::less; break;
    case '>': kind = Token::greater; break;
    default: {
        std::string text = snippet(3);
        return llvm::make_error<Fault>(FaultKind::Lexical, filename, loc,
                                       "unrecognized input '" + text + "...'", text);
    }
    }
    advanceChar();
    formToken(kind, start, loc);
    return llvm::Error::success();
}
