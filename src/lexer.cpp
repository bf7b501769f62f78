#include <cstdio>
#include <cstdlib>
#include <limits>

#include "llvm/ADT/StringExtras.h"

#include "kaleido/lexer.h"

using namespace kaleido;

// Character classes are ASCII only. EOF and bytes above 127 fall outside all
// of them.
static bool isAsciiChar(int c) { return c >= 0 && c < 128; }
static bool isSpaceChar(int c) { return isAsciiChar(c) && llvm::isSpace(static_cast<char>(c)); }
static bool isAlphaChar(int c) { return isAsciiChar(c) && llvm::isAlpha(static_cast<char>(c)); }
static bool isAlnumChar(int c) { return isAsciiChar(c) && llvm::isAlnum(static_cast<char>(c)); }
static bool isDigitChar(int c) { return isAsciiChar(c) && llvm::isDigit(static_cast<char>(c)); }

Token Lexer::gettok() {
    Token tok;

    while (true) {
        while (isSpaceChar(lastChar))  // Skip any whitespace
            lastChar = source.getChar();

        if (isAlphaChar(lastChar)) {  // identifier: [a-zA-Z][a-zA-Z0-9]*
            tok.identifierStr = static_cast<char>(lastChar);
            while (isAlnumChar((lastChar = source.getChar())))
                tok.identifierStr += static_cast<char>(lastChar);

            if (tok.identifierStr == "def") tok.kind = tok_def;
            else if (tok.identifierStr == "extern") tok.kind = tok_extern;
            else tok.kind = tok_identifier;
            return tok;
        }

        if (isDigitChar(lastChar) || lastChar == '.') {  // Number: [0-9.]+
            std::string numStr;
            do {
                numStr += static_cast<char>(lastChar);
                lastChar = source.getChar();
            } while (isDigitChar(lastChar) || lastChar == '.');

            // strtod stops at the first character that does not continue a
            // valid number, so "3.1.4" reads as 3.1. Text with no numeric
            // prefix at all (".", "..5") is NaN.
            tok.kind = tok_number;
            char* end = nullptr;
            tok.numVal = strtod(numStr.c_str(), &end);
            if (end == numStr.c_str())
                tok.numVal = std::numeric_limits<double>::quiet_NaN();
            return tok;
        }

        if (lastChar == '#') {
            // Comment until end of line.
            do lastChar = source.getChar();
            while (lastChar != EOF && lastChar != '\n' && lastChar != '\r');

            if (lastChar != EOF) continue;
        }
        break;
    }

    // Check for end of file.  Don't eat the EOF.
    if (lastChar == EOF) {
        tok.kind = tok_eof;
        return tok;
    }

    // Otherwise, just return the character as its ascii value.
    tok.kind = lastChar;
    lastChar = source.getChar();
    return tok;
}
