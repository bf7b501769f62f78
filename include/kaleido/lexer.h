#ifndef KALEIDO_LEXER_H
#define KALEIDO_LEXER_H

#include <string>

#include "kaleido/char_source.h"

namespace kaleido {
//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//
// The lexer returns tokens [0-255] if it is an unknown character, otherwise one
// of these for known things.
enum TokenKind {
  tok_eof = -1,

  // commands
  tok_def = -2,
  tok_extern = -3,

  // primary
  tok_identifier = -4,
  tok_number = -5
};

// Each token returned by the lexer includes a token code and potentially some
// metadata.
struct Token {
    int kind = tok_eof;
    std::string identifierStr; // Filled in if tok_identifier
    double numVal = 0.0;       // Filled in if tok_number

    bool is(int k) const { return kind == k; }
};

class Lexer {
    public:
    explicit Lexer(CharSource& source) : source(source) {}

    /// gettok - Return the next token from the character source.
    Token gettok();

    private:
    CharSource& source;
    int lastChar = ' ';  // Used by gettok
};

} // end namespace kaleido
#endif // KALEIDO_LEXER_H
