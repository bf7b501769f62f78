#ifndef KALEIDO_PARSER_H
#define KALEIDO_PARSER_H

#include <memory>

#include "llvm/Support/Error.h"

#include "kaleido/ast.h"
#include "kaleido/lexer.h"
#include "kaleido/precedence.h"

namespace kaleido {

class Parser {
public:
    Parser(Lexer& lexer, const PrecedenceTable& binopPrecedence);

    /// CurTok/getNextToken - Provide a simple token buffer. getNextToken reads
    /// another token from the lexer and updates curTok with its results.
    const Token& getNextToken();
    const Token& getCurTok() const { return curTok; }

    llvm::Expected<std::unique_ptr<ExprAST>> parseExpression();
    llvm::Expected<std::unique_ptr<PrototypeAST>> parsePrototype();
    llvm::Expected<std::unique_ptr<FunctionAST>> parseDefinition();
    llvm::Expected<std::unique_ptr<FunctionAST>> parseTopLevelExpr();
    llvm::Expected<std::unique_ptr<PrototypeAST>> parseExtern();

private:
    Lexer& lexer;
    const PrecedenceTable& binopPrecedence;

    Token curTok;  // Current token the parser is looking at

    int getTokPrecedence() const;

    llvm::Expected<std::unique_ptr<ExprAST>> parseNumberExpr();
    llvm::Expected<std::unique_ptr<ExprAST>> parseParenExpr();
    llvm::Expected<std::unique_ptr<ExprAST>> parseIdentifierExpr();
    llvm::Expected<std::unique_ptr<ExprAST>> parsePrimary();
    llvm::Expected<std::unique_ptr<ExprAST>> parseBinOpRHS(int exprPrec, std::unique_ptr<ExprAST> lhs);
};

} // end namespace kaleido

#endif // KALEIDO_PARSER_H
