#include "kaleido/parser.h"
#include "kaleido/error.h"

using namespace kaleido;

Parser::Parser(Lexer& lexer, const PrecedenceTable& binopPrecedence)
    : lexer(lexer), binopPrecedence(binopPrecedence) {}

// Helper to bridge the Lexer to the Parser's curTok
const Token& Parser::getNextToken() {
    curTok = lexer.gettok();
    return curTok;
}

/// getTokPrecedence - Get the precedence of the pending binary operator token.
int Parser::getTokPrecedence() const {
    return binopPrecedence.getPrecedence(curTok.kind);
}

// The routine eats all of the tokens that correspond to the production and
// leaves curTok at the first token after it.
// numberexpr ::= number
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseNumberExpr() {
    auto result = std::make_unique<NumberExprAST>(curTok.numVal);
    getNextToken(); // consume the number
    return std::move(result);
}

// parenexpr ::= '(' expression ')'
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseParenExpr() {
    getNextToken(); // eat (
    auto v = parseExpression();
    if (!v) return v.takeError();

    if (!curTok.is(')')) return syntaxError("expected ')'");
    getNextToken(); // eat )
    return v;
}

// identifierexpr ::= identifier | identifier '(' expression* ')'
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseIdentifierExpr() {
    std::string idName = curTok.identifierStr;
    getNextToken(); // eat identifier

    if (!curTok.is('('))  // Simple variable ref.
        return std::make_unique<VariableExprAST>(idName);

    getNextToken(); // eat (
    std::vector<std::unique_ptr<ExprAST>> args;
    if (!curTok.is(')')) {
        while (true) {
            auto arg = parseExpression();
            if (!arg) return arg.takeError();
            args.push_back(std::move(*arg));

            if (curTok.is(')')) break;
            if (!curTok.is(',')) return syntaxError("Expected ')' or ',' in argument list");
            getNextToken();
        }
    }
    getNextToken(); // eat )
    return std::make_unique<CallExprAST>(idName, std::move(args));
}

/// primary
///   ::= identifierexpr
///   ::= numberexpr
///   ::= parenexpr
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parsePrimary() {
    switch (curTok.kind) {
    case tok_identifier: return parseIdentifierExpr();
    case tok_number:     return parseNumberExpr();
    case '(':            return parseParenExpr();
    default:             return syntaxError("unknown token when expecting an expression");
    }
}

// binoprhs ::= ('+' primary)*
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseBinOpRHS(int exprPrec, std::unique_ptr<ExprAST> lhs) {
    while (true) {
        // If this is a binop, find its precedence.
        int tokPrec = getTokPrecedence();

        // If this is a binop that binds at least as tightly as the current binop,
        // consume it, otherwise we are done.
        if (tokPrec < exprPrec) return std::move(lhs);

        // Okay, we know this is a binop.
        char binOp = static_cast<char>(curTok.kind);
        getNextToken(); // eat binop

        // Parse the primary expression after the binary operator.
        auto rhs = parsePrimary();
        if (!rhs) return rhs.takeError();

        // If binOp binds less tightly with rhs than the operator after rhs, let
        // the pending operator take rhs as its lhs.
        int nextPrec = getTokPrecedence();
        if (tokPrec < nextPrec) {
            rhs = parseBinOpRHS(tokPrec + 1, std::move(*rhs));
            if (!rhs) return rhs.takeError();
        }
        // Merge lhs/rhs.
        lhs = std::make_unique<BinaryExprAST>(binOp, std::move(lhs), std::move(*rhs));
    }
}

// expression
//   ::= primary binoprhs
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseExpression() {
    auto lhs = parsePrimary();
    if (!lhs) return lhs.takeError();
    return parseBinOpRHS(0, std::move(*lhs));
}

/// prototype
///   ::= id '(' id* ')'
llvm::Expected<std::unique_ptr<PrototypeAST>> Parser::parsePrototype() {
    if (!curTok.is(tok_identifier))
        return syntaxError("Expected function name in prototype");

    std::string fnName = curTok.identifierStr;
    getNextToken();

    if (!curTok.is('('))
        return syntaxError("Expected '(' in prototype");

    // Read the list of argument names. Duplicates are accepted.
    std::vector<std::string> argNames;
    while (getNextToken().is(tok_identifier))
        argNames.push_back(curTok.identifierStr);
    if (!curTok.is(')'))
        return syntaxError("Expected ')' in prototype");

    // success.
    getNextToken(); // eat ')'.

    return std::make_unique<PrototypeAST>(fnName, std::move(argNames));
}

// definition ::= 'def' prototype expression
llvm::Expected<std::unique_ptr<FunctionAST>> Parser::parseDefinition() {
    getNextToken(); // eat def
    auto proto = parsePrototype();
    if (!proto) return proto.takeError();

    auto e = parseExpression();
    if (!e) return e.takeError();
    return std::make_unique<FunctionAST>(std::move(*proto), std::move(*e));
}

// toplevelexpr ::= expression
llvm::Expected<std::unique_ptr<FunctionAST>> Parser::parseTopLevelExpr() {
    auto e = parseExpression();
    if (!e) return e.takeError();

    // Make an anonymous proto.
    auto proto = std::make_unique<PrototypeAST>("", std::vector<std::string>());
    return std::make_unique<FunctionAST>(std::move(proto), std::move(*e));
}

/// external ::= 'extern' prototype
llvm::Expected<std::unique_ptr<PrototypeAST>> Parser::parseExtern() {
    getNextToken(); // eat extern
    return parsePrototype();
}
