#include "kaleido/driver.h"
#include "kaleido/log.h"

using namespace kaleido;

Driver::Driver(Parser& parser, llvm::raw_ostream& diag, DriverOptions opts)
    : parser(parser), diag(diag), opts(opts) {}

// Skip token for error recovery. This is one token regardless of how much of
// the failed construct was already consumed.
void Driver::recover(unsigned& failureCount, llvm::Error err) {
    ++failureCount;
    ++stats.failures;
    logError(diag, std::move(err));
    parser.getNextToken();
}

void Driver::handleDefinition() {
    auto fnAST = parser.parseDefinition();
    if (!fnAST) return recover(stats.definitionFailures, fnAST.takeError());

    ++stats.definitions;
    logInfo(diag, "Parsed a function definition.");
    if (opts.dumpAST) {
        (*fnAST)->print(diag);
        diag << "\n";
    }
    if (opts.retainAST) functions.push_back(std::move(*fnAST));
}

void Driver::handleExtern() {
    auto protoAST = parser.parseExtern();
    if (!protoAST) return recover(stats.externFailures, protoAST.takeError());

    ++stats.externs;
    logInfo(diag, "Parsed an extern");
    if (opts.dumpAST) {
        diag << "(extern ";
        (*protoAST)->print(diag);
        diag << ")\n";
    }
    if (opts.retainAST) externs.push_back(std::move(*protoAST));
}

void Driver::handleTopLevelExpression() {
    // Evaluate a top-level expression into an anonymous function.
    auto fnAST = parser.parseTopLevelExpr();
    if (!fnAST) return recover(stats.topLevelExprFailures, fnAST.takeError());

    ++stats.topLevelExprs;
    logInfo(diag, "Parsed a top-level expr");
    if (opts.dumpAST) {
        (*fnAST)->print(diag);
        diag << "\n";
    }
    if (opts.retainAST) functions.push_back(std::move(*fnAST));
}

/// top ::= definition | external | expression | ';'
DriverStats Driver::mainLoop() {
    // Prime the first token.
    parser.getNextToken();

    while (true) {
        switch (parser.getCurTok().kind) {
        case tok_eof:    return stats;
        case ';':        parser.getNextToken(); break;  // ignore top-level semicolons.
        case tok_def:    handleDefinition(); break;
        case tok_extern: handleExtern(); break;
        default:         handleTopLevelExpression(); break;
        }
    }
}

void kaleido::printStats(llvm::raw_ostream& os, const DriverStats& stats) {
    os << "definitions: " << stats.definitions
       << " (failed: " << stats.definitionFailures << ")\n"
       << "externs: " << stats.externs
       << " (failed: " << stats.externFailures << ")\n"
       << "top-level exprs: " << stats.topLevelExprs
       << " (failed: " << stats.topLevelExprFailures << ")\n"
       << "failures: " << stats.failures << "\n";
}
