#ifndef KALEIDO_DRIVER_H
#define KALEIDO_DRIVER_H

#include <memory>
#include <vector>

#include "llvm/Support/raw_ostream.h"

#include "kaleido/ast.h"
#include "kaleido/parser.h"

namespace kaleido {

/// Per-kind counts of the top-level constructs seen by the driver.
struct DriverStats {
    unsigned definitions = 0;
    unsigned externs = 0;
    unsigned topLevelExprs = 0;

    unsigned definitionFailures = 0;
    unsigned externFailures = 0;
    unsigned topLevelExprFailures = 0;
    unsigned failures = 0; // sum of the three above
};

struct DriverOptions {
    bool dumpAST = false;   // print each parsed construct
    bool retainAST = false; // keep the parsed constructs in the driver
};

/// Driver - Top-level parsing loop. It is the only place where diagnostics
/// are printed and where parse errors are consumed.
class Driver {
public:
    Driver(Parser& parser, llvm::raw_ostream& diag, DriverOptions opts = DriverOptions());

    /// Runs until the end of the token stream and returns the counts.
    DriverStats mainLoop();

    const std::vector<std::unique_ptr<FunctionAST>>& getFunctions() const { return functions; }
    const std::vector<std::unique_ptr<PrototypeAST>>& getExterns() const { return externs; }

private:
    Parser& parser;
    llvm::raw_ostream& diag;
    DriverOptions opts;
    DriverStats stats;

    // Filled only with opts.retainAST; anonymous top-level expressions are
    // kept in functions, in source order.
    std::vector<std::unique_ptr<FunctionAST>> functions;
    std::vector<std::unique_ptr<PrototypeAST>> externs;

    void handleDefinition();
    void handleExtern();
    void handleTopLevelExpression();
    void recover(unsigned& failureCount, llvm::Error err);
};

void printStats(llvm::raw_ostream& os, const DriverStats& stats);

} // end namespace kaleido

#endif // KALEIDO_DRIVER_H
