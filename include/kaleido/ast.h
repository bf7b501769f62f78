#ifndef KALEIDO_AST_H
#define KALEIDO_AST_H

#include <memory>
#include <string>
#include <vector>

#include "llvm/Support/Casting.h"
#include "llvm/Support/raw_ostream.h"

namespace kaleido {
//===----------------------------------------------------------------------===//
// Abstract Syntax Tree (aka Parse Tree)
//===----------------------------------------------------------------------===//

/// ExprAST - Base class for all expression nodes. The set of expression kinds
/// is closed; use llvm::isa / llvm::dyn_cast on getKind() to inspect a node.
class ExprAST {
public:
    enum ExprKind {
        EK_Number,
        EK_Variable,
        EK_Binary,
        EK_Call
    };

    virtual ~ExprAST() = default;

    ExprKind getKind() const { return kind; }

    /// Prints the expression as an S-expression.
    void print(llvm::raw_ostream& os) const;

protected:
    explicit ExprAST(ExprKind kind) : kind(kind) {}

private:
    const ExprKind kind;
};

/// NumberExprAST - Expression class for numeric literals like "1.0".
class NumberExprAST : public ExprAST {
    double val;

public:
    explicit NumberExprAST(double val) : ExprAST(EK_Number), val(val) {}
    double getValue() const { return val; }

    static bool classof(const ExprAST* e) { return e->getKind() == EK_Number; }
};

/// VariableExprAST - Expression class for referencing a variable, like "a".
class VariableExprAST : public ExprAST {
    std::string name;

public:
    explicit VariableExprAST(std::string name)
        : ExprAST(EK_Variable), name(std::move(name)) {}
    const std::string& getName() const { return name; }

    static bool classof(const ExprAST* e) { return e->getKind() == EK_Variable; }
};

/// BinaryExprAST - Expression class for a binary operator.
class BinaryExprAST : public ExprAST {
    char op;
    std::unique_ptr<ExprAST> lhs, rhs;

public:
    BinaryExprAST(char op, std::unique_ptr<ExprAST> lhs, std::unique_ptr<ExprAST> rhs)
        : ExprAST(EK_Binary), op(op), lhs(std::move(lhs)), rhs(std::move(rhs)) {}

    char getOp() const { return op; }
    const ExprAST& getLHS() const { return *lhs; }
    const ExprAST& getRHS() const { return *rhs; }

    static bool classof(const ExprAST* e) { return e->getKind() == EK_Binary; }
};

/// CallExprAST - Expression class for function calls.
class CallExprAST : public ExprAST {
    std::string callee;
    std::vector<std::unique_ptr<ExprAST>> args;

public:
    CallExprAST(std::string callee, std::vector<std::unique_ptr<ExprAST>> args)
        : ExprAST(EK_Call), callee(std::move(callee)), args(std::move(args)) {}

    const std::string& getCallee() const { return callee; }
    const std::vector<std::unique_ptr<ExprAST>>& getArgs() const { return args; }

    static bool classof(const ExprAST* e) { return e->getKind() == EK_Call; }
};

/// PrototypeAST - This class represents the "prototype" for a function,
/// which captures its name, and its argument names (thus implicitly the number
/// of arguments the function takes). The name is empty for the anonymous
/// function wrapping a top-level expression.
class PrototypeAST {
    std::string name;
    std::vector<std::string> args;

public:
    PrototypeAST(std::string name, std::vector<std::string> args)
        : name(std::move(name)), args(std::move(args)) {}

    const std::string& getName() const { return name; }
    const std::vector<std::string>& getArgs() const { return args; }
    bool isAnonymous() const { return name.empty(); }

    void print(llvm::raw_ostream& os) const;
};

/// FunctionAST - This class represents a function definition itself.
class FunctionAST {
    std::unique_ptr<PrototypeAST> proto;
    std::unique_ptr<ExprAST> body;

public:
    FunctionAST(std::unique_ptr<PrototypeAST> proto, std::unique_ptr<ExprAST> body)
        : proto(std::move(proto)), body(std::move(body)) {}

    const PrototypeAST& getProto() const { return *proto; }
    const ExprAST& getBody() const { return *body; }

    void print(llvm::raw_ostream& os) const;
};

/// Renders a node with print() into a string.
template <typename NodeT>
std::string printToString(const NodeT& node) {
    std::string s;
    llvm::raw_string_ostream os(s);
    node.print(os);
    return os.str();
}

} // end namespace kaleido

#endif // KALEIDO_AST_H
