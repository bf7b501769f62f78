#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Format.h"

#include "kaleido/ast.h"

using namespace kaleido;

void ExprAST::print(llvm::raw_ostream& os) const {
    switch (getKind()) {
    case EK_Number:
        os << llvm::format("%g", llvm::cast<NumberExprAST>(this)->getValue());
        return;
    case EK_Variable:
        os << llvm::cast<VariableExprAST>(this)->getName();
        return;
    case EK_Binary: {
        auto* e = llvm::cast<BinaryExprAST>(this);
        os << '(' << e->getOp() << ' ';
        e->getLHS().print(os);
        os << ' ';
        e->getRHS().print(os);
        os << ')';
        return;
    }
    case EK_Call: {
        auto* e = llvm::cast<CallExprAST>(this);
        os << "(call " << e->getCallee();
        for (const auto& arg : e->getArgs()) {
            os << ' ';
            arg->print(os);
        }
        os << ')';
        return;
    }
    }
    llvm_unreachable("unknown expression kind");
}

void PrototypeAST::print(llvm::raw_ostream& os) const {
    os << "(proto " << name << " (";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) os << ' ';
        os << args[i];
    }
    os << "))";
}

void FunctionAST::print(llvm::raw_ostream& os) const {
    os << "(def ";
    proto->print(os);
    os << ' ';
    body->print(os);
    os << ')';
}
