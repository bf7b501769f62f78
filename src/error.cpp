#include "kaleido/error.h"

using namespace kaleido;

char SyntaxError::ID = 0;

void SyntaxError::log(llvm::raw_ostream& os) const {
    os << msg;
}

std::error_code SyntaxError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}
