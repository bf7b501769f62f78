#include "kaleido/log.h"
#include "kaleido/error.h"

namespace kaleido {

void logInfo(llvm::raw_ostream& os, llvm::StringRef str) {
    os << str << "\n";
}

void logError(llvm::raw_ostream& os, llvm::Error err) {
    llvm::handleAllErrors(std::move(err),
        [&](const SyntaxError& e) {
            os << "LogError: " << e.getMessage() << "\n";
        },
        [&](const llvm::ErrorInfoBase& e) {
            os << "LogError: " << e.message() << "\n";
        });
}

} // end namespace kaleido
