#ifndef KALEIDO_ERROR_H
#define KALEIDO_ERROR_H

#include <string>

#include "llvm/Support/Error.h"

namespace kaleido {

/// SyntaxError - The only error the parser produces. The message is one of
/// the fixed strings of the grammar rule that failed.
class SyntaxError : public llvm::ErrorInfo<SyntaxError> {
public:
    static char ID;

    explicit SyntaxError(std::string msg) : msg(std::move(msg)) {}

    const std::string& getMessage() const { return msg; }

    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string msg;
};

inline llvm::Error syntaxError(const char* str) {
    return llvm::make_error<SyntaxError>(str);
}

} // end namespace kaleido

#endif // KALEIDO_ERROR_H
