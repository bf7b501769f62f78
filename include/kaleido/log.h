#ifndef KALEIDO_LOG_H
#define KALEIDO_LOG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

// Diagnostics helpers. Every event is written as a single line.
namespace kaleido {

void logInfo(llvm::raw_ostream& os, llvm::StringRef str);

/// Prints "LogError: <message>" for each error carried by err and consumes it.
void logError(llvm::raw_ostream& os, llvm::Error err);

} // end namespace kaleido
#endif // KALEIDO_LOG_H
