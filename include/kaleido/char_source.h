#ifndef KALEIDO_CHAR_SOURCE_H
#define KALEIDO_CHAR_SOURCE_H

#include <cstdio>
#include <memory>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/MemoryBuffer.h"

namespace kaleido {

//===----------------------------------------------------------------------===//
// Character sources
//===----------------------------------------------------------------------===//
// The lexer pulls one character at a time from a CharSource. getChar returns
// the next character as a value in [0, 255], or EOF once the input is
// exhausted. EOF is sticky: every later call returns EOF again.
class CharSource {
public:
    virtual ~CharSource() = default;
    virtual int getChar() = 0;
};

/// BufferSource - Yields the bytes of an in-memory buffer.
class BufferSource : public CharSource {
public:
    explicit BufferSource(std::string text) : text(std::move(text)) {}
    explicit BufferSource(std::unique_ptr<llvm::MemoryBuffer> buffer)
        : text(buffer->getBuffer().str()) {}

    /// Concatenates the program inputs with a single space between them.
    static BufferSource fromInputs(llvm::ArrayRef<std::string> inputs);

    int getChar() override;

private:
    std::string text;
    size_t pos = 0;
};

/// StdinSource - Reads standard input with getchar.
class StdinSource : public CharSource {
public:
    int getChar() override;

private:
    bool exhausted = false;
};

} // end namespace kaleido

#endif // KALEIDO_CHAR_SOURCE_H
