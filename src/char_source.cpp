#include "kaleido/char_source.h"

#include "llvm/ADT/StringExtras.h"

using namespace kaleido;

BufferSource BufferSource::fromInputs(llvm::ArrayRef<std::string> inputs) {
    return BufferSource(llvm::join(inputs.begin(), inputs.end(), " "));
}

int BufferSource::getChar() {
    if (pos >= text.size()) return EOF;
    // Bytes above 127 must not collide with EOF.
    return static_cast<unsigned char>(text[pos++]);
}

int StdinSource::getChar() {
    if (exhausted) return EOF;
    int c = getchar();
    if (c == EOF) exhausted = true;
    return c;
}
