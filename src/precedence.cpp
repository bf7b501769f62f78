#include "kaleido/precedence.h"

using namespace kaleido;

void PrecedenceTable::installStandardOps() {
    // Install standard binary operators.
    // 1 is lowest precedence.
    binopPrecedence['<'] = 10;
    binopPrecedence['+'] = 20;
    binopPrecedence['-'] = 30;
    binopPrecedence['*'] = 40;  // highest.
}

int PrecedenceTable::getPrecedence(int tok) const {
    if (tok < 0 || tok > 127) return -1;

    // Make sure it's a declared binop.
    auto it = binopPrecedence.find(static_cast<char>(tok));
    if (it == binopPrecedence.end() || it->second <= 0) return -1;
    return it->second;
}
