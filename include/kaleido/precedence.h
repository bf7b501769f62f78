#ifndef KALEIDO_PRECEDENCE_H
#define KALEIDO_PRECEDENCE_H

#include <map>

namespace kaleido {

/// PrecedenceTable - This holds the precedence for each binary operator that is
/// defined. Larger values bind tighter; 1 is the lowest precedence.
class PrecedenceTable {
public:
    /// Creates a table holding the standard binary operators.
    PrecedenceTable() { installStandardOps(); }

    void installStandardOps();

    /// Defines or redefines a binary operator. A non-positive precedence
    /// leaves the character in the table but not usable as an operator.
    void setPrecedence(char op, int prec) { binopPrecedence[op] = prec; }
    void erase(char op) { binopPrecedence.erase(op); }
    void clear() { binopPrecedence.clear(); }

    /// Returns the precedence of a token code, or -1 if it is not a declared
    /// binary operator.
    int getPrecedence(int tok) const;

private:
    std::map<char, int> binopPrecedence;
};

} // end namespace kaleido

#endif // KALEIDO_PRECEDENCE_H
