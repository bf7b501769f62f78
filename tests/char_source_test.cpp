#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "llvm/Support/MemoryBuffer.h"

#include "kaleido/char_source.h"

using namespace kaleido;

namespace {

std::string drain(CharSource& source) {
    std::string out;
    for (int c = source.getChar(); c != EOF; c = source.getChar())
        out += static_cast<char>(c);
    return out;
}

} // namespace

TEST(CharSource, InputsAreJoinedWithSingleSpaces) {
    std::vector<std::string> inputs = {"def", "f(x)", "x+1"};
    BufferSource source = BufferSource::fromInputs(inputs);
    EXPECT_EQ(drain(source), "def f(x) x+1");
}

TEST(CharSource, NoInputsIsEmpty) {
    BufferSource source = BufferSource::fromInputs({});
    EXPECT_EQ(source.getChar(), EOF);
}

TEST(CharSource, EofIsSticky) {
    BufferSource source(std::string("a"));
    EXPECT_EQ(source.getChar(), 'a');
    EXPECT_EQ(source.getChar(), EOF);
    EXPECT_EQ(source.getChar(), EOF);
    EXPECT_EQ(source.getChar(), EOF);
}

TEST(CharSource, HighBytesAreNotEof) {
    BufferSource source(std::string("\xff"));
    EXPECT_EQ(source.getChar(), 0xff);
    EXPECT_EQ(source.getChar(), EOF);
}

TEST(CharSource, FromMemoryBuffer) {
    BufferSource source(llvm::MemoryBuffer::getMemBufferCopy("1 + 2", "test"));
    EXPECT_EQ(drain(source), "1 + 2");
}
