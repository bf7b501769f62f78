#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "kaleido/char_source.h"
#include "kaleido/lexer.h"

using namespace kaleido;

namespace {

// Counts how many characters the lexer pulled from the underlying buffer.
class CountingSource : public CharSource {
public:
    explicit CountingSource(std::string text) : inner(std::move(text)) {}
    int getChar() override {
        ++calls;
        return inner.getChar();
    }
    int calls = 0;

private:
    BufferSource inner;
};

std::vector<Token> lexAll(const std::string& text) {
    BufferSource source(text);
    Lexer lexer(source);
    std::vector<Token> toks;
    do {
        toks.push_back(lexer.gettok());
    } while (!toks.back().is(tok_eof));
    return toks;
}

} // namespace

TEST(Lexer, EmptyInputIsEof) {
    auto toks = lexAll("");
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0].kind, tok_eof);
}

TEST(Lexer, EofIsStickyAndDoesNotConsume) {
    CountingSource source("x");
    Lexer lexer(source);
    EXPECT_EQ(lexer.gettok().kind, tok_identifier);
    EXPECT_EQ(lexer.gettok().kind, tok_eof);
    int callsAtEof = source.calls;
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(lexer.gettok().kind, tok_eof);
    EXPECT_EQ(source.calls, callsAtEof);
}

TEST(Lexer, Keywords) {
    auto toks = lexAll("def extern");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].kind, tok_def);
    EXPECT_EQ(toks[1].kind, tok_extern);
}

TEST(Lexer, IdentifiersKeepTheirText) {
    auto toks = lexAll("foo definitely x1y2 externs");
    ASSERT_EQ(toks.size(), 5u);
    const char* names[] = {"foo", "definitely", "x1y2", "externs"};
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(toks[i].kind, tok_identifier);
        EXPECT_EQ(toks[i].identifierStr, names[i]);
    }
}

TEST(Lexer, Numbers) {
    auto toks = lexAll("3.14 42 .5");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0].kind, tok_number);
    EXPECT_DOUBLE_EQ(toks[0].numVal, 3.14);
    EXPECT_DOUBLE_EQ(toks[1].numVal, 42.0);
    EXPECT_DOUBLE_EQ(toks[2].numVal, 0.5);
}

TEST(Lexer, SecondDecimalPointTruncatesValue) {
    auto toks = lexAll("3.1.4");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, tok_number);
    EXPECT_DOUBLE_EQ(toks[0].numVal, 3.1);
}

TEST(Lexer, NumberWithoutNumericPrefixIsNaN) {
    auto toks = lexAll(".");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, tok_number);
    EXPECT_TRUE(std::isnan(toks[0].numVal));

    toks = lexAll("..5");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, tok_number);
    EXPECT_TRUE(std::isnan(toks[0].numVal));
}

TEST(Lexer, NumberStopsAtLetter) {
    auto toks = lexAll("12abc");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_DOUBLE_EQ(toks[0].numVal, 12.0);
    EXPECT_EQ(toks[1].kind, tok_identifier);
    EXPECT_EQ(toks[1].identifierStr, "abc");
}

TEST(Lexer, CommentIsSkipped) {
    auto toks = lexAll("# comment\n42");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, tok_number);
    EXPECT_DOUBLE_EQ(toks[0].numVal, 42.0);
}

TEST(Lexer, CommentAtEndOfInput) {
    auto toks = lexAll("x # trailing");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].kind, tok_identifier);
    EXPECT_EQ(toks[1].kind, tok_eof);
}

TEST(Lexer, ManyCommentLines) {
    std::string text;
    for (int i = 0; i < 100000; ++i)
        text += "#c\r";
    text += "7";
    auto toks = lexAll(text);
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_DOUBLE_EQ(toks[0].numVal, 7.0);
}

TEST(Lexer, OtherCharactersAreTheirOwnTokens) {
    auto toks = lexAll("(a, b) + ;");
    std::vector<int> kinds;
    for (const auto& t : toks) kinds.push_back(t.kind);
    std::vector<int> expected = {'(', tok_identifier, ',', tok_identifier, ')', '+', ';', tok_eof};
    EXPECT_EQ(kinds, expected);
}

TEST(Lexer, AllWhitespaceKindsAreSkipped) {
    auto toks = lexAll(" \t\n\v\f\rx");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].identifierStr, "x");
}

TEST(Lexer, NonAsciiByteIsACharacterToken) {
    auto toks = lexAll("\xc3\xa9");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].kind, 0xc3);
    EXPECT_EQ(toks[1].kind, 0xa9);
    EXPECT_EQ(toks[2].kind, tok_eof);
}
