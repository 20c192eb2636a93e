// File: tests/lexer_test.cpp
// Purpose: Tokenizer covers operators, literals, keywords and rejects stray input.

#include <gtest/gtest.h>

#include "valyxo/lexer.hpp"

#include <vector>

using namespace vx;

namespace
{
std::vector<TokKind> kinds(const std::string &src)
{
    Lexer lx(src, 1);
    auto out = lx.lex();
    std::vector<TokKind> ks;
    for (const auto &t : out.toks)
        ks.push_back(t.k);
    return ks;
}
} // namespace

TEST(Lexer, SetStatementWithFloorDivision)
{
    std::vector<TokKind> want = {TokKind::Set, TokKind::Id,  TokKind::Assign, TokKind::Int,
                                 TokKind::SlashSlash, TokKind::Int, TokKind::Newline};
    EXPECT_EQ(kinds("set x = 10 // 3"), want);
}

TEST(Lexer, TwoCharacterOperators)
{
    std::vector<TokKind> want = {TokKind::StarStar, TokKind::Eq, TokKind::Ne, TokKind::Le,
                                 TokKind::Ge,       TokKind::Lt, TokKind::Gt, TokKind::Newline};
    EXPECT_EQ(kinds("** == != <= >= < >"), want);
}

TEST(Lexer, StringEscapesAndQuotes)
{
    Lexer lx("print \"a\\\"b\\n\", 'it''s'", 4);
    auto out = lx.lex();
    ASSERT_FALSE(out.err);
    ASSERT_GE(out.toks.size(), 4u);
    EXPECT_EQ(out.toks[1].k, TokKind::Str);
    EXPECT_EQ(out.toks[1].text, "a\"b\n");
    EXPECT_EQ(out.toks[1].line, 4);
    EXPECT_EQ(out.toks[3].k, TokKind::Str);
    EXPECT_EQ(out.toks[3].text, "it");
}

TEST(Lexer, NumbersIntAndFloat)
{
    Lexer lx("3 2.5 1e3 2.5e-2", 1);
    auto out = lx.lex();
    ASSERT_FALSE(out.err);
    EXPECT_EQ(out.toks[0].k, TokKind::Int);
    EXPECT_EQ(out.toks[1].k, TokKind::Float);
    EXPECT_EQ(out.toks[2].k, TokKind::Float);
    EXPECT_EQ(out.toks[3].k, TokKind::Float);
    EXPECT_EQ(out.toks[3].text, "2.5e-2");
}

TEST(Lexer, KeywordsAndBooleanSpellings)
{
    std::vector<TokKind> want = {TokKind::True, TokKind::True, TokKind::False, TokKind::NoneTok,
                                 TokKind::And,  TokKind::Or,   TokKind::Not,   TokKind::Newline};
    EXPECT_EQ(kinds("True true False None and or not"), want);
}

TEST(Lexer, TrailingCommentIsIgnored)
{
    std::vector<TokKind> want = {TokKind::Print, TokKind::Int, TokKind::Newline};
    EXPECT_EQ(kinds("print 1 # note"), want);
}

TEST(Lexer, HashInsideStringIsText)
{
    Lexer lx("print \"#1\"", 1);
    auto out = lx.lex();
    ASSERT_FALSE(out.err);
    EXPECT_EQ(out.toks[1].text, "#1");
}

TEST(Lexer, UnterminatedStringIsSyntaxError)
{
    Lexer lx("print \"oops", 7);
    auto out = lx.lex();
    ASSERT_TRUE(out.err);
    EXPECT_EQ(out.err->kind, ErrorKind::SyntaxError);
    EXPECT_EQ(out.err->line, 7);
    EXPECT_EQ(out.err->context, "print \"oops");
}

TEST(Lexer, MemberAccessIsRejected)
{
    Lexer lx("print x.y", 1);
    auto out = lx.lex();
    ASSERT_TRUE(out.err);
    EXPECT_NE(out.err->msg.find("member access"), std::string::npos);
}

TEST(Lexer, StrayCharactersAreRejected)
{
    Lexer bang("set a = !b", 1);
    EXPECT_TRUE(bang.lex().err);
    Lexer at("set a = @", 1);
    EXPECT_TRUE(at.lex().err);
}

TEST(Lexer, LexLinesJoinsWithNewlinesAndEnds)
{
    auto out = lex_lines({{1, "set a = 1"}, {3, "print a"}});
    ASSERT_FALSE(out.err);
    ASSERT_FALSE(out.toks.empty());
    EXPECT_EQ(out.toks.back().k, TokKind::End);
    int newlines = 0;
    for (const auto &t : out.toks)
        if (t.k == TokKind::Newline)
            ++newlines;
    EXPECT_EQ(newlines, 2);
    EXPECT_EQ(out.toks[5].k, TokKind::Print);
    EXPECT_EQ(out.toks[5].line, 3);
}
