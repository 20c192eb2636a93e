// File: tests/evaluator_test.cpp
// Purpose: Arithmetic, comparison, logic and indexing semantics of expressions.

#include <gtest/gtest.h>

#include "valyxo/evaluator.hpp"

#include <limits>

using namespace vx;

namespace
{
EvalOut eval(const std::string &text, const Environment &env = Environment{}, const Options &opts = {})
{
    auto p = parse_expression(text);
    if (p.err)
        return EvalOut{Value{}, p.err};
    return evaluate(p.expr, env, opts);
}

Value value_of(const std::string &text)
{
    auto out = eval(text);
    EXPECT_FALSE(out.err) << text << ": " << (out.err ? out.err->msg : "");
    return out.val;
}

ErrorKind error_of(const std::string &text, const Options &opts = {})
{
    auto out = eval(text, Environment{}, opts);
    EXPECT_TRUE(out.err) << text << " evaluated to " << repr(out.val);
    return out.err ? out.err->kind : ErrorKind::SyntaxError;
}
} // namespace

TEST(EvaluatorArith, IntegerOperations)
{
    EXPECT_EQ(value_of("1 + 2 * 3"), Value(7));
    EXPECT_EQ(value_of("(1 + 2) * 3"), Value(9));
    EXPECT_EQ(value_of("10 - 20"), Value(-10));
    EXPECT_TRUE(value_of("7 * 6").is_int());
}

TEST(EvaluatorArith, TrueDivisionAlwaysYieldsFloat)
{
    Value v = value_of("10 / 4");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.as_float(), 2.5);
    EXPECT_TRUE(value_of("6 / 3").is_float());
    EXPECT_EQ(to_string(value_of("6 / 3")), "2.0");
}

TEST(EvaluatorArith, FloorDivisionTruncatesTowardZero)
{
    EXPECT_EQ(value_of("10 // 3"), Value(3));
    EXPECT_EQ(value_of("-7 // 2"), Value(-3));
    EXPECT_EQ(value_of("7 // -2"), Value(-3));
    Value f = value_of("7.5 // 2");
    ASSERT_TRUE(f.is_float());
    EXPECT_DOUBLE_EQ(f.as_float(), 3.0);
}

TEST(EvaluatorArith, ModuloTakesSignOfDivisor)
{
    EXPECT_EQ(value_of("7 % 3"), Value(1));
    EXPECT_EQ(value_of("-7 % 3"), Value(2));
    EXPECT_EQ(value_of("7 % -3"), Value(-2));
    EXPECT_DOUBLE_EQ(value_of("7.5 % 2").as_float(), 1.5);
    EXPECT_DOUBLE_EQ(value_of("-7.5 % 2").as_float(), 0.5);
}

TEST(EvaluatorArith, Power)
{
    EXPECT_EQ(value_of("2 ** 10"), Value(1024));
    EXPECT_TRUE(value_of("2 ** 10").is_int());
    EXPECT_DOUBLE_EQ(value_of("2 ** -1").as_float(), 0.5);
    EXPECT_EQ(value_of("-2 ** 2"), Value(4));
    EXPECT_EQ(value_of("2 ** 3 ** 2"), Value(512));
    EXPECT_EQ(value_of("0 ** 0"), Value(1));
}

TEST(EvaluatorArith, MixedIntFloatPromotes)
{
    Value v = value_of("1 + 0.5");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.as_float(), 1.5);
    EXPECT_EQ(value_of("3 == 3.0"), Value(true));
}

TEST(EvaluatorArith, DivisionByZero)
{
    EXPECT_EQ(error_of("1 / 0"), ErrorKind::DivisionByZero);
    EXPECT_EQ(error_of("1 // 0"), ErrorKind::DivisionByZero);
    EXPECT_EQ(error_of("1 % 0"), ErrorKind::DivisionByZero);
    EXPECT_EQ(error_of("1.5 / 0.0"), ErrorKind::DivisionByZero);
    EXPECT_EQ(error_of("0 ** -1"), ErrorKind::DivisionByZero);
}

TEST(EvaluatorArith, OverflowIsReported)
{
    EXPECT_EQ(error_of("9223372036854775807 + 1"), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("3037000500 * 3037000500"), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("2 ** 64"), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("10.0 ** 400"), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("99999999999999999999"), ErrorKind::SyntaxError);
}

TEST(EvaluatorArith, NegativeBaseFractionalExponent)
{
    EXPECT_EQ(error_of("(-8) ** 0.5"), ErrorKind::RangeError);
}

TEST(EvaluatorTypes, StringConcatenationRequiresStrings)
{
    EXPECT_EQ(value_of("\"ab\" + \"cd\""), Value("abcd"));
    auto out = eval("\"n=\" + 5");
    ASSERT_TRUE(out.err);
    EXPECT_EQ(out.err->kind, ErrorKind::TypeError);
    EXPECT_EQ(out.err->suggestion, "strings can only be joined with strings");
}

TEST(EvaluatorTypes, BoolIsNotANumber)
{
    EXPECT_EQ(error_of("True + 1"), ErrorKind::TypeError);
    EXPECT_EQ(error_of("-True"), ErrorKind::TypeError);
    EXPECT_EQ(error_of("None * 2"), ErrorKind::TypeError);
    EXPECT_EQ(error_of("\"a\" - \"b\""), ErrorKind::TypeError);
}

TEST(EvaluatorTypes, Repetition)
{
    EXPECT_EQ(value_of("\"ab\" * 3"), Value("ababab"));
    EXPECT_EQ(value_of("2 * [0]"), Value(List{0, 0}));
    EXPECT_EQ(value_of("\"x\" * -1"), Value(""));
}

TEST(EvaluatorTypes, ListConcatenation)
{
    EXPECT_EQ(value_of("[1] + [2, 3]"), Value(List{1, 2, 3}));
}

TEST(EvaluatorCompare, OrderingAndEquality)
{
    EXPECT_EQ(value_of("1 < 2"), Value(true));
    EXPECT_EQ(value_of("2 <= 2"), Value(true));
    EXPECT_EQ(value_of("3 > 4"), Value(false));
    EXPECT_EQ(value_of("\"abc\" < \"abd\""), Value(true));
    EXPECT_EQ(value_of("1 != 2"), Value(true));
    EXPECT_EQ(value_of("\"1\" == 1"), Value(false));
    EXPECT_EQ(value_of("[1, 2] == [1, 2]"), Value(true));
    EXPECT_EQ(value_of("None == None"), Value(true));
}

TEST(EvaluatorCompare, OrderingAcrossTypesIsATypeError)
{
    EXPECT_EQ(error_of("1 < \"2\""), ErrorKind::TypeError);
    EXPECT_EQ(error_of("[1] < [2]"), ErrorKind::TypeError);
}

TEST(EvaluatorLogic, ShortCircuitSkipsRightOperand)
{
    // the right side would fail with UndefinedVariable if evaluated
    EXPECT_EQ(value_of("False and missing"), Value(false));
    EXPECT_EQ(value_of("True or missing"), Value(true));
    EXPECT_EQ(error_of("True and missing"), ErrorKind::UndefinedVariable);
}

TEST(EvaluatorLogic, ResultsAreBooleans)
{
    EXPECT_EQ(value_of("1 and \"x\""), Value(true));
    EXPECT_EQ(value_of("0 or \"\""), Value(false));
    EXPECT_EQ(value_of("not 0"), Value(true));
    EXPECT_EQ(value_of("not [1]"), Value(false));
}

TEST(EvaluatorIndex, ListsStringsAndDicts)
{
    EXPECT_EQ(value_of("[10, 20, 30][1]"), Value(20));
    EXPECT_EQ(value_of("[10, 20, 30][-1]"), Value(30));
    EXPECT_EQ(value_of("\"hey\"[0]"), Value("h"));
    EXPECT_EQ(value_of("{\"a\": 1, \"b\": 2}[\"b\"]"), Value(2));
    EXPECT_EQ(value_of("[[1, 2], [3]][0][1]"), Value(2));
}

TEST(EvaluatorIndex, Failures)
{
    EXPECT_EQ(error_of("[1][1]"), ErrorKind::IndexError);
    EXPECT_EQ(error_of("[1][-2]"), ErrorKind::IndexError);
    EXPECT_EQ(error_of("[1][\"0\"]"), ErrorKind::TypeError);
    EXPECT_EQ(error_of("5[0]"), ErrorKind::TypeError);
    EXPECT_EQ(error_of("{1: 2}"), ErrorKind::TypeError);

    auto out = eval("{\"name\": 1}[\"nmae\"]");
    ASSERT_TRUE(out.err);
    EXPECT_EQ(out.err->kind, ErrorKind::IndexError);
    EXPECT_EQ(out.err->suggestion, "did you mean 'name'?");
}

TEST(EvaluatorVars, LookupAndSuggestions)
{
    Environment env;
    ASSERT_FALSE(env.define("count", Value(4)).err);
    auto ok = eval("count * 2", env);
    ASSERT_FALSE(ok.err);
    EXPECT_EQ(ok.val, Value(8));

    auto typo = eval("cont + 1", env);
    ASSERT_TRUE(typo.err);
    EXPECT_EQ(typo.err->kind, ErrorKind::UndefinedVariable);
    EXPECT_EQ(typo.err->suggestion, "did you mean 'count'?");

    auto unknown = eval("zebra", env);
    ASSERT_TRUE(unknown.err);
    EXPECT_EQ(unknown.err->suggestion, "set it first: set zebra = value");
}

TEST(EvaluatorLimits, ValueSizeCap)
{
    Options opts;
    opts.max_value_size = 8;
    EXPECT_EQ(error_of("\"abcde\" + \"fghij\"", opts), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("\"ab\" * 5", opts), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("[0] * 9", opts), ErrorKind::ValueTooLarge);
    EXPECT_FALSE(eval("\"ab\" * 4", Environment{}, opts).err);
}

TEST(EvaluatorLimits, EmptySequenceRepetitionIsImmediate)
{
    EXPECT_EQ(value_of("\"\" * 1000000000000000"), Value(""));
    EXPECT_EQ(value_of("[] * 1000000000000000"), Value(List{}));
    EXPECT_EQ(value_of("1000000000000000 * []"), Value(List{}));
    EXPECT_EQ(value_of("[1, 2] * 0"), Value(List{}));
}

TEST(EvaluatorLimits, ContainerNestingIsCapped)
{
    Options opts;
    opts.max_nesting = 3;
    auto ok = eval("[[{\"k\": 1}]]", Environment{}, opts);
    ASSERT_FALSE(ok.err);
    EXPECT_EQ(ok.val.nesting, 3);
    EXPECT_EQ(error_of("[[[[1]]]]", opts), ErrorKind::ValueTooLarge);
    EXPECT_EQ(error_of("{\"a\": [[[1]]]}", opts), ErrorKind::ValueTooLarge);
}

TEST(EvaluatorLimits, ConcatenationKeepsNesting)
{
    EXPECT_EQ(value_of("[[1]] + [2]").nesting, 2);
    EXPECT_EQ(value_of("[[1]] * 3").nesting, 2);
    EXPECT_EQ(value_of("5").nesting, 0);
}

TEST(EvaluatorDisplay, ValueStrings)
{
    EXPECT_EQ(to_string(value_of("3.14")), "3.14");
    EXPECT_EQ(to_string(value_of("1.0 + 2")), "3.0");
    EXPECT_EQ(to_string(value_of("0.1 + 0.2")), "0.3");
    EXPECT_EQ(to_string(value_of("True")), "True");
    EXPECT_EQ(to_string(value_of("None")), "None");
    EXPECT_EQ(to_string(value_of("\"hi\"")), "hi");
    EXPECT_EQ(to_string(value_of("[1, \"a\", None]")), "[1, \"a\", None]");
    EXPECT_EQ(to_string(value_of("{\"k\": [2.5]}")), "{\"k\": [2.5]}");
}

TEST(EvaluatorUnary, MinimumIntegerNegationOverflows)
{
    Value min(std::numeric_limits<Int>::min());
    auto out = unary_op(TokKind::Minus, min, 3);
    ASSERT_TRUE(out.err);
    EXPECT_EQ(out.err->kind, ErrorKind::ValueTooLarge);
    EXPECT_EQ(out.err->line, 3);
}
