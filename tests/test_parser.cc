#include <gtest/gtest.h>

#include "errors.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

using logic::LexError;
using logic::ParseError;
using logic::ParseResult;
using logic::Parser;
using logic::Tokenizer;

namespace {
ParseResult parse(const std::string& source) {
    Tokenizer tokenizer(source);
    Parser parser(tokenizer);
    return parser.parse();
}

std::string shape(const std::string& source) {
    return parse(source).tree->toString();
}
}

TEST(ParserTest, SingleLiteral) {
    EXPECT_EQ(shape("1"), "1");
    EXPECT_EQ(shape("0"), "0");
}

TEST(ParserTest, SimpleConjunction) {
    EXPECT_EQ(shape("1 ^ 0"), "(^ 1 0)");
}

TEST(ParserTest, AndBindsTighterThanOr) {
    EXPECT_EQ(shape("1 ^ 0 v 1"), "(v (^ 1 0) 1)");
    EXPECT_EQ(shape("1 v 0 ^ 1"), "(v 1 (^ 0 1))");
}

TEST(ParserTest, ParenthesesOverridePrecedence) {
    EXPECT_EQ(shape("1 ^ (0 v 1)"), "(^ 1 (v 0 1))");
    EXPECT_EQ(shape("(1 ^ 0) v 1"), "(v (^ 1 0) 1)");
}

TEST(ParserTest, DoubleParenthesesChangeNothing) {
    EXPECT_EQ(shape("((1 ^ 0) v 1)"), shape("(1 ^ 0) v 1"));
    EXPECT_EQ(shape("((1))"), "1");
}

TEST(ParserTest, NegationBindsTighterThanBinary) {
    EXPECT_EQ(shape("~1 v 0"), "(v (~ 1) 0)");
    EXPECT_EQ(shape("~1 v ~0"), "(v (~ 1) (~ 0))");
    EXPECT_EQ(shape("1 ^ ~0 v 1"), "(v (^ 1 (~ 0)) 1)");
}

TEST(ParserTest, NegationOfGroup) {
    EXPECT_EQ(shape("~(1 v 0)"), "(~ (v 1 0))");
}

TEST(ParserTest, RepeatedNegation) {
    EXPECT_EQ(shape("~~1"), "(~ (~ 1))");
    EXPECT_EQ(shape("~ ~ ~p"), "(~ (~ (~ p)))");
}

TEST(ParserTest, LongerStatement) {
    EXPECT_EQ(shape("0 ^ 1 v 0 ^ 1"), "(v (^ 0 1) (^ 0 1))");
}

TEST(ParserTest, EquivalenceHasLowestPrecedence) {
    EXPECT_EQ(shape("~1 v ~0 <=> 0"), "(<=> (v (~ 1) (~ 0)) 0)");
    EXPECT_EQ(shape("1 => 0 <=> 0 => 1"), "(<=> (=> 1 0) (=> 0 1))");
}

TEST(ParserTest, ImplicationBindsLooserThanOr) {
    EXPECT_EQ(shape("1 => 0 v 1"), "(=> 1 (v 0 1))");
    EXPECT_EQ(shape("1 v 0 => 1"), "(=> (v 1 0) 1)");
}

TEST(ParserTest, BinaryOperatorsAreLeftAssociative) {
    EXPECT_EQ(shape("1 => 0 => 1"), "(=> (=> 1 0) 1)");
    EXPECT_EQ(shape("p ^ q ^ r"), "(^ (^ p q) r)");
    EXPECT_EQ(shape("0 <=> 0 <=> 0"), "(<=> (<=> 0 0) 0)");
}

TEST(ParserTest, AssignmentsFillBindings) {
    auto result = parse("p := 1 q := 0 r := 1 p ^ q ^ r");

    EXPECT_EQ(result.tree->toString(), "(^ (^ p q) r)");
    EXPECT_EQ(result.bindings.size(), 3u);
    EXPECT_EQ(result.bindings.lookup("p"), std::optional<bool>(true));
    EXPECT_EQ(result.bindings.lookup("q"), std::optional<bool>(false));
    EXPECT_EQ(result.bindings.lookup("r"), std::optional<bool>(true));
}

TEST(ParserTest, ReassignmentKeepsLastValue) {
    auto result = parse("p := 1 p := 0 p");
    EXPECT_EQ(result.bindings.lookup("p"), std::optional<bool>(false));
}

TEST(ParserTest, AssignmentFromVariableUsesEarlierValue) {
    auto result = parse("p := 0 q := p q");
    EXPECT_EQ(result.bindings.lookup("q"), std::optional<bool>(false));
}

TEST(ParserTest, AssignmentFromUndefinedVariableIsError) {
    EXPECT_THROW(parse("p := q p"), ParseError);
}

TEST(ParserTest, AssignmentLeavesNoNodes) {
    EXPECT_EQ(shape("p := 1 ~p"), "(~ p)");
}

TEST(ParserTest, AssignmentWithoutValueIsError) {
    EXPECT_THROW(parse("p :="), ParseError);
    EXPECT_THROW(parse("p := ^ 1"), ParseError);
    EXPECT_THROW(parse("p := ( 1 ) p"), ParseError);
}

TEST(ParserTest, AssignmentAfterExpressionStartIsError) {
    EXPECT_THROW(parse("1 ^ p := 1"), ParseError);
    EXPECT_THROW(parse("p ^ q q := 1"), ParseError);
    EXPECT_THROW(parse(":= 1"), ParseError);
    EXPECT_THROW(parse("1 := 0"), ParseError);
}

TEST(ParserTest, OnlyAssignmentsIsEmptyExpression) {
    EXPECT_THROW(parse("p := 1"), ParseError);
}

// Неопределённая переменная - ошибка вычисления, а не разбора
TEST(ParserTest, UnassignedVariableParses) {
    auto result = parse("p ^ q");
    EXPECT_EQ(result.tree->toString(), "(^ p q)");
    EXPECT_TRUE(result.bindings.empty());
}

TEST(ParserTest, AdjacentValuesAreError) {
    EXPECT_THROW(parse("1 1"), ParseError);
    EXPECT_THROW(parse("p q"), ParseError);
    EXPECT_THROW(parse("(1 ^ 0) 1"), ParseError);
    EXPECT_THROW(parse("1 (0)"), ParseError);
    EXPECT_THROW(parse("1 ~0"), ParseError);
}

TEST(ParserTest, MissingOperandIsError) {
    EXPECT_THROW(parse("^ 1"), ParseError);
    EXPECT_THROW(parse("1 ^"), ParseError);
    EXPECT_THROW(parse("1 ^ v 0"), ParseError);
    EXPECT_THROW(parse("~"), ParseError);
    EXPECT_THROW(parse("1 ~"), ParseError);
}

TEST(ParserTest, UnmatchedClosingParenthesisIsError) {
    EXPECT_THROW(parse(")1"), ParseError);
    EXPECT_THROW(parse("1 ^ 0)"), ParseError);
    EXPECT_THROW(parse("(1 => 0) ^ 1)"), ParseError);
}

TEST(ParserTest, UnmatchedOpeningParenthesisIsError) {
    EXPECT_THROW(parse("(1 ^ 0"), ParseError);
    EXPECT_THROW(parse("((1)"), ParseError);
    EXPECT_THROW(parse("("), ParseError);
}

TEST(ParserTest, EmptyParenthesesAreError) {
    EXPECT_THROW(parse("()"), ParseError);
    EXPECT_THROW(parse("1 ^ ()"), ParseError);
}

TEST(ParserTest, EmptyInputIsError) {
    EXPECT_THROW(parse(""), ParseError);
    EXPECT_THROW(parse("  \t "), ParseError);
}

TEST(ParserTest, LexErrorsPropagate) {
    EXPECT_THROW(parse("<1"), LexError);
    EXPECT_THROW(parse("p := 1 p = q"), LexError);
}

TEST(ParserTest, ParseCanBeRepeated) {
    Tokenizer tokenizer("p := 1 p v 0");
    Parser parser(tokenizer);

    auto first = parser.parse();
    tokenizer.reset();
    auto second = parser.parse();

    EXPECT_EQ(first.tree->toString(), second.tree->toString());
    EXPECT_EQ(first.bindings.entries(), second.bindings.entries());
}
