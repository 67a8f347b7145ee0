#include "brite/checker/fixture.h"

#include <gtest/gtest.h>

#include "brite/checker/checker.h"
#include "unit/checker/ast_builder.h"

namespace brite {


// fun f(x: Int, y: Int) { x }
static FunctionDeclarationPtr TakesTwoInts() {
  auto params = MakeList<ParameterPtr>(MakeParam("x", MakeNamedType("Int", SourceRange(1, 10, 1, 12)), SourceRange(1, 7, 1, 12)),
                                       MakeParam("y", MakeNamedType("Int", SourceRange(1, 18, 1, 20)), SourceRange(1, 15, 1, 20)));
  auto body = MakeBody(MakeRef("x", SourceRange(1, 25, 1, 25)));
  body->set_position(SourceRange(1, 23, 1, 27));
  return MakeDecl("f", MakeFunction(std::move(params), nullptr, std::move(body), SourceRange(1, 6, 1, 21)),
                  SourceRange(1, 5, 1, 5));
}


// fun main() { <body> }
static FunctionDeclarationPtr Main(ExpressionPtr&& value) {
  auto body = MakeBody(std::move(value));
  body->set_position(SourceRange(2, 12, 2, 30));
  return MakeDecl("main", MakeFunction(Vector<ParameterPtr>(), nullptr, std::move(body), SourceRange(2, 9, 2, 10)),
                  SourceRange(2, 5, 2, 8));
}


TEST(FixtureTest, NoErrors) {
  auto program = MakeProgram(TakesTwoInts());

  Checker checker;
  checker.VisitProgram(program.get());

  EXPECT_EQ(RenderFixture("ok", checker.diagnostics()), "# Checker Test: `ok`\n");
}


TEST(FixtureTest, CallWithTooFewArguments) {
  // f(true)
  auto call = MakeCall(MakeRef("f", SourceRange(2, 14, 2, 14)),
                       MakeList<ExpressionPtr>(MakeBool(true, SourceRange(2, 16, 2, 19))), SourceRange(2, 15, 2, 20),
                       SourceRange(2, 14, 2, 20));
  auto program = MakeProgram(TakesTwoInts(), Main(std::move(call)));

  Checker checker;
  checker.VisitProgram(program.get());

  auto expected =
      "# Checker Test: `call`\n"
      "\n"
      "## Errors\n"
      "\n"
      "- (2:15-2:20) Can not call `f` because we have one argument but we need two.\n"
      "  - (1:6-1:21) two arguments\n"
      "- (2:16-2:19) Can not call `f` because a `Bool` is not an `Int`.\n"
      "  - (1:10-1:12) `Int`\n";
  EXPECT_EQ(RenderFixture("call", checker.diagnostics()), expected);
}


TEST(FixtureTest, CallWithTooManyArguments) {
  // f(1, 2, 3)
  auto args = MakeList<ExpressionPtr>(MakeInt("1", SourceRange(2, 16, 2, 16)), MakeInt("2", SourceRange(2, 19, 2, 19)),
                                      MakeInt("3", SourceRange(2, 22, 2, 22)));
  auto call = MakeCall(MakeRef("f", SourceRange(2, 14, 2, 14)), std::move(args), SourceRange(2, 15, 2, 23),
                       SourceRange(2, 14, 2, 23));
  auto program = MakeProgram(TakesTwoInts(), Main(std::move(call)));

  Checker checker;
  checker.VisitProgram(program.get());

  auto expected =
      "# Checker Test: `call`\n"
      "\n"
      "## Errors\n"
      "\n"
      "- (2:15-2:23) Can not call `f` because we have three arguments but we only need two.\n"
      "  - (1:6-1:21) two arguments\n";
  EXPECT_EQ(RenderFixture("call", checker.diagnostics()), expected);
}


TEST(FixtureTest, DuplicateDeclaration) {
  auto program = MakeProgram(MakeDecl("g", MakeFunction(Vector<ParameterPtr>(), nullptr, MakeBlock()), SourceRange(1, 5, 1, 5)),
                             MakeDecl("g", MakeFunction(Vector<ParameterPtr>(), nullptr, MakeBlock()), SourceRange(2, 5, 2, 5)));

  Checker checker;
  checker.VisitProgram(program.get());

  auto expected =
      "# Checker Test: `duplicate`\n"
      "\n"
      "## Errors\n"
      "\n"
      "- (2:5-2:5) Can not use the name `g` again.\n"
      "  - (1:5-1:5) `g`\n";
  EXPECT_EQ(RenderFixture("duplicate", checker.diagnostics()), expected);
}


}  // namespace brite
