#include "brite/checker/unifier.h"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace brite {

static_assert(!std::copyable<Unifier>);
static_assert(!std::movable<Unifier>);


class UnifierTest : public ::testing::Test {
 protected:
  UnifierTest() :
      arena_(),
      reporter_(),
      prefix_(&arena_, &reporter_),
      unifier_(&prefix_, &arena_, &reporter_),
      printer_() {}

  std::string Bounds() const { return printer_(prefix_.bounds()); }

  // the core messages of everything reported so far
  std::vector<std::string> Messages() const {
    std::vector<std::string> messages;
    for (auto& diagnostic : reporter_.diagnostics()) {
      messages.push_back(PrintDiagnostic(diagnostic.get()));
    }
    return messages;
  }

  Monotype* Never() { return arena_.NewPrimitive(Monotype::Kind::kNever); }
  Monotype* Bool() { return arena_.NewPrimitive(Monotype::Kind::kBoolean); }
  Monotype* Num() { return arena_.NewPrimitive(Monotype::Kind::kNumber); }
  Monotype* Int() { return arena_.NewPrimitive(Monotype::Kind::kInteger); }
  Monotype* Float() { return arena_.NewPrimitive(Monotype::Kind::kFloat); }
  Monotype* Error() { return arena_.NewError(nullptr); }
  Monotype* Fun(Monotype* parameter, Monotype* body) { return arena_.NewFunction(parameter, body); }

  Monotype* Row(std::initializer_list<std::pair<const char*, Monotype*>> entries, Monotype* extension = nullptr) {
    Vector<RowEntry> row;
    for (auto& [label, type] : entries) {
      row.push_back({label, type});
    }
    return arena_.NewRowExtension(std::move(row), extension);
  }

  Polytype* Identity(const char* name) {
    Vector<NamedBound> bounds;
    bounds.push_back({name, {Flexibility::kFlexible, arena_.NewBottom()}});
    return arena_.NewQuantified(std::move(bounds), Fun(arena_.NewVariable(name), arena_.NewVariable(name)));
  }

  TypeArena arena_;
  DiagnosticReporter reporter_;
  Prefix prefix_;
  Unifier unifier_;
  TypePrinter printer_;
};


TEST_F(UnifierTest, Reflexive) {
  auto a = prefix_.Fresh();

  EXPECT_EQ(unifier_.Unify(Int(), Int()), nullptr);
  EXPECT_EQ(unifier_.Unify(a, a), nullptr);
  EXPECT_EQ(unifier_.Unify(Fun(Bool(), a), Fun(Bool(), a)), nullptr);
  EXPECT_EQ(unifier_.Unify(Row({{"x", Int()}}), Row({{"x", Int()}})), nullptr);
  EXPECT_EQ(unifier_.Unify(arena_.NewEmptyRow(), arena_.NewEmptyRow()), nullptr);

  EXPECT_FALSE(reporter_.has_diagnostics());
  EXPECT_EQ(Bounds(), "(t1)");
}


TEST_F(UnifierTest, Primitives) {
  EXPECT_EQ(unifier_.Unify(Int(), Num()), nullptr);
  EXPECT_EQ(unifier_.Unify(Float(), Num()), nullptr);
  EXPECT_EQ(unifier_.Unify(Never(), Bool()), nullptr);
  EXPECT_EQ(unifier_.Unify(Never(), Fun(Int(), Int())), nullptr);
  EXPECT_FALSE(reporter_.has_diagnostics());

  EXPECT_NE(unifier_.Unify(Num(), Int()), nullptr);
  EXPECT_NE(unifier_.Unify(Int(), Float()), nullptr);
  EXPECT_NE(unifier_.Unify(Bool(), Never()), nullptr);
  EXPECT_NE(unifier_.Unify(Int(), Fun(Int(), Int())), nullptr);

  std::vector<std::string> expected = {"Num ≢ Int", "Int ≢ Float", "Bool ≢ Never", "Int ≢ Int → Int"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, FunctionParametersAreContravariant) {
  EXPECT_EQ(unifier_.Unify(Fun(Bool(), Never()), Fun(Never(), Bool())), nullptr);
  EXPECT_EQ(unifier_.Unify(Fun(Int(), Int()), Fun(Int(), Num())), nullptr);
  EXPECT_EQ(unifier_.Unify(Fun(Num(), Int()), Fun(Int(), Int())), nullptr);
  EXPECT_FALSE(reporter_.has_diagnostics());

  auto diagnostic = unifier_.Unify(Fun(Int(), Int()), Fun(Num(), Int()));
  ASSERT_NE(diagnostic, nullptr);
  EXPECT_EQ(PrintDiagnostic(diagnostic), "Num ≢ Int");
}


TEST_F(UnifierTest, FunctionReportsBothSides) {
  auto diagnostic = unifier_.Unify(Fun(Int(), Int()), Fun(Bool(), Bool()));
  ASSERT_NE(diagnostic, nullptr);

  std::vector<std::string> expected = {"Bool ≢ Int", "Int ≢ Bool"};
  EXPECT_EQ(Messages(), expected);
  EXPECT_EQ(diagnostic, reporter_.diagnostics()[0].get());
}


TEST_F(UnifierTest, ErrorUnifiesWithAnything) {
  EXPECT_EQ(unifier_.Unify(Error(), Int()), nullptr);
  EXPECT_EQ(unifier_.Unify(Bool(), Error()), nullptr);
  EXPECT_EQ(unifier_.Unify(Fun(Int(), Error()), Fun(Int(), Bool())), nullptr);
  EXPECT_EQ(unifier_.Unify(Row({{"x", Int()}}, Error()), Row({{"x", Int()}, {"y", Bool()}})), nullptr);
  EXPECT_FALSE(reporter_.has_diagnostics());
}


TEST_F(UnifierTest, VariableTakesType) {
  auto a = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(a, Int()), nullptr);
  EXPECT_EQ(Bounds(), "(t1 = Int)");

  EXPECT_EQ(unifier_.Unify(a, Num()), nullptr);
  EXPECT_NE(unifier_.Unify(a, Bool()), nullptr);

  std::vector<std::string> expected = {"Int ≢ Bool"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, Variables) {
  auto a = prefix_.Fresh();
  auto b = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(a, b), nullptr);
  EXPECT_EQ(Bounds(), "(t1, t2 = t1)");

  ASSERT_EQ(unifier_.Unify(b, Int()), nullptr);
  EXPECT_EQ(Bounds(), "(t1 = Int, t2 = t1)");
}


TEST_F(UnifierTest, VariablesReorder) {
  auto a = prefix_.Fresh();
  auto b = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(b, a), nullptr);
  EXPECT_EQ(Bounds(), "(t2, t1 = t2)");
}


TEST_F(UnifierTest, UnboundTypeVariable) {
  auto diagnostic = unifier_.Unify(arena_.NewVariable("x"), Int());
  ASSERT_NE(diagnostic, nullptr);
  EXPECT_EQ(diagnostic->kind(), Diagnostic::Kind::kUnboundTypeVariable);
  EXPECT_EQ(PrintDiagnostic(diagnostic), "Unbound type variable `x`.");
}


TEST_F(UnifierTest, InfiniteType) {
  auto a = prefix_.Fresh();

  auto diagnostic = unifier_.Unify(a, Fun(a, Int()));
  ASSERT_NE(diagnostic, nullptr);
  EXPECT_EQ(diagnostic->kind(), Diagnostic::Kind::kInfiniteType);
  EXPECT_EQ(PrintDiagnostic(diagnostic), "Infinite type since `t1` occurs in `t1 → Int`.");
  EXPECT_EQ(Bounds(), "(t1)");
}


TEST_F(UnifierTest, RigidVariables) {
  auto t = prefix_.Add("T", {Flexibility::kRigid, arena_.NewBottom()});
  auto u = prefix_.Add("U", {Flexibility::kRigid, arena_.NewBottom()});

  EXPECT_EQ(unifier_.Unify(t, t), nullptr);
  EXPECT_NE(unifier_.Unify(t, Int()), nullptr);
  EXPECT_NE(unifier_.Unify(Int(), t), nullptr);
  EXPECT_NE(unifier_.Unify(t, u), nullptr);

  std::vector<std::string> expected = {"T ≢ Int", "Int ≢ T", "T ≢ U"};
  EXPECT_EQ(Messages(), expected);
  EXPECT_EQ(Bounds(), "(T = ⊥, U = ⊥)");
}


TEST_F(UnifierTest, FlexibleVariableMeetsRigid) {
  auto t = prefix_.Add("T", {Flexibility::kRigid, arena_.NewBottom()});
  auto a = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(a, t), nullptr);
  EXPECT_EQ(Bounds(), "(T = ⊥, t1 = T)");
}


TEST_F(UnifierTest, PolymorphicBound) {
  auto a = prefix_.FreshWithBound({Flexibility::kFlexible, Identity("x")});

  ASSERT_EQ(unifier_.Unify(a, Fun(Int(), Int())), nullptr);
  EXPECT_EQ(Bounds(), "(t1 = Int → Int)");
}


TEST_F(UnifierTest, PolymorphicBoundMismatch) {
  auto a = prefix_.FreshWithBound({Flexibility::kFlexible, Identity("x")});

  EXPECT_NE(unifier_.Unify(a, Fun(Int(), Bool())), nullptr);

  std::vector<std::string> expected = {"Int ≢ Bool"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, PolymorphicBounds) {
  auto a = prefix_.FreshWithBound({Flexibility::kFlexible, Identity("x")});
  auto b = prefix_.FreshWithBound({Flexibility::kFlexible, Identity("y")});

  ASSERT_EQ(unifier_.Unify(a, b), nullptr);
  EXPECT_EQ(Bounds(), "(t1 ≥ ∀x.x → x, t2 = t1)");
}


TEST_F(UnifierTest, RowsIgnoreOrder) {
  EXPECT_EQ(unifier_.Unify(Row({{"a", Int()}, {"b", Bool()}}), Row({{"b", Bool()}, {"a", Int()}})), nullptr);
  EXPECT_EQ(unifier_.Unify(Row({{"a", Int()}}, Row({{"b", Bool()}})), Row({{"b", Bool()}, {"a", Num()}})), nullptr);
  EXPECT_FALSE(reporter_.has_diagnostics());
}


TEST_F(UnifierTest, RowsMissingLabel) {
  EXPECT_NE(unifier_.Unify(Row({{"a", Int()}}), Row({{"a", Int()}, {"b", Bool()}})), nullptr);
  EXPECT_NE(unifier_.Unify(Row({{"a", Int()}, {"b", Bool()}}), Row({{"a", Int()}})), nullptr);

  std::vector<std::string> expected = {
      "(| a: Int |) ≢ (| a: Int, b: Bool |)",
      "(| a: Int, b: Bool |) ≢ (| a: Int |)",
  };
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, RowsFieldTypes) {
  EXPECT_NE(unifier_.Unify(Row({{"a", Num()}}), Row({{"a", Int()}})), nullptr);

  std::vector<std::string> expected = {"Num ≢ Int"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, RowsShadowing) {
  EXPECT_EQ(unifier_.Unify(Row({{"a", Int()}, {"a", Bool()}}), Row({{"a", Int()}})), nullptr);
  EXPECT_NE(unifier_.Unify(Row({{"a", Bool()}, {"a", Int()}}), Row({{"a", Int()}})), nullptr);

  std::vector<std::string> expected = {"Bool ≢ Int"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, OpenRowTakesMissingLabels) {
  auto r = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(Row({{"a", Int()}, {"b", Bool()}}), Row({{"a", Int()}}, r)), nullptr);
  EXPECT_EQ(Bounds(), "(t1 = (| b: Bool |))");
}


TEST_F(UnifierTest, OpenRowsShareTail) {
  auto r1 = prefix_.Fresh();
  auto r2 = prefix_.Fresh();

  ASSERT_EQ(unifier_.Unify(Row({{"a", Int()}}, r1), Row({{"b", Bool()}}, r2)), nullptr);
  EXPECT_EQ(Bounds(), "(t3, t1 = (| b: Bool | t3 |), t2 = (| a: Int | t3 |))");
}


TEST_F(UnifierTest, OpenRowsWithSameTail) {
  auto r = prefix_.Fresh();

  EXPECT_NE(unifier_.Unify(Row({{"a", Int()}}, r), Row({{"b", Bool()}}, r)), nullptr);

  std::vector<std::string> expected = {"(| a: Int | t1 |) ≢ (| b: Bool | t1 |)"};
  EXPECT_EQ(Messages(), expected);
}


TEST_F(UnifierTest, RowKinds) {
  auto r = prefix_.FreshWithBound({Flexibility::kRigid, arena_.NewMonomorphic(Int())});

  auto diagnostic = unifier_.Unify(Row({{"a", Int()}}, r), Row({{"a", Int()}}));
  ASSERT_NE(diagnostic, nullptr);
  EXPECT_EQ(diagnostic->kind(), Diagnostic::Kind::kIncompatibleKinds);
  EXPECT_EQ(PrintDiagnostic(diagnostic), "Incompatible kinds Value and Row.");

  EXPECT_NE(unifier_.Unify(Row({{"a", Int()}}), Int()), nullptr);
  EXPECT_EQ(PrintDiagnostic(reporter_.diagnostics().back().get()), "(| a: Int |) ≢ Int");
}


TEST_F(UnifierTest, UnifyPolytypes) {
  Polytype* out = nullptr;

  ASSERT_EQ(unifier_.UnifyPolytypes(arena_.NewBottom(), Identity("x"), &out), nullptr);
  EXPECT_EQ(printer_(out), "∀x.x → x");

  ASSERT_EQ(unifier_.UnifyPolytypes(Identity("x"), arena_.NewMonomorphic(Fun(Bool(), Bool())), &out), nullptr);
  EXPECT_EQ(printer_(out), "∀(t1 = Bool).t1 → t1");
  EXPECT_EQ(Bounds(), "(∅)");
}


}  // namespace brite
