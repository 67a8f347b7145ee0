#include "brite/checker/substitution.h"

#include <gtest/gtest.h>

namespace brite {

static_assert(!std::copyable<Substitution>);
static_assert(!std::movable<Substitution>);


static Bound Flexible(Polytype* type) { return {Flexibility::kFlexible, type}; }
static Bound Rigid(Polytype* type) { return {Flexibility::kRigid, type}; }


TEST(SubstitutionTest, ApplyMonotype) {
  TypeArena arena;
  TypePrinter printer;

  auto a = arena.NewVariable("a");
  auto b = arena.NewVariable("b");
  auto int_type = arena.NewPrimitive(Monotype::Kind::kInteger);

  Substitution subst;
  subst.Insert("a", int_type);

  EXPECT_EQ(printer(subst.Apply(arena.NewFunction(a, b), &arena)), "Int → b");

  // untouched types are shared
  auto func = arena.NewFunction(b, b);
  EXPECT_EQ(subst.Apply(func, &arena), func);
}


TEST(SubstitutionTest, ApplyRow) {
  TypeArena arena;
  TypePrinter printer;

  Vector<RowEntry> entries;
  entries.push_back({"x", arena.NewVariable("a")});
  auto row = arena.NewRowExtension(std::move(entries), arena.NewVariable("r"));

  Substitution subst;
  subst.Insert("r", arena.NewEmptyRow());
  subst.Insert("a", arena.NewPrimitive(Monotype::Kind::kBoolean));

  EXPECT_EQ(printer(subst.Apply(row, &arena)), "(| x: Bool |)");
}


TEST(SubstitutionTest, ParentFallback) {
  TypeArena arena;
  TypePrinter printer;

  Substitution parent;
  parent.Insert("a", arena.NewPrimitive(Monotype::Kind::kInteger));
  parent.Insert("b", arena.NewPrimitive(Monotype::Kind::kInteger));

  Substitution child(&parent);
  child.Insert("a", arena.NewPrimitive(Monotype::Kind::kBoolean));
  child.Hide("b");

  auto type = arena.NewFunction(arena.NewVariable("a"), arena.NewVariable("b"));
  EXPECT_EQ(printer(child.Apply(type, &arena)), "Bool → b");
  EXPECT_EQ(printer(parent.Apply(type, &arena)), "Int → Int");
}


TEST(SubstitutionTest, BinderShadows) {
  TypeArena arena;

  auto a = arena.NewVariable("a");
  auto b = arena.NewVariable("b");

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Flexible(arena.NewBottom())});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(a, b));

  Substitution subst;
  subst.Insert("a", arena.NewPrimitive(Monotype::Kind::kInteger));

  EXPECT_EQ(subst.Apply(type, &arena), type);
}


TEST(SubstitutionTest, BinderAvoidsCapture) {
  TypeArena arena;
  TypePrinter printer;

  auto a = arena.NewVariable("a");
  auto b = arena.NewVariable("b");

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Flexible(arena.NewBottom())});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(a, b));

  Substitution subst;
  subst.Insert("b", a);

  EXPECT_TRUE(subst.Captures("a"));
  EXPECT_FALSE(subst.Captures("b"));
  EXPECT_EQ(printer(subst.Apply(type, &arena)), "∀a2.a2 → a");
}


TEST(NormalizeTest, InlinesMonomorphicBounds) {
  TypeArena arena;
  TypePrinter printer;

  auto a = arena.NewVariable("a");

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Rigid(arena.NewMonomorphic(arena.NewPrimitive(Monotype::Kind::kInteger)))});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(a, a));

  auto normal = Normalize(type, &arena);
  EXPECT_EQ(normal->kind(), Polytype::Kind::kMonotype);
  EXPECT_EQ(printer(normal), "Int → Int");
}


TEST(NormalizeTest, DropsUnusedBounds) {
  TypeArena arena;
  TypePrinter printer;

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Flexible(arena.NewBottom())});
  bounds.push_back({"b", Flexible(arena.NewBottom())});
  bounds.push_back({"c", Flexible(arena.NewBottom())});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(arena.NewVariable("a"), arena.NewVariable("b")));

  EXPECT_EQ(printer(Normalize(type, &arena)), "∀(a, b).a → b");

  Vector<NamedBound> unused;
  unused.push_back({"a", Flexible(arena.NewBottom())});
  auto constant = arena.NewQuantified(std::move(unused), arena.NewPrimitive(Monotype::Kind::kBoolean));
  EXPECT_EQ(printer(Normalize(constant, &arena)), "Bool");
}


TEST(NormalizeTest, KeepsBoundsOfUsedBounds) {
  TypeArena arena;
  TypePrinter printer;

  auto a = arena.NewVariable("a");
  auto b = arena.NewVariable("b");

  Vector<NamedBound> inner;
  inner.push_back({"c", Flexible(arena.NewBottom())});
  auto poly = arena.NewQuantified(std::move(inner), arena.NewFunction(arena.NewVariable("c"), a));

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Flexible(arena.NewBottom())});
  bounds.push_back({"b", Flexible(poly)});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(b, b));

  EXPECT_EQ(printer(Normalize(type, &arena)), "∀(a, b ≥ ∀c.c → a).b → b");
}


TEST(NormalizeTest, CollapsesBodyVariable) {
  TypeArena arena;
  TypePrinter printer;

  Vector<NamedBound> bottom;
  bottom.push_back({"a", Flexible(arena.NewBottom())});
  bottom.push_back({"b", Flexible(arena.NewBottom())});
  auto type = arena.NewQuantified(std::move(bottom), arena.NewVariable("a"));
  EXPECT_EQ(Normalize(type, &arena)->kind(), Polytype::Kind::kBottom);

  Vector<NamedBound> inner;
  inner.push_back({"c", Flexible(arena.NewBottom())});
  auto identity = arena.NewQuantified(std::move(inner), arena.NewFunction(arena.NewVariable("c"), arena.NewVariable("c")));

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Flexible(identity)});
  auto wrapped = arena.NewQuantified(std::move(bounds), arena.NewVariable("a"));
  EXPECT_EQ(printer(Normalize(wrapped, &arena)), "∀c.c → c");
}


TEST(NormalizeTest, RenamesCapturedBinder) {
  TypeArena arena;
  TypePrinter printer;

  // in ∀(a = b, b).a → b the first b is free
  Vector<NamedBound> bounds;
  bounds.push_back({"a", Rigid(arena.NewMonomorphic(arena.NewVariable("b")))});
  bounds.push_back({"b", Flexible(arena.NewBottom())});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(arena.NewVariable("a"), arena.NewVariable("b")));

  EXPECT_EQ(printer(Normalize(type, &arena)), "∀b2.b → b2");
}


TEST(EquivalenceTest, Renaming) {
  TypeArena arena;

  auto quantify = [&](const char* name1, const char* name2, Monotype* body) {
    Vector<NamedBound> bounds;
    bounds.push_back({name1, Flexible(arena.NewBottom())});
    if (name2 != nullptr) {
      bounds.push_back({name2, Flexible(arena.NewBottom())});
    }
    return arena.NewQuantified(std::move(bounds), body);
  };

  auto a = arena.NewVariable("a");
  auto b = arena.NewVariable("b");

  EXPECT_TRUE(EqualUpToRenaming(quantify("a", nullptr, arena.NewFunction(a, a)),
                                quantify("b", nullptr, arena.NewFunction(b, b))));

  // binder order matters
  EXPECT_FALSE(EqualUpToRenaming(quantify("a", "b", arena.NewFunction(a, b)),
                                 quantify("b", "a", arena.NewFunction(a, b))));

  // a bound variable never matches a free one
  EXPECT_FALSE(EqualUpToRenaming(quantify("a", nullptr, arena.NewFunction(a, b)),
                                 quantify("b", nullptr, arena.NewFunction(b, b))));

  EXPECT_TRUE(EqualUpToRenaming(arena.NewMonomorphic(arena.NewFunction(a, b)),
                                arena.NewMonomorphic(arena.NewFunction(a, b))));
  EXPECT_FALSE(EqualUpToRenaming(arena.NewMonomorphic(a), arena.NewMonomorphic(b)));
}


TEST(EquivalenceTest, NormalForms) {
  TypeArena arena;

  auto a = arena.NewVariable("a");
  auto int_type = arena.NewPrimitive(Monotype::Kind::kInteger);

  Vector<NamedBound> bounds;
  bounds.push_back({"a", Rigid(arena.NewMonomorphic(int_type))});
  auto type = arena.NewQuantified(std::move(bounds), arena.NewFunction(a, a));

  EXPECT_TRUE(Equivalent(type, arena.NewMonomorphic(arena.NewFunction(int_type, int_type)), &arena));
  EXPECT_FALSE(Equivalent(type, arena.NewMonomorphic(arena.NewFunction(int_type, a)), &arena));
  EXPECT_TRUE(Equivalent(arena.NewBottom(), arena.NewBottom(), &arena));
}


}  // namespace brite
