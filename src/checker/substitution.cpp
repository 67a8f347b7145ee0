#include "brite/checker/substitution.h"

namespace brite {


static void CollectNames(const Polytype* type, Set<std::string>* out) {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      CollectFreeVariables(type->As<MonomorphicPolytype>()->type(), out);
      return;

    case Polytype::Kind::kBottom:
      return;

    case Polytype::Kind::kQuantify: {
      auto quantified = type->As<QuantifiedPolytype>();
      for (auto& entry : quantified->bounds()) {
        out->emplace(entry.name);
        CollectNames(entry.bound.type, out);
      }
      CollectFreeVariables(quantified->body(), out);
      return;
    }
  }

  brite_unreachable();
}


static std::string UniqueBinderName(const std::string& base, const Substitution* subst, const Polytype* scope) {
  Set<std::string> used;
  CollectNames(scope, &used);

  for (int i = 2;; ++i) {
    auto candidate = base + std::to_string(i);
    if (!used.contains(candidate) && !subst->Captures(candidate)) {
      return candidate;
    }
  }
}


bool Substitution::Find(const std::string& name, Monotype** out) const {
  for (auto s = this; s != nullptr; s = s->parent_) {
    auto it = s->entries_.find(name);
    if (it != s->entries_.end()) {
      *out = it->second;
      return true;
    }
  }
  return false;
}


bool Substitution::Captures(const std::string& name) const {
  Set<std::string> seen;

  for (auto s = this; s != nullptr; s = s->parent_) {
    for (auto& [key, type] : s->entries_) {
      if (!seen.emplace(key).second || type == nullptr) {
        continue;
      }
      Set<std::string> names;
      CollectFreeVariables(type, &names);
      if (names.contains(name)) {
        return true;
      }
    }
  }
  return false;
}


Monotype* Substitution::Apply(Monotype* type, TypeArena* arena) const {
  switch (type->kind()) {
    case Monotype::Kind::kVariable: {
      Monotype* replacement = nullptr;
      if (Find(type->As<TypeVariable>()->name(), &replacement) && replacement != nullptr) {
        return replacement;
      }
      return type;
    }

    case Monotype::Kind::kFunction: {
      auto func = type->As<FunctionType>();
      auto sbsted_parameter = Apply(func->parameter(), arena);
      auto sbsted_body = Apply(func->body(), arena);

      if (sbsted_parameter == func->parameter() && sbsted_body == func->body()) {
        return func;
      } else {
        return arena->NewFunction(sbsted_parameter, sbsted_body, func->position());
      }
    }

    case Monotype::Kind::kRowExtension: {
      auto row = type->As<RowExtensionType>();
      Vector<RowEntry> entries;
      bool changed = false;
      for (auto& entry : row->entries()) {
        auto sbsted_type = Apply(entry.type, arena);
        entries.push_back({entry.label, sbsted_type});
        changed |= (sbsted_type != entry.type);
      }

      auto sbsted_extension = row->extension();
      if (sbsted_extension != nullptr) {
        sbsted_extension = Apply(sbsted_extension, arena);
        changed |= (sbsted_extension != row->extension());
      }

      if (changed) {
        return arena->NewRowExtension(std::move(entries), sbsted_extension, row->position());
      } else {
        return row;
      }
    }

    default:
      return type;
  }
}


Polytype* Substitution::Apply(Polytype* type, TypeArena* arena) const {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype: {
      auto mono = type->As<MonomorphicPolytype>();
      auto sbsted_type = Apply(mono->type(), arena);
      if (sbsted_type == mono->type()) {
        return mono;
      } else {
        return arena->NewMonomorphic(sbsted_type);
      }
    }

    case Polytype::Kind::kBottom:
      return type;

    case Polytype::Kind::kQuantify: {
      auto quantified = type->As<QuantifiedPolytype>();
      Substitution inner(this);
      Vector<NamedBound> bounds;
      bool changed = false;

      for (auto& entry : quantified->bounds()) {
        auto sbsted_bound = inner.Apply(entry.bound.type, arena);
        changed |= (sbsted_bound != entry.bound.type);

        auto name = entry.name;
        if (inner.Captures(name)) {
          name = UniqueBinderName(entry.name, &inner, quantified);
          inner.Insert(entry.name, arena->NewVariable(name));
          changed = true;
        } else {
          inner.Hide(entry.name);
        }
        bounds.push_back({name, {entry.bound.flexibility, sbsted_bound}});
      }

      auto sbsted_body = inner.Apply(quantified->body(), arena);
      changed |= (sbsted_body != quantified->body());

      if (changed) {
        return arena->NewQuantified(std::move(bounds), sbsted_body, quantified->position());
      } else {
        return quantified;
      }
    }
  }

  brite_unreachable();
}


Polytype* Normalize(Polytype* type, TypeArena* arena) {
  if (type->kind() != Polytype::Kind::kQuantify) {
    return type;
  }

  auto quantified = type->As<QuantifiedPolytype>();
  Substitution subst;
  Vector<NamedBound> kept;

  for (auto& entry : quantified->bounds()) {
    auto bound_type = Normalize(subst.Apply(entry.bound.type, arena), arena);

    // a monomorphic bound is inlined into everything after it
    if (bound_type->kind() == Polytype::Kind::kMonotype) {
      subst.Insert(entry.name, bound_type->As<MonomorphicPolytype>()->type());
      continue;
    }

    auto name = entry.name;
    if (subst.Captures(name)) {
      name = UniqueBinderName(entry.name, &subst, quantified);
      subst.Insert(entry.name, arena->NewVariable(name));
    } else {
      subst.Hide(entry.name);
    }
    kept.push_back({name, {entry.bound.flexibility, bound_type}});
  }

  auto body = subst.Apply(quantified->body(), arena);

  // walk backwards so a used bound keeps the bounds it refers to alive
  Set<std::string> used;
  CollectFreeVariables(body, &used);
  Vector<NamedBound> reversed;
  for (auto i = kept.size(); i > 0; --i) {
    auto& entry = kept[i - 1];
    if (used.contains(entry.name)) {
      used.erase(entry.name);
      CollectFreeVariables(entry.bound.type, &used);
      reversed.push_back({entry.name, entry.bound});
    }
  }

  if (reversed.empty()) {
    return arena->NewMonomorphic(body);
  }

  Vector<NamedBound> bounds;
  for (auto i = reversed.size(); i > 0; --i) {
    bounds.push_back(reversed[i - 1]);
  }

  if (body->kind() == Monotype::Kind::kVariable && body->As<TypeVariable>()->name() == bounds.back().name) {
    auto last = bounds.back().bound.type;
    bounds.pop_back();

    if (last->kind() == Polytype::Kind::kBottom) {
      return last;
    }

    brite_contract(last->kind() == Polytype::Kind::kQuantify);
    auto inner = last->As<QuantifiedPolytype>();
    for (auto& entry : inner->bounds()) {
      bounds.push_back(entry);
    }
    return Normalize(arena->NewQuantified(std::move(bounds), inner->body(), quantified->position()), arena);
  }

  return arena->NewQuantified(std::move(bounds), body, quantified->position());
}


namespace {

class Renaming {
 public:
  Renaming() = default;

  Renaming(const Renaming& other) :
      forward_(other.forward_.clone()),
      backward_(other.backward_.clone()) {}

  void Bind(const std::string& name1, const std::string& name2) {
    auto it1 = forward_.find(name1);
    if (it1 != forward_.end()) {
      backward_.erase(it1->second);
    }
    auto it2 = backward_.find(name2);
    if (it2 != backward_.end()) {
      forward_.erase(it2->second);
    }
    forward_.insert_or_assign(name1, name2);
    backward_.insert_or_assign(name2, name1);
  }

  bool Matches(const std::string& name1, const std::string& name2) const {
    auto it = forward_.find(name1);
    if (it != forward_.end()) {
      return it->second == name2;
    }
    return !backward_.contains(name2) && name1 == name2;
  }

 private:
  Map<std::string, std::string> forward_;
  Map<std::string, std::string> backward_;
};

}  // namespace


static bool Equal(const Monotype* type1, const Monotype* type2, const Renaming& renaming) {
  if (type1->kind() != type2->kind()) {
    return false;
  }

  switch (type1->kind()) {
    case Monotype::Kind::kVariable:
      return renaming.Matches(type1->As<TypeVariable>()->name(), type2->As<TypeVariable>()->name());

    case Monotype::Kind::kFunction: {
      auto func1 = type1->As<FunctionType>();
      auto func2 = type2->As<FunctionType>();
      return Equal(func1->parameter(), func2->parameter(), renaming) && Equal(func1->body(), func2->body(), renaming);
    }

    case Monotype::Kind::kRowExtension: {
      auto row1 = type1->As<RowExtensionType>();
      auto row2 = type2->As<RowExtensionType>();
      if (row1->entries().size() != row2->entries().size()) {
        return false;
      }
      for (size_t i = 0; i < row1->entries().size(); ++i) {
        auto& entry1 = row1->entries()[i];
        auto& entry2 = row2->entries()[i];
        if (entry1.label != entry2.label || !Equal(entry1.type, entry2.type, renaming)) {
          return false;
        }
      }
      if (row1->extension() == nullptr || row2->extension() == nullptr) {
        return row1->extension() == row2->extension();
      }
      return Equal(row1->extension(), row2->extension(), renaming);
    }

    default:
      // same nullary constructor
      return true;
  }
}


static bool Equal(const Polytype* type1, const Polytype* type2, const Renaming& renaming) {
  if (type1->kind() != type2->kind()) {
    return false;
  }

  switch (type1->kind()) {
    case Polytype::Kind::kMonotype:
      return Equal(type1->As<MonomorphicPolytype>()->type(), type2->As<MonomorphicPolytype>()->type(), renaming);

    case Polytype::Kind::kBottom:
      return true;

    case Polytype::Kind::kQuantify: {
      auto quantified1 = type1->As<QuantifiedPolytype>();
      auto quantified2 = type2->As<QuantifiedPolytype>();
      if (quantified1->bounds().size() != quantified2->bounds().size()) {
        return false;
      }

      Renaming inner(renaming);
      for (size_t i = 0; i < quantified1->bounds().size(); ++i) {
        auto& entry1 = quantified1->bounds()[i];
        auto& entry2 = quantified2->bounds()[i];
        if (entry1.bound.flexibility != entry2.bound.flexibility ||
            !Equal(entry1.bound.type, entry2.bound.type, inner)) {
          return false;
        }
        inner.Bind(entry1.name, entry2.name);
      }
      return Equal(quantified1->body(), quantified2->body(), inner);
    }
  }

  brite_unreachable();
}


bool EqualUpToRenaming(const Polytype* type1, const Polytype* type2) {
  Renaming renaming;
  return Equal(type1, type2, renaming);
}


bool Equivalent(Polytype* type1, Polytype* type2, TypeArena* arena) {
  if (type1 == type2) {
    return true;
  }
  return EqualUpToRenaming(Normalize(type1, arena), Normalize(type2, arena));
}


}  // namespace brite
