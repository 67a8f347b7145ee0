#include "brite/checker/unifier.h"

#include "brite/checker/substitution.h"
#include "brite/util/set.h"

namespace brite {


Monotype* Unifier::Resolve(Monotype* type, Diagnostic** diagnostic) {
  while (type->kind() == Monotype::Kind::kVariable) {
    auto& name = type->As<TypeVariable>()->name();
    auto bound = prefix_->Find(name);
    if (bound == nullptr) {
      *diagnostic = reporter_->Report<UnboundTypeVariableDiagnostic>(name, type->position());
      return nullptr;
    }
    if (bound->type->kind() != Polytype::Kind::kMonotype) {
      break;
    }
    type = bound->type->As<MonomorphicPolytype>()->type();
  }
  return type;
}


Diagnostic* Unifier::Unify(Monotype* actual, Monotype* expected) {
  if (actual == expected) {
    return nullptr;
  }

  Diagnostic* diagnostic = nullptr;
  auto a = Resolve(actual, &diagnostic);
  if (a == nullptr) {
    return diagnostic;
  }
  auto e = Resolve(expected, &diagnostic);
  if (e == nullptr) {
    return diagnostic;
  }

  // the failure behind an error type was reported already
  if (a == e || a->kind() == Monotype::Kind::kError || e->kind() == Monotype::Kind::kError) {
    return nullptr;
  }

  if (a->kind() == Monotype::Kind::kVariable && e->kind() == Monotype::Kind::kVariable) {
    return UnifyVariables(a->As<TypeVariable>(), e->As<TypeVariable>());
  }
  if (a->kind() == Monotype::Kind::kVariable) {
    return UnifyVariable(a->As<TypeVariable>(), e, true);
  }
  if (e->kind() == Monotype::Kind::kVariable) {
    return UnifyVariable(e->As<TypeVariable>(), a, false);
  }

  if (a->kind() == Monotype::Kind::kNever) {
    return nullptr;
  }

  if (a->is_primitive() && e->is_primitive()) {
    if (IsPrimitiveSubtype(a->kind(), e->kind())) {
      return nullptr;
    }
    return ReportIncompatible(a, e);
  }

  if (a->kind() == Monotype::Kind::kFunction && e->kind() == Monotype::Kind::kFunction) {
    auto func_a = a->As<FunctionType>();
    auto func_e = e->As<FunctionType>();

    // parameters are contravariant
    auto parameter_diagnostic = Unify(func_e->parameter(), func_a->parameter());
    auto body_diagnostic = Unify(func_a->body(), func_e->body());
    return parameter_diagnostic != nullptr ? parameter_diagnostic : body_diagnostic;
  }

  if (a->kind() == Monotype::Kind::kEmptyRow && e->kind() == Monotype::Kind::kEmptyRow) {
    return nullptr;
  }

  if (a->is_row() && e->is_row()) {
    return UnifyRows(a, e);
  }

  return ReportIncompatible(a, e);
}


Diagnostic* Unifier::UnifyVariables(TypeVariable* actual, TypeVariable* expected) {
  if (actual->name() == expected->name()) {
    return nullptr;
  }

  auto bound_a = prefix_->Lookup(actual->name());
  auto bound_e = prefix_->Lookup(expected->name());

  // two distinct rigid type parameters never meet
  if (bound_a.is_rigid() && bound_e.is_rigid() &&
      (bound_a.type->kind() == Polytype::Kind::kBottom || bound_e.type->kind() == Polytype::Kind::kBottom)) {
    return reporter_->Report<IncompatibleTypesDiagnostic>(DescribeBound(actual->name(), bound_a),
                                                           DescribeBound(expected->name(), bound_e));
  }

  Polytype* merged = nullptr;
  if (auto diagnostic = UnifyPolytypes(bound_a.type, bound_e.type, &merged)) {
    return diagnostic;
  }
  merged = Normalize(merged, arena_);

  // prefer a bound that is already in the prefix
  if (Equivalent(merged, bound_a.type, arena_)) {
    merged = bound_a.type;
  } else if (Equivalent(merged, bound_e.type, arena_)) {
    merged = bound_e.type;
  }

  if (bound_a.is_rigid() && !Equivalent(bound_a.type, merged, arena_)) {
    return reporter_->Report<IncompatibleTypesDiagnostic>(DescribeBound(actual->name(), bound_a), merged);
  }
  if (bound_e.is_rigid() && !Equivalent(merged, bound_e.type, arena_)) {
    return reporter_->Report<IncompatibleTypesDiagnostic>(merged, DescribeBound(expected->name(), bound_e));
  }

  auto flexibility =
      (bound_a.is_flexible() && bound_e.is_flexible()) ? Flexibility::kFlexible : Flexibility::kRigid;

  // the rigid side keeps its name, the other one becomes an alias of it
  if (bound_a.is_flexible() && bound_e.is_rigid()) {
    return prefix_->Update2(expected->name(), actual->name(), {flexibility, merged});
  }
  return prefix_->Update2(actual->name(), expected->name(), {flexibility, merged});
}


Diagnostic* Unifier::UnifyVariable(TypeVariable* variable, Monotype* type, bool variable_is_actual) {
  auto bound = prefix_->Lookup(variable->name());
  auto mono = arena_->NewMonomorphic(type);

  Polytype* merged = nullptr;
  auto diagnostic = variable_is_actual ? UnifyPolytypes(bound.type, mono, &merged)
                                       : UnifyPolytypes(mono, bound.type, &merged);
  if (diagnostic != nullptr) {
    return diagnostic;
  }

  if (bound.is_rigid() && !Equivalent(bound.type, mono, arena_)) {
    auto described = DescribeBound(variable->name(), bound);
    if (variable_is_actual) {
      return reporter_->Report<IncompatibleTypesDiagnostic>(described, mono);
    } else {
      return reporter_->Report<IncompatibleTypesDiagnostic>(mono, described);
    }
  }

  return prefix_->Update(variable->name(), {Flexibility::kRigid, mono});
}


Diagnostic* Unifier::UnifyPolytypes(Polytype* actual, Polytype* expected, Polytype** out) {
  if (actual->kind() == Polytype::Kind::kBottom) {
    *out = expected;
    return nullptr;
  }
  if (expected->kind() == Polytype::Kind::kBottom) {
    *out = actual;
    return nullptr;
  }

  if (actual->kind() == Polytype::Kind::kMonotype && expected->kind() == Polytype::Kind::kMonotype) {
    *out = actual;
    return Unify(actual->As<MonomorphicPolytype>()->type(), expected->As<MonomorphicPolytype>()->type());
  }

  return prefix_->Level([&]() {
    auto instance_a = prefix_->Instantiate(actual);
    auto instance_e = prefix_->Instantiate(expected);
    auto diagnostic = Unify(instance_a, instance_e);
    *out = prefix_->Generalize(instance_a);
    return diagnostic;
  });
}


bool Unifier::FlattenRow(Monotype* row, Vector<RowEntry>* entries, Monotype** tail, Diagnostic** diagnostic) {
  Set<std::string> labels;
  auto current = row;

  for (;;) {
    current = Resolve(current, diagnostic);
    if (current == nullptr) {
      return false;
    }

    switch (current->kind()) {
      case Monotype::Kind::kRowExtension: {
        auto extension = current->As<RowExtensionType>();
        for (auto& entry : extension->entries()) {
          // the left-most entry shadows the ones after it
          if (labels.emplace(entry.label).second) {
            entries->push_back(entry);
          }
        }
        current = extension->extension() != nullptr ? extension->extension() : arena_->NewEmptyRow();
        break;
      }

      case Monotype::Kind::kEmptyRow:
      case Monotype::Kind::kVariable:
      case Monotype::Kind::kError:
        *tail = current;
        return true;

      default:
        *diagnostic = reporter_->Report<IncompatibleKindsDiagnostic>(TypeKind::kValue, TypeKind::kRow);
        return false;
    }
  }
}


static const RowEntry* FindLabel(const Vector<RowEntry>& entries, const std::string& label) {
  for (auto& entry : entries) {
    if (entry.label == label) {
      return &entry;
    }
  }
  return nullptr;
}


Diagnostic* Unifier::UnifyRows(Monotype* actual, Monotype* expected) {
  Diagnostic* diagnostic = nullptr;
  Vector<RowEntry> entries_a;
  Vector<RowEntry> entries_e;
  Monotype* tail_a = nullptr;
  Monotype* tail_e = nullptr;

  if (!FlattenRow(actual, &entries_a, &tail_a, &diagnostic)) {
    return diagnostic;
  }
  if (!FlattenRow(expected, &entries_e, &tail_e, &diagnostic)) {
    return diagnostic;
  }

  auto record = [&](Diagnostic* d) {
    if (diagnostic == nullptr) {
      diagnostic = d;
    }
  };

  Vector<RowEntry> only_a;
  Vector<RowEntry> only_e;

  for (auto& entry : entries_a) {
    if (auto other = FindLabel(entries_e, entry.label)) {
      record(Unify(entry.type, other->type));
    } else {
      only_a.push_back(entry);
    }
  }
  for (auto& entry : entries_e) {
    if (FindLabel(entries_a, entry.label) == nullptr) {
      only_e.push_back(entry);
    }
  }

  auto is_closed = [](Monotype* tail) { return tail->kind() == Monotype::Kind::kEmptyRow; };

  if (only_a.empty() && only_e.empty()) {
    record(Unify(tail_a, tail_e));
  } else if (only_a.empty()) {
    if (is_closed(tail_a)) {
      record(ReportIncompatible(actual, expected));
    } else {
      record(Unify(tail_a, arena_->NewRowExtension(std::move(only_e), tail_e)));
    }
  } else if (only_e.empty()) {
    if (is_closed(tail_e)) {
      record(ReportIncompatible(actual, expected));
    } else {
      record(Unify(arena_->NewRowExtension(std::move(only_a), tail_a), tail_e));
    }
  } else {
    bool same_tail = tail_a->kind() == Monotype::Kind::kVariable && tail_e->kind() == Monotype::Kind::kVariable &&
                     tail_a->As<TypeVariable>()->name() == tail_e->As<TypeVariable>()->name();

    if (is_closed(tail_a) || is_closed(tail_e) || same_tail) {
      record(ReportIncompatible(actual, expected));
    } else {
      auto rest = prefix_->Fresh();
      record(Unify(tail_a, arena_->NewRowExtension(std::move(only_e), rest)));
      record(Unify(arena_->NewRowExtension(std::move(only_a), rest), tail_e));
    }
  }

  return diagnostic;
}


Diagnostic* Unifier::ReportIncompatible(Monotype* actual, Monotype* expected) {
  return reporter_->Report<IncompatibleTypesDiagnostic>(arena_->NewMonomorphic(actual),
                                                         arena_->NewMonomorphic(expected));
}


Polytype* Unifier::DescribeBound(const std::string& name, const Bound& bound) {
  if (bound.type->kind() == Polytype::Kind::kBottom) {
    return arena_->NewMonomorphic(arena_->NewVariable(name));
  }
  return bound.type;
}


}  // namespace brite
