#include "brite/checker/type.h"

namespace brite {


ErrorType* TypeArena::NewError(Diagnostic* diagnostic, const SourceRange& position) {
  auto type = new ErrorType(diagnostic, position);
  adopt_type(MonotypePtr(type));
  return type;
}


TypeVariable* TypeArena::NewVariable(const std::string& name, const SourceRange& position) {
  auto type = new TypeVariable(name, position);
  adopt_type(MonotypePtr(type));
  return type;
}


PrimitiveType* TypeArena::NewPrimitive(Monotype::Kind kind, const SourceRange& position) {
  auto type = new PrimitiveType(kind, position);
  adopt_type(MonotypePtr(type));
  return type;
}


FunctionType* TypeArena::NewFunction(Monotype* parameter, Monotype* body, const SourceRange& position) {
  auto type = new FunctionType(parameter, body, position);
  adopt_type(MonotypePtr(type));
  return type;
}


EmptyRowType* TypeArena::NewEmptyRow(const SourceRange& position) {
  auto type = new EmptyRowType(position);
  adopt_type(MonotypePtr(type));
  return type;
}


RowExtensionType* TypeArena::NewRowExtension(Vector<RowEntry>&& entries, Monotype* extension,
                                             const SourceRange& position) {
  auto type = new RowExtensionType(std::move(entries), extension, position);
  adopt_type(MonotypePtr(type));
  return type;
}


MonomorphicPolytype* TypeArena::NewMonomorphic(Monotype* type) {
  auto poly = new MonomorphicPolytype(type);
  adopt_type(PolytypePtr(poly));
  return poly;
}


BottomPolytype* TypeArena::NewBottom(const SourceRange& position) {
  auto poly = new BottomPolytype(position);
  adopt_type(PolytypePtr(poly));
  return poly;
}


QuantifiedPolytype* TypeArena::NewQuantified(Vector<NamedBound>&& bounds, Monotype* body,
                                             const SourceRange& position) {
  auto poly = new QuantifiedPolytype(std::move(bounds), body, position);
  adopt_type(PolytypePtr(poly));
  return poly;
}


const char* PrimitiveName(Monotype::Kind kind) {
  switch (kind) {
    case Monotype::Kind::kNever:
      return "Never";
    case Monotype::Kind::kVoid:
      return "Void";
    case Monotype::Kind::kBoolean:
      return "Bool";
    case Monotype::Kind::kNumber:
      return "Num";
    case Monotype::Kind::kInteger:
      return "Int";
    case Monotype::Kind::kFloat:
      return "Float";
    default:
      break;
  }

  brite_unreachable();
}


bool IsPrimitiveSubtype(Monotype::Kind actual, Monotype::Kind expected) {
  if (actual == expected || actual == Monotype::Kind::kNever) {
    return true;
  }

  // Int and Float are numbers
  if (expected == Monotype::Kind::kNumber) {
    return actual == Monotype::Kind::kInteger || actual == Monotype::Kind::kFloat;
  }

  return false;
}


void CollectFreeVariables(const Monotype* type, Set<std::string>* out) {
  switch (type->kind()) {
    case Monotype::Kind::kVariable:
      out->emplace(type->As<TypeVariable>()->name());
      return;

    case Monotype::Kind::kFunction: {
      auto func = type->As<FunctionType>();
      CollectFreeVariables(func->parameter(), out);
      CollectFreeVariables(func->body(), out);
      return;
    }

    case Monotype::Kind::kRowExtension: {
      auto row = type->As<RowExtensionType>();
      for (auto& entry : row->entries()) {
        CollectFreeVariables(entry.type, out);
      }
      if (row->extension() != nullptr) {
        CollectFreeVariables(row->extension(), out);
      }
      return;
    }

    default:
      return;
  }
}


void CollectFreeVariables(const Polytype* type, Set<std::string>* out) {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      CollectFreeVariables(type->As<MonomorphicPolytype>()->type(), out);
      return;

    case Polytype::Kind::kBottom:
      return;

    case Polytype::Kind::kQuantify: {
      auto quantified = type->As<QuantifiedPolytype>();
      Set<std::string> binders;

      auto collect_unbound = [&](const Set<std::string>& names) {
        for (auto& name : names) {
          if (!binders.contains(name)) {
            out->emplace(name);
          }
        }
      };

      for (auto& entry : quantified->bounds()) {
        Set<std::string> names;
        CollectFreeVariables(entry.bound.type, &names);
        collect_unbound(names);
        binders.emplace(entry.name);
      }

      Set<std::string> names;
      CollectFreeVariables(quantified->body(), &names);
      collect_unbound(names);
      return;
    }
  }

  brite_unreachable();
}


std::string TypePrinter::operator()(const Vector<NamedBound>& bounds) const {
  if (bounds.empty()) {
    return "(∅)";
  }

  std::string str = "";
  for (auto& bound : bounds) {
    if (!str.empty()) {
      str += ", ";
    }
    str += Print(bound);
  }
  return "(" + str + ")";
}


std::string TypePrinter::Print(const Monotype* type, bool paren) const {
  switch (type->kind()) {
    case Monotype::Kind::kError:
      return "%error";

    case Monotype::Kind::kVariable:
      return type->As<TypeVariable>()->name();

    case Monotype::Kind::kNever:
    case Monotype::Kind::kVoid:
    case Monotype::Kind::kBoolean:
    case Monotype::Kind::kNumber:
    case Monotype::Kind::kInteger:
    case Monotype::Kind::kFloat:
      return PrimitiveName(type->kind());

    case Monotype::Kind::kFunction:
      return Print(type->As<FunctionType>(), paren);

    case Monotype::Kind::kEmptyRow:
      return "(||)";

    case Monotype::Kind::kRowExtension:
      return Print(type->As<RowExtensionType>());
  }

  brite_unreachable();
}


std::string TypePrinter::Print(const FunctionType* type, bool paren) const {
  // only a function in parameter position needs parentheses
  std::string str = Print(type->parameter(), true) + " → " + Print(type->body(), false);

  if (paren) {
    return "(" + str + ")";
  } else {
    return str;
  }
}


std::string TypePrinter::Print(const RowExtensionType* type) const {
  std::string str = "";

  for (auto& entry : type->entries()) {
    if (!str.empty()) {
      str += ", ";
    }
    str += entry.label + ": " + Print(entry.type, false);
  }

  auto extension = type->extension();
  if (extension != nullptr && extension->kind() != Monotype::Kind::kEmptyRow) {
    str += " | " + Print(extension, false);
  }

  return "(| " + str + " |)";
}


std::string TypePrinter::Print(const Polytype* type) const {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      return Print(type->As<MonomorphicPolytype>()->type(), false);

    case Polytype::Kind::kBottom:
      return "⊥";

    case Polytype::Kind::kQuantify:
      return Print(type->As<QuantifiedPolytype>());
  }

  brite_unreachable();
}


std::string TypePrinter::Print(const QuantifiedPolytype* type) const {
  auto& bounds = type->bounds();
  auto body = Print(type->body(), false);

  if (bounds.size() == 1 && bounds[0].bound.is_flexible() &&
      bounds[0].bound.type->kind() == Polytype::Kind::kBottom) {
    return "∀" + bounds[0].name + "." + body;
  }

  std::string str = "";
  for (auto& bound : bounds) {
    if (!str.empty()) {
      str += ", ";
    }
    str += Print(bound);
  }
  return "∀(" + str + ")." + body;
}


std::string TypePrinter::Print(const NamedBound& bound) const {
  auto type = bound.bound.type;
  if (bound.bound.is_flexible() && type->kind() == Polytype::Kind::kBottom) {
    return bound.name;
  }

  auto relation = bound.bound.is_flexible() ? " ≥ " : " = ";
  return bound.name + relation + Print(type);
}


std::string SourceTypePrinter::Print(const Monotype* type) const {
  switch (type->kind()) {
    case Monotype::Kind::kError:
      return "%error";

    case Monotype::Kind::kVariable:
      return type->As<TypeVariable>()->name();

    case Monotype::Kind::kNever:
    case Monotype::Kind::kVoid:
    case Monotype::Kind::kBoolean:
    case Monotype::Kind::kNumber:
    case Monotype::Kind::kInteger:
    case Monotype::Kind::kFloat:
      return PrimitiveName(type->kind());

    case Monotype::Kind::kFunction:
      return Print(type->As<FunctionType>(), "");

    case Monotype::Kind::kEmptyRow:
      return "{}";

    case Monotype::Kind::kRowExtension:
      return Print(type->As<RowExtensionType>());
  }

  brite_unreachable();
}


std::string SourceTypePrinter::Print(const FunctionType* type, const std::string& quantifiers) const {
  // curried parameters are written as one parameter list
  std::string params = "";
  const Monotype* body = type;
  while (body->kind() == Monotype::Kind::kFunction) {
    auto func = body->As<FunctionType>();
    if (!params.empty()) {
      params += ", ";
    }
    params += Print(func->parameter());
    body = func->body();
  }

  return "fun" + quantifiers + "(" + params + ") -> " + Print(body);
}


std::string SourceTypePrinter::Print(const RowExtensionType* type) const {
  std::string str = "";
  const Monotype* current = type;

  while (current != nullptr && current->kind() == Monotype::Kind::kRowExtension) {
    auto extension = current->As<RowExtensionType>();
    for (auto& entry : extension->entries()) {
      if (!str.empty()) {
        str += ", ";
      }
      str += entry.label + ": " + Print(entry.type);
    }
    current = extension->extension();
  }

  if (current != nullptr && current->kind() != Monotype::Kind::kEmptyRow) {
    str += " | " + Print(current);
  }

  return "{" + str + "}";
}


std::string SourceTypePrinter::Print(const Polytype* type) const {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      return Print(type->As<MonomorphicPolytype>()->type());

    case Polytype::Kind::kBottom:
      return "!";

    case Polytype::Kind::kQuantify: {
      auto quantified = type->As<QuantifiedPolytype>();

      std::string str = "";
      for (auto& bound : quantified->bounds()) {
        if (!str.empty()) {
          str += ", ";
        }
        str += Print(bound);
      }

      // quantifiers over a function are written inside it
      auto body = quantified->body();
      if (body->kind() == Monotype::Kind::kFunction) {
        return Print(body->As<FunctionType>(), "<" + str + ">");
      }
      return "<" + str + "> " + Print(body);
    }
  }

  brite_unreachable();
}


std::string SourceTypePrinter::Print(const NamedBound& bound) const {
  auto type = bound.bound.type;
  if (bound.bound.is_flexible() && type->kind() == Polytype::Kind::kBottom) {
    return bound.name;
  }

  auto relation = bound.bound.is_flexible() ? ": " : " = ";
  return bound.name + relation + Print(type);
}


}  // namespace brite
