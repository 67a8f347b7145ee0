#include "brite/checker/diagnostic.h"

namespace brite {


const char* TypeKindName(TypeKind kind) {
  switch (kind) {
    case TypeKind::kValue:
      return "Value";
    case TypeKind::kRow:
      return "Row";
  }

  brite_unreachable();
}


std::ostream& operator<<(std::ostream& stream, const Diagnostic& diagnostic) {
  auto& position = diagnostic.position();

  if (position.is_known()) {
    stream << position.start.line << ":" << position.start.column << ": ";
  }

  DiagnosticPrinter printer;
  stream << "error: " << printer.Explain(&diagnostic).message;
  return stream;
}


std::string PrintDiagnostic(const Diagnostic* diagnostic) {
  TypePrinter printer;

  switch (diagnostic->kind()) {
    case Diagnostic::Kind::kUnboundVariable:
      return "Unbound variable `" + diagnostic->As<UnboundVariableDiagnostic>()->name() + "`.";

    case Diagnostic::Kind::kUnboundTypeVariable:
      return "Unbound type variable `" + diagnostic->As<UnboundTypeVariableDiagnostic>()->name() + "`.";

    case Diagnostic::Kind::kIncompatibleTypes: {
      auto d = diagnostic->As<IncompatibleTypesDiagnostic>();
      return printer(d->type1()) + " ≢ " + printer(d->type2());
    }

    case Diagnostic::Kind::kInfiniteType: {
      auto d = diagnostic->As<InfiniteTypeDiagnostic>();
      return "Infinite type since `" + d->name() + "` occurs in `" + printer(d->type()) + "`.";
    }

    case Diagnostic::Kind::kIncompatibleKinds: {
      auto d = diagnostic->As<IncompatibleKindsDiagnostic>();
      return std::string("Incompatible kinds ") + TypeKindName(d->kind1()) + " and " + TypeKindName(d->kind2()) + ".";
    }

    case Diagnostic::Kind::kInfiniteKind:
      return "Infinite kind.";

    case Diagnostic::Kind::kIncompatibleArgumentCount: {
      auto d = diagnostic->As<IncompatibleArgumentCountDiagnostic>();
      return "Expected " + std::to_string(d->count2()) + " arguments but found " + std::to_string(d->count1()) + ".";
    }

    case Diagnostic::Kind::kDuplicateDeclaration:
      return "Duplicate declaration `" + diagnostic->As<DuplicateDeclarationDiagnostic>()->name() + "`.";

    case Diagnostic::Kind::kDeclarationCycle:
      return "Circular reference to `" + diagnostic->As<DeclarationCycleDiagnostic>()->name() + "`.";
  }

  brite_unreachable();
}


static std::string CountWord(size_t count) {
  static const char* words[] = {
      "zero",    "one",     "two",       "three",    "four",     "five",    "six",
      "seven",   "eight",   "nine",      "ten",      "eleven",   "twelve",  "thirteen",
      "fourteen", "fifteen", "sixteen",  "seventeen", "eighteen", "nineteen", "twenty",
  };

  if (count < sizeof(words) / sizeof(words[0])) {
    return words[count];
  }
  return std::to_string(count);
}


static std::string ArgumentCount(size_t count) {
  return CountWord(count) + (count == 1 ? " argument" : " arguments");
}


ExplainedDiagnostic DiagnosticPrinter::Explain(const Diagnostic* diagnostic) const {
  auto& operation = diagnostic->operation();

  switch (diagnostic->kind()) {
    case Diagnostic::Kind::kUnboundVariable:
      return {"Can not find `" + diagnostic->As<UnboundVariableDiagnostic>()->name() + "`.", {}};

    case Diagnostic::Kind::kUnboundTypeVariable:
      return {"Can not find type `" + diagnostic->As<UnboundTypeVariableDiagnostic>()->name() + "`.", {}};

    case Diagnostic::Kind::kIncompatibleTypes:
      return ExplainIncompatibleTypes(diagnostic->As<IncompatibleTypesDiagnostic>());

    case Diagnostic::Kind::kInfiniteType:
      if (operation.kind == Operation::Kind::kNone) {
        break;
      }
      return {ExplainOperation(operation) + " because the type checker infers an infinite type.", {}};

    case Diagnostic::Kind::kIncompatibleArgumentCount:
      return ExplainIncompatibleArgumentCount(diagnostic->As<IncompatibleArgumentCountDiagnostic>());

    case Diagnostic::Kind::kDuplicateDeclaration: {
      auto d = diagnostic->As<DuplicateDeclarationDiagnostic>();
      ExplainedDiagnostic explained{"Can not use the name `" + d->name() + "` again.", {}};
      explained.related.push_back({d->first(), "`" + d->name() + "`"});
      return explained;
    }

    case Diagnostic::Kind::kDeclarationCycle: {
      auto d = diagnostic->As<DeclarationCycleDiagnostic>();
      ExplainedDiagnostic explained{"Can not use `" + d->name() + "` because it would create a circular reference.", {}};
      explained.related.push_back({d->declaration(), "`" + d->name() + "`"});
      return explained;
    }

    case Diagnostic::Kind::kIncompatibleKinds:
    case Diagnostic::Kind::kInfiniteKind:
      break;
  }

  return {PrintDiagnostic(diagnostic), {}};
}


std::string DiagnosticPrinter::ExplainOperation(const Operation& operation) const {
  switch (operation.kind) {
    case Operation::Kind::kAnnotation:
      return "Can not change the type of `" + operation.subject + "`";
    case Operation::Kind::kBinding:
      return "Can not set `" + operation.subject + "` to `" + operation.value + "`";
    case Operation::Kind::kReturn:
      return "Can not return `" + operation.subject + "`";
    case Operation::Kind::kCall:
      return "Can not call `" + operation.subject + "`";
    case Operation::Kind::kTest:
      return "Can not test `" + operation.subject + "`";
    case Operation::Kind::kOperator:
      return "Can not use `" + operation.subject + "`";
    case Operation::Kind::kFieldAccess:
      return "Can not access `" + operation.subject + "`";
    case Operation::Kind::kNone:
      break;
  }

  brite_unreachable();
}


ExplainedDiagnostic DiagnosticPrinter::ExplainIncompatibleTypes(const IncompatibleTypesDiagnostic* diagnostic) const {
  auto& operation = diagnostic->operation();
  auto actual = diagnostic->type1();
  auto expected = diagnostic->type2();

  if (operation.kind == Operation::Kind::kNone) {
    return {PrintDiagnostic(diagnostic), {}};
  }

  // a function body that produces no value where one is declared
  if (operation.kind == Operation::Kind::kReturn && operation.subject.empty() &&
      actual->kind() == Polytype::Kind::kMonotype &&
      actual->As<MonomorphicPolytype>()->type()->kind() == Monotype::Kind::kVoid) {
    SourceTypePrinter printer;
    return {"We need `" + printer(expected) + "` to be returned from this function.", {}};
  }

  ExplainedDiagnostic explained{
      ExplainOperation(operation) + " because " + TypeSnippet(actual, expected, true) + " is not " +
          TypeSnippet(expected, actual, true) + ".",
      {},
  };

  for (auto type : {actual, expected}) {
    auto& position = type->position();
    if (position.is_known() && !position.Intersects(diagnostic->position())) {
      explained.related.push_back({position, TypeSnippet(type, type == actual ? expected : actual, false)});
    }
  }

  return explained;
}


ExplainedDiagnostic DiagnosticPrinter::ExplainIncompatibleArgumentCount(
    const IncompatibleArgumentCountDiagnostic* diagnostic) const {
  auto& operation = diagnostic->operation();
  auto found = diagnostic->count1();
  auto needed = diagnostic->count2();

  std::string message;
  if (operation.kind == Operation::Kind::kNone) {
    message = PrintDiagnostic(diagnostic);
  } else if (found < needed) {
    message = ExplainOperation(operation) + " because we have " + ArgumentCount(found) + " but we need " +
              CountWord(needed) + ".";
  } else {
    message = ExplainOperation(operation) + " because we have " + ArgumentCount(found) + " but we only need " +
              CountWord(needed) + ".";
  }

  ExplainedDiagnostic explained{message, {}};
  auto& declaration = diagnostic->range2();
  if (declaration.is_known() && !declaration.Intersects(diagnostic->position())) {
    explained.related.push_back({declaration, ArgumentCount(needed)});
  }
  return explained;
}


static bool IsFunctionOrRecord(const Polytype* type) {
  const Monotype* mono = nullptr;
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      mono = type->As<MonomorphicPolytype>()->type();
      break;
    case Polytype::Kind::kQuantify:
      mono = type->As<QuantifiedPolytype>()->body();
      break;
    case Polytype::Kind::kBottom:
      return false;
  }
  return mono->kind() == Monotype::Kind::kFunction || mono->is_row();
}


std::string DiagnosticPrinter::TypeSnippet(const Polytype* type, const Polytype* other, bool article) const {
  SourceTypePrinter printer;
  auto code = "`" + printer(type) + "`";

  if (type->kind() != Polytype::Kind::kMonotype) {
    return code;
  }

  auto mono = type->As<MonomorphicPolytype>()->type();
  switch (mono->kind()) {
    case Monotype::Kind::kBoolean:
    case Monotype::Kind::kNumber:
    case Monotype::Kind::kFloat:
      return article ? "a " + code : code;

    case Monotype::Kind::kInteger:
      return article ? "an " + code : code;

    case Monotype::Kind::kFunction:
      if (IsFunctionOrRecord(other)) {
        return code;
      }
      return article ? "a function" : "function";

    case Monotype::Kind::kEmptyRow:
    case Monotype::Kind::kRowExtension:
      if (IsFunctionOrRecord(other)) {
        return code;
      }
      return article ? "a record" : "record";

    default:
      return code;
  }
}


}  // namespace brite
