#include "brite/checker/checker.h"

#include <algorithm>

#include "brite/checker/substitution.h"

namespace brite {


void Checker::VisitProgram(Program* program) {
  for (auto& decl : program->declarations()) {
    auto it = declaration_states_.find(decl->name());
    if (it != declaration_states_.end()) {
      Report<DuplicateDeclarationDiagnostic>(decl->name(), it->second.decl->name_position(), decl->name_position());
      continue;
    }
    declaration_states_.emplace(decl->name(), DeclarationState(decl.get()));
  }

  for (auto& decl : program->declarations()) {
    auto& state = declaration_states_.at(decl->name());
    if (state.decl != decl.get()) {
      continue;
    }
    CheckDeclaration(&state, decl->name_position());
  }
}


Polytype* Checker::DeclarationType(const std::string& name) const {
  auto it = declaration_states_.find(name);
  if (it == declaration_states_.end()) {
    return nullptr;
  }
  return it->second.type;
}


Polytype* Checker::InferExpression(Expression* expr) {
  return prefix_.Level([&]() {
    auto type = VisitExpression(expr);
    return Normalize(prefix_.Generalize(type), &arena_);
  });
}


Polytype* Checker::CheckDeclaration(DeclarationState* state, const SourceRange& reference) {
  if (state->done) {
    return state->type;
  }

  auto decl = state->decl;
  auto func = decl->function();

  if (state->in_progress) {
    if (func->is_fully_annotated()) {
      return AtTopLevel([&]() { return AnnotatedFunctionType(func); });
    }
    auto diagnostic = Report<DeclarationCycleDiagnostic>(decl->name(), decl->name_position(), reference);
    return arena_.NewMonomorphic(arena_.NewError(diagnostic, reference));
  }

  state->in_progress = true;
  Finally finish([&]() { state->in_progress = false; });

  state->type = AtTopLevel([&]() { return CheckFunction(func); });
  state->done = true;
  return state->type;
}


Polytype* Checker::CheckFunction(Function* func) {
  return prefix_.Level([&]() {
    return WithScope([&]() {
      Vector<Monotype*> params;
      for (auto& param : func->params()) {
        auto type =
            param->annotation() != nullptr ? ConvertAnnotation(param->annotation()) : prefix_.Fresh(param->position());
        scopes_.back().insert_or_assign(param->name(), arena_.NewMonomorphic(type));
        params.push_back(type);
      }

      auto result = VisitBlock(func->body());

      if (auto return_type = func->return_type()) {
        auto annotated = ConvertAnnotation(return_type);
        auto value = func->body()->value();

        Operation operation(Operation::Kind::kReturn, value != nullptr ? ExpressionSnippet(value) : "");
        auto& position = value != nullptr ? value->position() : func->body()->position();
        WithOperation(operation, position, [&]() { return unifier_.Unify(result, annotated); });
        result = annotated;
      }

      return Normalize(prefix_.Generalize(Curry(params, result)), &arena_);
    });
  });
}


Polytype* Checker::AnnotatedFunctionType(Function* func) {
  return prefix_.Level([&]() {
    Vector<Monotype*> params;
    for (auto& param : func->params()) {
      params.push_back(ConvertAnnotation(param->annotation()));
    }
    auto result = ConvertAnnotation(func->return_type());
    return Normalize(prefix_.Generalize(Curry(params, result)), &arena_);
  });
}


Monotype* Checker::Curry(const Vector<Monotype*>& params, Monotype* result) {
  if (params.empty()) {
    return arena_.NewFunction(arena_.NewPrimitive(Monotype::Kind::kVoid), result);
  }

  auto type = result;
  for (auto i = params.size(); i > 0; --i) {
    type = arena_.NewFunction(params[i - 1], type);
  }
  return type;
}


Monotype* Checker::VisitBlock(Block* block) {
  return WithScope([&]() -> Monotype* {
    for (auto& stmt : block->statements()) {
      VisitStatement(stmt.get());
    }

    auto value = block->value();
    if (value != nullptr) {
      return value->type();
    }
    return arena_.NewPrimitive(Monotype::Kind::kVoid, block->position());
  });
}


void Checker::VisitStatement(Statement* stmt) {
  switch (stmt->kind()) {
    case Statement::Kind::kExpression:
      VisitExpression(stmt->As<ExpressionStatement>()->expr());
      return;

    case Statement::Kind::kLet:
      VisitLetStatement(stmt->As<LetStatement>());
      return;
  }

  brite_unreachable();
}


void Checker::VisitLetStatement(LetStatement* stmt) {
  auto type = prefix_.Level([&]() {
    auto value = VisitExpression(stmt->value());

    if (auto annotation = stmt->annotation()) {
      auto annotated = ConvertAnnotation(annotation);
      Operation operation(Operation::Kind::kBinding, stmt->name(), ExpressionSnippet(stmt->value()));
      WithOperation(operation, stmt->value()->position(), [&]() { return unifier_.Unify(value, annotated); });
      value = annotated;
    }

    return Normalize(prefix_.Generalize(value), &arena_);
  });

  brite_contract(!scopes_.empty());
  scopes_.back().insert_or_assign(stmt->name(), type);
}


Monotype* Checker::VisitExpression(Expression* expr) {
  Monotype* type = nullptr;

  switch (expr->kind()) {
    case Expression::Kind::kConstant:
      type = VisitConstantExpression(expr->As<ConstantExpression>());
      break;
    case Expression::Kind::kReference:
      type = VisitReferenceExpression(expr->As<ReferenceExpression>());
      break;
    case Expression::Kind::kCall:
      type = VisitCallExpression(expr->As<CallExpression>());
      break;
    case Expression::Kind::kFunction:
      type = VisitFunctionExpression(expr->As<FunctionExpression>());
      break;
    case Expression::Kind::kConditional:
      type = VisitConditionalExpression(expr->As<ConditionalExpression>());
      break;
    case Expression::Kind::kRecord:
      type = VisitRecordExpression(expr->As<RecordExpression>());
      break;
    case Expression::Kind::kFieldAccess:
      type = VisitFieldAccessExpression(expr->As<FieldAccessExpression>());
      break;
    case Expression::Kind::kAnnotation:
      type = VisitAnnotationExpression(expr->As<AnnotationExpression>());
      break;
    case Expression::Kind::kBlock:
      type = VisitBlock(expr->As<BlockExpression>()->block());
      break;
    case Expression::Kind::kNot:
      type = VisitNotExpression(expr->As<NotExpression>());
      break;
    case Expression::Kind::kLogical:
      type = VisitLogicalExpression(expr->As<LogicalExpression>());
      break;
  }

  brite_contract(type != nullptr);
  expr->set_type(type);
  return type;
}


Monotype* Checker::VisitConstantExpression(ConstantExpression* expr) {
  switch (expr->constant_kind()) {
    case ConstantExpression::ConstantKind::kBoolean:
      return arena_.NewPrimitive(Monotype::Kind::kBoolean, expr->position());
    case ConstantExpression::ConstantKind::kInteger:
      return arena_.NewPrimitive(Monotype::Kind::kInteger, expr->position());
    case ConstantExpression::ConstantKind::kFloat:
      return arena_.NewPrimitive(Monotype::Kind::kFloat, expr->position());
  }

  brite_unreachable();
}


Monotype* Checker::VisitReferenceExpression(ReferenceExpression* expr) {
  if (auto local = LookupLocal(expr->name())) {
    return prefix_.Instantiate(local);
  }

  auto it = declaration_states_.find(expr->name());
  if (it != declaration_states_.end()) {
    return prefix_.Instantiate(CheckDeclaration(&it->second, expr->position()));
  }

  auto diagnostic = Report<UnboundVariableDiagnostic>(expr->name(), expr->position());
  return arena_.NewError(diagnostic, expr->position());
}


Monotype* Checker::VisitCallExpression(CallExpression* expr) {
  auto callee = expr->callee();
  auto callee_type = VisitExpression(callee);
  auto& args = expr->args();
  Operation operation(Operation::Kind::kCall, ExpressionSnippet(callee));

  // the argument count is checked before any argument
  Diagnostic* arity = nullptr;
  auto checked = args.size();
  if (auto decl = CalleeDeclaration(callee)) {
    auto func = decl->function();
    if (func->params().size() != args.size()) {
      arity = WithOperation(operation, expr->args_position(), [&]() {
        return Report<IncompatibleArgumentCountDiagnostic>(args.size(), expr->args_position(), func->params().size(),
                                                            func->params_position());
      });
      checked = std::min(args.size(), func->params().size());
    }
  }

  auto current = callee_type;
  for (size_t i = 0; i < args.size(); ++i) {
    auto arg = args[i].get();
    auto arg_type = VisitExpression(arg);
    if (i >= checked) {
      continue;
    }

    auto func = WithOperation(operation, callee->position(), [&]() { return ExpectFunction(current); });
    WithOperation(operation, arg->position(), [&]() { return unifier_.Unify(arg_type, func->parameter()); });
    current = func->body();
  }

  if (arity != nullptr) {
    return arena_.NewError(arity, expr->position());
  }

  if (args.empty()) {
    auto func = WithOperation(operation, callee->position(), [&]() { return ExpectFunction(current); });
    auto void_type = arena_.NewPrimitive(Monotype::Kind::kVoid, expr->args_position());
    WithOperation(operation, expr->args_position(), [&]() { return unifier_.Unify(void_type, func->parameter()); });
    current = func->body();
  }

  return current;
}


FunctionDeclaration* Checker::CalleeDeclaration(Expression* callee) const {
  if (callee->kind() != Expression::Kind::kReference) {
    return nullptr;
  }

  auto& name = callee->As<ReferenceExpression>()->name();
  if (LookupLocal(name) != nullptr) {
    return nullptr;
  }

  auto it = declaration_states_.find(name);
  return it != declaration_states_.end() ? it->second.decl : nullptr;
}


FunctionType* Checker::ExpectFunction(Monotype* type) {
  for (;;) {
    if (type->kind() == Monotype::Kind::kFunction) {
      return type->As<FunctionType>();
    }
    if (type->kind() != Monotype::Kind::kVariable) {
      break;
    }

    // a polymorphic callee is used at a fresh instance
    auto bound = prefix_.Find(type->As<TypeVariable>()->name());
    if (bound == nullptr || bound->type->kind() == Polytype::Kind::kBottom) {
      break;
    }
    type = prefix_.Instantiate(bound->type);
  }

  auto func = arena_.NewFunction(prefix_.Fresh(), prefix_.Fresh());
  unifier_.Unify(type, func);
  return func;
}


Monotype* Checker::VisitFunctionExpression(FunctionExpression* expr) {
  auto type = CheckFunction(expr->function());
  if (type->kind() == Polytype::Kind::kMonotype) {
    return type->As<MonomorphicPolytype>()->type();
  }

  // keep the polymorphic type first-class
  return prefix_.FreshWithBound({Flexibility::kFlexible, type}, expr->position());
}


Monotype* Checker::VisitConditionalExpression(ConditionalExpression* expr) {
  auto cond = expr->cond();
  auto cond_type = VisitExpression(cond);
  Operation operation(Operation::Kind::kTest, ExpressionSnippet(cond));

  auto boolean = arena_.NewPrimitive(Monotype::Kind::kBoolean);
  WithOperation(operation, cond->position(), [&]() { return unifier_.Unify(cond_type, boolean); });

  auto then_type = VisitExpression(expr->then_expr());

  auto else_expr = expr->else_expr();
  if (else_expr == nullptr) {
    return arena_.NewPrimitive(Monotype::Kind::kVoid, expr->position());
  }

  auto else_type = VisitExpression(else_expr);
  WithOperation(operation, else_expr->position(), [&]() { return unifier_.Unify(else_type, then_type); });
  return then_type;
}


Monotype* Checker::VisitRecordExpression(RecordExpression* expr) {
  if (expr->fields().empty()) {
    return arena_.NewEmptyRow(expr->position());
  }

  Vector<RowEntry> entries;
  for (auto& field : expr->fields()) {
    entries.push_back({field.label, VisitExpression(field.value.get())});
  }
  return arena_.NewRowExtension(std::move(entries), nullptr, expr->position());
}


Monotype* Checker::VisitFieldAccessExpression(FieldAccessExpression* expr) {
  auto object_type = VisitExpression(expr->object());

  auto value = prefix_.Fresh(expr->position());
  Vector<RowEntry> entries;
  entries.push_back({expr->label(), value});
  auto row = arena_.NewRowExtension(std::move(entries), prefix_.Fresh());

  Operation operation(Operation::Kind::kFieldAccess, ExpressionSnippet(expr));
  auto diagnostic =
      WithOperation(operation, expr->position(), [&]() { return unifier_.Unify(object_type, row); });
  if (diagnostic != nullptr) {
    return arena_.NewError(diagnostic, expr->position());
  }
  return value;
}


Monotype* Checker::VisitAnnotationExpression(AnnotationExpression* expr) {
  auto inner = expr->expr();
  auto type = VisitExpression(inner);
  auto annotated = ConvertAnnotation(expr->annotation());

  Operation operation(Operation::Kind::kAnnotation, ExpressionSnippet(inner));
  WithOperation(operation, inner->position(), [&]() { return unifier_.Unify(type, annotated); });
  return annotated;
}


Monotype* Checker::VisitNotExpression(NotExpression* expr) {
  auto operand = expr->operand();
  auto type = VisitExpression(operand);

  auto boolean = arena_.NewPrimitive(Monotype::Kind::kBoolean);
  WithOperation(Operation(Operation::Kind::kOperator, "!"), operand->position(),
                [&]() { return unifier_.Unify(type, boolean); });
  return arena_.NewPrimitive(Monotype::Kind::kBoolean, expr->position());
}


Monotype* Checker::VisitLogicalExpression(LogicalExpression* expr) {
  Operation operation(Operation::Kind::kOperator, expr->op_text());
  auto boolean = arena_.NewPrimitive(Monotype::Kind::kBoolean);

  for (auto operand : {expr->left(), expr->right()}) {
    auto type = VisitExpression(operand);
    WithOperation(operation, operand->position(), [&]() { return unifier_.Unify(type, boolean); });
  }
  return arena_.NewPrimitive(Monotype::Kind::kBoolean, expr->position());
}


Polytype* Checker::LookupLocal(const std::string& name) const {
  for (auto i = scopes_.size(); i > 0; --i) {
    auto& scope = scopes_[i - 1];
    auto it = scope.find(name);
    if (it != scope.end()) {
      return it->second;
    }
  }
  return nullptr;
}


Monotype* Checker::ConvertAnnotation(TypeRepr* type_repr) {
  auto type = ConvertPolytype(type_repr);
  if (type->kind() == Polytype::Kind::kMonotype) {
    return type->As<MonomorphicPolytype>()->type();
  }
  return prefix_.FreshWithBound({Flexibility::kRigid, type}, type_repr->position());
}


Polytype* Checker::ConvertPolytype(TypeRepr* type_repr) {
  if (type_repr->kind() != TypeRepr::Kind::kGeneric) {
    return arena_.NewMonomorphic(ConvertTypeRepr(type_repr));
  }

  auto generic = type_repr->As<GenericTypeRepr>();
  return prefix_.Level([&]() {
    type_scopes_.push_back(TypeScope());
    Finally pop([&]() { type_scopes_.pop_back(); });

    for (auto& param : generic->params()) {
      auto bound_type = param.bound != nullptr ? ConvertPolytype(param.bound.get()) : arena_.NewBottom(param.position);
      Bound bound{param.flexibility, bound_type};

      // a name already in the prefix is taken by an enclosing scope
      Monotype* variable = prefix_.Add(param.name, bound, param.position);
      if (variable == nullptr) {
        variable = prefix_.FreshWithBound(bound, param.position);
      }
      type_scopes_.back().insert_or_assign(param.name, variable);
    }

    auto body = ConvertTypeRepr(generic->body());
    return Normalize(prefix_.Generalize(body), &arena_);
  });
}


Monotype* Checker::ConvertTypeRepr(TypeRepr* type_repr) {
  switch (type_repr->kind()) {
    case TypeRepr::Kind::kNamed:
      return ConvertNamedTypeRepr(type_repr->As<NamedTypeRepr>());
    case TypeRepr::Kind::kFunction:
      return ConvertFunctionTypeRepr(type_repr->As<FunctionTypeRepr>());
    case TypeRepr::Kind::kRecord:
      return ConvertRecordTypeRepr(type_repr->As<RecordTypeRepr>());
    case TypeRepr::Kind::kGeneric:
      return ConvertAnnotation(type_repr);
  }

  brite_unreachable();
}


Monotype* Checker::ConvertNamedTypeRepr(NamedTypeRepr* type_repr) {
  auto& name = type_repr->name();
  auto& position = type_repr->position();

  for (auto i = type_scopes_.size(); i > 0; --i) {
    auto& scope = type_scopes_[i - 1];
    auto it = scope.find(name);
    if (it != scope.end()) {
      return arena_.NewVariable(it->second->As<TypeVariable>()->name(), position);
    }
  }

  static const struct {
    const char* name;
    Monotype::Kind kind;
  } primitives[] = {
      {"Never", Monotype::Kind::kNever},  {"Void", Monotype::Kind::kVoid}, {"Bool", Monotype::Kind::kBoolean},
      {"Num", Monotype::Kind::kNumber},   {"Int", Monotype::Kind::kInteger}, {"Float", Monotype::Kind::kFloat},
  };

  for (auto& primitive : primitives) {
    if (name == primitive.name) {
      return arena_.NewPrimitive(primitive.kind, position);
    }
  }

  auto diagnostic = Report<UnboundTypeVariableDiagnostic>(name, position);
  return arena_.NewError(diagnostic, position);
}


Monotype* Checker::ConvertFunctionTypeRepr(FunctionTypeRepr* type_repr) {
  auto& position = type_repr->position();
  auto result = ConvertTypeRepr(type_repr->result());
  auto& params = type_repr->params();

  if (params.empty()) {
    return arena_.NewFunction(arena_.NewPrimitive(Monotype::Kind::kVoid), result, position);
  }

  Vector<Monotype*> param_types;
  for (auto& param : params) {
    param_types.push_back(ConvertTypeRepr(param.get()));
  }

  auto type = result;
  for (auto i = param_types.size(); i > 0; --i) {
    type = arena_.NewFunction(param_types[i - 1], type, i == 1 ? position : SourceRange());
  }
  return type;
}


Monotype* Checker::ConvertRecordTypeRepr(RecordTypeRepr* type_repr) {
  auto& position = type_repr->position();

  Monotype* extension = nullptr;
  if (auto extension_repr = type_repr->extension()) {
    extension = ConvertTypeRepr(extension_repr);
    auto kind = extension->kind();
    if (!extension->is_row() && kind != Monotype::Kind::kVariable && kind != Monotype::Kind::kError) {
      auto diagnostic =
          Report<IncompatibleKindsDiagnostic>(TypeKind::kValue, TypeKind::kRow, extension_repr->position());
      extension = arena_.NewError(diagnostic, extension_repr->position());
    }
  }

  if (type_repr->fields().empty()) {
    return extension != nullptr ? extension : arena_.NewEmptyRow(position);
  }

  Vector<RowEntry> entries;
  for (auto& field : type_repr->fields()) {
    entries.push_back({field.label, ConvertTypeRepr(field.type.get())});
  }
  return arena_.NewRowExtension(std::move(entries), extension, position);
}


std::string ExpressionSnippet(const Expression* expr) {
  switch (expr->kind()) {
    case Expression::Kind::kConstant:
      return expr->As<ConstantExpression>()->text();

    case Expression::Kind::kReference:
      return expr->As<ReferenceExpression>()->name();

    case Expression::Kind::kCall:
      return ExpressionSnippet(expr->As<CallExpression>()->callee()) + "()";

    case Expression::Kind::kFunction: {
      auto& params = expr->As<FunctionExpression>()->function()->params();
      std::string str = "";
      for (size_t i = 0; i < params.size() && i < 2; ++i) {
        if (i > 0) {
          str += ", ";
        }
        str += params[i]->name();
      }
      if (params.size() > 2) {
        str += ", ...";
      }
      return "fun(" + str + ") { ... }";
    }

    case Expression::Kind::kConditional:
      return "if " + ExpressionSnippet(expr->As<ConditionalExpression>()->cond()) + " { ... }";

    case Expression::Kind::kRecord:
      return "{ ... }";

    case Expression::Kind::kFieldAccess: {
      auto access = expr->As<FieldAccessExpression>();
      return ExpressionSnippet(access->object()) + "." + access->label();
    }

    case Expression::Kind::kAnnotation:
      return ExpressionSnippet(expr->As<AnnotationExpression>()->expr());

    case Expression::Kind::kBlock:
      return "do { ... }";

    case Expression::Kind::kNot:
      return "!" + ExpressionSnippet(expr->As<NotExpression>()->operand());

    case Expression::Kind::kLogical: {
      auto logical = expr->As<LogicalExpression>();
      return ExpressionSnippet(logical->left()) + " " + logical->op_text() + " " + ExpressionSnippet(logical->right());
    }
  }

  brite_unreachable();
}


}  // namespace brite
