#ifndef BRITE_TEST_UNIT_CHECKER_AST_BUILDER_H_
#define BRITE_TEST_UNIT_CHECKER_AST_BUILDER_H_

#include <string>
#include <utility>

#include "brite/checker/ast.h"

namespace brite {


template <typename T, typename... Args>
Vector<T> MakeList(Args&&... args) {
  Vector<T> list;
  (list.push_back(std::forward<Args>(args)), ...);
  return list;
}


template <typename T>
auto At(std::unique_ptr<T>&& node, const SourceRange& position) {
  node->set_position(position);
  return std::move(node);
}


inline TypeReprPtr MakeNamedType(const std::string& name, const SourceRange& position = SourceRange()) {
  return At(NamedTypeRepr::Create(name), position);
}

inline TypeReprPtr MakeFunctionType(Vector<TypeReprPtr>&& params, TypeReprPtr&& result,
                                    const SourceRange& position = SourceRange()) {
  return At(FunctionTypeRepr::Create(std::move(params), std::move(result)), position);
}

inline TypeReprPtr MakeRecordType(Vector<RecordFieldRepr>&& fields, TypeReprPtr&& extension = nullptr,
                                  const SourceRange& position = SourceRange()) {
  return At(RecordTypeRepr::Create(std::move(fields), std::move(extension)), position);
}

inline TypeReprPtr MakeGenericType(Vector<TypeParameterRepr>&& params, TypeReprPtr&& body,
                                   const SourceRange& position = SourceRange()) {
  return At(GenericTypeRepr::Create(std::move(params), std::move(body)), position);
}


inline ExpressionPtr MakeBool(bool value, const SourceRange& position = SourceRange()) {
  return At(ConstantExpression::Create(ConstantExpression::ConstantKind::kBoolean, value ? "true" : "false"),
            position);
}

inline ExpressionPtr MakeInt(const std::string& text, const SourceRange& position = SourceRange()) {
  return At(ConstantExpression::Create(ConstantExpression::ConstantKind::kInteger, text), position);
}

inline ExpressionPtr MakeFloat(const std::string& text, const SourceRange& position = SourceRange()) {
  return At(ConstantExpression::Create(ConstantExpression::ConstantKind::kFloat, text), position);
}

inline ExpressionPtr MakeRef(const std::string& name, const SourceRange& position = SourceRange()) {
  return At(ReferenceExpression::Create(name), position);
}

inline ExpressionPtr MakeCall(ExpressionPtr&& callee, Vector<ExpressionPtr>&& args,
                              const SourceRange& args_position = SourceRange(),
                              const SourceRange& position = SourceRange()) {
  auto call = At(CallExpression::Create(std::move(callee), std::move(args)), position);
  call->set_args_position(args_position);
  return call;
}

inline ExpressionPtr MakeIf(ExpressionPtr&& cond, ExpressionPtr&& then_expr, ExpressionPtr&& else_expr = nullptr,
                            const SourceRange& position = SourceRange()) {
  return At(ConditionalExpression::Create(std::move(cond), std::move(then_expr), std::move(else_expr)), position);
}

inline ExpressionPtr MakeRecord(Vector<RecordField>&& fields, const SourceRange& position = SourceRange()) {
  return At(RecordExpression::Create(std::move(fields)), position);
}

inline ExpressionPtr MakeAccess(ExpressionPtr&& object, const std::string& label,
                                const SourceRange& position = SourceRange()) {
  return At(FieldAccessExpression::Create(std::move(object), label), position);
}

inline ExpressionPtr MakeAnnotation(ExpressionPtr&& expr, TypeReprPtr&& annotation,
                                    const SourceRange& position = SourceRange()) {
  return At(AnnotationExpression::Create(std::move(expr), std::move(annotation)), position);
}

inline ExpressionPtr MakeNot(ExpressionPtr&& operand, const SourceRange& position = SourceRange()) {
  return At(NotExpression::Create(std::move(operand)), position);
}

inline ExpressionPtr MakeLogical(LogicalExpression::Operator op, ExpressionPtr&& left, ExpressionPtr&& right,
                                 const SourceRange& position = SourceRange()) {
  return At(LogicalExpression::Create(op, std::move(left), std::move(right)), position);
}


inline StatementPtr MakeExprStmt(ExpressionPtr&& expr) {
  auto position = expr->position();
  return At(ExpressionStatement::Create(std::move(expr)), position);
}

inline StatementPtr MakeLet(const std::string& name, TypeReprPtr&& annotation, ExpressionPtr&& value) {
  auto position = value->position();
  return At(LetStatement::Create(name, std::move(annotation), std::move(value)), position);
}


template <typename... Stmts>
BlockPtr MakeBlock(Stmts&&... stmts) {
  auto block = Block::Create();
  (block->add_statement(std::forward<Stmts>(stmts)), ...);
  return block;
}

template <typename... Exprs>
BlockPtr MakeBody(Exprs&&... exprs) {
  return MakeBlock(MakeExprStmt(std::forward<Exprs>(exprs))...);
}

inline ExpressionPtr MakeDo(BlockPtr&& block, const SourceRange& position = SourceRange()) {
  return At(BlockExpression::Create(std::move(block)), position);
}


inline ParameterPtr MakeParam(const std::string& name, TypeReprPtr&& annotation = nullptr,
                              const SourceRange& position = SourceRange()) {
  return At(Parameter::Create(name, std::move(annotation)), position);
}

inline FunctionPtr MakeFunction(Vector<ParameterPtr>&& params, TypeReprPtr&& return_type, BlockPtr&& body,
                                const SourceRange& params_position = SourceRange()) {
  auto func = Function::Create(std::move(params), std::move(return_type), std::move(body));
  func->set_params_position(params_position);
  return func;
}

inline ExpressionPtr MakeLambda(FunctionPtr&& func, const SourceRange& position = SourceRange()) {
  return At(FunctionExpression::Create(std::move(func)), position);
}

inline FunctionDeclarationPtr MakeDecl(const std::string& name, FunctionPtr&& func,
                                       const SourceRange& name_position = SourceRange()) {
  auto decl = FunctionDeclaration::Create(name, std::move(func));
  decl->set_name_position(name_position);
  return decl;
}

template <typename... Decls>
ProgramPtr MakeProgram(Decls&&... decls) {
  auto program = Program::Create();
  (program->add_declaration(std::forward<Decls>(decls)), ...);
  return program;
}


}  // namespace brite

#endif  // BRITE_TEST_UNIT_CHECKER_AST_BUILDER_H_
