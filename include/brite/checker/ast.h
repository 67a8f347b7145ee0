#ifndef BRITE_CHECKER_AST_H_
#define BRITE_CHECKER_AST_H_

#include <memory>
#include <string>
#include <utility>

#include "brite/checker/location.h"
#include "brite/checker/type.h"
#include "brite/util/downcastable.h"
#include "brite/util/vector.h"

namespace brite {

class Program;
class FunctionDeclaration;
class Function;
class Parameter;
class Block;
class Statement;
class Expression;
class TypeRepr;

using ProgramPtr = std::unique_ptr<Program>;
using FunctionDeclarationPtr = std::unique_ptr<FunctionDeclaration>;
using FunctionPtr = std::unique_ptr<Function>;
using ParameterPtr = std::unique_ptr<Parameter>;
using BlockPtr = std::unique_ptr<Block>;
using StatementPtr = std::unique_ptr<Statement>;
using ExpressionPtr = std::unique_ptr<Expression>;
using TypeReprPtr = std::unique_ptr<TypeRepr>;


class Program {
 public:
  static auto Create() {
    auto p = new Program();
    return std::unique_ptr<Program>(p);
  }

 protected:
  Program() :
      declarations_() {}

 public:
  ~Program() = default;

  Program(const Program&) = delete;
  Program& operator=(const Program&) = delete;

  const Vector<FunctionDeclarationPtr>& declarations() const { return declarations_; }
  void add_declaration(FunctionDeclarationPtr&& decl) { declarations_.push_back(std::move(decl)); }

 private:
  Vector<FunctionDeclarationPtr> declarations_;
};


class Parameter {
 public:
  static auto Create(const std::string& name, TypeReprPtr&& annotation) {
    auto p = new Parameter(name, std::move(annotation));
    return std::unique_ptr<Parameter>(p);
  }

 protected:
  Parameter(const std::string& name, TypeReprPtr&& annotation) :
      name_(name),
      annotation_(std::move(annotation)),
      position_() {}

 public:
  ~Parameter() = default;

  Parameter(const Parameter&) = delete;
  Parameter& operator=(const Parameter&) = delete;

  const std::string& name() const { return name_; }

  // nullptr when not annotated
  TypeRepr* annotation() const { return annotation_.get(); }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  std::string name_;
  TypeReprPtr annotation_;
  SourceRange position_;
};


// parameters, optional return annotation and body shared by declarations and function literals
class Function {
 public:
  static auto Create(Vector<ParameterPtr>&& params, TypeReprPtr&& return_type, BlockPtr&& body) {
    auto p = new Function(std::move(params), std::move(return_type), std::move(body));
    return std::unique_ptr<Function>(p);
  }

 protected:
  Function(Vector<ParameterPtr>&& params, TypeReprPtr&& return_type, BlockPtr&& body) :
      params_(std::move(params)),
      return_type_(std::move(return_type)),
      body_(std::move(body)),
      params_position_() {}

 public:
  ~Function() = default;

  Function(const Function&) = delete;
  Function& operator=(const Function&) = delete;

  const Vector<ParameterPtr>& params() const { return params_; }
  TypeRepr* return_type() const { return return_type_.get(); }
  Block* body() const { return body_.get(); }

  bool is_fully_annotated() const;

  // the whole parameter list, parentheses included
  const SourceRange& params_position() const { return params_position_; }
  void set_params_position(const SourceRange& position) { params_position_ = position; }

 private:
  Vector<ParameterPtr> params_;
  TypeReprPtr return_type_;
  BlockPtr body_;
  SourceRange params_position_;
};


class FunctionDeclaration {
 public:
  static auto Create(const std::string& name, FunctionPtr&& function) {
    auto p = new FunctionDeclaration(name, std::move(function));
    return std::unique_ptr<FunctionDeclaration>(p);
  }

 protected:
  FunctionDeclaration(const std::string& name, FunctionPtr&& function) :
      name_(name),
      function_(std::move(function)),
      name_position_(),
      position_() {}

 public:
  ~FunctionDeclaration() = default;

  FunctionDeclaration(const FunctionDeclaration&) = delete;
  FunctionDeclaration& operator=(const FunctionDeclaration&) = delete;

  const std::string& name() const { return name_; }
  Function* function() const { return function_.get(); }

  const SourceRange& name_position() const { return name_position_; }
  void set_name_position(const SourceRange& position) { name_position_ = position; }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  std::string name_;
  FunctionPtr function_;
  SourceRange name_position_;
  SourceRange position_;
};


class Block {
 public:
  static auto Create() {
    auto p = new Block();
    return std::unique_ptr<Block>(p);
  }

 protected:
  Block() :
      statements_(),
      position_() {}

 public:
  ~Block() = default;

  Block(const Block&) = delete;
  Block& operator=(const Block&) = delete;

  const Vector<StatementPtr>& statements() const { return statements_; }
  void add_statement(StatementPtr&& stmt) { statements_.push_back(std::move(stmt)); }

  // the trailing expression statement, if any, gives the block its value
  Expression* value() const;

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  Vector<StatementPtr> statements_;
  SourceRange position_;
};


class Statement : public Downcastable {
 public:
  enum class Kind {
    kExpression,
    kLet,
  };

 protected:
  explicit Statement(Kind kind) :
      kind_(kind),
      position_() {}

 public:
  virtual ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Kind kind() const { return kind_; }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  Kind kind_;
  SourceRange position_;
};


class ExpressionStatement : public Statement {
 public:
  static auto Create(ExpressionPtr&& expr) {
    auto p = new ExpressionStatement(std::move(expr));
    return std::unique_ptr<ExpressionStatement>(p);
  }

 protected:
  explicit ExpressionStatement(ExpressionPtr&& expr) :
      Statement(Kind::kExpression),
      expr_(std::move(expr)) {}

 public:
  Expression* expr() const { return expr_.get(); }

 private:
  ExpressionPtr expr_;
};


class LetStatement : public Statement {
 public:
  static auto Create(const std::string& name, TypeReprPtr&& annotation, ExpressionPtr&& value) {
    auto p = new LetStatement(name, std::move(annotation), std::move(value));
    return std::unique_ptr<LetStatement>(p);
  }

 protected:
  LetStatement(const std::string& name, TypeReprPtr&& annotation, ExpressionPtr&& value) :
      Statement(Kind::kLet),
      name_(name),
      annotation_(std::move(annotation)),
      value_(std::move(value)) {}

 public:
  const std::string& name() const { return name_; }
  TypeRepr* annotation() const { return annotation_.get(); }
  Expression* value() const { return value_.get(); }

 private:
  std::string name_;
  TypeReprPtr annotation_;
  ExpressionPtr value_;
};


class Expression : public Downcastable {
 public:
  enum class Kind {
    kConstant,
    kReference,
    kCall,
    kFunction,
    kConditional,
    kRecord,
    kFieldAccess,
    kAnnotation,
    kBlock,
    kNot,
    kLogical,
  };

 protected:
  explicit Expression(Kind kind) :
      kind_(kind),
      type_(nullptr),
      position_() {}

 public:
  virtual ~Expression() = default;

  Expression(const Expression&) = delete;
  Expression& operator=(const Expression&) = delete;

  Kind kind() const { return kind_; }

  // set by the checker
  Monotype* type() const { return type_; }
  void set_type(Monotype* type) { type_ = type; }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  Kind kind_;
  Monotype* type_;
  SourceRange position_;
};


class ConstantExpression : public Expression {
 public:
  enum class ConstantKind {
    kBoolean,
    kInteger,
    kFloat,
  };

  static auto Create(ConstantKind kind, const std::string& text) {
    auto p = new ConstantExpression(kind, text);
    return std::unique_ptr<ConstantExpression>(p);
  }

 protected:
  ConstantExpression(ConstantKind kind, const std::string& text) :
      Expression(Kind::kConstant),
      constant_kind_(kind),
      text_(text) {}

 public:
  ConstantKind constant_kind() const { return constant_kind_; }

  // as written, e.g. "true" or "1.5"
  const std::string& text() const { return text_; }

 private:
  ConstantKind constant_kind_;
  std::string text_;
};


class ReferenceExpression : public Expression {
 public:
  static auto Create(const std::string& name) {
    auto p = new ReferenceExpression(name);
    return std::unique_ptr<ReferenceExpression>(p);
  }

 protected:
  explicit ReferenceExpression(const std::string& name) :
      Expression(Kind::kReference),
      name_(name) {}

 public:
  const std::string& name() const { return name_; }

 private:
  std::string name_;
};


class CallExpression : public Expression {
 public:
  static auto Create(ExpressionPtr&& callee, Vector<ExpressionPtr>&& args) {
    auto p = new CallExpression(std::move(callee), std::move(args));
    return std::unique_ptr<CallExpression>(p);
  }

 protected:
  CallExpression(ExpressionPtr&& callee, Vector<ExpressionPtr>&& args) :
      Expression(Kind::kCall),
      callee_(std::move(callee)),
      args_(std::move(args)),
      args_position_() {}

 public:
  Expression* callee() const { return callee_.get(); }
  const Vector<ExpressionPtr>& args() const { return args_; }

  // the whole argument list, parentheses included
  const SourceRange& args_position() const { return args_position_; }
  void set_args_position(const SourceRange& position) { args_position_ = position; }

 private:
  ExpressionPtr callee_;
  Vector<ExpressionPtr> args_;
  SourceRange args_position_;
};


class FunctionExpression : public Expression {
 public:
  static auto Create(FunctionPtr&& function) {
    auto p = new FunctionExpression(std::move(function));
    return std::unique_ptr<FunctionExpression>(p);
  }

 protected:
  explicit FunctionExpression(FunctionPtr&& function) :
      Expression(Kind::kFunction),
      function_(std::move(function)) {}

 public:
  Function* function() const { return function_.get(); }

 private:
  FunctionPtr function_;
};


class ConditionalExpression : public Expression {
 public:
  static auto Create(ExpressionPtr&& cond, ExpressionPtr&& then_expr, ExpressionPtr&& else_expr) {
    auto p = new ConditionalExpression(std::move(cond), std::move(then_expr), std::move(else_expr));
    return std::unique_ptr<ConditionalExpression>(p);
  }

 protected:
  ConditionalExpression(ExpressionPtr&& cond, ExpressionPtr&& then_expr, ExpressionPtr&& else_expr) :
      Expression(Kind::kConditional),
      cond_(std::move(cond)),
      then_expr_(std::move(then_expr)),
      else_expr_(std::move(else_expr)) {}

 public:
  Expression* cond() const { return cond_.get(); }
  Expression* then_expr() const { return then_expr_.get(); }

  // nullptr without an else branch
  Expression* else_expr() const { return else_expr_.get(); }

 private:
  ExpressionPtr cond_;
  ExpressionPtr then_expr_;
  ExpressionPtr else_expr_;
};


struct RecordField {
  std::string label;
  ExpressionPtr value;
};


class RecordExpression : public Expression {
 public:
  static auto Create(Vector<RecordField>&& fields) {
    auto p = new RecordExpression(std::move(fields));
    return std::unique_ptr<RecordExpression>(p);
  }

 protected:
  explicit RecordExpression(Vector<RecordField>&& fields) :
      Expression(Kind::kRecord),
      fields_(std::move(fields)) {}

 public:
  const Vector<RecordField>& fields() const { return fields_; }

 private:
  Vector<RecordField> fields_;
};


class FieldAccessExpression : public Expression {
 public:
  static auto Create(ExpressionPtr&& object, const std::string& label) {
    auto p = new FieldAccessExpression(std::move(object), label);
    return std::unique_ptr<FieldAccessExpression>(p);
  }

 protected:
  FieldAccessExpression(ExpressionPtr&& object, const std::string& label) :
      Expression(Kind::kFieldAccess),
      object_(std::move(object)),
      label_(label) {}

 public:
  Expression* object() const { return object_.get(); }
  const std::string& label() const { return label_; }

 private:
  ExpressionPtr object_;
  std::string label_;
};


// (e: T)
class AnnotationExpression : public Expression {
 public:
  static auto Create(ExpressionPtr&& expr, TypeReprPtr&& annotation) {
    auto p = new AnnotationExpression(std::move(expr), std::move(annotation));
    return std::unique_ptr<AnnotationExpression>(p);
  }

 protected:
  AnnotationExpression(ExpressionPtr&& expr, TypeReprPtr&& annotation) :
      Expression(Kind::kAnnotation),
      expr_(std::move(expr)),
      annotation_(std::move(annotation)) {}

 public:
  Expression* expr() const { return expr_.get(); }
  TypeRepr* annotation() const { return annotation_.get(); }

 private:
  ExpressionPtr expr_;
  TypeReprPtr annotation_;
};


// do { ... }
class BlockExpression : public Expression {
 public:
  static auto Create(BlockPtr&& block) {
    auto p = new BlockExpression(std::move(block));
    return std::unique_ptr<BlockExpression>(p);
  }

 protected:
  explicit BlockExpression(BlockPtr&& block) :
      Expression(Kind::kBlock),
      block_(std::move(block)) {}

 public:
  Block* block() const { return block_.get(); }

 private:
  BlockPtr block_;
};


class NotExpression : public Expression {
 public:
  static auto Create(ExpressionPtr&& operand) {
    auto p = new NotExpression(std::move(operand));
    return std::unique_ptr<NotExpression>(p);
  }

 protected:
  explicit NotExpression(ExpressionPtr&& operand) :
      Expression(Kind::kNot),
      operand_(std::move(operand)) {}

 public:
  Expression* operand() const { return operand_.get(); }

 private:
  ExpressionPtr operand_;
};


class LogicalExpression : public Expression {
 public:
  enum class Operator {
    kAnd,
    kOr,
  };

  static auto Create(Operator op, ExpressionPtr&& left, ExpressionPtr&& right) {
    auto p = new LogicalExpression(op, std::move(left), std::move(right));
    return std::unique_ptr<LogicalExpression>(p);
  }

 protected:
  LogicalExpression(Operator op, ExpressionPtr&& left, ExpressionPtr&& right) :
      Expression(Kind::kLogical),
      op_(op),
      left_(std::move(left)),
      right_(std::move(right)) {}

 public:
  Operator op() const { return op_; }
  const char* op_text() const { return op_ == Operator::kAnd ? "&&" : "||"; }

  Expression* left() const { return left_.get(); }
  Expression* right() const { return right_.get(); }

 private:
  Operator op_;
  ExpressionPtr left_;
  ExpressionPtr right_;
};


class TypeRepr : public Downcastable {
 public:
  enum class Kind {
    kNamed,
    kFunction,
    kRecord,
    kGeneric,
  };

 protected:
  explicit TypeRepr(Kind kind) :
      kind_(kind),
      position_() {}

 public:
  virtual ~TypeRepr() = default;

  TypeRepr(const TypeRepr&) = delete;
  TypeRepr& operator=(const TypeRepr&) = delete;

  Kind kind() const { return kind_; }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

 private:
  Kind kind_;
  SourceRange position_;
};


// a primitive or a type parameter in scope
class NamedTypeRepr : public TypeRepr {
 public:
  static auto Create(const std::string& name) {
    auto p = new NamedTypeRepr(name);
    return std::unique_ptr<NamedTypeRepr>(p);
  }

 protected:
  explicit NamedTypeRepr(const std::string& name) :
      TypeRepr(Kind::kNamed),
      name_(name) {}

 public:
  const std::string& name() const { return name_; }

 private:
  std::string name_;
};


// fun(A, B) -> C
class FunctionTypeRepr : public TypeRepr {
 public:
  static auto Create(Vector<TypeReprPtr>&& params, TypeReprPtr&& result) {
    auto p = new FunctionTypeRepr(std::move(params), std::move(result));
    return std::unique_ptr<FunctionTypeRepr>(p);
  }

 protected:
  FunctionTypeRepr(Vector<TypeReprPtr>&& params, TypeReprPtr&& result) :
      TypeRepr(Kind::kFunction),
      params_(std::move(params)),
      result_(std::move(result)) {}

 public:
  const Vector<TypeReprPtr>& params() const { return params_; }
  TypeRepr* result() const { return result_.get(); }

 private:
  Vector<TypeReprPtr> params_;
  TypeReprPtr result_;
};


struct RecordFieldRepr {
  std::string label;
  TypeReprPtr type;
};


// { a: A, b: B | R }
class RecordTypeRepr : public TypeRepr {
 public:
  static auto Create(Vector<RecordFieldRepr>&& fields, TypeReprPtr&& extension) {
    auto p = new RecordTypeRepr(std::move(fields), std::move(extension));
    return std::unique_ptr<RecordTypeRepr>(p);
  }

 protected:
  RecordTypeRepr(Vector<RecordFieldRepr>&& fields, TypeReprPtr&& extension) :
      TypeRepr(Kind::kRecord),
      fields_(std::move(fields)),
      extension_(std::move(extension)) {}

 public:
  const Vector<RecordFieldRepr>& fields() const { return fields_; }

  // nullptr for a closed record
  TypeRepr* extension() const { return extension_.get(); }

 private:
  Vector<RecordFieldRepr> fields_;
  TypeReprPtr extension_;
};


// <A, B: σ, C = σ> body
struct TypeParameterRepr {
  std::string name;
  Flexibility flexibility;
  TypeReprPtr bound;  // nullptr for ⊥
  SourceRange position;
};


class GenericTypeRepr : public TypeRepr {
 public:
  static auto Create(Vector<TypeParameterRepr>&& params, TypeReprPtr&& body) {
    auto p = new GenericTypeRepr(std::move(params), std::move(body));
    return std::unique_ptr<GenericTypeRepr>(p);
  }

 protected:
  GenericTypeRepr(Vector<TypeParameterRepr>&& params, TypeReprPtr&& body) :
      TypeRepr(Kind::kGeneric),
      params_(std::move(params)),
      body_(std::move(body)) {}

 public:
  const Vector<TypeParameterRepr>& params() const { return params_; }
  TypeRepr* body() const { return body_.get(); }

 private:
  Vector<TypeParameterRepr> params_;
  TypeReprPtr body_;
};


inline bool Function::is_fully_annotated() const {
  if (return_type_ == nullptr) {
    return false;
  }
  for (auto& param : params_) {
    if (param->annotation() == nullptr) {
      return false;
    }
  }
  return true;
}


inline Expression* Block::value() const {
  if (statements_.empty() || statements_.back()->kind() != Statement::Kind::kExpression) {
    return nullptr;
  }
  return statements_.back()->As<ExpressionStatement>()->expr();
}


}  // namespace brite

#endif  // BRITE_CHECKER_AST_H_
