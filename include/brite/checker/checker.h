#ifndef BRITE_CHECKER_CHECKER_H_
#define BRITE_CHECKER_CHECKER_H_

#include <string>
#include <utility>

#include "brite/checker/ast.h"
#include "brite/checker/diagnostic.h"
#include "brite/checker/prefix.h"
#include "brite/checker/type.h"
#include "brite/checker/unifier.h"
#include "brite/util/finally.h"
#include "brite/util/map.h"
#include "brite/util/vector.h"

namespace brite {


class Checker : public DiagnosticReporter {
 public:
  Checker() :
      DiagnosticReporter(),
      arena_(),
      prefix_(&arena_, this),
      unifier_(&prefix_, &arena_, this),
      declaration_states_(),
      scopes_(),
      type_scopes_() {}

  ~Checker() = default;

  Checker(const Checker&) = delete;
  Checker& operator=(const Checker&) = delete;

  TypeArena* arena() { return &arena_; }
  Prefix* prefix() { return &prefix_; }

  void VisitProgram(Program* program);

  // the generalized type of a checked declaration, nullptr for unknown names
  Polytype* DeclarationType(const std::string& name) const;

  // infers a standalone expression and generalizes it
  Polytype* InferExpression(Expression* expr);

 protected:
  struct DeclarationState {
    FunctionDeclaration* decl;
    bool in_progress;
    bool done;
    Polytype* type;

    explicit DeclarationState(FunctionDeclaration* decl) :
        decl(decl),
        in_progress(false),
        done(false),
        type(nullptr) {}
  };

  using Scope = Map<std::string, Polytype*>;
  using TypeScope = Map<std::string, Monotype*>;

  Polytype* CheckDeclaration(DeclarationState* state, const SourceRange& reference);
  Polytype* CheckFunction(Function* func);
  Polytype* AnnotatedFunctionType(Function* func);

  Monotype* VisitBlock(Block* block);
  void VisitStatement(Statement* stmt);
  void VisitLetStatement(LetStatement* stmt);

  Monotype* VisitExpression(Expression* expr);
  Monotype* VisitConstantExpression(ConstantExpression* expr);
  Monotype* VisitReferenceExpression(ReferenceExpression* expr);
  Monotype* VisitCallExpression(CallExpression* expr);
  Monotype* VisitFunctionExpression(FunctionExpression* expr);
  Monotype* VisitConditionalExpression(ConditionalExpression* expr);
  Monotype* VisitRecordExpression(RecordExpression* expr);
  Monotype* VisitFieldAccessExpression(FieldAccessExpression* expr);
  Monotype* VisitAnnotationExpression(AnnotationExpression* expr);
  Monotype* VisitNotExpression(NotExpression* expr);
  Monotype* VisitLogicalExpression(LogicalExpression* expr);

  // reports when type can not be called, and still hands back a function to keep checking with
  FunctionType* ExpectFunction(Monotype* type);

  // the declaration a callee refers to, nullptr when it is not a plain reference to one
  FunctionDeclaration* CalleeDeclaration(Expression* callee) const;

  Monotype* ConvertTypeRepr(TypeRepr* type_repr);
  Monotype* ConvertNamedTypeRepr(NamedTypeRepr* type_repr);
  Monotype* ConvertFunctionTypeRepr(FunctionTypeRepr* type_repr);
  Monotype* ConvertRecordTypeRepr(RecordTypeRepr* type_repr);
  Polytype* ConvertPolytype(TypeRepr* type_repr);

  // a polymorphic annotation becomes a variable with a rigid bound
  Monotype* ConvertAnnotation(TypeRepr* type_repr);

  Monotype* Curry(const Vector<Monotype*>& params, Monotype* result);

  Polytype* LookupLocal(const std::string& name) const;

  template <typename F>
  auto WithScope(F&& f) {
    scopes_.push_back(Scope());
    Finally pop([&]() { scopes_.pop_back(); });
    return f();
  }

  // declarations never see the locals or the operation of the code that referenced them
  template <typename F>
  auto AtTopLevel(F&& f) {
    auto saved_scopes = std::move(scopes_);
    auto saved_type_scopes = std::move(type_scopes_);
    scopes_.clear();
    type_scopes_.clear();
    Finally restore([&]() {
      scopes_ = std::move(saved_scopes);
      type_scopes_ = std::move(saved_type_scopes);
    });

    return WithOperation(Operation(), SourceRange(), std::forward<F>(f));
  }

 private:
  TypeArena arena_;
  Prefix prefix_;
  Unifier unifier_;
  Map<std::string, DeclarationState> declaration_states_;
  Vector<Scope> scopes_;
  Vector<TypeScope> type_scopes_;
};


// short source text for an expression, used in diagnostic messages
std::string ExpressionSnippet(const Expression* expr);


}  // namespace brite

#endif  // BRITE_CHECKER_CHECKER_H_
