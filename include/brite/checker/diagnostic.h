#ifndef BRITE_CHECKER_DIAGNOSTIC_H_
#define BRITE_CHECKER_DIAGNOSTIC_H_

#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "brite/checker/location.h"
#include "brite/checker/type.h"
#include "brite/util/downcastable.h"
#include "brite/util/finally.h"
#include "brite/util/vector.h"

namespace brite {

class Diagnostic;

using DiagnosticPtr = std::unique_ptr<Diagnostic>;


// what the checker was doing when a diagnostic was reported
struct Operation {
  enum class Kind {
    kNone,
    kAnnotation,
    kBinding,
    kReturn,
    kCall,
    kTest,
    kOperator,
    kFieldAccess,
  };

  Kind kind;

  // source snippet of the subject, e.g. the callee of a call
  std::string subject;

  // the bound value for kBinding
  std::string value;

  Operation() :
      kind(Kind::kNone),
      subject(),
      value() {}

  Operation(Kind kind, const std::string& subject, const std::string& value = "") :
      kind(kind),
      subject(subject),
      value(value) {}
};


enum class TypeKind {
  kValue,
  kRow,
};

const char* TypeKindName(TypeKind kind);


class Diagnostic : public Downcastable {
 public:
  enum class Kind {
    kUnboundVariable,
    kUnboundTypeVariable,
    kIncompatibleTypes,
    kInfiniteType,
    kIncompatibleKinds,
    kInfiniteKind,
    kIncompatibleArgumentCount,
    kDuplicateDeclaration,
    kDeclarationCycle,
  };

 protected:
  explicit Diagnostic(Kind kind, const SourceRange& position) :
      kind_(kind),
      position_(position),
      operation_() {}

 public:
  virtual ~Diagnostic() = default;

  Diagnostic(const Diagnostic&) = delete;
  Diagnostic& operator=(const Diagnostic&) = delete;

  Kind kind() const { return kind_; }

  const SourceRange& position() const { return position_; }
  void set_position(const SourceRange& position) { position_ = position; }

  const Operation& operation() const { return operation_; }
  void set_operation(const Operation& operation) { operation_ = operation; }

  friend std::ostream& operator<<(std::ostream& stream, const Diagnostic& diagnostic);

 private:
  Kind kind_;
  SourceRange position_;
  Operation operation_;
};


class UnboundVariableDiagnostic : public Diagnostic {
 public:
  explicit UnboundVariableDiagnostic(const std::string& name, const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kUnboundVariable, position),
      name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};


class UnboundTypeVariableDiagnostic : public Diagnostic {
 public:
  explicit UnboundTypeVariableDiagnostic(const std::string& name, const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kUnboundTypeVariable, position),
      name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};


// type1 is the actual type, type2 the expected one
class IncompatibleTypesDiagnostic : public Diagnostic {
 public:
  IncompatibleTypesDiagnostic(Polytype* type1, Polytype* type2, const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kIncompatibleTypes, position),
      type1_(type1),
      type2_(type2) {}

  Polytype* type1() const { return type1_; }
  Polytype* type2() const { return type2_; }

 private:
  Polytype* type1_;
  Polytype* type2_;
};


class InfiniteTypeDiagnostic : public Diagnostic {
 public:
  InfiniteTypeDiagnostic(const std::string& name, Polytype* type, const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kInfiniteType, position),
      name_(name),
      type_(type) {}

  const std::string& name() const { return name_; }
  Polytype* type() const { return type_; }

 private:
  std::string name_;
  Polytype* type_;
};


class IncompatibleKindsDiagnostic : public Diagnostic {
 public:
  IncompatibleKindsDiagnostic(TypeKind kind1, TypeKind kind2, const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kIncompatibleKinds, position),
      kind1_(kind1),
      kind2_(kind2) {}

  TypeKind kind1() const { return kind1_; }
  TypeKind kind2() const { return kind2_; }

 private:
  TypeKind kind1_;
  TypeKind kind2_;
};


// reserved: the kind language has no kind variables, so nothing reports this yet
class InfiniteKindDiagnostic : public Diagnostic {
 public:
  explicit InfiniteKindDiagnostic(const SourceRange& position = SourceRange()) :
      Diagnostic(Kind::kInfiniteKind, position) {}
};


// count1 arguments were passed at range1 where the declaration at range2 takes count2
class IncompatibleArgumentCountDiagnostic : public Diagnostic {
 public:
  IncompatibleArgumentCountDiagnostic(size_t count1, const SourceRange& range1, size_t count2,
                                      const SourceRange& range2) :
      Diagnostic(Kind::kIncompatibleArgumentCount, range1),
      count1_(count1),
      range1_(range1),
      count2_(count2),
      range2_(range2) {}

  size_t count1() const { return count1_; }
  const SourceRange& range1() const { return range1_; }
  size_t count2() const { return count2_; }
  const SourceRange& range2() const { return range2_; }

 private:
  size_t count1_;
  SourceRange range1_;
  size_t count2_;
  SourceRange range2_;
};


class DuplicateDeclarationDiagnostic : public Diagnostic {
 public:
  DuplicateDeclarationDiagnostic(const std::string& name, const SourceRange& first, const SourceRange& position) :
      Diagnostic(Kind::kDuplicateDeclaration, position),
      name_(name),
      first_(first) {}

  const std::string& name() const { return name_; }
  const SourceRange& first() const { return first_; }

 private:
  std::string name_;
  SourceRange first_;
};


class DeclarationCycleDiagnostic : public Diagnostic {
 public:
  DeclarationCycleDiagnostic(const std::string& name, const SourceRange& declaration, const SourceRange& position) :
      Diagnostic(Kind::kDeclarationCycle, position),
      name_(name),
      declaration_(declaration) {}

  const std::string& name() const { return name_; }
  const SourceRange& declaration() const { return declaration_; }

 private:
  std::string name_;
  SourceRange declaration_;
};


class DiagnosticReporter {
 public:
  DiagnosticReporter() :
      diagnostics_(),
      operation_(),
      operation_position_() {}
  virtual ~DiagnosticReporter() = default;

  DiagnosticReporter(const DiagnosticReporter&) = delete;
  DiagnosticReporter& operator=(const DiagnosticReporter&) = delete;

  bool has_diagnostics() const { return !diagnostics_.empty(); }
  const Vector<DiagnosticPtr>& diagnostics() const { return diagnostics_; }
  int error_count() const { return static_cast<int>(diagnostics_.size()); }

  const Operation& operation() const { return operation_; }

  // stamps the current operation, and its range when the diagnostic has none
  template <typename T, typename... Args>
  T* Report(Args&&... args) {
    auto diagnostic = new T(std::forward<Args>(args)...);
    diagnostics_.push_back(DiagnosticPtr(diagnostic));

    if (!diagnostic->position().is_known()) {
      diagnostic->set_position(operation_position_);
    }
    diagnostic->set_operation(operation_);
    return diagnostic;
  }

  // the innermost operation wins
  template <typename F>
  auto WithOperation(const Operation& operation, const SourceRange& position, F&& f) {
    auto saved_operation = operation_;
    auto saved_position = operation_position_;
    Finally restore([&]() {
      operation_ = saved_operation;
      operation_position_ = saved_position;
    });

    operation_ = operation;
    operation_position_ = position;
    return f();
  }

 private:
  Vector<DiagnosticPtr> diagnostics_;
  Operation operation_;
  SourceRange operation_position_;
};


// the short core message, e.g. "Int ≢ Bool"
std::string PrintDiagnostic(const Diagnostic* diagnostic);


struct RelatedInformation {
  SourceRange position;
  std::string message;
};


struct ExplainedDiagnostic {
  std::string message;
  Vector<RelatedInformation> related;
};


// renders the message a programmer reads, using the operation the diagnostic was reported under
class DiagnosticPrinter {
 public:
  DiagnosticPrinter() = default;
  ~DiagnosticPrinter() = default;

  ExplainedDiagnostic Explain(const Diagnostic* diagnostic) const;

 protected:
  std::string ExplainOperation(const Operation& operation) const;
  ExplainedDiagnostic ExplainIncompatibleTypes(const IncompatibleTypesDiagnostic* diagnostic) const;
  ExplainedDiagnostic ExplainIncompatibleArgumentCount(const IncompatibleArgumentCountDiagnostic* diagnostic) const;
  std::string TypeSnippet(const Polytype* type, const Polytype* other, bool article) const;
};


}  // namespace brite

#endif  // BRITE_CHECKER_DIAGNOSTIC_H_
