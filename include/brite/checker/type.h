#ifndef BRITE_CHECKER_TYPE_H_
#define BRITE_CHECKER_TYPE_H_

#include <memory>
#include <string>
#include <utility>

#include "brite/checker/location.h"
#include "brite/util/contract.h"
#include "brite/util/downcastable.h"
#include "brite/util/set.h"
#include "brite/util/vector.h"

namespace brite {

class Diagnostic;

class Monotype;
class ErrorType;
class TypeVariable;
class PrimitiveType;
class FunctionType;
class EmptyRowType;
class RowExtensionType;

class Polytype;
class MonomorphicPolytype;
class BottomPolytype;
class QuantifiedPolytype;

using MonotypePtr = std::unique_ptr<Monotype>;
using PolytypePtr = std::unique_ptr<Polytype>;


enum class Flexibility {
  kFlexible,
  kRigid,
};


struct Bound {
  Flexibility flexibility;
  Polytype* type;

  bool is_flexible() const { return flexibility == Flexibility::kFlexible; }
  bool is_rigid() const { return flexibility == Flexibility::kRigid; }
};


struct NamedBound {
  std::string name;
  Bound bound;
};


struct RowEntry {
  std::string label;
  Monotype* type;
};


class Monotype : public Downcastable {
 public:
  enum class Kind {
    kError,
    kVariable,
    kNever,
    kVoid,
    kBoolean,
    kNumber,
    kInteger,
    kFloat,
    kFunction,
    kEmptyRow,
    kRowExtension,
  };

 protected:
  explicit Monotype(Kind kind, const SourceRange& position) :
      kind_(kind),
      position_(position) {}

 public:
  virtual ~Monotype() = default;

  Monotype(const Monotype&) = delete;
  Monotype& operator=(const Monotype&) = delete;

  Kind kind() const { return kind_; }

  // where the type was written or inferred, if anywhere
  const SourceRange& position() const { return position_; }

  bool is_primitive() const { return kind_ >= Kind::kNever && kind_ <= Kind::kFloat; }
  bool is_row() const { return kind_ == Kind::kEmptyRow || kind_ == Kind::kRowExtension; }

 private:
  Kind kind_;
  SourceRange position_;
};


class ErrorType : public Monotype {
 public:
  ErrorType(Diagnostic* diagnostic, const SourceRange& position) :
      Monotype(Kind::kError, position),
      diagnostic_(diagnostic) {}

  Diagnostic* diagnostic() const { return diagnostic_; }

 private:
  Diagnostic* diagnostic_;
};


class TypeVariable : public Monotype {
 public:
  TypeVariable(const std::string& name, const SourceRange& position) :
      Monotype(Kind::kVariable, position),
      name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};


class PrimitiveType : public Monotype {
 public:
  PrimitiveType(Kind kind, const SourceRange& position) :
      Monotype(kind, position) {
    brite_contract(is_primitive());
  }
};


class FunctionType : public Monotype {
 public:
  FunctionType(Monotype* parameter, Monotype* body, const SourceRange& position) :
      Monotype(Kind::kFunction, position),
      parameter_(parameter),
      body_(body) {}

  Monotype* parameter() const { return parameter_; }
  Monotype* body() const { return body_; }

 private:
  Monotype* parameter_;
  Monotype* body_;
};


class EmptyRowType : public Monotype {
 public:
  explicit EmptyRowType(const SourceRange& position) :
      Monotype(Kind::kEmptyRow, position) {}
};


class RowExtensionType : public Monotype {
 public:
  RowExtensionType(Vector<RowEntry>&& entries, Monotype* extension, const SourceRange& position) :
      Monotype(Kind::kRowExtension, position),
      entries_(std::move(entries)),
      extension_(extension) {
    brite_contract(!entries_.empty());
  }

  const Vector<RowEntry>& entries() const { return entries_; }

  // nullptr for a closed row
  Monotype* extension() const { return extension_; }

 private:
  Vector<RowEntry> entries_;
  Monotype* extension_;
};


class Polytype : public Downcastable {
 public:
  enum class Kind {
    kMonotype,
    kBottom,
    kQuantify,
  };

 protected:
  explicit Polytype(Kind kind, const SourceRange& position) :
      kind_(kind),
      position_(position) {}

 public:
  virtual ~Polytype() = default;

  Polytype(const Polytype&) = delete;
  Polytype& operator=(const Polytype&) = delete;

  Kind kind() const { return kind_; }
  const SourceRange& position() const { return position_; }

 private:
  Kind kind_;
  SourceRange position_;
};


class MonomorphicPolytype : public Polytype {
 public:
  explicit MonomorphicPolytype(Monotype* type) :
      Polytype(Kind::kMonotype, type->position()),
      type_(type) {}

  Monotype* type() const { return type_; }

 private:
  Monotype* type_;
};


class BottomPolytype : public Polytype {
 public:
  explicit BottomPolytype(const SourceRange& position) :
      Polytype(Kind::kBottom, position) {}
};


class QuantifiedPolytype : public Polytype {
 public:
  QuantifiedPolytype(Vector<NamedBound>&& bounds, Monotype* body, const SourceRange& position) :
      Polytype(Kind::kQuantify, position),
      bounds_(std::move(bounds)),
      body_(body) {
    brite_contract(!bounds_.empty());
  }

  // sequentially scoped: a bound sees the names before it
  const Vector<NamedBound>& bounds() const { return bounds_; }
  Monotype* body() const { return body_; }

 private:
  Vector<NamedBound> bounds_;
  Monotype* body_;
};


class TypeArena {
 public:
  TypeArena() :
      monotypes_(),
      polytypes_() {}
  ~TypeArena() = default;

  TypeArena(const TypeArena&) = delete;
  TypeArena& operator=(const TypeArena&) = delete;

  void adopt_type(MonotypePtr&& type) { monotypes_.push_back(std::move(type)); }
  void adopt_type(PolytypePtr&& type) { polytypes_.push_back(std::move(type)); }

  ErrorType* NewError(Diagnostic* diagnostic, const SourceRange& position = SourceRange());
  TypeVariable* NewVariable(const std::string& name, const SourceRange& position = SourceRange());
  PrimitiveType* NewPrimitive(Monotype::Kind kind, const SourceRange& position = SourceRange());
  FunctionType* NewFunction(Monotype* parameter, Monotype* body, const SourceRange& position = SourceRange());
  EmptyRowType* NewEmptyRow(const SourceRange& position = SourceRange());
  RowExtensionType* NewRowExtension(Vector<RowEntry>&& entries, Monotype* extension,
                                    const SourceRange& position = SourceRange());

  MonomorphicPolytype* NewMonomorphic(Monotype* type);
  BottomPolytype* NewBottom(const SourceRange& position = SourceRange());
  QuantifiedPolytype* NewQuantified(Vector<NamedBound>&& bounds, Monotype* body,
                                    const SourceRange& position = SourceRange());

 private:
  Vector<MonotypePtr> monotypes_;
  Vector<PolytypePtr> polytypes_;
};


// the printed name of a primitive, e.g. "Int"
const char* PrimitiveName(Monotype::Kind kind);

// actual <: expected for two primitive kinds
bool IsPrimitiveSubtype(Monotype::Kind actual, Monotype::Kind expected);

void CollectFreeVariables(const Monotype* type, Set<std::string>* out);
void CollectFreeVariables(const Polytype* type, Set<std::string>* out);


class TypePrinter {
 public:
  TypePrinter() = default;
  ~TypePrinter() = default;

  std::string operator()(const Monotype* type) const { return Print(type, false); }
  std::string operator()(const Polytype* type) const { return Print(type); }

  // a prefix snapshot, "(∅)" when empty
  std::string operator()(const Vector<NamedBound>& bounds) const;

 protected:
  std::string Print(const Monotype* type, bool paren) const;
  std::string Print(const FunctionType* type, bool paren) const;
  std::string Print(const RowExtensionType* type) const;
  std::string Print(const Polytype* type) const;
  std::string Print(const QuantifiedPolytype* type) const;
  std::string Print(const NamedBound& bound) const;
};


// prints types the way they are written in source, e.g. "fun<A>(A) -> A" or "{a: Int | R}"
class SourceTypePrinter {
 public:
  SourceTypePrinter() = default;
  ~SourceTypePrinter() = default;

  std::string operator()(const Monotype* type) const { return Print(type); }
  std::string operator()(const Polytype* type) const { return Print(type); }

 protected:
  std::string Print(const Monotype* type) const;
  std::string Print(const FunctionType* type, const std::string& quantifiers) const;
  std::string Print(const RowExtensionType* type) const;
  std::string Print(const Polytype* type) const;
  std::string Print(const NamedBound& bound) const;
};


}  // namespace brite

#endif  // BRITE_CHECKER_TYPE_H_
