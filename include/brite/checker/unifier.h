#ifndef BRITE_CHECKER_UNIFIER_H_
#define BRITE_CHECKER_UNIFIER_H_

#include "brite/checker/diagnostic.h"
#include "brite/checker/prefix.h"
#include "brite/checker/type.h"
#include "brite/util/vector.h"

namespace brite {


// checks that an actual type may be used where an expected type is required,
// strengthening the prefix as it goes
//
// every method returns the first diagnostic it reported, or nullptr on success
class Unifier {
 public:
  Unifier(Prefix* prefix, TypeArena* arena, DiagnosticReporter* reporter) :
      prefix_(prefix),
      arena_(arena),
      reporter_(reporter) {}

  ~Unifier() = default;

  Unifier(const Unifier&) = delete;
  Unifier& operator=(const Unifier&) = delete;

  Diagnostic* Unify(Monotype* actual, Monotype* expected);

  // out receives the polytype both sides agree on
  Diagnostic* UnifyPolytypes(Polytype* actual, Polytype* expected, Polytype** out);

 protected:
  // follows variables bound to monotypes; nullptr after reporting an unbound variable
  Monotype* Resolve(Monotype* type, Diagnostic** diagnostic);

  Diagnostic* UnifyVariables(TypeVariable* actual, TypeVariable* expected);
  Diagnostic* UnifyVariable(TypeVariable* variable, Monotype* type, bool variable_is_actual);
  Diagnostic* UnifyRows(Monotype* actual, Monotype* expected);

  // entries with the left-most occurrence of each label, and the tail after them
  bool FlattenRow(Monotype* row, Vector<RowEntry>* entries, Monotype** tail, Diagnostic** diagnostic);

  Diagnostic* ReportIncompatible(Monotype* actual, Monotype* expected);

  // how a rigid bound is shown in a diagnostic
  Polytype* DescribeBound(const std::string& name, const Bound& bound);

 private:
  Prefix* prefix_;
  TypeArena* arena_;
  DiagnosticReporter* reporter_;
};


}  // namespace brite

#endif  // BRITE_CHECKER_UNIFIER_H_
