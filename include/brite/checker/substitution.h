#ifndef BRITE_CHECKER_SUBSTITUTION_H_
#define BRITE_CHECKER_SUBSTITUTION_H_

#include <string>

#include "brite/checker/type.h"
#include "brite/util/map.h"

namespace brite {


// maps type variable names to monotypes; lookups fall back to the parent
class Substitution {
 public:
  explicit Substitution(const Substitution* parent = nullptr) :
      parent_(parent),
      entries_() {}
  ~Substitution() = default;

  Substitution(const Substitution&) = delete;
  Substitution& operator=(const Substitution&) = delete;

  // a later insert of the same name replaces the earlier one
  void Insert(const std::string& name, Monotype* type) { entries_.insert_or_assign(name, type); }

  // a binder of the same name shadows anything the parent maps
  void Hide(const std::string& name) { entries_.insert_or_assign(name, nullptr); }

  Monotype* Apply(Monotype* type, TypeArena* arena) const;
  Polytype* Apply(Polytype* type, TypeArena* arena) const;

  // would binding `name` capture a free variable of some substituted type?
  bool Captures(const std::string& name) const;

 private:
  // false when not mapped, true with nullptr when hidden
  bool Find(const std::string& name, Monotype** out) const;

  const Substitution* parent_;
  Map<std::string, Monotype*> entries_;
};

// inline monomorphic bounds, drop unused bounds, collapse ∀(.., a ≥ σ).a into σ
Polytype* Normalize(Polytype* type, TypeArena* arena);

// structural equality up to consistent renaming of bound variables
bool EqualUpToRenaming(const Polytype* type1, const Polytype* type2);

// equality of normal forms
bool Equivalent(Polytype* type1, Polytype* type2, TypeArena* arena);


}  // namespace brite

#endif  // BRITE_CHECKER_SUBSTITUTION_H_
