#ifndef BRITE_CHECKER_PREFIX_H_
#define BRITE_CHECKER_PREFIX_H_

#include <string>
#include <utility>

#include "brite/checker/diagnostic.h"
#include "brite/checker/type.h"
#include "brite/util/contract.h"
#include "brite/util/finally.h"
#include "brite/util/map.h"
#include "brite/util/vector.h"

namespace brite {


// the level-scoped binding environment of type variables
//
// entries are kept in dependency order: a bound only refers to entries before it.
// an entry's level never exceeds the level of an entry it is referenced from.
class Prefix {
 public:
  Prefix(TypeArena* arena, DiagnosticReporter* reporter) :
      arena_(arena),
      reporter_(reporter),
      entries_(),
      index_(),
      level_(0),
      counter_(0) {}

  ~Prefix() = default;

  Prefix(const Prefix&) = delete;
  Prefix& operator=(const Prefix&) = delete;

  int level() const { return level_; }

  // runs f one level deeper; entries of the deeper level are dropped on the way out
  template <typename F>
  auto Level(F&& f) {
    auto saved_level = level_;
    Finally restore([&]() {
      level_ = saved_level;
      Prune();
    });

    level_ += 1;
    return f();
  }

  TypeVariable* Fresh(const SourceRange& position = SourceRange());
  TypeVariable* FreshWithBound(const Bound& bound, const SourceRange& position = SourceRange());

  // nullptr when the name is taken
  TypeVariable* Add(const std::string& name, const Bound& bound, const SourceRange& position = SourceRange());

  Bound Lookup(const std::string& name) const {
    auto it = index_.find(name);
    brite_contract(it != index_.end());
    return entries_[it->second].bound;
  }

  const Bound* Find(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() ? &entries_[it->second].bound : nullptr;
  }

  Monotype* Instantiate(const Vector<NamedBound>& bounds, Monotype* body);
  Monotype* Instantiate(Polytype* type);

  // quantifies the entries of the current level reachable from type
  Polytype* Generalize(Monotype* type);

  // both return the reported diagnostic, or nullptr when the prefix was updated
  Diagnostic* Update(const std::string& name, const Bound& bound);
  Diagnostic* Update2(const std::string& name1, const std::string& name2, const Bound& bound);

  Vector<NamedBound> bounds() const;

 private:
  struct Entry {
    std::string name;
    Bound bound;
    int level;
  };

  std::string NewName();
  TypeVariable* Insert(const std::string& name, const Bound& bound, const SourceRange& position);

  // does type refer to name, directly or through the bounds of the entries it refers to?
  bool Occurs(const std::string& name, const Polytype* type) const;

  // a rigid entry only accepts an equivalent bound
  Diagnostic* CheckRigid(const Entry& entry, const Bound& bound);

  void Commit(size_t index, const Bound& bound, int level);
  void Reorder(size_t index);
  void Prune();
  void Reindex();

  TypeArena* arena_;
  DiagnosticReporter* reporter_;
  Vector<Entry> entries_;
  Map<std::string, size_t> index_;
  int level_;
  int counter_;
};


}  // namespace brite

#endif  // BRITE_CHECKER_PREFIX_H_
