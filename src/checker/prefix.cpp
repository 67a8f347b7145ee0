#include "brite/checker/prefix.h"

#include <algorithm>

#include "brite/checker/substitution.h"
#include "brite/util/set.h"

namespace brite {


std::string Prefix::NewName() {
  for (;;) {
    counter_ += 1;
    auto name = "t" + std::to_string(counter_);
    if (!index_.contains(name)) {
      return name;
    }
  }
}


TypeVariable* Prefix::Insert(const std::string& name, const Bound& bound, const SourceRange& position) {
  index_.insert_or_assign(name, entries_.size());
  entries_.push_back({name, bound, level_});
  return arena_->NewVariable(name, position);
}


TypeVariable* Prefix::Fresh(const SourceRange& position) {
  return FreshWithBound({Flexibility::kFlexible, arena_->NewBottom()}, position);
}


TypeVariable* Prefix::FreshWithBound(const Bound& bound, const SourceRange& position) {
  return Insert(NewName(), bound, position);
}


TypeVariable* Prefix::Add(const std::string& name, const Bound& bound, const SourceRange& position) {
  if (index_.contains(name)) {
    return nullptr;
  }
  return Insert(name, bound, position);
}


Monotype* Prefix::Instantiate(const Vector<NamedBound>& bounds, Monotype* body) {
  Substitution subst;

  for (auto& entry : bounds) {
    auto bound_type = subst.Apply(entry.bound.type, arena_);
    auto fresh = FreshWithBound({entry.bound.flexibility, bound_type});
    subst.Insert(entry.name, fresh);
  }

  return subst.Apply(body, arena_);
}


Monotype* Prefix::Instantiate(Polytype* type) {
  switch (type->kind()) {
    case Polytype::Kind::kMonotype:
      return type->As<MonomorphicPolytype>()->type();

    case Polytype::Kind::kBottom:
      return Fresh(type->position());

    case Polytype::Kind::kQuantify: {
      auto quantified = type->As<QuantifiedPolytype>();
      return Instantiate(quantified->bounds(), quantified->body());
    }
  }

  brite_unreachable();
}


Polytype* Prefix::Generalize(Monotype* type) {
  brite_contract(level_ > 0);

  Set<std::string> reachable;
  Vector<std::string> worklist;

  Set<std::string> names;
  CollectFreeVariables(type, &names);
  for (auto& name : names) {
    worklist.push_back(name);
  }

  while (!worklist.empty()) {
    auto name = worklist.back();
    worklist.pop_back();

    auto it = index_.find(name);
    if (it == index_.end() || reachable.contains(name)) {
      continue;
    }
    auto& entry = entries_[it->second];
    if (entry.level != level_) {
      continue;
    }

    reachable.emplace(name);
    Set<std::string> bound_names;
    CollectFreeVariables(entry.bound.type, &bound_names);
    for (auto& bound_name : bound_names) {
      worklist.push_back(bound_name);
    }
  }

  Vector<NamedBound> bounds;
  for (auto& entry : entries_) {
    if (reachable.contains(entry.name)) {
      bounds.push_back({entry.name, entry.bound});
    }
  }

  if (bounds.empty()) {
    return arena_->NewMonomorphic(type);
  }
  return arena_->NewQuantified(std::move(bounds), type, type->position());
}


bool Prefix::Occurs(const std::string& name, const Polytype* type) const {
  Set<std::string> visited;
  Vector<std::string> worklist;

  Set<std::string> names;
  CollectFreeVariables(type, &names);
  for (auto& n : names) {
    worklist.push_back(n);
  }

  while (!worklist.empty()) {
    auto next = worklist.back();
    worklist.pop_back();

    if (next == name) {
      return true;
    }
    if (!visited.emplace(next).second) {
      continue;
    }

    auto it = index_.find(next);
    if (it == index_.end()) {
      continue;
    }
    Set<std::string> bound_names;
    CollectFreeVariables(entries_[it->second].bound.type, &bound_names);
    for (auto& n : bound_names) {
      worklist.push_back(n);
    }
  }

  return false;
}


Diagnostic* Prefix::CheckRigid(const Entry& entry, const Bound& bound) {
  if (entry.bound.is_flexible() || Equivalent(entry.bound.type, bound.type, arena_)) {
    return nullptr;
  }

  Polytype* current = entry.bound.type;
  if (current->kind() == Polytype::Kind::kBottom) {
    current = arena_->NewMonomorphic(arena_->NewVariable(entry.name));
  }
  return reporter_->Report<IncompatibleTypesDiagnostic>(current, bound.type);
}


Diagnostic* Prefix::Update(const std::string& name, const Bound& bound) {
  auto it = index_.find(name);
  brite_contract(it != index_.end());
  auto index = it->second;

  if (Occurs(name, bound.type)) {
    return reporter_->Report<InfiniteTypeDiagnostic>(name, bound.type);
  }
  if (auto diagnostic = CheckRigid(entries_[index], bound)) {
    return diagnostic;
  }

  Commit(index, bound, entries_[index].level);
  return nullptr;
}


Diagnostic* Prefix::Update2(const std::string& name1, const std::string& name2, const Bound& bound) {
  brite_contract(name1 != name2);
  brite_contract(index_.contains(name1) && index_.contains(name2));

  if (Occurs(name1, bound.type)) {
    return reporter_->Report<InfiniteTypeDiagnostic>(name1, bound.type);
  }
  if (Occurs(name2, bound.type)) {
    return reporter_->Report<InfiniteTypeDiagnostic>(name2, bound.type);
  }
  if (auto diagnostic = CheckRigid(entries_[index_.at(name1)], bound)) {
    return diagnostic;
  }
  if (auto diagnostic = CheckRigid(entries_[index_.at(name2)], bound)) {
    return diagnostic;
  }

  auto level = std::min(entries_[index_.at(name1)].level, entries_[index_.at(name2)].level);
  Commit(index_.at(name1), bound, level);

  // commits reorder entries, so look the second name up again
  auto alias = arena_->NewMonomorphic(arena_->NewVariable(name1));
  auto index2 = index_.at(name2);
  Commit(index2, {Flexibility::kRigid, alias}, entries_[index2].level);
  return nullptr;
}


void Prefix::Commit(size_t index, const Bound& bound, int level) {
  entries_[index].bound = bound;
  entries_[index].level = level;

  // whatever the bound refers to must live at least as long as the entry
  Vector<std::string> worklist;
  Set<std::string> names;
  CollectFreeVariables(bound.type, &names);
  for (auto& name : names) {
    worklist.push_back(name);
  }

  while (!worklist.empty()) {
    auto name = worklist.back();
    worklist.pop_back();

    auto it = index_.find(name);
    if (it == index_.end()) {
      continue;
    }
    auto& entry = entries_[it->second];
    if (entry.level <= level) {
      continue;
    }

    entry.level = level;
    Set<std::string> bound_names;
    CollectFreeVariables(entry.bound.type, &bound_names);
    for (auto& bound_name : bound_names) {
      worklist.push_back(bound_name);
    }
  }

  Reorder(index);
}


void Prefix::Reorder(size_t index) {
  Set<std::string> names;
  CollectFreeVariables(entries_[index].bound.type, &names);

  bool out_of_order = false;
  for (auto& name : names) {
    auto it = index_.find(name);
    if (it != index_.end() && it->second > index) {
      out_of_order = true;
      break;
    }
  }
  if (!out_of_order) {
    return;
  }

  // move the entry and everything depending on it to the end, keeping their order
  Set<std::string> moved;
  Vector<Entry> stay;
  Vector<Entry> move;

  for (size_t i = 0; i < entries_.size(); ++i) {
    auto& entry = entries_[i];
    bool depends = (i == index);

    if (!depends && i > index) {
      Set<std::string> bound_names;
      CollectFreeVariables(entry.bound.type, &bound_names);
      for (auto& name : bound_names) {
        if (moved.contains(name)) {
          depends = true;
          break;
        }
      }
    }

    if (depends) {
      moved.emplace(entry.name);
      move.push_back(std::move(entry));
    } else {
      stay.push_back(std::move(entry));
    }
  }

  for (auto& entry : move) {
    stay.push_back(std::move(entry));
  }
  entries_ = std::move(stay);
  Reindex();
}


void Prefix::Prune() {
  auto deeper = std::count_if(entries_.begin(), entries_.end(), [&](auto& entry) { return entry.level > level_; });
  if (deeper == 0) {
    return;
  }

  Vector<Entry> kept;
  for (auto& entry : entries_) {
    if (entry.level <= level_) {
      kept.push_back(std::move(entry));
    }
  }
  entries_ = std::move(kept);
  Reindex();
}


void Prefix::Reindex() {
  index_.clear();
  for (size_t i = 0; i < entries_.size(); ++i) {
    index_.insert_or_assign(entries_[i].name, i);
  }
}


Vector<NamedBound> Prefix::bounds() const {
  Vector<NamedBound> bounds;
  for (auto& entry : entries_) {
    bounds.push_back({entry.name, entry.bound});
  }
  return bounds;
}


}  // namespace brite
