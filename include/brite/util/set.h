#ifndef BRITE_UTIL_SET_H_
#define BRITE_UTIL_SET_H_

#include <functional>
#include <initializer_list>
#include <unordered_set>
#include <utility>

namespace brite {


// clang-format off
template <class Key, class Hash = std::hash<Key>, class Pred = std::equal_to<Key>>
class Set {
 public:
  using base = std::unordered_set<Key, Hash, Pred>;
  using key_type = base::key_type;
  using value_type = base::value_type;
  using size_type = base::size_type;

  Set() = default;
  ~Set() = default;

  Set(const Set&) = delete;
  Set& operator=(const Set&) = delete;

  Set(Set&&) = default;
  Set& operator=(Set&&) = default;

  Set(std::initializer_list<value_type> init) : impl_(init) {}

  bool empty() const noexcept { return impl_.empty(); }
  size_type size() const noexcept { return impl_.size(); }
  bool contains(const Key& x) const { return impl_.contains(x); }

  template <class... Args>
  auto emplace(Args&&... args) { return impl_.emplace(std::forward<Args>(args)...); }

  auto erase(const Key& x) { return impl_.erase(x); }
  void clear() noexcept { impl_.clear(); }

  auto begin() noexcept { return impl_.begin(); }
  auto begin() const noexcept { return impl_.begin(); }

  auto end() noexcept { return impl_.end(); }
  auto end() const noexcept { return impl_.end(); }

 private:
  base impl_;
};
// clang-format on


}  // namespace brite

#endif  // BRITE_UTIL_SET_H_
