#ifndef BRITE_UTIL_VECTOR_H_
#define BRITE_UTIL_VECTOR_H_

#include <initializer_list>
#include <utility>
#include <vector>

namespace brite {


// std::vector that refuses implicit copies; use clone() when a copy is meant
// clang-format off
template <typename T>
class Vector {
 public:
  using base = std::vector<T>;
  using size_type = base::size_type;
  using reference = base::reference;
  using const_reference = base::const_reference;

 public:
  Vector() noexcept = default;
  ~Vector() = default;

  Vector(const Vector&) = delete;
  Vector& operator=(const Vector&) = delete;

  Vector(Vector&&) noexcept = default;
  Vector& operator=(Vector&&) noexcept = default;

  Vector(std::initializer_list<T> init) : impl_(init) {}

  bool empty() const noexcept { return impl_.empty(); }
  size_type size() const noexcept { return impl_.size(); }
  reference operator[](size_type n) { return impl_[n]; }
  const_reference operator[](size_type n) const { return impl_[n]; }

  reference front() { return impl_.front(); }
  const_reference front() const { return impl_.front(); }
  reference back() { return impl_.back(); }
  const_reference back() const { return impl_.back(); }

  void push_back(const T& x) { impl_.push_back(x); }
  void push_back(T&& x) { impl_.push_back(std::move(x)); }
  template <class... Args>
  reference emplace_back(Args&&... args) { return impl_.emplace_back(std::forward<Args>(args)...); }
  void pop_back() { impl_.pop_back(); }

  void reserve(size_type n) { impl_.reserve(n); }
  void clear() noexcept { impl_.clear(); }

  auto begin() noexcept { return impl_.begin(); }
  auto begin() const noexcept { return impl_.begin(); }

  auto end() noexcept { return impl_.end(); }
  auto end() const noexcept { return impl_.end(); }

  Vector clone() const { return Vector(impl_); }

 private:
  base impl_;

  explicit Vector(const base& impl) : impl_(impl) {}
};
// clang-format on


}  // namespace brite

#endif  // BRITE_UTIL_VECTOR_H_
