#ifndef BRITE_UTIL_FINALLY_H_
#define BRITE_UTIL_FINALLY_H_

#include <cstddef>
#include <utility>

namespace brite {


// runs the given action when the enclosing scope exits, whichever way it exits
template <typename F>
class Finally {
 public:
  explicit Finally(F&& action) :
      action_(std::forward<F>(action)) {}

  ~Finally() { action_(); }

  Finally(const Finally&) = delete;
  Finally& operator=(const Finally&) = delete;

  Finally(Finally&&) = delete;
  Finally& operator=(Finally&&) = delete;

  void* operator new(size_t) = delete;
  void operator delete(void*) = delete;

 private:
  F action_;
};


}  // namespace brite

#endif  // BRITE_UTIL_FINALLY_H_
