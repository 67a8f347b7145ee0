#ifndef BRITE_UTIL_DOWNCASTABLE_H_
#define BRITE_UTIL_DOWNCASTABLE_H_

#include "brite/util/contract.h"

namespace brite {


// base for tagged class hierarchies; As<T>() is only valid once the tag was checked
class Downcastable {
 public:
  virtual ~Downcastable() = default;

  template <typename T>
  T* As() {
    auto t = dynamic_cast<T*>(this);
    brite_contract(t != nullptr);
    return t;
  }

  template <typename T>
  const T* As() const {
    auto t = dynamic_cast<const T*>(this);
    brite_contract(t != nullptr);
    return t;
  }
};


}  // namespace brite

#endif  // BRITE_UTIL_DOWNCASTABLE_H_
