#ifndef BRITE_UTIL_CONTRACT_H_
#define BRITE_UTIL_CONTRACT_H_

#include <cassert>
#include <exception>

namespace brite {


// a broken contract is a bug in the caller, never a user-facing condition
#ifdef NDEBUG
#define BRITE_CONTRACT_FAILED(what) std::terminate()
#else
#define BRITE_CONTRACT_FAILED(what) (assert(false && what), std::terminate())
#endif

#define brite_unreachable() BRITE_CONTRACT_FAILED("unreachable here")

#define brite_contract(condition)            \
  do {                                       \
    if (!(condition)) [[unlikely]] {         \
      BRITE_CONTRACT_FAILED(#condition);     \
    }                                        \
  } while (0)


}  // namespace brite

#endif  // BRITE_UTIL_CONTRACT_H_
