#ifndef TESSEL_CORE_COMPILER_MACROS_HPP
#define TESSEL_CORE_COMPILER_MACROS_HPP

#include <cstdio>
#include <cstdlib>

namespace tessel {

#ifndef TESSEL_CACHE_LINE_SIZE
#define TESSEL_CACHE_LINE_SIZE 64
#endif // TESSEL_CACHE_LINE_SIZE

#ifndef TESSEL_ASSERT
#define TESSEL_ASSERT(X)                                                       \
  do {                                                                         \
    if (!(X)) {                                                                \
      std::fprintf(stderr, "Assertion failed: %s, file %s, line %d\n", #X,     \
                   __FILE__, __LINE__);                                        \
      std::abort();                                                            \
    }                                                                          \
  } while (0)
#endif // TESSEL_ASSERT

// Only for invariants the library itself guarantees. Caller mistakes are
// raised as core::matrix_error instead.
#ifndef TESSEL_DEBUG_ASSERT
#ifdef NDEBUG
#define TESSEL_DEBUG_ASSERT(X) ((void)0)
#else
#define TESSEL_DEBUG_ASSERT(X) TESSEL_ASSERT(X)
#endif // NDEBUG
#endif // TESSEL_DEBUG_ASSERT

} // namespace tessel

#endif // TESSEL_CORE_COMPILER_MACROS_HPP
