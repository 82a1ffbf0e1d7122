#ifndef TESSEL_MEMORY_ALIGNED_ALLOCATOR_HPP
#define TESSEL_MEMORY_ALIGNED_ALLOCATOR_HPP

#include "core/compiler_macros.hpp"
#include "core/error_collector.hpp"
#include <cstddef>
#include <cstdlib>
#include <new>
#include <type_traits>

namespace tessel {
namespace memory {

/// Cache-line aligned allocator backing every packed_store buffer, so that
/// row-major traversal starts on a line boundary.
template <typename T, std::size_t Alignment = TESSEL_CACHE_LINE_SIZE>
class aligned_allocator {
  static_assert((Alignment & (Alignment - 1)) == 0,
                "alignment must be a power of two");
  static_assert(Alignment >= alignof(T),
                "alignment weaker than the element type");

public:
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  static constexpr std::size_t alignment = Alignment;

  constexpr aligned_allocator() noexcept = default;
  constexpr aligned_allocator(const aligned_allocator&) noexcept = default;

  template <typename U>
  constexpr aligned_allocator(const aligned_allocator<U, Alignment>&) noexcept {
  }

  [[nodiscard]] T* allocate(std::size_t n) {
    if (n == 0) {
      return nullptr;
    }

    if (n > std::size_t(-1) / sizeof(T)) [[unlikely]] {
      record_failure(n);
      throw std::bad_array_new_length();
    }

    // posix_memalign wants a size that is a multiple of the alignment
    std::size_t bytes = n * sizeof(T);
    bytes = (bytes + Alignment - 1) & ~(Alignment - 1);

    void* ptr = nullptr;
    if (posix_memalign(&ptr, Alignment, bytes) != 0 || !ptr) [[unlikely]] {
      record_failure(n);
      throw std::bad_alloc();
    }

    return static_cast<T*>(ptr);
  }

  void deallocate(T* ptr, std::size_t) noexcept { std::free(ptr); }

  template <typename U> struct rebind {
    using other = aligned_allocator<U, Alignment>;
  };

private:
  static void record_failure(std::size_t n) {
    auto error =
        core::make_error(core::ErrorCode::AllocationFailure,
                         "aligned_allocator", "allocate",
                         "Unable to allocate an aligned cell buffer");
    error.add_context(n);
    error.add_context(Alignment);
    core::ErrorCollector::instance().report(error);
  }
};

template <typename T1, std::size_t A1, typename T2, std::size_t A2>
constexpr bool operator==(const aligned_allocator<T1, A1>&,
                          const aligned_allocator<T2, A2>&) noexcept {
  return A1 == A2;
}

} // namespace memory
} // namespace tessel

#endif // TESSEL_MEMORY_ALIGNED_ALLOCATOR_HPP
