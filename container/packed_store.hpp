#ifndef TESSEL_CONTAINER_PACKED_STORE_HPP
#define TESSEL_CONTAINER_PACKED_STORE_HPP

#include "core/compiler_macros.hpp"
#include "core/data_type_enum.hpp"
#include "core/error_collector.hpp"
#include "core/matrix_error.hpp"
#include "memory/aligned_allocator.hpp"
#include <algorithm>
#include <concepts>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace tessel {

namespace concepts {

template <typename T>
concept MatrixPolicy = requires {
  typename T::value_type;
  typename T::allocator_type;
  requires std::is_same_v<decltype(T::report_errors), const bool>;
  requires std::is_same_v<decltype(T::policy_id), const DataTypeEnum::Enum>;
  requires std::equality_comparable<typename T::value_type>;
  requires std::is_same_v<typename T::allocator_type::value_type,
                          typename T::value_type>;
};

// Needed by sum, trace, identity and the linear-algebra operators.
template <typename T>
concept ArithmeticValue =
    std::totally_ordered<T> && requires(T a, T b, std::size_t n) {
      { a + b } -> std::convertible_to<T>;
      { a * b } -> std::convertible_to<T>;
      static_cast<T>(n);
    };

} // namespace concepts

// Standard policy definitions, all backed by the cache-line aligned allocator
struct Int32DefaultPolicy {
  using value_type = std::int32_t;
  using allocator_type =
      memory::aligned_allocator<value_type, TESSEL_CACHE_LINE_SIZE>;
  static constexpr bool report_errors = true;
  static constexpr DataTypeEnum::Enum policy_id = DataTypeEnum::Int32Default;
};

struct Int64DefaultPolicy {
  using value_type = std::int64_t;
  using allocator_type =
      memory::aligned_allocator<value_type, TESSEL_CACHE_LINE_SIZE>;
  static constexpr bool report_errors = true;
  static constexpr DataTypeEnum::Enum policy_id = DataTypeEnum::Int64Default;
};

struct Float32DefaultPolicy {
  using value_type = float;
  using allocator_type =
      memory::aligned_allocator<value_type, TESSEL_CACHE_LINE_SIZE>;
  static constexpr bool report_errors = true;
  static constexpr DataTypeEnum::Enum policy_id = DataTypeEnum::Float32Default;
};

struct Float64DefaultPolicy {
  using value_type = double;
  using allocator_type =
      memory::aligned_allocator<value_type, TESSEL_CACHE_LINE_SIZE>;
  static constexpr bool report_errors = true;
  static constexpr DataTypeEnum::Enum policy_id = DataTypeEnum::Float64Default;
};

// Fixed-length cell array with a single default value.
//
// high_water_ is one past the highest index ever explicitly written. Every
// cell at or beyond it holds the default, which is what lets the sparse
// traversals stop early. A reset restores the default in place but never
// lowers the mark, so the mark is a safe upper bound rather than an exact
// count of non-default cells.
template <concepts::MatrixPolicy Policy> class packed_store {
public:
  using value_type = typename Policy::value_type;
  using allocator_type = typename Policy::allocator_type;

private:
  std::vector<value_type, allocator_type> cells_;
  value_type default_;
  std::size_t high_water_;

  void check_index(std::size_t index, std::string_view operation) const {
    if (index >= cells_.size()) [[unlikely]] {
      auto error =
          core::make_error(core::ErrorCode::IndexOutOfRange, "packed_store",
                           operation, "Index exceeds store length");
      error.add_context(index);
      error.add_context(cells_.size());
      core::raise(std::move(error), Policy::report_errors);
    }
  }

public:
  explicit packed_store(std::size_t length,
                        const value_type& default_value = value_type{},
                        const allocator_type& alloc = allocator_type())
      : cells_(length, default_value, alloc), default_(default_value),
        high_water_(0) {}

  // Copies the first min(values.size(), new_length) values and
  // default-fills the rest. The mark covers every copied value.
  static packed_store resize_from(std::span<const value_type> values,
                                  std::size_t new_length,
                                  const value_type& default_value =
                                      value_type{}) {
    packed_store store(new_length, default_value);
    std::size_t const copied = std::min(values.size(), new_length);
    std::copy_n(values.begin(), copied, store.cells_.begin());
    store.high_water_ = copied;
    return store;
  }

  std::size_t size() const noexcept { return cells_.size(); }
  const value_type& default_value() const noexcept { return default_; }
  std::size_t sparse_extent() const noexcept { return high_water_; }

  const value_type& get(std::size_t index) const {
    check_index(index, "get");
    return cells_[index];
  }

  // Precondition: index < size()
  const value_type& get_unchecked(std::size_t index) const noexcept {
    TESSEL_DEBUG_ASSERT(index < cells_.size());
    return cells_[index];
  }

  packed_store& set(std::size_t index, const value_type& value) {
    check_index(index, "set");
    set_unchecked(index, value);
    return *this;
  }

  // Precondition: index < size()
  void set_unchecked(std::size_t index, const value_type& value) noexcept {
    TESSEL_DEBUG_ASSERT(index < cells_.size());
    cells_[index] = value;
    high_water_ = std::max(high_water_, index + 1);
  }

  packed_store& reset(std::size_t index) {
    check_index(index, "reset");
    cells_[index] = default_;
    return *this;
  }

  // Rewrites cells [0, end) with fn(index, old_value). The mark is left
  // alone; callers that may have produced non-defaults beyond it must
  // follow up with mark_dense().
  template <typename Fn> void transform_prefix(std::size_t end, Fn&& fn) {
    TESSEL_DEBUG_ASSERT(end <= cells_.size());
    for (std::size_t i = 0; i < end; ++i) {
      cells_[i] = fn(i, static_cast<const value_type&>(cells_[i]));
    }
  }

  void mark_dense() noexcept { high_water_ = cells_.size(); }

  std::span<const value_type> cells() const noexcept {
    return {cells_.data(), cells_.size()};
  }
};

} // namespace tessel

#endif // TESSEL_CONTAINER_PACKED_STORE_HPP
