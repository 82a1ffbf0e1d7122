#ifndef TESSEL_CONTAINER_TRAVERSAL_HPP
#define TESSEL_CONTAINER_TRAVERSAL_HPP

#include "container/matrix.hpp"
#include <cstdint>
#include <utility>

namespace tessel {

// Folds visit (index, value, acc) and return the next accumulator.
//
// The sparse variants only visit indices below sparse_extent(); every cell
// beyond it is known to hold the default. Cells below the extent are
// visited even when they equal the default.

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc fold_left(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  auto const& store = m.store();
  for (std::size_t i = 0, n = store.size(); i < n; ++i) {
    acc = fn(i, store.get_unchecked(i), std::move(acc));
  }
  return acc;
}

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc fold_right(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  auto const& store = m.store();
  for (std::size_t i = store.size(); i-- > 0;) {
    acc = fn(i, store.get_unchecked(i), std::move(acc));
  }
  return acc;
}

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc sparse_fold_left(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  auto const& store = m.store();
  for (std::size_t i = 0, n = store.sparse_extent(); i < n; ++i) {
    acc = fn(i, store.get_unchecked(i), std::move(acc));
  }
  return acc;
}

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc sparse_fold_right(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  auto const& store = m.store();
  for (std::size_t i = store.sparse_extent(); i-- > 0;) {
    acc = fn(i, store.get_unchecked(i), std::move(acc));
  }
  return acc;
}

// Early-exit folds. The step function returns continue_with(acc) to keep
// going or stop_with(acc) to end the traversal at the current index.

enum class step_kind : std::uint8_t { next, stop };

template <typename Acc> struct fold_step {
  step_kind kind;
  Acc acc;
};

template <typename Acc> fold_step<Acc> continue_with(Acc acc) {
  return {step_kind::next, std::move(acc)};
}

template <typename Acc> fold_step<Acc> stop_with(Acc acc) {
  return {step_kind::stop, std::move(acc)};
}

namespace detail {

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc fold_prefix_until(const matrix<Policy>& m, std::size_t end, Fn&& fn,
                      Acc acc) {
  auto const& store = m.store();
  for (std::size_t i = 0; i < end; ++i) {
    fold_step<Acc> step = fn(i, store.get_unchecked(i), std::move(acc));
    acc = std::move(step.acc);
    if (step.kind == step_kind::stop) {
      break;
    }
  }
  return acc;
}

} // namespace detail

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc fold_left_until(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  return detail::fold_prefix_until(m, m.size(), std::forward<Fn>(fn),
                                   std::move(acc));
}

template <concepts::MatrixPolicy Policy, typename Acc, typename Fn>
Acc sparse_fold_left_until(const matrix<Policy>& m, Fn&& fn, Acc acc) {
  return detail::fold_prefix_until(m, m.sparse_extent(), std::forward<Fn>(fn),
                                   std::move(acc));
}

// Dense map: every cell becomes fn(index, value).
template <concepts::MatrixPolicy Policy, typename Fn>
matrix<Policy> map(const matrix<Policy>& m, Fn&& fn) {
  return matrix<Policy>(m).transform(std::forward<Fn>(fn));
}

// Sparse map: only cells below the extent are rewritten; trailing default
// cells and the extent are left as they are.
template <concepts::MatrixPolicy Policy, typename Fn>
matrix<Policy> sparse_map(const matrix<Policy>& m, Fn&& fn) {
  return matrix<Policy>(m).transform_sparse(std::forward<Fn>(fn));
}

} // namespace tessel

#endif // TESSEL_CONTAINER_TRAVERSAL_HPP
