#ifndef TESSEL_CONTAINER_TRANSFORMS_HPP
#define TESSEL_CONTAINER_TRANSFORMS_HPP

#include "container/matrix.hpp"
#include "container/traversal.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace tessel {

enum class axis : std::uint8_t { rows, columns };

namespace detail {

// Builds an out_rows x out_columns matrix pre-filled with the source
// default and moves every cell below the source extent to to(position).
// Cells in the elided region stay default, which is correct because source
// and result share the default.
template <concepts::MatrixPolicy Policy, typename Target>
matrix<Policy> remap(const matrix<Policy>& m, std::size_t out_rows,
                     std::size_t out_columns, Target to) {
  using store_type = typename matrix<Policy>::store_type;
  std::size_t const columns = m.columns();

  store_type out = sparse_fold_left(
      m,
      [&](std::size_t index, const auto& value, store_type acc) {
        position const target = to(position{index / columns, index % columns});
        acc.set_unchecked(target.row * out_columns + target.col, value);
        return acc;
      },
      store_type(out_rows * out_columns, m.default_value()));

  return matrix<Policy>(out_rows, out_columns, std::move(out));
}

template <concepts::MatrixPolicy Policy>
[[noreturn]] void raise_drop(std::string_view operation, std::size_t index,
                             std::size_t bound) {
  auto error = core::make_error(
      core::ErrorCode::InvalidDimension, "matrix", operation,
      "Drop index out of range or result would have a zero dimension");
  error.add_context(index);
  error.add_context(bound);
  core::raise(std::move(error), Policy::report_errors);
}

// Copies every cell below the extent for which keep(index) holds,
// compacting them in order into a rows x columns result.
template <concepts::MatrixPolicy Policy, typename Keep>
matrix<Policy> compact(const matrix<Policy>& m, std::size_t rows,
                       std::size_t columns, Keep keep) {
  using store_type = typename matrix<Policy>::store_type;
  struct cursor {
    store_type store;
    std::size_t next;
  };

  cursor out = sparse_fold_left(
      m,
      [&keep](std::size_t index, const auto& value, cursor acc) {
        if (keep(index)) {
          acc.store.set_unchecked(acc.next++, value);
        }
        return acc;
      },
      cursor{store_type(rows * columns, m.default_value()), 0});

  return matrix<Policy>(rows, columns, std::move(out.store));
}

} // namespace detail

// 1 x columns row holding get({i, i}) for every column i. Only meaningful
// for square matrices; a wide matrix raises PositionOutOfBounds.
template <concepts::MatrixPolicy Policy>
matrix<Policy> diagonal(const matrix<Policy>& m) {
  typename matrix<Policy>::store_type out(m.columns(), m.default_value());
  for (std::size_t i = 0; i < m.columns(); ++i) {
    out.set_unchecked(i, m.get({i, i}));
  }
  return matrix<Policy>(1, m.columns(), std::move(out));
}

template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
matrix<Policy>
identity(std::size_t n,
         const typename Policy::value_type& default_value = {}) {
  using value_type = typename Policy::value_type;
  matrix<Policy> out(n, n, default_value);
  for (std::size_t i = 0; i < n; ++i) {
    out = std::move(out).set({i, i}, static_cast<value_type>(1));
  }
  return out;
}

template <concepts::MatrixPolicy Policy>
matrix<Policy> transpose(const matrix<Policy>& m) {
  return detail::remap(m, m.columns(), m.rows(), [](position p) {
    return position{p.col, p.row};
  });
}

template <concepts::MatrixPolicy Policy>
matrix<Policy> flip_lr(const matrix<Policy>& m) {
  std::size_t const last = m.columns() - 1;
  return detail::remap(m, m.rows(), m.columns(), [last](position p) {
    return position{p.row, last - p.col};
  });
}

template <concepts::MatrixPolicy Policy>
matrix<Policy> flip_ud(const matrix<Policy>& m) {
  std::size_t const last = m.rows() - 1;
  return detail::remap(m, m.rows(), m.columns(), [last](position p) {
    return position{last - p.row, p.col};
  });
}

template <concepts::MatrixPolicy Policy>
matrix<Policy> drop_row(const matrix<Policy>& m, std::size_t row_index) {
  if (m.rows() == 1 || row_index >= m.rows()) [[unlikely]] {
    detail::raise_drop<Policy>("drop_row", row_index, m.rows());
  }
  std::size_t const first = row_index * m.columns();
  std::size_t const last = first + m.columns();
  return detail::compact(m, m.rows() - 1, m.columns(),
                         [first, last](std::size_t index) {
                           return index < first || index >= last;
                         });
}

template <concepts::MatrixPolicy Policy>
matrix<Policy> drop_column(const matrix<Policy>& m, std::size_t col_index) {
  if (m.columns() == 1 || col_index >= m.columns()) [[unlikely]] {
    detail::raise_drop<Policy>("drop_column", col_index, m.columns());
  }
  std::size_t const columns = m.columns();
  return detail::compact(m, m.rows(), columns - 1,
                         [columns, col_index](std::size_t index) {
                           return index % columns != col_index;
                         });
}

// Stacks whole rows (axis::rows) or whole columns (axis::columns) of each
// input in list order.
template <concepts::MatrixPolicy Policy>
matrix<Policy>
concat(std::span<const matrix<Policy>> matrices, axis along,
       const typename Policy::value_type& default_value = {}) {
  auto raise_shape = [](std::size_t expected, std::size_t actual) {
    auto error = core::make_error(core::ErrorCode::ShapeMismatch, "matrix",
                                  "concat", "Inputs disagree on the shared "
                                            "dimension or the list is empty");
    error.add_context(expected);
    error.add_context(actual);
    core::raise(std::move(error), Policy::report_errors);
  };

  if (matrices.empty()) [[unlikely]] {
    raise_shape(0, 0);
  }

  std::size_t total = 0;
  for (auto const& m : matrices) {
    total += m.size();
  }

  if (along == axis::rows) {
    std::size_t const columns = matrices.front().columns();
    for (auto const& m : matrices) {
      if (m.columns() != columns) [[unlikely]] {
        raise_shape(columns, m.columns());
      }
    }

    matrix<Policy> out(total / columns, columns, default_value);
    std::size_t target = 0;
    for (auto const& m : matrices) {
      for (std::size_t r = 0; r < m.rows(); ++r) {
        out = std::move(out).set_row(target++, m.row(r));
      }
    }
    return out;
  }

  std::size_t const rows = matrices.front().rows();
  for (auto const& m : matrices) {
    if (m.rows() != rows) [[unlikely]] {
      raise_shape(rows, m.rows());
    }
  }

  matrix<Policy> out(rows, total / rows, default_value);
  std::size_t target = 0;
  for (auto const& m : matrices) {
    for (std::size_t c = 0; c < m.columns(); ++c) {
      out = std::move(out).set_column(target++, m.column(c));
    }
  }
  return out;
}

template <concepts::MatrixPolicy Policy>
matrix<Policy>
concat(const std::vector<matrix<Policy>>& matrices, axis along,
       const typename Policy::value_type& default_value = {}) {
  return concat(std::span<const matrix<Policy>>(matrices), along,
                default_value);
}

} // namespace tessel

#endif // TESSEL_CONTAINER_TRANSFORMS_HPP
