#ifndef TESSEL_CONTAINER_LINALG_HPP
#define TESSEL_CONTAINER_LINALG_HPP

#include "container/aggregates.hpp"
#include "container/matrix.hpp"
#include "container/transforms.hpp"
#include "container/traversal.hpp"
#include <vector>

namespace tessel {

namespace detail {

template <concepts::MatrixPolicy Policy>
void check_same_shape(const matrix<Policy>& a, const matrix<Policy>& b,
                      std::string_view operation) {
  if (a.rows() != b.rows() || a.columns() != b.columns()) [[unlikely]] {
    auto error =
        core::make_error(core::ErrorCode::ShapeMismatch, "matrix", operation,
                         "Elementwise operands must share their dimensions");
    error.add_context(a.rows());
    error.add_context(a.columns());
    error.add_context(b.rows());
    error.add_context(b.columns());
    core::raise(std::move(error), Policy::report_errors);
  }
}

} // namespace detail

template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
matrix<Policy> add(const matrix<Policy>& a, const matrix<Policy>& b) {
  detail::check_same_shape(a, b, "add");
  auto const& rhs = b.store();
  return map(a, [&rhs](std::size_t index, const auto& value) {
    return value + rhs.get_unchecked(index);
  });
}

template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
matrix<Policy> multiply_elementwise(const matrix<Policy>& a,
                                    const matrix<Policy>& b) {
  detail::check_same_shape(a, b, "multiply_elementwise");
  auto const& rhs = b.store();
  return map(a, [&rhs](std::size_t index, const auto& value) {
    return value * rhs.get_unchecked(index);
  });
}

// Textbook product. Each row of `a` and each column of `b` (transposed to a
// 1 x n row) is extracted once, then every output cell is the sum of their
// elementwise product.
template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
matrix<Policy> dot(const matrix<Policy>& a, const matrix<Policy>& b) {
  if (a.columns() != b.rows()) [[unlikely]] {
    auto error =
        core::make_error(core::ErrorCode::ShapeMismatch, "matrix", "dot",
                         "Left columns must equal right rows");
    error.add_context(a.rows());
    error.add_context(a.columns());
    error.add_context(b.rows());
    error.add_context(b.columns());
    core::raise(std::move(error), Policy::report_errors);
  }

  std::vector<matrix<Policy>> left_rows;
  left_rows.reserve(a.rows());
  for (std::size_t i = 0; i < a.rows(); ++i) {
    left_rows.push_back(a.row(i));
  }

  std::vector<matrix<Policy>> right_columns;
  right_columns.reserve(b.columns());
  for (std::size_t j = 0; j < b.columns(); ++j) {
    right_columns.push_back(transpose(b.column(j)));
  }

  matrix<Policy> out(a.rows(), b.columns(), a.default_value());
  for (std::size_t i = 0; i < a.rows(); ++i) {
    for (std::size_t j = 0; j < b.columns(); ++j) {
      out = std::move(out).set(
          {i, j}, sum(multiply_elementwise(left_rows[i], right_columns[j])));
    }
  }
  return out;
}

template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
matrix<Policy> operator+(const matrix<Policy>& a, const matrix<Policy>& b) {
  return add(a, b);
}

} // namespace tessel

#endif // TESSEL_CONTAINER_LINALG_HPP
