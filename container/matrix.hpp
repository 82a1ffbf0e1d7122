#ifndef TESSEL_CONTAINER_MATRIX_HPP
#define TESSEL_CONTAINER_MATRIX_HPP

#include "container/packed_store.hpp"
#include "core/matrix_error.hpp"
#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <initializer_list>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace tessel {

struct position {
  std::size_t row;
  std::size_t col;

  bool operator==(const position&) const = default;
};

// Rank-2 matrix over a packed_store, addressed row-major.
//
// A matrix is a value: every mutator returns a new matrix and leaves the
// receiver untouched. The rvalue-qualified overloads reuse the buffer of
// an expiring matrix, so `m = std::move(m).set(...)` does not copy.
template <concepts::MatrixPolicy Policy> class matrix {
public:
  using value_type = typename Policy::value_type;
  using store_type = packed_store<Policy>;
  using policy_type = Policy;

private:
  store_type store_;
  std::size_t rows_;
  std::size_t columns_;

  static void check_dimensions(std::size_t rows, std::size_t columns,
                               std::string_view operation) {
    if (rows == 0 || columns == 0) [[unlikely]] {
      auto error =
          core::make_error(core::ErrorCode::InvalidDimension, "matrix",
                           operation, "Matrix dimensions must be at least 1");
      error.add_context(rows);
      error.add_context(columns);
      core::raise(std::move(error), Policy::report_errors);
    }
    // rows * columns must be representable as a store length
    if (rows > std::numeric_limits<std::size_t>::max() / columns)
        [[unlikely]] {
      auto error = core::make_error(core::ErrorCode::InvalidDimension,
                                    "matrix", operation,
                                    "Cell count overflows the index type");
      error.add_context(rows);
      error.add_context(columns);
      core::raise(std::move(error), Policy::report_errors);
    }
  }

  void check_position(const position& pos, std::string_view operation) const {
    if (pos.row >= rows_ || pos.col >= columns_) [[unlikely]] {
      auto error =
          core::make_error(core::ErrorCode::PositionOutOfBounds, "matrix",
                           operation, "Position outside matrix dimensions");
      error.add_context(pos.row);
      error.add_context(pos.col);
      error.add_context(rows_);
      error.add_context(columns_);
      core::raise(std::move(error), Policy::report_errors);
    }
  }

  static void raise_shape(std::string_view operation, std::string_view message,
                          std::size_t a, std::size_t b) {
    auto error = core::make_error(core::ErrorCode::ShapeMismatch, "matrix",
                                  operation, message);
    error.add_context(a);
    error.add_context(b);
    core::raise(std::move(error), Policy::report_errors);
  }

public:
  matrix(std::size_t rows, std::size_t columns,
         const value_type& default_value = value_type{})
      : store_((check_dimensions(rows, columns, "new"), rows * columns),
               default_value),
        rows_(rows), columns_(columns) {}

  // Adopts a store built elsewhere; its length must be rows * columns.
  matrix(std::size_t rows, std::size_t columns, store_type store)
      : store_(std::move(store)), rows_(rows), columns_(columns) {
    check_dimensions(rows, columns, "adopt");
    if (store_.size() != rows * columns) [[unlikely]] {
      raise_shape("adopt", "Store length differs from rows * columns",
                  store_.size(), rows * columns);
    }
  }

  // Row-major fill. Missing trailing cells take the default, surplus values
  // are dropped.
  static matrix from_flat(std::span<const value_type> values, std::size_t rows,
                          std::size_t columns,
                          const value_type& default_value = value_type{}) {
    check_dimensions(rows, columns, "from_flat");
    if (values.empty()) [[unlikely]] {
      raise_shape("from_flat", "Construction requires a non-empty value list",
                  rows, columns);
    }
    return matrix(rows, columns,
                  store_type::resize_from(values, rows * columns,
                                          default_value));
  }

  static matrix from_flat(std::initializer_list<value_type> values,
                          std::size_t rows, std::size_t columns,
                          const value_type& default_value = value_type{}) {
    return from_flat(std::span<const value_type>(values.begin(), values.size()),
                     rows, columns, default_value);
  }

  static matrix
  from_nested(const std::vector<std::vector<value_type>>& rows_of_values,
              const value_type& default_value = value_type{}) {
    if (rows_of_values.empty()) [[unlikely]] {
      raise_shape("from_nested", "Construction requires at least one row", 0,
                  0);
    }

    std::size_t const rows = rows_of_values.size();
    std::size_t const columns = rows_of_values.front().size();
    check_dimensions(rows, columns, "from_nested");

    std::vector<value_type> flat;
    flat.reserve(rows * columns);
    for (std::size_t r = 0; r < rows; ++r) {
      auto const& row = rows_of_values[r];
      if (row.size() != columns) [[unlikely]] {
        raise_shape("from_nested", "Rows differ in length", r, row.size());
      }
      flat.insert(flat.end(), row.begin(), row.end());
    }

    return matrix(rows, columns,
                  store_type::resize_from(flat, rows * columns, default_value));
  }

  std::size_t rows() const noexcept { return rows_; }
  std::size_t columns() const noexcept { return columns_; }
  std::size_t size() const noexcept { return rows_ * columns_; }
  const value_type& default_value() const noexcept {
    return store_.default_value();
  }
  std::size_t sparse_extent() const noexcept { return store_.sparse_extent(); }
  const store_type& store() const noexcept { return store_; }

  std::size_t position_to_index(const position& pos) const {
    check_position(pos, "position_to_index");
    return pos.row * columns_ + pos.col;
  }

  position index_to_position(std::size_t index) const {
    if (index >= size()) [[unlikely]] {
      auto error =
          core::make_error(core::ErrorCode::IndexOutOfRange, "matrix",
                           "index_to_position", "Index exceeds matrix size");
      error.add_context(index);
      error.add_context(size());
      core::raise(std::move(error), Policy::report_errors);
    }
    return {index / columns_, index % columns_};
  }

  const value_type& get(const position& pos) const {
    check_position(pos, "get");
    return store_.get_unchecked(pos.row * columns_ + pos.col);
  }

  matrix set(const position& pos, const value_type& value) && {
    check_position(pos, "set");
    store_.set_unchecked(pos.row * columns_ + pos.col, value);
    return std::move(*this);
  }

  matrix set(const position& pos, const value_type& value) const& {
    return matrix(*this).set(pos, value);
  }

  matrix reset(const position& pos) && {
    check_position(pos, "reset");
    store_.reset(pos.row * columns_ + pos.col);
    return std::move(*this);
  }

  matrix reset(const position& pos) const& { return matrix(*this).reset(pos); }

  matrix set_row(std::size_t row_index, const matrix& source) && {
    check_position({row_index, 0}, "set_row");
    if (source.rows_ != 1 || source.columns_ != columns_) [[unlikely]] {
      raise_shape("set_row", "Source must be a single row of matching width",
                  source.rows_, source.columns_);
    }
    std::size_t const base = row_index * columns_;
    for (std::size_t c = 0; c < columns_; ++c) {
      store_.set_unchecked(base + c, source.store_.get_unchecked(c));
    }
    return std::move(*this);
  }

  matrix set_row(std::size_t row_index, const matrix& source) const& {
    return matrix(*this).set_row(row_index, source);
  }

  matrix set_column(std::size_t col_index, const matrix& source) && {
    check_position({0, col_index}, "set_column");
    if (source.columns_ != 1 || source.rows_ != rows_) [[unlikely]] {
      raise_shape("set_column",
                  "Source must be a single column of matching height",
                  source.rows_, source.columns_);
    }
    for (std::size_t r = 0; r < rows_; ++r) {
      store_.set_unchecked(r * columns_ + col_index,
                           source.store_.get_unchecked(r));
    }
    return std::move(*this);
  }

  matrix set_column(std::size_t col_index, const matrix& source) const& {
    return matrix(*this).set_column(col_index, source);
  }

  // Reinterprets the same cells under new dimensions.
  matrix reshape(std::size_t rows, std::size_t columns) && {
    check_dimensions(rows, columns, "reshape");
    if (rows * columns != size()) [[unlikely]] {
      raise_shape("reshape", "Reshape must preserve the element count",
                  rows * columns, size());
    }
    rows_ = rows;
    columns_ = columns;
    return std::move(*this);
  }

  matrix reshape(std::size_t rows, std::size_t columns) const& {
    return matrix(*this).reshape(rows, columns);
  }

  // 1 x columns copy of one row
  matrix row(std::size_t row_index) const {
    check_position({row_index, 0}, "row");
    store_type out(columns_, default_value());
    std::size_t const base = row_index * columns_;
    std::size_t const extent = sparse_extent();
    for (std::size_t c = 0; c < columns_ && base + c < extent; ++c) {
      out.set_unchecked(c, store_.get_unchecked(base + c));
    }
    return matrix(1, columns_, std::move(out));
  }

  // rows x 1 copy of one column
  matrix column(std::size_t col_index) const {
    check_position({0, col_index}, "column");
    store_type out(rows_, default_value());
    std::size_t const extent = sparse_extent();
    for (std::size_t r = 0; r < rows_ && r * columns_ + col_index < extent;
         ++r) {
      out.set_unchecked(r, store_.get_unchecked(r * columns_ + col_index));
    }
    return matrix(rows_, 1, std::move(out));
  }

  std::vector<value_type> row_values(std::size_t row_index) const {
    check_position({row_index, 0}, "row_values");
    auto const cells = store_.cells().subspan(row_index * columns_, columns_);
    return {cells.begin(), cells.end()};
  }

  std::vector<value_type> column_values(std::size_t col_index) const {
    check_position({0, col_index}, "column_values");
    std::vector<value_type> out;
    out.reserve(rows_);
    for (std::size_t r = 0; r < rows_; ++r) {
      out.push_back(store_.get_unchecked(r * columns_ + col_index));
    }
    return out;
  }

  std::vector<value_type> to_flat() const {
    auto const cells = store_.cells();
    return {cells.begin(), cells.end()};
  }

  std::vector<std::vector<value_type>> to_nested() const {
    std::vector<std::vector<value_type>> out;
    out.reserve(rows_);
    for (std::size_t r = 0; r < rows_; ++r) {
      out.push_back(row_values(r));
    }
    return out;
  }

  // Copy of the block starting at (row_first, col_first).
  matrix submatrix(std::size_t row_first, std::size_t row_count,
                   std::size_t col_first, std::size_t col_count) const {
    check_dimensions(row_count, col_count, "submatrix");
    check_position({row_first, col_first}, "submatrix");
    if (row_count > rows_ - row_first || col_count > columns_ - col_first)
        [[unlikely]] {
      auto error =
          core::make_error(core::ErrorCode::PositionOutOfBounds, "matrix",
                           "submatrix", "Block extends past the matrix");
      error.add_context(row_first);
      error.add_context(row_count);
      error.add_context(col_first);
      error.add_context(col_count);
      core::raise(std::move(error), Policy::report_errors);
    }

    store_type out(row_count * col_count, default_value());
    std::size_t const extent = sparse_extent();
    for (std::size_t r = 0; r < row_count; ++r) {
      for (std::size_t c = 0; c < col_count; ++c) {
        std::size_t const source = (row_first + r) * columns_ + col_first + c;
        if (source >= extent) {
          break;
        }
        out.set_unchecked(r * col_count + c, store_.get_unchecked(source));
      }
    }
    return matrix(row_count, col_count, std::move(out));
  }

  // Dense rewrite of every cell through fn(index, value). The result may
  // differ from the default anywhere, so its extent covers the whole store.
  template <typename Fn> matrix transform(Fn&& fn) && {
    store_.transform_prefix(size(), std::forward<Fn>(fn));
    store_.mark_dense();
    return std::move(*this);
  }

  // Rewrites only the cells below the sparse extent.
  template <typename Fn> matrix transform_sparse(Fn&& fn) && {
    store_.transform_prefix(sparse_extent(), std::forward<Fn>(fn));
    return std::move(*this);
  }

  std::string describe() const {
    return fmt::format("matrix<{}>({}x{}, default={}, sparse_extent={})",
                       DataTypeEnum::to_string(Policy::policy_id), rows_,
                       columns_, default_value(), sparse_extent());
  }

  std::string to_string() const {
    std::string out;
    for (std::size_t r = 0; r < rows_; ++r) {
      auto const cells = store_.cells().subspan(r * columns_, columns_);
      out += fmt::format("[{}]\n", fmt::join(cells, ", "));
    }
    return out;
  }

  // Shape and cell values only; default and extent are not compared.
  friend bool operator==(const matrix& lhs, const matrix& rhs) {
    if (lhs.rows_ != rhs.rows_ || lhs.columns_ != rhs.columns_) {
      return false;
    }
    auto const a = lhs.store_.cells();
    auto const b = rhs.store_.cells();
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
  }
};

using imatrix = matrix<Int32DefaultPolicy>;
using lmatrix = matrix<Int64DefaultPolicy>;
using fmatrix = matrix<Float32DefaultPolicy>;
using dmatrix = matrix<Float64DefaultPolicy>;

} // namespace tessel

#endif // TESSEL_CONTAINER_MATRIX_HPP
