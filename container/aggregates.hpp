#ifndef TESSEL_CONTAINER_AGGREGATES_HPP
#define TESSEL_CONTAINER_AGGREGATES_HPP

#include "container/matrix.hpp"
#include "container/transforms.hpp"
#include "container/traversal.hpp"
#include <concepts>
#include <functional>
#include <optional>
#include <string_view>

namespace tessel {

// Stops scanning at the first match.
template <concepts::MatrixPolicy Policy>
bool member(const matrix<Policy>& m,
            const typename Policy::value_type& term) {
  if (m.sparse_extent() < m.size() && term == m.default_value()) {
    return true;
  }
  return sparse_fold_left_until(
      m,
      [&term](std::size_t, const auto& value, bool) {
        return value == term ? stop_with(true) : continue_with(false);
      },
      false);
}

// Position of the lowest index holding `term`, or nullopt.
template <concepts::MatrixPolicy Policy>
std::optional<position> find(const matrix<Policy>& m,
                             const typename Policy::value_type& term) {
  auto const hit = sparse_fold_left_until(
      m,
      [&term](std::size_t index, const auto& value,
              std::optional<std::size_t>) {
        return value == term ? stop_with(std::optional<std::size_t>(index))
                             : continue_with(std::optional<std::size_t>());
      },
      std::optional<std::size_t>());

  if (hit) {
    return m.index_to_position(*hit);
  }
  // The first cell past the extent is the lowest index known to hold the
  // default that the scan above did not cover.
  if (term == m.default_value() && m.sparse_extent() < m.size()) {
    return m.index_to_position(m.sparse_extent());
  }
  return std::nullopt;
}

// Like find, but a missing term raises NotFound.
template <concepts::MatrixPolicy Policy>
position locate(const matrix<Policy>& m,
                const typename Policy::value_type& term) {
  auto const pos = find(m, term);
  if (!pos) [[unlikely]] {
    auto error = core::make_error(core::ErrorCode::NotFound, "matrix",
                                  "locate", "Term not present in matrix");
    error.add_context(m.rows());
    error.add_context(m.columns());
    core::raise(std::move(error), Policy::report_errors);
  }
  return *pos;
}

namespace detail {

// Outcome of a min/max fold. `seeded` means no cell beat the default the
// fold started from; otherwise `index` is the winning cell.
struct extreme {
  bool seeded;
  std::size_t index;
};

// sparse_fold_left seeded with the default value. A cell replaces the
// accumulator only when it is strictly better, so the lowest index wins
// ties and a cell equal to the default never displaces the seed.
template <concepts::MatrixPolicy Policy, typename Better>
extreme fold_extreme(const matrix<Policy>& m, Better better) {
  auto const& store = m.store();
  return sparse_fold_left(
      m,
      [&](std::size_t index, const auto& value, extreme acc) {
        auto const& current =
            acc.seeded ? m.default_value() : store.get_unchecked(acc.index);
        if (better(value, current)) {
          return extreme{false, index};
        }
        return acc;
      },
      extreme{true, 0});
}

// Position of a min/max result. When the default won, that is where find
// places the default. A fully written matrix with no cell holding the
// default has no such position and raises NotFound.
template <concepts::MatrixPolicy Policy>
position extreme_position(const matrix<Policy>& m, const extreme& result,
                          std::string_view operation) {
  if (!result.seeded) {
    return m.index_to_position(result.index);
  }

  if (auto const pos = find(m, m.default_value())) {
    return *pos;
  }

  auto error = core::make_error(
      core::ErrorCode::NotFound, "matrix", operation,
      "Extreme is the default value, which no cell holds");
  error.add_context(m.rows());
  error.add_context(m.columns());
  core::raise(std::move(error), Policy::report_errors);
}

template <concepts::MatrixPolicy Policy>
typename Policy::value_type extreme_value(const matrix<Policy>& m,
                                          const extreme& result) {
  return result.seeded ? m.default_value()
                       : m.store().get_unchecked(result.index);
}

} // namespace detail

template <concepts::MatrixPolicy Policy>
  requires std::totally_ordered<typename Policy::value_type>
position argmin(const matrix<Policy>& m) {
  return detail::extreme_position(m, detail::fold_extreme(m, std::less<>{}),
                                  "argmin");
}

template <concepts::MatrixPolicy Policy>
  requires std::totally_ordered<typename Policy::value_type>
position argmax(const matrix<Policy>& m) {
  return detail::extreme_position(
      m, detail::fold_extreme(m, std::greater<>{}), "argmax");
}

// The default always takes part, even when every cell has been written.
template <concepts::MatrixPolicy Policy>
  requires std::totally_ordered<typename Policy::value_type>
typename Policy::value_type min(const matrix<Policy>& m) {
  return detail::extreme_value(m, detail::fold_extreme(m, std::less<>{}));
}

template <concepts::MatrixPolicy Policy>
  requires std::totally_ordered<typename Policy::value_type>
typename Policy::value_type max(const matrix<Policy>& m) {
  return detail::extreme_value(m, detail::fold_extreme(m, std::greater<>{}));
}

// Cells past the extent are accounted for as (size - visited) defaults
// without being iterated.
template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
typename Policy::value_type sum(const matrix<Policy>& m) {
  using value_type = typename Policy::value_type;
  struct tally {
    std::size_t visited;
    value_type total;
  };

  tally const t = sparse_fold_left(
      m,
      [](std::size_t, const value_type& value, tally acc) {
        ++acc.visited;
        acc.total = acc.total + value;
        return acc;
      },
      tally{0, value_type{}});

  return t.total +
         static_cast<value_type>(m.size() - t.visited) * m.default_value();
}

template <concepts::MatrixPolicy Policy>
  requires concepts::ArithmeticValue<typename Policy::value_type>
typename Policy::value_type trace(const matrix<Policy>& m) {
  return sum(diagonal(m));
}

} // namespace tessel

#endif // TESSEL_CONTAINER_AGGREGATES_HPP
