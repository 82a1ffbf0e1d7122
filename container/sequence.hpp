#ifndef TESSEL_CONTAINER_SEQUENCE_HPP
#define TESSEL_CONTAINER_SEQUENCE_HPP

#include "container/aggregates.hpp"
#include "container/matrix.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace tessel {

// Control signal a reducer hands back after each element.
enum class reduce_signal : std::uint8_t { cont, suspend, halt };

template <typename Acc> struct reduce_command {
  reduce_signal signal;
  Acc acc;
};

namespace command {

template <typename Acc> reduce_command<Acc> cont(Acc acc) {
  return {reduce_signal::cont, std::move(acc)};
}

template <typename Acc> reduce_command<Acc> suspend(Acc acc) {
  return {reduce_signal::suspend, std::move(acc)};
}

template <typename Acc> reduce_command<Acc> halt(Acc acc) {
  return {reduce_signal::halt, std::move(acc)};
}

} // namespace command

enum class reduce_status : std::uint8_t { done, halted, suspended };

template <typename Acc> struct reduce_result {
  reduce_status status;
  Acc acc;
  // Set only when suspended. Invoking it with a new command resumes at the
  // element after the one that asked to suspend.
  std::function<reduce_result(reduce_command<Acc>)> continuation;
};

// View of a matrix as its values in row-major order. Values are read on
// demand, but the view owns its source: constructing it from a matrix
// takes a copy (or the buffer of an rvalue), while the shared_ptr
// constructor adopts an existing immutable matrix without copying.
// Suspended continuations share that ownership, so they stay valid after
// the view itself is gone.
template <concepts::MatrixPolicy Policy> class matrix_sequence {
public:
  using value_type = typename Policy::value_type;
  using const_iterator = typename std::span<const value_type>::iterator;

private:
  std::shared_ptr<const matrix<Policy>> source_;

  template <typename Acc, typename Fn>
  static reduce_result<Acc>
  resume(std::shared_ptr<const matrix<Policy>> source, std::size_t index,
         reduce_command<Acc> cmd, Fn fn) {
    for (;;) {
      switch (cmd.signal) {
      case reduce_signal::halt:
        return {reduce_status::halted, std::move(cmd.acc), nullptr};
      case reduce_signal::suspend:
        return {reduce_status::suspended, std::move(cmd.acc),
                [source, index, fn](reduce_command<Acc> next) {
                  return resume(source, index, std::move(next), fn);
                }};
      case reduce_signal::cont:
        if (index == source->size()) {
          return {reduce_status::done, std::move(cmd.acc), nullptr};
        }
        cmd = fn(source->store().get_unchecked(index), std::move(cmd.acc));
        ++index;
        break;
      }
    }
  }

public:
  explicit matrix_sequence(matrix<Policy> source)
      : source_(std::make_shared<const matrix<Policy>>(std::move(source))) {}

  explicit matrix_sequence(std::shared_ptr<const matrix<Policy>> source)
      : source_(std::move(source)) {}

  std::size_t count() const noexcept { return source_->size(); }

  bool contains(const value_type& term) const { return member(*source_, term); }

  // Values at [start, start + length), clamped to the end of the sequence.
  std::vector<value_type> slice(std::size_t start, std::size_t length) const {
    auto const cells = source_->store().cells();
    if (start >= cells.size()) {
      return {};
    }
    auto const run = cells.subspan(start, std::min(length, cells.size() - start));
    return {run.begin(), run.end()};
  }

  // fn(value, acc) returns the next reduce_command.
  template <typename Acc, typename Fn>
  reduce_result<Acc> reduce(reduce_command<Acc> cmd, Fn fn) const {
    return resume(source_, 0, std::move(cmd), std::move(fn));
  }

  const_iterator begin() const noexcept {
    return source_->store().cells().begin();
  }
  const_iterator end() const noexcept { return source_->store().cells().end(); }
};

template <concepts::MatrixPolicy Policy>
matrix_sequence<Policy> as_sequence(const matrix<Policy>& m) {
  return matrix_sequence<Policy>(m);
}

template <concepts::MatrixPolicy Policy>
matrix_sequence<Policy> as_sequence(matrix<Policy>&& m) {
  return matrix_sequence<Policy>(std::move(m));
}

} // namespace tessel

#endif // TESSEL_CONTAINER_SEQUENCE_HPP
