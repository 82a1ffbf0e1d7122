#include "container/linalg.hpp"
#include "container/sequence.hpp"
#include "core/error_collector.hpp"
#include <fmt/core.h>

int main() {
  using namespace tessel;

  // 3x3 matrix where every cell reads as 1 until written
  imatrix m = imatrix(3, 3, 1).set({0, 0}, 4).set({0, 2}, -2);
  fmt::print("{}\n{}", m.describe(), m.to_string());
  fmt::print("sum={} min={} max={}\n", sum(m), min(m), max(m));

  auto const where = find(m, -2);
  if (where) {
    fmt::print("-2 found at ({}, {})\n", where->row, where->col);
  }

  auto const product = dot(m, identity<Int32DefaultPolicy>(3));
  fmt::print("m . I == m: {}\n", product == m);
  fmt::print("transpose:\n{}", transpose(m).to_string());

  // Stop summing once the running total passes 4
  auto const partial = as_sequence(m).reduce(
      command::cont(0), [](std::int32_t v, std::int32_t acc) {
        return acc + v > 4 ? command::halt(acc) : command::cont(acc + v);
      });
  fmt::print("partial sum before passing 4: {}\n", partial.acc);

  try {
    (void)m.get({3, 0});
  } catch (const core::matrix_error& e) {
    fmt::print("Expected error: {}\n", e.what());
  }

  fmt::print("Errors recorded: {}\n",
             core::ErrorCollector::instance().error_count());
  return 0;
}
