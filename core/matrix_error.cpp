#include "core/matrix_error.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <span>

namespace tessel::core {

matrix_error::matrix_error(const ErrorInfo& info)
    : std::runtime_error(format_error(info)), info_(info) {}

std::string format_error(const ErrorInfo& error) {
  auto const message =
      fmt::format("[[{}]]: {}::{}: {}", error_code_name(error.code),
                  error.component, error.operation, error.message);
  if (error.num_context_values == 0) {
    return message;
  }

  std::span<const std::uint64_t> context(error.context_data,
                                         error.num_context_values);
  return fmt::format("{} (context: {})", message, fmt::join(context, ", "));
}

void raise(ErrorInfo&& error, bool report) {
  if (report) {
    ErrorCollector::instance().report(error);
  }
  throw matrix_error(error);
}

} // namespace tessel::core
