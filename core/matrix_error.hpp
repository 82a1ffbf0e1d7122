#ifndef TESSEL_CORE_MATRIX_ERROR_HPP
#define TESSEL_CORE_MATRIX_ERROR_HPP

#include "core/error_collector.hpp"
#include <stdexcept>
#include <string>

namespace tessel {
namespace core {

// Exception carrying the full ErrorInfo of a failed matrix operation.
class matrix_error : public std::runtime_error {
  ErrorInfo info_;

public:
  explicit matrix_error(const ErrorInfo& info);

  ErrorCode code() const noexcept { return info_.code; }
  const ErrorInfo& info() const noexcept { return info_; }
};

// Renders "[[Code]]: component::operation: message (context: a, b)".
std::string format_error(const ErrorInfo& error);

// Records the error in the ErrorCollector when `report` is set, then throws
// matrix_error. Nothing is mutated before a raise.
[[noreturn]] void raise(ErrorInfo&& error, bool report = true);

} // namespace core
} // namespace tessel

#endif // TESSEL_CORE_MATRIX_ERROR_HPP
