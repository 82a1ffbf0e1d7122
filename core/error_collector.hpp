#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <source_location>
#include <string_view>
#include <vector>

namespace tessel {
namespace core {

enum class ErrorCode : std::uint32_t {
  None = 0,
  IndexOutOfRange,     // raw store index beyond the store length
  PositionOutOfBounds, // (row, col) outside the declared dimensions
  ShapeMismatch,       // operand dimensions incompatible
  InvalidDimension,    // result would have a zero dimension
  NotFound,
  AllocationFailure,
};

constexpr std::string_view error_code_name(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::IndexOutOfRange:
    return "IndexOutOfRange";
  case ErrorCode::PositionOutOfBounds:
    return "PositionOutOfBounds";
  case ErrorCode::ShapeMismatch:
    return "ShapeMismatch";
  case ErrorCode::InvalidDimension:
    return "InvalidDimension";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AllocationFailure:
    return "AllocationFailure";
  default:
    return "Unknown";
  }
}

struct ErrorInfo {
  ErrorCode code;
  std::string_view component;    // e.g., "matrix", "packed_store"
  std::string_view operation;    // e.g., "get", "drop_row", "dot"
  std::string_view message;      // Human-readable description
  std::source_location location; // Source location where error occurred

  // Offending index, extent, rows, columns... (up to 4 values)
  std::uint64_t context_data[4];
  std::uint8_t num_context_values;

  ErrorInfo() : code(ErrorCode::None), context_data{}, num_context_values(0) {}

  ErrorInfo(ErrorCode error_code, std::string_view comp, std::string_view op,
            std::string_view msg,
            std::source_location loc = std::source_location::current())
      : code(error_code), component(comp), operation(op), message(msg),
        location(loc), context_data{}, num_context_values(0) {}

  void add_context(std::uint64_t value) {
    if (num_context_values < 4) {
      context_data[num_context_values++] = value;
    }
  }
};

// Process-wide record of every error raised by the library. This is the
// library's diagnostic log: raising code records here, then throws.
class ErrorCollector {
private:
  std::vector<ErrorInfo> errors_;
  mutable std::mutex mutex_;
  bool enabled_ = true;

  ErrorCollector() = default;

public:
  static ErrorCollector& instance() {
    static ErrorCollector collector;
    return collector;
  }

  ErrorCollector(const ErrorCollector&) = delete;
  ErrorCollector& operator=(const ErrorCollector&) = delete;
  ErrorCollector(ErrorCollector&&) = delete;
  ErrorCollector& operator=(ErrorCollector&&) = delete;

  void report(const ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_)
      return;
    errors_.push_back(error);
  }

  bool has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !errors_.empty();
  }

  std::size_t error_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size();
  }

  // Number of recorded errors of one kind
  std::size_t count(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(errors_.begin(), errors_.end(),
                      [code](const ErrorInfo& e) { return e.code == code; }));
  }

  ErrorInfo get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (errors_.empty()) {
      return ErrorInfo();
    }
    return errors_.back();
  }

  std::vector<ErrorInfo> get_all_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.clear();
  }

  void set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
  }

  bool is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
  }
};

inline ErrorInfo
make_error(ErrorCode code, std::string_view component,
           std::string_view operation, std::string_view message,
           std::source_location location = std::source_location::current()) {
  return ErrorInfo(code, component, operation, message, location);
}

} // namespace core
} // namespace tessel
