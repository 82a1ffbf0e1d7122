#ifndef TESSEL_CORE_DATA_TYPE_ENUM_HPP
#define TESSEL_CORE_DATA_TYPE_ENUM_HPP

#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

namespace tessel {

// Runtime tag for a matrix policy, used when describing a matrix.
class DataTypeEnum {
public:
  enum Enum : std::uint16_t {
    Undef = 0,
    Int32Default,
    Int64Default,
    Float32Default,
    Float64Default,
    Unknown = std::numeric_limits<std::underlying_type_t<Enum>>::max()
  };

  constexpr static std::string_view to_string(Enum e) noexcept {
    using namespace std::string_view_literals;
    switch (e) {
    case Undef:
      return "Undef"sv;
    case Int32Default:
      return "Int32Default"sv;
    case Int64Default:
      return "Int64Default"sv;
    case Float32Default:
      return "Float32Default"sv;
    case Float64Default:
      return "Float64Default"sv;
    case Unknown:
      [[fallthrough]];
    default:
      return "Unknown"sv;
    }
  }
};

} // namespace tessel

#endif // TESSEL_CORE_DATA_TYPE_ENUM_HPP
