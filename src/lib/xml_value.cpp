#include <xso/xml_value.hpp>

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace xso {

  std::string
  format(bool value) {
    return value ? "true" : "false";
  }

  std::string
  format(int32_t value) {
    return std::to_string(value);
  }

  std::string
  format(int64_t value) {
    return std::to_string(value);
  }

  std::string
  format(uint32_t value) {
    return std::to_string(value);
  }

  std::string
  format(uint64_t value) {
    return std::to_string(value);
  }

  std::string
  format(double value) {
    if (std::isinf(value)) return value > 0 ? "INF" : "-INF";
    if (std::isnan(value)) return "NaN";

    // Use to_chars for round-trip fidelity
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{})
      throw std::runtime_error("failed to format floating-point value");
    return std::string(buf, ptr);
  }

} // namespace xso
