#pragma once

#include <cstdint>
#include <string>

namespace xso {

  // Lexical forms of XML Schema simple types, used for typed text and
  // attribute values.
  std::string
  format(bool value);
  std::string
  format(int32_t value);
  std::string
  format(int64_t value);
  std::string
  format(uint32_t value);
  std::string
  format(uint64_t value);
  std::string
  format(double value);

} // namespace xso
