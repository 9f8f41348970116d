#ifndef REFINERY_CORE_JSON_UTILS_HPP_
#define REFINERY_CORE_JSON_UTILS_HPP_

#include "core/time_utils.hpp"

#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace refinery::core {

// String escaping shared by every report serializer.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string JsonString(std::string_view value) {
  return "\"" + EscapeJson(value) + "\"";
}

// JSON has no NaN/Inf; those serialize as null.
inline std::string JsonNumber(double value, int precision = 6) {
  if (!std::isfinite(value)) {
    return "null";
  }
  return FormatFixedDouble(value, precision);
}

inline std::string JsonStringArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ',';
    }
    out += JsonString(values[i]);
  }
  out += ']';
  return out;
}

inline std::string JsonNumberObject(const std::map<std::string, double>& values) {
  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : values) {
    if (!first) {
      out += ',';
    }
    first = false;
    out += JsonString(key) + ":" + JsonNumber(value);
  }
  out += '}';
  return out;
}

} // namespace refinery::core

#endif // REFINERY_CORE_JSON_UTILS_HPP_
