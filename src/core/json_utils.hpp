#ifndef COSMICAM_CORE_JSON_UTILS_HPP_
#define COSMICAM_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

namespace cosmicam::core {

// Shared JSON string escaping for the settings writer and the event stream.
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

// Integers print without a fraction so `"shutter_speed": 100000` survives a
// read/merge/write cycle unchanged. Non-finite values have no JSON spelling
// and are written as null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
    std::ostringstream out;
    out << static_cast<long long>(value);
    return out.str();
  }
  // Shortest of 15 or 17 significant digits that reads back to the same value.
  std::ostringstream shortest;
  shortest << std::setprecision(15) << value;
  if (std::strtod(shortest.str().c_str(), nullptr) == value) {
    return shortest.str();
  }
  std::ostringstream exact;
  exact << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return exact.str();
}

} // namespace cosmicam::core

#endif // COSMICAM_CORE_JSON_UTILS_HPP_
