#ifndef TRENDLOOP_CORE_JSON_UTILS_HPP_
#define TRENDLOOP_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <map>
#include <string>
#include <string_view>

namespace trendloop::core {

// Shared JSON string escaping for report, event, manifest and state writers.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

// `"escaped"` including the surrounding quotes.
inline std::string JsonString(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Flat string map as a JSON object. std::map keeps key order deterministic.
inline std::string JsonStringMap(const std::map<std::string, std::string>& values) {
  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : values) {
    if (!first) {
      out += ',';
    }
    out += JsonString(key);
    out += ':';
    out += JsonString(value);
    first = false;
  }
  out += '}';
  return out;
}

} // namespace trendloop::core

#endif // TRENDLOOP_CORE_JSON_UTILS_HPP_
