#ifndef GRIDRUN_CORE_JSON_UTILS_HPP_
#define GRIDRUN_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace gridrun::core {

// Appends `input` to `out` with JSON string escaping applied. Control bytes
// without a short escape become `\u00XX`.
inline void AppendEscapedJson(std::string& out, std::string_view input) {
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
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(ch)));
        out += escaped;
      } else {
        out += ch;
      }
      break;
    }
  }
}

inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  AppendEscapedJson(out, input);
  return out;
}

// Quoted JSON string literal, as used by the report and event writers.
inline std::string JsonString(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 2U);
  out += '"';
  AppendEscapedJson(out, input);
  out += '"';
  return out;
}

inline const char* JsonBool(bool value) {
  return value ? "true" : "false";
}

} // namespace gridrun::core

#endif // GRIDRUN_CORE_JSON_UTILS_HPP_
