#ifndef GRIDRUN_CORE_JSON_DOM_HPP_
#define GRIDRUN_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gridrun::core::json {

// Minimal DOM shared by the pipeline model, validator, matrix resolver and
// condition evaluator. STL-only so every module can use one parser.
//
// Objects keep a sorted member map for lookup plus `object_keys` in document
// order. Matrix dimensions are declared as object members, so declaration
// order must survive parsing.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  std::vector<std::string> object_keys;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }

  // Object member lookup; nullptr for non-objects and missing keys.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    if (it == object_value.end()) {
      return nullptr;
    }
    return &it->second;
  }

  // Inserts or replaces an object member. New keys are appended to
  // `object_keys`; replaced keys keep their original position.
  void Set(const std::string& key, Value value) {
    type = Type::kObject;
    const auto it = object_value.find(key);
    if (it == object_value.end()) {
      object_keys.push_back(key);
      object_value.emplace(key, std::move(value));
      return;
    }
    it->second = std::move(value);
  }
};

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

inline Value MakeNumber(double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBool(bool flag) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = flag;
  return value;
}

inline Value MakeObject() {
  Value value;
  value.type = Value::Type::kObject;
  return value;
}

// Integral values print without a fractional part ("3", not "3.000000").
inline std::string FormatNumber(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }
  if (std::isinf(number)) {
    return number > 0 ? "Infinity" : "-Infinity";
  }
  if (std::floor(number) == number && std::fabs(number) < 1e15) {
    std::ostringstream out;
    out << static_cast<long long>(number);
    return out.str();
  }
  std::ostringstream out;
  out << std::setprecision(15) << number;
  return out.str();
}

// Deep structural equality. Object comparison ignores member order.
inline bool Equals(const Value& lhs, const Value& rhs) {
  if (lhs.type != rhs.type) {
    return false;
  }
  switch (lhs.type) {
  case Value::Type::kNull:
    return true;
  case Value::Type::kBool:
    return lhs.bool_value == rhs.bool_value;
  case Value::Type::kNumber:
    return lhs.number_value == rhs.number_value;
  case Value::Type::kString:
    return lhs.string_value == rhs.string_value;
  case Value::Type::kArray:
    if (lhs.array_value.size() != rhs.array_value.size()) {
      return false;
    }
    for (std::size_t i = 0; i < lhs.array_value.size(); ++i) {
      if (!Equals(lhs.array_value[i], rhs.array_value[i])) {
        return false;
      }
    }
    return true;
  case Value::Type::kObject:
    if (lhs.object_value.size() != rhs.object_value.size()) {
      return false;
    }
    for (const auto& [key, member] : lhs.object_value) {
      const Value* other = rhs.Find(key);
      if (other == nullptr || !Equals(member, *other)) {
        return false;
      }
    }
    return true;
  }
  return false;
}

// Compact JSON text. Objects serialize in document order.
inline std::string Serialize(const Value& value) {
  switch (value.type) {
  case Value::Type::kNull:
    return "null";
  case Value::Type::kBool:
    return value.bool_value ? "true" : "false";
  case Value::Type::kNumber:
    return FormatNumber(value.number_value);
  case Value::Type::kString:
    return "\"" + EscapeJson(value.string_value) + "\"";
  case Value::Type::kArray: {
    std::string out = "[";
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i != 0U) {
        out += ',';
      }
      out += Serialize(value.array_value[i]);
    }
    out += ']';
    return out;
  }
  case Value::Type::kObject: {
    std::string out = "{";
    bool first = true;
    for (const auto& key : value.object_keys) {
      const Value* member = value.Find(key);
      if (member == nullptr) {
        continue;
      }
      if (!first) {
        out += ',';
      }
      out += "\"" + EscapeJson(key) + "\":" + Serialize(*member);
      first = false;
    }
    out += '}';
    return out;
  }
  }
  return "null";
}

// Human-facing rendering: strings print bare, everything else as JSON.
inline std::string ToDisplayString(const Value& value) {
  if (value.type == Value::Type::kString) {
    return value.string_value;
  }
  return Serialize(value);
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed pipeline files are actionable.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      // Duplicate keys: last value wins, first position is kept.
      value.Set(key, std::move(item));

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          return Fail("unicode escape \\uXXXX is not supported in current parser", error);
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    try {
      std::size_t parsed = 0;
      output = std::stod(text, &parsed);
      if (parsed != text.size()) {
        return Fail("invalid number token", error);
      }
    } catch (const std::exception&) {
      return Fail("invalid numeric value", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace gridrun::core::json

#endif // GRIDRUN_CORE_JSON_DOM_HPP_
