#ifndef COSMICAM_CORE_JSON_DOM_HPP_
#define COSMICAM_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cosmicam::core::json {

// Small STL-only DOM shared by the settings store and its typed views.
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
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  static Value MakeObject() {
    Value value;
    value.type = Type::kObject;
    return value;
  }

  static Value MakeNumber(double number) {
    Value value;
    value.type = Type::kNumber;
    value.number_value = number;
    return value;
  }

  static Value MakeString(std::string text) {
    Value value;
    value.type = Type::kString;
    value.string_value = std::move(text);
    return value;
  }

  static Value MakeBool(bool flag) {
    Value value;
    value.type = Type::kBool;
    value.bool_value = flag;
    return value;
  }

  bool IsObject() const {
    return type == Type::kObject;
  }

  bool IsNumber() const {
    return type == Type::kNumber;
  }

  // Returns nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Recursive-descent parser. Diagnostics carry line/column so a hand-edited
// settings file that fails to load points straight at the typo.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error, 0U)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, std::string& error, std::size_t depth) {
    if (depth > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    switch (c) {
    case '{':
      return ParseObject(value, error, depth);
    case '[':
      return ParseArray(value, error, depth);
    case '"':
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      return ParseLiteral("true", Value::MakeBool(true), value, error);
    case 'f':
      return ParseLiteral("false", Value::MakeBool(false), value, error);
    case 'n':
      return ParseLiteral("null", Value{}, value, error);
    default:
      break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ParseLiteral(std::string_view token, Value literal, Value& value, std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    value = std::move(literal);
    return true;
  }

  bool ParseObject(Value& value, std::string& error, std::size_t depth) {
    value = Value::MakeObject();
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!Match(':')) {
        return Fail("expected ':' after object key", error);
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error, depth + 1U)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ParseArray(Value& value, std::string& error, std::size_t depth) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error, depth + 1U)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }

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
      case 'u': {
        std::uint32_t code_point = 0;
        if (!ParseHex4(code_point, error)) {
          return false;
        }
        AppendUtf8(code_point, output);
        break;
      }
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ParseHex4(std::uint32_t& code_point, std::string& error) {
    code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate pairs are not supported in \\u escapes", error);
    }
    return true;
  }

  static void AppendUtf8(std::uint32_t code_point, std::string& output) {
    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    (void)Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        (void)Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
      return Fail("invalid number token", error);
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

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
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

namespace detail {

inline void WriteIndent(std::ostringstream& out, int indent, int depth) {
  if (indent <= 0) {
    return;
  }
  out << '\n' << std::string(static_cast<std::size_t>(indent * depth), ' ');
}

inline void WriteValue(std::ostringstream& out, const Value& value, int indent, int depth) {
  switch (value.type) {
  case Value::Type::kNull:
    out << "null";
    return;
  case Value::Type::kBool:
    out << (value.bool_value ? "true" : "false");
    return;
  case Value::Type::kNumber:
    out << FormatJsonNumber(value.number_value);
    return;
  case Value::Type::kString:
    out << '"' << EscapeJson(value.string_value) << '"';
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out << "[]";
      return;
    }
    out << '[';
    bool first = true;
    for (const Value& item : value.array_value) {
      if (!first) {
        out << ',';
      }
      first = false;
      WriteIndent(out, indent, depth + 1);
      WriteValue(out, item, indent, depth + 1);
    }
    WriteIndent(out, indent, depth);
    out << ']';
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out << "{}";
      return;
    }
    out << '{';
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out << ',';
      }
      first = false;
      WriteIndent(out, indent, depth + 1);
      out << '"' << EscapeJson(key) << "\":" << (indent > 0 ? " " : "");
      WriteValue(out, item, indent, depth + 1);
    }
    WriteIndent(out, indent, depth);
    out << '}';
    return;
  }
  }
}

} // namespace detail

// Serializes with sorted object keys. `indent == 0` produces a single line.
inline std::string Serialize(const Value& value, int indent = 0) {
  std::ostringstream out;
  detail::WriteValue(out, value, indent, 0);
  return out.str();
}

// Top-level merge: every key of `patch` replaces the same key of `target`.
// Nested objects are replaced whole, matching the document-granularity
// update contract of the settings store.
inline void MergeTopLevel(Value& target, const Value& patch) {
  if (!target.IsObject()) {
    target = Value::MakeObject();
  }
  for (const auto& [key, item] : patch.object_value) {
    target.object_value[key] = item;
  }
}

} // namespace cosmicam::core::json

#endif // COSMICAM_CORE_JSON_DOM_HPP_
