#include "core/json_dom.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace refinery::core::json {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;

class Reader {
public:
  explicit Reader(std::string_view input) : input_(input) {}

  bool ReadDocument(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ReadValue(root, 0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ReadValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxNestingDepth) {
      return Fail("nesting depth exceeds limit", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    switch (Peek()) {
    case '{':
      return ReadObject(value, depth, error);
    case '[':
      return ReadArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ReadString(value.string_value, error);
    default:
      break;
    }

    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      value.type = Value::Type::kNumber;
      return ReadNumber(value.number_value, error);
    }
    if (ConsumeLiteral("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeLiteral("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return true;
    }
    if (ConsumeLiteral("null")) {
      value.type = Value::Type::kNull;
      return true;
    }
    return Fail("expected JSON value", error);
  }

  bool ReadObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ReadString(key, error)) {
        return false;
      }
      if (value.object_value.count(key) != 0U) {
        return Fail("duplicate object key '" + key + "'", error);
      }

      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ReadValue(member, depth + 1U, error)) {
        return false;
      }
      value.object_value.emplace(std::move(key), std::move(member));

      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' after object member", error);
      }
    }
  }

  bool ReadArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      Value item;
      if (!ReadValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' after array item", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
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
        out.push_back(c);
        continue;
      }

      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }
    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ReadUnicodeEscape(std::string& out, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    std::uint32_t code_point = 0;
    const char* begin = input_.data() + pos_;
    const auto [ptr, ec] = std::from_chars(begin, begin + 4, code_point, 16);
    if (ec != std::errc() || ptr != begin + 4) {
      return Fail("invalid \\u escape", error);
    }
    for (int i = 0; i < 4; ++i) {
      Advance();
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    TryConsume('-');
    if (!TryConsume('0') && SkipDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (TryConsume('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        TryConsume('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      return Fail("invalid number token '" + token + "'", error);
    }
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeLiteral(std::string_view literal) {
    if (input_.substr(pos_, literal.size()) != literal) {
      return false;
    }
    for (std::size_t i = 0; i < literal.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool TryConsume(char expected) {
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

  bool Fail(const std::string& message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + message;
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

} // namespace

const Value* Value::Find(std::string_view key) const {
  if (type != Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.find(std::string(key));
  return it == object_value.end() ? nullptr : &it->second;
}

const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

bool Parse(std::string_view input, Value& root, std::string& error) {
  error.clear();
  Reader reader(input);
  return reader.ReadDocument(root, error);
}

} // namespace refinery::core::json
