#ifndef REFINERY_CORE_JSON_DOM_HPP_
#define REFINERY_CORE_JSON_DOM_HPP_

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace refinery::core::json {

// Small STL-only DOM used for engine configuration files.
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

  bool is_object() const {
    return type == Type::kObject;
  }
  bool is_number() const {
    return type == Type::kNumber;
  }
  bool is_bool() const {
    return type == Type::kBool;
  }
  bool is_string() const {
    return type == Type::kString;
  }

  // Member lookup; nullptr when this is not an object or the key is absent.
  const Value* Find(std::string_view key) const;
};

const char* ToString(Value::Type type);

// Parses one complete JSON document. Errors carry line/column, e.g.
// "parse error at line 3, col 7: expected ':' after object key".
bool Parse(std::string_view input, Value& root, std::string& error);

} // namespace refinery::core::json

#endif // REFINERY_CORE_JSON_DOM_HPP_
