#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace shipcoord::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Document tree used for configs, snapshots, action payloads and exports.
// Numbers are stored as double; millisecond timestamps stay exact.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  // "null", "bool", "number", "string", "array" or "object".
  const char* type_name() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  const Object& object() const;
  const Array& array() const;

  // Member/element lookup. Throws std::runtime_error naming the key.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;
  const Value* find(const std::string& key) const;

  // Typed reads with a fallback for a missing or mistyped value.
  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;
};

// Throws std::runtime_error with line/column and a caret line on bad input.
// A leading UTF-8 BOM is skipped.
Value parse(const std::string& text);

// Keys are written in sorted order. indent == 0 writes one line.
std::string stringify(const Value& v, int indent = 2);

} // namespace shipcoord::json
