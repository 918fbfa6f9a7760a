#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace driftgrid::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Small JSON tree (null, bool, number, string, array, object). Enough for
// parameter presets; not a general-purpose document model.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  // nullptr if this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  // Throw std::runtime_error on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Throws std::runtime_error with line/column and a caret snippet on bad input.
Value parse(const std::string& text);

// Object keys are emitted in sorted order so output is diff-friendly.
std::string stringify(const Value& v, int indent = 2);

} // namespace driftgrid::json
