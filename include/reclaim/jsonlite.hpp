#pragma once

// reclaim/jsonlite.hpp - Minimal strict JSON codec used for audit lines,
// lock files, config files and CLI output.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so serialize() always emits keys in sorted order.
//     The same record therefore always produces the same audit line bytes,
//     which the audit chain digest relies on.
//   - Integers are kept as u64 when non-negative; negative and fractional
//     numbers are stored as double.
//
// ERROR MODEL:
//   Parsing never throws. Failures are reported through an optional
//   JsonError out-parameter and an empty result.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reclaim::jsonlite {

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
};

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

// Parse a document whose top level must be an object.
// Returns an empty object and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse any JSON value. Returns null and sets *error on failure.
Value parse_value(const std::string& text, std::optional<JsonError>* error = nullptr);

std::optional<JsonError> validate_strict(const std::string& text);

// Compact canonical serialization.
std::string to_json(const Value& v);
std::string serialize(const Object& obj);

// Type-safe extractors. Absent or mistyped keys yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);

bool has_string(const Object& obj, const std::string& key);
bool has_bool(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

}  // namespace reclaim::jsonlite
