#pragma once

// conclave/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for run configuration and objective documents (config.cpp) and for the
// report/event/audit serializers. Objects are std::map so serialization is
// key-sorted and therefore deterministic.
//
// Strictness: duplicate keys, trailing data, NaN/Infinity are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace conclave::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse a document whose root must be an object. On error returns {} and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// True when key is present with a value of the wrong type.
bool has_wrong_type(const Object& obj, const std::string& key, const char* expected);

std::string escape(const std::string& s);

// Fixed 6-decimal rendering with trailing zeros trimmed ("0.94", "1.0").
std::string format_double(double d);

}  // namespace conclave::jsonlite
