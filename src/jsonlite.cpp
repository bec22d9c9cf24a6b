#include "conclave/jsonlite.hpp"

// DETERMINISM:
//   - to_json() iterates Object (std::map) in key order.
//   - format_double() uses snprintf("%.6f"), which is locale-independent for
//     digit output in the C locale.
//   - std::stod is only used on input parsing.

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace conclave::jsonlite {

namespace {

void append_utf8(std::string& out, unsigned cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }
  bool eat(char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }
  void fail(const std::string& message) {
    if (!err) err = JsonError{"json_parse_error", message};
  }

  std::string parse_string() {
    if (!eat('"')) {
      fail("expected string");
      return {};
    }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          if (i + 4 > s.size()) {
            fail("truncated \\u escape");
            return {};
          }
          unsigned cp = 0;
          for (int k = 0; k < 4; ++k) {
            const char h = s[i++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else {
              fail("invalid \\u escape");
              return {};
            }
          }
          append_utf8(o, cp);
          break;
        }
        default: o += n; break;
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    ws();
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    bool is_real = false;
    if (i < s.size() && s[i] == '.') {
      is_real = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_real = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    const std::string num = s.substr(start, i - start);
    try {
      if (is_real || num[0] == '-') {
        out = Value{std::stod(num)};
      } else {
        out = Value{static_cast<std::uint64_t>(std::stoull(num))};
      }
    } catch (const std::out_of_range&) {
      fail("number out of range");
      return false;
    } catch (const std::invalid_argument&) {
      fail("invalid number");
      return false;
    }
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) {
      fail("unexpected eof");
      return {};
    }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      std::string k = parse_string();
      if (err) break;
      if (out.count(k) != 0) {
        err = JsonError{"json_duplicate_key", "duplicate key: " + k};
        break;
      }
      if (!eat(':')) {
        fail("expected :");
        break;
      }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) {
        fail("expected ,");
        break;
      }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) {
        fail("expected ,");
        break;
      }
    }
    return out;
  }
};

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (!p.err && !std::holds_alternative<Object>(v.v)) p.fail("root must be an object");
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<size_t>(n));
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.push_back('0');
  return out;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (const auto* b = std::get_if<bool>(&v.v)) return *b ? "true" : "false";
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return std::to_string(*u);
  if (const auto* d = std::get_if<double>(&v.v)) return format_double(*d);
  if (const auto* s = std::get_if<std::string>(&v.v)) return "\"" + escape(*s) + "\"";
  std::string out;
  if (const auto* o = std::get_if<Object>(&v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, vv] : *o) {
      if (!first) out += ',';
      first = false;
      out += '"';
      out += escape(k);
      out += "\":";
      out += to_json(vv);
    }
    out += '}';
    return out;
  }
  out += '[';
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) out += ',';
    first = false;
    out += to_json(vv);
  }
  out += ']';
  return out;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::string>(v->v)) return def;
  return std::get<std::string>(v->v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<bool>(v->v)) return def;
  return std::get<bool>(v->v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::uint64_t>(v->v)) return def;
  return std::get<std::uint64_t>(v->v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (const auto* d = std::get_if<double>(&v->v)) return *d;
  if (const auto* u = std::get_if<std::uint64_t>(&v->v)) return static_cast<double>(*u);
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return out;
  for (const auto& [k, item] : std::get<Object>(v->v)) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out[k] = *s;
  }
  return out;
}

bool has_wrong_type(const Object& obj, const std::string& key, const char* expected) {
  const Value* v = find(obj, key);
  if (!v) return false;
  const std::string want(expected);
  if (want == "string") return !std::holds_alternative<std::string>(v->v);
  if (want == "bool") return !std::holds_alternative<bool>(v->v);
  if (want == "u64") return !std::holds_alternative<std::uint64_t>(v->v);
  if (want == "number") {
    return !std::holds_alternative<std::uint64_t>(v->v) && !std::holds_alternative<double>(v->v);
  }
  if (want == "array") return !std::holds_alternative<Array>(v->v);
  if (want == "object") return !std::holds_alternative<Object>(v->v);
  return true;
}

}  // namespace conclave::jsonlite
