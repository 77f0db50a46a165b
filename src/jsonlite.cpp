#include "reclaim/jsonlite.hpp"

// jsonlite notes:
//
// DETERMINISM:
//   - to_json() walks Object in std::map order, so keys come out sorted.
//   - format_double() uses "%.6f" with trailing-zero trimming; the only
//     doubles in practice are negative pids and hand-written config values.
//
// DETERMINISM RISKS:
//   - std::stod() is locale-sensitive. It is used only for input parsing,
//     never for output. Output uses format_double().

#include <cctype>
#include <cstdio>
#include <cstdint>
#include <sstream>

namespace reclaim::jsonlite {

namespace {

// Arrays and objects nested deeper than this are rejected rather than
// recursed into, so a corrupt line cannot exhaust the stack.
constexpr size_t kMaxDepth = 256;

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  static void append_utf8(std::string& o, uint32_t cp) {
    if (cp < 0x80) {
      o += static_cast<char>(cp);
    } else if (cp < 0x800) {
      o += static_cast<char>(0xC0 | (cp >> 6));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      o += static_cast<char>(0xE0 | (cp >> 12));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      o += static_cast<char>(0xF0 | (cp >> 18));
      o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool parse_hex4(uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        err = JsonError{"json_parse_error", "control character in string"};
        return {};
      }
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          uint32_t cp = 0;
          if (!parse_hex4(cp)) { err = JsonError{"json_parse_error", "invalid unicode escape"}; return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            uint32_t lo = 0;
            if (!parse_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              err = JsonError{"json_parse_error", "invalid surrogate pair"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
        }
        else o += n;
      } else {
        o += c;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;

    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    try {
      if (has_frac || has_exp || num_str[0] == '-') {
        // Negative integers are stored as double to preserve the sign.
        out_val = Value{std::stod(num_str)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
      return true;
    } catch (const std::exception&) {
      err = JsonError{"json_parse_error", "number out of range"};
      return false;
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (depth >= kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
      ++depth;
      Value nested = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return nested;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      ws();
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

// Fast path for strings with no escape characters (the common case: paths,
// status codes, batch ids).
std::string escape_inner(const std::string& s) {
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
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

}  // namespace

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) return serialize(std::get<Object>(v.v));
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::string serialize(const Object& obj) {
  std::ostringstream oss; oss << "{"; bool first = true;
  for (const auto& [k, vv] : obj) {
    if (!first) oss << ",";
    first = false;
    oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv);
  }
  oss << "}";
  return oss.str();
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  auto v = p.parse_value();
  (void)v;
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  return p.err;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "top level is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return std::get<std::uint64_t>(it->second.v);
  if (std::holds_alternative<double>(it->second.v)) {
    const double d = std::get<double>(it->second.v);
    if (d >= 0.0) return static_cast<std::uint64_t>(d);
  }
  return def;
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<std::uint64_t>(it->second.v));
  }
  if (std::holds_alternative<double>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<double>(it->second.v));
  }
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

Array get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return {};
  return std::get<Array>(it->second.v);
}

Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return {};
  return std::get<Object>(it->second.v);
}

bool has_string(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<std::string>(it->second.v);
}

bool has_bool(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && std::holds_alternative<bool>(it->second.v);
}

std::string escape(const std::string& s) { return escape_inner(s); }

}  // namespace reclaim::jsonlite
