#include "driftgrid/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace driftgrid::json {
namespace {

bool has_utf8_bom(const std::string& s) {
  return s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
         static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF;
}

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text), i_(has_utf8_bom(text) ? 3 : 0) {}

  Value document() {
    Value v = value();
    skip_ws();
    if (i_ != s_.size()) fail("trailing characters after JSON");
    return v;
  }

 private:
  static constexpr int kMaxDepth = 256;

  const std::string& s_;
  std::size_t i_;
  int depth_{0};

  // Bounds recursion through nested arrays/objects.
  class DepthGuard {
   public:
    explicit DepthGuard(Reader& r) : r_(r) {
      if (++r_.depth_ > kMaxDepth) r_.fail("nesting too deep");
    }
    ~DepthGuard() { --r_.depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    Reader& r_;
  };

  char peek() const { return i_ < s_.size() ? s_[i_] : '\0'; }
  bool at_end() const { return i_ >= s_.size(); }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i_, s_.size());
    int line = 1;
    int col = 1;
    std::size_t line_start = has_utf8_bom(s_) ? 3 : 0;
    for (std::size_t k = line_start; k < pos; ++k) {
      if (s_[k] == '\r' && k + 1 < s_.size() && s_[k + 1] == '\n') continue;
      if (s_[k] == '\n' || s_[k] == '\r') {
        ++line;
        col = 1;
        line_start = k + 1;
      } else {
        ++col;
      }
    }
    std::size_t line_end = line_start;
    while (line_end < s_.size() && s_[line_end] != '\n' && s_[line_end] != '\r') ++line_end;

    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << msg;
    if (line_end > line_start && line_end - line_start <= 160) {
      ss << "\n" << s_.substr(line_start, line_end - line_start) << "\n"
         << std::string(pos - line_start, ' ') << "^";
    }
    throw std::runtime_error(ss.str());
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++i_;
  }

  bool accept(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++i_;
    return true;
  }

  Value value() {
    skip_ws();
    switch (peek()) {
      case 'n': return literal("null", nullptr);
      case 't': return literal("true", true);
      case 'f': return literal("false", false);
      case '"': return string();
      case '[': return array();
      case '{': return object();
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    fail(at_end() ? "unexpected end of input" : "unexpected character");
  }

  Value literal(const char* word, Value v) {
    for (const char* p = word; *p; ++p) {
      if (peek() != *p) fail("invalid literal");
      ++i_;
    }
    return v;
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
  }

  Value number() {
    const std::size_t start = i_;
    if (peek() == '-') ++i_;
    digits();
    if (peek() == '.') {
      ++i_;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i_;
      if (peek() == '+' || peek() == '-') ++i_;
      digits();
    }
    const std::string num = s_.substr(start, i_ - start);
    return std::strtod(num.c_str(), nullptr);
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = peek();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
      ++i_;
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string raw_string() {
    expect('"');
    std::string out;
    for (;;) {
      if (at_end()) fail("unterminated string");
      const char c = s_[i_++];
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (at_end()) fail("bad escape");
      const char e = s_[i_++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (peek() != '\\') fail("expected low surrogate");
            ++i_;
            if (peek() != 'u') fail("expected low surrogate");
            ++i_;
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + (((cp - 0xD800u) << 10) | (lo - 0xDC00u));
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unexpected low surrogate");
          }
          put_utf8(cp, out);
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value string() { return raw_string(); }

  Value array() {
    const DepthGuard guard(*this);
    expect('[');
    Array arr;
    if (accept(']')) return arr;
    do {
      arr.push_back(value());
    } while (accept(','));
    expect(']');
    return arr;
  }

  Value object() {
    const DepthGuard guard(*this);
    expect('{');
    Object obj;
    if (accept('}')) return obj;
    do {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = raw_string();
      expect(':');
      obj[std::move(key)] = value();
    } while (accept(','));
    expect('}');
    return obj;
  }
};

void write_string(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (const char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void write_value(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (const bool* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const double* d = v.as_number()) {
    if (std::isfinite(*d) && std::fabs(*d - std::round(*d)) < 1e-9 && std::fabs(*d) < 9.0e15) {
      out << static_cast<long long>(std::llround(*d));
    } else if (!std::isfinite(*d)) {
      out << "null";
    } else {
      // Shortest of %.15g / %.17g that reads back to the same double.
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.15g", *d);
      if (std::strtod(buf, nullptr) != *d) std::snprintf(buf, sizeof(buf), "%.17g", *d);
      out << buf;
    }
  } else if (const std::string* s = v.as_string()) {
    write_string(*s, out);
  } else if (const Array* a = v.as_array()) {
    out << '[';
    for (std::size_t k = 0; k < a->size(); ++k) {
      newline(depth + 1);
      write_value((*a)[k], out, indent, depth + 1);
      if (k + 1 < a->size()) out << ',';
    }
    if (!a->empty()) newline(depth);
    out << ']';
  } else {
    const Object& o = v.object();
    std::vector<const std::string*> keys;
    keys.reserve(o.size());
    for (const auto& [k, _] : o) keys.push_back(&k);
    std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

    out << '{';
    for (std::size_t k = 0; k < keys.size(); ++k) {
      newline(depth + 1);
      write_string(*keys[k], out);
      out << (indent > 0 ? ": " : ":");
      write_value(o.at(*keys[k]), out, indent, depth + 1);
      if (k + 1 < keys.size()) out << ',';
    }
    if (!keys.empty()) newline(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

const Object& Value::object() const {
  const Object* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const Array* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  write_value(v, out, indent, 0);
  return out.str();
}

} // namespace driftgrid::json
