#include "shipcoord/util/json.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace shipcoord::json {
namespace {

constexpr std::size_t kMaxCaretLine = 120;
constexpr int kMaxDepth = 256;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void put_utf8(std::uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
    return;
  }
  if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  }
  out += static_cast<char>(0x80 | (cp & 0x3F));
}

// Recursive-descent reader. Line and column are tracked as characters are
// consumed so errors can point at the offending character.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {
    if (text_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      pos_ = 3;
      line_start_ = 3;
    }
  }

  Value document() {
    Value v = value(0);
    skip_space();
    if (pos_ < text_.size()) error("trailing characters after the document");
    return v;
  }

 private:
  const std::string& text_;
  std::size_t pos_{0};
  std::size_t line_start_{0};
  int line_{1};

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  char take() {
    if (at_end()) return '\0';
    const char c = text_[pos_++];
    if (c == '\n' || (c == '\r' && peek() != '\n')) {
      ++line_;
      line_start_ = pos_;
    }
    return c;
  }

  void skip_space() {
    while (!at_end() && is_space(peek())) take();
  }

  [[noreturn]] void error(const std::string& what) const {
    const std::size_t col = pos_ - line_start_ + 1;
    std::string msg = "JSON error at line " + std::to_string(line_) + ", column " + std::to_string(col) + ": " + what;

    std::size_t end = line_start_;
    while (end < text_.size() && text_[end] != '\n' && text_[end] != '\r') ++end;
    if (end > line_start_ && end - line_start_ <= kMaxCaretLine) {
      msg += "\n" + text_.substr(line_start_, end - line_start_) + "\n" + std::string(col - 1, ' ') + "^";
    }
    throw std::runtime_error(msg);
  }

  std::string describe_next() const {
    if (at_end()) return "end of input";
    return std::string("'") + peek() + "'";
  }

  void require(char c) {
    skip_space();
    if (peek() != c) error(std::string("expected '") + c + "' but found " + describe_next());
    take();
  }

  bool accept(char c) {
    skip_space();
    if (peek() != c) return false;
    take();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) error("nesting too deep");
    skip_space();
    switch (peek()) {
      case '{': return object(depth);
      case '[': return array(depth);
      case '"': return string();
      case 't': return word("true", true);
      case 'f': return word("false", false);
      case 'n': return word("null", nullptr);
      default: break;
    }
    if (peek() == '-' || is_digit(peek())) return number();
    error("unexpected " + describe_next());
  }

  Value word(const char* w, Value v) {
    for (const char* p = w; *p; ++p) {
      if (peek() != *p) error(std::string("unexpected ") + describe_next() + " in literal '" + w + "'");
      take();
    }
    return v;
  }

  void digit_run(const char* what) {
    if (!is_digit(peek())) error(std::string("expected digits in ") + what);
    while (is_digit(peek())) take();
  }

  Value number() {
    const std::size_t start = pos_;
    if (peek() == '-') take();
    if (peek() == '0') {
      take();
    } else {
      digit_run("number");
    }
    if (peek() == '.') {
      take();
      digit_run("fraction");
    }
    if (peek() == 'e' || peek() == 'E') {
      take();
      if (peek() == '+' || peek() == '-') take();
      digit_run("exponent");
    }
    const std::string token = text_.substr(start, pos_ - start);
    const double d = std::strtod(token.c_str(), nullptr);
    if (!std::isfinite(d)) error("number out of range: " + token);
    return d;
  }

  std::uint32_t hex4() {
    std::uint32_t cp = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_digit(peek());
      if (h < 0) error("expected four hex digits after \\u");
      take();
      cp = (cp << 4) | static_cast<std::uint32_t>(h);
    }
    return cp;
  }

  std::string string() {
    require('"');
    std::string out;
    for (;;) {
      if (at_end()) error("unterminated string");
      const char c = take();
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      const char esc = take();
      switch (esc) {
        case '"':
        case '\\':
        case '/': out += esc; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xDC00 && cp <= 0xDFFF) error("unpaired low surrogate");
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (take() != '\\' || take() != 'u') error("expected a low surrogate");
            const std::uint32_t lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) error("invalid low surrogate");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          put_utf8(cp, out);
          break;
        }
        default: error(std::string("unknown escape '\\") + esc + "'");
      }
    }
  }

  Value array(int depth) {
    require('[');
    Array out;
    if (accept(']')) return out;
    do {
      out.push_back(value(depth + 1));
    } while (accept(','));
    require(']');
    return out;
  }

  Value object(int depth) {
    require('{');
    Object out;
    if (accept('}')) return out;
    do {
      skip_space();
      if (peek() != '"') error("expected a quoted key but found " + describe_next());
      std::string key = string();
      require(':');
      out[std::move(key)] = value(depth + 1);
    } while (accept(','));
    require('}');
    return out;
  }
};

void write_quoted(const std::string& s, std::string& out) {
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_number(double d, std::string& out) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  if (d == std::floor(d) && std::fabs(d) < 9.0e15) {
    out += std::to_string(static_cast<long long>(d));
    return;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", d);
  out += buf;
}

class Writer {
 public:
  explicit Writer(int indent) : indent_(indent) {}

  void write(const Value& v, int depth) {
    if (v.is_null()) {
      out_ += "null";
    } else if (const bool* b = v.as_bool()) {
      out_ += *b ? "true" : "false";
    } else if (const double* d = v.as_number()) {
      write_number(*d, out_);
    } else if (const std::string* s = v.as_string()) {
      write_quoted(*s, out_);
    } else if (const Array* a = v.as_array()) {
      out_ += '[';
      for (std::size_t k = 0; k < a->size(); ++k) {
        if (k) out_ += ',';
        newline(depth + 1);
        write((*a)[k], depth + 1);
      }
      if (!a->empty()) newline(depth);
      out_ += ']';
    } else {
      const Object& o = v.object();
      std::vector<Object::const_iterator> members;
      members.reserve(o.size());
      for (auto it = o.begin(); it != o.end(); ++it) members.push_back(it);
      std::sort(members.begin(), members.end(),
                [](Object::const_iterator x, Object::const_iterator y) { return x->first < y->first; });

      out_ += '{';
      for (std::size_t k = 0; k < members.size(); ++k) {
        if (k) out_ += ',';
        newline(depth + 1);
        write_quoted(members[k]->first, out_);
        out_ += indent_ > 0 ? ": " : ":";
        write(members[k]->second, depth + 1);
      }
      if (!members.empty()) newline(depth);
      out_ += '}';
    }
  }

  std::string take() { return std::move(out_); }

 private:
  int indent_;
  std::string out_;

  void newline(int depth) {
    if (indent_ <= 0) return;
    out_ += '\n';
    out_.append(static_cast<std::size_t>(depth * indent_), ' ');
  }
};

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const char* Value::type_name() const {
  static const char* const kNames[] = {"null", "bool", "number", "string", "array", "object"};
  return kNames[index()];
}

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Object& Value::object() const {
  if (const Object* o = as_object()) return *o;
  throw std::runtime_error(std::string("expected a JSON object, got ") + type_name());
}

const Array& Value::array() const {
  if (const Array* a = as_array()) return *a;
  throw std::runtime_error(std::string("expected a JSON array, got ") + type_name());
}

const Value& Value::at(const std::string& key) const {
  const Object& o = object();
  const auto it = o.find(key);
  if (it == o.end()) throw std::runtime_error("missing JSON key '" + key + "'");
  return it->second;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) {
    throw std::runtime_error("JSON index " + std::to_string(index) + " out of range (size " +
                             std::to_string(a.size()) + ")");
  }
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  const bool* b = as_bool();
  return b ? *b : def;
}

double Value::number_value(double def) const {
  const double* d = as_number();
  return d ? *d : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* d = as_number();
  return d ? static_cast<std::int64_t>(std::llround(*d)) : def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* s = as_string();
  return s ? *s : def;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  Writer w(indent);
  w.write(v, 0);
  return w.take();
}

} // namespace shipcoord::json
