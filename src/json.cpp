#include "hashrig/json.hpp"

#include <charconv>
#include <cctype>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string_view>

namespace hashrig {

JsonValue::JsonValue() : value_(nullptr) {}
JsonValue::JsonValue(std::nullptr_t value) : value_(value) {}
JsonValue::JsonValue(bool value) : value_(value) {}
JsonValue::JsonValue(int32_t value) : value_(static_cast<int64_t>(value)) {}
JsonValue::JsonValue(int64_t value) : value_(value) {}
JsonValue::JsonValue(uint32_t value) : value_(static_cast<uint64_t>(value)) {}
JsonValue::JsonValue(uint64_t value) : value_(value) {}
JsonValue::JsonValue(double value) : value_(value) {}
JsonValue::JsonValue(std::string value) : value_(std::move(value)) {}
JsonValue::JsonValue(const char* value) : value_(std::string(value)) {}
JsonValue::JsonValue(array value) : value_(std::move(value)) {}
JsonValue::JsonValue(object value) : value_(std::move(value)) {}

bool JsonValue::is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
bool JsonValue::is_bool() const { return std::holds_alternative<bool>(value_); }
bool JsonValue::is_number() const {
  return std::holds_alternative<int64_t>(value_) ||
         std::holds_alternative<uint64_t>(value_) ||
         std::holds_alternative<double>(value_);
}
bool JsonValue::is_string() const { return std::holds_alternative<std::string>(value_); }
bool JsonValue::is_array() const { return std::holds_alternative<array>(value_); }
bool JsonValue::is_object() const { return std::holds_alternative<object>(value_); }

bool JsonValue::as_bool() const {
  if (!is_bool()) {
    throw JsonError("expected bool");
  }
  return std::get<bool>(value_);
}

int64_t JsonValue::as_int64() const {
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<uint64_t>(&value_)) {
    if (*v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw JsonError("number out of range for int64");
    }
    return static_cast<int64_t>(*v);
  }
  if (const auto* v = std::get_if<double>(&value_)) {
    return static_cast<int64_t>(*v);
  }
  throw JsonError("expected integer");
}

uint64_t JsonValue::as_uint64() const {
  if (const auto* v = std::get_if<uint64_t>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    if (*v < 0) {
      throw JsonError("negative number for unsigned field");
    }
    return static_cast<uint64_t>(*v);
  }
  if (const auto* v = std::get_if<double>(&value_)) {
    if (*v < 0.0) {
      throw JsonError("negative number for unsigned field");
    }
    return static_cast<uint64_t>(*v);
  }
  throw JsonError("expected unsigned integer");
}

double JsonValue::as_double() const {
  if (const auto* v = std::get_if<double>(&value_)) {
    return *v;
  }
  if (const auto* v = std::get_if<int64_t>(&value_)) {
    return static_cast<double>(*v);
  }
  if (const auto* v = std::get_if<uint64_t>(&value_)) {
    return static_cast<double>(*v);
  }
  throw JsonError("expected number");
}

const std::string& JsonValue::as_string() const {
  if (!is_string()) {
    throw JsonError("expected string");
  }
  return std::get<std::string>(value_);
}

const JsonValue::array& JsonValue::as_array() const {
  if (!is_array()) {
    throw JsonError("expected array");
  }
  return std::get<array>(value_);
}

const JsonValue::object& JsonValue::as_object() const {
  if (!is_object()) {
    throw JsonError("expected object");
  }
  return std::get<object>(value_);
}

const JsonValue* JsonValue::find(const std::string& key) const {
  if (!is_object()) {
    return nullptr;
  }
  const auto& obj = std::get<object>(value_);
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

const JsonValue::storage& JsonValue::raw() const { return value_; }

namespace {

class Parser {
public:
  explicit Parser(const std::string& text) : text_(text) {}

  JsonValue parse() {
    skip_ws();
    auto value = parse_value(0);
    skip_ws();
    if (!eof()) {
      throw error("unexpected trailing data");
    }
    return value;
  }

private:
  static constexpr uint32_t kMaxDepth = 64;

  const std::string& text_;
  size_t pos_ = 0;

  bool eof() const { return pos_ >= text_.size(); }

  char peek() const { return eof() ? '\0' : text_[pos_]; }

  char next() {
    if (eof()) {
      throw error("unexpected end of input");
    }
    return text_[pos_++];
  }

  [[nodiscard]] JsonError error(const std::string& msg) const {
    return JsonError("json: " + msg + " at offset " + std::to_string(pos_));
  }

  void skip_ws() {
    while (!eof() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  void expect(char c, const char* what) {
    if (next() != c) {
      throw error(std::string("expected ") + what);
    }
  }

  JsonValue parse_value(uint32_t depth) {
    if (depth > kMaxDepth) {
      throw error("nesting too deep");
    }
    switch (peek()) {
      case 'n': parse_literal("null"); return JsonValue(nullptr);
      case 't': parse_literal("true"); return JsonValue(true);
      case 'f': parse_literal("false"); return JsonValue(false);
      case '"': return JsonValue(parse_string());
      case '[': return JsonValue(parse_array(depth));
      case '{': return JsonValue(parse_object(depth));
      default:
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek())) != 0) {
          return parse_number();
        }
        throw error("unexpected token");
    }
  }

  void parse_literal(std::string_view lit) {
    for (const char c : lit) {
      if (next() != c) {
        throw error("invalid literal");
      }
    }
  }

  uint32_t parse_hex4() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = next();
      value <<= 4U;
      if (h >= '0' && h <= '9') {
        value |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        value |= static_cast<uint32_t>(10 + h - 'a');
      } else if (h >= 'A' && h <= 'F') {
        value |= static_cast<uint32_t>(10 + h - 'A');
      } else {
        throw error("invalid unicode escape");
      }
    }
    return value;
  }

  static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80U) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }

  std::string parse_string() {
    expect('"', "string");

    std::string out;
    while (!eof()) {
      const char c = next();
      if (c == '"') {
        return out;
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char esc = next();
      switch (esc) {
        case '"':
        case '\\':
        case '/': out.push_back(esc); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          uint32_t cp = parse_hex4();
          if (cp >= 0xD800U && cp <= 0xDBFFU) {
            expect('\\', "low surrogate");
            expect('u', "low surrogate");
            const uint32_t low = parse_hex4();
            if (low < 0xDC00U || low > 0xDFFFU) {
              throw error("invalid low surrogate");
            }
            cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
          }
          append_utf8(out, cp);
          break;
        }
        default:
          throw error("invalid string escape");
      }
    }

    throw error("unterminated string");
  }

  void skip_digits() {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
      throw error("invalid number");
    }
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      ++pos_;
    }
  }

  JsonValue parse_number() {
    const size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else {
      skip_digits();
    }
    if (peek() == '.') {
      is_float = true;
      ++pos_;
      skip_digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      is_float = true;
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      skip_digits();
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;

    if (is_float) {
      // from_chars for double is missing on some older standard libraries.
      std::istringstream iss(std::string(first, last));
      iss.imbue(std::locale::classic());
      double out = 0.0;
      if (!(iss >> out)) {
        throw error("invalid floating-point number");
      }
      return JsonValue(out);
    }
    if (*first == '-') {
      int64_t out = 0;
      if (std::from_chars(first, last, out).ec != std::errc()) {
        throw error("invalid signed number");
      }
      return JsonValue(out);
    }
    uint64_t out = 0;
    if (std::from_chars(first, last, out).ec != std::errc()) {
      throw error("invalid unsigned number");
    }
    return JsonValue(out);
  }

  JsonValue::array parse_array(uint32_t depth) {
    expect('[', "array");

    JsonValue::array out;
    skip_ws();
    if (peek() == ']') {
      ++pos_;
      return out;
    }

    while (true) {
      skip_ws();
      out.push_back(parse_value(depth + 1));
      skip_ws();
      const char c = next();
      if (c == ']') {
        return out;
      }
      if (c != ',') {
        throw error("expected ',' or ']' in array");
      }
    }
  }

  JsonValue::object parse_object(uint32_t depth) {
    expect('{', "object");

    JsonValue::object out;
    skip_ws();
    if (peek() == '}') {
      ++pos_;
      return out;
    }

    while (true) {
      skip_ws();
      if (peek() != '"') {
        throw error("expected object key");
      }
      std::string key = parse_string();
      skip_ws();
      expect(':', "':' after object key");
      skip_ws();
      out.insert_or_assign(std::move(key), parse_value(depth + 1));
      skip_ws();
      const char c = next();
      if (c == '}') {
        return out;
      }
      if (c != ',') {
        throw error("expected ',' or '}' in object");
      }
    }
  }
};

void append_indent(std::string& out, uint32_t level, uint32_t width) {
  out.append(static_cast<size_t>(level) * static_cast<size_t>(width), ' ');
}

void escape_string(const std::string& in, std::string& out) {
  out.push_back('"');
  for (const char c : in) {
    switch (c) {
      case '"': out.append("\\\""); break;
      case '\\': out.append("\\\\"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20U) {
          std::ostringstream oss;
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c));
          out.append(oss.str());
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  out.push_back('"');
}

struct Writer {
  std::string& out;
  bool pretty;
  uint32_t indent;

  void newline(uint32_t level) {
    if (pretty) {
      out.push_back('\n');
      append_indent(out, level, indent);
    }
  }

  void write(const JsonValue& value, uint32_t level) {
    const auto& raw = value.raw();
    if (std::holds_alternative<std::nullptr_t>(raw)) {
      out.append("null");
    } else if (const auto* b = std::get_if<bool>(&raw)) {
      out.append(*b ? "true" : "false");
    } else if (const auto* i = std::get_if<int64_t>(&raw)) {
      out.append(std::to_string(*i));
    } else if (const auto* u = std::get_if<uint64_t>(&raw)) {
      out.append(std::to_string(*u));
    } else if (const auto* d = std::get_if<double>(&raw)) {
      std::ostringstream oss;
      oss.imbue(std::locale::classic());
      oss << std::setprecision(17) << *d;
      out.append(oss.str());
    } else if (const auto* s = std::get_if<std::string>(&raw)) {
      escape_string(*s, out);
    } else if (const auto* arr = std::get_if<JsonValue::array>(&raw)) {
      out.push_back('[');
      for (size_t idx = 0; idx < arr->size(); ++idx) {
        newline(level + 1);
        write((*arr)[idx], level + 1);
        if (idx + 1 != arr->size()) {
          out.push_back(',');
        }
      }
      if (!arr->empty()) {
        newline(level);
      }
      out.push_back(']');
    } else {
      const auto& obj = std::get<JsonValue::object>(raw);
      out.push_back('{');
      size_t idx = 0;
      for (const auto& [key, child] : obj) {
        newline(level + 1);
        escape_string(key, out);
        out.append(pretty ? ": " : ":");
        write(child, level + 1);
        if (++idx != obj.size()) {
          out.push_back(',');
        }
      }
      if (!obj.empty()) {
        newline(level);
      }
      out.push_back('}');
    }
  }
};

template <typename Fn>
void read_typed(const JsonValue& section, const char* key, Fn&& assign) {
  const JsonValue* field = section.find(key);
  if (field == nullptr || field->is_null()) {
    return;
  }
  try {
    assign(*field);
  } catch (const JsonError& ex) {
    throw JsonError(std::string("field '") + key + "': " + ex.what());
  }
}

} // namespace

JsonValue parse_json(const std::string& text) {
  Parser parser(text);
  return parser.parse();
}

std::string to_json(const JsonValue& value, bool pretty, uint32_t indent) {
  std::string out;
  Writer writer{out, pretty, indent};
  writer.write(value, 0);
  return out;
}

void read_field(const JsonValue& section, const char* key, bool& out) {
  read_typed(section, key, [&](const JsonValue& v) { out = v.as_bool(); });
}

void read_field(const JsonValue& section, const char* key, int64_t& out) {
  read_typed(section, key, [&](const JsonValue& v) { out = v.as_int64(); });
}

void read_field(const JsonValue& section, const char* key, uint64_t& out) {
  read_typed(section, key, [&](const JsonValue& v) { out = v.as_uint64(); });
}

void read_field(const JsonValue& section, const char* key, uint32_t& out) {
  read_typed(section, key, [&](const JsonValue& v) {
    const uint64_t value = v.as_uint64();
    if (value > std::numeric_limits<uint32_t>::max()) {
      throw JsonError("value out of range");
    }
    out = static_cast<uint32_t>(value);
  });
}

void read_field(const JsonValue& section, const char* key, uint16_t& out) {
  read_typed(section, key, [&](const JsonValue& v) {
    const uint64_t value = v.as_uint64();
    if (value > std::numeric_limits<uint16_t>::max()) {
      throw JsonError("value out of range");
    }
    out = static_cast<uint16_t>(value);
  });
}

void read_field(const JsonValue& section, const char* key, double& out) {
  read_typed(section, key, [&](const JsonValue& v) { out = v.as_double(); });
}

void read_field(const JsonValue& section, const char* key, std::string& out) {
  read_typed(section, key, [&](const JsonValue& v) { out = v.as_string(); });
}

void read_field(const JsonValue& section, const char* key, std::vector<std::string>& out) {
  read_typed(section, key, [&](const JsonValue& v) {
    std::vector<std::string> values;
    for (const auto& item : v.as_array()) {
      values.push_back(item.as_string());
    }
    out = std::move(values);
  });
}

} // namespace hashrig
