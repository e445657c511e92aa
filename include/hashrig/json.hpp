#pragma once

#include "hashrig/errors.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace hashrig {

class JsonError : public ConfigError {
public:
  using ConfigError::ConfigError;
};

class JsonValue {
public:
  using array = std::vector<JsonValue>;
  using object = std::map<std::string, JsonValue, std::less<>>;

  using storage = std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string, array, object>;

  JsonValue();
  JsonValue(std::nullptr_t value);
  JsonValue(bool value);
  JsonValue(int32_t value);
  JsonValue(int64_t value);
  JsonValue(uint32_t value);
  JsonValue(uint64_t value);
  JsonValue(double value);
  JsonValue(std::string value);
  JsonValue(const char* value);
  JsonValue(array value);
  JsonValue(object value);

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  bool as_bool() const;
  int64_t as_int64() const;
  uint64_t as_uint64() const;
  double as_double() const;
  const std::string& as_string() const;
  const array& as_array() const;
  const object& as_object() const;

  const JsonValue* find(const std::string& key) const;

  const storage& raw() const;

private:
  storage value_;
};

JsonValue parse_json(const std::string& text);
std::string to_json(const JsonValue& value, bool pretty = false, uint32_t indent = 2);

// Section readers: absent keys leave `out` untouched, wrong types throw JsonError
// naming the key.
void read_field(const JsonValue& section, const char* key, bool& out);
void read_field(const JsonValue& section, const char* key, int64_t& out);
void read_field(const JsonValue& section, const char* key, uint64_t& out);
void read_field(const JsonValue& section, const char* key, uint32_t& out);
void read_field(const JsonValue& section, const char* key, uint16_t& out);
void read_field(const JsonValue& section, const char* key, double& out);
void read_field(const JsonValue& section, const char* key, std::string& out);
void read_field(const JsonValue& section, const char* key, std::vector<std::string>& out);

} // namespace hashrig
