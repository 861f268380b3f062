#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uiscope::json {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;
using Null = std::monostate;

struct Value : std::variant<Null, bool, double, std::string, Array, Object> {
  using variant::variant;

  Value() = default;
  Value(int v) : variant(static_cast<double>(v)) {}
  Value(long v) : variant(static_cast<double>(v)) {}
  Value(long long v) : variant(static_cast<double>(v)) {}
  Value(unsigned v) : variant(static_cast<double>(v)) {}
  Value(unsigned long v) : variant(static_cast<double>(v)) {}
  Value(unsigned long long v) : variant(static_cast<double>(v)) {}
  Value(const char *s) : variant(std::string(s)) {}

  bool is_null() const { return std::holds_alternative<Null>(*this); }
  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_num() const { return std::holds_alternative<double>(*this); }
  bool is_str() const { return std::holds_alternative<std::string>(*this); }
  bool is_arr() const { return std::holds_alternative<Array>(*this); }
  bool is_obj() const { return std::holds_alternative<Object>(*this); }

  const Object &as_obj() const { return std::get<Object>(*this); }
  const Array &as_arr() const { return std::get<Array>(*this); }
  const std::string &as_str() const { return std::get<std::string>(*this); }
  double as_num() const { return std::get<double>(*this); }
  bool as_bool() const { return std::get<bool>(*this); }

  Object &obj() { return std::get<Object>(*this); }
  Array &arr() { return std::get<Array>(*this); }
};

class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Thrown by the typed getters when a key is present with the wrong type.
class TypeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

Value parse(std::string_view s);

// Compact output; object keys come out sorted.
std::string dumps(const Value &v);
// Two-space indented output for humans.
std::string dumps_pretty(const Value &v);

// Missing keys and explicit nulls read as nullopt.
std::optional<std::string> get_str(const Object &o, const std::string &k);
std::optional<double> get_num(const Object &o, const std::string &k);
std::optional<std::int64_t> get_int(const Object &o, const std::string &k);
std::optional<bool> get_bool(const Object &o, const std::string &k);
const Array *get_arr(const Object &o, const std::string &k);
const Object *get_obj(const Object &o, const std::string &k);

} // namespace uiscope::json
