#include "uiscope/tinyjson.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace uiscope::json {

namespace {

constexpr int MAX_NESTING = 256;

class Reader {
public:
  explicit Reader(std::string_view s) : s_(s) {}

  Value document() {
    ws();
    Value v = value(0);
    ws();
    if (pos_ != s_.size())
      fail("trailing characters");
    return v;
  }

private:
  std::string_view s_;
  size_t pos_ = 0;

  [[noreturn]] void fail(const char *what) const {
    throw ParseError(std::string(what) + " at offset " + std::to_string(pos_));
  }

  void ws() {
    while (pos_ < s_.size() && std::isspace((unsigned char)s_[pos_]))
      ++pos_;
  }
  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
  char next() {
    if (pos_ >= s_.size())
      fail("unexpected end");
    return s_[pos_++];
  }
  void expect(char c) {
    if (next() != c) {
      --pos_;
      fail("unexpected character");
    }
  }
  void literal(std::string_view word) {
    if (s_.substr(pos_, word.size()) != word)
      fail("bad literal");
    pos_ += word.size();
  }

  Value value(int nesting) {
    if (nesting > MAX_NESTING)
      fail("nesting too deep");
    switch (peek()) {
    case '{': return object(nesting);
    case '[': return array(nesting);
    case '"': return string();
    case 't': literal("true"); return true;
    case 'f': literal("false"); return false;
    case 'n': literal("null"); return Null{};
    default: break;
    }
    if (peek() == '-' || std::isdigit((unsigned char)peek()))
      return number();
    fail("invalid value");
  }

  Value object(int nesting) {
    Object out;
    expect('{');
    ws();
    if (peek() == '}') {
      ++pos_;
      return out;
    }
    for (;;) {
      ws();
      if (peek() != '"')
        fail("expected string key");
      std::string key = string();
      ws();
      expect(':');
      ws();
      out[std::move(key)] = value(nesting + 1);
      ws();
      char c = next();
      if (c == '}')
        return out;
      if (c != ',')
        fail("expected ',' or '}'");
    }
  }

  Value array(int nesting) {
    Array out;
    expect('[');
    ws();
    if (peek() == ']') {
      ++pos_;
      return out;
    }
    for (;;) {
      ws();
      out.push_back(value(nesting + 1));
      ws();
      char c = next();
      if (c == ']')
        return out;
      if (c != ',')
        fail("expected ',' or ']'");
    }
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
      char c = next();
      code <<= 4;
      if (c >= '0' && c <= '9')
        code |= unsigned(c - '0');
      else if (c >= 'a' && c <= 'f')
        code |= unsigned(10 + c - 'a');
      else if (c >= 'A' && c <= 'F')
        code |= unsigned(10 + c - 'A');
      else
        fail("bad unicode escape");
    }
    return code;
  }

  static void put_utf8(std::string &out, std::uint32_t cp) {
    if (cp < 0x80) {
      out.push_back((char)cp);
    } else if (cp < 0x800) {
      out.push_back((char)(0xC0 | (cp >> 6)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back((char)(0xE0 | (cp >> 12)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
      out.push_back((char)(0xF0 | (cp >> 18)));
      out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    }
  }

  std::string string() {
    std::string out;
    expect('"');
    for (;;) {
      char c = next();
      if (c == '"')
        return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      char e = next();
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
        // Accessible names regularly carry emoji; join surrogate pairs.
        if (cp >= 0xD800 && cp <= 0xDBFF && s_.substr(pos_, 2) == "\\u") {
          pos_ += 2;
          std::uint32_t lo = hex4();
          if (lo < 0xDC00 || lo > 0xDFFF)
            fail("bad surrogate pair");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        put_utf8(out, cp);
        break;
      }
      default:
        fail("bad escape");
      }
    }
  }

  Value number() {
    size_t start = pos_;
    auto digits = [&] {
      if (!std::isdigit((unsigned char)peek()))
        fail("bad number");
      while (std::isdigit((unsigned char)peek()))
        ++pos_;
    };
    if (peek() == '-')
      ++pos_;
    if (peek() == '0')
      ++pos_;
    else
      digits();
    if (peek() == '.') {
      ++pos_;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-')
        ++pos_;
      digits();
    }
    try {
      return std::stod(std::string(s_.substr(start, pos_ - start)));
    } catch (const std::out_of_range &) {
      fail("number out of range");
    }
  }
};

void write_string(std::string &out, const std::string &s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out.push_back((char)c);
      }
    }
  }
  out.push_back('"');
}

void write_number(std::string &out, double d) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  // Integral values (coordinates, ids, handles) print without a fraction.
  if (std::fabs(d) < 9.007199254740992e15 && d == std::floor(d)) {
    out += std::to_string((long long)d);
    return;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6f", d);
  std::string s = buf;
  while (s.back() == '0')
    s.pop_back();
  if (s.back() == '.')
    s.pop_back();
  out += s;
}

void write(std::string &out, const Value &v, int indent, int level) {
  auto newline = [&](int lvl) {
    if (indent <= 0)
      return;
    out.push_back('\n');
    out.append(size_t(indent * lvl), ' ');
  };

  if (v.is_null()) {
    out += "null";
  } else if (v.is_bool()) {
    out += v.as_bool() ? "true" : "false";
  } else if (v.is_num()) {
    write_number(out, v.as_num());
  } else if (v.is_str()) {
    write_string(out, v.as_str());
  } else if (v.is_arr()) {
    const Array &a = v.as_arr();
    out.push_back('[');
    for (size_t i = 0; i < a.size(); ++i) {
      if (i)
        out.push_back(',');
      newline(level + 1);
      write(out, a[i], indent, level + 1);
    }
    if (!a.empty())
      newline(level);
    out.push_back(']');
  } else {
    const Object &o = v.as_obj();
    out.push_back('{');
    bool first = true;
    for (const auto &[k, child] : o) {
      if (!first)
        out.push_back(',');
      first = false;
      newline(level + 1);
      write_string(out, k);
      out += indent > 0 ? ": " : ":";
      write(out, child, indent, level + 1);
    }
    if (!o.empty())
      newline(level);
    out.push_back('}');
  }
}

const Value *lookup(const Object &o, const std::string &k) {
  auto it = o.find(k);
  if (it == o.end() || it->second.is_null())
    return nullptr;
  return &it->second;
}

[[noreturn]] void wrong_type(const std::string &k, const char *want) {
  throw TypeError("'" + k + "' must be " + want);
}

} // namespace

Value parse(std::string_view s) { return Reader(s).document(); }

std::string dumps(const Value &v) {
  std::string out;
  write(out, v, 0, 0);
  return out;
}

std::string dumps_pretty(const Value &v) {
  std::string out;
  write(out, v, 2, 0);
  return out;
}

std::optional<std::string> get_str(const Object &o, const std::string &k) {
  const Value *v = lookup(o, k);
  if (!v)
    return std::nullopt;
  if (!v->is_str())
    wrong_type(k, "a string");
  return v->as_str();
}

std::optional<double> get_num(const Object &o, const std::string &k) {
  const Value *v = lookup(o, k);
  if (!v)
    return std::nullopt;
  if (!v->is_num())
    wrong_type(k, "a number");
  return v->as_num();
}

std::optional<std::int64_t> get_int(const Object &o, const std::string &k) {
  auto d = get_num(o, k);
  if (!d)
    return std::nullopt;
  if (*d != std::floor(*d))
    wrong_type(k, "an integer");
  // 2^63; anything at or past it does not fit.
  constexpr double LIMIT = 9223372036854775808.0;
  if (*d >= LIMIT || *d < -LIMIT)
    wrong_type(k, "a 64-bit integer");
  return (std::int64_t)*d;
}

std::optional<bool> get_bool(const Object &o, const std::string &k) {
  const Value *v = lookup(o, k);
  if (!v)
    return std::nullopt;
  if (!v->is_bool())
    wrong_type(k, "a boolean");
  return v->as_bool();
}

const Array *get_arr(const Object &o, const std::string &k) {
  const Value *v = lookup(o, k);
  if (!v)
    return nullptr;
  if (!v->is_arr())
    wrong_type(k, "an array");
  return &v->as_arr();
}

const Object *get_obj(const Object &o, const std::string &k) {
  const Value *v = lookup(o, k);
  if (!v)
    return nullptr;
  if (!v->is_obj())
    wrong_type(k, "an object");
  return &v->as_obj();
}

} // namespace uiscope::json
