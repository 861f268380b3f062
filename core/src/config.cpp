#include "uiscope/config.hpp"
#include "uiscope/errors.hpp"
#include <fstream>
#include <sstream>

namespace uiscope {

namespace {

std::int64_t int_in_range(const json::Object &o, const std::string &key,
                          std::int64_t lo, std::int64_t hi, std::int64_t dflt) {
  auto v = json::get_int(o, key);
  if (!v)
    return dflt;
  if (*v < lo || *v > hi)
    throw InvalidInput("config key '" + key + "' out of range");
  return *v;
}

} // namespace

Config config_from_json(const json::Object &o, Config base) {
  Config c = base;
  try {
    c.capture.max_depth = (int)int_in_range(o, "max_depth", 0, 100000,
                                            c.capture.max_depth);
    c.capture.dom_mode = json::get_bool(o, "dom_mode").value_or(c.capture.dom_mode);
    c.capture.timeout = std::chrono::milliseconds(int_in_range(
        o, "timeout_ms", 1, 3600000, c.capture.timeout.count()));
    c.capture.max_workers = (unsigned)int_in_range(o, "max_workers", 1, 256,
                                                   c.capture.max_workers);
    c.capture.max_attempts = (int)int_in_range(o, "max_attempts", 1, 100,
                                               c.capture.max_attempts);
    c.capture.max_children = (std::size_t)int_in_range(
        o, "max_children", 1, 1000000, (std::int64_t)c.capture.max_children);
    c.capture.clip_to_root =
        json::get_bool(o, "clip_to_root").value_or(c.capture.clip_to_root);

    c.provider.transaction_timeout_ms = (unsigned)int_in_range(
        o, "transaction_timeout_ms", 0, 3600000, c.provider.transaction_timeout_ms);
    c.provider.connection_timeout_ms = (unsigned)int_in_range(
        o, "connection_timeout_ms", 0, 3600000, c.provider.connection_timeout_ms);

    if (auto lvl = json::get_str(o, "log_level")) {
      auto parsed = parse_log_level(*lvl);
      if (!parsed)
        throw InvalidInput("unknown log_level '" + *lvl + "'");
      c.log_level = *parsed;
    }
  } catch (const json::TypeError &e) {
    throw InvalidInput(std::string("config: ") + e.what());
  }
  return c;
}

Config load_config(const std::string &path, Config base) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw InvalidInput("cannot open config file " + path);
  std::stringstream ss;
  ss << f.rdbuf();

  json::Value v;
  try {
    v = json::parse(ss.str());
  } catch (const json::ParseError &e) {
    throw InvalidInput("config file " + path + ": " + e.what());
  }
  if (!v.is_obj())
    throw InvalidInput("config file " + path + " must hold a JSON object");
  return config_from_json(v.as_obj(), base);
}

json::Object config_to_json(const Config &c) {
  json::Object o;
  o["max_depth"] = c.capture.max_depth;
  o["dom_mode"] = c.capture.dom_mode;
  o["timeout_ms"] = (long long)c.capture.timeout.count();
  o["max_workers"] = c.capture.max_workers;
  o["max_attempts"] = c.capture.max_attempts;
  o["max_children"] = c.capture.max_children;
  o["clip_to_root"] = c.capture.clip_to_root;
  o["transaction_timeout_ms"] = c.provider.transaction_timeout_ms;
  o["connection_timeout_ms"] = c.provider.connection_timeout_ms;
  o["log_level"] = std::string(level_to_str(c.log_level));
  return o;
}

} // namespace uiscope
