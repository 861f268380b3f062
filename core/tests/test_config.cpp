#include "doctest/doctest.h"
#include "uiscope/config.hpp"
#include "uiscope/errors.hpp"
#include <cstdio>
#include <fstream>

using namespace uiscope;

DOCTEST_TEST_CASE("config defaults") {
  Config c = config_from_json(json::Object{});
  DOCTEST_REQUIRE(c.capture.max_depth == 200);
  DOCTEST_REQUIRE(c.capture.max_children == 512);
  DOCTEST_REQUIRE(c.capture.max_attempts == 3);
  DOCTEST_REQUIRE(c.capture.timeout.count() == 10000);
  DOCTEST_REQUIRE_FALSE(c.capture.dom_mode);
  DOCTEST_REQUIRE(c.log_level == LogLevel::INFO);
}

DOCTEST_TEST_CASE("config keys overlay the base") {
  json::Object o;
  o["max_depth"] = 50;
  o["dom_mode"] = true;
  o["timeout_ms"] = 2500;
  o["max_workers"] = 2;
  o["clip_to_root"] = false;
  o["log_level"] = "debug";
  o["connection_timeout_ms"] = 800;
  o["something_else"] = "ignored";

  Config base;
  base.capture.max_attempts = 5;
  Config c = config_from_json(o, base);
  DOCTEST_REQUIRE(c.capture.max_depth == 50);
  DOCTEST_REQUIRE(c.capture.dom_mode);
  DOCTEST_REQUIRE(c.capture.timeout.count() == 2500);
  DOCTEST_REQUIRE(c.capture.max_workers == 2);
  DOCTEST_REQUIRE_FALSE(c.capture.clip_to_root);
  DOCTEST_REQUIRE(c.capture.max_attempts == 5);
  DOCTEST_REQUIRE(c.provider.connection_timeout_ms == 800);
  DOCTEST_REQUIRE(c.log_level == LogLevel::DEBUG);
}

DOCTEST_TEST_CASE("bad config values are rejected") {
  auto with = [](const char *key, json::Value v) {
    json::Object o;
    o[key] = std::move(v);
    return o;
  };
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("max_depth", -1)), InvalidInput);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("max_depth", "200")), InvalidInput);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("max_workers", 0)), InvalidInput);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("timeout_ms", 1.5)), InvalidInput);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("dom_mode", 1)), InvalidInput);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(with("log_level", "loud")), InvalidInput);
  // Explicit null means "not set".
  DOCTEST_REQUIRE(config_from_json(with("max_depth", json::Null{})).capture.max_depth ==
                  200);
}

DOCTEST_TEST_CASE("out of range numbers are rejected") {
  DOCTEST_REQUIRE_THROWS_AS(json::parse("1e400"), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse("[-1e400]"), json::ParseError);

  json::Object o;
  o["max_depth"] = 1e19;
  DOCTEST_REQUIRE_THROWS_AS(json::get_int(o, "max_depth"), json::TypeError);
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(o), InvalidInput);
  o["max_depth"] = -1e19;
  DOCTEST_REQUIRE_THROWS_AS(config_from_json(o), InvalidInput);

  const char *path = "uiscope_huge_config.json";
  {
    std::ofstream f(path);
    f << "{\"max_depth\": 1e400}";
  }
  DOCTEST_REQUIRE_THROWS_AS(load_config(path), InvalidInput);
  std::remove(path);
}

DOCTEST_TEST_CASE("config file round trip") {
  const char *path = "uiscope_test_config.json";
  Config c;
  c.capture.max_depth = 12;
  c.capture.dom_mode = true;
  c.log_level = LogLevel::WARN;
  {
    std::ofstream f(path);
    f << json::dumps_pretty(config_to_json(c));
  }
  Config back = load_config(path);
  std::remove(path);

  DOCTEST_REQUIRE(back.capture.max_depth == 12);
  DOCTEST_REQUIRE(back.capture.dom_mode);
  DOCTEST_REQUIRE(back.log_level == LogLevel::WARN);
  DOCTEST_REQUIRE(back.capture.max_children == c.capture.max_children);
}

DOCTEST_TEST_CASE("unreadable or malformed config files") {
  DOCTEST_REQUIRE_THROWS_AS(load_config("does/not/exist.json"), InvalidInput);

  const char *path = "uiscope_bad_config.json";
  {
    std::ofstream f(path);
    f << "{\"max_depth\": ";
  }
  DOCTEST_REQUIRE_THROWS_AS(load_config(path), InvalidInput);
  {
    std::ofstream f(path);
    f << "[1, 2]";
  }
  DOCTEST_REQUIRE_THROWS_AS(load_config(path), InvalidInput);
  std::remove(path);
}

DOCTEST_TEST_CASE("json parse and dump") {
  json::Value v = json::parse(R"( {"b": [1, 2.5, true, null], "a": "x\ny"} )");
  DOCTEST_REQUIRE(v.is_obj());
  const auto &o = v.as_obj();
  DOCTEST_REQUIRE(o.at("a").as_str() == "x\ny");
  DOCTEST_REQUIRE(o.at("b").as_arr().size() == 4);
  DOCTEST_REQUIRE(o.at("b").as_arr()[3].is_null());
  DOCTEST_REQUIRE(json::dumps(v) == R"({"a":"x\ny","b":[1,2.5,true,null]})");

  DOCTEST_REQUIRE(json::dumps_pretty(json::parse("[]")) == "[]");
  DOCTEST_REQUIRE(json::dumps_pretty(json::parse(R"({"k":1})")) == "{\n  \"k\": 1\n}");
}

DOCTEST_TEST_CASE("json unicode escapes") {
  json::Value v = json::parse(R"("caf\u00e9 \ud83d\ude00")");
  DOCTEST_REQUIRE(v.as_str() == "caf\xc3\xa9 \xf0\x9f\x98\x80");
  DOCTEST_REQUIRE_THROWS_AS(json::parse(R"("\ud83d\u0041")"), json::ParseError);
}

DOCTEST_TEST_CASE("json rejects malformed input") {
  DOCTEST_REQUIRE_THROWS_AS(json::parse(""), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse("{\"a\":1,}"), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse("[1] x"), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse("tru"), json::ParseError);
  DOCTEST_REQUIRE_THROWS_AS(json::parse(std::string(300, '[')), json::ParseError);
}

DOCTEST_TEST_CASE("typed getters") {
  json::Object o;
  o["n"] = 3;
  o["s"] = "str";
  o["z"] = json::Null{};
  DOCTEST_REQUIRE(json::get_int(o, "n") == 3);
  DOCTEST_REQUIRE_FALSE(json::get_int(o, "missing").has_value());
  DOCTEST_REQUIRE_FALSE(json::get_str(o, "z").has_value());
  DOCTEST_REQUIRE(json::get_arr(o, "missing") == nullptr);
  DOCTEST_REQUIRE_THROWS_AS(json::get_arr(o, "n"), json::TypeError);
  DOCTEST_REQUIRE_THROWS_AS(json::get_str(o, "n"), json::TypeError);
}
