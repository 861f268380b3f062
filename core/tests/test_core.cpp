#include "doctest/doctest.h"
#include "fixtures.hpp"
#include "uiscope/core.hpp"

using namespace uiscope;
using namespace uiscope::testing;

namespace {

struct Harness {
  std::shared_ptr<FakeProvider> provider;
  CaptureCoordinator coordinator;
  StateSlot slot;
  CoreEngine core;

  explicit Harness(std::shared_ptr<FakeProvider> p)
      : provider(p), coordinator(make_coordinator(p)),
        core(&coordinator, &slot) {}
};

std::shared_ptr<FakeProvider> notepad() {
  FakeNode root = window_root("Untitled - Notepad");
  FakeNode edit = make_fake_node(ControlType::Edit, "Text Editor", {0, 40, 800, 580});
  edit.props.patterns.set(Pattern::Value);
  edit.props.value = "hello";
  edit.props.has_keyboard_focus = true;
  root.add_child(std::move(edit));
  root.add_child(button("Close", {760, 0, 800, 30}));
  return std::make_shared<FakeProvider>(
      std::vector<FakeWindow>{fake_window(0x1A2B, std::move(root))});
}

CoreRequest request(const std::string &method, json::Object params = {}) {
  CoreRequest r;
  r.id = "1";
  r.method = method;
  r.params = std::move(params);
  return r;
}

json::Object windows_param(const std::string &hwnd) {
  json::Object w;
  w["hwnd"] = hwnd;
  w["title"] = "Untitled - Notepad";
  w["process"] = "notepad.exe";
  json::Object p;
  p["windows"] = json::Array{w};
  return p;
}

} // namespace

DOCTEST_TEST_CASE("tree.capture returns classified elements") {
  Harness h(notepad());
  auto resp = h.core.handle(request("tree.capture", windows_param("0x1A2B")));
  DOCTEST_REQUIRE(resp.ok);
  DOCTEST_REQUIRE(resp.metrics.count("duration_ms") == 1);

  const json::Object &res = resp.result.as_obj();
  DOCTEST_REQUIRE(res.at("cached").as_bool() == false);
  const json::Array &els = res.at("elements").as_arr();
  DOCTEST_REQUIRE(els.size() == 3);

  const json::Object &edit = els[1].as_obj();
  DOCTEST_REQUIRE(edit.at("id").as_num() == 2);
  DOCTEST_REQUIRE(edit.at("window").as_str() == "0x1A2B");
  DOCTEST_REQUIRE(edit.at("window_name").as_str() == "Untitled - Notepad");
  DOCTEST_REQUIRE(edit.at("tag").as_str() == "interactive");
  DOCTEST_REQUIRE(edit.at("control_type_name").as_str() == "Edit");
  DOCTEST_REQUIRE(edit.at("value").as_str() == "hello");
  DOCTEST_REQUIRE(edit.at("focused").as_bool());
  DOCTEST_REQUIRE(edit.at("center").as_arr()[0].as_num() == 400);
  DOCTEST_REQUIRE(edit.at("center").as_arr()[1].as_num() == 310);
  DOCTEST_REQUIRE(edit.count("scroll") == 0);

  const json::Object &counts = res.at("counts").as_obj();
  DOCTEST_REQUIRE(counts.at("total").as_num() == 3);
  DOCTEST_REQUIRE(counts.at("interactive").as_num() == 2);
  DOCTEST_REQUIRE(res.at("errors").as_arr().empty());

  DOCTEST_REQUIRE(h.slot.load() != nullptr);
}

DOCTEST_TEST_CASE("tree.capture applies per-request options") {
  Harness h(notepad());
  json::Object p = windows_param("0x1A2B");
  p["max_depth"] = 0;
  auto resp = h.core.handle(request("tree.capture", p));
  DOCTEST_REQUIRE(resp.ok);
  const json::Array &els = resp.result.as_obj().at("elements").as_arr();
  DOCTEST_REQUIRE(els.size() == 1);
  DOCTEST_REQUIRE(els[0].as_obj().at("truncated").as_bool());
}

DOCTEST_TEST_CASE("truncated marker without text has its own count") {
  FakeNode root = make_fake_node(ControlType::Pane, "", {0, 0, 800, 600});
  root.add_child(button("Hidden below the limit"));
  auto p = std::make_shared<FakeProvider>(
      std::vector<FakeWindow>{fake_window(0x1A2B, std::move(root))});
  Harness h(p);
  json::Object params = windows_param("0x1A2B");
  params["max_depth"] = 0;

  auto resp = h.core.handle(request("tree.capture", params));
  DOCTEST_REQUIRE(resp.ok);
  const json::Object &res = resp.result.as_obj();
  const json::Array &els = res.at("elements").as_arr();
  DOCTEST_REQUIRE(els.size() == 1);
  DOCTEST_REQUIRE(els[0].as_obj().at("tag").as_str() == "ignored");
  DOCTEST_REQUIRE(els[0].as_obj().at("truncated").as_bool());

  const json::Object &counts = res.at("counts").as_obj();
  DOCTEST_REQUIRE(counts.at("total").as_num() == 1);
  DOCTEST_REQUIRE(counts.at("boundary").as_num() == 1);
  DOCTEST_REQUIRE(counts.at("interactive").as_num() == 0);
  DOCTEST_REQUIRE(counts.at("informative").as_num() == 0);
}

DOCTEST_TEST_CASE("tree.state reuses a current capture until invalidated") {
  Harness h(notepad());
  auto first = h.core.handle(request("tree.state", windows_param("0x1A2B")));
  DOCTEST_REQUIRE(first.ok);
  DOCTEST_REQUIRE(first.result.as_obj().at("cached").as_bool() == false);
  int connects = h.provider->connects();

  auto second = h.core.handle(request("tree.state", windows_param("0x1A2B")));
  DOCTEST_REQUIRE(second.result.as_obj().at("cached").as_bool());
  DOCTEST_REQUIRE(h.provider->connects() == connects);

  json::Object inv;
  inv["hwnd"] = "0x1A2B";
  inv["kind"] = "focus";
  auto bumped = h.core.handle(request("tree.invalidate", inv));
  DOCTEST_REQUIRE(bumped.ok);
  DOCTEST_REQUIRE(bumped.result.as_obj().at("bumped").as_bool());
  DOCTEST_REQUIRE(bumped.result.as_obj().at("generation").as_num() == 1);

  auto folded = h.core.handle(request("tree.invalidate", inv));
  DOCTEST_REQUIRE(folded.result.as_obj().at("bumped").as_bool() == false);

  auto third = h.core.handle(request("tree.state", windows_param("0x1A2B")));
  DOCTEST_REQUIRE(third.result.as_obj().at("cached").as_bool() == false);
  DOCTEST_REQUIRE(third.result.as_obj().at("generation").as_num() == 1);

  auto gen = h.core.handle(request("tree.generation"));
  DOCTEST_REQUIRE(gen.result.as_obj().at("generation").as_num() == 1);
  DOCTEST_REQUIRE(gen.result.as_obj().at("published").as_num() == 1);
}

DOCTEST_TEST_CASE("tree.state recaptures for a different window set") {
  Harness h(notepad());
  h.core.handle(request("tree.state", windows_param("0x1A2B")));

  auto resp = h.core.handle(request("tree.state", windows_param("0x1A2C")));
  DOCTEST_REQUIRE(resp.ok);
  DOCTEST_REQUIRE(resp.result.as_obj().at("cached").as_bool() == false);
  // Unknown handle: captured as a failed window, not a failed request.
  DOCTEST_REQUIRE(resp.result.as_obj().at("errors").as_arr().size() == 1);
}

DOCTEST_TEST_CASE("tree.generation before any capture") {
  Harness h(notepad());
  auto resp = h.core.handle(request("tree.generation"));
  DOCTEST_REQUIRE(resp.ok);
  DOCTEST_REQUIRE(resp.result.as_obj().at("generation").as_num() == 0);
  DOCTEST_REQUIRE(resp.result.as_obj().at("published").is_null());
}

DOCTEST_TEST_CASE("bad requests map to error codes") {
  Harness h(notepad());

  auto unknown = h.core.handle(request("tree.explode"));
  DOCTEST_REQUIRE_FALSE(unknown.ok);
  DOCTEST_REQUIRE(unknown.error_code == "E_BAD_METHOD");

  auto no_windows = h.core.handle(request("tree.capture"));
  DOCTEST_REQUIRE(no_windows.error_code == "E_INVALID_INPUT");

  auto bad_hwnd = h.core.handle(request("tree.capture", windows_param("1234")));
  DOCTEST_REQUIRE(bad_hwnd.error_code == "E_INVALID_INPUT");

  json::Object p = windows_param("0x1A2B");
  p["max_depth"] = "deep";
  auto bad_type = h.core.handle(request("tree.capture", p));
  DOCTEST_REQUIRE(bad_type.error_code == "E_INVALID_INPUT");

  json::Object inv;
  inv["hwnd"] = "0x1A2B";
  inv["kind"] = "resize";
  auto bad_kind = h.core.handle(request("tree.invalidate", inv));
  DOCTEST_REQUIRE(bad_kind.error_code == "E_INVALID_INPUT");

  auto obj = bad_kind.to_json_obj();
  DOCTEST_REQUIRE(obj.at("ok").as_bool() == false);
  DOCTEST_REQUIRE(obj.at("error").as_obj().at("code").as_str() == "E_INVALID_INPUT");
  DOCTEST_REQUIRE(obj.count("result") == 0);
}

DOCTEST_TEST_CASE("daemon.logs returns recent log lines") {
  Harness h(notepad());
  Logger::get().set_quiet(true);
  LOG_WARN("marker line for the log test");

  json::Object p;
  p["count"] = 5;
  auto resp = h.core.handle(request("daemon.logs", p));
  Logger::get().set_quiet(false);
  DOCTEST_REQUIRE(resp.ok);
  const json::Array &logs = resp.result.as_arr();
  DOCTEST_REQUIRE(!logs.empty());
  DOCTEST_REQUIRE(logs.size() <= 5);

  bool seen = false;
  for (const auto &l : logs) {
    if (l.as_obj().at("message").as_str() == "marker line for the log test") {
      seen = true;
      DOCTEST_REQUIRE(l.as_obj().at("level").as_str() == "WARN");
    }
  }
  DOCTEST_REQUIRE(seen);
}

DOCTEST_TEST_CASE("request json parsing") {
  CoreRequest r = parse_request_json(
      R"({"id":"7","method":"tree.capture","params":{"windows":[{"hwnd":"0x10"}]}})");
  DOCTEST_REQUIRE(r.id == "7");
  DOCTEST_REQUIRE(r.method == "tree.capture");
  DOCTEST_REQUIRE(parse_windows(r.params).at(0).hwnd == 0x10);

  CoreRequest bare = parse_request_json(R"({"id":"8","method":"tree.generation"})");
  DOCTEST_REQUIRE(bare.params.empty());

  DOCTEST_REQUIRE_THROWS(parse_request_json("[]"));
  DOCTEST_REQUIRE_THROWS(parse_request_json(R"({"id":"1"})"));
  DOCTEST_REQUIRE_THROWS(parse_request_json(R"({"id":1,"method":"x"})"));
  DOCTEST_REQUIRE_THROWS(parse_request_json(R"({"id":"1","method":"x","params":[]})"));
}

DOCTEST_TEST_CASE("response serialization") {
  CoreResponse resp;
  resp.id = "9";
  json::Object r;
  r["generation"] = 3;
  resp.result = r;
  DOCTEST_REQUIRE(serialize_response_json(resp) ==
                  R"({"id":"9","ok":true,"result":{"generation":3}})");
}
