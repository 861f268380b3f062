#include "uiscope/core.hpp"
#include "uiscope/config.hpp"
#include "uiscope/errors.hpp"
#include <chrono>
#include <stdexcept>

namespace uiscope {

static json::Value make_error(const std::string &code, const std::string &msg) {
  json::Object e;
  e["code"] = code;
  e["message"] = msg;
  return e;
}

json::Object CoreResponse::to_json_obj() const {
  json::Object o;
  o["id"] = id;
  o["ok"] = ok;
  if (ok)
    o["result"] = result;
  else
    o["error"] = make_error(error_code, error_message);

  if (!metrics.empty()) {
    o["metrics"] = metrics;
  }
  return o;
}

CoreEngine::CoreEngine(CaptureCoordinator *coordinator, StateSlot *slot,
                       CaptureOptions defaults)
    : coordinator_(coordinator), slot_(slot), defaults_(defaults) {
  if (!coordinator_ || !slot_)
    throw std::invalid_argument("CoreEngine needs a coordinator and a state slot");
}

static json::Object rect_to_json(const Rect &r) {
  json::Object o;
  o["left"] = r.left;
  o["top"] = r.top;
  o["right"] = r.right;
  o["bottom"] = r.bottom;
  return o;
}

static const char *toggle_name(ToggleState t) {
  switch (t) {
  case ToggleState::On: return "on";
  case ToggleState::Indeterminate: return "indeterminate";
  default: return "off";
  }
}

json::Object element_to_json(const ElementNode &n) {
  const ClassifiedElement &e = as_element(n);
  json::Object o;
  o["id"] = e.id;
  o["window"] = Hwnd(e.window).to_string();
  o["window_index"] = e.window_index;
  o["window_name"] = e.window_name;
  o["control_type"] = e.control_type;
  o["control_type_name"] = e.control_type_name;
  o["name"] = e.name;
  o["automation_id"] = e.automation_id;
  if (!e.accelerator_key.empty())
    o["accelerator_key"] = e.accelerator_key;
  // "ignored" only appears on a truncated depth-limit node kept as a marker.
  o["tag"] = to_string(e.tag);
  o["bounding_box"] = rect_to_json(e.bounding_box);
  o["visible_box"] = rect_to_json(e.visible_box);
  auto c = e.visible_box.empty() ? e.bounding_box.center() : e.visible_box.center();
  o["center"] = json::Array{c.first, c.second};
  if (e.value)
    o["value"] = *e.value;
  if (e.toggle)
    o["toggle"] = toggle_name(*e.toggle);
  o["depth"] = e.depth;
  o["focused"] = e.is_focused;
  o["truncated"] = e.truncated;

  if (const ScrollElementNode *s = as_scroll(n)) {
    json::Object so;
    so["horizontally_scrollable"] = s->horizontally_scrollable;
    so["vertically_scrollable"] = s->vertically_scrollable;
    so["horizontal_percent"] = s->horizontal_scroll_percent;
    so["vertical_percent"] = s->vertical_scroll_percent;
    so["horizontal_view_size"] = s->horizontal_view_size;
    so["vertical_view_size"] = s->vertical_view_size;
    o["scroll"] = so;
  }
  return o;
}

static json::Object summary_to_json(const WindowSummary &w) {
  json::Object o;
  o["window_index"] = w.window_index;
  o["hwnd"] = Hwnd(w.hwnd).to_string();
  o["window_name"] = w.window_name;
  o["strategy"] = to_string(w.strategy);
  o["dom_scoped"] = w.dom_scoped;
  o["completed"] = w.completed;
  o["visited"] = w.visited;
  o["recorded"] = w.recorded;
  o["skipped_subtrees"] = w.skipped_subtrees;
  o["truncated"] = w.truncated;
  o["capped_children"] = w.capped_children;
  o["live_queries"] = w.live_queries;
  o["elapsed_ms"] = (long long)w.elapsed.count();
  return o;
}

static json::Object error_to_json(const WindowError &e) {
  json::Object o;
  o["window_index"] = e.window_index;
  o["hwnd"] = Hwnd(e.hwnd).to_string();
  o["kind"] = to_string(e.kind);
  o["message"] = e.message;
  o["fatal"] = e.fatal;
  return o;
}

json::Object tree_state_to_json(const TreeState &s) {
  json::Object o;
  o["generation"] = s.generation();

  json::Array elements;
  for (const auto &n : s.elements())
    elements.push_back(element_to_json(n));
  o["elements"] = std::move(elements);

  json::Array windows;
  for (const auto &w : s.windows())
    windows.push_back(summary_to_json(w));
  o["windows"] = std::move(windows);

  json::Array errors;
  for (const auto &e : s.errors())
    errors.push_back(error_to_json(e));
  o["errors"] = std::move(errors);

  json::Object counts;
  counts["total"] = s.size();
  counts["interactive"] = s.interactive().size();
  counts["scrollable"] = s.scrollable().size();
  counts["informative"] = s.informative().size();
  std::size_t boundary = 0;
  for (const auto &n : s.elements()) {
    if (as_element(n).tag == Classification::Ignored)
      ++boundary;
  }
  counts["boundary"] = boundary;
  o["counts"] = counts;
  return o;
}

std::vector<WindowHandle> parse_windows(const json::Object &params) {
  const json::Array *arr = json::get_arr(params, "windows");
  if (!arr)
    throw InvalidInput("missing windows");
  std::vector<WindowHandle> out;
  for (const auto &v : *arr) {
    if (!v.is_obj())
      throw InvalidInput("window entries must be objects");
    const json::Object &w = v.as_obj();
    auto hwnd_s = json::get_str(w, "hwnd");
    if (!hwnd_s)
      throw InvalidInput("window entry missing hwnd");
    auto hwnd = parse_hwnd(*hwnd_s);
    if (!hwnd)
      throw InvalidInput("bad hwnd '" + *hwnd_s + "'");
    WindowHandle h;
    h.hwnd = *hwnd;
    h.title = json::get_str(w, "title").value_or("");
    h.process_name = json::get_str(w, "process").value_or("");
    h.class_name = json::get_str(w, "class_name").value_or("");
    out.push_back(std::move(h));
  }
  return out;
}

json::Value CoreEngine::capture_and_publish(const json::Object &params) {
  Config base;
  base.capture = defaults_;
  CaptureOptions opts = config_from_json(params, base).capture;
  auto windows = parse_windows(params);

  auto state = coordinator_->capture(windows, opts);
  slot_->publish(state);
  json::Object o = tree_state_to_json(*state);
  o["cached"] = false;
  return o;
}

CoreResponse CoreEngine::handle(const CoreRequest &req) {
  auto start_time = std::chrono::steady_clock::now();
  CoreResponse resp;
  resp.id = req.id;
  LOG_DEBUG("Handling request: " + req.method + " (id: " + req.id + ")");

  try {
    if (req.method == "tree.capture") {
      resp.result = capture_and_publish(req.params);
    } else if (req.method == "tree.state") {
      auto current = slot_->load();
      bool reuse = current && slot_->is_current(*coordinator_->generation());
      if (reuse && json::get_arr(req.params, "windows")) {
        std::vector<hwnd_u64> wanted;
        for (const auto &w : parse_windows(req.params))
          wanted.push_back(w.hwnd);
        reuse = wanted == current->window_handles();
      }
      if (reuse) {
        json::Object o = tree_state_to_json(*current);
        o["cached"] = true;
        resp.result = o;
      } else {
        resp.result = capture_and_publish(req.params);
      }
    } else if (req.method == "tree.invalidate") {
      auto hwnd_s = json::get_str(req.params, "hwnd");
      if (!hwnd_s)
        throw InvalidInput("missing hwnd");
      auto hwnd = parse_hwnd(*hwnd_s);
      if (!hwnd)
        throw InvalidInput("bad hwnd");
      auto kind_s = json::get_str(req.params, "kind").value_or("structure");
      auto kind = parse_change_kind(kind_s);
      if (!kind)
        throw InvalidInput("unknown change kind '" + kind_s + "'");
      bool bumped = coordinator_->generation()->notify(*hwnd, *kind);
      json::Object o;
      o["generation"] = coordinator_->generation()->current();
      o["bumped"] = bumped;
      resp.result = o;
    } else if (req.method == "tree.generation") {
      json::Object o;
      o["generation"] = coordinator_->generation()->current();
      auto current = slot_->load();
      o["published"] = current ? json::Value(current->generation()) : json::Value();
      resp.result = o;
    } else if (req.method == "daemon.logs") {
      auto count = json::get_int(req.params, "count").value_or(100);
      auto logs = Logger::get().get_recent_logs(count > 0 ? (size_t)count : 0);
      json::Array arr;
      for (const auto &l : logs) {
        json::Object lo;
        lo["timestamp"] = l.timestamp;
        lo["level"] = level_to_str(l.level);
        lo["thread"] = l.thread;
        lo["message"] = l.message;
        arr.push_back(lo);
      }
      resp.result = arr;
    } else {
      resp.ok = false;
      resp.error_code = "E_BAD_METHOD";
      resp.error_message = "unknown method";
      LOG_WARN("Method not implemented: " + req.method);
    }
  } catch (const InvalidInput &e) {
    resp.ok = false;
    resp.error_code = "E_INVALID_INPUT";
    resp.error_message = e.what();
    LOG_WARN("Rejected request: " + std::string(e.what()));
  } catch (const std::logic_error &e) {
    resp.ok = false;
    resp.error_code = "E_INTERNAL";
    resp.error_message = e.what();
    LOG_ERROR("Internal error: " + std::string(e.what()));
  } catch (const std::exception &e) {
    resp.ok = false;
    resp.error_code = "E_BAD_REQUEST";
    resp.error_message = e.what();
    LOG_ERROR("Request failed: " + std::string(e.what()));
  }

  auto end_time = std::chrono::steady_clock::now();
  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  resp.metrics["duration_ms"] = (long long)duration_ms;

  return resp;
}

CoreRequest parse_request_json(std::string_view json_utf8) {
  auto v = json::parse(json_utf8);
  if (!v.is_obj())
    throw std::runtime_error("request must be object");
  const auto &o = v.as_obj();

  auto it_id = o.find("id");
  auto it_m = o.find("method");
  if (it_id == o.end() || it_m == o.end())
    throw std::runtime_error("missing fields");
  if (!it_id->second.is_str() || !it_m->second.is_str())
    throw std::runtime_error("bad field types");

  CoreRequest r;
  r.id = it_id->second.as_str();
  r.method = it_m->second.as_str();
  auto it_p = o.find("params");
  if (it_p != o.end()) {
    if (!it_p->second.is_obj())
      throw std::runtime_error("params must be an object");
    r.params = it_p->second.as_obj();
  }
  return r;
}

std::string serialize_response_json(const CoreResponse &resp, bool pretty) {
  json::Value v = resp.to_json_obj();
  return pretty ? json::dumps_pretty(v) : json::dumps(v);
}

} // namespace uiscope
