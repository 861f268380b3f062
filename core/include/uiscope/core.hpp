#pragma once
#include "coordinator.hpp"
#include "logger.hpp"
#include "tinyjson.hpp"
#include "tree_state.hpp"
#include <string>

namespace uiscope {

struct CoreRequest {
  std::string id;
  std::string method;
  json::Object params;
};

struct CoreResponse {
  std::string id;
  bool ok = true;
  json::Value result;
  std::string error_code;
  std::string error_message;
  json::Object metrics;

  json::Object to_json_obj() const;
};

// JSON front for the capture engine. Methods:
//   tree.capture     capture the given windows and publish the result
//   tree.state       published state if still current, else a fresh capture
//   tree.invalidate  feed a focus/structure/property change signal
//   tree.generation  current cache generation
//   daemon.logs      recent log lines
class CoreEngine {
public:
  CoreEngine(CaptureCoordinator *coordinator, StateSlot *slot,
             CaptureOptions defaults = {});

  CoreResponse handle(const CoreRequest &req);

private:
  json::Value capture_and_publish(const json::Object &params);

  CaptureCoordinator *coordinator_;
  StateSlot *slot_;
  CaptureOptions defaults_;
};

json::Object element_to_json(const ElementNode &n);
json::Object tree_state_to_json(const TreeState &s);

std::vector<WindowHandle> parse_windows(const json::Object &params);

CoreRequest parse_request_json(std::string_view json_utf8);
std::string serialize_response_json(const CoreResponse &resp, bool pretty = false);

} // namespace uiscope
