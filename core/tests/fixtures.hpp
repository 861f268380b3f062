#pragma once
#include "uiscope/cache_request.hpp"
#include "uiscope/coordinator.hpp"
#include "uiscope/fake_provider.hpp"
#include "uiscope/tree_walker.hpp"
#include <memory>
#include <string>
#include <vector>

namespace uiscope::testing {

inline FakeNode button(std::string name, Rect r = {10, 10, 90, 40},
                       bool enabled = true) {
  FakeNode n = make_fake_node(ControlType::Button, std::move(name), r, enabled);
  n.props.patterns.set(Pattern::Invoke);
  n.props.is_keyboard_focusable = true;
  return n;
}

inline FakeNode window_root(std::string name, Rect r = {0, 0, 800, 600}) {
  return make_fake_node(ControlType::Window, std::move(name), r);
}

inline FakeWindow fake_window(hwnd_u64 hwnd, FakeNode root) {
  FakeWindow w;
  w.hwnd = hwnd;
  w.root = std::move(root);
  return w;
}

inline WindowHandle handle(hwnd_u64 hwnd, std::string title = "",
                           std::string process = "") {
  WindowHandle h;
  h.hwnd = hwnd;
  h.title = std::move(title);
  h.process_name = std::move(process);
  return h;
}

// A straight chain of named groups, `levels` nodes deep below a window root.
inline FakeNode chain(int levels) {
  FakeNode cur = make_fake_node(ControlType::Group, "g" + std::to_string(levels));
  for (int i = levels - 1; i >= 1; --i) {
    FakeNode parent = make_fake_node(ControlType::Group, "g" + std::to_string(i));
    parent.children.push_back(std::move(cur));
    cur = std::move(parent);
  }
  FakeNode root = window_root("deep");
  root.children.push_back(std::move(cur));
  return root;
}

// Fetches and walks one window on the calling thread.
inline WindowFragment walk_window(const std::shared_ptr<FakeProvider> &p,
                                  hwnd_u64 hwnd, WalkOptions opts = {},
                                  bool subtree = true) {
  auto conn = p->connect();
  ProviderCapabilities caps;
  caps.subtree_cache = subtree;
  RootFetch rf =
      CacheRequestBuilder().fetch_root(*conn, hwnd, caps, opts.max_attempts);
  WalkTarget t;
  t.window.hwnd = hwnd;
  return TreeWalker(opts).walk(std::move(rf.root), rf.strategy, t);
}

inline std::vector<std::string> names(const std::vector<ElementNode> &els) {
  std::vector<std::string> out;
  for (const auto &n : els)
    out.push_back(as_element(n).name);
  return out;
}

inline CaptureCoordinator make_coordinator(const std::shared_ptr<FakeProvider> &p) {
  return CaptureCoordinator(std::make_shared<PlatformAccess>(p));
}

} // namespace uiscope::testing
