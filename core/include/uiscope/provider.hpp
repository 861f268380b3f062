#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace uiscope {

struct CacheRequest;

struct ThreadInit {
  // False when the thread was already initialised by someone else (e.g. in
  // another apartment model); such a thread must not be torn down by us.
  bool owns = false;
};

struct ProviderCapabilities {
  bool subtree_cache = true;
  bool is_wine = false;
  std::string description;
};

// One accessibility element. Thread-affine: only the worker thread that
// fetched it may touch it. All reads throw ElementStale or FetchTimeout.
class IElement {
public:
  virtual ~IElement() = default;

  // Plain values from the element's cache.
  virtual RawNode read() = 0;

  // Re-fetches this element with the given request. May throw FetchRejected.
  virtual std::unique_ptr<IElement> build_cache(const CacheRequest &req) = 0;

  // Children carried by the last cache request covering Children or Subtree.
  virtual std::vector<std::unique_ptr<IElement>> cached_children() = 0;

  // Live queries; nullopt when the pattern or property is unavailable.
  virtual std::optional<Rect> query_bounding_rect() = 0;
  virtual std::optional<ScrollInfo> query_scroll() = 0;
  virtual std::optional<std::string> query_value() = 0;
  virtual std::optional<LegacyInfo> query_legacy() = 0;
  virtual std::optional<ToggleState> query_toggle() = 0;
};

class IConnection {
public:
  virtual ~IConnection() = default;

  // Throws ConnectionUnavailable when the window has no root element.
  virtual std::unique_ptr<IElement> element_from_window(hwnd_u64 hwnd) = 0;
};

// Shared, thread-safe factory for per-thread connections.
class IProvider {
public:
  virtual ~IProvider() = default;

  virtual ThreadInit enter_thread() = 0;
  virtual void leave_thread() = 0;
  virtual std::unique_ptr<IConnection> connect() = 0;
  virtual ProviderCapabilities probe() = 0;
};

} // namespace uiscope
