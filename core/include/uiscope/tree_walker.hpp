#pragma once
#include "cache_request.hpp"
#include "provider.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace uiscope {

struct WalkOptions {
  int max_depth = 200;
  std::size_t max_children = 512;
  int max_attempts = 3;
  ClassifierProfile profile = ClassifierProfile::Desktop;
  bool clip_to_root = true;
  // Checked between nodes; the walk stops early once set.
  const std::atomic<bool> *cancelled = nullptr;
};

// Resolves optional properties for one node: batched values first, then at
// most one live query per property. Failed live queries are remembered as
// unavailable.
class NodeProbe {
public:
  NodeProbe(IElement &element, const RawNode &raw);

  std::optional<Rect> bounding_rect();
  std::optional<ScrollInfo> scroll();
  std::optional<std::string> value();
  std::optional<ToggleState> toggle();

  std::size_t live_queries() const { return live_queries_; }

private:
  template <typename T, typename Query>
  std::optional<T> live(std::optional<std::optional<T>> &memo, Query q);

  IElement &element_;
  const RawNode &raw_;
  std::size_t live_queries_ = 0;

  std::optional<std::optional<Rect>> rect_;
  std::optional<std::optional<ScrollInfo>> scroll_;
  std::optional<std::optional<std::string>> value_;
  std::optional<std::optional<LegacyInfo>> legacy_;
  std::optional<std::optional<ToggleState>> toggle_;
};

struct WindowFragment {
  std::vector<ElementNode> elements;
  WindowSummary summary;
  std::vector<WindowError> errors;
};

struct WalkTarget {
  WindowHandle window;
  std::size_t window_index = 0;
  // Empty means: use the root element's name.
  std::string window_name;
  // Depth of the walk root inside its window (non-zero for a document root).
  int base_depth = 0;
  bool dom_scoped = false;
};

class TreeWalker {
public:
  explicit TreeWalker(WalkOptions opts) : opts_(opts) {}

  // Iterative pre-order walk. Element ids are left at 0; the coordinator
  // numbers them when fragments are merged.
  WindowFragment walk(std::unique_ptr<IElement> root, FetchStrategy strategy,
                      const WalkTarget &target) const;

  static constexpr std::size_t MAX_NODE_ERRORS = 32;

private:
  WalkOptions opts_;
  CacheRequestBuilder requests_;
};

struct DocumentSearch {
  std::unique_ptr<IElement> element;
  int depth = 0;
  bool found = false;
};

// Looks for the web document (automation id "RootWebArea", or the first
// Document control) no deeper than max_depth. When nothing is found the
// original root comes back with found == false.
DocumentSearch find_document_root(std::unique_ptr<IElement> root,
                                  FetchStrategy strategy, int max_depth,
                                  int max_attempts);

// Shell windows get fixed names; everything else uses its title.
std::string display_window_name(const std::string &title,
                                const std::string &class_name);

} // namespace uiscope
