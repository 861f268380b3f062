#include "uiscope/tree_walker.hpp"
#include "uiscope/classifier.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace uiscope {

NodeProbe::NodeProbe(IElement &element, const RawNode &raw)
    : element_(element), raw_(raw) {}

template <typename T, typename Query>
std::optional<T> NodeProbe::live(std::optional<std::optional<T>> &memo,
                                 Query q) {
  if (memo)
    return *memo;
  ++live_queries_;
  try {
    memo = q();
  } catch (const CaptureError &e) {
    if (!is_recoverable(e.kind()) && e.kind() != ErrorKind::FetchRejected)
      throw;
    LOG_TRACE(std::string("live query failed: ") + e.what());
    memo = std::optional<T>{};
  }
  return *memo;
}

std::optional<Rect> NodeProbe::bounding_rect() {
  if (raw_.bounding_rect)
    return raw_.bounding_rect;
  return live(rect_, [&] { return element_.query_bounding_rect(); });
}

std::optional<ScrollInfo> NodeProbe::scroll() {
  if (raw_.scroll)
    return raw_.scroll;
  if (!raw_.patterns.has(Pattern::Scroll))
    return std::nullopt;
  return live(scroll_, [&] { return element_.query_scroll(); });
}

std::optional<std::string> NodeProbe::value() {
  if (raw_.value)
    return raw_.value;
  if (raw_.legacy && !raw_.legacy->value.empty())
    return raw_.legacy->value;
  if (raw_.patterns.has(Pattern::Value)) {
    auto v = live(value_, [&] { return element_.query_value(); });
    if (v && !v->empty())
      return v;
  }
  if (raw_.patterns.has(Pattern::LegacyIAccessible) && !raw_.legacy) {
    auto l = live(legacy_, [&] { return element_.query_legacy(); });
    if (l && !l->value.empty())
      return l->value;
  }
  return std::nullopt;
}

std::optional<ToggleState> NodeProbe::toggle() {
  if (raw_.toggle)
    return raw_.toggle;
  if (!raw_.patterns.has(Pattern::Toggle))
    return std::nullopt;
  return live(toggle_, [&] { return element_.query_toggle(); });
}

namespace {

struct Frame {
  std::unique_ptr<IElement> element;
  int depth = 0;
  bool fetched = false;
};

bool cancelled(const WalkOptions &opts) {
  return opts.cancelled && opts.cancelled->load(std::memory_order_relaxed);
}

void add_error(WindowFragment &frag, const WalkTarget &target, ErrorKind kind,
               const std::string &msg) {
  if (frag.errors.size() >= TreeWalker::MAX_NODE_ERRORS)
    return;
  frag.errors.push_back(WindowError{target.window_index, target.window.hwnd,
                                    kind, msg, false});
}

ElementNode make_node(ClassifiedElement base, const std::optional<ScrollInfo> &s) {
  if (base.tag != Classification::Scrollable || !s)
    return base;
  ScrollElementNode n;
  static_cast<ClassifiedElement &>(n) = std::move(base);
  n.horizontally_scrollable = s->horizontally_scrollable;
  n.vertically_scrollable = s->vertically_scrollable;
  n.horizontal_scroll_percent = std::max(0.0, s->horizontal_percent);
  n.vertical_scroll_percent = std::max(0.0, s->vertical_percent);
  n.horizontal_view_size = s->horizontal_view_size;
  n.vertical_view_size = s->vertical_view_size;
  return n;
}

} // namespace

WindowFragment TreeWalker::walk(std::unique_ptr<IElement> root,
                                FetchStrategy strategy,
                                const WalkTarget &target) const {
  if (!root)
    throw std::invalid_argument("walk needs a root element");

  auto started = std::chrono::steady_clock::now();
  const CacheRequest per_node = requests_.element_with_children();

  WindowFragment frag;
  WindowSummary &sum = frag.summary;
  sum.window_index = target.window_index;
  sum.hwnd = target.window.hwnd;
  sum.window_name = target.window_name;
  sum.strategy = strategy;
  sum.dom_scoped = target.dom_scoped;

  std::optional<Rect> root_box;
  bool at_root = true;

  std::vector<Frame> stack;
  stack.push_back(Frame{std::move(root), target.base_depth, true});

  while (!stack.empty()) {
    if (cancelled(opts_)) {
      LOG_DEBUG("walk of " + Hwnd(target.window.hwnd).to_string() +
                " cancelled");
      break;
    }

    Frame f = std::move(stack.back());
    stack.pop_back();
    ++sum.visited;
    const bool is_root = at_root;
    at_root = false;

    RawNode raw;
    std::vector<std::unique_ptr<IElement>> children;
    try {
      if (!f.fetched) {
        f.element = retry_recoverable(opts_.max_attempts, [&] {
          return f.element->build_cache(per_node);
        });
      }
      raw = retry_recoverable(opts_.max_attempts,
                              [&] { return f.element->read(); });
      children = retry_recoverable(opts_.max_attempts,
                                   [&] { return f.element->cached_children(); });
    } catch (const CaptureError &e) {
      // The node is gone or unreachable; drop it and everything below it.
      ++sum.skipped_subtrees;
      add_error(frag, target, e.kind(),
                std::string("node at depth ") + std::to_string(f.depth) +
                    " skipped: " + e.what());
      LOG_DEBUG("skipping subtree in " + Hwnd(target.window.hwnd).to_string() +
                ": " + e.what());
      continue;
    }

    NodeProbe probe(*f.element, raw);

    if (is_root) {
      root_box = probe.bounding_rect();
      if (sum.window_name.empty())
        sum.window_name = raw.name;
    }

    PatternFlags flags = raw.patterns;
    std::optional<ScrollInfo> scroll;
    if (flags.has(Pattern::Scroll)) {
      scroll = probe.scroll();
      flags.scroll_range = scroll && scroll->has_range();
    }

    std::optional<std::string> value;
    bool has_text = !raw.name.empty();
    if (!has_text) {
      value = probe.value();
      has_text = value && !value->empty();
    }

    Classification tag = classify(raw.control_type, flags, raw.is_enabled,
                                  raw.is_offscreen, has_text, opts_.profile);

    const bool boundary = f.depth >= opts_.max_depth;
    const bool truncated = boundary && !children.empty();

    if (tag != Classification::Ignored || truncated) {
      if (has_text && !value)
        value = probe.value();

      ClassifiedElement el;
      el.window = target.window.hwnd;
      el.window_index = target.window_index;
      el.window_name = sum.window_name;
      el.control_type = raw.control_type;
      el.control_type_name = control_type_name(raw.control_type);
      el.name = raw.name;
      el.automation_id = raw.automation_id;
      el.accelerator_key = raw.accelerator_key;
      el.tag = tag;
      el.bounding_box = probe.bounding_rect().value_or(Rect{});
      el.visible_box = (opts_.clip_to_root && root_box && !is_root)
                           ? el.bounding_box.intersect(*root_box)
                           : el.bounding_box;
      el.value = value;
      el.toggle = probe.toggle();
      el.depth = f.depth;
      el.is_focused = raw.has_keyboard_focus;
      el.truncated = truncated;

      frag.elements.push_back(make_node(std::move(el), scroll));
      ++sum.recorded;
    }
    sum.live_queries += probe.live_queries();

    if (boundary) {
      if (truncated)
        ++sum.truncated;
      continue;
    }

    if (children.size() > opts_.max_children) {
      sum.capped_children += children.size() - opts_.max_children;
      children.resize(opts_.max_children);
    }
    const bool cached = strategy == FetchStrategy::Subtree;
    for (auto it = children.rbegin(); it != children.rend(); ++it)
      stack.push_back(Frame{std::move(*it), f.depth + 1, cached});
  }

  sum.completed = stack.empty() && !cancelled(opts_);
  sum.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return frag;
}

DocumentSearch find_document_root(std::unique_ptr<IElement> root,
                                  FetchStrategy strategy, int max_depth,
                                  int max_attempts) {
  static constexpr const char *ROOT_WEB_AREA = "RootWebArea";
  const CacheRequest per_node = CacheRequestBuilder().element_with_children();

  DocumentSearch out;
  // The root has already been fetched by the caller and stays owned by
  // `root` until it is handed back.
  std::vector<Frame> stack;
  stack.push_back(Frame{nullptr, 0, true});

  while (!stack.empty()) {
    Frame f = std::move(stack.back());
    stack.pop_back();

    std::vector<std::unique_ptr<IElement>> children;
    try {
      if (!f.fetched) {
        f.element = retry_recoverable(max_attempts, [&] {
          return f.element->build_cache(per_node);
        });
      }
      IElement &el = f.element ? *f.element : *root;
      RawNode raw = retry_recoverable(max_attempts, [&] { return el.read(); });
      if (raw.automation_id == ROOT_WEB_AREA ||
          raw.control_type == static_cast<int>(ControlType::Document)) {
        out.element = f.element ? std::move(f.element) : std::move(root);
        out.depth = f.depth;
        out.found = true;
        return out;
      }
      if (f.depth >= max_depth)
        continue;
      children = retry_recoverable(max_attempts,
                                   [&] { return el.cached_children(); });
    } catch (const CaptureError &e) {
      LOG_DEBUG(std::string("document search skipped a node: ") + e.what());
      continue;
    }

    const bool cached = strategy == FetchStrategy::Subtree;
    for (auto it = children.rbegin(); it != children.rend(); ++it)
      stack.push_back(Frame{std::move(*it), f.depth + 1, cached});
  }

  out.element = std::move(root);
  return out;
}

std::string display_window_name(const std::string &title,
                                const std::string &class_name) {
  if (class_name == "Progman")
    return "Desktop";
  if (class_name == "Shell_TrayWnd" || class_name == "Shell_SecondaryTrayWnd")
    return "Taskbar";
  if (class_name == "Microsoft.UI.Content.PopupWindowSiteBridge")
    return "Context Menu";
  return title;
}

} // namespace uiscope
