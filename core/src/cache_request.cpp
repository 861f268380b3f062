#include "uiscope/cache_request.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"

namespace uiscope {

const std::vector<Property> &CacheRequestBuilder::fixed_properties() {
  static const std::vector<Property> props = {
      Property::ControlType,
      Property::LocalizedControlType,
      Property::Name,
      Property::AutomationId,
      Property::ClassName,
      Property::BoundingRectangle,
      Property::IsEnabled,
      Property::IsOffscreen,
      Property::IsControlElement,
      Property::HasKeyboardFocus,
      Property::IsKeyboardFocusable,
      Property::AcceleratorKey,
      Property::ValueValue,
      Property::LegacyRole,
      Property::LegacyValue,
      Property::LegacyDefaultAction,
      Property::ToggleState,
      Property::ScrollHorizontallyScrollable,
      Property::ScrollVerticallyScrollable,
      Property::ScrollHorizontalPercent,
      Property::ScrollVerticalPercent,
      Property::ScrollHorizontalViewSize,
      Property::ScrollVerticalViewSize,
      Property::IsInvokePatternAvailable,
      Property::IsValuePatternAvailable,
      Property::IsTogglePatternAvailable,
      Property::IsScrollPatternAvailable,
      Property::IsExpandCollapsePatternAvailable,
      Property::IsSelectionItemPatternAvailable,
      Property::IsLegacyIAccessiblePatternAvailable,
  };
  return props;
}

CacheRequest CacheRequestBuilder::subtree() const {
  return CacheRequest{TreeScope::Subtree, fixed_properties()};
}

CacheRequest CacheRequestBuilder::element_with_children() const {
  return CacheRequest{TreeScope::ElementWithChildren, fixed_properties()};
}

RootFetch CacheRequestBuilder::fetch_root(IConnection &conn, hwnd_u64 hwnd,
                                          const ProviderCapabilities &caps,
                                          int max_attempts) const {
  std::unique_ptr<IElement> root = retry_recoverable(
      max_attempts, [&] { return conn.element_from_window(hwnd); });
  if (!root)
    throw ConnectionUnavailable("no root element for " + Hwnd(hwnd).to_string());

  RootFetch out;
  if (caps.subtree_cache) {
    const CacheRequest req = subtree();
    try {
      out.root = retry_recoverable(max_attempts,
                                   [&] { return root->build_cache(req); });
      out.strategy = FetchStrategy::Subtree;
      return out;
    } catch (const FetchRejected &e) {
      out.fallback_reason = e.what();
      LOG_WARN("subtree fetch rejected for " + Hwnd(hwnd).to_string() +
               ", falling back to per-node: " + e.what());
    }
  } else {
    out.fallback_reason = "subtree caching unsupported";
    LOG_DEBUG("subtree caching unsupported, per-node fetch for " +
              Hwnd(hwnd).to_string());
  }

  const CacheRequest req = element_with_children();
  out.root =
      retry_recoverable(max_attempts, [&] { return root->build_cache(req); });
  out.strategy = FetchStrategy::PerNode;
  return out;
}

} // namespace uiscope
