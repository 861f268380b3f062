#pragma once
#include "provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace uiscope {

// Mirrors UIA TreeScope bits.
enum class TreeScope : std::uint8_t {
  Element = 0x1,
  Children = 0x2,
  ElementWithChildren = 0x3,
  Subtree = 0x7,
};

enum class Property : std::uint8_t {
  ControlType,
  LocalizedControlType,
  Name,
  AutomationId,
  ClassName,
  BoundingRectangle,
  IsEnabled,
  IsOffscreen,
  IsControlElement,
  HasKeyboardFocus,
  IsKeyboardFocusable,
  AcceleratorKey,
  ValueValue,
  LegacyRole,
  LegacyValue,
  LegacyDefaultAction,
  ToggleState,
  ScrollHorizontallyScrollable,
  ScrollVerticallyScrollable,
  ScrollHorizontalPercent,
  ScrollVerticalPercent,
  ScrollHorizontalViewSize,
  ScrollVerticalViewSize,
  IsInvokePatternAvailable,
  IsValuePatternAvailable,
  IsTogglePatternAvailable,
  IsScrollPatternAvailable,
  IsExpandCollapsePatternAvailable,
  IsSelectionItemPatternAvailable,
  IsLegacyIAccessiblePatternAvailable,
};

struct CacheRequest {
  TreeScope scope = TreeScope::Element;
  std::vector<Property> properties;

  bool covers_children() const {
    return (static_cast<unsigned>(scope) &
            static_cast<unsigned>(TreeScope::Children)) != 0;
  }
  bool operator==(const CacheRequest &o) const {
    return scope == o.scope && properties == o.properties;
  }
};

struct RootFetch {
  std::unique_ptr<IElement> root;
  FetchStrategy strategy = FetchStrategy::Subtree;
  // Why Subtree was not used; empty when it was.
  std::string fallback_reason;
};

class CacheRequestBuilder {
public:
  // Every property classification, value resolution and boxes need.
  static const std::vector<Property> &fixed_properties();

  CacheRequest subtree() const;
  CacheRequest element_with_children() const;

  // Resolves the window root and fetches it with the best strategy the
  // provider accepts. Stale/timeout failures are retried up to max_attempts;
  // exhausting them or failing to resolve the root throws.
  RootFetch fetch_root(IConnection &conn, hwnd_u64 hwnd,
                       const ProviderCapabilities &caps,
                       int max_attempts) const;
};

} // namespace uiscope
