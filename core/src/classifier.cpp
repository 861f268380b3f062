#include "uiscope/classifier.hpp"
#include <algorithm>

namespace uiscope {

const std::vector<ControlType> &interactive_control_types() {
  static const std::vector<ControlType> types = {
      ControlType::Button,   ControlType::SplitButton, ControlType::Edit,
      ControlType::MenuItem, ControlType::ListItem,    ControlType::ComboBox,
      ControlType::TreeItem, ControlType::DataItem,    ControlType::Hyperlink,
      ControlType::Slider,   ControlType::Spinner,     ControlType::TabItem,
      ControlType::CheckBox, ControlType::RadioButton,
  };
  return types;
}

static bool in_desktop_set(int control_type) {
  const auto &types = interactive_control_types();
  return std::any_of(types.begin(), types.end(), [&](ControlType t) {
    return static_cast<int>(t) == control_type;
  });
}

static bool has_action(const PatternFlags &p) {
  return p.has(Pattern::Invoke) || p.has(Pattern::Toggle) ||
         p.has(Pattern::ExpandCollapse) || p.has(Pattern::SelectionItem);
}

bool is_interactive_type(int control_type, const PatternFlags &patterns,
                         ClassifierProfile profile) {
  if (profile == ClassifierProfile::Desktop)
    return in_desktop_set(control_type);

  // Web content reports most things as Group/Custom/Text; the patterns tell
  // us what a script has made clickable.
  switch (static_cast<ControlType>(control_type)) {
  case ControlType::Group:
  case ControlType::Custom:
  case ControlType::Text:
  case ControlType::Image:
    return has_action(patterns);
  case ControlType::ListItem:
  case ControlType::DataItem:
    return patterns.has(Pattern::Invoke) ||
           patterns.has(Pattern::SelectionItem);
  default:
    return in_desktop_set(control_type);
  }
}

Classification classify(int control_type, const PatternFlags &patterns,
                        bool is_enabled, bool is_offscreen, bool has_text,
                        ClassifierProfile profile) {
  if (patterns.has(Pattern::Scroll) && patterns.scroll_range)
    return Classification::Scrollable;
  if (is_enabled && !is_offscreen &&
      is_interactive_type(control_type, patterns, profile))
    return Classification::Interactive;
  if (has_text)
    return Classification::Informative;
  return Classification::Ignored;
}

} // namespace uiscope
