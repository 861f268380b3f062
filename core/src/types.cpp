#include "uiscope/types.hpp"
#include <algorithm>
#include <sstream>

namespace uiscope {

std::string Hwnd::to_string() const {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << val;
  return oss.str();
}

std::optional<hwnd_u64> parse_hwnd(std::string_view s) {
  if (s.size() < 3 || (s.substr(0, 2) != "0x" && s.substr(0, 2) != "0X"))
    return std::nullopt;
  std::uint64_t v = 0;
  std::istringstream ss{std::string(s.substr(2))};
  ss >> std::hex >> v;
  if (ss.fail() || !ss.eof())
    return std::nullopt;
  return (hwnd_u64)v;
}

Rect Rect::intersect(const Rect &o) const {
  Rect r{std::max(left, o.left), std::max(top, o.top),
         std::min(right, o.right), std::min(bottom, o.bottom)};
  if (r.empty())
    return Rect{};
  return r;
}

bool ScrollInfo::has_range() const {
  // UIA reports -1 (UIA_ScrollPatternNoScroll) for an axis without range.
  bool v = vertically_scrollable && vertical_percent >= 0;
  bool h = horizontally_scrollable && horizontal_percent >= 0;
  return v || h;
}

std::string control_type_name(int control_type) {
  switch (static_cast<ControlType>(control_type)) {
  case ControlType::Button: return "Button";
  case ControlType::Calendar: return "Calendar";
  case ControlType::CheckBox: return "CheckBox";
  case ControlType::ComboBox: return "ComboBox";
  case ControlType::Edit: return "Edit";
  case ControlType::Hyperlink: return "Hyperlink";
  case ControlType::Image: return "Image";
  case ControlType::ListItem: return "ListItem";
  case ControlType::List: return "List";
  case ControlType::Menu: return "Menu";
  case ControlType::MenuBar: return "MenuBar";
  case ControlType::MenuItem: return "MenuItem";
  case ControlType::ProgressBar: return "ProgressBar";
  case ControlType::RadioButton: return "RadioButton";
  case ControlType::ScrollBar: return "ScrollBar";
  case ControlType::Slider: return "Slider";
  case ControlType::Spinner: return "Spinner";
  case ControlType::StatusBar: return "StatusBar";
  case ControlType::Tab: return "Tab";
  case ControlType::TabItem: return "TabItem";
  case ControlType::Text: return "Text";
  case ControlType::ToolBar: return "ToolBar";
  case ControlType::ToolTip: return "ToolTip";
  case ControlType::Tree: return "Tree";
  case ControlType::TreeItem: return "TreeItem";
  case ControlType::Custom: return "Custom";
  case ControlType::Group: return "Group";
  case ControlType::Thumb: return "Thumb";
  case ControlType::DataGrid: return "DataGrid";
  case ControlType::DataItem: return "DataItem";
  case ControlType::Document: return "Document";
  case ControlType::SplitButton: return "SplitButton";
  case ControlType::Window: return "Window";
  case ControlType::Pane: return "Pane";
  case ControlType::Header: return "Header";
  case ControlType::HeaderItem: return "HeaderItem";
  case ControlType::Table: return "Table";
  case ControlType::TitleBar: return "TitleBar";
  case ControlType::Separator: return "Separator";
  case ControlType::SemanticZoom: return "SemanticZoom";
  case ControlType::AppBar: return "AppBar";
  }
  return "Unknown";
}

const char *to_string(Classification c) {
  switch (c) {
  case Classification::Interactive: return "interactive";
  case Classification::Scrollable: return "scrollable";
  case Classification::Informative: return "informative";
  case Classification::Ignored: return "ignored";
  }
  return "ignored";
}

const char *to_string(FetchStrategy s) {
  return s == FetchStrategy::Subtree ? "subtree" : "per_node";
}

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::ConnectionUnavailable: return "connection_unavailable";
  case ErrorKind::ElementStale: return "element_stale";
  case ErrorKind::FetchTimeout: return "fetch_timeout";
  case ErrorKind::FetchRejected: return "fetch_rejected";
  case ErrorKind::CaptureTimeout: return "capture_timeout";
  case ErrorKind::InvalidInput: return "invalid_input";
  case ErrorKind::Internal: return "internal";
  }
  return "internal";
}

} // namespace uiscope
