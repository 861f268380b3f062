#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace uiscope {

using hwnd_u64 = std::uint64_t;
inline constexpr std::string_view PROTOCOL_VERSION = "1.0.0";

struct Hwnd {
  hwnd_u64 val{};
  explicit Hwnd(hwnd_u64 v) : val(v) {}
  std::string to_string() const;
};

std::optional<hwnd_u64> parse_hwnd(std::string_view s);

struct Rect {
  long left{}, top{}, right{}, bottom{};

  long width() const { return right - left; }
  long height() const { return bottom - top; }
  bool empty() const { return right <= left || bottom <= top; }
  std::pair<long, long> center() const {
    return {left + width() / 2, top + height() / 2};
  }
  // Empty rect when the two do not overlap.
  Rect intersect(const Rect &o) const;

  bool operator==(const Rect &o) const {
    return left == o.left && top == o.top && right == o.right &&
           bottom == o.bottom;
  }
  bool operator!=(const Rect &o) const { return !(*this == o); }
};

// Produced by window enumeration; read-only here.
struct WindowHandle {
  hwnd_u64 hwnd{};
  std::string title;
  std::string process_name;
  std::string class_name;
};

// UI Automation control type ids.
enum class ControlType : int {
  Button = 50000,
  Calendar = 50001,
  CheckBox = 50002,
  ComboBox = 50003,
  Edit = 50004,
  Hyperlink = 50005,
  Image = 50006,
  ListItem = 50007,
  List = 50008,
  Menu = 50009,
  MenuBar = 50010,
  MenuItem = 50011,
  ProgressBar = 50012,
  RadioButton = 50013,
  ScrollBar = 50014,
  Slider = 50015,
  Spinner = 50016,
  StatusBar = 50017,
  Tab = 50018,
  TabItem = 50019,
  Text = 50020,
  ToolBar = 50021,
  ToolTip = 50022,
  Tree = 50023,
  TreeItem = 50024,
  Custom = 50025,
  Group = 50026,
  Thumb = 50027,
  DataGrid = 50028,
  DataItem = 50029,
  Document = 50030,
  SplitButton = 50031,
  Window = 50032,
  Pane = 50033,
  Header = 50034,
  HeaderItem = 50035,
  Table = 50036,
  TitleBar = 50037,
  Separator = 50038,
  SemanticZoom = 50039,
  AppBar = 50040,
};

// "Unknown" for ids outside the table.
std::string control_type_name(int control_type);

enum class Pattern : std::uint32_t {
  Invoke = 1u << 0,
  Value = 1u << 1,
  Toggle = 1u << 2,
  Scroll = 1u << 3,
  ExpandCollapse = 1u << 4,
  SelectionItem = 1u << 5,
  LegacyIAccessible = 1u << 6,
};

struct PatternFlags {
  std::uint32_t available = 0;
  // Scroll pattern present and at least one axis has a non-trivial range.
  bool scroll_range = false;

  bool has(Pattern p) const {
    return (available & static_cast<std::uint32_t>(p)) != 0;
  }
  PatternFlags &set(Pattern p) {
    available |= static_cast<std::uint32_t>(p);
    return *this;
  }
  bool operator==(const PatternFlags &o) const {
    return available == o.available && scroll_range == o.scroll_range;
  }
};

// Percentages follow UIA: 0..100, or -1 when the axis cannot scroll.
// View sizes are the visible share of the content, in percent.
struct ScrollInfo {
  bool horizontally_scrollable = false;
  bool vertically_scrollable = false;
  double horizontal_percent = -1;
  double vertical_percent = -1;
  double horizontal_view_size = 100;
  double vertical_view_size = 100;

  bool has_range() const;
};

enum class ToggleState : std::uint8_t { Off = 0, On, Indeterminate };

struct LegacyInfo {
  std::uint32_t role{};
  std::string value;
  std::string default_action;
};

// Plain values read from one fetched element. Never holds provider handles.
struct RawNode {
  int control_type{};
  std::string localized_control_type;
  std::string name;
  std::string automation_id;
  std::string class_name;
  std::string accelerator_key;
  std::optional<Rect> bounding_rect;
  bool is_enabled = false;
  bool is_offscreen = false;
  bool is_control_element = true;
  bool has_keyboard_focus = false;
  bool is_keyboard_focusable = false;
  PatternFlags patterns;
  std::optional<ScrollInfo> scroll;
  std::optional<std::string> value;
  std::optional<LegacyInfo> legacy;
  std::optional<ToggleState> toggle;
};

enum class Classification : std::uint8_t {
  Ignored = 0,
  Interactive,
  Scrollable,
  Informative,
};

const char *to_string(Classification c);

enum class ClassifierProfile : std::uint8_t { Desktop = 0, Web };

enum class FetchStrategy : std::uint8_t { Subtree = 0, PerNode };

const char *to_string(FetchStrategy s);

struct ClassifiedElement {
  std::uint64_t id{};
  hwnd_u64 window{};
  std::size_t window_index{};
  std::string window_name;
  int control_type{};
  std::string control_type_name;
  std::string name;
  std::string automation_id;
  std::string accelerator_key;
  Classification tag = Classification::Ignored;
  Rect bounding_box{};
  Rect visible_box{};
  std::optional<std::string> value;
  std::optional<ToggleState> toggle;
  int depth{};
  bool is_focused = false;
  bool truncated = false;
};

struct ScrollElementNode : ClassifiedElement {
  bool horizontally_scrollable = false;
  bool vertically_scrollable = false;
  double horizontal_scroll_percent = 0;
  double vertical_scroll_percent = 0;
  double horizontal_view_size = 100;
  double vertical_view_size = 100;
};

using ElementNode = std::variant<ClassifiedElement, ScrollElementNode>;

inline const ClassifiedElement &as_element(const ElementNode &n) {
  return std::visit(
      [](const auto &e) -> const ClassifiedElement & { return e; }, n);
}
inline ClassifiedElement &as_element(ElementNode &n) {
  return std::visit([](auto &e) -> ClassifiedElement & { return e; }, n);
}
inline const ScrollElementNode *as_scroll(const ElementNode &n) {
  return std::get_if<ScrollElementNode>(&n);
}

enum class ErrorKind : std::uint8_t {
  ConnectionUnavailable = 0,
  ElementStale,
  FetchTimeout,
  FetchRejected,
  CaptureTimeout,
  InvalidInput,
  Internal,
};

const char *to_string(ErrorKind k);

struct WindowError {
  std::size_t window_index{};
  hwnd_u64 hwnd{};
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
  // The window produced no elements.
  bool fatal = false;
};

struct WindowSummary {
  std::size_t window_index{};
  hwnd_u64 hwnd{};
  std::string window_name;
  FetchStrategy strategy = FetchStrategy::Subtree;
  bool dom_scoped = false;
  bool completed = false;
  std::size_t visited = 0;
  std::size_t recorded = 0;
  std::size_t skipped_subtrees = 0;
  std::size_t truncated = 0;
  std::size_t capped_children = 0;
  std::size_t live_queries = 0;
  std::chrono::milliseconds elapsed{0};
};

struct CaptureOptions {
  int max_depth = 200;
  bool dom_mode = false;
  std::chrono::milliseconds timeout{10000};
  unsigned max_workers = 8;
  int max_attempts = 3;
  std::size_t max_children = 512;
  bool clip_to_root = true;
};

} // namespace uiscope
