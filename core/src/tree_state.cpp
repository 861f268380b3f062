#include "uiscope/tree_state.hpp"
#include "uiscope/logger.hpp"

namespace uiscope {

TreeState::TreeState(std::uint64_t generation,
                     std::vector<ElementNode> elements,
                     std::vector<WindowSummary> windows,
                     std::vector<WindowError> errors)
    : generation_(generation), elements_(std::move(elements)),
      windows_(std::move(windows)), errors_(std::move(errors)) {}

std::vector<const ClassifiedElement *> TreeState::interactive() const {
  std::vector<const ClassifiedElement *> out;
  for (const auto &n : elements_) {
    const ClassifiedElement &e = as_element(n);
    if (e.tag == Classification::Interactive)
      out.push_back(&e);
  }
  return out;
}

std::vector<const ScrollElementNode *> TreeState::scrollable() const {
  std::vector<const ScrollElementNode *> out;
  for (const auto &n : elements_) {
    if (const ScrollElementNode *s = as_scroll(n))
      out.push_back(s);
  }
  return out;
}

std::vector<const ClassifiedElement *> TreeState::informative() const {
  std::vector<const ClassifiedElement *> out;
  for (const auto &n : elements_) {
    const ClassifiedElement &e = as_element(n);
    if (e.tag == Classification::Informative)
      out.push_back(&e);
  }
  return out;
}

const ElementNode *TreeState::find(std::uint64_t id) const {
  // Ids are dense from 1 in element order.
  if (id >= 1 && id <= elements_.size()) {
    const ElementNode &n = elements_[id - 1];
    if (as_element(n).id == id)
      return &n;
  }
  for (const auto &n : elements_) {
    if (as_element(n).id == id)
      return &n;
  }
  return nullptr;
}

std::vector<hwnd_u64> TreeState::window_handles() const {
  std::vector<hwnd_u64> out;
  out.reserve(windows_.size());
  for (const auto &w : windows_)
    out.push_back(w.hwnd);
  return out;
}

const char *to_string(ChangeKind k) {
  switch (k) {
  case ChangeKind::Focus: return "focus";
  case ChangeKind::Structure: return "structure";
  case ChangeKind::Property: return "property";
  }
  return "structure";
}

std::optional<ChangeKind> parse_change_kind(std::string_view s) {
  if (s == "focus")
    return ChangeKind::Focus;
  if (s == "structure")
    return ChangeKind::Structure;
  if (s == "property")
    return ChangeKind::Property;
  return std::nullopt;
}

std::uint64_t CacheGeneration::bump() {
  return value_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

bool CacheGeneration::notify(hwnd_u64 hwnd, ChangeKind kind,
                             clock::time_point now) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = std::make_pair(hwnd, kind);
    auto it = last_.find(key);
    if (it != last_.end() && now >= it->second && now - it->second < debounce_)
      return false;
    // Entries past their debounce window can no longer fold anything.
    for (auto e = last_.begin(); e != last_.end();) {
      if (now >= e->second && now - e->second >= debounce_)
        e = last_.erase(e);
      else
        ++e;
    }
    last_[key] = now;
  }
  std::uint64_t g = bump();
  LOG_TRACE("generation " + std::to_string(g) + " after " + to_string(kind) +
            " change on " + Hwnd(hwnd).to_string());
  return true;
}

std::size_t CacheGeneration::tracked() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_.size();
}

void StateSlot::publish(std::shared_ptr<const TreeState> state) {
  std::atomic_store(&state_, std::move(state));
}

std::shared_ptr<const TreeState> StateSlot::load() const {
  return std::atomic_load(&state_);
}

bool StateSlot::is_current(const CacheGeneration &gen) const {
  auto s = load();
  return s && s->generation() == gen.current();
}

} // namespace uiscope
