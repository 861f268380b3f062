#pragma once
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace uiscope {

// One finished capture. Never modified after construction.
class TreeState {
public:
  TreeState(std::uint64_t generation, std::vector<ElementNode> elements,
            std::vector<WindowSummary> windows,
            std::vector<WindowError> errors);

  std::uint64_t generation() const { return generation_; }
  const std::vector<ElementNode> &elements() const { return elements_; }
  const std::vector<WindowSummary> &windows() const { return windows_; }
  const std::vector<WindowError> &errors() const { return errors_; }
  std::size_t size() const { return elements_.size(); }

  std::vector<const ClassifiedElement *> interactive() const;
  std::vector<const ScrollElementNode *> scrollable() const;
  std::vector<const ClassifiedElement *> informative() const;
  const ElementNode *find(std::uint64_t id) const;

  // Window handles in capture order.
  std::vector<hwnd_u64> window_handles() const;

private:
  const std::uint64_t generation_;
  const std::vector<ElementNode> elements_;
  const std::vector<WindowSummary> windows_;
  const std::vector<WindowError> errors_;
};

enum class ChangeKind : std::uint8_t { Focus = 0, Structure, Property };

const char *to_string(ChangeKind k);
std::optional<ChangeKind> parse_change_kind(std::string_view s);

// Bumped by focus/structure change signals from outside. Repeats of the
// same (window, kind) inside the debounce window are folded.
class CacheGeneration {
public:
  using clock = std::chrono::steady_clock;

  explicit CacheGeneration(
      std::chrono::milliseconds debounce = std::chrono::milliseconds(1000))
      : debounce_(debounce) {}

  std::uint64_t current() const {
    return value_.load(std::memory_order_acquire);
  }

  // Unconditional bump; returns the new value.
  std::uint64_t bump();

  // Returns true when the generation moved.
  bool notify(hwnd_u64 hwnd, ChangeKind kind, clock::time_point now = clock::now());

  // (window, kind) pairs still inside their debounce window.
  std::size_t tracked() const;

private:
  std::atomic<std::uint64_t> value_{0};
  std::chrono::milliseconds debounce_;
  mutable std::mutex mu_;
  std::map<std::pair<hwnd_u64, ChangeKind>, clock::time_point> last_;
};

// Holds the most recently published TreeState for a caller.
class StateSlot {
public:
  void publish(std::shared_ptr<const TreeState> state);
  std::shared_ptr<const TreeState> load() const;

  bool is_current(const CacheGeneration &gen) const;

private:
  std::shared_ptr<const TreeState> state_;
};

} // namespace uiscope
