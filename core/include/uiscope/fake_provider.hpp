#pragma once
#include "cache_request.hpp"
#include "provider.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace uiscope {

// One element of a scripted accessibility tree. `props` holds the true
// values; the omit_* switches keep a value out of the batched fetch so it is
// only reachable through a live query.
struct FakeNode {
  RawNode props;
  std::vector<FakeNode> children;

  int stale_failures = 0;   // read() throws ElementStale this many times
  int timeout_failures = 0; // then FetchTimeout this many times

  bool omit_cached_rect = false;
  bool omit_cached_scroll = false;
  bool omit_cached_value = false;
  bool omit_cached_toggle = false;

  FakeNode &add_child(FakeNode child) {
    children.push_back(std::move(child));
    return children.back();
  }
};

FakeNode make_fake_node(ControlType type, std::string name, Rect box = {},
                        bool enabled = true);

struct FakeWindow {
  hwnd_u64 hwnd{};
  FakeNode root;
  // element_from_window fails with ConnectionUnavailable.
  bool unreachable = false;
  // Subtree fetches fail with FetchRejected.
  bool reject_subtree = false;
  // Subtree fetches covering more nodes than this are rejected (0 = no limit).
  std::size_t max_subtree_nodes = 0;
  // element_from_window blocks this long (or until release_delays()).
  std::chrono::milliseconds delay{0};
  // element_from_window throws ElementStale this many times, then
  // FetchTimeout this many times.
  int root_stale_failures = 0;
  int root_timeout_failures = 0;
  // element_from_window throws std::logic_error.
  bool broken_invariant = false;
};

enum class LiveQuery : std::uint8_t { Rect = 0, Scroll, Value, Legacy, Toggle };

class FakeProvider final : public IProvider,
                           public std::enable_shared_from_this<FakeProvider> {
public:
  explicit FakeProvider(std::vector<FakeWindow> windows);

  ThreadInit enter_thread() override;
  void leave_thread() override;
  std::unique_ptr<IConnection> connect() override;
  ProviderCapabilities probe() override;

  // Configuration, set before capturing.
  void set_subtree_supported(bool v);
  void set_preinitialized(bool v);
  void fail_next_connects(int n);
  void set_probe_delay(std::chrono::milliseconds d);

  // Wakes any element_from_window call blocked on a window delay.
  void release_delays();

  // Observations.
  int connects() const;
  int disconnects() const;
  int enters() const;
  int owned_enters() const;
  int leaves() const;
  int probes() const;
  int subtree_fetches() const;
  int per_node_fetches() const;
  int reads() const;
  int root_lookups() const;
  int thread_violations() const;
  std::size_t live_queries() const;
  // Highest number of live queries any single node received for one kind.
  std::size_t max_live_queries_per_node() const;
  std::set<std::thread::id> connected_threads() const;
  void reset_counters();

  // Hooks for the fake connection and elements.
  void check_owner(std::thread::id owner) const;
  const FakeWindow *window(hwnd_u64 hwnd) const;
  void before_read(const FakeNode &node);
  void before_root(const FakeWindow &w);
  void count_fetch(TreeScope scope);
  void count_disconnect();
  void count_live(const FakeNode &node, LiveQuery q);
  void wait_delay(std::chrono::milliseconds d);

private:
  std::map<hwnd_u64, FakeWindow> windows_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool delays_released_ = false;

  bool subtree_supported_ = true;
  bool preinitialized_ = false;
  int failing_connects_ = 0;
  std::chrono::milliseconds probe_delay_{0};

  std::map<const FakeNode *, int> stale_used_;
  std::map<const FakeNode *, int> timeout_used_;
  std::map<hwnd_u64, int> root_stale_used_;
  std::map<hwnd_u64, int> root_timeout_used_;
  std::map<std::pair<const FakeNode *, LiveQuery>, std::size_t> live_;
  std::map<std::thread::id, int> init_depth_;
  std::set<std::thread::id> connected_threads_;

  int connects_ = 0;
  int disconnects_ = 0;
  int enters_ = 0;
  int owned_enters_ = 0;
  int leaves_ = 0;
  int probes_ = 0;
  int subtree_fetches_ = 0;
  int per_node_fetches_ = 0;
  int reads_ = 0;
  int root_lookups_ = 0;
  mutable int violations_ = 0;
};

} // namespace uiscope
