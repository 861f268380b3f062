#include "uiscope/fake_provider.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace uiscope {

FakeNode make_fake_node(ControlType type, std::string name, Rect box,
                        bool enabled) {
  FakeNode n;
  n.props.control_type = static_cast<int>(type);
  n.props.localized_control_type = control_type_name(n.props.control_type);
  n.props.name = std::move(name);
  n.props.bounding_rect = box;
  n.props.is_enabled = enabled;
  return n;
}

namespace {

std::size_t count_nodes(const FakeNode &n) {
  std::size_t total = 0;
  std::vector<const FakeNode *> stack{&n};
  while (!stack.empty()) {
    const FakeNode *cur = stack.back();
    stack.pop_back();
    ++total;
    for (const auto &c : cur->children)
      stack.push_back(&c);
  }
  return total;
}

constexpr int UNLIMITED = -1;

class FakeElement final : public IElement {
public:
  // levels: how many generations below this element are cached; -1 for a
  // subtree fetch. An element straight from element_from_window has no
  // cache at all.
  FakeElement(std::shared_ptr<FakeProvider> p, const FakeWindow *w,
              const FakeNode *n, bool cached, int levels)
      : p_(std::move(p)), w_(w), n_(n), cached_(cached), levels_(levels),
        owner_(std::this_thread::get_id()) {}

  RawNode read() override {
    p_->check_owner(owner_);
    if (!cached_)
      throw std::logic_error("read() on an element without a cache");
    p_->before_read(*n_);
    RawNode r = n_->props;
    if (n_->omit_cached_rect)
      r.bounding_rect.reset();
    if (n_->omit_cached_scroll)
      r.scroll.reset();
    if (n_->omit_cached_value)
      r.value.reset();
    if (n_->omit_cached_toggle)
      r.toggle.reset();
    return r;
  }

  std::unique_ptr<IElement> build_cache(const CacheRequest &req) override {
    p_->check_owner(owner_);
    p_->count_fetch(req.scope);
    if (req.scope == TreeScope::Subtree) {
      if (w_->reject_subtree)
        throw FetchRejected("subtree request rejected by provider");
      if (w_->max_subtree_nodes && count_nodes(*n_) > w_->max_subtree_nodes)
        throw FetchRejected("subtree exceeds provider limit");
      return std::make_unique<FakeElement>(p_, w_, n_, true, UNLIMITED);
    }
    return std::make_unique<FakeElement>(p_, w_, n_, true,
                                         req.covers_children() ? 1 : 0);
  }

  std::vector<std::unique_ptr<IElement>> cached_children() override {
    p_->check_owner(owner_);
    if (!cached_ || levels_ == 0)
      throw std::logic_error("children were not part of the cache request");
    std::vector<std::unique_ptr<IElement>> out;
    out.reserve(n_->children.size());
    int child_levels = levels_ == UNLIMITED ? UNLIMITED : levels_ - 1;
    for (const auto &c : n_->children)
      out.push_back(std::make_unique<FakeElement>(p_, w_, &c, true, child_levels));
    return out;
  }

  std::optional<Rect> query_bounding_rect() override {
    p_->check_owner(owner_);
    p_->count_live(*n_, LiveQuery::Rect);
    return n_->props.bounding_rect;
  }
  std::optional<ScrollInfo> query_scroll() override {
    p_->check_owner(owner_);
    p_->count_live(*n_, LiveQuery::Scroll);
    return n_->props.scroll;
  }
  std::optional<std::string> query_value() override {
    p_->check_owner(owner_);
    p_->count_live(*n_, LiveQuery::Value);
    return n_->props.value;
  }
  std::optional<LegacyInfo> query_legacy() override {
    p_->check_owner(owner_);
    p_->count_live(*n_, LiveQuery::Legacy);
    return n_->props.legacy;
  }
  std::optional<ToggleState> query_toggle() override {
    p_->check_owner(owner_);
    p_->count_live(*n_, LiveQuery::Toggle);
    return n_->props.toggle;
  }

private:
  std::shared_ptr<FakeProvider> p_;
  const FakeWindow *w_;
  const FakeNode *n_;
  bool cached_;
  int levels_;
  std::thread::id owner_;
};

class FakeConnection final : public IConnection {
public:
  explicit FakeConnection(std::shared_ptr<FakeProvider> p)
      : p_(std::move(p)), owner_(std::this_thread::get_id()) {}
  ~FakeConnection() override { p_->count_disconnect(); }

  std::unique_ptr<IElement> element_from_window(hwnd_u64 hwnd) override {
    p_->check_owner(owner_);
    const FakeWindow *w = p_->window(hwnd);
    if (!w || w->unreachable)
      throw ConnectionUnavailable("no element for window " + Hwnd(hwnd).to_string());
    p_->wait_delay(w->delay);
    p_->before_root(*w);
    return std::make_unique<FakeElement>(p_, w, &w->root, false, 0);
  }

private:
  std::shared_ptr<FakeProvider> p_;
  std::thread::id owner_;
};

} // namespace

FakeProvider::FakeProvider(std::vector<FakeWindow> windows) {
  for (auto &w : windows) {
    hwnd_u64 h = w.hwnd;
    windows_.emplace(h, std::move(w));
  }
}

ThreadInit FakeProvider::enter_thread() {
  std::lock_guard<std::mutex> lk(mu_);
  ++enters_;
  if (preinitialized_)
    return ThreadInit{false};
  ++owned_enters_;
  ++init_depth_[std::this_thread::get_id()];
  return ThreadInit{true};
}

void FakeProvider::leave_thread() {
  std::lock_guard<std::mutex> lk(mu_);
  ++leaves_;
  auto it = init_depth_.find(std::this_thread::get_id());
  if (it == init_depth_.end() || it->second == 0) {
    // Leaving a thread we never entered.
    ++violations_;
    return;
  }
  --it->second;
}

std::unique_ptr<IConnection> FakeProvider::connect() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++connects_;
    if (failing_connects_ > 0) {
      --failing_connects_;
      throw ConnectionUnavailable("fake connection refused");
    }
    connected_threads_.insert(std::this_thread::get_id());
  }
  return std::make_unique<FakeConnection>(shared_from_this());
}

ProviderCapabilities FakeProvider::probe() {
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++probes_;
    delay = probe_delay_;
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);
  std::lock_guard<std::mutex> lk(mu_);
  ProviderCapabilities caps;
  caps.subtree_cache = subtree_supported_;
  caps.description = "fake provider";
  return caps;
}

void FakeProvider::set_subtree_supported(bool v) {
  std::lock_guard<std::mutex> lk(mu_);
  subtree_supported_ = v;
}

void FakeProvider::set_preinitialized(bool v) {
  std::lock_guard<std::mutex> lk(mu_);
  preinitialized_ = v;
}

void FakeProvider::fail_next_connects(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  failing_connects_ = n;
}

void FakeProvider::set_probe_delay(std::chrono::milliseconds d) {
  std::lock_guard<std::mutex> lk(mu_);
  probe_delay_ = d;
}

void FakeProvider::release_delays() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    delays_released_ = true;
  }
  cv_.notify_all();
}

int FakeProvider::connects() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connects_;
}

int FakeProvider::disconnects() const {
  std::lock_guard<std::mutex> lk(mu_);
  return disconnects_;
}

int FakeProvider::enters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return enters_;
}

int FakeProvider::owned_enters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return owned_enters_;
}

int FakeProvider::leaves() const {
  std::lock_guard<std::mutex> lk(mu_);
  return leaves_;
}

int FakeProvider::probes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return probes_;
}

int FakeProvider::subtree_fetches() const {
  std::lock_guard<std::mutex> lk(mu_);
  return subtree_fetches_;
}

int FakeProvider::per_node_fetches() const {
  std::lock_guard<std::mutex> lk(mu_);
  return per_node_fetches_;
}

int FakeProvider::reads() const {
  std::lock_guard<std::mutex> lk(mu_);
  return reads_;
}

int FakeProvider::root_lookups() const {
  std::lock_guard<std::mutex> lk(mu_);
  return root_lookups_;
}

int FakeProvider::thread_violations() const {
  std::lock_guard<std::mutex> lk(mu_);
  return violations_;
}

std::size_t FakeProvider::live_queries() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t total = 0;
  for (const auto &[key, n] : live_)
    total += n;
  return total;
}

std::size_t FakeProvider::max_live_queries_per_node() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t best = 0;
  for (const auto &[key, n] : live_)
    best = std::max(best, n);
  return best;
}

std::set<std::thread::id> FakeProvider::connected_threads() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connected_threads_;
}

void FakeProvider::reset_counters() {
  std::lock_guard<std::mutex> lk(mu_);
  live_.clear();
  connected_threads_.clear();
  connects_ = disconnects_ = enters_ = owned_enters_ = leaves_ = probes_ = 0;
  subtree_fetches_ = per_node_fetches_ = reads_ = root_lookups_ = 0;
  violations_ = 0;
}

void FakeProvider::check_owner(std::thread::id owner) const {
  if (std::this_thread::get_id() == owner)
    return;
  std::lock_guard<std::mutex> lk(mu_);
  ++violations_;
  LOG_ERROR("fake provider object used off its owner thread");
}

const FakeWindow *FakeProvider::window(hwnd_u64 hwnd) const {
  auto it = windows_.find(hwnd);
  return it == windows_.end() ? nullptr : &it->second;
}

void FakeProvider::before_read(const FakeNode &node) {
  std::lock_guard<std::mutex> lk(mu_);
  ++reads_;
  int &stale = stale_used_[&node];
  if (stale < node.stale_failures) {
    ++stale;
    throw ElementStale("element is no longer available");
  }
  int &timeouts = timeout_used_[&node];
  if (timeouts < node.timeout_failures) {
    ++timeouts;
    throw FetchTimeout("provider call timed out");
  }
}

void FakeProvider::before_root(const FakeWindow &w) {
  std::lock_guard<std::mutex> lk(mu_);
  ++root_lookups_;
  if (w.broken_invariant)
    throw std::logic_error("fake provider invariant broken for " +
                           Hwnd(w.hwnd).to_string());
  int &stale = root_stale_used_[w.hwnd];
  if (stale < w.root_stale_failures) {
    ++stale;
    throw ElementStale("window element is no longer available");
  }
  int &timeouts = root_timeout_used_[w.hwnd];
  if (timeouts < w.root_timeout_failures) {
    ++timeouts;
    throw FetchTimeout("window element lookup timed out");
  }
}

void FakeProvider::count_fetch(TreeScope scope) {
  std::lock_guard<std::mutex> lk(mu_);
  if (scope == TreeScope::Subtree)
    ++subtree_fetches_;
  else
    ++per_node_fetches_;
}

void FakeProvider::count_disconnect() {
  std::lock_guard<std::mutex> lk(mu_);
  ++disconnects_;
}

void FakeProvider::count_live(const FakeNode &node, LiveQuery q) {
  std::lock_guard<std::mutex> lk(mu_);
  ++live_[std::make_pair(&node, q)];
}

void FakeProvider::wait_delay(std::chrono::milliseconds d) {
  if (d.count() <= 0)
    return;
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, d, [this] { return delays_released_; });
}

} // namespace uiscope
