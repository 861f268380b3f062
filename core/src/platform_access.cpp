#include "uiscope/platform_access.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"
#include <sstream>
#include <stdexcept>

namespace uiscope {

static std::string thread_name(std::thread::id id) {
  std::ostringstream ss;
  ss << id;
  return ss.str();
}

ThreadConnection::ThreadConnection(std::shared_ptr<IProvider> provider)
    : provider_(std::move(provider)), owner_(std::this_thread::get_id()) {}

ThreadConnection::~ThreadConnection() {
  if (std::this_thread::get_id() != owner_) {
    // Tearing down here would uninitialise someone else's runtime, so the
    // connection is leaked rather than released on this thread.
    LOG_ERROR("thread connection destroyed off its owner thread " +
              thread_name(owner_));
    (void)conn_.release();
    return;
  }
  conn_.reset();
  if (entered_ && owns_)
    provider_->leave_thread();
}

void ThreadConnection::check_thread(const char *op) const {
  if (std::this_thread::get_id() != owner_) {
    throw std::logic_error(std::string("thread connection ") + op +
                           " from thread " +
                           thread_name(std::this_thread::get_id()) +
                           ", owner is " + thread_name(owner_));
  }
}

IConnection &ThreadConnection::get() {
  check_thread("used");
  if (conn_)
    return *conn_;

  if (!entered_) {
    ThreadInit init = provider_->enter_thread();
    entered_ = true;
    owns_ = init.owns;
    if (!owns_)
      LOG_DEBUG("provider runtime already initialised on this thread, not "
                "taking ownership");
  }

  try {
    conn_ = provider_->connect();
  } catch (const CaptureError &) {
    throw;
  } catch (const std::logic_error &) {
    throw;
  } catch (const std::exception &e) {
    throw ConnectionUnavailable(std::string("connect failed: ") + e.what());
  }
  if (!conn_)
    throw ConnectionUnavailable("provider returned no connection");
  LOG_TRACE("connection established on thread " +
            thread_name(std::this_thread::get_id()));
  return *conn_;
}

void ThreadConnection::release() {
  check_thread("released");
  conn_.reset();
  if (entered_ && owns_)
    provider_->leave_thread();
  entered_ = false;
  owns_ = false;
}

PlatformAccess::PlatformAccess(std::shared_ptr<IProvider> provider)
    : provider_(std::move(provider)) {
  if (!provider_)
    throw std::invalid_argument("PlatformAccess requires a provider");
}

ThreadConnection PlatformAccess::acquire() { return ThreadConnection(provider_); }

const ProviderCapabilities &PlatformAccess::capabilities() {
  if (probed_.load(std::memory_order_acquire))
    return caps_;
  std::lock_guard<std::mutex> lk(probe_mu_);
  if (!probed_.load(std::memory_order_relaxed)) {
    caps_ = provider_->probe();
    LOG_INFO("provider capabilities: " + caps_.description +
             (caps_.subtree_cache ? " (subtree cache)" : " (per-node only)"));
    probed_.store(true, std::memory_order_release);
  }
  return caps_;
}

} // namespace uiscope
