#pragma once
#include "provider.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace uiscope {

// A connection pinned to the thread that acquired it. Lives on that
// thread's stack; never copied, moved or shared.
class ThreadConnection {
public:
  ~ThreadConnection();
  ThreadConnection(const ThreadConnection &) = delete;
  ThreadConnection &operator=(const ThreadConnection &) = delete;
  ThreadConnection(ThreadConnection &&) = delete;
  ThreadConnection &operator=(ThreadConnection &&) = delete;

  // Enters the provider runtime and connects on first use. Throws
  // ConnectionUnavailable on failure; the next call tries again.
  IConnection &get();

  bool connected() const { return conn_ != nullptr; }
  std::thread::id owner() const { return owner_; }

  // Drops the connection and balances the runtime init we own.
  void release();

private:
  friend class PlatformAccess;
  explicit ThreadConnection(std::shared_ptr<IProvider> provider);

  void check_thread(const char *op) const;

  std::shared_ptr<IProvider> provider_;
  std::thread::id owner_;
  bool entered_ = false;
  bool owns_ = false;
  std::unique_ptr<IConnection> conn_;
};

class PlatformAccess {
public:
  explicit PlatformAccess(std::shared_ptr<IProvider> provider);

  ThreadConnection acquire();

  // Probed once per instance, whichever thread asks first.
  const ProviderCapabilities &capabilities();

  const std::shared_ptr<IProvider> &provider() const { return provider_; }

private:
  std::shared_ptr<IProvider> provider_;
  std::atomic<bool> probed_{false};
  std::mutex probe_mu_;
  ProviderCapabilities caps_;
};

} // namespace uiscope
