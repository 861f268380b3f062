#pragma once
#include "provider.hpp"

namespace uiscope {

struct ProviderConfig {
  // 0 keeps the UI Automation default.
  unsigned transaction_timeout_ms = 0;
  unsigned connection_timeout_ms = 0;
};

// Windows UI Automation over COM. Every thread gets its own multithreaded
// apartment and its own IUIAutomation instance. On other platforms connect()
// always fails with ConnectionUnavailable.
class UiaProvider final : public IProvider {
public:
  explicit UiaProvider(ProviderConfig cfg = {});

  ThreadInit enter_thread() override;
  void leave_thread() override;
  std::unique_ptr<IConnection> connect() override;
  ProviderCapabilities probe() override;

private:
  ProviderConfig cfg_;
};

} // namespace uiscope
