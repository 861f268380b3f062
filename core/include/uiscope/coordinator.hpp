#pragma once
#include "platform_access.hpp"
#include "tree_state.hpp"
#include "tree_walker.hpp"
#include <memory>
#include <string>
#include <vector>

namespace uiscope {

// Process names whose windows are narrowed to the web document in DOM mode.
bool is_browser_process(const std::string &process_name);

class CaptureCoordinator {
public:
  explicit CaptureCoordinator(std::shared_ptr<PlatformAccess> access,
                              std::shared_ptr<CacheGeneration> generation = nullptr);

  // Walks every window on a bounded pool and returns a new snapshot with
  // elements in input order. Throws InvalidInput for a bad request; window
  // level failures become error records in the result.
  std::shared_ptr<const TreeState> capture(const std::vector<WindowHandle> &windows,
                                           const CaptureOptions &opts);

  PlatformAccess &access() { return *access_; }
  const std::shared_ptr<CacheGeneration> &generation() const { return generation_; }

private:
  std::shared_ptr<PlatformAccess> access_;
  std::shared_ptr<CacheGeneration> generation_;
};

} // namespace uiscope
