#include "uiscope/coordinator.hpp"
#include "uiscope/cache_request.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace uiscope {

bool is_browser_process(const std::string &process_name) {
  static const char *const browsers[] = {
      "chrome.exe",  "msedge.exe",  "firefox.exe", "brave.exe",
      "opera.exe",   "vivaldi.exe", "iexplore.exe",
  };
  std::string lower = process_name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  for (const char *b : browsers) {
    if (lower == b)
      return true;
  }
  return false;
}

namespace {

// Shared between capture() and its workers. Workers that outlive a timed
// out capture keep it alive until they finish.
struct CaptureJob {
  std::vector<WindowHandle> windows;
  CaptureOptions opts;
  std::shared_ptr<PlatformAccess> access;

  std::atomic<std::size_t> next{0};
  std::atomic<bool> cancelled{false};

  std::mutex mu;
  std::condition_variable cv;
  std::vector<std::optional<WindowFragment>> slots;
  std::size_t done = 0;
  std::size_t running = 0;
  std::exception_ptr failure;
};

// Marks a worker finished once its connection has been torn down. capture()
// counts the worker as running before starting its thread.
class RunningGuard {
public:
  explicit RunningGuard(CaptureJob &job) : job_(job) {}
  ~RunningGuard() {
    {
      std::lock_guard<std::mutex> lk(job_.mu);
      --job_.running;
    }
    job_.cv.notify_all();
  }
  RunningGuard(const RunningGuard &) = delete;
  RunningGuard &operator=(const RunningGuard &) = delete;

private:
  CaptureJob &job_;
};

WindowFragment capture_window(CaptureJob &job, ThreadConnection &conn,
                              std::size_t index) {
  const WindowHandle &w = job.windows[index];
  const CaptureOptions &opts = job.opts;

  WalkTarget target;
  target.window = w;
  target.window_index = index;
  target.window_name = display_window_name(w.title, w.class_name);

  try {
    IConnection &c = conn.get();
    const ProviderCapabilities &caps = job.access->capabilities();
    RootFetch fetched =
        CacheRequestBuilder().fetch_root(c, w.hwnd, caps, opts.max_attempts);

    WalkOptions wo;
    wo.max_depth = opts.max_depth;
    wo.max_children = opts.max_children;
    wo.max_attempts = opts.max_attempts;
    wo.clip_to_root = opts.clip_to_root;
    wo.cancelled = &job.cancelled;

    if (opts.dom_mode && is_browser_process(w.process_name)) {
      DocumentSearch doc =
          find_document_root(std::move(fetched.root), fetched.strategy,
                             opts.max_depth, opts.max_attempts);
      fetched.root = std::move(doc.element);
      if (doc.found) {
        target.base_depth = doc.depth;
        target.dom_scoped = true;
        wo.profile = ClassifierProfile::Web;
      } else {
        LOG_DEBUG("no web document under " + Hwnd(w.hwnd).to_string() +
                  ", walking the whole window");
      }
    }

    return TreeWalker(wo).walk(std::move(fetched.root), fetched.strategy,
                               target);
  } catch (const CaptureError &e) {
    LOG_WARN("window " + Hwnd(w.hwnd).to_string() + " failed: " + e.what());
    WindowFragment frag;
    frag.summary.window_index = index;
    frag.summary.hwnd = w.hwnd;
    frag.summary.window_name = target.window_name;
    frag.errors.push_back(WindowError{index, w.hwnd, e.kind(), e.what(), true});
    return frag;
  }
}

void run_worker(std::shared_ptr<CaptureJob> job) {
  RunningGuard guard(*job);
  ThreadConnection conn = job->access->acquire();
  const std::size_t n = job->windows.size();

  while (!job->cancelled.load()) {
    std::size_t i = job->next.fetch_add(1);
    if (i >= n)
      break;

    LOG_DEBUG("capturing window " + std::to_string(i) + " (" +
              Hwnd(job->windows[i].hwnd).to_string() + ")");
    WindowFragment frag;
    try {
      frag = capture_window(*job, conn, i);
    } catch (const std::logic_error &) {
      std::lock_guard<std::mutex> lk(job->mu);
      if (!job->failure)
        job->failure = std::current_exception();
      job->cancelled = true;
      job->cv.notify_all();
      return;
    } catch (const std::exception &e) {
      LOG_ERROR("window " + std::to_string(i) + " aborted: " + e.what());
      frag.summary.window_index = i;
      frag.summary.hwnd = job->windows[i].hwnd;
      frag.errors.push_back(WindowError{i, job->windows[i].hwnd,
                                        ErrorKind::Internal, e.what(), true});
    }

    {
      std::lock_guard<std::mutex> lk(job->mu);
      job->slots[i] = std::move(frag);
      ++job->done;
    }
    job->cv.notify_all();
  }
}

void validate(const std::vector<WindowHandle> &windows,
              const CaptureOptions &opts) {
  if (windows.empty())
    throw InvalidInput("no windows to capture");
  for (std::size_t i = 0; i < windows.size(); ++i) {
    if (windows[i].hwnd == 0)
      throw InvalidInput("window " + std::to_string(i) + " has a null handle");
  }
  if (opts.max_depth < 0)
    throw InvalidInput("max_depth must not be negative");
  if (opts.timeout.count() <= 0)
    throw InvalidInput("timeout must be positive");
  if (opts.max_workers == 0)
    throw InvalidInput("max_workers must be at least 1");
  if (opts.max_attempts < 1)
    throw InvalidInput("max_attempts must be at least 1");
}

} // namespace

CaptureCoordinator::CaptureCoordinator(std::shared_ptr<PlatformAccess> access,
                                       std::shared_ptr<CacheGeneration> generation)
    : access_(std::move(access)), generation_(std::move(generation)) {
  if (!access_)
    throw std::invalid_argument("CaptureCoordinator requires platform access");
  if (!generation_)
    generation_ = std::make_shared<CacheGeneration>();
}

std::shared_ptr<const TreeState>
CaptureCoordinator::capture(const std::vector<WindowHandle> &windows,
                            const CaptureOptions &opts) {
  validate(windows, opts);

  const auto started = std::chrono::steady_clock::now();
  const std::uint64_t generation = generation_->current();
  const std::size_t n = windows.size();

  auto job = std::make_shared<CaptureJob>();
  job->windows = windows;
  job->opts = opts;
  job->access = access_;
  job->slots.resize(n);

  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0)
    hw = 4;
  std::size_t want = std::min<std::size_t>({opts.max_workers, hw, n});

  std::vector<std::thread> threads;
  threads.reserve(want);
  for (std::size_t k = 0; k < want; ++k) {
    {
      std::lock_guard<std::mutex> lk(job->mu);
      ++job->running;
    }
    try {
      threads.emplace_back(run_worker, job);
    } catch (const std::system_error &e) {
      {
        std::lock_guard<std::mutex> lk(job->mu);
        --job->running;
      }
      if (threads.empty())
        throw;
      LOG_WARN(std::string("started only ") + std::to_string(threads.size()) +
               " capture workers: " + e.what());
      break;
    }
  }
  LOG_DEBUG("capturing " + std::to_string(n) + " windows on " +
            std::to_string(threads.size()) + " workers");

  std::vector<std::optional<WindowFragment>> fragments(n);
  std::exception_ptr failure;
  bool finished = false;
  {
    std::unique_lock<std::mutex> lk(job->mu);
    finished = job->cv.wait_until(lk, started + opts.timeout, [&] {
      return job->done == n || job->failure != nullptr;
    });
    if (!finished)
      job->cancelled = true;
    failure = job->failure;
    // Late workers may still write their own slots; take only what is here.
    for (std::size_t i = 0; i < n; ++i) {
      fragments[i] = std::move(job->slots[i]);
      job->slots[i].reset();
    }
  }

  if (failure) {
    // Siblings stop at their next window; one stuck in the provider is
    // abandoned at the deadline like a timed out capture.
    bool drained = false;
    {
      std::unique_lock<std::mutex> lk(job->mu);
      job->cancelled = true;
      drained = job->cv.wait_until(lk, started + opts.timeout,
                                   [&] { return job->running == 0; });
    }
    for (auto &t : threads) {
      if (drained)
        t.join();
      else
        t.detach();
    }
    if (!drained)
      LOG_WARN("abandoning capture workers still busy after an internal failure");
    std::rethrow_exception(failure);
  }
  if (finished) {
    for (auto &t : threads)
      t.join();
  } else {
    LOG_WARN("capture timed out after " + std::to_string(opts.timeout.count()) +
             "ms, abandoning unfinished windows");
    for (auto &t : threads)
      t.detach();
  }

  std::vector<ElementNode> elements;
  std::vector<WindowSummary> summaries;
  std::vector<WindowError> errors;
  std::uint64_t next_id = 1;
  std::size_t failed = 0;
  for (std::size_t i = 0; i < n; ++i) {
    if (!fragments[i]) {
      WindowSummary s;
      s.window_index = i;
      s.hwnd = windows[i].hwnd;
      s.window_name = display_window_name(windows[i].title, windows[i].class_name);
      summaries.push_back(std::move(s));
      errors.push_back(WindowError{i, windows[i].hwnd, ErrorKind::CaptureTimeout,
                                   "window not captured within " +
                                       std::to_string(opts.timeout.count()) + "ms",
                                   true});
      ++failed;
      continue;
    }
    WindowFragment &frag = *fragments[i];
    for (auto &node : frag.elements) {
      as_element(node).id = next_id++;
      elements.push_back(std::move(node));
    }
    for (auto &e : frag.errors) {
      if (e.fatal)
        ++failed;
      errors.push_back(std::move(e));
    }
    summaries.push_back(std::move(frag.summary));
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  LOG_INFO("captured " + std::to_string(elements.size()) + " elements from " +
           std::to_string(n - failed) + "/" + std::to_string(n) +
           " windows in " + std::to_string(elapsed.count()) + "ms");

  return std::make_shared<const TreeState>(generation, std::move(elements),
                                           std::move(summaries),
                                           std::move(errors));
}

} // namespace uiscope
