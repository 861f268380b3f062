#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "uiscope/config.hpp"
#include "uiscope/coordinator.hpp"
#include "uiscope/core.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/logger.hpp"
#include "uiscope/uia_provider.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include "uiscope/util_win32.hpp"
#endif

using namespace uiscope;

static void usage() {
  std::cerr
      << "usage: uiscope [options] [hwnd...]\n"
      << "  --config FILE       JSON config file\n"
      << "  --max-depth N       deepest level walked (default 200)\n"
      << "  --dom               narrow browser windows to the web document\n"
      << "  --timeout-ms N      overall capture deadline\n"
      << "  --workers N         worker thread cap\n"
      << "  --log-level LEVEL   trace|debug|info|warn|error\n"
      << "  --title T           title for the following handle\n"
      << "  --process P         process name for the following handle\n"
      << "  --class C           class name for the following handle\n"
      << "  --compact           single-line JSON output\n"
      << "Without handles the foreground window is captured (Windows only).\n";
}

#ifdef _WIN32
static std::string window_text(HWND h) {
  int len = GetWindowTextLengthW(h);
  if (len <= 0)
    return {};
  std::wstring buf((size_t)len + 1, L'\0');
  int got = GetWindowTextW(h, buf.data(), len + 1);
  return w2u8(buf.data(), got);
}

static std::string window_class(HWND h) {
  wchar_t buf[256];
  int got = GetClassNameW(h, buf, 256);
  return w2u8(buf, got);
}

static std::string window_process(HWND h) {
  DWORD pid = 0;
  GetWindowThreadProcessId(h, &pid);
  HANDLE proc = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
  if (!proc)
    return {};
  wchar_t path[MAX_PATH];
  DWORD size = MAX_PATH;
  std::string out;
  if (QueryFullProcessImageNameW(proc, 0, path, &size)) {
    std::wstring full(path, size);
    auto slash = full.find_last_of(L"\\/");
    std::wstring base = slash == std::wstring::npos ? full : full.substr(slash + 1);
    out = w2u8(base.c_str(), (int)base.size());
  }
  CloseHandle(proc);
  return out;
}

static void describe(WindowHandle &w) {
  HWND h = reinterpret_cast<HWND>(static_cast<std::uintptr_t>(w.hwnd));
  if (!IsWindow(h))
    return;
  if (w.title.empty())
    w.title = window_text(h);
  if (w.class_name.empty())
    w.class_name = window_class(h);
  if (w.process_name.empty())
    w.process_name = window_process(h);
}
#endif

int main(int argc, char **argv) {
  std::string config_path;
  bool compact = false;
  std::vector<WindowHandle> windows;
  WindowHandle pending;

  json::Object cli_opts;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto next = [&]() -> std::string {
        if (i + 1 >= argc)
          throw InvalidInput(arg + " needs a value");
        return argv[++i];
      };
      if (arg == "--help" || arg == "-h") {
        usage();
        return 0;
      } else if (arg == "--config") {
        config_path = next();
      } else if (arg == "--max-depth") {
        cli_opts["max_depth"] = std::stoi(next());
      } else if (arg == "--dom") {
        cli_opts["dom_mode"] = true;
      } else if (arg == "--timeout-ms") {
        cli_opts["timeout_ms"] = std::stoi(next());
      } else if (arg == "--workers") {
        cli_opts["max_workers"] = std::stoi(next());
      } else if (arg == "--log-level") {
        cli_opts["log_level"] = next();
      } else if (arg == "--title") {
        pending.title = next();
      } else if (arg == "--process") {
        pending.process_name = next();
      } else if (arg == "--class") {
        pending.class_name = next();
      } else if (arg == "--compact") {
        compact = true;
      } else if (!arg.empty() && arg[0] == '-') {
        std::cerr << "unknown option " << arg << "\n";
        usage();
        return 2;
      } else {
        auto h = parse_hwnd(arg);
        if (!h)
          throw InvalidInput("bad window handle '" + arg + "' (expected 0x...)");
        pending.hwnd = *h;
        windows.push_back(pending);
        pending = WindowHandle{};
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    usage();
    return 2;
  }

  Config cfg;
  try {
    if (!config_path.empty())
      cfg = load_config(config_path, cfg);
    cfg = config_from_json(cli_opts, cfg);
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
  Logger::get().set_level(cfg.log_level);

#ifdef _WIN32
  if (windows.empty()) {
    HWND fg = GetForegroundWindow();
    if (fg) {
      WindowHandle w;
      w.hwnd = static_cast<hwnd_u64>(reinterpret_cast<std::uintptr_t>(fg));
      windows.push_back(w);
    }
  }
  for (auto &w : windows)
    describe(w);
#endif
  if (windows.empty()) {
    std::cerr << "error: no window handles given\n";
    usage();
    return 2;
  }

  auto provider = std::make_shared<UiaProvider>(cfg.provider);
  auto access = std::make_shared<PlatformAccess>(provider);
  CaptureCoordinator coordinator(access);
  StateSlot slot;
  CoreEngine engine(&coordinator, &slot, cfg.capture);

  CoreRequest req;
  req.id = "cli";
  req.method = "tree.capture";
  json::Array arr;
  for (const auto &w : windows) {
    json::Object o;
    o["hwnd"] = Hwnd(w.hwnd).to_string();
    o["title"] = w.title;
    o["process"] = w.process_name;
    o["class_name"] = w.class_name;
    arr.push_back(o);
  }
  req.params["windows"] = arr;

  CoreResponse resp = engine.handle(req);
  std::cout << serialize_response_json(resp, !compact) << std::endl;
  return resp.ok ? 0 : 1;
}
