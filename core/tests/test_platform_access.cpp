#include "doctest/doctest.h"
#include "fixtures.hpp"
#include "uiscope/errors.hpp"
#include "uiscope/platform_access.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace uiscope;
using namespace uiscope::testing;

static std::shared_ptr<FakeProvider> one_window_provider() {
  FakeNode root = window_root("Main");
  root.add_child(button("OK"));
  return std::make_shared<FakeProvider>(
      std::vector<FakeWindow>{fake_window(0x100, std::move(root))});
}

DOCTEST_TEST_CASE("connection is lazy and bound to the acquiring thread") {
  auto p = one_window_provider();
  PlatformAccess access(p);

  ThreadConnection conn = access.acquire();
  DOCTEST_REQUIRE_FALSE(conn.connected());
  DOCTEST_REQUIRE(p->enters() == 0);
  DOCTEST_REQUIRE(conn.owner() == std::this_thread::get_id());

  IConnection &c = conn.get();
  DOCTEST_REQUIRE(conn.connected());
  DOCTEST_REQUIRE(&conn.get() == &c);
  DOCTEST_REQUIRE(p->connects() == 1);
  DOCTEST_REQUIRE(p->enters() == 1);
}

DOCTEST_TEST_CASE("using a connection from another thread is a logic error") {
  auto p = one_window_provider();
  PlatformAccess access(p);
  ThreadConnection conn = access.acquire();
  conn.get();

  bool threw_logic = false;
  std::thread t([&] {
    try {
      conn.get();
    } catch (const std::logic_error &) {
      threw_logic = true;
    }
  });
  t.join();
  DOCTEST_REQUIRE(threw_logic);
  DOCTEST_REQUIRE(p->connects() == 1);
}

DOCTEST_TEST_CASE("connection destroyed off its owner thread is leaked") {
  auto p = one_window_provider();
  PlatformAccess access(p);
  std::unique_ptr<ThreadConnection> conn(new ThreadConnection(access.acquire()));
  conn->get();

  std::thread t([&] { conn.reset(); });
  t.join();
  DOCTEST_REQUIRE(p->connects() == 1);
  DOCTEST_REQUIRE(p->disconnects() == 0);
  DOCTEST_REQUIRE(p->leaves() == 0);
  DOCTEST_REQUIRE(p->thread_violations() == 0);
}

DOCTEST_TEST_CASE("thread teardown balances runtime init") {
  auto p = one_window_provider();
  PlatformAccess access(p);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      ThreadConnection conn = access.acquire();
      conn.get().element_from_window(0x100);
    });
  }
  for (auto &t : threads)
    t.join();

  DOCTEST_REQUIRE(p->owned_enters() == 4);
  DOCTEST_REQUIRE(p->leaves() == 4);
  DOCTEST_REQUIRE(p->thread_violations() == 0);
}

DOCTEST_TEST_CASE("runtime initialised elsewhere is not torn down") {
  auto p = one_window_provider();
  p->set_preinitialized(true);
  PlatformAccess access(p);
  {
    ThreadConnection conn = access.acquire();
    conn.get();
  }
  DOCTEST_REQUIRE(p->enters() == 1);
  DOCTEST_REQUIRE(p->owned_enters() == 0);
  DOCTEST_REQUIRE(p->leaves() == 0);
}

DOCTEST_TEST_CASE("connection that was never used leaves nothing behind") {
  auto p = one_window_provider();
  PlatformAccess access(p);
  { ThreadConnection conn = access.acquire(); }
  DOCTEST_REQUIRE(p->enters() == 0);
  DOCTEST_REQUIRE(p->leaves() == 0);
}

DOCTEST_TEST_CASE("failed connect can be retried on the same thread") {
  auto p = one_window_provider();
  p->fail_next_connects(1);
  PlatformAccess access(p);
  {
    ThreadConnection conn = access.acquire();
    DOCTEST_REQUIRE_THROWS_AS(conn.get(), ConnectionUnavailable);
    DOCTEST_REQUIRE_FALSE(conn.connected());
    conn.get();
    DOCTEST_REQUIRE(conn.connected());
  }
  DOCTEST_REQUIRE(p->connects() == 2);
  DOCTEST_REQUIRE(p->enters() == 1);
  DOCTEST_REQUIRE(p->leaves() == 1);
}

DOCTEST_TEST_CASE("release drops the connection and reconnects on demand") {
  auto p = one_window_provider();
  PlatformAccess access(p);
  {
    ThreadConnection conn = access.acquire();
    conn.get();
    conn.release();
    DOCTEST_REQUIRE_FALSE(conn.connected());
    DOCTEST_REQUIRE(p->leaves() == 1);
    conn.get();
  }
  DOCTEST_REQUIRE(p->enters() == 2);
  DOCTEST_REQUIRE(p->leaves() == 2);
}

DOCTEST_TEST_CASE("capabilities are probed once under concurrent first use") {
  auto p = one_window_provider();
  p->set_subtree_supported(false);
  p->set_probe_delay(std::chrono::milliseconds(50));
  PlatformAccess access(p);

  std::atomic<int> subtree_seen{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (access.capabilities().subtree_cache)
        ++subtree_seen;
    });
  }
  for (auto &t : threads)
    t.join();

  DOCTEST_REQUIRE(p->probes() == 1);
  DOCTEST_REQUIRE(subtree_seen.load() == 0);
  DOCTEST_REQUIRE(access.capabilities().description == "fake provider");
  DOCTEST_REQUIRE(p->probes() == 1);
}

DOCTEST_TEST_CASE("platform access needs a provider") {
  DOCTEST_REQUIRE_THROWS_AS(PlatformAccess(nullptr), std::invalid_argument);
}
