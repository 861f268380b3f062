#include "doctest/doctest.h"
#include "uiscope/tree_state.hpp"
#include <thread>
#include <vector>

using namespace uiscope;

static std::shared_ptr<const TreeState> state_at(std::uint64_t gen,
                                                 std::vector<ElementNode> els = {}) {
  return std::make_shared<const TreeState>(gen, std::move(els),
                                           std::vector<WindowSummary>{},
                                           std::vector<WindowError>{});
}

static ClassifiedElement element(std::uint64_t id, Classification tag) {
  ClassifiedElement e;
  e.id = id;
  e.name = "e" + std::to_string(id);
  e.tag = tag;
  return e;
}

DOCTEST_TEST_CASE("generation starts at zero and bumps by one") {
  CacheGeneration gen;
  DOCTEST_REQUIRE(gen.current() == 0);
  DOCTEST_REQUIRE(gen.bump() == 1);
  DOCTEST_REQUIRE(gen.bump() == 2);
  DOCTEST_REQUIRE(gen.current() == 2);
}

DOCTEST_TEST_CASE("repeated change signals inside the debounce window are folded") {
  CacheGeneration gen(std::chrono::milliseconds(1000));
  auto t0 = CacheGeneration::clock::now();

  DOCTEST_REQUIRE(gen.notify(0x10, ChangeKind::Focus, t0));
  DOCTEST_REQUIRE(gen.current() == 1);
  DOCTEST_REQUIRE_FALSE(
      gen.notify(0x10, ChangeKind::Focus, t0 + std::chrono::milliseconds(500)));
  DOCTEST_REQUIRE(gen.current() == 1);

  // Different window or different kind is a separate stream.
  DOCTEST_REQUIRE(
      gen.notify(0x11, ChangeKind::Focus, t0 + std::chrono::milliseconds(500)));
  DOCTEST_REQUIRE(
      gen.notify(0x10, ChangeKind::Structure, t0 + std::chrono::milliseconds(500)));
  DOCTEST_REQUIRE(gen.current() == 3);

  DOCTEST_REQUIRE(
      gen.notify(0x10, ChangeKind::Focus, t0 + std::chrono::milliseconds(1000)));
  DOCTEST_REQUIRE(gen.current() == 4);
}

DOCTEST_TEST_CASE("expired debounce entries are dropped") {
  CacheGeneration gen(std::chrono::milliseconds(1000));
  auto t0 = CacheGeneration::clock::now();
  for (hwnd_u64 h = 1; h <= 100; ++h)
    gen.notify(h, ChangeKind::Focus, t0);
  DOCTEST_REQUIRE(gen.tracked() == 100);

  DOCTEST_REQUIRE(
      gen.notify(0x1000, ChangeKind::Structure, t0 + std::chrono::milliseconds(1500)));
  DOCTEST_REQUIRE(gen.tracked() == 1);
  DOCTEST_REQUIRE(gen.current() == 101);

  // Still folded: its own entry survived the sweep.
  DOCTEST_REQUIRE_FALSE(
      gen.notify(0x1000, ChangeKind::Structure, t0 + std::chrono::milliseconds(1600)));
}

DOCTEST_TEST_CASE("concurrent bumps are not lost") {
  CacheGeneration gen;
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int k = 0; k < 1000; ++k)
        gen.bump();
    });
  }
  for (auto &t : threads)
    t.join();
  DOCTEST_REQUIRE(gen.current() == 8000);
}

DOCTEST_TEST_CASE("state slot tracks the generation it was captured under") {
  CacheGeneration gen;
  StateSlot slot;
  DOCTEST_REQUIRE(slot.load() == nullptr);
  DOCTEST_REQUIRE_FALSE(slot.is_current(gen));

  slot.publish(state_at(gen.current()));
  DOCTEST_REQUIRE(slot.is_current(gen));

  auto held = slot.load();
  gen.notify(0x1, ChangeKind::Structure);
  DOCTEST_REQUIRE_FALSE(slot.is_current(gen));

  slot.publish(state_at(gen.current()));
  DOCTEST_REQUIRE(slot.is_current(gen));
  // Earlier readers keep their snapshot.
  DOCTEST_REQUIRE(held->generation() == 0);
}

DOCTEST_TEST_CASE("tree state views filter by classification") {
  std::vector<ElementNode> els;
  els.push_back(element(1, Classification::Interactive));
  els.push_back(element(2, Classification::Informative));
  ScrollElementNode s;
  static_cast<ClassifiedElement &>(s) = element(3, Classification::Scrollable);
  s.vertical_scroll_percent = 10;
  els.push_back(s);
  els.push_back(element(4, Classification::Interactive));

  auto st = state_at(7, std::move(els));
  DOCTEST_REQUIRE(st->generation() == 7);
  DOCTEST_REQUIRE(st->size() == 4);
  DOCTEST_REQUIRE(st->interactive().size() == 2);
  DOCTEST_REQUIRE(st->informative().size() == 1);
  DOCTEST_REQUIRE(st->scrollable().size() == 1);
  DOCTEST_REQUIRE(st->scrollable()[0]->vertical_scroll_percent == 10);
  DOCTEST_REQUIRE(as_element(*st->find(3)).name == "e3");
  DOCTEST_REQUIRE(st->find(0) == nullptr);
}

DOCTEST_TEST_CASE("change kinds parse from their names") {
  DOCTEST_REQUIRE(parse_change_kind("focus") == ChangeKind::Focus);
  DOCTEST_REQUIRE(parse_change_kind("structure") == ChangeKind::Structure);
  DOCTEST_REQUIRE(parse_change_kind("property") == ChangeKind::Property);
  DOCTEST_REQUIRE_FALSE(parse_change_kind("resize").has_value());
  DOCTEST_REQUIRE(std::string(to_string(ChangeKind::Focus)) == "focus");
}
