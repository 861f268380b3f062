#include "doctest/doctest.h"
#include "uiscope/classifier.hpp"

using namespace uiscope;

static int ct(ControlType t) { return static_cast<int>(t); }

DOCTEST_TEST_CASE("enabled onscreen button is interactive") {
  PatternFlags p;
  p.set(Pattern::Invoke);
  DOCTEST_REQUIRE(classify(ct(ControlType::Button), p, true, false, true) ==
                  Classification::Interactive);
}

DOCTEST_TEST_CASE("disabled or offscreen controls are never interactive") {
  PatternFlags p;
  p.set(Pattern::Invoke);
  DOCTEST_REQUIRE(classify(ct(ControlType::Button), p, false, false, true) ==
                  Classification::Informative);
  DOCTEST_REQUIRE(classify(ct(ControlType::Button), p, true, true, true) ==
                  Classification::Informative);
  DOCTEST_REQUIRE(classify(ct(ControlType::Button), p, false, false, false) ==
                  Classification::Ignored);
  DOCTEST_REQUIRE(classify(ct(ControlType::Group), p, false, false, false,
                           ClassifierProfile::Web) == Classification::Ignored);
}

DOCTEST_TEST_CASE("scroll range wins over interactive") {
  PatternFlags p;
  p.set(Pattern::Scroll).set(Pattern::Value);
  p.scroll_range = true;
  DOCTEST_REQUIRE(classify(ct(ControlType::Edit), p, true, false, true) ==
                  Classification::Scrollable);

  // A scroll pattern without range does not make it scrollable.
  p.scroll_range = false;
  DOCTEST_REQUIRE(classify(ct(ControlType::Edit), p, true, false, true) ==
                  Classification::Interactive);
}

DOCTEST_TEST_CASE("text alone makes an element informative") {
  PatternFlags none;
  DOCTEST_REQUIRE(classify(ct(ControlType::Text), none, true, false, true) ==
                  Classification::Informative);
  DOCTEST_REQUIRE(classify(ct(ControlType::Pane), none, true, false, false) ==
                  Classification::Ignored);
  DOCTEST_REQUIRE(classify(99999, none, true, false, false) ==
                  Classification::Ignored);
}

DOCTEST_TEST_CASE("every interactive type classifies as interactive") {
  PatternFlags none;
  for (ControlType t : interactive_control_types()) {
    DOCTEST_REQUIRE(classify(ct(t), none, true, false, false) ==
                    Classification::Interactive);
  }
  DOCTEST_REQUIRE(interactive_control_types().size() == 14);
}

DOCTEST_TEST_CASE("web profile accepts actionable generic containers") {
  PatternFlags invoke;
  invoke.set(Pattern::Invoke);
  PatternFlags none;

  for (ControlType t : {ControlType::Group, ControlType::Custom,
                        ControlType::Text, ControlType::Image}) {
    DOCTEST_REQUIRE(classify(ct(t), invoke, true, false, false,
                             ClassifierProfile::Web) ==
                    Classification::Interactive);
    DOCTEST_REQUIRE(classify(ct(t), invoke, true, false, false,
                             ClassifierProfile::Desktop) !=
                    Classification::Interactive);
    DOCTEST_REQUIRE(classify(ct(t), none, true, false, false,
                             ClassifierProfile::Web) == Classification::Ignored);
  }

  PatternFlags expand;
  expand.set(Pattern::ExpandCollapse);
  DOCTEST_REQUIRE(classify(ct(ControlType::Group), expand, true, false, false,
                           ClassifierProfile::Web) ==
                  Classification::Interactive);
}

DOCTEST_TEST_CASE("web profile needs a pattern on list and data items") {
  PatternFlags none;
  PatternFlags select;
  select.set(Pattern::SelectionItem);

  DOCTEST_REQUIRE(classify(ct(ControlType::ListItem), none, true, false, true,
                           ClassifierProfile::Web) ==
                  Classification::Informative);
  DOCTEST_REQUIRE(classify(ct(ControlType::ListItem), select, true, false, true,
                           ClassifierProfile::Web) ==
                  Classification::Interactive);
  DOCTEST_REQUIRE(classify(ct(ControlType::DataItem), none, true, false, false,
                           ClassifierProfile::Desktop) ==
                  Classification::Interactive);
  DOCTEST_REQUIRE(classify(ct(ControlType::Button), none, true, false, false,
                           ClassifierProfile::Web) ==
                  Classification::Interactive);
}

DOCTEST_TEST_CASE("classify is deterministic") {
  PatternFlags p;
  p.set(Pattern::Toggle).set(Pattern::Invoke);
  Classification first = classify(ct(ControlType::CheckBox), p, true, false, true);
  for (int i = 0; i < 100; ++i) {
    DOCTEST_REQUIRE(classify(ct(ControlType::CheckBox), p, true, false, true) ==
                    first);
  }
}
