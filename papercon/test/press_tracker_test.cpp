#include "press_tracker.hpp"
#include <gtest/gtest.h>

using namespace std::chrono;

namespace {

struct Counts {
  int tap = 0, ready = 0, long_press = 0, reset = 0;
  void add(const std::vector<PressAction>& v){
    for (auto a : v){
      switch (a){
        case PressAction::Tap:            ++tap; break;
        case PressAction::LongPressReady: ++ready; break;
        case PressAction::LongPress:      ++long_press; break;
        case PressAction::FactoryReset:   ++reset; break;
      }
    }
  }
};

// press at 0, tick every 100 ms while held, release at `hold`
Counts simulate(nanoseconds hold){
  PressTracker t;
  Counts c;
  c.add(t.on_edge({Edge::Falling, nanoseconds(0)}));
  for (nanoseconds now = milliseconds(100); now < hold; now += milliseconds(100))
    c.add(t.on_tick(now));
  c.add(t.on_edge({Edge::Rising, hold}));
  return c;
}

}

TEST(PressTracker, ShortPressIsTap){
  for (auto hold : {milliseconds(60), milliseconds(800), milliseconds(4900)}){
    Counts c = simulate(hold);
    EXPECT_EQ(c.tap, 1) << hold.count();
    EXPECT_EQ(c.long_press, 0);
    EXPECT_EQ(c.reset, 0);
    EXPECT_EQ(c.ready, 0);
  }
}

TEST(PressTracker, MediumPressIsLongPress){
  for (auto hold : {milliseconds(5000), milliseconds(9000), milliseconds(14950)}){
    Counts c = simulate(hold);
    EXPECT_EQ(c.long_press, 1) << hold.count();
    EXPECT_EQ(c.tap, 0);
    EXPECT_EQ(c.reset, 0);
  }
}

TEST(PressTracker, LongHoldFiresFactoryResetWhileHeld){
  PressTracker t;
  Counts c;
  c.add(t.on_edge({Edge::Falling, seconds(0)}));
  for (nanoseconds now = milliseconds(100); now <= milliseconds(15050); now += milliseconds(100))
    c.add(t.on_tick(now));
  EXPECT_EQ(c.reset, 1);
  EXPECT_EQ(c.ready, 1);
  EXPECT_TRUE(t.pressed());

  for (nanoseconds now = milliseconds(15100); now < seconds(20); now += milliseconds(100))
    c.add(t.on_tick(now));
  c.add(t.on_edge({Edge::Rising, seconds(20)}));
  EXPECT_EQ(c.reset, 1);
  EXPECT_EQ(c.tap, 0);
  EXPECT_EQ(c.long_press, 0);
  EXPECT_FALSE(t.pressed());
}

TEST(PressTracker, ReadyCueOnceAtLongPressThreshold){
  PressTracker t;
  t.on_edge({Edge::Falling, seconds(0)});
  EXPECT_TRUE(t.on_tick(milliseconds(4900)).empty());
  auto a = t.on_tick(milliseconds(5000));
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0], PressAction::LongPressReady);
  EXPECT_TRUE(t.on_tick(milliseconds(6000)).empty());
}

TEST(PressTracker, ThreeSecondPressScenario){
  Counts c = simulate(seconds(3));
  EXPECT_EQ(c.tap, 1);
  EXPECT_EQ(c.long_press, 0);
  EXPECT_EQ(c.reset, 0);
}

TEST(PressTracker, ReleasePastResetWithoutTickStillResets){
  PressTracker t;
  t.on_edge({Edge::Falling, seconds(0)});
  auto a = t.on_edge({Edge::Rising, seconds(16)});
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0], PressAction::FactoryReset);
}

TEST(PressTracker, RepeatedFallingEdgeIgnored){
  PressTracker t;
  t.on_edge({Edge::Falling, seconds(0)});
  t.on_edge({Edge::Falling, seconds(2)});  // must not restart the session
  auto a = t.on_edge({Edge::Rising, seconds(6)});
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0], PressAction::LongPress);
}

TEST(PressTracker, RisingEdgeWithoutPressIgnored){
  PressTracker t;
  EXPECT_TRUE(t.on_edge({Edge::Rising, seconds(1)}).empty());
  EXPECT_TRUE(t.on_tick(seconds(30)).empty());
}

TEST(PressTracker, BounceAfterReleaseIgnored){
  PressTracker t;
  t.on_edge({Edge::Falling, milliseconds(0)});
  t.on_edge({Edge::Rising, milliseconds(300)});
  // contact bounce 10 ms after release
  EXPECT_TRUE(t.on_edge({Edge::Falling, milliseconds(310)}).empty());
  EXPECT_FALSE(t.pressed());
  t.on_edge({Edge::Falling, milliseconds(400)});
  EXPECT_TRUE(t.pressed());
}

TEST(PressTracker, BounceAtPressTimeKeepsSession){
  PressTracker t;
  Counts c;
  c.add(t.on_edge({Edge::Falling, milliseconds(0)}));
  // contacts chatter while closing
  c.add(t.on_edge({Edge::Rising, milliseconds(2)}));
  c.add(t.on_edge({Edge::Falling, milliseconds(4)}));
  EXPECT_TRUE(t.pressed());
  for (nanoseconds now = milliseconds(100); now < milliseconds(7000); now += milliseconds(100))
    c.add(t.on_tick(now));
  c.add(t.on_edge({Edge::Rising, milliseconds(7000)}));
  EXPECT_EQ(c.tap, 0);
  EXPECT_EQ(c.ready, 1);
  EXPECT_EQ(c.long_press, 1);
  EXPECT_EQ(c.reset, 0);
  EXPECT_FALSE(t.pressed());
}

TEST(PressTracker, CustomThresholds){
  PressThresholds th;
  th.long_press = milliseconds(500);
  th.factory_reset = seconds(2);
  PressTracker t(th);
  t.on_edge({Edge::Falling, seconds(0)});
  auto a = t.on_edge({Edge::Rising, milliseconds(700)});
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0], PressAction::LongPress);
}
