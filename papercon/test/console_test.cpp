#include "console.hpp"
#include "fake_transport.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <memory>
#include <thread>

using namespace std::chrono;

namespace {

class CountingModule : public ContentModule {
public:
  explicit CountingModule(std::atomic<int>& n) : n_(n) {}
  std::string name() const override { return "Counter"; }
  void render(Printer& p) override { ++n_; p.print_body("count"); }
private:
  std::atomic<int>& n_;
};

// prints one line, then holds the job until released
class HeldModule : public ContentModule {
public:
  std::string name() const override { return "Held"; }
  void render(Printer& p) override {
    p.print_body("one");
    entered.set_value();
    release.get_future().wait();
    p.print_body("two");
  }
  std::promise<void> entered;
  std::promise<void> release;
};

struct ConsoleTest : ::testing::Test {
  FakeTransport port;
  Printer printer{port, PrinterConfig(), EscPosTiming::none()};
  DialDriver dial{DialConfig{}};
  EventLoop loop;
  std::atomic<int> renders{0};

  ConsoleConfig config(milliseconds debounce = milliseconds(0)){
    ConsoleConfig c;
    c.print_debounce = debounce;
    c.quick_actions_timeout = milliseconds(50);
    return c;
  }
};

}

TEST(EventLoopTest, RunsInPostOrder){
  EventLoop loop;
  std::vector<int> order;
  loop.post([&]{ order.push_back(1); });
  loop.post([&]{ order.push_back(2); });
  EXPECT_EQ(loop.run_pending(), 2);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTest, RanTasksReleaseCaptures){
  EventLoop loop;
  auto token = std::make_shared<int>(0);
  loop.post([token]{ ++*token; });
  loop.post_after(milliseconds(0), [token]{ ++*token; });
  EXPECT_EQ(token.use_count(), 3);
  EXPECT_EQ(loop.run_pending(), 2);
  EXPECT_EQ(*token, 2);
  EXPECT_EQ(token.use_count(), 1);
  EXPECT_EQ(loop.pending(), 0u);
}

TEST(EventLoopTest, DelayedTaskWaitsForDeadline){
  EventLoop loop;
  bool ran = false;
  loop.post_after(milliseconds(30), [&]{ ran = true; });
  EXPECT_EQ(loop.run_pending(), 0);
  EXPECT_FALSE(ran);
  loop.run_for(seconds(2));
  EXPECT_TRUE(ran);
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopLoop){
  EventLoop loop;
  bool ran = false;
  loop.post([]{ throw std::runtime_error("bad task"); });
  loop.post([&]{ ran = true; });
  loop.run_pending();
  EXPECT_TRUE(ran);
}

TEST(EventLoopTest, RunStopsOnRequest){
  EventLoop loop;
  std::thread t([&]{ std::this_thread::sleep_for(milliseconds(20)); loop.stop(); });
  loop.run();
  t.join();
  SUCCEED();
}

TEST_F(ConsoleTest, TapPrintsDialChannel){
  Console console(loop, printer, dial, config());
  console.set_channel(3, {std::make_shared<CountingModule>(renders)});
  dial.set_position(3);
  console.on_tap();
  console.wait_idle();
  EXPECT_EQ(renders.load(), 1);
  EXPECT_EQ(find_rasters(port.bytes()).size(), 1u);
  EXPECT_FALSE(console.gate().busy());
}

TEST_F(ConsoleTest, EmptyChannelStillPrints){
  Console console(loop, printer, dial, config());
  dial.set_position(6);
  console.on_tap();
  console.wait_idle();
  auto r = find_rasters(port.bytes());
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0].height, 58 + 22);
}

TEST_F(ConsoleTest, RepeatedTapsInsideDebounceGiveOneJob){
  Console console(loop, printer, dial, config(seconds(10)));
  console.set_channel(1, {std::make_shared<CountingModule>(renders)});
  console.on_tap();
  console.on_tap();
  console.on_tap();
  console.wait_idle();
  console.on_tap();
  console.wait_idle();
  EXPECT_EQ(renders.load(), 1);
  EXPECT_EQ(console.jobs_started(), 1);
}

TEST_F(ConsoleTest, LongPressOpensQuickActions){
  Console console(loop, printer, dial, config());
  console.on_long_press();
  console.wait_idle();
  EXPECT_TRUE(console.selection().active());
  EXPECT_EQ(find_rasters(port.bytes()).size(), 1u);

  // choosing "cancel" closes the menu without printing
  dial.set_position(8);
  console.on_tap();
  console.wait_idle();
  EXPECT_FALSE(console.selection().active());
  EXPECT_EQ(find_rasters(port.bytes()).size(), 1u);
}

TEST_F(ConsoleTest, QuickActionReprintsChannel){
  Console console(loop, printer, dial, config());
  console.set_channel(2, {std::make_shared<CountingModule>(renders)});
  dial.set_position(2);
  console.on_long_press();
  console.wait_idle();

  dial.set_position(3);
  console.on_tap();
  console.wait_idle();
  EXPECT_EQ(renders.load(), 1);
  EXPECT_FALSE(console.selection().active());
}

TEST_F(ConsoleTest, QuickActionsExpire){
  Console console(loop, printer, dial, config());
  console.on_long_press();
  console.wait_idle();
  ASSERT_TRUE(console.selection().active());
  loop.run_for(seconds(2));
  EXPECT_FALSE(console.selection().active());
}

TEST_F(ConsoleTest, ExpiryLeavesNewerSessionAlone){
  Console console(loop, printer, dial, config());
  console.on_long_press();
  console.wait_idle();
  console.selection().enter([](int){}, "game");
  loop.run_for(seconds(2));
  ASSERT_TRUE(console.selection().active());
  EXPECT_EQ(console.selection().owner().value(), "game");
}

TEST_F(ConsoleTest, SelectionTapGoesToMenuNotChannel){
  Console console(loop, printer, dial, config());
  console.set_channel(4, {std::make_shared<CountingModule>(renders)});
  int chosen = 0;
  console.selection().enter([&](int p){ chosen = p; }, "menu");
  dial.set_position(4);
  console.on_tap();
  console.wait_idle();
  EXPECT_EQ(chosen, 4);
  EXPECT_EQ(renders.load(), 0);
}

TEST_F(ConsoleTest, FactoryResetPrintsNoticeAndClearsSelection){
  Console console(loop, printer, dial, config());
  console.selection().enter([](int){}, "menu");
  console.on_factory_reset();
  console.wait_idle();
  EXPECT_EQ(console.factory_resets(), 1);
  EXPECT_FALSE(console.selection().active());
  EXPECT_EQ(find_rasters(port.bytes()).size(), 1u);
}

TEST_F(ConsoleTest, FactoryResetWaitsForRunningJob){
  Console console(loop, printer, dial, config(seconds(10)));
  auto held = std::make_shared<HeldModule>();
  auto entered = held->entered.get_future();
  console.set_channel(1, {held});
  console.on_tap();
  entered.wait();

  console.on_factory_reset();
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_TRUE(find_rasters(port.bytes()).empty());

  held->release.set_value();
  console.wait_idle();
  auto r = find_rasters(port.bytes());
  ASSERT_EQ(r.size(), 2u);
  // the channel job kept both of its lines
  EXPECT_EQ(r[0].height, 2 * 22);
  EXPECT_FALSE(console.gate().busy());
}

TEST_F(ConsoleTest, LongPressReadyBlips){
  Console console(loop, printer, dial, config());
  console.on_long_press_ready();
  console.wait_idle();
  EXPECT_EQ(port.bytes(), (std::vector<uint8_t>{0x1B, 0x4A, 0x02}));
}

TEST_F(ConsoleTest, DialChangesReachLoop){
  Console console(loop, printer, dial, config());
  console.attach(dial);
  dial.set_position(5);
  EXPECT_EQ(loop.run_pending(), 1);
}
