#include "button_driver.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace {

ButtonConfig missing_chip(){
  ButtonConfig c;
  c.chip = "/dev/gpiochip-papercon-missing";
  c.retry = RetryPolicy{2, milliseconds(10)};
  return c;
}

bool wait_for_state(const ButtonDriver& b, InitState want, milliseconds timeout){
  auto deadline = steady_clock::now() + timeout;
  while (steady_clock::now() < deadline){
    if (b.state() == want) return true;
    std::this_thread::sleep_for(milliseconds(5));
  }
  return b.state() == want;
}

// press at clock, tick every 100 ms, release after hold; clock moves past the release
void press(ButtonDriver& b, nanoseconds& clock, nanoseconds hold){
  nanoseconds start = clock;
  b.handle({Edge::Falling, start});
  for (nanoseconds now = start + milliseconds(100); now < start + hold; now += milliseconds(100)) b.tick(now);
  b.handle({Edge::Rising, start + hold});
  clock = start + hold + seconds(1);
}

}

TEST(ButtonDriver, MissingChipDisablesAndRetries){
  ButtonDriver b(missing_chip());
  EXPECT_EQ(b.state(), InitState::Uninit);
  EXPECT_NO_THROW(b.start());
  EXPECT_FALSE(b.available());
  InitState s = b.state();
  EXPECT_TRUE(s == InitState::Retrying || s == InitState::Failed) << to_string(s);

  EXPECT_TRUE(wait_for_state(b, InitState::Failed, seconds(2)));
  EXPECT_FALSE(b.available());
  EXPECT_NO_THROW(b.stop());
}

TEST(ButtonDriver, StopWhileRetryingReturns){
  ButtonConfig c = missing_chip();
  c.retry = RetryPolicy{100, seconds(30)};
  ButtonDriver b(c);
  b.start();
  EXPECT_EQ(b.state(), InitState::Retrying);
  b.stop();
  EXPECT_FALSE(b.available());
}

TEST(ButtonDriver, EachActionReachesItsCallback){
  ButtonDriver b(missing_chip());
  std::vector<std::string> fired;
  b.set_tap_callback([&]{ fired.push_back("tap"); });
  b.set_long_press_callback([&]{ fired.push_back("long"); });
  b.set_long_press_ready_callback([&]{ fired.push_back("ready"); });
  b.set_factory_reset_callback([&]{ fired.push_back("reset"); });

  nanoseconds clock{0};
  press(b, clock, seconds(1));
  EXPECT_EQ(fired, (std::vector<std::string>{"tap"}));

  fired.clear();
  press(b, clock, seconds(7));
  EXPECT_EQ(fired, (std::vector<std::string>{"ready", "long"}));

  fired.clear();
  press(b, clock, seconds(20));
  EXPECT_EQ(fired, (std::vector<std::string>{"ready", "reset"}));
}

TEST(ButtonDriver, ThrowingCallbackDoesNotStopTheNext){
  ButtonDriver b(missing_chip());
  int long_presses = 0;
  int taps = 0;
  b.set_long_press_ready_callback([]{ throw std::runtime_error("cue failed"); });
  b.set_long_press_callback([&]{ ++long_presses; });
  b.set_tap_callback([&]{ ++taps; throw std::runtime_error("tap failed"); });

  nanoseconds clock{0};
  EXPECT_NO_THROW(press(b, clock, seconds(6)));
  EXPECT_EQ(long_presses, 1);

  EXPECT_NO_THROW(press(b, clock, milliseconds(300)));
  EXPECT_NO_THROW(press(b, clock, milliseconds(300)));
  EXPECT_EQ(taps, 2);
}

TEST(ButtonDriver, MissingCallbackIsSkipped){
  ButtonDriver b(missing_chip());
  int resets = 0;
  b.set_factory_reset_callback([&]{ ++resets; });
  nanoseconds clock{0};
  EXPECT_NO_THROW(press(b, clock, seconds(16)));
  EXPECT_EQ(resets, 1);
}
