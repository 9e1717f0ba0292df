#include "selection_mode.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(SelectionMode, DispatchWithoutSessionDoesNothing){
  SelectionMode s;
  EXPECT_FALSE(s.dispatch(3));
  EXPECT_FALSE(s.active());
  EXPECT_FALSE(s.owner().has_value());
}

TEST(SelectionMode, DispatchCallsCallbackWithPosition){
  SelectionMode s;
  int got = 0;
  s.enter([&](int p){ got = p; }, "menu");
  EXPECT_TRUE(s.dispatch(6));
  EXPECT_EQ(got, 6);
  // the session stays until someone exits it
  EXPECT_TRUE(s.active());
}

TEST(SelectionMode, EnterSupersedesPreviousOwner){
  SelectionMode s;
  int old_calls = 0, new_calls = 0;
  s.enter([&](int){ ++old_calls; }, "first");
  s.enter([&](int){ ++new_calls; }, "second");
  EXPECT_TRUE(s.dispatch(1));
  EXPECT_EQ(old_calls, 0);
  EXPECT_EQ(new_calls, 1);
  EXPECT_EQ(s.owner().value(), "second");
}

TEST(SelectionMode, LateTimeoutDoesNotExitNewerOwner){
  SelectionMode s;
  s.enter([](int){}, "quick-actions-1");
  s.enter([](int){}, "adventure");
  EXPECT_FALSE(s.exit_if_owner("quick-actions-1"));
  EXPECT_TRUE(s.active());
  EXPECT_TRUE(s.exit_if_owner("adventure"));
  EXPECT_FALSE(s.active());
}

TEST(SelectionMode, ThrowingCallbackClearsSession){
  SelectionMode s;
  s.enter([](int){ throw std::runtime_error("broken menu"); }, "menu");
  EXPECT_TRUE(s.dispatch(2));
  EXPECT_FALSE(s.active());
  EXPECT_FALSE(s.dispatch(2));
}

TEST(SelectionMode, CallbackMayExitItself){
  SelectionMode s;
  s.enter([&](int){ s.exit(); }, "one-shot");
  EXPECT_TRUE(s.dispatch(4));
  EXPECT_FALSE(s.active());
}

TEST(SelectionMode, CallbackMayEnterNestedSession){
  SelectionMode s;
  int nested = 0;
  s.enter([&](int){ s.enter([&](int){ ++nested; }, "nested"); }, "outer");
  s.dispatch(1);
  EXPECT_EQ(s.owner().value(), "nested");
  s.dispatch(1);
  EXPECT_EQ(nested, 1);
}
