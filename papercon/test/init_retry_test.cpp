#include "init_retry.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

using namespace std::chrono;

TEST(InitRetry, ImmediateSuccess){
  InitRetry r("dev", RetryPolicy{3, milliseconds(10)}, []{ return true; });
  EXPECT_EQ(r.state(), InitState::Uninit);
  EXPECT_EQ(r.start(), InitState::Ready);
  EXPECT_EQ(r.attempts(), 1);
  EXPECT_TRUE(r.settled());
}

TEST(InitRetry, StepWalksToFailed){
  InitRetry r("dev", RetryPolicy{2, milliseconds(10)}, []{ return false; });
  EXPECT_EQ(r.step(), InitState::Retrying);
  EXPECT_EQ(r.step(), InitState::Retrying);
  EXPECT_EQ(r.step(), InitState::Failed);
  EXPECT_EQ(r.attempts(), 3);
  // settled states do not attempt again
  EXPECT_EQ(r.step(), InitState::Failed);
  EXPECT_EQ(r.attempts(), 3);
}

TEST(InitRetry, ThrowingAttemptCountsAsFailure){
  InitRetry r("dev", RetryPolicy{1, milliseconds(10)}, []() -> bool { throw std::runtime_error("EBUSY"); });
  EXPECT_EQ(r.step(), InitState::Retrying);
  EXPECT_EQ(r.step(), InitState::Failed);
}

TEST(InitRetry, RecoversInBackground){
  std::atomic<int> calls{0};
  InitRetry r("dev", RetryPolicy{5, milliseconds(5)}, [&]{ return ++calls >= 3; });
  EXPECT_EQ(r.start(), InitState::Retrying);
  ASSERT_TRUE(r.wait_settled(seconds(5)));
  EXPECT_EQ(r.state(), InitState::Ready);
  EXPECT_EQ(r.attempts(), 3);
}

TEST(InitRetry, GivesUpAfterBoundedRetries){
  InitRetry r("dev", RetryPolicy{3, milliseconds(1)}, []{ return false; });
  r.start();
  ASSERT_TRUE(r.wait_settled(seconds(5)));
  EXPECT_EQ(r.state(), InitState::Failed);
  EXPECT_EQ(r.attempts(), 4);
}

TEST(InitRetry, CancelStopsRetries){
  InitRetry r("dev", RetryPolicy{100, seconds(30)}, []{ return false; });
  r.start();
  r.cancel();
  EXPECT_EQ(r.state(), InitState::Retrying);
  EXPECT_EQ(r.attempts(), 1);
}
