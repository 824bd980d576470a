#include "core/ExpirySweeper.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using sessiondb::common::ConfigurationError;
using sessiondb::core::ExpirySweeper;
using namespace std::chrono_literals;

TEST(ExpirySweeperTest, FirstSweepRunsOnStart) {
  std::atomic<int> iCount{0};
  ExpirySweeper es([&iCount]() { iCount.fetch_add(1); return 0; }, 60s);
  es.start();

  std::this_thread::sleep_for(300ms);
  es.stop();

  EXPECT_EQ(iCount.load(), 1);
}

TEST(ExpirySweeperTest, SweepRepeatsOnInterval) {
  std::atomic<int> iCount{0};
  ExpirySweeper es([&iCount]() { iCount.fetch_add(1); return 0; }, 1s);
  es.start();

  std::this_thread::sleep_for(1500ms);
  es.stop();

  EXPECT_GE(iCount.load(), 2);
}

TEST(ExpirySweeperTest, SweepNowAccumulatesTotal) {
  ExpirySweeper es([]() { return 3; }, 60s);
  EXPECT_EQ(es.sweepNow(), 3);
  EXPECT_EQ(es.sweepNow(), 3);
  EXPECT_EQ(es.totalDeleted(), 6);
}

TEST(ExpirySweeperTest, SweepNowPropagatesFailure) {
  ExpirySweeper es([]() -> int { throw std::runtime_error("db down"); }, 60s);
  EXPECT_THROW(es.sweepNow(), std::runtime_error);
  EXPECT_EQ(es.totalDeleted(), 0);
}

TEST(ExpirySweeperTest, FailingSweepDoesNotStopSchedule) {
  std::atomic<int> iCalls{0};
  ExpirySweeper es(
      [&iCalls]() -> int {
        if (iCalls.fetch_add(1) == 0) throw std::runtime_error("transient");
        return 2;
      },
      1s);
  es.start();

  std::this_thread::sleep_for(1500ms);
  es.stop();

  EXPECT_GE(iCalls.load(), 2);
  EXPECT_GE(es.totalDeleted(), 2);
}

TEST(ExpirySweeperTest, StopIsIdempotent) {
  ExpirySweeper es([]() { return 0; }, 1s);
  es.start();
  es.stop();
  es.stop();  // second stop should not crash

  SUCCEED();
}

TEST(ExpirySweeperTest, DestructorStopsCleanly) {
  std::atomic<int> iCount{0};
  {
    ExpirySweeper es([&iCount]() { iCount.fetch_add(1); return 0; }, 60s);
    es.start();
    std::this_thread::sleep_for(200ms);
  }
  // Destructor must not wait out the 60s interval
  EXPECT_EQ(iCount.load(), 1);
}

TEST(ExpirySweeperTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(ExpirySweeper(nullptr, 1s), ConfigurationError);
  EXPECT_THROW(ExpirySweeper([]() { return 0; }, 0s), ConfigurationError);
}
