#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <chrono>
#include <thread>
#include <vector>

#include "core/concurrency/CancellationToken.hpp"
#include "core/concurrency/ConcurrencyGate.hpp"
#include "core/errors/Error.hpp"

using namespace vindex;
using namespace std::chrono_literals;

TEST(ConcurrencyGateTest, NeverExceedsMaxConcurrency) {
  GateRegistry gates;
  gates.registerGate("gpu", 2);

  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      GateGuard g = gates.acquire("gpu");
      const int now = ++active;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
      std::this_thread::sleep_for(5ms);
      --active;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
  EXPECT_EQ(gates.inUse("gpu"), 0u);
}

TEST(ConcurrencyGateTest, UnknownNameIsMisconfigured) {
  GateRegistry gates;
  try {
    gates.acquire("missing");
    FAIL() << "expected GateMisconfigured";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::GateMisconfigured);
  }
  EXPECT_FALSE(gates.isRegistered("missing"));
}

TEST(ConcurrencyGateTest, ZeroSlotsIsRejected) {
  GateRegistry gates;
  try {
    gates.registerGate("gpu", 0);
    FAIL() << "expected InvalidArgument";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
  }
  EXPECT_FALSE(gates.isRegistered("gpu"));
}

TEST(ConcurrencyGateTest, TimedAcquireReportsExhaustion) {
  GateRegistry gates;
  gates.registerGate("gpu", 1);
  GateGuard held = gates.acquire("gpu");
  try {
    gates.acquireFor("gpu", 20ms);
    FAIL() << "expected GateExhausted";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::GateExhausted);
  }
  held.release();
  GateGuard again = gates.acquireFor("gpu", 20ms);
  EXPECT_TRUE(again.held());
}

TEST(ConcurrencyGateTest, SlotIsReleasedOnException) {
  GateRegistry gates;
  gates.registerGate("gpu", 1);
  try {
    GateGuard g = gates.acquire("gpu");
    EXPECT_EQ(gates.inUse("gpu"), 1u);
    throw std::runtime_error("inference blew up");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(gates.inUse("gpu"), 0u);
}

TEST(ConcurrencyGateTest, MovedGuardReleasesOnce) {
  GateRegistry gates;
  gates.registerGate("gpu", 1);
  {
    GateGuard a = gates.acquire("gpu");
    GateGuard b = std::move(a);
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_EQ(gates.inUse("gpu"), 1u);
  }
  EXPECT_EQ(gates.inUse("gpu"), 0u);
}

TEST(ConcurrencyGateTest, WaiterProceedsWhenSlotFrees) {
  GateRegistry gates;
  gates.registerGate("gpu", 1);
  GateGuard first = gates.acquire("gpu");

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    GateGuard g = gates.acquire("gpu");
    acquired = true;
  });
  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(acquired.load());
  first.release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
}

TEST(CancellationTokenTest, WaitReturnsEarlyWhenCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.waitFor(1ms));

  std::thread canceller([&] {
    std::this_thread::sleep_for(10ms);
    token.cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.waitFor(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  canceller.join();
  EXPECT_TRUE(token.cancelled());
}
