#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include <gtest/gtest.h>

#include "extauth/request_workers.hpp"

namespace {

TEST(RequestWorkersTest, BlockedTasksDoNotDelayNewOnes) {
  extauth::RequestWorkers workers;
  std::promise<void> gate;
  std::shared_future<void> released = gate.get_future().share();
  std::atomic<int> blocked{0};
  for (int i = 0; i < 8; ++i) {
    ASSERT_TRUE(workers.Spawn([released, &blocked] {
      ++blocked;
      released.wait();
    }));
  }

  std::promise<void> quick;
  auto quick_done = quick.get_future();
  ASSERT_TRUE(workers.Spawn([&quick] { quick.set_value(); }));
  EXPECT_EQ(quick_done.wait_for(std::chrono::seconds(2)), std::future_status::ready);

  gate.set_value();
  workers.Join();
  EXPECT_EQ(blocked.load(), 8);
  EXPECT_EQ(workers.Active(), 0u);
}

TEST(RequestWorkersTest, JoinWaitsForRunningTasks) {
  extauth::RequestWorkers workers;
  std::atomic<int> done{0};
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(workers.Spawn([&done] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      ++done;
    }));
  }
  workers.Join();
  EXPECT_EQ(done.load(), 4);
}

TEST(RequestWorkersTest, StoppedWorkersRefuseNewTasks) {
  extauth::RequestWorkers workers;
  workers.Stop();
  bool ran = false;
  EXPECT_FALSE(workers.Spawn([&ran] { ran = true; }));
  workers.Join();
  EXPECT_FALSE(ran);
}

TEST(RequestWorkersTest, FinishedThreadsAreReapedOnNextSpawn) {
  extauth::RequestWorkers workers;
  for (int round = 0; round < 50; ++round) {
    std::promise<void> finished;
    auto f = finished.get_future();
    ASSERT_TRUE(workers.Spawn([&finished] { finished.set_value(); }));
    f.wait();
  }
  workers.Join();
  EXPECT_EQ(workers.Active(), 0u);
}

}  // namespace
