#include "detection/event_loop.h"
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tripsense;
using namespace std::chrono_literals;

class EventLoopTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(loop_.init());
    ASSERT_TRUE(loop_.start());
  }
  void TearDown() override { loop_.shutdown(); }

  void record(int value) {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.push_back(value);
  }
  std::vector<int> order() {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
  }

  std::shared_ptr<SystemClock> clock_ = std::make_shared<SystemClock>();
  EventLoop loop_{clock_};
  std::mutex mutex_;
  std::vector<int> order_;
};

TEST_F(EventLoopTest, RunsTasksInPostOrder) {
  for (int i = 0; i < 100; ++i)
    loop_.post([this, i] { record(i); });
  ASSERT_TRUE(loop_.flush(2s));

  auto seen = order();
  ASSERT_EQ(seen.size(), 100u);
  for (int i = 0; i < 100; ++i)
    EXPECT_EQ(seen[i], i);
}

TEST_F(EventLoopTest, TasksFromManyThreadsRunOnOneThread) {
  std::atomic<int> count{0};
  std::mutex ids_mutex;
  std::set<std::thread::id> ids;

  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&] {
      for (int i = 0; i < 250; ++i) {
        loop_.post([&] {
          count++;
          std::lock_guard<std::mutex> lock(ids_mutex);
          ids.insert(std::this_thread::get_id());
        });
      }
    });
  }
  for (auto &t : producers)
    t.join();

  ASSERT_TRUE(loop_.flush(2s));
  EXPECT_EQ(count.load(), 1000);
  EXPECT_EQ(ids.size(), 1u);
}

TEST_F(EventLoopTest, TimerFiresAfterDelay) {
  std::atomic<bool> fired{false};
  auto start = std::chrono::steady_clock::now();
  std::atomic<int64_t> waited_ms{0};

  loop_.schedule(50ms, [&] {
    waited_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count();
    fired = true;
  });

  for (int i = 0; i < 100 && !fired; ++i)
    std::this_thread::sleep_for(10ms);
  ASSERT_TRUE(fired.load());
  EXPECT_GE(waited_ms.load(), 45);
}

TEST_F(EventLoopTest, CancelledTimerNeverFires) {
  std::atomic<bool> fired{false};
  TimerId id = loop_.schedule(30ms, [&] { fired = true; });
  EXPECT_NE(id, kInvalidTimer);
  loop_.cancel(id);
  loop_.cancel(id);
  loop_.cancel(kInvalidTimer);

  std::this_thread::sleep_for(80ms);
  EXPECT_FALSE(fired.load());
  EXPECT_EQ(loop_.pending_timers(), 0u);
}

TEST_F(EventLoopTest, TimersFireInDeadlineOrder) {
  loop_.schedule(40ms, [this] { record(2); });
  loop_.schedule(10ms, [this] { record(1); });
  loop_.schedule(70ms, [this] { record(3); });

  for (int i = 0; i < 100 && order().size() < 3; ++i)
    std::this_thread::sleep_for(10ms);
  std::vector<int> expected = {1, 2, 3};
  EXPECT_EQ(order(), expected);
}

TEST_F(EventLoopTest, ThrowingTaskDoesNotStopLoop) {
  loop_.post([] { throw std::runtime_error("adapter exploded"); });
  loop_.post([] { throw 42; });
  loop_.post([this] { record(1); });
  ASSERT_TRUE(loop_.flush(2s));

  EXPECT_EQ(order().size(), 1u);
  EXPECT_EQ(loop_.get_stats().task_errors, 2u);
  EXPECT_TRUE(loop_.running());
}

TEST_F(EventLoopTest, TimerCanScheduleAnotherTimer) {
  loop_.schedule(5ms, [this] {
    record(1);
    loop_.schedule(5ms, [this] { record(2); });
  });
  for (int i = 0; i < 100 && order().size() < 2; ++i)
    std::this_thread::sleep_for(10ms);
  EXPECT_EQ(order().size(), 2u);
}

TEST_F(EventLoopTest, StopRunsQueuedTasksAndCancelsTimers) {
  std::atomic<bool> timer_fired{false};
  loop_.schedule(10s, [&] { timer_fired = true; });
  for (int i = 0; i < 10; ++i)
    loop_.post([this, i] { record(i); });

  ASSERT_TRUE(loop_.stop());
  EXPECT_EQ(order().size(), 10u);
  EXPECT_FALSE(timer_fired.load());
  EXPECT_EQ(loop_.pending_timers(), 0u);
  EXPECT_FALSE(loop_.running());
}

TEST_F(EventLoopTest, FlushFromLoopThreadIsRefused) {
  std::atomic<bool> result{true};
  loop_.post([&] { result = loop_.flush(100ms); });
  ASSERT_TRUE(loop_.flush(2s));
  EXPECT_FALSE(result.load());
}

TEST_F(EventLoopTest, RestartsAfterStop) {
  ASSERT_TRUE(loop_.stop());
  ASSERT_TRUE(loop_.start());
  loop_.post([this] { record(7); });
  ASSERT_TRUE(loop_.flush(2s));
  EXPECT_EQ(order(), std::vector<int>{7});
}

TEST(EventLoopScaledTest, ScaledClockShortensRealWait) {
  auto clock = std::make_shared<ScaledClock>(100.0);
  EventLoop loop(clock);
  ASSERT_TRUE(loop.start());

  std::atomic<bool> fired{false};
  auto start = std::chrono::steady_clock::now();
  loop.schedule(std::chrono::seconds(2), [&] { fired = true; });

  for (int i = 0; i < 200 && !fired; ++i)
    std::this_thread::sleep_for(5ms);
  auto real = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(fired.load());
  EXPECT_LT(real, 1s);
  loop.stop();
}
