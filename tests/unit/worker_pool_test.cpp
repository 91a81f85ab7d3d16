#include "internal/scheduler/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/scheduler/periodic_task.hpp"

namespace {

using namespace std::chrono_literals;
using mirrorwatch::scheduler::PeriodicTask;
using mirrorwatch::scheduler::ResumeDelay;
using mirrorwatch::scheduler::WorkerPool;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

void TestJobsRunOnAllWorkers() {
  WorkerPool pool("test", 4);
  assert(pool.Size() == 4);

  std::atomic<int> done{0};
  for (int i = 0; i < 100; ++i) {
    assert(pool.Submit([&] { done.fetch_add(1); }));
  }
  assert(WaitFor([&] { return done.load() == 100; }));
  assert(!pool.Stopped());
}

void TestConcurrencyIsBoundedByPoolSize() {
  WorkerPool pool("bounded", 3);

  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::atomic<int> done{0};
  for (int i = 0; i < 12; ++i) {
    pool.Submit([&] {
      const int now = running.fetch_add(1) + 1;
      int       seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(5ms);
      running.fetch_sub(1);
      done.fetch_add(1);
    });
  }
  assert(WaitFor([&] { return done.load() == 12; }));
  assert(peak.load() <= 3);
}

void TestThrowingJobDoesNotKillWorker() {
  WorkerPool pool("throwing", 1);
  std::atomic<bool> after{false};
  pool.Submit([] { throw std::runtime_error("boom"); });
  pool.Submit([&] { after = true; });
  assert(WaitFor([&] { return after.load(); }));
}

void TestShutdownDropsQueuedJobs() {
  WorkerPool pool("shutdown", 1);
  std::atomic<bool> release{false};
  std::atomic<int>  ran{0};

  pool.Submit([&] {
    while (!release.load()) std::this_thread::sleep_for(1ms);
    ran.fetch_add(1);
  });
  for (int i = 0; i < 5; ++i) pool.Submit([&] { ran.fetch_add(1); });
  assert(WaitFor([&] { return pool.Pending() == 5; }));

  std::thread stopper([&] { pool.Shutdown(); });
  std::this_thread::sleep_for(10ms);
  release = true;
  stopper.join();

  assert(pool.Stopped());
  assert(ran.load() == 1);
  assert(pool.Pending() == 0);
  assert(!pool.Submit([] {}));

  // idempotent
  pool.Shutdown();
}

void TestPeriodicTaskRunsAndStops() {
  std::atomic<int> runs{0};
  PeriodicTask     task("tick", 10ms, [&] { runs.fetch_add(1); });
  task.Start();
  assert(WaitFor([&] { return runs.load() >= 3; }));
  task.Stop();

  const auto stopped_at = runs.load();
  std::this_thread::sleep_for(30ms);
  assert(runs.load() == stopped_at);
  assert(task.Runs() == static_cast<uint64_t>(stopped_at));
}

void TestPeriodicTaskSurvivesExceptions() {
  std::atomic<int> runs{0};
  PeriodicTask     task("failing", 5ms, [&] {
    runs.fetch_add(1);
    throw std::runtime_error("loop body failed");
  });
  task.Start();
  assert(WaitFor([&] { return runs.load() >= 2; }));
}

void TestStopInterruptsInitialDelay() {
  std::atomic<int> runs{0};
  PeriodicTask     task("delayed", 10ms, [&] { runs.fetch_add(1); }, 10s);
  task.Start();

  const auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(runs.load() == 0);
}

void TestResumeDelay() {
  const auto interval = std::chrono::milliseconds(900'000);
  assert(ResumeDelay(std::nullopt, 1'000'000, interval) == 0ms);
  // last run 100s ago: wait the rest of the interval
  assert(ResumeDelay(900'000, 1'000'000, interval) == std::chrono::milliseconds(800'000));
  // overdue
  assert(ResumeDelay(10'000, 1'000'000, interval) == 0ms);
  // stored timestamp from the future (clock moved back)
  assert(ResumeDelay(5'000'000, 1'000'000, interval) == 0ms);
}

} // namespace

int main() {
  TestJobsRunOnAllWorkers();
  TestConcurrencyIsBoundedByPoolSize();
  TestThrowingJobDoesNotKillWorker();
  TestShutdownDropsQueuedJobs();
  TestPeriodicTaskRunsAndStops();
  TestPeriodicTaskSurvivesExceptions();
  TestStopInterruptsInitialDelay();
  TestResumeDelay();

  std::cout << "worker_pool_test: pass\n";
  return 0;
}
