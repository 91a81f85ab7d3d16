#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mirrorwatch::scheduler {

/*
  Runs `body` on its own thread every `interval`, measured from the start
  of one run to the start of the next. A run that overruns the interval
  delays the next one instead of overlapping it.

  Stop() interrupts the sleep, not a run in progress.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body,
               std::chrono::milliseconds initial_delay = std::chrono::milliseconds{0});
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

  uint64_t Runs() const {
    return runs_.load();
  }

 private:
  void Loop();
  // false when woken by Stop()
  bool SleepUntil(std::chrono::steady_clock::time_point when);

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     body_;
  std::chrono::milliseconds initial_delay_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   runs_{0};
};

// Delay until the next run when the previous one happened at `last_ms`.
std::chrono::milliseconds ResumeDelay(std::optional<uint64_t> last_ms, uint64_t now_ms, std::chrono::milliseconds interval);

} // namespace mirrorwatch::scheduler
