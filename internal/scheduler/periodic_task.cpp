#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace mirrorwatch::scheduler {

using SteadyClock = std::chrono::steady_clock;

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body,
                           std::chrono::milliseconds initial_delay)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)), initial_delay_(initial_delay) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool PeriodicTask::SleepUntil(SteadyClock::time_point when) {
  std::unique_lock lock(mutex_);
  cv_.wait_until(lock, when, [&] { return !running_; });
  return running_;
}

void PeriodicTask::Loop() {
  auto next = SteadyClock::now() + initial_delay_;
  if (initial_delay_.count() > 0) {
    MIRRORWATCH_LOG_INFO("resuming loop", {observability::StringField("loop", name_), observability::IntField("delay_ms", initial_delay_.count())});
  }

  while (SleepUntil(next)) {
    const auto started = SteadyClock::now();
    {
      observability::SpanScope span("loop." + name_);
      try {
        body_();
      } catch (const std::exception& e) {
        span.RecordError(e.what());
        MIRRORWATCH_LOG_ERROR("loop run failed", {observability::StringField("loop", name_), observability::StringField("error", e.what())});
      }
    }
    runs_.fetch_add(1);

    const auto finished = SteadyClock::now();
    const auto took     = std::chrono::duration<double, std::milli>(finished - started).count();
    observability::Metrics::Instance().ObserveLoopDurationMs(name_, took);
    MIRRORWATCH_LOG_DEBUG("loop run finished", {observability::StringField("loop", name_), observability::DoubleField("took_ms", took)});

    next = std::max(started + interval_, finished);
  }
}

std::chrono::milliseconds ResumeDelay(std::optional<uint64_t> last_ms, uint64_t now_ms, std::chrono::milliseconds interval) {
  if (!last_ms || *last_ms >= now_ms + static_cast<uint64_t>(interval.count())) {
    return std::chrono::milliseconds{0};
  }
  const auto due = *last_ms + static_cast<uint64_t>(interval.count());
  return due <= now_ms ? std::chrono::milliseconds{0} : std::chrono::milliseconds(due - now_ms);
}

} // namespace mirrorwatch::scheduler
