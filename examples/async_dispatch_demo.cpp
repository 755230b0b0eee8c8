/**
 * @file async_dispatch_demo.cpp
 * @brief Callbacks that complete on a worker thread.
 *
 * Demonstrates:
 *   - Returning a flux::Outcome from a callback and settling its Deferred
 *     later from another thread
 *   - Broadcasts issued while one is suspended being queued, not interleaved
 *   - WaitFor() on a dependency that completes asynchronously
 *   - Loading dispatcher options from a JSON config buffer (when enabled)
 */

#include "flux/config.hpp"
#include "flux/dispatcher.hpp"
#include "flux/log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

// -- Worker -----------------------------------------------------------------

/// Settles queued Deferreds in order after a fixed delay.
class SlowWorker {
 public:
  SlowWorker() : thread_([this]() { Run(); }) {}

  ~SlowWorker() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
    }
    cv_.notify_one();
    thread_.join();
  }

  flux::Outcome Submit(const char* what) {
    flux::Deferred done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs_.push_back(Job{what, done});
    }
    cv_.notify_one();
    return done.GetOutcome();
  }

 private:
  struct Job {
    const char* what = nullptr;
    flux::Deferred done;
  };

  void Run() {
    for (;;) {
      Job job;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
        if (jobs_.empty()) return;
        job = jobs_.front();
        jobs_.pop_front();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      FLUX_LOG_INFO("worker", "finished %s", job.what);
      job.done.Resolve();
    }
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stop_ = false;
  std::thread thread_;
};

// -- Payload ----------------------------------------------------------------

struct Request {
  uint32_t seq;
};

// ---------------------------------------------------------------------------

int main() {
  flux::log::Init();
  FLUX_SCOPE_EXIT(flux::log::Shutdown());

  flux::DispatcherOptions opts;
#ifdef FLUX_CONFIG_JSON_ENABLED
  const char* json =
      R"({"dispatcher": {"name": "async", "max_queue_depth": 8, "log_level": "info"}})";
  flux::JsonConfig cfg;
  auto loaded = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                               flux::ConfigFormat::kJson);
  flux::or_else(loaded, [](flux::ConfigError e) {
    FLUX_LOG_WARN("demo", "config rejected (%d), using defaults",
                  static_cast<int>(e));
  });
  if (loaded.has_value()) opts = flux::DispatcherOptions::FromConfig(cfg);
#endif

  flux::Dispatcher<Request> dispatcher(opts);
  SlowWorker worker;

  flux::CallbackId fetch = dispatcher.Register([&](const Request& r) {
    FLUX_LOG_INFO("fetch", "request #%u submitted",
                  static_cast<unsigned>(r.seq));
    return worker.Submit("fetch");
  });

  // Renders once `fetch` has completed for the same request.
  dispatcher.Register([&](const Request& r) {
    flux::Deferred rendered;
    dispatcher.WaitFor({fetch}).Then(
        [rendered, seq = r.seq](const flux::Settlement& s) mutable {
          FLUX_LOG_INFO("render", "request #%u rendered (%s)",
                        static_cast<unsigned>(seq),
                        s.has_value() ? "ok" : s.get_error().message.c_str());
          rendered.Settle(s);
        });
    return rendered.GetOutcome();
  });

  std::mutex done_mutex;
  std::condition_variable done_cv;
  uint32_t remaining = 3;

  for (uint32_t seq = 1; seq <= 3; ++seq) {
    dispatcher.Dispatch(Request{seq}).Then([&, seq](const flux::Settlement& s) {
      printf("request #%u %s\n", static_cast<unsigned>(seq),
             s.has_value() ? "completed" : "failed");
      std::lock_guard<std::mutex> lock(done_mutex);
      --remaining;
      done_cv.notify_one();
    });
  }
  printf("queued behind the first broadcast: %u\n",
         static_cast<unsigned>(dispatcher.QueueDepth()));

  {
    std::unique_lock<std::mutex> lock(done_mutex);
    done_cv.wait(lock, [&]() { return remaining == 0; });
  }

  flux::DispatcherStats stats = dispatcher.GetStats();
  printf("broadcasts completed=%llu, peak queue depth=%u\n",
         static_cast<unsigned long long>(stats.broadcasts_completed),
         static_cast<unsigned>(stats.max_queue_depth));

  return 0;
}
