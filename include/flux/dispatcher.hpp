/**
 * @file dispatcher.hpp
 * @brief Single-flight broadcast dispatcher with intra-broadcast ordering.
 *
 * A Dispatcher<Payload> broadcasts one payload at a time to every registered
 * callback, in registration order:
 *
 *   - At most one broadcast is open at any instant.  Dispatch() calls made
 *     while a broadcast is open are queued and run strictly FIFO once the
 *     open broadcast has fully completed.
 *   - A callback may call WaitFor(ids) to run other callbacks of the same
 *     broadcast first.  Each callback runs at most once per broadcast; a
 *     chain that waits on itself is rejected as a circular dependency.
 *   - Callbacks may complete asynchronously by returning an Outcome.  The
 *     broadcast suspends on it and resumes from whichever context settles
 *     it, so execution stays serialized across callbacks.
 *   - A failing callback never stops its siblings; the first failure rejects
 *     the Outcome returned by Dispatch().
 *
 * Usage:
 * @code
 *   struct Action { const char* type; int value; };
 *   flux::Dispatcher<Action> dispatcher;
 *
 *   flux::CallbackId totals = dispatcher.Register([&](const Action& a) {
 *     sum += a.value;
 *   });
 *   dispatcher.Register([&](const Action&) {
 *     return dispatcher.WaitFor({totals});  // runs after `totals`
 *   });
 *
 *   dispatcher.Dispatch(Action{"add", 3}).Then([](const flux::Settlement& s) {
 *     if (!s.has_value()) { ... }
 *   });
 * @endcode
 *
 * Thread safety: bookkeeping is guarded by one internal mutex that is never
 * held while a callback or continuation runs.  Outcomes returned by
 * callbacks may be settled from any thread.
 *
 * The dispatcher must outlive every broadcast it has started.  A callback
 * that never settles stalls the dispatcher and its queue (no timeouts).
 */

#ifndef FLUX_DISPATCHER_HPP_
#define FLUX_DISPATCHER_HPP_

#include "flux/config.hpp"
#include "flux/log.hpp"
#include "flux/outcome.hpp"
#include "flux/platform.hpp"
#include "flux/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

#if FLUX_HAS_EXCEPTIONS
#include <exception>
#endif

#ifndef FLUX_DISPATCH_MAX_QUEUE_DEPTH
#define FLUX_DISPATCH_MAX_QUEUE_DEPTH 0U
#endif

namespace flux {

// ============================================================================
// DispatcherOptions
// ============================================================================

struct DispatcherOptions {
  /** Log category used by this dispatcher. */
  FixedString<32> name{"dispatcher"};
  /** Maximum queued broadcasts; 0 means unbounded. */
  uint32_t max_queue_depth = FLUX_DISPATCH_MAX_QUEUE_DEPTH;
  /** When set, applied to the global log level on construction. */
  optional<log::Level> log_level;

  /**
   * @brief Read options from @p section of a loaded config.
   *
   * Keys: name, max_queue_depth, log_level.  Missing keys keep defaults.
   */
  static DispatcherOptions FromConfig(const ConfigStore& cfg,
                                      const char* section = "dispatcher") {
    DispatcherOptions opts;
    if (cfg.HasKey(section, "name")) {
      opts.name.assign(TruncateToCapacity, cfg.GetString(section, "name"));
    }
    opts.max_queue_depth =
        cfg.GetUint(section, "max_queue_depth", opts.max_queue_depth);
    if (cfg.HasKey(section, "log_level")) {
      opts.log_level = log::ParseLevel(cfg.GetString(section, "log_level"),
                                       log::GetLevel());
    }
    return opts;
  }
};

// ============================================================================
// DispatcherStats
// ============================================================================

struct DispatcherStats {
  uint64_t broadcasts_started = 0;    ///< Broadcasts that opened.
  uint64_t broadcasts_completed = 0;  ///< Top-level batches that resolved.
  uint64_t broadcasts_failed = 0;     ///< Top-level batches that rejected.
  uint64_t broadcasts_queued = 0;     ///< Dispatch() calls that were queued.
  uint64_t queue_rejected = 0;        ///< Dispatch() calls refused (queue full).
  uint64_t callbacks_invoked = 0;     ///< Callback invocations.
  uint64_t callbacks_failed = 0;      ///< Invocations that rejected.
  uint32_t max_queue_depth = 0;       ///< High-water mark of the queue.
};

namespace detail {

/// Process-wide id source so ids never collide across dispatchers.
inline std::atomic<uint64_t>& NextCallbackId() noexcept {
  static std::atomic<uint64_t> next{1U};
  return next;
}

template <typename>
struct AlwaysFalse : std::false_type {};

}  // namespace detail

// ============================================================================
// Dispatcher<Payload>
// ============================================================================

template <typename Payload>
class Dispatcher final {
 public:
  using PayloadType = Payload;
  using Callback = std::function<Outcome(const Payload&)>;

  explicit Dispatcher(const DispatcherOptions& options = DispatcherOptions())
      : options_(options) {
    if (options_.log_level.has_value()) {
      log::SetLevel(options_.log_level.value());
    }
  }

  ~Dispatcher() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dispatching_ || !queue_.empty()) {
      FLUX_LOG_WARN(options_.name.c_str(),
                    "destroyed while dispatching (%u queued broadcasts)",
                    static_cast<unsigned>(queue_.size()));
    }
  }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  // --------------------------------------------------------------------------
  // Registration
  // --------------------------------------------------------------------------

  /**
   * @brief Register a callback invoked with every broadcast payload.
   *
   * @p fn is invoked as fn(const Payload&) and may return:
   *   - void                          : resolves when it returns
   *   - bool                          : false rejects (kCallbackFailed)
   *   - expected<void, DispatchFailure>: error rejects with that failure
   *   - Outcome                       : settles asynchronously
   *
   * When built with exceptions, anything thrown is captured as a rejection
   * (std::exception::what() becomes the failure message).
   *
   * @return The new callback id (never invalid).
   */
  template <typename F>
  CallbackId Register(F&& fn) {
    auto callback = std::make_shared<Callback>(Wrap(std::forward<F>(fn)));
    const CallbackId id(
        detail::NextCallbackId().fetch_add(1U, std::memory_order_relaxed));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callbacks_.emplace(id, std::move(callback));
    }
    FLUX_LOG_DEBUG(options_.name.c_str(), "registered %s",
                   id.ToString().c_str());
    return id;
  }

  /**
   * @brief Remove a callback.
   *
   * Safe while the callback is executing: the running invocation completes,
   * later broadcasts no longer include it.
   *
   * @return kUnknownCallback if @p id is not registered (state untouched).
   */
  expected<void, DispatchError> Unregister(CallbackId id) {
    std::shared_ptr<Callback> old_callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = callbacks_.find(id);
      if (it == callbacks_.end()) {
        return expected<void, DispatchError>::error(
            DispatchError::kUnknownCallback);
      }
      old_callback = std::move(it->second);
      callbacks_.erase(it);
    }
    // old_callback released outside the lock (it may be mid-invocation).
    FLUX_LOG_DEBUG(options_.name.c_str(), "unregistered %s",
                   id.ToString().c_str());
    return expected<void, DispatchError>::success();
  }

  bool IsRegistered(CallbackId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.find(id) != callbacks_.end();
  }

  uint32_t CallbackCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(callbacks_.size());
  }

  /** @brief True exactly while a broadcast is open. */
  bool IsDispatching() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatching_;
  }

  // --------------------------------------------------------------------------
  // Dispatch
  // --------------------------------------------------------------------------

  /**
   * @brief Broadcast @p payload to every registered callback.
   *
   * Opens the broadcast immediately when idle, otherwise queues it behind
   * the open broadcast and any earlier queued ones.
   *
   * @return Outcome settled when the broadcast has run to completion;
   *         rejected with the first callback failure, or with kQueueFull
   *         when the bounded queue has no room.
   */
  Outcome Dispatch(Payload payload) {
    auto shared = std::make_shared<const Payload>(std::move(payload));
    std::shared_ptr<Broadcast> broadcast;
    std::vector<CallbackId> ids;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (dispatching_ || draining_ || !queue_.empty()) {
        return Enqueue(std::move(shared), lock);
      }
      broadcast = OpenBroadcastLocked(std::move(shared));
      ids = PendingIdsLocked(*broadcast);
    }
    FLUX_LOG_DEBUG(options_.name.c_str(),
                   "broadcast #%llu opened (%u callbacks)",
                   static_cast<unsigned long long>(broadcast->seq.value()),
                   static_cast<unsigned>(ids.size()));
    return RunBatch(broadcast, std::move(ids), true);
  }

  // --------------------------------------------------------------------------
  // WaitFor
  // --------------------------------------------------------------------------

  /**
   * @brief Run the given callbacks of the open broadcast before returning.
   *
   * Must be called from inside a callback of the open broadcast.  Ids that
   * already ran are treated as satisfied.
   *
   * @return Outcome settled when all requested callbacks have run; rejected
   *         immediately with kNotDispatching, kUnknownCallback (message
   *         names the id) or kCircularDependency without touching the
   *         broadcast's bookkeeping.
   */
  Outcome WaitFor(const CallbackId* ids, uint32_t count) {
    std::shared_ptr<Broadcast> broadcast;
    std::vector<CallbackId> batch;
    optional<DispatchFailure> failure;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (FLUX_UNLIKELY(!dispatching_ || !active_)) {
        failure = DispatchFailure::Make(
            DispatchError::kNotDispatching,
            "Dispatcher.WaitFor(...): Must be invoked while dispatching.");
      } else {
        broadcast = active_;
        for (uint32_t i = 0; i < count; ++i) {
          const CallbackId id = ids[i];
          if (callbacks_.find(id) == callbacks_.end()) {
            failure = DispatchFailure::Format(
                DispatchError::kUnknownCallback, id,
                "Dispatcher.WaitFor(...): `%s` does not map to a registered "
                "callback.",
                id.ToString().c_str());
            break;
          }
          if (std::find(broadcast->open.begin(), broadcast->open.end(), id) !=
              broadcast->open.end()) {
            failure = DispatchFailure::Make(
                DispatchError::kCircularDependency,
                "Dispatcher.WaitFor(...): Circular dependency detected", id);
            break;
          }
          if (broadcast->pending.find(id) != broadcast->pending.end()) {
            batch.push_back(id);
          }
        }
      }
    }

    if (failure.has_value()) {
      FLUX_LOG_WARN(options_.name.c_str(), "%s",
                    failure.value().message.c_str());
      return Outcome::Rejected(failure.value());
    }

    std::sort(batch.begin(), batch.end());
    batch.erase(std::unique(batch.begin(), batch.end()), batch.end());
    if (batch.empty()) {
      return Outcome::Resolved();
    }
    return RunBatch(broadcast, std::move(batch), false);
  }

  Outcome WaitFor(std::initializer_list<CallbackId> ids) {
    return WaitFor(ids.begin(), static_cast<uint32_t>(ids.size()));
  }

  Outcome WaitFor(const std::vector<CallbackId>& ids) {
    return WaitFor(ids.data(), static_cast<uint32_t>(ids.size()));
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  uint32_t QueueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(queue_.size());
  }

  DispatcherStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

  void ResetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = DispatcherStats();
  }

  const char* Name() const noexcept { return options_.name.c_str(); }

 private:
  // --------------------------------------------------------------------------
  // Internal Types
  // --------------------------------------------------------------------------

  using PendingFn = std::function<Outcome()>;

  /** One open dispatch cycle, shared by its top-level and nested batches. */
  struct Broadcast {
    BroadcastSeq seq;
    std::shared_ptr<const Payload> payload;
    std::map<CallbackId, PendingFn> pending;  ///< Not yet started.
    std::map<CallbackId, Outcome> running;    ///< Started, not yet settled.
    std::vector<CallbackId> open;             ///< Currently running.
    bool failed = false;
    DispatchFailure first_failure;
  };

  /** Progress of one batch; kept alive across asynchronous callbacks. */
  struct BatchRun {
    std::shared_ptr<Broadcast> broadcast;
    std::vector<CallbackId> ids;
    size_t next = 0;
    bool top_level = false;
    bool failed = false;
    DispatchFailure first_failure;
    Deferred done;
  };

  struct QueuedBroadcast {
    std::shared_ptr<const Payload> payload;
    Deferred done;
  };

  // --------------------------------------------------------------------------
  // Callback Wrapping
  // --------------------------------------------------------------------------

  template <typename F>
  static Callback Wrap(F&& fn) {
    using Fn = typename std::decay<F>::type;
    using Ret = typename std::invoke_result<Fn&, const Payload&>::type;
    return Callback([f = Fn(std::forward<F>(fn))](
                        const Payload& payload) mutable -> Outcome {
#if FLUX_HAS_EXCEPTIONS
      try {
        return Invoke<Ret>(f, payload);
      } catch (const std::exception& e) {
        return Outcome::Rejected(
            DispatchFailure::Make(DispatchError::kCallbackFailed, e.what()));
      } catch (...) {
        return Outcome::Rejected(DispatchFailure::Make(
            DispatchError::kCallbackFailed, "unknown exception"));
      }
#else
      return Invoke<Ret>(f, payload);
#endif
    });
  }

  template <typename Ret, typename Fn>
  static Outcome Invoke(Fn& f, const Payload& payload) {
    if constexpr (std::is_void<Ret>::value) {
      f(payload);
      return Outcome::Resolved();
    } else if constexpr (std::is_same<Ret, Outcome>::value) {
      return f(payload);
    } else if constexpr (std::is_same<Ret, Settlement>::value) {
      return Outcome::From(f(payload));
    } else if constexpr (std::is_same<Ret, bool>::value) {
      return f(payload) ? Outcome::Resolved()
                        : Outcome::Rejected(DispatchFailure::Make(
                              DispatchError::kCallbackFailed,
                              "callback returned false"));
    } else {
      static_assert(detail::AlwaysFalse<Ret>::value,
                    "callback must return void, bool, Settlement or Outcome");
      return Outcome::Resolved();
    }
  }

  /** Pending thunk body: the callback is looked up when it actually runs. */
  Outcome InvokeRegistered(CallbackId id, const Payload& payload) {
    std::shared_ptr<Callback> callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = callbacks_.find(id);
      if (it != callbacks_.end()) callback = it->second;
    }
    if (!callback) return Outcome::Resolved();
    return (*callback)(payload);
  }

  // --------------------------------------------------------------------------
  // Broadcast Lifecycle (mutex_ held by *Locked helpers)
  // --------------------------------------------------------------------------

  std::shared_ptr<Broadcast> OpenBroadcastLocked(
      std::shared_ptr<const Payload> payload) {
    dispatching_ = true;
    auto broadcast = std::make_shared<Broadcast>();
    broadcast->seq = BroadcastSeq(++broadcast_seq_);
    broadcast->payload = std::move(payload);
    for (const auto& entry : callbacks_) {
      const CallbackId id = entry.first;
      std::shared_ptr<const Payload> p = broadcast->payload;
      broadcast->pending.emplace(
          id, [this, p, id]() { return InvokeRegistered(id, *p); });
    }
    active_ = broadcast;
    ++stats_.broadcasts_started;
    return broadcast;
  }

  static std::vector<CallbackId> PendingIdsLocked(const Broadcast& broadcast) {
    std::vector<CallbackId> ids;
    ids.reserve(broadcast.pending.size());
    for (const auto& entry : broadcast.pending) {
      ids.push_back(entry.first);
    }
    return ids;
  }

  Outcome Enqueue(std::shared_ptr<const Payload> payload,
                  std::unique_lock<std::mutex>& lock) {
    if (FLUX_UNLIKELY(options_.max_queue_depth != 0U &&
                      queue_.size() >= options_.max_queue_depth)) {
      ++stats_.queue_rejected;
      lock.unlock();
      FLUX_LOG_ERROR(options_.name.c_str(), "queue full (%u), broadcast refused",
                     static_cast<unsigned>(options_.max_queue_depth));
      return Outcome::Rejected(DispatchFailure::Make(
          DispatchError::kQueueFull, "Dispatcher.Dispatch(...): queue full"));
    }

    QueuedBroadcast entry;
    entry.payload = std::move(payload);
    Outcome outcome = entry.done.GetOutcome();
    queue_.push_back(std::move(entry));
    ++stats_.broadcasts_queued;
    const uint32_t depth = static_cast<uint32_t>(queue_.size());
    if (depth > stats_.max_queue_depth) stats_.max_queue_depth = depth;

    // Nothing running and nobody draining: start the queue here.
    const bool kick = !dispatching_ && !draining_;
    if (kick) draining_ = true;
    lock.unlock();

    FLUX_LOG_DEBUG(options_.name.c_str(), "broadcast queued (depth %u)",
                   static_cast<unsigned>(depth));
    if (kick) Drain();
    return outcome;
  }

  /**
   * @brief Start queued broadcasts until one stays open or the queue empties.
   *
   * Caller must have set draining_.  Iterative so that a long queue of
   * synchronous broadcasts does not nest.
   */
  void Drain() {
    for (;;) {
      std::shared_ptr<Broadcast> broadcast;
      std::vector<CallbackId> ids;
      Deferred done;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dispatching_ || queue_.empty()) {
          draining_ = false;
          return;
        }
        QueuedBroadcast next = std::move(queue_.front());
        queue_.pop_front();
        done = next.done;
        broadcast = OpenBroadcastLocked(std::move(next.payload));
        ids = PendingIdsLocked(*broadcast);
      }
      FLUX_LOG_DEBUG(options_.name.c_str(),
                     "broadcast #%llu dequeued (%u callbacks)",
                     static_cast<unsigned long long>(broadcast->seq.value()),
                     static_cast<unsigned>(ids.size()));
      RunBatch(broadcast, std::move(ids), true)
          .Then([done](const Settlement& s) mutable { done.Settle(s); });
    }
  }

  /** Clear the dispatching flag and drain the queue (top-level batch end). */
  void StopDispatching() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dispatching_ = false;
      active_.reset();
      if (draining_) return;
      draining_ = true;
    }
    Drain();
  }

  // --------------------------------------------------------------------------
  // Batch Execution
  // --------------------------------------------------------------------------

  Outcome RunBatch(std::shared_ptr<Broadcast> broadcast,
                   std::vector<CallbackId> ids, bool top_level) {
    auto run = std::make_shared<BatchRun>();
    run->broadcast = std::move(broadcast);
    run->ids = std::move(ids);
    run->top_level = top_level;
    Outcome outcome = run->done.GetOutcome();
    Step(run);
    return outcome;
  }

  /**
   * @brief Advance @p run through its ids, one callback at a time.
   *
   * Synchronous callbacks are processed in a loop.  On the first unsettled
   * Outcome the job cleanup is handed to a continuation and Step() returns;
   * the continuation resumes the loop once that callback settles.  The
   * pending entry is consumed when the callback starts, so an id reached
   * again (e.g. by the top-level batch after a nested WaitFor whose outcome
   * was dropped) is never run twice; if it is still running the batch waits
   * for it instead.
   */
  void Step(const std::shared_ptr<BatchRun>& run) {
    Broadcast& broadcast = *run->broadcast;
    for (;;) {
      CallbackId id;
      PendingFn thunk;
      optional<Outcome> in_flight;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (run->next >= run->ids.size()) break;
        id = run->ids[run->next++];
        auto it = broadcast.pending.find(id);
        if (FLUX_LIKELY(it != broadcast.pending.end())) {
          thunk = std::move(it->second);
          broadcast.pending.erase(it);
          broadcast.open.push_back(id);
        } else {
          auto running = broadcast.running.find(id);
          if (running != broadcast.running.end()) in_flight = running->second;
        }
      }

      if (!thunk) {
        if (in_flight.has_value() && !in_flight.value().IsSettled()) {
          in_flight.value().Then(
              [this, run](const Settlement&) { Step(run); });
          return;
        }
        continue;
      }

      Settlement settlement = Settlement::success();
      {
        std::shared_ptr<Broadcast> owner = run->broadcast;
        ScopeGuard job(FixedFunction<void()>(
            [this, owner, id]() { PostDispatch(*owner, id); }));

        Outcome result = thunk();
        if (!result.IsSettled()) {
          {
            std::lock_guard<std::mutex> lock(mutex_);
            broadcast.running.emplace(id, result);
          }
          // The continuation becomes the only owner of the job cleanup.
          result.Then([this, run, id,
                       held = std::make_shared<ScopeGuard>(std::move(job))](
                          const Settlement& s) mutable {
            held.reset();
            RecordJob(*run, id, s);
            Step(run);
          });
          return;
        }
        settlement = result.Result();
      }
      RecordJob(*run, id, settlement);
    }
    FinishBatch(run);
  }

  /** Job cleanup: the id leaves the open set and the in-flight map. */
  void PostDispatch(Broadcast& broadcast, CallbackId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcast.running.erase(id);
    broadcast.open.erase(
        std::remove(broadcast.open.begin(), broadcast.open.end(), id),
        broadcast.open.end());
  }

  void RecordJob(BatchRun& run, CallbackId id, const Settlement& s) {
    if (s.has_value()) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.callbacks_invoked;
      return;
    }

    DispatchFailure failure = s.get_error();
    if (!failure.origin.IsValid()) failure.origin = id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.callbacks_invoked;
      ++stats_.callbacks_failed;
      if (!run.failed) {
        run.failed = true;
        run.first_failure = failure;
      }
      Broadcast& broadcast = *run.broadcast;
      if (!broadcast.failed) {
        broadcast.failed = true;
        broadcast.first_failure = failure;
      }
    }
    FLUX_LOG_WARN(options_.name.c_str(), "%s failed: %s",
                  id.ToString().c_str(), failure.message.c_str());
  }

  /**
   * @brief Batch release.
   *
   * A nested (WaitFor) batch settles with its own first failure.  The
   * top-level batch settles with the broadcast's first failure, including
   * failures inside nested batches, after the dispatching flag is cleared
   * and the queue drained.
   */
  void FinishBatch(const std::shared_ptr<BatchRun>& run) {
    Settlement settlement = Settlement::success();
    const unsigned long long seq = run->broadcast->seq.value();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (run->top_level) {
        if (run->broadcast->failed) {
          settlement = Settlement::error(run->broadcast->first_failure);
          ++stats_.broadcasts_failed;
        } else {
          ++stats_.broadcasts_completed;
        }
      } else if (run->failed) {
        settlement = Settlement::error(run->first_failure);
      }
    }

    if (run->top_level) {
      FLUX_LOG_DEBUG(options_.name.c_str(), "broadcast #%llu %s", seq,
                     settlement.has_value() ? "completed" : "failed");
      StopDispatching();
    }
    run->done.Settle(settlement);
  }

  // --------------------------------------------------------------------------
  // Data Members
  // --------------------------------------------------------------------------

  DispatcherOptions options_;
  mutable std::mutex mutex_;  ///< Guards everything below.
  std::map<CallbackId, std::shared_ptr<Callback>> callbacks_;
  std::deque<QueuedBroadcast> queue_;
  std::shared_ptr<Broadcast> active_;
  bool dispatching_ = false;
  bool draining_ = false;
  uint64_t broadcast_seq_ = 0;
  DispatcherStats stats_;
};

}  // namespace flux

#endif  // FLUX_DISPATCHER_HPP_
