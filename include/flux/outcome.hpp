/**
 * @file outcome.hpp
 * @brief Settle-once asynchronous result used by the dispatcher.
 *
 * An Outcome is a shared handle to a result that is either still pending,
 * resolved, or rejected with a DispatchFailure.  The producing side holds a
 * Deferred and settles it exactly once; consumers attach continuations with
 * Then().  A continuation attached after settlement runs immediately on the
 * calling thread, otherwise it runs on whichever thread settles.
 *
 * Usage:
 * @code
 *   flux::Deferred pending;
 *   flux::Outcome out = pending.GetOutcome();
 *   out.Then([](const flux::Settlement& s) {
 *     if (!s.has_value()) { ... s.get_error().message.c_str() ... }
 *   });
 *   pending.Resolve();
 * @endcode
 *
 * Settlement is internally synchronized; continuations never run while the
 * internal lock is held.
 */

#ifndef FLUX_OUTCOME_HPP_
#define FLUX_OUTCOME_HPP_

#include "flux/platform.hpp"
#include "flux/vocabulary.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#ifndef FLUX_FAILURE_MESSAGE_LEN
#define FLUX_FAILURE_MESSAGE_LEN 128U
#endif

namespace flux {

// ============================================================================
// CallbackId
// ============================================================================

/**
 * @brief Opaque handle of a registered callback.
 *
 * Values are assigned from a process-wide monotonic counter starting at 1,
 * so ordering ids gives registration order.  Value 0 is the invalid id.
 * The textual form is "ID_<n>".
 */
class CallbackId final {
 public:
  using Text = FixedString<24>;  ///< "ID_" + up to 20 digits.

  constexpr CallbackId() noexcept : value_(0U) {}
  constexpr explicit CallbackId(uint64_t v) noexcept : value_(v) {}

  constexpr uint64_t value() const noexcept { return value_; }
  constexpr bool IsValid() const noexcept { return value_ != 0U; }

  Text ToString() const noexcept {
    char buf[Text::capacity() + 1U];
    int n = std::snprintf(buf, sizeof(buf), "ID_%llu",
                          static_cast<unsigned long long>(value_));
    if (n < 0) return Text();
    return Text(TruncateToCapacity, buf);
  }

  constexpr bool operator==(const CallbackId& rhs) const noexcept {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(const CallbackId& rhs) const noexcept {
    return value_ != rhs.value_;
  }
  constexpr bool operator<(const CallbackId& rhs) const noexcept {
    return value_ < rhs.value_;
  }

 private:
  uint64_t value_;
};

// ============================================================================
// DispatchFailure / Settlement
// ============================================================================

/**
 * @brief Rejection value carried by an Outcome.
 *
 * @c origin is the callback whose invocation failed, or the invalid id for
 * failures raised by the dispatcher itself.
 */
struct DispatchFailure {
  using Message = FixedString<FLUX_FAILURE_MESSAGE_LEN>;

  DispatchError code = DispatchError::kCallbackFailed;
  CallbackId origin;
  Message message;

  static DispatchFailure Make(DispatchError code, const char* msg,
                              CallbackId origin = CallbackId()) noexcept {
    DispatchFailure f;
    f.code = code;
    f.origin = origin;
    f.message.assign(TruncateToCapacity, msg);
    return f;
  }

  /** @brief printf-style variant of Make(); output is truncated. */
  static DispatchFailure Format(DispatchError code, CallbackId origin,
                                const char* fmt, ...) noexcept {
    char buf[Message::capacity() + 1U];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n < 0) buf[0] = '\0';
    return Make(code, buf, origin);
  }
};

using Settlement = expected<void, DispatchFailure>;

class Deferred;

// ============================================================================
// Outcome
// ============================================================================

class Outcome final {
 public:
  using Continuation = std::function<void(const Settlement&)>;

  /** @brief An outcome that is already resolved. */
  static Outcome Resolved() {
    auto state = std::make_shared<State>();
    state->settled = true;
    return Outcome(std::move(state));
  }

  /** @brief An outcome that is already rejected with @p failure. */
  static Outcome Rejected(const DispatchFailure& failure) {
    auto state = std::make_shared<State>();
    state->settled = true;
    state->rejected = true;
    state->failure = failure;
    return Outcome(std::move(state));
  }

  static Outcome From(const Settlement& s) {
    return s.has_value() ? Resolved() : Rejected(s.get_error());
  }

  bool IsSettled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->settled;
  }

  bool IsResolved() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->settled && !state_->rejected;
  }

  bool IsRejected() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->settled && state_->rejected;
  }

  /**
   * @brief The settlement of a settled outcome.
   *
   * Precondition: IsSettled().
   */
  Settlement Result() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    FLUX_ASSERT(state_->settled);
    return state_->ToSettlement();
  }

  /**
   * @brief Attach a continuation.
   *
   * Runs immediately when already settled, otherwise exactly once when the
   * owning Deferred settles.
   */
  void Then(Continuation fn) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->settled) {
      state_->continuations.push_back(std::move(fn));
      return;
    }
    Settlement s = state_->ToSettlement();
    lock.unlock();
    fn(s);
  }

 private:
  friend class Deferred;

  struct State {
    std::mutex mutex;
    bool settled = false;
    bool rejected = false;
    DispatchFailure failure;
    std::vector<Continuation> continuations;

    Settlement ToSettlement() const {
      return rejected ? Settlement::error(failure) : Settlement::success();
    }
  };

  explicit Outcome(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

// ============================================================================
// Deferred
// ============================================================================

/**
 * @brief Producer side of an Outcome.  Copies share the same state.
 */
class Deferred final {
 public:
  Deferred() : state_(std::make_shared<Outcome::State>()) {}

  Outcome GetOutcome() const { return Outcome(state_); }

  bool Resolve() { return Settle(Settlement::success()); }

  bool Reject(const DispatchFailure& failure) {
    return Settle(Settlement::error(failure));
  }

  /**
   * @brief Settle with @p s and run pending continuations in attach order.
   *
   * @return false if already settled (the call has no effect).
   */
  bool Settle(const Settlement& s) {
    std::vector<Outcome::Continuation> pending;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->settled) return false;
      state_->settled = true;
      state_->rejected = !s.has_value();
      if (state_->rejected) state_->failure = s.get_error();
      pending.swap(state_->continuations);
    }
    for (auto& fn : pending) {
      fn(s);
    }
    return true;
  }

 private:
  std::shared_ptr<Outcome::State> state_;
};

}  // namespace flux

#endif  // FLUX_OUTCOME_HPP_
