/**
 * @file dispatcher_demo.cpp
 * @brief Store-style action flow on top of flux::Dispatcher.
 *
 * Demonstrates:
 *   - Registering stores as dispatcher callbacks
 *   - WaitFor() to order one store after another within a broadcast
 *   - Re-dispatching a structured "failed" event after a rejection, tagged
 *     with where the failure came from (action, listener, hooks)
 *   - Dispatch() from inside a callback being queued behind the current one
 *   - Reading dispatcher statistics
 */

#include "flux/dispatcher.hpp"
#include "flux/log.hpp"

#include <cstdint>
#include <cstdio>
#include <map>
#include <stdexcept>

// -- Payload ----------------------------------------------------------------

enum class FailureOrigin : uint8_t {
  kAction = 0,
  kListener,
  kBeforeHook,
  kAfterHook,
  kFailedHook,
};

static const char* FailureOriginName(FailureOrigin origin) {
  switch (origin) {
    case FailureOrigin::kAction:
      return "action";
    case FailureOrigin::kListener:
      return "listener";
    case FailureOrigin::kBeforeHook:
      return "before-hook";
    case FailureOrigin::kAfterHook:
      return "after-hook";
    case FailureOrigin::kFailedHook:
      return "failed-hook";
  }
  return "?";
}

struct AppEvent {
  enum class Kind : uint8_t { kAction, kFailed };

  Kind kind = Kind::kAction;
  flux::FixedString<32> type;
  int32_t amount = 0;

  // Valid for Kind::kFailed.
  FailureOrigin origin = FailureOrigin::kAction;
  flux::FixedString<32> failed_type;
  flux::DispatchFailure::Message error;
};

using AppDispatcher = flux::Dispatcher<AppEvent>;

static AppEvent MakeAction(const char* type, int32_t amount) {
  AppEvent e;
  e.type.assign(flux::TruncateToCapacity, type);
  e.amount = amount;
  return e;
}

// ---------------------------------------------------------------------------

int main() {
  flux::log::Init();
  FLUX_SCOPE_EXIT(flux::log::Shutdown());
  flux::log::SetLevel(flux::log::Level::kInfo);

  flux::DispatcherOptions opts;
  opts.name.assign(flux::TruncateToCapacity, "app");
  AppDispatcher dispatcher(opts);

  // Map callback ids back to the role they play, for failure reports.
  std::map<flux::CallbackId, FailureOrigin> roles;

  // -- Stores ---------------------------------------------------------------

  // Before-hook: rejects malformed actions. Siblings still run, so the
  // stores ignore what it rejects.
  flux::CallbackId validator = dispatcher.Register([](const AppEvent& e) {
    return e.kind != AppEvent::Kind::kAction || e.amount >= 0;
  });
  roles[validator] = FailureOrigin::kBeforeHook;

  int32_t balance = 0;
  uint32_t audit_lines = 0;
  flux::CallbackId balance_store;

  // Registered before the balance store but reports after it.
  flux::CallbackId audit_store = dispatcher.Register([&](const AppEvent& e) {
    if (e.kind != AppEvent::Kind::kAction) return flux::Outcome::Resolved();
    flux::Outcome dep = dispatcher.WaitFor({balance_store});
    if (dep.IsRejected()) return dep;
    ++audit_lines;
    FLUX_LOG_INFO("audit", "%s(%d) -> balance %d", e.type.c_str(),
                  static_cast<int>(e.amount), static_cast<int>(balance));
    return flux::Outcome::Resolved();
  });
  roles[audit_store] = FailureOrigin::kListener;

  balance_store = dispatcher.Register([&](const AppEvent& e) {
    if (e.kind != AppEvent::Kind::kAction || e.amount < 0) return;
    if (e.type == "withdraw" && e.amount > balance) {
      throw std::runtime_error("insufficient funds");
    }
    balance += (e.type == "withdraw") ? -e.amount : e.amount;
  });
  roles[balance_store] = FailureOrigin::kListener;

  // Failed-hook: consumes the structured failure events.
  flux::CallbackId failed_hook = dispatcher.Register([](const AppEvent& e) {
    if (e.kind != AppEvent::Kind::kFailed) return;
    FLUX_LOG_WARN("failed", "%s failed in %s: %s", e.failed_type.c_str(),
                  FailureOriginName(e.origin), e.error.c_str());
  });
  roles[failed_hook] = FailureOrigin::kFailedHook;

  // Re-dispatch rejections as "failed" events through the same dispatcher.
  auto dispatch_action = [&](const AppEvent& action) {
    dispatcher.Dispatch(action).Then([&, action](const flux::Settlement& s) {
      if (s.has_value()) return;
      const flux::DispatchFailure& f = s.get_error();
      AppEvent failed;
      failed.kind = AppEvent::Kind::kFailed;
      failed.type.assign(flux::TruncateToCapacity, "failed");
      failed.failed_type = action.type;
      failed.error = f.message;
      auto it = roles.find(f.origin);
      failed.origin = (it != roles.end()) ? it->second : FailureOrigin::kAction;
      (void)dispatcher.Dispatch(failed);
    });
  };

  // -- Demo 1: ordered stores -----------------------------------------------

  printf("\n=== Demo 1: WaitFor ordering ===\n");
  dispatch_action(MakeAction("deposit", 100));
  dispatch_action(MakeAction("withdraw", 30));
  printf("balance=%d audit_lines=%u\n", static_cast<int>(balance),
         static_cast<unsigned>(audit_lines));

  // -- Demo 2: failures -----------------------------------------------------

  printf("\n=== Demo 2: failure events ===\n");
  dispatch_action(MakeAction("withdraw", 500));  // listener throws
  dispatch_action(MakeAction("deposit", -5));    // before-hook rejects
  printf("balance=%d (unchanged)\n", static_cast<int>(balance));

  // -- Demo 3: dispatch from a callback -------------------------------------

  printf("\n=== Demo 3: queued follow-up action ===\n");
  flux::CallbackId interest = dispatcher.Register([&](const AppEvent& e) {
    if (e.kind == AppEvent::Kind::kAction && e.type == "month_end") {
      // Queued: runs after every store has seen month_end.
      dispatch_action(MakeAction("deposit", balance / 10));
    }
  });
  roles[interest] = FailureOrigin::kAfterHook;
  dispatch_action(MakeAction("month_end", 0));
  printf("balance=%d after interest\n", static_cast<int>(balance));
  flux::or_else(dispatcher.Unregister(interest), [](flux::DispatchError e) {
    FLUX_LOG_ERROR("demo", "unregister failed: %s", flux::DispatchErrorName(e));
  });

  // -- Demo 4: statistics ---------------------------------------------------

  printf("\n=== Demo 4: statistics ===\n");
  flux::DispatcherStats stats = dispatcher.GetStats();
  printf("broadcasts: started=%llu completed=%llu failed=%llu queued=%llu\n",
         static_cast<unsigned long long>(stats.broadcasts_started),
         static_cast<unsigned long long>(stats.broadcasts_completed),
         static_cast<unsigned long long>(stats.broadcasts_failed),
         static_cast<unsigned long long>(stats.broadcasts_queued));
  printf("callbacks: invoked=%llu failed=%llu\n",
         static_cast<unsigned long long>(stats.callbacks_invoked),
         static_cast<unsigned long long>(stats.callbacks_failed));

  return 0;
}
