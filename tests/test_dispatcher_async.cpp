/**
 * @file test_dispatcher_async.cpp
 * @brief Tests for dispatcher.hpp with callbacks that settle later.
 */

#include "flux/dispatcher.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

struct Event {
  int value = 0;
};

using EventDispatcher = flux::Dispatcher<Event>;

}  // namespace

// ============================================================================
// Suspension and queueing
// ============================================================================

TEST_CASE("Async callback keeps the broadcast open", "[dispatcher][async]") {
  EventDispatcher dispatcher;
  flux::Deferred pending;
  int after = 0;

  dispatcher.Register([&](const Event&) { return pending.GetOutcome(); });
  dispatcher.Register([&](const Event&) { ++after; });

  flux::Outcome out = dispatcher.Dispatch(Event{});
  REQUIRE(!out.IsSettled());
  REQUIRE(dispatcher.IsDispatching());
  REQUIRE(after == 0);

  pending.Resolve();
  REQUIRE(after == 1);
  REQUIRE(out.IsResolved());
  REQUIRE(!dispatcher.IsDispatching());
}

TEST_CASE("Dispatches during async broadcast are queued", "[dispatcher][async]") {
  EventDispatcher dispatcher;
  std::deque<flux::Deferred> pending;
  std::vector<std::pair<int, char>> recorder;

  dispatcher.Register([&](const Event& e) {
    recorder.emplace_back(e.value, 'A');
    pending.emplace_back();
    return pending.back().GetOutcome();
  });
  dispatcher.Register([&](const Event& e) { recorder.emplace_back(e.value, 'B'); });

  flux::Outcome o1 = dispatcher.Dispatch(Event{1});
  flux::Outcome o2 = dispatcher.Dispatch(Event{2});
  flux::Outcome o3 = dispatcher.Dispatch(Event{3});
  REQUIRE(dispatcher.QueueDepth() == 2U);
  REQUIRE(pending.size() == 1U);

  pending[0].Resolve();
  REQUIRE(o1.IsResolved());
  REQUIRE(!o2.IsSettled());
  REQUIRE(pending.size() == 2U);
  REQUIRE(dispatcher.QueueDepth() == 1U);

  pending[1].Resolve();
  REQUIRE(o2.IsResolved());
  REQUIRE(!o3.IsSettled());

  pending[2].Resolve();
  REQUIRE(o3.IsResolved());
  REQUIRE(!dispatcher.IsDispatching());

  const std::vector<std::pair<int, char>> expected_log{
      {1, 'A'}, {1, 'B'}, {2, 'A'}, {2, 'B'}, {3, 'A'}, {3, 'B'}};
  REQUIRE(recorder == expected_log);

  flux::DispatcherStats stats = dispatcher.GetStats();
  REQUIRE(stats.broadcasts_queued == 2U);
  REQUIRE(stats.max_queue_depth == 2U);
  REQUIRE(stats.broadcasts_completed == 3U);
}

TEST_CASE("Async rejection rejects the broadcast", "[dispatcher][async]") {
  EventDispatcher dispatcher;
  flux::Deferred pending;
  int sibling = 0;

  flux::CallbackId slow =
      dispatcher.Register([&](const Event&) { return pending.GetOutcome(); });
  dispatcher.Register([&](const Event&) { ++sibling; });

  flux::Outcome out = dispatcher.Dispatch(Event{});
  pending.Reject(flux::DispatchFailure::Make(
      flux::DispatchError::kCallbackFailed, "late boom"));

  REQUIRE(out.IsRejected());
  REQUIRE(std::string(out.Result().get_error().message.c_str()) == "late boom");
  REQUIRE(out.Result().get_error().origin == slow);
  REQUIRE(sibling == 1);
}

// ============================================================================
// WaitFor across suspension
// ============================================================================

TEST_CASE("WaitFor on async dependency", "[dispatcher][async][wait_for]") {
  EventDispatcher dispatcher;
  flux::Deferred b_pending;
  flux::CallbackId b_id;
  std::vector<char> order;

  dispatcher.Register([&](const Event&) {
    flux::Deferred done;
    dispatcher.WaitFor({b_id}).Then(
        [&order, done](const flux::Settlement& s) mutable {
          order.push_back('A');
          done.Settle(s);
        });
    return done.GetOutcome();
  });
  b_id = dispatcher.Register([&](const Event&) {
    order.push_back('B');
    return b_pending.GetOutcome();
  });

  flux::Outcome out = dispatcher.Dispatch(Event{});
  REQUIRE(order == std::vector<char>{'B'});
  REQUIRE(!out.IsSettled());

  // Anything dispatched now waits for the whole broadcast.
  flux::Outcome next = dispatcher.Dispatch(Event{1});
  REQUIRE(!next.IsSettled());

  // The queued broadcast reuses the already resolved Deferred, so it runs
  // straight through once the first one completes.
  b_pending.Resolve();
  REQUIRE(order == (std::vector<char>{'B', 'A', 'B', 'A'}));
  REQUIRE(out.IsResolved());
  REQUIRE(next.IsResolved());
}

TEST_CASE("Circular detection holds across suspension", "[dispatcher][async][wait_for]") {
  EventDispatcher dispatcher;
  flux::Deferred gate;
  flux::CallbackId a_id;
  flux::CallbackId b_id;

  a_id = dispatcher.Register([&](const Event&) {
    flux::Deferred done;
    gate.GetOutcome().Then([&, done](const flux::Settlement&) mutable {
      dispatcher.WaitFor({b_id}).Then(
          [done](const flux::Settlement& s) mutable { done.Settle(s); });
    });
    return done.GetOutcome();
  });
  b_id = dispatcher.Register(
      [&](const Event&) { return dispatcher.WaitFor({a_id}); });

  flux::Outcome out = dispatcher.Dispatch(Event{});
  REQUIRE(!out.IsSettled());
  gate.Resolve();
  REQUIRE(out.IsRejected());
  REQUIRE(out.Result().get_error().code ==
          flux::DispatchError::kCircularDependency);
  REQUIRE(!dispatcher.IsDispatching());
}

TEST_CASE("Dropped WaitFor on async dependency runs it once", "[dispatcher][async][wait_for]") {
  EventDispatcher dispatcher;
  flux::Deferred a_pending;
  flux::CallbackId a_id;
  std::vector<std::pair<int, char>> recorder;

  // Starts A through WaitFor but does not wait for the result.
  dispatcher.Register([&](const Event& e) {
    (void)dispatcher.WaitFor({a_id});
    recorder.emplace_back(e.value, 'B');
  });
  a_id = dispatcher.Register([&](const Event& e) {
    recorder.emplace_back(e.value, 'A');
    if (e.value == 1) return a_pending.GetOutcome();
    return flux::Outcome::Resolved();
  });

  flux::Outcome o1 = dispatcher.Dispatch(Event{1});
  flux::Outcome o2 = dispatcher.Dispatch(Event{2});

  // The top-level batch reached A while it was still running: it waits
  // for it instead of starting it again.
  REQUIRE(recorder == (std::vector<std::pair<int, char>>{{1, 'A'}, {1, 'B'}}));
  REQUIRE(!o1.IsSettled());
  REQUIRE(dispatcher.IsDispatching());
  REQUIRE(dispatcher.QueueDepth() == 1U);

  a_pending.Resolve();
  REQUIRE(recorder == (std::vector<std::pair<int, char>>{
                          {1, 'A'}, {1, 'B'}, {2, 'A'}, {2, 'B'}}));
  REQUIRE(o1.IsResolved());
  REQUIRE(o2.IsResolved());
  REQUIRE(!dispatcher.IsDispatching());
  REQUIRE(dispatcher.GetStats().callbacks_invoked == 4U);
}

// ============================================================================
// Threads
// ============================================================================

TEST_CASE("Callback settled from a worker thread", "[dispatcher][async][thread]") {
  EventDispatcher dispatcher;
  std::vector<std::thread> workers;
  std::atomic<int> tail_calls{0};

  dispatcher.Register([&](const Event&) {
    flux::Deferred done;
    workers.emplace_back([done]() mutable {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      done.Resolve();
    });
    return done.GetOutcome();
  });
  dispatcher.Register([&](const Event&) { ++tail_calls; });

  std::promise<bool> settled;
  std::future<bool> result = settled.get_future();
  dispatcher.Dispatch(Event{}).Then(
      [&settled](const flux::Settlement& s) { settled.set_value(s.has_value()); });

  REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  REQUIRE(result.get());
  for (auto& t : workers) t.join();
  REQUIRE(tail_calls.load() == 1);
  REQUIRE(!dispatcher.IsDispatching());
}

TEST_CASE("Concurrent dispatchers never interleave", "[dispatcher][async][thread]") {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  constexpr int kCallbacks = 3;

  EventDispatcher dispatcher;
  std::mutex record_mutex;
  std::vector<std::pair<int, int>> recorder;

  for (int cb = 0; cb < kCallbacks; ++cb) {
    dispatcher.Register([&, cb](const Event& e) {
      std::lock_guard<std::mutex> lock(record_mutex);
      recorder.emplace_back(e.value, cb);
    });
  }

  std::mutex outcomes_mutex;
  std::vector<flux::Outcome> outcomes;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        flux::Outcome o = dispatcher.Dispatch(Event{t * 1000 + i});
        std::lock_guard<std::mutex> lock(outcomes_mutex);
        outcomes.push_back(o);
      }
    });
  }
  for (auto& th : threads) th.join();

  REQUIRE(outcomes.size() == static_cast<size_t>(kThreads * kPerThread));
  for (const auto& o : outcomes) {
    REQUIRE(o.IsResolved());
  }
  REQUIRE(!dispatcher.IsDispatching());
  REQUIRE(dispatcher.QueueDepth() == 0U);

  REQUIRE(recorder.size() ==
          static_cast<size_t>(kThreads * kPerThread * kCallbacks));
  for (size_t i = 0; i < recorder.size(); i += kCallbacks) {
    for (int cb = 0; cb < kCallbacks; ++cb) {
      REQUIRE(recorder[i + cb].first == recorder[i].first);
      REQUIRE(recorder[i + cb].second == cb);
    }
  }
}
