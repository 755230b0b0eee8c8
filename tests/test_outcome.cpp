/**
 * @file test_outcome.cpp
 * @brief Tests for outcome.hpp (Outcome / Deferred / CallbackId)
 */

#include "flux/outcome.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("CallbackId text form and ordering", "[outcome][callback_id]") {
  flux::CallbackId invalid;
  REQUIRE(!invalid.IsValid());

  flux::CallbackId a(3);
  flux::CallbackId b(12);
  REQUIRE(a.IsValid());
  REQUIRE(a.ToString() == "ID_3");
  REQUIRE(b.ToString() == "ID_12");
  REQUIRE(a < b);
  REQUIRE(a != b);

  // 64-bit ids keep their order past the 32-bit range.
  flux::CallbackId wide(0x100000000ULL);
  REQUIRE(flux::CallbackId(0xFFFFFFFFU) < wide);
  REQUIRE(wide.ToString() == "ID_4294967296");
  REQUIRE(flux::CallbackId(UINT64_MAX).ToString() == "ID_18446744073709551615");
}

TEST_CASE("DispatchFailure Format truncates", "[outcome][failure]") {
  auto f = flux::DispatchFailure::Format(flux::DispatchError::kUnknownCallback,
                                         flux::CallbackId(9), "`%s` missing",
                                         "ID_9");
  REQUIRE(f.code == flux::DispatchError::kUnknownCallback);
  REQUIRE(f.origin == flux::CallbackId(9));
  REQUIRE(f.message == "`ID_9` missing");

  std::string huge(FLUX_FAILURE_MESSAGE_LEN * 2U, 'z');
  auto g = flux::DispatchFailure::Make(flux::DispatchError::kCallbackFailed,
                                       huge.c_str());
  REQUIRE(g.message.size() == FLUX_FAILURE_MESSAGE_LEN);
}

TEST_CASE("Resolved and Rejected are settled", "[outcome]") {
  auto ok = flux::Outcome::Resolved();
  REQUIRE(ok.IsSettled());
  REQUIRE(ok.IsResolved());
  REQUIRE(ok.Result().has_value());

  auto bad = flux::Outcome::Rejected(flux::DispatchFailure::Make(
      flux::DispatchError::kCallbackFailed, "boom"));
  REQUIRE(bad.IsRejected());
  REQUIRE(bad.Result().get_error().message == "boom");
}

TEST_CASE("Then on settled outcome runs immediately", "[outcome]") {
  bool ran = false;
  flux::Outcome::Resolved().Then(
      [&ran](const flux::Settlement& s) { ran = s.has_value(); });
  REQUIRE(ran);
}

TEST_CASE("Deferred runs continuations in attach order", "[outcome][deferred]") {
  flux::Deferred pending;
  flux::Outcome out = pending.GetOutcome();
  std::vector<int> order;

  out.Then([&order](const flux::Settlement&) { order.push_back(1); });
  out.Then([&order](const flux::Settlement&) { order.push_back(2); });
  REQUIRE(!out.IsSettled());
  REQUIRE(order.empty());

  REQUIRE(pending.Resolve());
  REQUIRE(order == std::vector<int>{1, 2});
  REQUIRE(out.IsResolved());
}

TEST_CASE("Deferred settles only once", "[outcome][deferred]") {
  flux::Deferred pending;
  int calls = 0;
  pending.GetOutcome().Then([&calls](const flux::Settlement&) { ++calls; });

  REQUIRE(pending.Reject(flux::DispatchFailure::Make(
      flux::DispatchError::kCallbackFailed, "first")));
  REQUIRE(!pending.Resolve());
  REQUIRE(calls == 1);
  REQUIRE(pending.GetOutcome().Result().get_error().message == "first");
}

TEST_CASE("Deferred copies share state", "[outcome][deferred]") {
  flux::Deferred a;
  flux::Deferred b = a;
  b.Resolve();
  REQUIRE(a.GetOutcome().IsResolved());
}

TEST_CASE("From converts a settlement", "[outcome]") {
  auto ok = flux::Outcome::From(flux::Settlement::success());
  REQUIRE(ok.IsResolved());

  auto bad = flux::Outcome::From(flux::Settlement::error(
      flux::DispatchFailure::Make(flux::DispatchError::kQueueFull, "full")));
  REQUIRE(bad.IsRejected());
  REQUIRE(bad.Result().get_error().code == flux::DispatchError::kQueueFull);
}

TEST_CASE("Deferred settled from another thread", "[outcome][deferred]") {
  flux::Deferred pending;
  std::atomic<int> seen{0};
  pending.GetOutcome().Then(
      [&seen](const flux::Settlement& s) { seen = s.has_value() ? 1 : -1; });

  std::thread worker([pending]() mutable { pending.Resolve(); });
  worker.join();

  REQUIRE(seen.load() == 1);
}
