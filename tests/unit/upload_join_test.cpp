#include "internal/coordination/upload_join.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using cms::coordination::ContentIds;
using cms::coordination::UploadFailure;
using cms::coordination::UploadJoinCoordinator;

struct Outcome {
  int                          successes = 0;
  int                          failures  = 0;
  ContentIds                   ids;
  std::optional<UploadFailure> failure;
};

cms::coordination::SessionHandle BeginTestcase(UploadJoinCoordinator& joins, Outcome& outcome) {
  return joins.Begin(
      {"input", "output"},
      [&outcome](const ContentIds& ids) {
        ++outcome.successes;
        outcome.ids = ids;
      },
      [&outcome](const UploadFailure& failure) {
        ++outcome.failures;
        outcome.failure = failure;
      });
}

void TestBothPartsStoredFiresSuccessOnce() {
  UploadJoinCoordinator joins;
  Outcome               outcome;
  const auto            session = BeginTestcase(joins, outcome);

  joins.ReportSuccess(session, "output", "d2");
  assert(outcome.successes == 0);
  assert(joins.IsActive(session));

  joins.ReportSuccess(session, "input", "d1");
  assert(outcome.successes == 1 && outcome.failures == 0);
  assert(outcome.ids.at("input") == "d1" && outcome.ids.at("output") == "d2");
  assert(!joins.IsActive(session));
  assert(joins.ActiveSessions() == 0);
}

void TestFailureAfterSuccessReportsOrphan() {
  UploadJoinCoordinator joins;
  Outcome               outcome;
  const auto            session = BeginTestcase(joins, outcome);

  joins.ReportSuccess(session, "input", "d1");
  joins.ReportFailure(session, "output", "disk full");

  assert(outcome.successes == 0 && outcome.failures == 1);
  assert(outcome.failure->tag == "output");
  assert(outcome.failure->error == "disk full");
  assert(outcome.failure->orphaned.size() == 1 && outcome.failure->orphaned.at("input") == "d1");
}

void TestReportsAfterTerminalAreIgnored() {
  UploadJoinCoordinator joins;
  Outcome               outcome;
  const auto            session = BeginTestcase(joins, outcome);

  joins.ReportFailure(session, "input", "Connection failed.");
  joins.ReportSuccess(session, "output", "d2");
  joins.ReportFailure(session, "output", "late");

  assert(outcome.failures == 1 && outcome.successes == 0);
  assert(outcome.failure->orphaned.empty());

  // Unknown handles are ignored the same way.
  joins.ReportSuccess("no-such-session", "input", "x");
}

void TestEveryArrivalOrderYieldsOneAction() {
  const std::vector<std::string> tags = {"a", "b", "c"};

  // All successes in any order: one success.
  std::vector<std::string> order = tags;
  std::sort(order.begin(), order.end());
  do {
    UploadJoinCoordinator joins;
    Outcome               outcome;
    const auto            session = joins.Begin(
        {tags.begin(), tags.end()}, [&](const ContentIds& ids) {
          ++outcome.successes;
          outcome.ids = ids;
        },
        [&](const UploadFailure&) { ++outcome.failures; });
    for (const auto& tag : order) joins.ReportSuccess(session, tag, "id-" + tag);
    assert(outcome.successes == 1 && outcome.failures == 0 && outcome.ids.size() == 3);
  } while (std::next_permutation(order.begin(), order.end()));

  // One failing tag anywhere in the order: one failure, never a success.
  for (const auto& failing : tags) {
    std::sort(order.begin(), order.end());
    do {
      UploadJoinCoordinator joins;
      Outcome               outcome;
      const auto            session = joins.Begin(
          {tags.begin(), tags.end()}, [&](const ContentIds&) { ++outcome.successes; },
          [&](const UploadFailure& f) {
            ++outcome.failures;
            outcome.failure = f;
          });
      for (const auto& tag : order) {
        if (tag == failing) {
          joins.ReportFailure(session, tag, "boom");
        } else {
          joins.ReportSuccess(session, tag, "id-" + tag);
        }
      }
      assert(outcome.failures == 1 && outcome.successes == 0);
      assert(outcome.failure->tag == failing);
    } while (std::next_permutation(order.begin(), order.end()));
  }
}

void TestInvalidSessionsAreRejected() {
  UploadJoinCoordinator joins;

  bool threw = false;
  try {
    joins.Begin({}, [](const ContentIds&) {}, [](const UploadFailure&) {});
  } catch (const cms::util::InvalidSession&) {
    threw = true;
  }
  assert(threw && "empty tag set must be rejected");

  threw = false;
  try {
    joins.Begin({"input"}, nullptr, [](const UploadFailure&) {});
  } catch (const cms::util::InvalidSession&) {
    threw = true;
  }
  assert(threw && "missing action must be rejected");
  assert(joins.ActiveSessions() == 0);
}

void TestUnexpectedAndDuplicateTags() {
  UploadJoinCoordinator joins;
  Outcome               outcome;
  const auto            session = BeginTestcase(joins, outcome);

  bool threw = false;
  try {
    joins.ReportSuccess(session, "checker", "x");
  } catch (const cms::util::UnexpectedTag&) {
    threw = true;
  }
  assert(threw);

  joins.ReportSuccess(session, "input", "d1");
  threw = false;
  try {
    joins.ReportSuccess(session, "input", "d1-again");
  } catch (const cms::util::UnexpectedTag&) {
    threw = true;
  }
  assert(threw);

  // The session survived both protocol errors.
  joins.ReportSuccess(session, "output", "d2");
  assert(outcome.successes == 1);
  assert(outcome.ids.at("input") == "d1");
}

void TestActionMayBeginNewSession() {
  UploadJoinCoordinator joins;
  bool                  inner_done = false;

  const auto outer = joins.Begin(
      {"only"},
      [&](const ContentIds&) {
        const auto inner = joins.Begin({"next"}, [&](const ContentIds&) { inner_done = true; }, [](const UploadFailure&) {});
        joins.ReportSuccess(inner, "next", "n");
      },
      [](const UploadFailure&) {});
  joins.ReportSuccess(outer, "only", "o");
  assert(inner_done);
}

// Racing reports from three threads; the failing part decides the outcome.
void TestConcurrentReportsFireExactlyOnce() {
  for (int round = 0; round < 200; ++round) {
    UploadJoinCoordinator joins;
    std::atomic<int>      fired{0};

    const auto session = joins.Begin(
        {"input", "output", "extra"}, [&](const ContentIds&) { ++fired; }, [&](const UploadFailure&) { ++fired; });

    std::thread a([&] { joins.ReportSuccess(session, "input", "d1"); });
    std::thread b([&] { joins.ReportFailure(session, "output", "boom"); });
    std::thread c([&] { joins.ReportSuccess(session, "extra", "d3"); });
    a.join();
    b.join();
    c.join();

    assert(fired == 1);
    assert(!joins.IsActive(session));
  }
}

void TestJoinContinuationMapsReplies() {
  auto    joins = std::make_shared<UploadJoinCoordinator>();
  Outcome outcome;

  const auto session = BeginTestcase(*joins, outcome);
  auto       cont    = cms::coordination::JoinContinuation(joins, session);

  cms::rpc::RpcReply stored;
  stored.plus = "input";
  stored.result.set_string_value("d1");
  cont(stored);

  // An ok reply without a content id counts as a failed part.
  cms::rpc::RpcReply empty;
  empty.plus = "output";
  cont(empty);

  assert(outcome.failures == 1);
  assert(outcome.failure->tag == "output");
  assert(outcome.failure->orphaned.at("input") == "d1");
}

} // namespace

int main() {
  TestBothPartsStoredFiresSuccessOnce();
  TestFailureAfterSuccessReportsOrphan();
  TestReportsAfterTerminalAreIgnored();
  TestEveryArrivalOrderYieldsOneAction();
  TestInvalidSessionsAreRejected();
  TestUnexpectedAndDuplicateTags();
  TestActionMayBeginNewSession();
  TestConcurrentReportsFireExactlyOnce();
  TestJoinContinuationMapsReplies();

  std::cout << "cms_admin_unit_upload_join: pass\n";
  return 0;
}
