#include "internal/rpc/authorization_gate.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using cms::rpc::AuthorizationGate;
using cms::rpc::Method;
using cms::rpc::ServiceKind;

void TestDefaultAllowList() {
  const AuthorizationGate gate;

  assert(gate.Allow({"Evaluation", 0}, "submissions_status"));
  assert(gate.Allow({"Evaluation", 0}, "queue_status"));
  assert(gate.Allow({"Evaluation", 0}, "workers_status"));
  assert(gate.Allow({"Log", 0}, "last_messages"));

  // Resource methods are reachable on every shard.
  for (uint32_t shard = 0; shard < 8; ++shard) {
    assert(gate.Allow({"Resource", shard}, "get_resources"));
    assert(gate.Allow({"Resource", shard}, "kill_service"));
  }
}

void TestDeniedCalls() {
  const AuthorizationGate gate;

  // Known method, not on the list: resubmitting work is server-only.
  assert(!gate.Allow({"Evaluation", 0}, "new_submission"));
  // Right method, wrong shard.
  assert(!gate.Allow({"Evaluation", 1}, "queue_status"));
  // File storage is never exposed to the browser.
  assert(!gate.Allow({"FileStorage", 0}, "get_file"));
  assert(!gate.Allow({"FileStorage", 0}, "put_file"));
  // Unknown service or method.
  assert(!gate.Allow({"Checker", 0}, "queue_status"));
  assert(!gate.Allow({"Evaluation", 0}, "drop_database"));
  assert(!gate.Allow({"Evaluation", 0}, ""));
  // Method names are case sensitive.
  assert(!gate.Allow({"Evaluation", 0}, "Queue_Status"));
}

void TestDecisionIsDeterministic() {
  const AuthorizationGate gate;

  google::protobuf::Struct args;
  (*args.mutable_fields())["submission_id"].set_number_value(42);

  for (int i = 0; i < 100; ++i) {
    assert(gate.Allow({"Evaluation", 0}, "queue_status", args));
    assert(!gate.Allow({"Evaluation", 0}, "new_submission", args));
  }
}

void TestCustomRules() {
  const AuthorizationGate gate({{ServiceKind::kFileStorage, Method::kGetFile, std::nullopt}});

  assert(gate.Allow({"FileStorage", 3}, "get_file"));
  assert(!gate.Allow({"Evaluation", 0}, "queue_status"));
  assert(gate.Rules().size() == 1);
}

void TestMethodNamesRoundTrip() {
  assert(cms::rpc::ParseMethod(cms::rpc::MethodName(Method::kNewSubmission)) == Method::kNewSubmission);
  assert(cms::rpc::ParseServiceKind("Resource") == ServiceKind::kResource);
  assert(cms::rpc::ParseServiceKind("resource") == ServiceKind::kUnknown);
  assert(cms::rpc::MethodName(Method::kUnknown) == "unknown");
}

} // namespace

int main() {
  TestDefaultAllowList();
  TestDeniedCalls();
  TestDecisionIsDeterministic();
  TestCustomRules();
  TestMethodNamesRoundTrip();

  std::cout << "cms_admin_unit_authorization_gate: pass\n";
  return 0;
}
