#include "internal/rpc/channel_pool.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include "internal/util/errors.hpp"
#include "tests/support/fake_backend.hpp"

namespace {

using cms::rpc::ChannelPool;
using cms::rpc::Dispatcher;
using cms::rpc::Endpoint;
using cms::rpc::InvokeOutcome;
using cms::rpc::RpcReply;
using cms::rpc::ServiceRegistry;
using cms::testing::FakeBackendServer;
using cms::testing::PumpUntil;

using namespace std::chrono_literals;

struct Harness {
  std::shared_ptr<Dispatcher>  dispatcher = std::make_shared<Dispatcher>();
  FakeBackendServer            evaluation;
  std::shared_ptr<ChannelPool> pool;

  explicit Harness(std::chrono::milliseconds timeout = 2s) {
    auto registry = std::make_shared<const ServiceRegistry>(ServiceRegistry::ShardTable{
        {"Evaluation", {Endpoint{"in-process", 1}}},
    });
    pool = std::make_shared<ChannelPool>(registry, dispatcher, timeout,
                                         [this](const cms::rpc::ServiceCoordinate&, const Endpoint&) { return evaluation.Channel(); });
  }
};

void TestSuccessfulCallCarriesResultAndPlus() {
  Harness h;
  h.evaluation.Backend().On("queue_status", [](const auto& req, auto* resp) {
    auto& fields = *resp->mutable_result()->mutable_struct_value()->mutable_fields();
    fields["length"].set_number_value(3);
    fields["echo"].set_string_value(req.arguments().fields().at("who").string_value());
    resp->set_binary_data(req.binary_data());
    return ::grpc::Status::OK;
  });

  google::protobuf::Struct args;
  (*args.mutable_fields())["who"].set_string_value("admin");

  std::optional<RpcReply> reply;
  const auto outcome = h.pool->Invoke({"Evaluation", 0}, "queue_status", args, std::string("\x00\x01", 2),
                                      [&](const RpcReply& r) { reply = r; }, "tag-7");
  assert(outcome == InvokeOutcome::kPending);
  assert(PumpUntil(*h.dispatcher, [&] { return reply.has_value(); }));

  assert(reply->ok());
  assert(reply->plus == "tag-7");
  assert(reply->result.struct_value().fields().at("length").number_value() == 3);
  assert(reply->result.struct_value().fields().at("echo").string_value() == "admin");
  assert(reply->binary_data == std::string("\x00\x01", 2));

  const auto requests = h.evaluation.Backend().Requests();
  assert(requests.size() == 1);
  assert(requests[0].service() == "Evaluation" && requests[0].shard() == 0);
  assert(requests[0].method() == "queue_status");
}

void TestBackendErrorIsDelivered() {
  Harness h;
  h.evaluation.Backend().On("new_submission", [](const auto&, auto*) {
    return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "unknown submission");
  });

  std::optional<RpcReply> reply;
  h.pool->Invoke({"Evaluation", 0}, "new_submission", {}, [&](const RpcReply& r) { reply = r; });
  assert(PumpUntil(*h.dispatcher, [&] { return reply.has_value(); }));

  assert(!reply->ok());
  assert(*reply->error == "unknown submission");
  assert(reply->code == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestSilentShardTimesOut() {
  Harness h(100ms);
  h.evaluation.Backend().On("workers_status", [](const auto&, auto*) {
    std::this_thread::sleep_for(600ms);
    return ::grpc::Status::OK;
  });

  std::optional<RpcReply> reply;
  h.pool->Invoke({"Evaluation", 0}, "workers_status", {}, [&](const RpcReply& r) { reply = r; });
  assert(PumpUntil(*h.dispatcher, [&] { return reply.has_value(); }));

  assert(!reply->ok());
  assert(reply->code == ::grpc::StatusCode::DEADLINE_EXCEEDED);
}

void TestUnknownCoordinateFailsThroughContinuation() {
  Harness h;

  bool                    called = false;
  std::optional<RpcReply> reply;
  const auto outcome = h.pool->Invoke({"Log", 0}, "last_messages", {}, [&](const RpcReply& r) {
    called = true;
    reply  = r;
  }, "p");

  // Never invoked synchronously from Invoke().
  assert(outcome == InvokeOutcome::kFailed);
  assert(!called);

  h.dispatcher->RunPending();
  assert(called);
  assert(!reply->ok() && reply->code == ::grpc::StatusCode::NOT_FOUND);
  assert(reply->plus == "p");

  bool threw = false;
  try {
    h.pool->Connect({"Evaluation", 4});
  } catch (const cms::util::UnknownService&) {
    threw = true;
  }
  assert(threw);
}

void TestUnreachableShardFails() {
  auto dispatcher = std::make_shared<Dispatcher>();
  auto registry   = std::make_shared<const ServiceRegistry>(ServiceRegistry::ShardTable{
      {"Resource", {Endpoint{"127.0.0.1", 1}}},
  });
  ChannelPool pool(registry, dispatcher, 2s);

  std::optional<RpcReply> reply;
  pool.Invoke({"Resource", 0}, "get_resources", {}, [&](const RpcReply& r) { reply = r; });
  assert(PumpUntil(*dispatcher, [&] { return reply.has_value(); }));

  assert(!reply->ok());
  assert(reply->code == ::grpc::StatusCode::UNAVAILABLE);
  assert(!pool.Connect({"Resource", 0})->IsConnected());
}

// Once gRPC reports the channel down, further calls fail without being sent.
void TestDisconnectedChannelFailsFast() {
  auto dispatcher = std::make_shared<Dispatcher>();

  // Long backoff keeps the channel in TRANSIENT_FAILURE for the whole test.
  ::grpc::ChannelArguments args;
  args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, 30000);
  args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, 30000);
  args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, 30000);
  auto grpc_channel = ::grpc::CreateCustomChannel("127.0.0.1:1", ::grpc::InsecureChannelCredentials(), args);
  auto channel      = cms::rpc::RpcChannel::Create({"Resource", 0}, grpc_channel, dispatcher, 2s);

  std::optional<RpcReply> first;
  channel->Invoke("get_resources", {}, {}, [&](const RpcReply& r) { first = r; });
  assert(PumpUntil(*dispatcher, [&] { return first.has_value(); }));
  assert(!first->ok());
  assert(PumpUntil(*dispatcher, [&] { return grpc_channel->GetState(false) == GRPC_CHANNEL_TRANSIENT_FAILURE; }));

  bool                    called = false;
  std::optional<RpcReply> second;
  const auto outcome = channel->Invoke("get_resources", {}, {}, [&](const RpcReply& r) {
    called = true;
    second = r;
  }, "again");

  assert(outcome == InvokeOutcome::kFailed);
  assert(!called);
  assert(channel->PendingCalls() == 0);

  dispatcher->RunPending();
  assert(called);
  assert(second->error && *second->error == "Connection failed.");
  assert(second->code == ::grpc::StatusCode::UNAVAILABLE);
  assert(second->plus == "again");
}

void TestClosingChannelFailsPendingCallsOnce() {
  auto              dispatcher = std::make_shared<Dispatcher>();
  FakeBackendServer server;
  server.Backend().On("get_resources", [](const auto&, auto*) {
    std::this_thread::sleep_for(300ms);
    return ::grpc::Status::OK;
  });

  auto channel = cms::rpc::RpcChannel::Create({"Resource", 0}, server.Channel(), dispatcher, 5s);

  int                     calls = 0;
  std::optional<RpcReply> reply;
  channel->Invoke("get_resources", {}, {}, [&](const RpcReply& r) {
    ++calls;
    reply = r;
  });
  assert(channel->PendingCalls() == 1);

  channel.reset();
  assert(PumpUntil(*dispatcher, [&] { return reply.has_value(); }));
  assert(*reply->error == "Channel closed.");

  // The transport completion that follows the cancel is dropped.
  std::this_thread::sleep_for(500ms);
  dispatcher->RunPending();
  assert(calls == 1);
}

void TestMissingContinuationIsRejected() {
  Harness h;
  auto    channel = h.pool->Connect({"Evaluation", 0});

  bool threw = false;
  try {
    channel->Invoke("queue_status", {}, {}, nullptr);
  } catch (const cms::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(channel->PendingCalls() == 0);
}

} // namespace

int main() {
  TestSuccessfulCallCarriesResultAndPlus();
  TestBackendErrorIsDelivered();
  TestSilentShardTimesOut();
  TestUnknownCoordinateFailsThroughContinuation();
  TestUnreachableShardFails();
  TestDisconnectedChannelFailsFast();
  TestClosingChannelFailsPendingCallsOnce();
  TestMissingContinuationIsRejected();

  std::cout << "cms_admin_unit_rpc_channel: pass\n";
  return 0;
}
