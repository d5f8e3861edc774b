#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <google/protobuf/struct.pb.h>
#include <grpcpp/grpcpp.h>

#include "cms/admin/v1/service_rpc.grpc.pb.h"
#include "dispatcher.hpp"
#include "service_coord.hpp"

namespace cms::rpc {

/*
  Outcome of one RPC as seen by its continuation.

  `plus` is the caller's local correlation tag; it never goes on the wire.
*/
struct RpcReply {
  std::string                plus;
  google::protobuf::Value    result;
  std::string                binary_data;
  std::optional<std::string> error;
  ::grpc::StatusCode         code = ::grpc::StatusCode::OK;

  bool ok() const {
    return !error.has_value();
  }
};

using RpcCallback = std::function<void(const RpcReply&)>;

enum class InvokeOutcome {
  kPending,
  kFailed, // failure already posted to the continuation
};

// Posts `on_complete` with an error reply to the dispatcher.
void PostFailure(Dispatcher& dispatcher, RpcCallback on_complete, std::string plus, std::string error,
                 ::grpc::StatusCode code = ::grpc::StatusCode::UNAVAILABLE);

/*
  RpcChannel

  Persistent connection to one backend shard. Calls are non-blocking:
  Invoke() returns immediately and the continuation later runs on the
  dispatcher, exactly once, with either the result or an error.

  Policy while disconnected: fail fast. A channel in TRANSIENT_FAILURE or
  SHUTDOWN reports "Connection failed." right away and gRPC keeps
  reconnecting in the background. Every call carries a deadline, so a
  shard that never answers still produces a DEADLINE_EXCEEDED failure.

  No ordering is guaranteed between the replies of different calls.
*/
class RpcChannel : public std::enable_shared_from_this<RpcChannel> {
 public:
  static std::shared_ptr<RpcChannel> Create(ServiceCoordinate coord, std::shared_ptr<::grpc::Channel> channel,
                                            std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds call_timeout);

  // Fails every still-pending call with "Channel closed.".
  ~RpcChannel();

  RpcChannel(const RpcChannel&)            = delete;
  RpcChannel& operator=(const RpcChannel&) = delete;

  InvokeOutcome Invoke(const std::string& method, const google::protobuf::Struct& arguments, std::string binary_data,
                       RpcCallback on_complete, std::string plus = {});

  const ServiceCoordinate& Coordinate() const {
    return coord_;
  }

  bool IsConnected() const;

  std::size_t PendingCalls() const;

 private:
  struct PendingCall {
    std::uint64_t id = 0;
    std::string   method;
    std::string   plus;
    RpcCallback   on_complete;

    ::grpc::ClientContext          context;
    cms::admin::v1::InvokeRequest  request;
    cms::admin::v1::InvokeResponse response;
  };

  RpcChannel(ServiceCoordinate coord, std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<Dispatcher> dispatcher,
             std::chrono::milliseconds call_timeout);

  // Runs on the dispatcher. A second completion for the same id is dropped.
  void Complete(std::uint64_t call_id, const ::grpc::Status& status);

  ServiceCoordinate                                      coord_;
  std::shared_ptr<::grpc::Channel>                       channel_;
  std::unique_ptr<cms::admin::v1::ServiceRpc::Stub>      stub_;
  std::shared_ptr<Dispatcher>                            dispatcher_;
  std::chrono::milliseconds                              call_timeout_;

  mutable std::mutex                                              mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> pending_;
  std::uint64_t                                                   next_call_id_ = 1;
};

} // namespace cms::rpc
