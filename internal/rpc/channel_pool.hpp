#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <grpcpp/grpcpp.h>

#include "dispatcher.hpp"
#include "rpc_channel.hpp"
#include "service_coord.hpp"
#include "service_registry.hpp"

namespace cms::rpc {

/*
  ChannelPool

  One RpcChannel per ServiceCoordinate, created on first use from the
  registry address. Invoke() is the single entry point used by the rest
  of the front end: addressing errors travel through the continuation
  just like transport errors, so callers only handle one failure path.
*/
class ChannelPool {
 public:
  using ChannelFactory = std::function<std::shared_ptr<::grpc::Channel>(const ServiceCoordinate&, const Endpoint&)>;

  ChannelPool(std::shared_ptr<const ServiceRegistry> registry, std::shared_ptr<Dispatcher> dispatcher,
              std::chrono::milliseconds call_timeout, ChannelFactory factory = InsecureChannelFactory());

  static ChannelFactory InsecureChannelFactory();

  // Throws util::UnknownService for coordinates missing from the registry.
  std::shared_ptr<RpcChannel> Connect(const ServiceCoordinate& coord);

  InvokeOutcome Invoke(const ServiceCoordinate& coord, const std::string& method, const google::protobuf::Struct& arguments,
                       std::string binary_data, RpcCallback on_complete, std::string plus = {});

  InvokeOutcome Invoke(const ServiceCoordinate& coord, const std::string& method, const google::protobuf::Struct& arguments,
                       RpcCallback on_complete, std::string plus = {}) {
    return Invoke(coord, method, arguments, std::string{}, std::move(on_complete), std::move(plus));
  }

  const ServiceRegistry& Registry() const {
    return *registry_;
  }

  Dispatcher& GetDispatcher() const {
    return *dispatcher_;
  }

 private:
  std::shared_ptr<const ServiceRegistry> registry_;
  std::shared_ptr<Dispatcher>            dispatcher_;
  std::chrono::milliseconds              call_timeout_;
  ChannelFactory                         factory_;

  std::mutex                                                                            mutex_;
  std::unordered_map<ServiceCoordinate, std::shared_ptr<RpcChannel>, ServiceCoordinateHash> channels_;
};

} // namespace cms::rpc
