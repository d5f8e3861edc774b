#include "channel_pool.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cms::rpc {

ChannelPool::ChannelPool(std::shared_ptr<const ServiceRegistry> registry, std::shared_ptr<Dispatcher> dispatcher,
                         std::chrono::milliseconds call_timeout, ChannelFactory factory)
    : registry_(std::move(registry)), dispatcher_(std::move(dispatcher)), call_timeout_(call_timeout), factory_(std::move(factory)) {
}

ChannelPool::ChannelFactory ChannelPool::InsecureChannelFactory() {
  return [](const ServiceCoordinate&, const Endpoint& endpoint) {
    ::grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, 500);
    args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, 10'000);
    return ::grpc::CreateCustomChannel(endpoint.Target(), ::grpc::InsecureChannelCredentials(), args);
  };
}

std::shared_ptr<RpcChannel> ChannelPool::Connect(const ServiceCoordinate& coord) {
  std::lock_guard lock(mutex_);

  if (auto it = channels_.find(coord); it != channels_.end()) {
    return it->second;
  }

  const auto endpoint = registry_->Address(coord);
  auto       channel  = RpcChannel::Create(coord, factory_(coord, endpoint), dispatcher_, call_timeout_);
  channels_.emplace(coord, channel);

  CMS_LOG_INFO("Connecting to service", {observability::StringField("service", coord.ToString()),
                                         observability::StringField("address", endpoint.Target())});
  return channel;
}

InvokeOutcome ChannelPool::Invoke(const ServiceCoordinate& coord, const std::string& method, const google::protobuf::Struct& arguments,
                                  std::string binary_data, RpcCallback on_complete, std::string plus) {
  std::shared_ptr<RpcChannel> channel;
  try {
    channel = Connect(coord);
  } catch (const util::UnknownService& e) {
    CMS_LOG_WARN("RPC to unknown service", {observability::StringField("service", coord.ToString()),
                                            observability::StringField("method", method)});
    PostFailure(*dispatcher_, std::move(on_complete), std::move(plus), e.what(), ::grpc::StatusCode::NOT_FOUND);
    return InvokeOutcome::kFailed;
  }

  return channel->Invoke(method, arguments, std::move(binary_data), std::move(on_complete), std::move(plus));
}

} // namespace cms::rpc
