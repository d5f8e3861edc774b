#include "rpc_channel.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cms::rpc {

namespace {

std::string DescribeStatus(const ::grpc::Status& status) {
  if (!status.error_message().empty()) {
    return status.error_message();
  }
  return "rpc failed with status code " + std::to_string(static_cast<int>(status.error_code()));
}

} // namespace

void PostFailure(Dispatcher& dispatcher, RpcCallback on_complete, std::string plus, std::string error, ::grpc::StatusCode code) {
  dispatcher.Post([on_complete = std::move(on_complete), plus = std::move(plus), error = std::move(error), code] {
    RpcReply reply;
    reply.plus  = plus;
    reply.error = error;
    reply.code  = code;
    on_complete(reply);
  });
}

std::shared_ptr<RpcChannel> RpcChannel::Create(ServiceCoordinate coord, std::shared_ptr<::grpc::Channel> channel,
                                               std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds call_timeout) {
  return std::shared_ptr<RpcChannel>(new RpcChannel(std::move(coord), std::move(channel), std::move(dispatcher), call_timeout));
}

RpcChannel::RpcChannel(ServiceCoordinate coord, std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<Dispatcher> dispatcher,
                       std::chrono::milliseconds call_timeout)
    : coord_(std::move(coord)),
      channel_(std::move(channel)),
      stub_(cms::admin::v1::ServiceRpc::NewStub(channel_)),
      dispatcher_(std::move(dispatcher)),
      call_timeout_(call_timeout) {
}

RpcChannel::~RpcChannel() {
  std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> orphaned;
  {
    std::lock_guard lock(mutex_);
    orphaned.swap(pending_);
  }

  for (auto& [_, call] : orphaned) {
    call->context.TryCancel();
    PostFailure(*dispatcher_, std::move(call->on_complete), call->plus, "Channel closed.", ::grpc::StatusCode::CANCELLED);
  }
}

bool RpcChannel::IsConnected() const {
  return channel_->GetState(false) == GRPC_CHANNEL_READY;
}

std::size_t RpcChannel::PendingCalls() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

InvokeOutcome RpcChannel::Invoke(const std::string& method, const google::protobuf::Struct& arguments, std::string binary_data,
                                 RpcCallback on_complete, std::string plus) {
  if (!on_complete) {
    throw util::InvalidArgument("rpc continuation must be set for " + coord_.ToString() + "." + method);
  }

  // Kicks off reconnection when idle or failed.
  const auto state = channel_->GetState(true);
  if (state == GRPC_CHANNEL_TRANSIENT_FAILURE || state == GRPC_CHANNEL_SHUTDOWN) {
    CMS_LOG_WARN("RPC not sent, channel disconnected",
                 {observability::StringField("service", coord_.ToString()), observability::StringField("method", method)});
    PostFailure(*dispatcher_, std::move(on_complete), std::move(plus), "Connection failed.");
    return InvokeOutcome::kFailed;
  }

  auto call         = std::make_shared<PendingCall>();
  call->method      = method;
  call->plus        = std::move(plus);
  call->on_complete = std::move(on_complete);

  call->request.set_service(coord_.name);
  call->request.set_shard(coord_.shard);
  call->request.set_method(method);
  *call->request.mutable_arguments() = arguments;
  call->request.set_binary_data(std::move(binary_data));

  call->context.set_deadline(std::chrono::system_clock::now() + call_timeout_);
  call->context.set_wait_for_ready(false);

  {
    std::lock_guard lock(mutex_);
    call->id = next_call_id_++;
    pending_.emplace(call->id, call);
  }

  CMS_LOG_DEBUG("RPC issued", {observability::StringField("service", coord_.ToString()), observability::StringField("method", method),
                               observability::IntField("call_id", static_cast<std::int64_t>(call->id))});

  std::weak_ptr<RpcChannel> weak_self  = weak_from_this();
  auto                      dispatcher = dispatcher_;
  const auto                call_id    = call->id;

  // `call` is captured so the context and messages outlive the transport
  // even if this channel is destroyed first.
  stub_->async()->Invoke(&call->context, &call->request, &call->response,
                         [weak_self, dispatcher, call, call_id](::grpc::Status status) {
                           dispatcher->Post([weak_self, call_id, status = std::move(status)] {
                             if (auto self = weak_self.lock()) {
                               self->Complete(call_id, status);
                             }
                           });
                         });

  return InvokeOutcome::kPending;
}

void RpcChannel::Complete(std::uint64_t call_id, const ::grpc::Status& status) {
  std::shared_ptr<PendingCall> call;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(call_id);
    if (it == pending_.end()) {
      CMS_LOG_DEBUG("Dropping completion for finished call",
                    {observability::StringField("service", coord_.ToString()), observability::IntField("call_id", static_cast<std::int64_t>(call_id))});
      return;
    }
    call = std::move(it->second);
    pending_.erase(it);
  }

  RpcReply reply;
  reply.plus = call->plus;
  reply.code = status.error_code();
  if (status.ok()) {
    reply.result      = call->response.result();
    reply.binary_data = call->response.binary_data();
  } else {
    reply.error = DescribeStatus(status);
    CMS_LOG_WARN("RPC failed", {observability::StringField("service", coord_.ToString()), observability::StringField("method", call->method),
                                observability::StringField("error", *reply.error)});
  }

  call->on_complete(reply);
}

} // namespace cms::rpc
