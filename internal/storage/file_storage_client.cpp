#include "file_storage_client.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/rpc/authorization_gate.hpp"

namespace cms::storage {

FileStorageClient::FileStorageClient(std::shared_ptr<rpc::ChannelPool> pool, rpc::ServiceCoordinate coord)
    : pool_(std::move(pool)), coord_(std::move(coord)) {
}

rpc::InvokeOutcome FileStorageClient::PutFile(std::string data, const std::string& description, rpc::RpcCallback on_complete,
                                              std::string plus) {
  google::protobuf::Struct args;
  (*args.mutable_fields())["description"].set_string_value(description);

  return pool_->Invoke(coord_, std::string(rpc::MethodName(rpc::Method::kPutFile)), args, std::move(data), std::move(on_complete),
                       std::move(plus));
}

rpc::InvokeOutcome FileStorageClient::GetFile(const std::string& digest, rpc::RpcCallback on_complete, std::string plus) {
  google::protobuf::Struct args;
  (*args.mutable_fields())["digest"].set_string_value(digest);

  return pool_->Invoke(coord_, std::string(rpc::MethodName(rpc::Method::kGetFile)), args, std::move(on_complete), std::move(plus));
}

} // namespace cms::storage
