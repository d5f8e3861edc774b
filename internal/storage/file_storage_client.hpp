#pragma once

#include <memory>
#include <string>

#include "internal/rpc/channel_pool.hpp"
#include "internal/rpc/rpc_channel.hpp"
#include "internal/rpc/service_coord.hpp"

namespace cms::storage {

/*
  Client for the content-addressed file storage service.

  put_file replies with the content digest as a string result; identical
  bytes yield the same digest. The front end never recomputes digests,
  it only threads them through to the database.
*/
class FileStorageClient {
 public:
  explicit FileStorageClient(std::shared_ptr<rpc::ChannelPool> pool,
                             rpc::ServiceCoordinate coord = {std::string(rpc::kFileStorageService), 0});

  // Continuation receives the digest in reply.result.string_value().
  rpc::InvokeOutcome PutFile(std::string data, const std::string& description, rpc::RpcCallback on_complete, std::string plus = {});

  // Continuation receives the bytes in reply.binary_data.
  rpc::InvokeOutcome GetFile(const std::string& digest, rpc::RpcCallback on_complete, std::string plus = {});

  const rpc::ServiceCoordinate& Coordinate() const {
    return coord_;
  }

 private:
  std::shared_ptr<rpc::ChannelPool> pool_;
  rpc::ServiceCoordinate            coord_;
};

} // namespace cms::storage
