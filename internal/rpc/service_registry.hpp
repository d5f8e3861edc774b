#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "service_coord.hpp"

namespace cms::rpc {

/*
  ServiceRegistry

  Resolves (service-name, shard) to a network endpoint. Built once from
  the runtime config and never mutated afterwards, so lookups need no
  locking.

  Unknown names or out-of-range shards raise util::UnknownService.
*/
class ServiceRegistry {
 public:
  using ShardTable = std::map<std::string, std::vector<Endpoint>>;

  explicit ServiceRegistry(ShardTable shards);

  static ServiceRegistry FromConfig(const cms::runtime::config::RuntimeConfig& config);

  std::uint32_t ShardCount(const std::string& service_name) const;

  Endpoint Address(const ServiceCoordinate& coord) const;

  bool Contains(const ServiceCoordinate& coord) const;

  std::vector<std::string> ServiceNames() const;

 private:
  const std::vector<Endpoint>& Shards(const std::string& service_name) const;

  ShardTable shards_;
};

} // namespace cms::rpc
