#include "service_registry.hpp"

#include "internal/util/errors.hpp"

namespace cms::rpc {

ServiceRegistry::ServiceRegistry(ShardTable shards) : shards_(std::move(shards)) {
}

ServiceRegistry ServiceRegistry::FromConfig(const cms::runtime::config::RuntimeConfig& config) {
  ShardTable table;
  for (const auto& [name, service] : config.services()) {
    auto& endpoints = table[name];
    endpoints.reserve(service.shards_size());
    for (const auto& shard : service.shards()) {
      endpoints.push_back(Endpoint{shard.host(), static_cast<std::uint16_t>(shard.port())});
    }
  }
  return ServiceRegistry(std::move(table));
}

const std::vector<Endpoint>& ServiceRegistry::Shards(const std::string& service_name) const {
  auto it = shards_.find(service_name);
  if (it == shards_.end() || it->second.empty()) {
    throw util::UnknownService("no shards configured for service " + service_name);
  }
  return it->second;
}

std::uint32_t ServiceRegistry::ShardCount(const std::string& service_name) const {
  return static_cast<std::uint32_t>(Shards(service_name).size());
}

Endpoint ServiceRegistry::Address(const ServiceCoordinate& coord) const {
  const auto& endpoints = Shards(coord.name);
  if (coord.shard >= endpoints.size()) {
    throw util::UnknownService("unknown shard " + coord.ToString());
  }
  return endpoints[coord.shard];
}

bool ServiceRegistry::Contains(const ServiceCoordinate& coord) const {
  auto it = shards_.find(coord.name);
  return it != shards_.end() && coord.shard < it->second.size();
}

std::vector<std::string> ServiceRegistry::ServiceNames() const {
  std::vector<std::string> names;
  names.reserve(shards_.size());
  for (const auto& [name, _] : shards_) {
    names.push_back(name);
  }
  return names;
}

} // namespace cms::rpc
