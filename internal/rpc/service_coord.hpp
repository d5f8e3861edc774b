#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace cms::rpc {

// Names of the backend services the admin front end talks to.
inline constexpr std::string_view kEvaluationService  = "Evaluation";
inline constexpr std::string_view kResourceService    = "Resource";
inline constexpr std::string_view kLogService         = "Log";
inline constexpr std::string_view kFileStorageService = "FileStorage";

/*
  Logical address of one shard of one named backend service.
  Immutable value type; equality by (name, shard).
*/
struct ServiceCoordinate {
  std::string   name;
  std::uint32_t shard = 0;

  std::string ToString() const {
    return name + "/" + std::to_string(shard);
  }

  friend bool operator==(const ServiceCoordinate&, const ServiceCoordinate&) = default;
};

inline std::ostream& operator<<(std::ostream& out, const ServiceCoordinate& coord) {
  return out << coord.ToString();
}

struct Endpoint {
  std::string   host;
  std::uint16_t port = 0;

  std::string Target() const {
    return host + ":" + std::to_string(port);
  }
};

struct ServiceCoordinateHash {
  std::size_t operator()(const ServiceCoordinate& coord) const noexcept {
    return std::hash<std::string>{}(coord.name) ^ (std::hash<std::uint32_t>{}(coord.shard) << 1);
  }
};

} // namespace cms::rpc
