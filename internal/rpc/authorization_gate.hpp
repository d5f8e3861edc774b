#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "service_coord.hpp"

namespace cms::rpc {

enum class ServiceKind {
  kUnknown,
  kEvaluation,
  kResource,
  kLog,
  kFileStorage,
};

// Every backend method the front end knows by name.
enum class Method {
  kUnknown,
  // Evaluation
  kSubmissionsStatus,
  kQueueStatus,
  kWorkersStatus,
  kNewSubmission,
  // Log
  kLastMessages,
  // Resource
  kGetResources,
  kKillService,
  // FileStorage
  kPutFile,
  kGetFile,
};

ServiceKind ParseServiceKind(std::string_view name) noexcept;
Method      ParseMethod(std::string_view name) noexcept;

std::string_view MethodName(Method method) noexcept;

/*
  AuthorizationGate

  Fail-closed allow-list for RPCs requested by untrusted callers (the
  browser proxy). A (service, method) pair is reachable only if a rule
  names it; unknown services, unknown method names and known-but-unlisted
  methods are all denied. Server-initiated calls do not go through here.

  The table is built once and never changes, so Allow() is pure.
*/
class AuthorizationGate {
 public:
  struct Rule {
    ServiceKind service;
    Method      method;
    // Empty means every shard of the service.
    std::optional<std::uint32_t> shard;
  };

  AuthorizationGate();
  explicit AuthorizationGate(std::vector<Rule> rules);

  // The rules the admin front end ships with.
  static std::vector<Rule> DefaultRules();

  // `arguments` is accepted for per-call policies; current rules ignore it.
  bool Allow(const ServiceCoordinate& coord, std::string_view method,
             const google::protobuf::Struct& arguments = google::protobuf::Struct::default_instance()) const noexcept;

  const std::vector<Rule>& Rules() const {
    return rules_;
  }

 private:
  std::vector<Rule> rules_;
};

} // namespace cms::rpc
