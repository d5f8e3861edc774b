#include "authorization_gate.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace cms::rpc {

namespace {

constexpr std::array<std::pair<std::string_view, ServiceKind>, 4> kServiceNames = {{
    {kEvaluationService, ServiceKind::kEvaluation},
    {kResourceService, ServiceKind::kResource},
    {kLogService, ServiceKind::kLog},
    {kFileStorageService, ServiceKind::kFileStorage},
}};

constexpr std::array<std::pair<std::string_view, Method>, 9> kMethodNames = {{
    {"submissions_status", Method::kSubmissionsStatus},
    {"queue_status", Method::kQueueStatus},
    {"workers_status", Method::kWorkersStatus},
    {"new_submission", Method::kNewSubmission},
    {"last_messages", Method::kLastMessages},
    {"get_resources", Method::kGetResources},
    {"kill_service", Method::kKillService},
    {"put_file", Method::kPutFile},
    {"get_file", Method::kGetFile},
}};

} // namespace

ServiceKind ParseServiceKind(std::string_view name) noexcept {
  for (const auto& [candidate, kind] : kServiceNames) {
    if (candidate == name) return kind;
  }
  return ServiceKind::kUnknown;
}

Method ParseMethod(std::string_view name) noexcept {
  for (const auto& [candidate, method] : kMethodNames) {
    if (candidate == name) return method;
  }
  return Method::kUnknown;
}

std::string_view MethodName(Method method) noexcept {
  for (const auto& [name, candidate] : kMethodNames) {
    if (candidate == method) return name;
  }
  return "unknown";
}

AuthorizationGate::AuthorizationGate() : AuthorizationGate(DefaultRules()) {
}

AuthorizationGate::AuthorizationGate(std::vector<Rule> rules) : rules_(std::move(rules)) {
}

std::vector<AuthorizationGate::Rule> AuthorizationGate::DefaultRules() {
  return {
      {ServiceKind::kEvaluation, Method::kSubmissionsStatus, 0},
      {ServiceKind::kEvaluation, Method::kQueueStatus, 0},
      {ServiceKind::kEvaluation, Method::kWorkersStatus, 0},
      {ServiceKind::kLog, Method::kLastMessages, 0},
      {ServiceKind::kResource, Method::kGetResources, std::nullopt},
      {ServiceKind::kResource, Method::kKillService, std::nullopt},
  };
}

bool AuthorizationGate::Allow(const ServiceCoordinate& coord, std::string_view method, const google::protobuf::Struct&) const noexcept {
  const auto service = ParseServiceKind(coord.name);
  const auto parsed  = ParseMethod(method);
  if (service == ServiceKind::kUnknown || parsed == Method::kUnknown) {
    return false;
  }

  return std::any_of(rules_.begin(), rules_.end(), [&](const Rule& rule) {
    return rule.service == service && rule.method == parsed && (!rule.shard || *rule.shard == coord.shard);
  });
}

} // namespace cms::rpc
