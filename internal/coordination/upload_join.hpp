#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "internal/rpc/rpc_channel.hpp"

namespace cms::coordination {

using SessionHandle = std::string;

// tag -> content id (digest) returned by the store.
using ContentIds = std::map<std::string, std::string>;

struct UploadFailure {
  std::string tag;
  std::string error;
  // Parts that were stored before the failure. They stay in the store
  // unreferenced; the store has no delete verb.
  ContentIds orphaned;
};

using SuccessAction = std::function<void(const ContentIds&)>;
using FailureAction = std::function<void(const UploadFailure&)>;

/*
  UploadJoinCoordinator

  Joins N independently issued store calls into one all-or-nothing
  result. Each session fires exactly one of its two actions:

    - success, once every expected tag has reported a content id;
    - failure, on the first tag that reports an error, no matter how
      many tags already succeeded.

  A session is terminal (and forgotten) as soon as an action fires; any
  later report for it is discarded. Store calls cannot be cancelled, so
  late replies for a failed session are expected and harmless.

  Reports may race from different threads; the terminal check and the
  bookkeeping happen under one lock and the action runs after it is
  released, so an action may start new sessions.
*/
class UploadJoinCoordinator {
 public:
  // Throws util::InvalidSession when `expected_tags` is empty or an action is missing.
  SessionHandle Begin(std::set<std::string> expected_tags, SuccessAction on_success, FailureAction on_failure);

  // Throws util::UnexpectedTag for a tag outside the expected set or a
  // tag that already reported; the session stays open in that case.
  void ReportSuccess(const SessionHandle& session, const std::string& tag, std::string content_id);

  void ReportFailure(const SessionHandle& session, const std::string& tag, std::string error);

  bool IsActive(const SessionHandle& session) const;

  std::size_t ActiveSessions() const;

 private:
  struct Session {
    std::set<std::string> expected;
    ContentIds            stored;
    SuccessAction         on_success;
    FailureAction         on_failure;
  };

  void CheckTag(const SessionHandle& handle, const Session& session, const std::string& tag) const;

  mutable std::mutex                          mutex_;
  std::unordered_map<SessionHandle, Session> sessions_;
};

/*
  Continuation for a store call that is part of `session`; the call's
  plus tag is the session tag and a successful result carries the content
  id as a string value.
*/
rpc::RpcCallback JoinContinuation(std::shared_ptr<UploadJoinCoordinator> coordinator, SessionHandle session);

} // namespace cms::coordination
