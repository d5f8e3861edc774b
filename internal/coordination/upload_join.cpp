#include "upload_join.hpp"

#include <sstream>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace cms::coordination {

namespace {

std::string JoinIds(const ContentIds& ids) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& [tag, id] : ids) {
    if (!first) out << ',';
    first = false;
    out << tag << ':' << id;
  }
  return out.str();
}

} // namespace

SessionHandle UploadJoinCoordinator::Begin(std::set<std::string> expected_tags, SuccessAction on_success, FailureAction on_failure) {
  if (expected_tags.empty()) {
    throw util::InvalidSession("upload session needs at least one expected tag");
  }
  if (!on_success || !on_failure) {
    throw util::InvalidSession("upload session needs both a success and a failure action");
  }

  Session session;
  session.expected   = std::move(expected_tags);
  session.on_success = std::move(on_success);
  session.on_failure = std::move(on_failure);

  std::lock_guard lock(mutex_);
  SessionHandle   handle = util::RandomUuid();
  while (sessions_.contains(handle)) {
    handle = util::RandomUuid();
  }
  sessions_.emplace(handle, std::move(session));
  return handle;
}

void UploadJoinCoordinator::CheckTag(const SessionHandle& handle, const Session& session, const std::string& tag) const {
  if (!session.expected.contains(tag)) {
    CMS_LOG_ERROR("Report for unexpected upload tag", {observability::StringField("session", handle), observability::StringField("tag", tag)});
    throw util::UnexpectedTag("tag '" + tag + "' is not part of upload session " + handle);
  }
  if (session.stored.contains(tag)) {
    CMS_LOG_ERROR("Duplicate report for upload tag", {observability::StringField("session", handle), observability::StringField("tag", tag)});
    throw util::UnexpectedTag("tag '" + tag + "' already reported for upload session " + handle);
  }
}

void UploadJoinCoordinator::ReportSuccess(const SessionHandle& handle, const std::string& tag, std::string content_id) {
  SuccessAction action;
  ContentIds    ids;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(handle);
    if (it == sessions_.end()) {
      CMS_LOG_DEBUG("Ignoring success for finished upload session",
                    {observability::StringField("session", handle), observability::StringField("tag", tag)});
      return;
    }

    auto& session = it->second;
    CheckTag(handle, session, tag);
    session.stored.emplace(tag, std::move(content_id));

    if (session.stored.size() < session.expected.size()) {
      return;
    }

    action = std::move(session.on_success);
    ids    = std::move(session.stored);
    sessions_.erase(it);
  }

  CMS_LOG_DEBUG("Upload session complete", {observability::StringField("session", handle), observability::StringField("content", JoinIds(ids))});
  action(ids);
}

void UploadJoinCoordinator::ReportFailure(const SessionHandle& handle, const std::string& tag, std::string error) {
  FailureAction action;
  UploadFailure failure;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(handle);
    if (it == sessions_.end()) {
      CMS_LOG_DEBUG("Ignoring failure for finished upload session",
                    {observability::StringField("session", handle), observability::StringField("tag", tag)});
      return;
    }

    auto& session = it->second;
    CheckTag(handle, session, tag);

    action           = std::move(session.on_failure);
    failure.tag      = tag;
    failure.error    = std::move(error);
    failure.orphaned = std::move(session.stored);
    sessions_.erase(it);
  }

  CMS_LOG_WARN("Upload session failed", {observability::StringField("session", handle), observability::StringField("tag", failure.tag),
                                         observability::StringField("error", failure.error)});
  if (!failure.orphaned.empty()) {
    CMS_LOG_WARN("Stored parts left unreferenced", {observability::StringField("session", handle),
                                                    observability::StringField("content", JoinIds(failure.orphaned))});
  }
  action(failure);
}

bool UploadJoinCoordinator::IsActive(const SessionHandle& handle) const {
  std::lock_guard lock(mutex_);
  return sessions_.contains(handle);
}

std::size_t UploadJoinCoordinator::ActiveSessions() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

rpc::RpcCallback JoinContinuation(std::shared_ptr<UploadJoinCoordinator> coordinator, SessionHandle session) {
  return [coordinator = std::move(coordinator), session = std::move(session)](const rpc::RpcReply& reply) {
    if (reply.ok() && !reply.result.string_value().empty()) {
      coordinator->ReportSuccess(session, reply.plus, reply.result.string_value());
    } else if (reply.ok()) {
      coordinator->ReportFailure(session, reply.plus, "store returned no content id");
    } else {
      coordinator->ReportFailure(session, reply.plus, *reply.error);
    }
  };
}

} // namespace cms::coordination
