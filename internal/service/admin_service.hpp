#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include "cms/admin/v1.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/task_record.hpp"
#include "service_context.hpp"

namespace cms::service {

/*
  AdminService

  Operations behind AdminFrontendService. Every method runs on the
  dispatcher and either throws before any backend call is issued, or
  later calls `done` exactly once; the response is filled in before a
  successful `done(nullptr)`.

  File-storing operations answer once their upload session is terminal.
  Storage failures are also appended to the notification queue so the
  operator sees them on the next poll.
*/
class AdminService {
public:
  using Completion = std::function<void(std::exception_ptr)>;

  explicit AdminService(ServiceContext ctx);

  void ProxyCall(const cms::admin::v1::ProxyCallRequest& req, cms::admin::v1::ProxyCallResponse* resp, Completion done);

  void AddTestcase(const cms::admin::v1::AddTestcaseRequest& req, cms::admin::v1::AddTestcaseResponse* resp, Completion done);

  void AddStatement(const cms::admin::v1::AddStatementRequest& req, cms::admin::v1::AddStatementResponse* resp, Completion done);

  void AddAttachment(const cms::admin::v1::AddAttachmentRequest& req, cms::admin::v1::AddAttachmentResponse* resp, Completion done);

  void AddManager(const cms::admin::v1::AddManagerRequest& req, cms::admin::v1::AddManagerResponse* resp, Completion done);

  void GetFile(const cms::admin::v1::GetFileRequest& req, cms::admin::v1::GetFileResponse* resp, Completion done);

  void Reevaluate(const cms::admin::v1::ReevaluateRequest& req, cms::admin::v1::ReevaluateResponse* resp, Completion done);

  cms::admin::v1::ListResourcesResponse ListResources(const cms::admin::v1::ListResourcesRequest& req);

  cms::admin::v1::PollNotificationsResponse PollNotifications(const cms::admin::v1::PollNotificationsRequest& req);

private:
  // Persists `digest` for the task inside the caller's transaction.
  using StoreAction = std::function<void(db::Transaction&, const std::string& digest)>;

  db::model::TaskRecord LoadTask(uint64_t task_id);

  // One put_file joined by a single-tag session.
  void StoreTaskFile(const db::model::TaskRecord& task, const std::string& filename, const std::string& data,
                     const std::string& description, std::string failure_subject, StoreAction store,
                     std::function<void(const std::string&)> on_stored, Completion done);

  void Notify(std::string subject, std::string body);

  ServiceContext ctx_;
};

} // namespace cms::service
