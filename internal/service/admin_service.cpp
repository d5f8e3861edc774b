#include "admin_service.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/coordination/upload_join.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notification/notification_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rpc/authorization_gate.hpp"
#include "internal/rpc/channel_pool.hpp"
#include "internal/storage/file_storage_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cms::service {

using namespace cms::admin::v1;

namespace {

constexpr const char* kTestcaseFailed   = "Testcase storage failed";
constexpr const char* kInvalidStatement = "Invalid task statement";
constexpr const char* kStatementFailed  = "Task statement storage failed";
constexpr const char* kAttachmentFailed = "Attachment storage failed";
constexpr const char* kManagerFailed    = "Manager storage failed";
constexpr const char* kReevaluateFailed = "Reevaluation request failed";

// Turns an error reply into the exception the gRPC layer maps to a status.
std::exception_ptr ReplyError(const rpc::RpcReply& reply) {
  const std::string& message = *reply.error;
  switch (reply.code) {
    case ::grpc::StatusCode::NOT_FOUND:
      return std::make_exception_ptr(util::NotFound(message));
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return std::make_exception_ptr(util::InvalidArgument(message));
    case ::grpc::StatusCode::PERMISSION_DENIED:
      return std::make_exception_ptr(util::AuthorizationDenied(message));
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return std::make_exception_ptr(util::TransportError(message));
    default:
      return std::make_exception_ptr(std::runtime_error(message));
  }
}

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AdminService::Notify(std::string subject, std::string body) {
  CMS_LOG_WARN("Operator notification", {observability::StringField("subject", subject), observability::StringField("text", body)});
  ctx_.notifications->Append(util::NowUnixSeconds(), std::move(subject), std::move(body));
}

db::model::TaskRecord AdminService::LoadTask(uint64_t task_id) {
  auto tx   = ctx_.repository->Begin();
  auto task = ctx_.repository->GetTask(*tx, task_id);
  tx->Rollback();
  if (!task) {
    throw util::NotFound("task " + std::to_string(task_id) + " not found");
  }
  return *task;
}

// ------------------------------------------------------------------
// Browser proxy
// ------------------------------------------------------------------

void AdminService::ProxyCall(const ProxyCallRequest& req, ProxyCallResponse* resp, Completion done) {
  const rpc::ServiceCoordinate coord{req.service(), req.shard()};
  if (!ctx_.gate->Allow(coord, req.method(), req.arguments())) {
    CMS_LOG_WARN("Proxy call denied",
                 {observability::StringField("service", coord.ToString()), observability::StringField("method", req.method())});
    throw util::AuthorizationDenied("method " + req.method() + " of " + coord.ToString() + " is not callable from the browser");
  }

  ctx_.pool->Invoke(coord, req.method(), req.arguments(), [resp, done](const rpc::RpcReply& reply) {
    if (!reply.ok()) {
      done(ReplyError(reply));
      return;
    }
    *resp->mutable_result() = reply.result;
    done(nullptr);
  });
}

// ------------------------------------------------------------------
// Task files
// ------------------------------------------------------------------

void AdminService::AddTestcase(const AddTestcaseRequest& req, AddTestcaseResponse* resp, Completion done) {
  const auto task      = LoadTask(req.task_id());
  const bool is_public = req.is_public();

  auto on_success = [this, task_id = task.id, is_public, resp, done](const coordination::ContentIds& ids) {
    try {
      db::model::TestcaseRecord record;
      record.task_id       = task_id;
      record.input_digest  = ids.at("input");
      record.output_digest = ids.at("output");
      record.is_public     = is_public;

      auto tx    = ctx_.repository->Begin();
      record.num = ctx_.repository->CountTestcases(*tx, task_id);
      db::ThrowIfError(ctx_.repository->InsertTestcase(*tx, record), "insert testcase");
      tx->Commit();

      resp->set_num(record.num);
      resp->set_input_digest(record.input_digest);
      resp->set_output_digest(record.output_digest);
      CMS_LOG_INFO("Testcase added", {observability::IntField("task_id", static_cast<int64_t>(task_id)),
                                      observability::IntField("num", record.num),
                                      observability::BoolField("public", record.is_public)});
      done(nullptr);
    } catch (const std::exception& e) {
      Notify(kTestcaseFailed, e.what());
      done(std::current_exception());
    }
  };

  auto on_failure = [this, done](const coordination::UploadFailure& failure) {
    Notify(kTestcaseFailed, failure.error);
    done(std::make_exception_ptr(util::PartialUploadFailure(failure.tag + ": " + failure.error)));
  };

  const auto session = ctx_.joins->Begin({"input", "output"}, std::move(on_success), std::move(on_failure));

  ctx_.files->PutFile(req.input(), "Testcase input for task " + task.name, coordination::JoinContinuation(ctx_.joins, session), "input");
  ctx_.files->PutFile(req.output(), "Testcase output for task " + task.name, coordination::JoinContinuation(ctx_.joins, session), "output");
}

void AdminService::StoreTaskFile(const db::model::TaskRecord& task, const std::string& filename, const std::string& data,
                                 const std::string& description, std::string failure_subject, StoreAction store,
                                 std::function<void(const std::string&)> on_stored, Completion done) {
  if (filename.empty()) {
    throw util::InvalidArgument("task file needs a filename");
  }

  auto on_success = [this, task_id = task.id, filename, failure_subject, store = std::move(store),
                     on_stored = std::move(on_stored), done](const coordination::ContentIds& ids) {
    const auto& digest = ids.at(filename);
    try {
      auto tx = ctx_.repository->Begin();
      store(*tx, digest);
      tx->Commit();

      CMS_LOG_INFO("Task file stored", {observability::IntField("task_id", static_cast<int64_t>(task_id)),
                                        observability::StringField("filename", filename),
                                        observability::StringField("digest", digest)});
      on_stored(digest);
      done(nullptr);
    } catch (const std::exception& e) {
      Notify(failure_subject, e.what());
      done(std::current_exception());
    }
  };

  auto on_failure = [this, failure_subject, done](const coordination::UploadFailure& failure) {
    Notify(failure_subject, failure.error);
    done(std::make_exception_ptr(util::PartialUploadFailure(failure.tag + ": " + failure.error)));
  };

  const auto session = ctx_.joins->Begin({filename}, std::move(on_success), std::move(on_failure));
  ctx_.files->PutFile(data, description, coordination::JoinContinuation(ctx_.joins, session), filename);
}

void AdminService::AddStatement(const AddStatementRequest& req, AddStatementResponse* resp, Completion done) {
  const auto task = LoadTask(req.task_id());
  if (!EndsWith(req.filename(), ".pdf")) {
    Notify(kInvalidStatement, "The task statement must be a .pdf file.");
    throw util::InvalidArgument("task statement must be a .pdf file, got " + req.filename());
  }

  StoreTaskFile(
      task, req.filename(), req.data(), "Task statement for " + task.name, kStatementFailed,
      [this, task_id = task.id](db::Transaction& tx, const std::string& digest) {
        db::ThrowIfError(ctx_.repository->SetTaskStatement(tx, task_id, digest), "set task statement");
      },
      [resp](const std::string& digest) { resp->set_digest(digest); }, std::move(done));
}

void AdminService::AddAttachment(const AddAttachmentRequest& req, AddAttachmentResponse* resp, Completion done) {
  const auto task = LoadTask(req.task_id());

  StoreTaskFile(
      task, req.filename(), req.data(), "Task attachment for " + task.name, kAttachmentFailed,
      [this, task_id = task.id, filename = req.filename()](db::Transaction& tx, const std::string& digest) {
        db::ThrowIfError(ctx_.repository->InsertTaskFile(tx, {task_id, db::model::TaskFileKind::kAttachment, filename, digest}),
                         "insert attachment");
      },
      [resp](const std::string& digest) { resp->set_digest(digest); }, std::move(done));
}

void AdminService::AddManager(const AddManagerRequest& req, AddManagerResponse* resp, Completion done) {
  const auto task = LoadTask(req.task_id());

  StoreTaskFile(
      task, req.filename(), req.data(), "Task manager for " + task.name, kManagerFailed,
      [this, task_id = task.id, filename = req.filename()](db::Transaction& tx, const std::string& digest) {
        db::ThrowIfError(ctx_.repository->InsertTaskFile(tx, {task_id, db::model::TaskFileKind::kManager, filename, digest}),
                         "insert manager");
      },
      [resp](const std::string& digest) { resp->set_digest(digest); }, std::move(done));
}

void AdminService::GetFile(const GetFileRequest& req, GetFileResponse* resp, Completion done) {
  if (req.digest().empty()) {
    throw util::InvalidArgument("get file: digest is required");
  }

  ctx_.files->GetFile(req.digest(), [resp, done](const rpc::RpcReply& reply) {
    if (!reply.ok()) {
      done(ReplyError(reply));
      return;
    }
    resp->set_data(reply.binary_data);
    done(nullptr);
  });
}

// ------------------------------------------------------------------
// Reevaluation
// ------------------------------------------------------------------

void AdminService::Reevaluate(const ReevaluateRequest& req, ReevaluateResponse* resp, Completion done) {
  auto tx = ctx_.repository->Begin();

  std::vector<db::model::SubmissionRecord> submissions;
  switch (req.scope()) {
    case REEVALUATE_SCOPE_SUBMISSION: {
      auto submission = ctx_.repository->GetSubmission(*tx, req.id());
      if (!submission) throw util::NotFound("submission " + std::to_string(req.id()) + " not found");
      submissions.push_back(*submission);
      break;
    }
    case REEVALUATE_SCOPE_USER:
      submissions = ctx_.repository->ListSubmissionsByUser(*tx, req.id());
      // Users are only known through their submissions.
      if (submissions.empty()) throw util::NotFound("user " + std::to_string(req.id()) + " has no submissions");
      break;
    case REEVALUATE_SCOPE_TASK:
      if (!ctx_.repository->GetTask(*tx, req.id())) throw util::NotFound("task " + std::to_string(req.id()) + " not found");
      submissions = ctx_.repository->ListSubmissionsByTask(*tx, req.id());
      break;
    default:
      throw util::InvalidArgument("reevaluate: scope is required");
  }

  for (const auto& submission : submissions) {
    db::ThrowIfError(ctx_.repository->InvalidateSubmission(*tx, submission.id), "invalidate submission");
  }
  tx->Commit();

  // Trusted server-initiated calls: no authorization gate.
  const rpc::ServiceCoordinate evaluation{std::string(rpc::kEvaluationService), 0};
  const std::string            method(rpc::MethodName(rpc::Method::kNewSubmission));
  for (const auto& submission : submissions) {
    google::protobuf::Struct args;
    (*args.mutable_fields())["submission_id"].set_number_value(static_cast<double>(submission.id));

    ctx_.pool->Invoke(evaluation, method, args, [this](const rpc::RpcReply& reply) {
      if (!reply.ok()) Notify(kReevaluateFailed, "Submission " + reply.plus + ": " + *reply.error);
    }, std::to_string(submission.id));
  }

  CMS_LOG_INFO("Reevaluation requested", {observability::IntField("scope", req.scope()), observability::IntField("id", static_cast<int64_t>(req.id())),
                                          observability::IntField("submissions", static_cast<int64_t>(submissions.size()))});
  resp->set_submissions(static_cast<uint32_t>(submissions.size()));
  done(nullptr);
}

// ------------------------------------------------------------------
// Synchronous views
// ------------------------------------------------------------------

ListResourcesResponse AdminService::ListResources(const ListResourcesRequest&) {
  ListResourcesResponse resp;

  const auto&       registry = ctx_.pool->Registry();
  const std::string service(rpc::kResourceService);
  if (!registry.Contains({service, 0})) {
    return resp;
  }

  const auto count = registry.ShardCount(service);
  resp.set_shard_count(count);
  for (uint32_t shard = 0; shard < count; ++shard) {
    const auto endpoint = registry.Address({service, shard});
    auto*      entry    = resp.add_shards();
    entry->set_shard(shard);
    entry->set_host(endpoint.host);
    entry->set_port(endpoint.port);
  }
  return resp;
}

PollNotificationsResponse AdminService::PollNotifications(const PollNotificationsRequest& req) {
  PollNotificationsResponse resp;

  auto tx        = ctx_.repository->Begin();
  auto questions = ctx_.repository->ListUnansweredQuestions(*tx, req.last_notification());
  auto unanswered = ctx_.repository->CountUnansweredQuestions(*tx);
  tx->Rollback();

  for (const auto& question : questions) {
    auto* entry = resp.add_entries();
    entry->set_type("new_question");
    entry->set_timestamp(question.question_timestamp);
    entry->set_subject(question.subject);
    entry->set_text(question.text);
  }

  for (auto& notification : ctx_.notifications->DrainAll()) {
    auto* entry = resp.add_entries();
    entry->set_type("notification");
    entry->set_timestamp(notification.timestamp);
    entry->set_subject(std::move(notification.subject));
    entry->set_text(std::move(notification.body));
  }

  resp.set_unanswered(static_cast<uint32_t>(unanswered));
  return resp;
}

} // namespace cms::service
