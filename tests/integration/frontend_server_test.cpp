#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "cms/admin/v1.hpp"
#include "internal/coordination/upload_join.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/frontend_server.hpp"
#include "internal/notification/notification_queue.hpp"
#include "internal/rpc/authorization_gate.hpp"
#include "internal/rpc/channel_pool.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/file_storage_client.hpp"
#include "tests/support/fake_backend.hpp"

namespace {

using namespace cms::admin::v1;
using namespace std::chrono_literals;

// Front end served over a real port with the dispatcher on its own thread.
struct Frontend {
  std::shared_ptr<cms::rpc::Dispatcher>              dispatcher = std::make_shared<cms::rpc::Dispatcher>();
  cms::testing::FakeBackendServer                    evaluation;
  cms::testing::FakeBackendServer                    files;
  std::shared_ptr<cms::db::memory::MemoryRepository> repository = std::make_shared<cms::db::memory::MemoryRepository>();
  std::unique_ptr<cms::runtime::Server>              server;
  std::unique_ptr<AdminFrontendService::Stub>        stub;

  Frontend() {
    cms::rpc::ServiceRegistry::ShardTable table = {
        {"Evaluation", {cms::rpc::Endpoint{"eval", 25000}}},
        {"FileStorage", {cms::rpc::Endpoint{"fs", 28500}}},
    };
    auto pool = std::make_shared<cms::rpc::ChannelPool>(
        std::make_shared<const cms::rpc::ServiceRegistry>(std::move(table)), dispatcher, 2s,
        [this](const cms::rpc::ServiceCoordinate& coord, const cms::rpc::Endpoint&) {
          return coord.name == "FileStorage" ? files.Channel() : evaluation.Channel();
        });
    cms::testing::InstallFileStore(files.Backend(), "BAD");

    cms::service::ServiceContext ctx;
    ctx.repository    = repository;
    ctx.pool          = pool;
    ctx.gate          = std::make_shared<const cms::rpc::AuthorizationGate>();
    ctx.joins         = std::make_shared<cms::coordination::UploadJoinCoordinator>();
    ctx.notifications = std::make_shared<cms::notification::NotificationQueue>();
    ctx.files         = std::make_shared<cms::storage::FileStorageClient>(pool);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<cms::grpc::FrontendServer>(std::make_shared<cms::service::AdminService>(ctx), dispatcher));

    dispatcher->Start();
    server = std::make_unique<cms::runtime::Server>("127.0.0.1:0", std::move(services));
    server->Start();

    stub = AdminFrontendService::NewStub(
        grpc::CreateChannel("127.0.0.1:" + std::to_string(server->BoundPort()), grpc::InsecureChannelCredentials()));
  }

  ~Frontend() {
    server->Stop();
    dispatcher->Stop();
  }

  uint64_t CreateTask() {
    auto                       tx = repository->Begin();
    cms::db::model::TaskRecord task;
    task.name = "sum";
    assert(repository->InsertTask(*tx, task));
    tx->Commit();
    return task.id;
  }
};

void TestTestcaseUploadOverGrpc() {
  Frontend   f;
  const auto task_id = f.CreateTask();

  AddTestcaseRequest req;
  req.set_task_id(task_id);
  req.set_input("1 2");
  req.set_output("3");

  AddTestcaseResponse resp;
  grpc::ClientContext ctx;
  auto                status = f.stub->AddTestcase(&ctx, req, &resp);
  assert(status.ok());
  assert(resp.num() == 0);

  req.set_output("BAD");
  AddTestcaseResponse failed;
  grpc::ClientContext failed_ctx;
  status = f.stub->AddTestcase(&failed_ctx, req, &failed);
  assert(status.error_code() == grpc::StatusCode::ABORTED);

  PollNotificationsResponse poll;
  grpc::ClientContext       poll_ctx;
  assert(f.stub->PollNotifications(&poll_ctx, PollNotificationsRequest{}, &poll).ok());
  assert(poll.entries_size() == 1);
  assert(poll.entries(0).subject() == "Testcase storage failed");
}

void TestStatusCodesOverGrpc() {
  Frontend f;

  AddStatementRequest missing;
  missing.set_task_id(12345);
  missing.set_filename("s.pdf");
  AddStatementResponse missing_resp;
  grpc::ClientContext  missing_ctx;
  assert(f.stub->AddStatement(&missing_ctx, missing, &missing_resp).error_code() == grpc::StatusCode::NOT_FOUND);

  ProxyCallRequest denied;
  denied.set_service("FileStorage");
  denied.set_method("get_file");
  ProxyCallResponse   denied_resp;
  grpc::ClientContext denied_ctx;
  assert(f.stub->ProxyCall(&denied_ctx, denied, &denied_resp).error_code() == grpc::StatusCode::PERMISSION_DENIED);
  assert(f.files.Backend().CallCount("get_file") == 0);

  ReevaluateRequest unspecified;
  ReevaluateResponse  unspecified_resp;
  grpc::ClientContext unspecified_ctx;
  assert(f.stub->Reevaluate(&unspecified_ctx, unspecified, &unspecified_resp).error_code() == grpc::StatusCode::INVALID_ARGUMENT);

  // Backend errors without a domain mapping surface as INTERNAL.
  ProxyCallRequest unimplemented;
  unimplemented.set_service("Evaluation");
  unimplemented.set_method("workers_status");
  ProxyCallResponse   unimplemented_resp;
  grpc::ClientContext unimplemented_ctx;
  assert(f.stub->ProxyCall(&unimplemented_ctx, unimplemented, &unimplemented_resp).error_code() == grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestTestcaseUploadOverGrpc();
  TestStatusCodesOverGrpc();

  std::cout << "cms_admin_integration_frontend_server: pass\n";
  return 0;
}
