#include "frontend_server.hpp"

#include <string>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace cms::grpc {

using namespace cms::admin::v1;
using cms::service::AdminService;

FrontendServer::FrontendServer(std::shared_ptr<AdminService> svc, std::shared_ptr<cms::rpc::Dispatcher> dispatcher)
    : service_(std::move(svc)), dispatcher_(std::move(dispatcher)) {
}

::grpc::ServerUnaryReactor* FrontendServer::Schedule(::grpc::CallbackServerContext* context, std::string_view route, Body body) {
  auto* reactor = context->DefaultReactor();

  auto finish = [reactor, route = std::string(route)](std::exception_ptr error) {
    auto status = ToStatus(error);
    if (!status.ok()) {
      CMS_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::IntField("code", status.error_code()),
                                   observability::StringField("error", status.error_message())});
    }
    reactor->Finish(status);
  };

  dispatcher_->Post([service = service_, body = std::move(body), finish]() {
    try {
      body(*service, finish);
    } catch (...) {
      finish(std::current_exception());
    }
  });
  return reactor;
}

::grpc::ServerUnaryReactor* FrontendServer::ProxyCall(::grpc::CallbackServerContext* ctx, const ProxyCallRequest* req,
                                                      ProxyCallResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.ProxyCall",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.ProxyCall(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::AddTestcase(::grpc::CallbackServerContext* ctx, const AddTestcaseRequest* req,
                                                        AddTestcaseResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.AddTestcase",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.AddTestcase(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::AddStatement(::grpc::CallbackServerContext* ctx, const AddStatementRequest* req,
                                                         AddStatementResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.AddStatement",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.AddStatement(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::AddAttachment(::grpc::CallbackServerContext* ctx, const AddAttachmentRequest* req,
                                                          AddAttachmentResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.AddAttachment",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.AddAttachment(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::AddManager(::grpc::CallbackServerContext* ctx, const AddManagerRequest* req,
                                                       AddManagerResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.AddManager",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.AddManager(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::GetFile(::grpc::CallbackServerContext* ctx, const GetFileRequest* req, GetFileResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.GetFile",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.GetFile(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::Reevaluate(::grpc::CallbackServerContext* ctx, const ReevaluateRequest* req,
                                                       ReevaluateResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.Reevaluate",
                  [req, resp](AdminService& svc, AdminService::Completion done) { svc.Reevaluate(*req, resp, std::move(done)); });
}

::grpc::ServerUnaryReactor* FrontendServer::ListResources(::grpc::CallbackServerContext* ctx, const ListResourcesRequest* req,
                                                          ListResourcesResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.ListResources", [req, resp](AdminService& svc, AdminService::Completion done) {
    *resp = svc.ListResources(*req);
    done(nullptr);
  });
}

::grpc::ServerUnaryReactor* FrontendServer::PollNotifications(::grpc::CallbackServerContext* ctx, const PollNotificationsRequest* req,
                                                              PollNotificationsResponse* resp) {
  return Schedule(ctx, "AdminFrontendService.PollNotifications", [req, resp](AdminService& svc, AdminService::Completion done) {
    *resp = svc.PollNotifications(*req);
    done(nullptr);
  });
}

} // namespace cms::grpc
