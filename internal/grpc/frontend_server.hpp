#pragma once

#include <functional>
#include <memory>
#include <string_view>

#include <grpcpp/grpcpp.h>

#include "cms/admin/v1/admin_frontend.grpc.pb.h"
#include "internal/rpc/dispatcher.hpp"
#include "internal/service/admin_service.hpp"

namespace cms::grpc {

/*
  Transport adapter for AdminFrontendService.

  gRPC invokes the handlers on its own threads; each handler only posts
  the request body to the dispatcher and returns the call's reactor. The
  reactor is finished from the service completion, which may be long
  after the handler returned.
*/
class FrontendServer final : public cms::admin::v1::AdminFrontendService::CallbackService {
public:
  FrontendServer(std::shared_ptr<cms::service::AdminService> svc, std::shared_ptr<cms::rpc::Dispatcher> dispatcher);

  ::grpc::ServerUnaryReactor* ProxyCall(::grpc::CallbackServerContext*, const cms::admin::v1::ProxyCallRequest*,
                                        cms::admin::v1::ProxyCallResponse*) override;

  ::grpc::ServerUnaryReactor* AddTestcase(::grpc::CallbackServerContext*, const cms::admin::v1::AddTestcaseRequest*,
                                          cms::admin::v1::AddTestcaseResponse*) override;

  ::grpc::ServerUnaryReactor* AddStatement(::grpc::CallbackServerContext*, const cms::admin::v1::AddStatementRequest*,
                                           cms::admin::v1::AddStatementResponse*) override;

  ::grpc::ServerUnaryReactor* AddAttachment(::grpc::CallbackServerContext*, const cms::admin::v1::AddAttachmentRequest*,
                                            cms::admin::v1::AddAttachmentResponse*) override;

  ::grpc::ServerUnaryReactor* AddManager(::grpc::CallbackServerContext*, const cms::admin::v1::AddManagerRequest*,
                                         cms::admin::v1::AddManagerResponse*) override;

  ::grpc::ServerUnaryReactor* GetFile(::grpc::CallbackServerContext*, const cms::admin::v1::GetFileRequest*,
                                      cms::admin::v1::GetFileResponse*) override;

  ::grpc::ServerUnaryReactor* Reevaluate(::grpc::CallbackServerContext*, const cms::admin::v1::ReevaluateRequest*,
                                         cms::admin::v1::ReevaluateResponse*) override;

  ::grpc::ServerUnaryReactor* ListResources(::grpc::CallbackServerContext*, const cms::admin::v1::ListResourcesRequest*,
                                            cms::admin::v1::ListResourcesResponse*) override;

  ::grpc::ServerUnaryReactor* PollNotifications(::grpc::CallbackServerContext*, const cms::admin::v1::PollNotificationsRequest*,
                                                cms::admin::v1::PollNotificationsResponse*) override;

private:
  using Body = std::function<void(cms::service::AdminService&, cms::service::AdminService::Completion)>;

  ::grpc::ServerUnaryReactor* Schedule(::grpc::CallbackServerContext* context, std::string_view route, Body body);

  std::shared_ptr<cms::service::AdminService> service_;
  std::shared_ptr<cms::rpc::Dispatcher>       dispatcher_;
};

} // namespace cms::grpc
