#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace cms::rpc { class Dispatcher; class ChannelPool; }
namespace cms::notification { class NotificationQueue; }
namespace cms::service { class AdminService; }

namespace cms::factory {

/*
  Application

  Everything the running front end owns. The dispatcher is already
  started; stop the gRPC server before the dispatcher so no request body
  is posted after the queue drained.
*/
struct Application {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<rpc::Dispatcher>                  dispatcher;
  std::shared_ptr<rpc::ChannelPool>                 pool;
  std::shared_ptr<notification::NotificationQueue>  notifications;
  std::shared_ptr<service::AdminService>            admin_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root. The only place that knows concrete repository and
  channel types.
*/
Application Build(const cms::runtime::config::RuntimeConfig& config);

// Sqlite when configured, otherwise the in-memory repository.
std::shared_ptr<db::Repository> BuildRepository(const cms::runtime::config::RuntimeConfig& config);

} // namespace cms::factory
