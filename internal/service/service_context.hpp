#pragma once

#include <memory>

namespace cms::db { class Repository; }
namespace cms::rpc { class ChannelPool; class AuthorizationGate; }
namespace cms::coordination { class UploadJoinCoordinator; }
namespace cms::notification { class NotificationQueue; }
namespace cms::storage { class FileStorageClient; }

namespace cms::service {

/*
  Dependency container shared by the front-end services. One per process;
  the composition root owns the pieces, services only borrow them.
*/
struct ServiceContext {
  std::shared_ptr<cms::db::Repository>                       repository;
  std::shared_ptr<cms::rpc::ChannelPool>                     pool;
  std::shared_ptr<const cms::rpc::AuthorizationGate>         gate;
  std::shared_ptr<cms::coordination::UploadJoinCoordinator>  joins;
  std::shared_ptr<cms::notification::NotificationQueue>      notifications;
  std::shared_ptr<cms::storage::FileStorageClient>           files;
};

}
