#include "notification_queue.hpp"

#include "internal/observability/logging.hpp"

namespace cms::notification {

void NotificationQueue::Append(Notification notification) {
  CMS_LOG_DEBUG("Notification queued", {observability::IntField("timestamp", notification.timestamp),
                                         observability::StringField("subject", notification.subject)});

  std::lock_guard lock(mutex_);
  pending_.push_back(std::move(notification));
}

std::vector<Notification> NotificationQueue::DrainAll() {
  std::vector<Notification> drained;
  {
    std::lock_guard lock(mutex_);
    drained.swap(pending_);
  }
  return drained;
}

std::size_t NotificationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

} // namespace cms::notification
