#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace cms::notification {

struct Notification {
  int64_t     timestamp = 0;
  std::string subject;
  std::string body;
};

/*
  NotificationQueue

  Ephemeral FIFO of notifications waiting for the next poll. Best-effort
  and at-most-once: nothing survives a restart and each entry is handed
  to exactly one DrainAll().

  Append and DrainAll take the same lock; DrainAll swaps the whole buffer
  out, so an Append racing with a drain lands either in that drain or in
  the next one, never in both and never nowhere.

  One queue per front-end instance, injected into whatever needs to emit.
*/
class NotificationQueue {
 public:
  void Append(Notification notification);

  void Append(int64_t timestamp, std::string subject, std::string body) {
    Append(Notification{timestamp, std::move(subject), std::move(body)});
  }

  // Returns every pending notification in append order and empties the queue.
  std::vector<Notification> DrainAll();

  std::size_t Size() const;

 private:
  mutable std::mutex        mutex_;
  std::vector<Notification> pending_;
};

} // namespace cms::notification
