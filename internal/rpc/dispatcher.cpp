#include "dispatcher.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cms::rpc {

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::size_t Dispatcher::RunPending() {
  if (running_) {
    throw util::InvalidState("RunPending called while the dispatcher thread is running");
  }

  std::size_t executed = 0;
  for (;;) {
    Task task;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) break;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    Execute(task);
    ++executed;
  }
  return executed;
}

void Dispatcher::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&Dispatcher::Run, this);
}

void Dispatcher::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

bool Dispatcher::OnWorkerThread() const {
  return running_ && std::this_thread::get_id() == thread_.get_id();
}

std::size_t Dispatcher::QueuedTasks() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void Dispatcher::Run() {
  for (;;) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

      if (shutdown_ && queue_.empty()) return;

      task = std::move(queue_.front());
      queue_.pop_front();
    }
    Execute(task);
  }
}

void Dispatcher::Execute(Task& task) noexcept {
  try {
    task();
  } catch (const std::exception& e) {
    CMS_LOG_ERROR("Dispatcher task failed", {observability::StringField("error", e.what())});
  } catch (...) {
    CMS_LOG_ERROR("Dispatcher task failed", {observability::StringField("error", "non-standard exception")});
  }
}

} // namespace cms::rpc
